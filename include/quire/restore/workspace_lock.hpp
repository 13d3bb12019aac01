#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace quire::restore {

/// Per workspace id mutexes serializing restores of the same workspace.
/// Mutexes are created on first use and live as long as the table.
class workspace_lock_table final {
 public:
  std::unique_lock<std::mutex> lock(const std::string_view workspace_id);

 private:
  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> locks_;
};

}  // namespace quire::restore
