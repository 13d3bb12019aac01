#include <quire/restore/workspace_lock.hpp>

#include <iterator>

namespace quire::restore {

std::unique_lock<std::mutex> workspace_lock_table::lock(
    const std::string_view workspace_id) {
  std::mutex* workspace_mutex{nullptr};
  {
    auto guard = std::scoped_lock{mutex_};
    auto it = locks_.find(workspace_id);
    if (it == std::end(locks_)) {
      it = locks_
               .emplace(std::string{workspace_id},
                        std::make_unique<std::mutex>())
               .first;
    }
    workspace_mutex = it->second.get();
  }
  return std::unique_lock<std::mutex>{*workspace_mutex};
}

}  // namespace quire::restore
