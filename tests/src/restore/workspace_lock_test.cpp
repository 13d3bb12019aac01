#include <quire/restore/failure_policy.hpp>
#include <quire/restore/workspace_lock.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

TEST(workspace_lock, same_workspace_is_serialized) {
  auto table = quire::restore::workspace_lock_table{};
  auto entered = std::atomic<bool>{false};

  auto held = table.lock("ws-1");
  auto contender = std::thread{[&]() {
    auto lock = table.lock("ws-1");
    entered = true;
  }};
  std::this_thread::sleep_for(std::chrono::milliseconds{50});
  EXPECT_FALSE(entered.load());

  held.unlock();
  contender.join();
  EXPECT_TRUE(entered.load());
}

TEST(workspace_lock, different_workspaces_do_not_block) {
  auto table = quire::restore::workspace_lock_table{};
  auto held = table.lock("ws-1");
  auto entered = std::atomic<bool>{false};
  auto other = std::thread{[&]() {
    auto lock = table.lock("ws-10");
    entered = true;
  }};
  other.join();
  EXPECT_TRUE(entered.load());
  EXPECT_TRUE(held.owns_lock());
}

TEST(workspace_lock, failure_policy_names_round_trip) {
  using quire::restore::failure_policy;
  EXPECT_EQ(quire::restore::to_string(failure_policy::abort), "abort");
  EXPECT_EQ(quire::restore::to_string(failure_policy::best_effort),
            "best_effort");
  EXPECT_EQ(quire::restore::failure_policy_from_string("best_effort"),
            failure_policy::best_effort);
  EXPECT_FALSE(quire::restore::failure_policy_from_string("retry").has_value());
}
