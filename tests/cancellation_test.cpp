#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/error.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <thread>

using namespace xmit_cpp;

// -- CancellationToken --------------------------------------------------------

TEST(CancellationToken, starts_uncancelled) {
    const auto token = CancellationToken{};
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_NO_THROW(token.throw_if_cancelled());
}

TEST(CancellationToken, copies_share_the_flag) {
    const auto token = CancellationToken{};
    const auto copy = token;
    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_TRUE(token.shares_flag_with(copy));
    EXPECT_FALSE(token.shares_flag_with(CancellationToken{}));
}

TEST(CancellationToken, throw_if_cancelled_raises_cancelled_kind) {
    const auto token = CancellationToken{};
    token.cancel();
    try {
        token.throw_if_cancelled();
        FAIL() << "expected PublishError";
    } catch (const PublishError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::cancelled);
    }
}

// -- LaunchRegistry -----------------------------------------------------------

TEST(LaunchRegistry, begin_registers_until_handle_is_dropped) {
    auto registry = LaunchRegistry{};
    {
        auto handle = registry.begin("/work/site:prod");
        EXPECT_TRUE(registry.is_running("/work/site:prod"));
        EXPECT_EQ(handle.launch_id(), "/work/site:prod");
        EXPECT_EQ(registry.size(), 1u);
    }
    EXPECT_FALSE(registry.is_running("/work/site:prod"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(LaunchRegistry, cancel_sets_the_launch_token) {
    auto registry = LaunchRegistry{};
    auto handle = registry.begin("a:prod");

    EXPECT_TRUE(registry.cancel("a:prod"));
    EXPECT_TRUE(handle.token().is_cancelled());
}

TEST(LaunchRegistry, cancel_unknown_launch_returns_false) {
    auto registry = LaunchRegistry{};
    EXPECT_FALSE(registry.cancel("nobody:home"));
}

TEST(LaunchRegistry, launches_are_independent) {
    auto registry = LaunchRegistry{};
    auto prod = registry.begin("a:prod");
    auto staging = registry.begin("a:staging");

    registry.cancel("a:prod");
    EXPECT_TRUE(prod.token().is_cancelled());
    EXPECT_FALSE(staging.token().is_cancelled());
}

TEST(LaunchRegistry, restart_replaces_token_and_old_handle_leaves_it) {
    auto registry = LaunchRegistry{};
    auto first = std::optional<LaunchHandle>{registry.begin("a:prod")};
    auto second = registry.begin("a:prod");
    EXPECT_FALSE(first->token().shares_flag_with(second.token()));

    // The stale handle must not unregister the newer launch
    first.reset();
    EXPECT_TRUE(registry.is_running("a:prod"));

    registry.cancel("a:prod");
    EXPECT_TRUE(second.token().is_cancelled());
}

TEST(LaunchRegistry, moved_handle_unregisters_once) {
    auto registry = LaunchRegistry{};
    auto handle = registry.begin("a:prod");
    {
        auto moved = std::move(handle);
        EXPECT_TRUE(registry.is_running("a:prod"));
    }
    EXPECT_FALSE(registry.is_running("a:prod"));
}

TEST(LaunchRegistry, cancel_from_another_thread) {
    auto registry = LaunchRegistry{};
    auto handle = registry.begin("a:prod");

    auto canceller = std::jthread{[&] { registry.cancel("a:prod"); }};
    canceller.join();

    EXPECT_TRUE(handle.token().is_cancelled());
}
