// test/unittest/test_keep_measuring_token.cpp
// Unit tests for the shared keep-measuring resource

#include "session/keep_measuring_token.hpp"
#include "test_harness.hpp"
#include <thread>

using namespace coverage::session;

TEST(hooks_on_first_acquire_and_last_release) {
    KeepMeasuringToken token;
    int holds = 0;
    int drops = 0;
    token.set_hooks([&holds]() { ++holds; }, [&drops]() { ++drops; });

    token.acquire();
    token.acquire();
    ASSERT_EQ(holds, 1);
    ASSERT_EQ(token.count(), 2);
    ASSERT_TRUE(token.is_held());

    token.release();
    ASSERT_EQ(drops, 0);
    ASSERT_TRUE(token.is_held());

    token.release();
    ASSERT_EQ(drops, 1);
    ASSERT_FALSE(token.is_held());

    // Held again by a later run
    token.acquire();
    ASSERT_EQ(holds, 2);
    token.release();
    ASSERT_EQ(drops, 2);
}

TEST(unbalanced_release_ignored) {
    KeepMeasuringToken token;
    int drops = 0;
    token.set_hooks(nullptr, [&drops]() { ++drops; });

    token.release();
    ASSERT_EQ(token.count(), 0);
    ASSERT_EQ(drops, 0);

    token.acquire();
    token.release();
    token.release();
    ASSERT_EQ(token.count(), 0);
    ASSERT_EQ(drops, 1);
}

TEST(guard_scopes_the_hold) {
    KeepMeasuringToken token;
    {
        KeepMeasuringGuard outer(token);
        ASSERT_EQ(token.count(), 1);
        {
            KeepMeasuringGuard inner(token);
            ASSERT_EQ(token.count(), 2);
        }
        ASSERT_EQ(token.count(), 1);

        KeepMeasuringGuard moved(std::move(outer));
        ASSERT_EQ(token.count(), 1);
    }
    ASSERT_EQ(token.count(), 0);
}

TEST(concurrent_runs) {
    KeepMeasuringToken token;
    int holds = 0;
    int drops = 0;
    token.set_hooks([&holds]() { ++holds; }, [&drops]() { ++drops; });

    KeepMeasuringGuard keep(token);
    std::vector<std::thread> runs;
    for (int i = 0; i < 8; ++i) {
        runs.emplace_back([&token]() {
            for (int j = 0; j < 1000; ++j) {
                KeepMeasuringGuard g(token);
            }
        });
    }
    for (auto& t : runs) t.join();

    ASSERT_EQ(token.count(), 1);
    ASSERT_EQ(holds, 1);
    ASSERT_EQ(drops, 0);
}

TEST(shared_instance_is_singleton) {
    ASSERT_TRUE(&KeepMeasuringToken::shared() == &KeepMeasuringToken::shared());
}

int main() {
    return run_all_tests("KeepMeasuringToken");
}
