#include <gtest/gtest.h>
#include "atomicstore/change_notifier.hpp"
#include "atomicstore/store.hpp"
#include <atomic>
#include <chrono>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace atomicstore;
using namespace std::chrono_literals;

namespace {

// Keeps notifying until pred() holds or the deadline passes
template <typename Notify, typename Pred>
bool notify_until(Notify notify, Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        notify();
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

class ChangeNotificationTest : public ::testing::Test {
protected:
    Store<std::string> store{true};
};


TEST_F(ChangeNotificationTest, NotifyWakesWaiter) {
    std::atomic<bool> woke{false};
    std::jthread waiter([this, &woke](std::stop_token stop_token) {
        woke = store.wait_for_data_change(stop_token);
    });

    EXPECT_TRUE(notify_until([this]() { store.notify_did_change(); },
                             [&woke]() { return woke.load(); }));
}

TEST_F(ChangeNotificationTest, NotifyWakesEveryWaiter) {
    const int num_waiters = 5;
    std::atomic<int> woken{0};
    std::vector<std::jthread> waiters;

    for (int i = 0; i < num_waiters; i++) {
        waiters.emplace_back([this, &woken](std::stop_token stop_token) {
            if (store.wait_for_data_change(stop_token))
                woken++;
        });
    }

    EXPECT_TRUE(notify_until([this]() { store.notify_did_change(); },
                             [&woken]() { return woken.load() == num_waiters; }));
}

TEST_F(ChangeNotificationTest, PastNotificationIsNotBuffered) {
    store.notify_did_change();

    std::atomic<bool> returned{false};
    std::atomic<bool> result{true};
    std::jthread waiter([this, &returned, &result](std::stop_token stop_token) {
        result = store.wait_for_data_change(stop_token);
        returned = true;
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(returned.load());

    waiter.request_stop();
    waiter.join();
    EXPECT_TRUE(returned.load());
    EXPECT_FALSE(result.load());
}

TEST_F(ChangeNotificationTest, AlreadyCancelledTokenReturnsPromptly) {
    std::stop_source source;
    source.request_stop();

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(store.wait_for_data_change(source.get_token()));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(ChangeNotificationTest, CancelWakesBlockedWaiter) {
    std::stop_source source;
    std::atomic<bool> returned{false};
    std::thread waiter([this, &source, &returned]() {
        store.wait_for_data_change(source.get_token());
        returned = true;
    });

    std::this_thread::sleep_for(50ms);
    source.request_stop();
    waiter.join();
    EXPECT_TRUE(returned.load());
}

TEST_F(ChangeNotificationTest, CancellingOneWaiterLeavesOthersWaiting) {
    std::stop_source cancelled;
    std::atomic<bool> other_returned{false};

    std::jthread other([this, &other_returned](std::stop_token stop_token) {
        store.wait_for_data_change(stop_token);
        other_returned = true;
    });
    std::thread first([this, &cancelled]() {
        store.wait_for_data_change(cancelled.get_token());
    });

    std::this_thread::sleep_for(50ms);
    cancelled.request_stop();
    first.join();

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(other_returned.load());
}

TEST_F(ChangeNotificationTest, FlushNotifies) {
    std::atomic<bool> woke{false};
    std::jthread waiter([this, &woke](std::stop_token stop_token) {
        woke = store.wait_for_data_change(stop_token);
    });

    EXPECT_TRUE(notify_until([this]() {
                                 store.insert("k", "v");
                                 store.flush();
                             },
                             [&woke]() { return woke.load(); }));
}

TEST_F(ChangeNotificationTest, MutationsAloneDoNotNotify) {
    std::atomic<bool> returned{false};
    std::jthread waiter([this, &returned](std::stop_token stop_token) {
        store.wait_for_data_change(stop_token);
        returned = true;
    });

    std::this_thread::sleep_for(20ms);
    store.insert("k", "v");
    store.remove("k");
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(returned.load());
}

TEST(NonLockableNotificationTest, WaitReturnsImmediately) {
    Store<int> store{false};
    store.notify_did_change();
    EXPECT_FALSE(store.wait_for_data_change(std::stop_token{}));
}

TEST(ChangeNotifierTest, WaitWithStoppedTokenReturnsFalse) {
    ChangeNotifier notifier;
    std::stop_source source;
    source.request_stop();
    EXPECT_FALSE(notifier.wait(source.get_token()));
}

TEST(ChangeNotifierTest, NotifyAllReleasesWaiter) {
    ChangeNotifier notifier;
    std::atomic<bool> woke{false};
    std::jthread waiter([&notifier, &woke](std::stop_token stop_token) {
        woke = notifier.wait(stop_token);
    });

    EXPECT_TRUE(notify_until([&notifier]() { notifier.notify_all(); },
                             [&woke]() { return woke.load(); }));
}
