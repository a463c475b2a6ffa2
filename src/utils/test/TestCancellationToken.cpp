#include "CancellationToken.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>

using namespace std::chrono;

void test_sleep_reaches_deadline() {
    CancellationToken token;
    auto start = steady_clock::now();
    bool reached = token.sleep_for(milliseconds(30));
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    assert(reached);
    assert(elapsed.count() >= 30);
    (void)reached;
    (void)elapsed;
    std::cout << "test_sleep_reaches_deadline passed" << std::endl;
}

void test_sleep_in_the_past_returns_immediately() {
    CancellationToken token;
    bool reached = token.sleep_until(steady_clock::now() - seconds(1));
    assert(reached);
    (void)reached;
    std::cout << "test_sleep_in_the_past_returns_immediately passed" << std::endl;
}

void test_cancel_interrupts_sleep() {
    CancellationToken token;
    std::thread canceller([&]() {
        std::this_thread::sleep_for(milliseconds(20));
        token.cancel();
    });

    auto start = steady_clock::now();
    bool reached = token.sleep_for(seconds(10));
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
    canceller.join();

    assert(!reached);
    assert(elapsed.count() < 1000);
    (void)reached;
    (void)elapsed;
    std::cout << "test_cancel_interrupts_sleep passed" << std::endl;
}

void test_cancelled_token_never_sleeps() {
    CancellationToken token;
    token.cancel();
    assert(token.is_cancelled());
    assert(!token.sleep_for(seconds(10)));
    token.wait();
    std::cout << "test_cancelled_token_never_sleeps passed" << std::endl;
}

void test_wait_released_by_cancel() {
    CancellationToken token;
    std::atomic<bool> released{false};
    std::thread waiter([&]() {
        token.wait();
        released = true;
    });

    std::this_thread::sleep_for(milliseconds(20));
    assert(!released);
    token.cancel();
    waiter.join();
    assert(released);
    std::cout << "test_wait_released_by_cancel passed" << std::endl;
}

void test_request_cancel_seen_by_waiters() {
    CancellationToken token;
    std::thread canceller([&]() {
        std::this_thread::sleep_for(milliseconds(20));
        token.request_cancel();
    });

    // No notification is sent, waiters pick the flag up on their next poll
    auto start = steady_clock::now();
    bool reached = token.sleep_for(seconds(10));
    auto elapsed = steady_clock::now() - start;
    canceller.join();

    assert(!reached);
    assert(token.is_cancelled());
    assert(elapsed < milliseconds(20) + CancellationToken::kPollInterval + milliseconds(200));
    (void)reached;
    (void)elapsed;

    CancellationToken idle;
    std::atomic<bool> released{false};
    std::thread waiter([&]() {
        idle.wait();
        released = true;
    });
    std::this_thread::sleep_for(milliseconds(20));
    idle.request_cancel();
    waiter.join();
    assert(released);
    std::cout << "test_request_cancel_seen_by_waiters passed" << std::endl;
}

int main() {
    test_sleep_reaches_deadline();
    test_sleep_in_the_past_returns_immediately();
    test_cancel_interrupts_sleep();
    test_cancelled_token_never_sleeps();
    test_wait_released_by_cancel();
    test_request_cancel_seen_by_waiters();

    std::cout << "All CancellationToken tests passed!" << std::endl;
    return 0;
}
