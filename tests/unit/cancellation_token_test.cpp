// Copyright (c) 2025 VAM Voice Relay
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include "core/cancellation.hpp"

using core::CancellationToken;

static void test_cancel_is_idempotent_and_runs_callbacks_once() {
    CancellationToken token;
    int calls = 0;
    token.on_cancel([&] { calls++; });
    assert(!token.is_cancelled());
    token.cancel();
    token.cancel();
    assert(token.is_cancelled());
    assert(calls == 1);
}

static void test_late_registration_runs_immediately() {
    CancellationToken token;
    token.cancel();
    bool ran = false;
    size_t id = token.on_cancel([&] { ran = true; });
    assert(ran);
    assert(id == 0);
}

static void test_removed_callback_does_not_run() {
    CancellationToken token;
    int a = 0, b = 0;
    size_t ida = token.on_cancel([&] { a++; });
    token.on_cancel([&] { b++; });
    token.remove_callback(ida);
    token.cancel();
    assert(a == 0);
    assert(b == 1);
}

static void test_throwing_callback_does_not_stop_others() {
    CancellationToken token;
    bool second = false;
    token.on_cancel([] { throw std::runtime_error("boom"); });
    token.on_cancel([&] { second = true; });
    token.cancel();
    assert(second);
}

static void test_wait_for() {
    CancellationToken token;
    auto t0 = std::chrono::steady_clock::now();
    assert(!token.wait_for(std::chrono::milliseconds(20)));
    assert(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(15));

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    assert(token.wait_for(std::chrono::seconds(5)));
    canceller.join();
    assert(token.wait_for(std::chrono::milliseconds(0)));
}

int main() {
    test_cancel_is_idempotent_and_runs_callbacks_once();
    test_late_registration_runs_immediately();
    test_removed_callback_does_not_run();
    test_throwing_callback_does_not_stop_others();
    test_wait_for();
    std::cout << "cancellation_token_test: PASS\n";
    return 0;
}
