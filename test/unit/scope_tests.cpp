// Copyright (c) 2025 The Unicity Foundation
// Unit tests for cancellable scopes

#include <catch2/catch_test_macros.hpp>
#include "probe/scope.hpp"
#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>

using namespace liveprobe::probe;
using namespace std::chrono_literals;

TEST_CASE("Scope - Background is never cancelled", "[probe][scope]") {
    auto bg = Scope::Background();
    REQUIRE(bg);
    CHECK(bg == Scope::Background());
    CHECK_FALSE(bg->IsCancelled());
    CHECK(bg->Reason() == CancelReason::None);
    CHECK_FALSE(bg->Deadline().has_value());
    CHECK_FALSE(bg->Token().stop_possible());

    bg->Cancel();
    CHECK_FALSE(bg->IsCancelled());
    CHECK_FALSE(bg->CancelIfExpired());
}

TEST_CASE("Scope - Cancel is idempotent and reports a reason", "[probe][scope]") {
    auto scope = Scope::WithCancel(Scope::Background());
    CHECK_FALSE(scope->IsCancelled());
    CHECK(scope->Token().stop_possible());

    scope->Cancel();
    CHECK(scope->IsCancelled());
    CHECK(scope->Token().stop_requested());
    CHECK(scope->Reason() == CancelReason::Cancelled);

    scope->Cancel();
    CHECK(scope->Reason() == CancelReason::Cancelled);
    CHECK(std::string(CancelReasonName(scope->Reason())) == "canceled");
}

TEST_CASE("Scope - cancellation flows from parent to child only", "[probe][scope]") {
    SECTION("Parent cancels child and grandchild") {
        auto parent = Scope::WithCancel(Scope::Background());
        auto child = Scope::WithCancel(parent);
        auto grandchild = Scope::WithCancel(child);

        parent->Cancel();
        CHECK(child->IsCancelled());
        CHECK(grandchild->IsCancelled());
        CHECK(child->Reason() == CancelReason::Cancelled);
        CHECK(grandchild->Token().stop_requested());
    }

    SECTION("Child does not cancel parent or siblings") {
        auto parent = Scope::WithCancel(Scope::Background());
        auto a = Scope::WithCancel(parent);
        auto b = Scope::WithCancel(parent);

        a->Cancel();
        CHECK(a->IsCancelled());
        CHECK_FALSE(parent->IsCancelled());
        CHECK_FALSE(b->IsCancelled());
    }

    SECTION("Child of an already cancelled parent starts cancelled") {
        auto parent = Scope::WithCancel(Scope::Background());
        parent->Cancel();
        auto child = Scope::WithCancel(parent);
        CHECK(child->IsCancelled());
        CHECK(child->Reason() == CancelReason::Cancelled);
    }

    SECTION("Null parent behaves like Background") {
        auto scope = Scope::WithCancel(nullptr);
        CHECK_FALSE(scope->IsCancelled());
        scope->Cancel();
        CHECK(scope->IsCancelled());
    }
}

TEST_CASE("Scope - stop callbacks run on cancel", "[probe][scope]") {
    auto scope = Scope::WithCancel(Scope::Background());
    std::atomic<int> calls{0};
    std::stop_callback cb(scope->Token(), [&] { calls++; });

    CHECK(calls == 0);
    scope->Cancel();
    CHECK(calls == 1);
    scope->Cancel();
    CHECK(calls == 1);
}

TEST_CASE("Scope - deadlines", "[probe][scope]") {
    SECTION("Deadline is passive until CancelIfExpired") {
        auto scope = Scope::WithTimeout(Scope::Background(), 20ms);
        REQUIRE(scope->Deadline().has_value());
        CHECK_FALSE(scope->IsCancelled());
        CHECK_FALSE(scope->CancelIfExpired());

        std::this_thread::sleep_for(40ms);
        CHECK(scope->IsCancelled());
        CHECK_FALSE(scope->Token().stop_requested());

        CHECK(scope->CancelIfExpired());
        CHECK(scope->Token().stop_requested());
        CHECK(scope->Reason() == CancelReason::DeadlineExceeded);
        CHECK(std::string(CancelReasonName(scope->Reason())) == "deadline exceeded");
    }

    SECTION("Children inherit the earlier deadline") {
        auto parent = Scope::WithTimeout(Scope::Background(), 100ms);
        auto looser = Scope::WithTimeout(parent, 10s);
        auto tighter = Scope::WithTimeout(parent, 10ms);

        REQUIRE(looser->Deadline().has_value());
        CHECK(*looser->Deadline() == *parent->Deadline());
        CHECK(*tighter->Deadline() < *parent->Deadline());

        auto plain = Scope::WithCancel(parent);
        REQUIRE(plain->Deadline().has_value());
        CHECK(*plain->Deadline() == *parent->Deadline());
    }

    SECTION("An explicit cancel before the deadline keeps its reason") {
        auto scope = Scope::WithTimeout(Scope::Background(), 10ms);
        scope->Cancel();
        std::this_thread::sleep_for(20ms);
        scope->CancelIfExpired();
        CHECK(scope->Reason() == CancelReason::Cancelled);
    }
}

TEST_CASE("Scope - WaitFor", "[probe][scope]") {
    SECTION("Times out on a live scope") {
        auto scope = Scope::WithCancel(Scope::Background());
        auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(scope->WaitFor(30ms));
        CHECK(std::chrono::steady_clock::now() - start >= 30ms);
    }

    SECTION("Wakes on cancel from another thread") {
        auto scope = Scope::WithCancel(Scope::Background());
        std::thread canceller([scope] {
            std::this_thread::sleep_for(20ms);
            scope->Cancel();
        });

        auto start = std::chrono::steady_clock::now();
        CHECK(scope->WaitFor(5s));
        CHECK(std::chrono::steady_clock::now() - start < 2s);
        canceller.join();
    }

    SECTION("Wakes at the deadline") {
        auto scope = Scope::WithTimeout(Scope::Background(), 20ms);
        auto start = std::chrono::steady_clock::now();
        CHECK(scope->WaitFor(5s));
        CHECK(std::chrono::steady_clock::now() - start < 2s);
    }
}

TEST_CASE("Scope - child outliving its parent handle", "[probe][scope]") {
    auto parent = Scope::WithCancel(Scope::Background());
    auto child = Scope::WithCancel(parent);
    std::weak_ptr<Scope> weak_parent = parent;

    parent.reset();
    // The child keeps its parent alive, so the link still works
    REQUIRE_FALSE(weak_parent.expired());
    weak_parent.lock()->Cancel();
    CHECK(child->IsCancelled());
}
