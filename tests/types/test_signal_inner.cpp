/**
 * @file test_signal_inner.cpp
 * @brief Unit tests for SignalInner, AnySignalInner and AnySignalRef.
 *
 * Covers the subscriber map (idempotent subscribe/unsubscribe, ordering) and the propagation pass.
 */

#include <catch2/catch_test_macros.hpp>
#include <rcell/types/signal_inner.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rcell;

namespace {

/**
 * A callback body that records its name into a shared log when invoked.
 */
callback_s_ptr recorder(std::vector<std::string> &log, std::string name) {
    return CallbackBody::make([&log, name = std::move(name)] { log.push_back(name); });
}

}  // namespace

// ============================================================================
// Value Tests
// ============================================================================

TEST_CASE("SignalInner - construction wraps the initial value", "[types][signal_inner]") {
    SignalInner<int> cell{7};

    REQUIRE(cell.value() != nullptr);
    CHECK(*cell.value() == 7);
    CHECK(cell.subscriber_count() == 0);
}

TEST_CASE("SignalInner - update installs a new snapshot", "[types][signal_inner]") {
    SignalInner<std::string> cell{"a"};
    auto before = cell.value();

    cell.update("b");

    CHECK(*before == "a");
    CHECK(*cell.value() == "b");
    CHECK(before != cell.value());
}

TEST_CASE("SignalInner - update does not notify subscribers", "[types][signal_inner]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");
    cell.subscribe(Callback{a});

    cell.update(1);

    CHECK(log.empty());
}

// ============================================================================
// Subscriber Map Tests
// ============================================================================

TEST_CASE("SignalInner - subscribing twice is a no-op", "[types][signal_inner]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");

    cell.subscribe(Callback{a});
    cell.subscribe(Callback{a});

    CHECK(cell.subscriber_count() == 1);
    cell.trigger_subscribers();
    CHECK(log == std::vector<std::string>{"a"});
}

TEST_CASE("SignalInner - re-subscribing keeps the original position", "[types][signal_inner]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");
    auto b = recorder(log, "b");

    cell.subscribe(Callback{a});
    cell.subscribe(Callback{b});
    cell.subscribe(Callback{a});

    CHECK(cell.subscriber_order() == std::vector<callback_ptr>{a.get(), b.get()});
}

TEST_CASE("SignalInner - unsubscribing an unknown callback is a no-op", "[types][signal_inner]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");
    auto stranger = recorder(log, "stranger");
    cell.subscribe(Callback{a});

    cell.unsubscribe(stranger.get());
    cell.unsubscribe(stranger.get());

    CHECK(cell.subscriber_count() == 1);
    CHECK(cell.is_subscribed(a.get()));
}

TEST_CASE("SignalInner - unsubscribe moves the last subscriber into the freed position", "[types][signal_inner]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");
    auto b = recorder(log, "b");
    auto c = recorder(log, "c");
    cell.subscribe(Callback{a});
    cell.subscribe(Callback{b});
    cell.subscribe(Callback{c});

    cell.unsubscribe(a.get());

    CHECK(cell.subscriber_order() == std::vector<callback_ptr>{c.get(), b.get()});
}

// ============================================================================
// Propagation Tests
// ============================================================================

TEST_CASE("SignalInner - trigger_subscribers runs subscribers in reverse insertion order", "[types][signal_inner][propagation]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");
    auto b = recorder(log, "b");
    auto c = recorder(log, "c");
    cell.subscribe(Callback{a});
    cell.subscribe(Callback{b});
    cell.subscribe(Callback{c});

    cell.trigger_subscribers();

    CHECK(log == std::vector<std::string>{"c", "b", "a"});
}

TEST_CASE("SignalInner - released subscribers are skipped", "[types][signal_inner][propagation]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");
    auto b = recorder(log, "b");
    cell.subscribe(Callback{a});
    cell.subscribe(Callback{b});

    b.reset();
    REQUIRE_NOTHROW(cell.trigger_subscribers());

    CHECK(log == std::vector<std::string>{"a"});
}

TEST_CASE("SignalInner - subscriber added during a pass is not invoked in that pass", "[types][signal_inner][propagation]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto late = recorder(log, "late");
    auto a = CallbackBody::make([&] {
        log.emplace_back("a");
        cell.subscribe(Callback{late});
    });
    cell.subscribe(Callback{a});

    cell.trigger_subscribers();
    CHECK(log == std::vector<std::string>{"a"});
    CHECK(cell.subscriber_count() == 2);

    log.clear();
    cell.trigger_subscribers();
    CHECK(log == std::vector<std::string>{"late", "a"});
}

TEST_CASE("SignalInner - subscriber removed during a pass still runs in that pass", "[types][signal_inner][propagation]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");
    auto b = CallbackBody::make([&] {
        log.emplace_back("b");
        cell.unsubscribe(a.get());
    });
    cell.subscribe(Callback{a});
    cell.subscribe(Callback{b});

    cell.trigger_subscribers();

    CHECK(log == std::vector<std::string>{"b", "a"});
    CHECK_FALSE(cell.is_subscribed(a.get()));
}

TEST_CASE("SignalInner - a subscriber triggering its own cell is not re-entered", "[types][signal_inner][reentrancy]") {
    SignalInner<int> cell{0};
    int calls = 0;
    auto a = CallbackBody::make([&] {
        ++calls;
        cell.update(*cell.value() + 1);
        cell.trigger_subscribers();
    });
    cell.subscribe(Callback{a});

    cell.trigger_subscribers();

    CHECK(calls == 1);
    CHECK(*cell.value() == 1);
}

TEST_CASE("SignalInner - exception aborts the rest of the pass", "[types][signal_inner][propagation]") {
    std::vector<std::string> log;
    SignalInner<int> cell{0};
    auto a = recorder(log, "a");
    auto b = CallbackBody::make([] { throw std::runtime_error("boom"); });
    cell.subscribe(Callback{a});
    cell.subscribe(Callback{b});

    CHECK_THROWS_AS(cell.trigger_subscribers(), std::runtime_error);
    CHECK(log.empty());
    CHECK(b->state() == CallbackState::Idle);
}

// ============================================================================
// AnySignalRef Tests
// ============================================================================

TEST_CASE("AnySignalRef - static and dynamic references to one cell are equal", "[types][signal_ref]") {
    auto cell = std::make_shared<SignalInner<int>>(1);

    auto dynamic = AnySignalRef::from_dynamic(cell);
    auto stat = AnySignalRef::from_static(*cell);

    CHECK(dynamic == stat);
    CHECK(dynamic.as_ptr() == cell.get());
    CHECK(stat.is_static());
    CHECK_FALSE(dynamic.is_static());
}

TEST_CASE("AnySignalRef - dynamic reference keeps the cell alive", "[types][signal_ref]") {
    auto cell = std::make_shared<SignalInner<int>>(1);
    std::weak_ptr<SignalInner<int>> weak = cell;

    auto ref = AnySignalRef::from_dynamic(cell);
    cell.reset();

    CHECK_FALSE(weak.expired());
}

TEST_CASE("AnySignalRef - subscribe and unsubscribe reach the cell", "[types][signal_ref]") {
    std::vector<std::string> log;
    auto cell = std::make_shared<SignalInner<int>>(1);
    auto ref = AnySignalRef::from_dynamic(cell);
    auto a = recorder(log, "a");

    ref.subscribe(Callback{a});
    CHECK(cell->is_subscribed(a.get()));

    ref.unsubscribe(a.get());
    CHECK_FALSE(cell->is_subscribed(a.get()));
}
