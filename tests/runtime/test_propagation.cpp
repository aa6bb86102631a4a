/**
 * @file test_propagation.cpp
 * @brief Tests for notification order and re-entrancy across cells.
 *
 * Raw callbacks are subscribed directly where the exact shape of the subscriber graph matters, effects are used
 * where the graph is discovered from reads.
 */

#include <catch2/catch_test_macros.hpp>
#include <rcell/runtime/effect.h>
#include <rcell/types/signal.h>

#include <string>
#include <vector>

using namespace rcell;

// ============================================================================
// Re-entrancy
// ============================================================================

TEST_CASE("Propagation - a callback setting its own cell is not re-entered", "[runtime][propagation]") {
    DynSignal<int> state{0};
    int calls = 0;
    auto body = CallbackBody::make([&] {
        ++calls;
        state.set(*state.get_untracked() + 1);
    });
    state.inner().subscribe(Callback{body});

    state.set(10);

    CHECK(calls == 1);
    CHECK(*state.get_untracked() == 11);
    CHECK(body->state() == CallbackState::Idle);

    // The nested notification was dropped, not queued for later.
    state.set(20);
    CHECK(calls == 2);
    CHECK(*state.get_untracked() == 21);
}

TEST_CASE("Propagation - an effect writing the cell it reads terminates", "[runtime][propagation]") {
    DynSignal<int> counter{0};
    int runs = 0;
    auto root = create_root([&] {
        create_effect([&] {
            ++runs;
            const int v = *counter.get();
            if (v < 1000) { counter.set(v + 1); }
        });
    });

    CHECK(runs == 1);
    CHECK(*counter.get_untracked() == 1);

    counter.set(5);
    CHECK(runs == 2);
    CHECK(*counter.get_untracked() == 6);
}

TEST_CASE("Propagation - effects writing each other's cells terminate", "[runtime][propagation]") {
    DynSignal<int> a{0};
    DynSignal<int> b{0};
    int a_runs = 0;
    int b_runs = 0;
    auto root = create_root([&] {
        create_effect([&] {
            ++a_runs;
            b.set(*a.get() + 1);
        });
        create_effect([&] {
            ++b_runs;
            a.set(*b.get() + 1);
        });
    });
    const int a_before = a_runs;
    const int b_before = b_runs;

    a.set(10);

    // The a-effect is mid-run when the b-effect writes a, so that write reaches no subscriber.
    CHECK(a_runs == a_before + 1);
    CHECK(b_runs == b_before + 1);
    CHECK(*b.get_untracked() == 11);
    CHECK(*a.get_untracked() == 12);
}

// ============================================================================
// Ordering
// ============================================================================

TEST_CASE("Propagation - nested passes complete before the outer pass continues", "[runtime][propagation][order]") {
    DynSignal<int> x{0};
    StaticSignal<int> y{0};
    std::vector<std::string> log;

    auto first = CallbackBody::make([&log] { log.emplace_back("x:first"); });
    auto second = CallbackBody::make([&] {
        log.emplace_back("x:second");
        y.set(1);
    });
    auto downstream = CallbackBody::make([&log] { log.emplace_back("y:downstream"); });

    x.inner().subscribe(Callback{first});
    x.inner().subscribe(Callback{second});
    y.inner().subscribe(Callback{downstream});

    x.set(1);

    CHECK(log == std::vector<std::string>{"x:second", "y:downstream", "x:first"});
}

TEST_CASE("Propagation - subscribers added during a pass wait for the next pass", "[runtime][propagation]") {
    DynSignal<int> state{0};
    int late_calls = 0;
    auto late = CallbackBody::make([&late_calls] { ++late_calls; });
    auto early = CallbackBody::make([&] { state.inner().subscribe(Callback{late}); });
    state.inner().subscribe(Callback{early});

    state.trigger_subscribers();
    CHECK(late_calls == 0);
    CHECK(state.inner().subscriber_count() == 2);

    state.trigger_subscribers();
    CHECK(late_calls == 1);
}

TEST_CASE("Propagation - subscribers removed during a pass still receive it", "[runtime][propagation]") {
    DynSignal<int> state{0};
    int removed_calls = 0;
    auto removed = CallbackBody::make([&removed_calls] { ++removed_calls; });
    auto remover = CallbackBody::make([&] { state.inner().unsubscribe(removed.get()); });
    state.inner().subscribe(Callback{removed});
    state.inner().subscribe(Callback{remover});

    state.trigger_subscribers();
    CHECK(removed_calls == 1);

    state.trigger_subscribers();
    CHECK(removed_calls == 1);
}

TEST_CASE("Propagation - a subscriber disposed earlier in the pass is skipped", "[runtime][propagation]") {
    DynSignal<int> state{0};
    int victim_calls = 0;
    auto victim = CallbackBody::make([&victim_calls] { ++victim_calls; });
    auto killer = CallbackBody::make([&victim] { victim->dispose(); });
    state.inner().subscribe(Callback{victim});
    state.inner().subscribe(Callback{killer});

    REQUIRE_NOTHROW(state.trigger_subscribers());
    CHECK(victim_calls == 0);
}

TEST_CASE("Propagation - a subscriber released earlier in the pass is skipped", "[runtime][propagation]") {
    DynSignal<int> state{0};
    int victim_calls = 0;
    auto victim = CallbackBody::make([&victim_calls] { ++victim_calls; });
    auto killer = CallbackBody::make([&victim] { victim.reset(); });
    state.inner().subscribe(Callback{victim});
    state.inner().subscribe(Callback{killer});

    REQUIRE_NOTHROW(state.trigger_subscribers());
    CHECK(victim_calls == 0);
}

// ============================================================================
// Mixed Ownership
// ============================================================================

TEST_CASE("Propagation - static and dynamic cells share one protocol", "[runtime][propagation][ownership]") {
    StaticSignal<int> stat{1};
    DynSignal<int> dyn{2};
    std::vector<int> sums;

    auto root = create_root([&] { create_effect([&] { sums.push_back(*stat.get() + *dyn.get()); }); });

    stat.set(10);
    dyn.set(20);

    CHECK(sums == std::vector<int>{3, 12, 30});
    CHECK(stat.inner().subscriber_count() == 1);
    CHECK(dyn.inner().subscriber_count() == 1);
}

TEST_CASE("Propagation - a dynamic cell outliving its write handle still notifies", "[runtime][propagation][ownership]") {
    std::vector<int> seen;
    DynReadSignal<int> readonly = [] {
        DynSignal<int> state{1};
        return state.handle();
    }();

    auto root = create_root([&] { create_effect([&] { seen.push_back(*readonly.get()); }); });
    readonly.inner().trigger_subscribers();

    CHECK(seen == std::vector<int>{1, 1});
}
