#include <rcell/runtime/dependency_tracker.h>
#include <rcell/runtime/reactive_scope.h>
#include <rcell/runtime/running.h>
#include <rcell/util/debug_flags.h>
#include <rcell/util/errors.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <utility>

namespace rcell {

    namespace {
        enum class TrackerState : unsigned char { Unborn, Alive, Destroyed };

        // Trivially destructible, so it can still be read while other thread_locals are being destroyed.
        thread_local TrackerState t_tracker_state{TrackerState::Unborn};

        bool same_running(const running_w_ptr &lhs, const running_w_ptr &rhs) noexcept {
            return !lhs.owner_before(rhs) && !rhs.owner_before(lhs);
        }
    } // namespace

    DependencyTracker::DependencyTracker() { t_tracker_state = TrackerState::Alive; }

    DependencyTracker::~DependencyTracker() {
        t_tracker_state = TrackerState::Destroyed;
        if (!_listeners.empty()) {
            warn("dependency tracker destroyed with {} computation(s) still running", _listeners.size());
        }
        if (!_scopes.empty()) { warn("dependency tracker destroyed with {} scope(s) still active", _scopes.size()); }
        try {
            dispose_detached();
        } catch (const std::exception &e) {
            fmt::print(stderr, "[rcell] warning: exception while disposing detached effects: {}\n", e.what());
        }
    }

    DependencyTracker &DependencyTracker::instance() {
        if (t_tracker_state == TrackerState::Destroyed) {
            fatal_invariant_violation("dependency tracker used after thread teardown");
        }
        thread_local DependencyTracker tracker;
        return tracker;
    }

    DependencyTracker *DependencyTracker::try_instance() noexcept {
        if (t_tracker_state == TrackerState::Destroyed) { return nullptr; }
        return &instance();
    }

    void DependencyTracker::track_read(const AnySignalRef &cell) {
        // Reads performed from destructors during thread teardown are never tracked.
        if (auto *tracker = try_instance(); tracker != nullptr) { tracker->track(cell); }
    }

    DependencyTracker::ListenerGuard DependencyTracker::enter(running_w_ptr running) {
        return ListenerGuard{*this, std::move(running)};
    }

    DependencyTracker::ScopeGuard DependencyTracker::enter_scope(ReactiveScope &scope) { return ScopeGuard{*this, scope}; }

    DependencyTracker::UntrackGuard DependencyTracker::suspend() { return UntrackGuard{*this}; }

    void DependencyTracker::track(const AnySignalRef &cell) {
        if (_listeners.empty()) { return; }

        auto running = _listeners.back().lock();
        if (!running) {
            fatal_invariant_violation("running computation was released while still on the listener stack");
        }
        // A computation disposed part way through its own run finishes the run without gaining new edges.
        if (running->is_disposed()) { return; }

        const auto before = running->dependency_count();
        running->add_dependency(cell);
        if (running->dependency_count() != before) {
            debug_print(RCELL_DEBUG_TRACK, "track", "computation={} cell={} depth={}", fmt::ptr(running.get()),
                        fmt::ptr(cell.as_ptr()), _listeners.size());
        }
    }

    ReactiveScope *DependencyTracker::current_scope() const noexcept {
        return _scopes.empty() ? nullptr : _scopes.back();
    }

    bool DependencyTracker::is_active_scope(const ReactiveScope *scope) const noexcept {
        return std::find(_scopes.begin(), _scopes.end(), scope) != _scopes.end();
    }

    void DependencyTracker::adopt_detached(running_s_ptr running) { _detached.push_back(std::move(running)); }

    void DependencyTracker::dispose_detached() {
        // Detach the list first, a cleanup may create further detached effects.
        auto detached = std::exchange(_detached, {});
        std::exception_ptr first_error;
        for (auto &running : detached) {
            try {
                running->dispose();
            } catch (const std::exception &) {
                if (!first_error) { first_error = std::current_exception(); }
            }
        }
        detached.clear();
        if (first_error) { std::rethrow_exception(first_error); }
    }

    void DependencyTracker::pop_listener(const running_w_ptr &expected) {
        if (_listeners.empty() || !same_running(_listeners.back(), expected)) {
            fatal_invariant_violation("listener stack popped out of order");
        }
        _listeners.pop_back();
    }

    void DependencyTracker::pop_scope(const ReactiveScope *expected) {
        if (_scopes.empty() || _scopes.back() != expected) { fatal_invariant_violation("scope stack popped out of order"); }
        _scopes.pop_back();
    }

    // ListenerGuard

    DependencyTracker::ListenerGuard::ListenerGuard(DependencyTracker &tracker, running_w_ptr running)
        : _tracker{&tracker}, _running{std::move(running)} {
        _tracker->_listeners.push_back(_running);
    }

    DependencyTracker::ListenerGuard::ListenerGuard(ListenerGuard &&other) noexcept
        : _tracker{std::exchange(other._tracker, nullptr)}, _running{std::move(other._running)} {}

    DependencyTracker::ListenerGuard::~ListenerGuard() {
        if (_tracker != nullptr) { _tracker->pop_listener(_running); }
    }

    // ScopeGuard

    DependencyTracker::ScopeGuard::ScopeGuard(DependencyTracker &tracker, ReactiveScope &scope)
        : _tracker{&tracker}, _scope{&scope} {
        _tracker->_scopes.push_back(_scope);
    }

    DependencyTracker::ScopeGuard::ScopeGuard(ScopeGuard &&other) noexcept
        : _tracker{std::exchange(other._tracker, nullptr)}, _scope{std::exchange(other._scope, nullptr)} {}

    DependencyTracker::ScopeGuard::~ScopeGuard() {
        if (_tracker != nullptr) { _tracker->pop_scope(_scope); }
    }

    // UntrackGuard

    DependencyTracker::UntrackGuard::UntrackGuard(DependencyTracker &tracker)
        : _tracker{&tracker}, _saved{std::exchange(tracker._listeners, {})} {}

    DependencyTracker::UntrackGuard::UntrackGuard(UntrackGuard &&other) noexcept
        : _tracker{std::exchange(other._tracker, nullptr)}, _saved{std::move(other._saved)} {}

    DependencyTracker::UntrackGuard::~UntrackGuard() {
        if (_tracker == nullptr) { return; }
        if (!_tracker->_listeners.empty()) { fatal_invariant_violation("listener stack not balanced inside untrack"); }
        _tracker->_listeners = std::move(_saved);
    }

} // namespace rcell
