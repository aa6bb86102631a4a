#include <rcell/runtime/reactive_scope.h>
#include <rcell/runtime/running.h>
#include <rcell/util/debug_flags.h>
#include <rcell/util/errors.h>

#include <fmt/format.h>

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

namespace rcell {

    ReactiveScope::ReactiveScope(ReactiveScope &&other) noexcept
        : _effects{std::move(other._effects)}, _cleanups{std::move(other._cleanups)} {
        other._effects.clear();
        other._cleanups.clear();
    }

    ReactiveScope &ReactiveScope::operator=(ReactiveScope &&other) {
        if (this != &other) {
            dispose();
            _effects = std::exchange(other._effects, {});
            _cleanups = std::exchange(other._cleanups, {});
        }
        return *this;
    }

    ReactiveScope::~ReactiveScope() {
        // Destructors must not throw, a failing cleanup is reported and the remaining ones are skipped.
        try {
            release();
        } catch (const std::exception &e) {
            fmt::print(stderr, "[rcell] warning: exception while disposing reactive scope: {}\n", e.what());
        }
    }

    void ReactiveScope::add_effect(running_s_ptr effect) { _effects.push_back(std::move(effect)); }

    void ReactiveScope::add_cleanup(std::function<void()> cleanup) { _cleanups.push_back(std::move(cleanup)); }

    void ReactiveScope::dispose() {
        if (auto *tracker = DependencyTracker::try_instance(); tracker != nullptr && tracker->is_active_scope(this)) {
            throw_error<std::logic_error>("cannot dispose a reactive scope while it is being populated by create_root");
        }
        release();
    }

    void ReactiveScope::release() {
        if (is_empty()) { return; }

        // Take the contents first, effects disposed below may re-enter this scope through their own cleanups.
        auto effects = std::exchange(_effects, {});
        auto cleanups = std::exchange(_cleanups, {});
        debug_print(RCELL_DEBUG_SCOPE, "scope", "dispose scope={} effects={} cleanups={}", fmt::ptr(this),
                    effects.size(), cleanups.size());

        for (auto &effect : effects) { effect->dispose(); }
        for (auto &cleanup : cleanups) { untrack(cleanup); }
    }

    void on_cleanup(std::function<void()> cleanup) {
        auto *scope = DependencyTracker::instance().current_scope();
        if (scope == nullptr) {
            warn("on_cleanup called outside of a reactive scope, the callback will never run");
            return;
        }
        scope->add_cleanup(std::move(cleanup));
    }

} // namespace rcell
