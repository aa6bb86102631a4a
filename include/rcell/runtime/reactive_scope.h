#pragma once

/**
 * @file reactive_scope.h
 * @brief Ownership of effects and cleanup callbacks.
 *
 * Every effect is owned by the scope that was active when it was created. Effects create a fresh child scope
 * on every run, so disposing a scope releases the whole tree of computations created under it.
 */

#include <rcell/rcell_export.h>
#include <rcell/rcell_forward_declarations.h>
#include <rcell/runtime/dependency_tracker.h>

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace rcell {

    class RCELL_EXPORT ReactiveScope {
    public:
        ReactiveScope() = default;
        ReactiveScope(ReactiveScope &&other) noexcept;

        /**
         * Disposes the current contents before taking over those of other.
         */
        ReactiveScope &operator=(ReactiveScope &&other);

        ReactiveScope(const ReactiveScope &) = delete;
        ReactiveScope &operator=(const ReactiveScope &) = delete;

        ~ReactiveScope();

        void add_effect(running_s_ptr effect);

        void add_cleanup(std::function<void()> cleanup);

        /**
         * Dispose the owned effects (in creation order), then run the cleanup callbacks (in registration order)
         * with tracking suspended. The scope is empty afterwards and can be reused.
         *
         * @throws std::logic_error if the scope is still being populated by create_root.
         */
        void dispose();

        [[nodiscard]] std::size_t effect_count() const noexcept { return _effects.size(); }
        [[nodiscard]] std::size_t cleanup_count() const noexcept { return _cleanups.size(); }
        [[nodiscard]] bool is_empty() const noexcept { return _effects.empty() && _cleanups.empty(); }

    private:
        void release();

        std::vector<running_s_ptr> _effects;
        std::vector<std::function<void()>> _cleanups;
    };

    /**
     * Run f with a new scope active and return that scope. Effects and cleanup callbacks registered by f belong
     * to the returned scope and live until it is disposed or destroyed.
     */
    template<typename F>
        requires std::is_invocable_v<F>
    [[nodiscard]] ReactiveScope create_root(F &&f) {
        ReactiveScope scope;
        {
            auto guard = DependencyTracker::instance().enter_scope(scope);
            std::invoke(std::forward<F>(f));
        }
        return scope;
    }

    /**
     * Register a callback to run when the innermost active scope is disposed. For an effect this is just before
     * its next run, or when the effect itself is disposed.
     */
    RCELL_EXPORT void on_cleanup(std::function<void()> cleanup);

} // namespace rcell
