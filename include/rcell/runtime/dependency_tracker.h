#pragma once

/**
 * @file dependency_tracker.h
 * @brief The per-thread stacks that make reads implicit dependency declarations.
 *
 * The tracker holds:
 * - the listener stack: the computations currently running, innermost last. A tracked read registers the
 *   cell with the top entry only.
 * - the scope stack: the ReactiveScopes currently being populated by create_root. New effects and cleanup
 *   callbacks are owned by the top entry.
 * - the detached effects: effects created with no active scope. They live until the thread exits.
 *
 * Life-cycle: the tracker is created empty on first use by a thread and destroyed at thread exit. Both stacks
 * must be empty at that point, a non-empty listener stack means a computation was leaked while running.
 * Once destroyed, try_instance() returns nullptr, which lets destructors that run during thread teardown read
 * signals without tracking.
 *
 * The reactive graph is single-threaded, each thread sees only its own tracker.
 */

#include <rcell/rcell_export.h>
#include <rcell/rcell_forward_declarations.h>
#include <rcell/types/signal_inner.h>

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace rcell {

    class RCELL_EXPORT DependencyTracker {
    public:
        /**
         * Pops the computation pushed by enter() when it goes out of scope.
         */
        class RCELL_EXPORT [[nodiscard]] ListenerGuard {
        public:
            ListenerGuard(DependencyTracker &tracker, running_w_ptr running);
            ListenerGuard(ListenerGuard &&other) noexcept;
            ListenerGuard(const ListenerGuard &) = delete;
            ListenerGuard &operator=(const ListenerGuard &) = delete;
            ListenerGuard &operator=(ListenerGuard &&) = delete;
            ~ListenerGuard();

        private:
            DependencyTracker *_tracker;
            running_w_ptr _running;
        };

        class RCELL_EXPORT [[nodiscard]] ScopeGuard {
        public:
            ScopeGuard(DependencyTracker &tracker, ReactiveScope &scope);
            ScopeGuard(ScopeGuard &&other) noexcept;
            ScopeGuard(const ScopeGuard &) = delete;
            ScopeGuard &operator=(const ScopeGuard &) = delete;
            ScopeGuard &operator=(ScopeGuard &&) = delete;
            ~ScopeGuard();

        private:
            DependencyTracker *_tracker;
            ReactiveScope *_scope;
        };

        /**
         * Empties the listener stack for its lifetime and restores it afterwards.
         */
        class RCELL_EXPORT [[nodiscard]] UntrackGuard {
        public:
            explicit UntrackGuard(DependencyTracker &tracker);
            UntrackGuard(UntrackGuard &&other) noexcept;
            UntrackGuard(const UntrackGuard &) = delete;
            UntrackGuard &operator=(const UntrackGuard &) = delete;
            UntrackGuard &operator=(UntrackGuard &&) = delete;
            ~UntrackGuard();

        private:
            DependencyTracker *_tracker;
            std::vector<running_w_ptr> _saved;
        };

        DependencyTracker(const DependencyTracker &) = delete;
        DependencyTracker &operator=(const DependencyTracker &) = delete;
        ~DependencyTracker();

        /**
         * The calling thread's tracker, created on first use. Aborts if called after the thread's tracker has
         * been destroyed.
         */
        [[nodiscard]] static DependencyTracker &instance();

        /**
         * The calling thread's tracker, or nullptr once it has been torn down.
         */
        [[nodiscard]] static DependencyTracker *try_instance() noexcept;

        /**
         * Register a read of cell with the running computation, if any. This is what every tracked read calls.
         */
        static void track_read(const AnySignalRef &cell);

        ListenerGuard enter(running_w_ptr running);

        ScopeGuard enter_scope(ReactiveScope &scope);

        UntrackGuard suspend();

        /**
         * Adds cell to the dependency set of the top computation. Does nothing when no computation is running.
         */
        void track(const AnySignalRef &cell);

        [[nodiscard]] ReactiveScope *current_scope() const noexcept;

        [[nodiscard]] bool is_active_scope(const ReactiveScope *scope) const noexcept;

        /**
         * Keep an effect created outside of any scope alive until thread exit.
         */
        void adopt_detached(running_s_ptr running);

        /**
         * Dispose every detached effect now, in creation order, instead of at thread exit. Hosts whose runtime
         * ends before the thread does (an embedding interpreter) call this while the captured state is still
         * valid. An exception from a cleanup propagates after the remaining effects have been disposed.
         */
        void dispose_detached();

        [[nodiscard]] std::size_t depth() const noexcept { return _listeners.size(); }
        [[nodiscard]] std::size_t scope_depth() const noexcept { return _scopes.size(); }
        [[nodiscard]] std::size_t detached_count() const noexcept { return _detached.size(); }

    private:
        DependencyTracker();

        void pop_listener(const running_w_ptr &expected);
        void pop_scope(const ReactiveScope *expected);

        std::vector<running_w_ptr> _listeners;
        std::vector<ReactiveScope *> _scopes;
        std::vector<running_s_ptr> _detached;
    };

    /**
     * Run f without registering any of its reads as dependencies of the running computation.
     */
    template<typename F>
    decltype(auto) untrack(F &&f) {
        auto *tracker = DependencyTracker::try_instance();
        if (tracker == nullptr) { return std::invoke(std::forward<F>(f)); }
        auto guard = tracker->suspend();
        return std::invoke(std::forward<F>(f));
    }

} // namespace rcell
