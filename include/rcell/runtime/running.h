#pragma once

#include <rcell/rcell_export.h>
#include <rcell/rcell_forward_declarations.h>
#include <rcell/runtime/reactive_scope.h>
#include <rcell/types/callback.h>
#include <rcell/types/signal_inner.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>

namespace rcell {

    /**
     * The cells read during a computation's last run, keyed by cell identity so a cell read several times is
     * recorded once.
     */
    using DependencySet = ankerl::unordered_dense::map<const AnySignalInner *, AnySignalRef>;

    /**
     * State of one reactive computation.
     *
     * execute is the body registered with the cells in dependencies. scope owns whatever the last run created.
     * The listener stack only holds weak references to a Running, ownership sits with a ReactiveScope.
     */
    struct RCELL_EXPORT Running {
        Running() = default;
        Running(const Running &) = delete;
        Running &operator=(const Running &) = delete;
        ~Running();

        callback_s_ptr execute;
        DependencySet dependencies;
        ReactiveScope scope;

        void add_dependency(const AnySignalRef &cell);

        /**
         * Unsubscribe execute from every dependency and forget them.
         */
        void clear_dependencies();

        /**
         * Subscribe execute to every dependency recorded by the last run.
         */
        void subscribe_dependencies() const;

        /**
         * Stop the computation for good: no further runs, no subscriptions, child scope disposed.
         */
        void dispose();

        [[nodiscard]] bool is_disposed() const noexcept { return _disposed; }

        [[nodiscard]] std::size_t dependency_count() const noexcept { return dependencies.size(); }

        [[nodiscard]] bool depends_on(const AnySignalRef &cell) const { return dependencies.contains(cell.as_ptr()); }

    private:
        bool _disposed{false};
    };

} // namespace rcell
