#pragma once

/**
 * @file effect.h
 * @brief Computations that re-run when the signals they read change.
 *
 * Example:
 *
 *     auto root = rcell::create_root([&] {
 *         auto count = rcell::DynSignal<int>{0};
 *         auto doubled = rcell::create_memo([count] { return *count.get() * 2; });
 *         rcell::create_effect([doubled] { fmt::print("{}\n", *doubled.get()); });   // prints 0
 *         count.set(2);                                                             // prints 4
 *     });
 *     root.dispose();
 */

#include <rcell/rcell_export.h>
#include <rcell/runtime/reactive_scope.h>
#include <rcell/types/signal.h>

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace rcell {

    /**
     * Run effect now and again every time one of the signals it read on its previous run is set.
     *
     * The effect belongs to the innermost active scope. Each run first disposes what the previous run created
     * (nested effects, cleanup callbacks) and forgets the previous dependencies, so the dependency set always
     * reflects the latest run only.
     */
    RCELL_EXPORT void create_effect(std::function<void()> effect);

    /**
     * A read-only signal holding the result of f, recomputed whenever the signals f reads change. Subscribers
     * of the returned signal are notified only when eq(old_value, new_value) is false.
     */
    template<typename F, typename Eq>
        requires std::is_invocable_v<F> &&
                 std::is_invocable_r_v<bool, Eq, const std::decay_t<std::invoke_result_t<F>> &,
                                       const std::decay_t<std::invoke_result_t<F>> &>
    [[nodiscard]] DynReadSignal<std::decay_t<std::invoke_result_t<F>>> create_selector_with(F &&f, Eq eq) {
        using T = std::decay_t<std::invoke_result_t<F>>;

        auto memo = std::make_shared<std::optional<DynSignal<T>>>();
        create_effect([memo, f = std::forward<F>(f), eq = std::move(eq)]() mutable {
            T new_value = std::invoke(f);
            if (!memo->has_value()) {
                memo->emplace(std::move(new_value));
            } else if (!std::invoke(eq, *(*memo)->get_untracked(), new_value)) {
                (*memo)->set(std::move(new_value));
            }
        });
        return (*memo)->handle();
    }

    /**
     * A memoised derived signal that notifies its subscribers on every recomputation.
     */
    template<typename F>
        requires std::is_invocable_v<F>
    [[nodiscard]] auto create_memo(F &&f) {
        using T = std::decay_t<std::invoke_result_t<F>>;
        return create_selector_with(std::forward<F>(f), [](const T &, const T &) { return false; });
    }

    /**
     * A memoised derived signal that notifies its subscribers only when the value changes according to ==.
     */
    template<typename F>
        requires std::is_invocable_v<F> && std::equality_comparable<std::decay_t<std::invoke_result_t<F>>>
    [[nodiscard]] auto create_selector(F &&f) {
        return create_selector_with(std::forward<F>(f), std::equal_to<>{});
    }

} // namespace rcell
