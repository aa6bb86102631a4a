#pragma once

/**
 * @file signal.h
 * @brief Read and write handles over a signal cell.
 *
 * Two ownership flavours share one protocol:
 *
 * - Static: the cell is allocated once and never reclaimed. Handles are plain pointers, copying them is free
 *   and they remain valid for the rest of the process. Use for state meant to outlive every observer.
 * - Dyn: the cell is shared, it lives as long as the longest-lived handle (or dependency edge) referring to it.
 *
 * Read handles (StaticReadSignal, DynReadSignal) can only fetch the current snapshot. Write handles
 * (StaticSignal, DynSignal) are read handles that can also replace the value and notify subscribers.
 *
 * Example:
 *
 *     auto state = rcell::Signal<int>{0};
 *     auto readonly = state.handle();
 *     state.set(1);
 *     assert(*readonly.get() == 1);
 */

#include <rcell/rcell_forward_declarations.h>
#include <rcell/runtime/dependency_tracker.h>
#include <rcell/types/signal_inner.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

namespace rcell {

    /**
     * The read protocol shared by both ownership flavours. Derived provides inner() and as_any_ref().
     */
    template<typename Derived, typename T>
    class ReadSignalBase {
    public:
        using value_type = T;
        using snapshot_type = std::shared_ptr<const T>;

        /**
         * The current snapshot. When called while a computation is running the cell is first registered as one
         * of its dependencies; with no computation running nothing is registered.
         */
        [[nodiscard]] snapshot_type get() const {
            DependencyTracker::track_read(derived().as_any_ref());
            return get_untracked();
        }

        /**
         * The current snapshot, never registering a dependency.
         */
        [[nodiscard]] snapshot_type get_untracked() const { return derived().inner().value(); }

    private:
        [[nodiscard]] const Derived &derived() const { return static_cast<const Derived &>(*this); }
    };

    template<typename T>
    class StaticReadSignal : public ReadSignalBase<StaticReadSignal<T>, T> {
    public:
        explicit StaticReadSignal(SignalInner<T> &inner) noexcept : _inner{&inner} {}

        // Over a fresh cell holding T{}; the cell is never reclaimed.
        StaticReadSignal() requires std::default_initializable<T> : _inner{new SignalInner<T>(T{})} {}

        [[nodiscard]] SignalInner<T> &inner() const noexcept { return *_inner; }

        [[nodiscard]] AnySignalRef as_any_ref() const noexcept { return AnySignalRef::from_static(*_inner); }

    private:
        SignalInner<T> *_inner;
    };

    template<typename T>
    class DynReadSignal : public ReadSignalBase<DynReadSignal<T>, T> {
    public:
        explicit DynReadSignal(std::shared_ptr<SignalInner<T>> inner) noexcept : _inner{std::move(inner)} {}

        // Over a fresh cell holding T{}.
        DynReadSignal() requires std::default_initializable<T> : _inner{std::make_shared<SignalInner<T>>(T{})} {}

        [[nodiscard]] SignalInner<T> &inner() const noexcept { return *_inner; }

        [[nodiscard]] AnySignalRef as_any_ref() const noexcept { return AnySignalRef::from_dynamic(_inner); }

        [[nodiscard]] long use_count() const noexcept { return _inner.use_count(); }

    private:
        std::shared_ptr<SignalInner<T>> _inner;
    };

    /**
     * The write protocol, layered over a read handle so a write handle can be used wherever a read handle is
     * expected.
     */
    template<typename Handle>
    class SignalBase : public Handle {
    public:
        using read_signal_type = Handle;
        using value_type = typename Handle::value_type;

        /**
         * Replace the value and notify every subscriber, always, even if the new value equals the old one.
         */
        void set(value_type new_value) const {
            this->inner().update(std::move(new_value));
            trigger_subscribers();
        }

        /**
         * Notify every subscriber without replacing the value, for values changed through inner mutability.
         * In general set is preferable.
         */
        void trigger_subscribers() const { this->inner().trigger_subscribers(); }

        [[nodiscard]] read_signal_type handle() const { return static_cast<const read_signal_type &>(*this); }

        [[nodiscard]] read_signal_type into_handle() && { return std::move(static_cast<read_signal_type &>(*this)); }

    protected:
        explicit SignalBase(read_signal_type handle) : read_signal_type{std::move(handle)} {}
    };

    template<typename T>
    class StaticSignal : public SignalBase<StaticReadSignal<T>> {
    public:
        /**
         * Allocates a cell that is never reclaimed.
         */
        explicit StaticSignal(T initial)
            // Leaked on purpose, a static cell is never reclaimed.
            : SignalBase<StaticReadSignal<T>>{StaticReadSignal<T>{*new SignalInner<T>(std::move(initial))}} {}

        StaticSignal() requires std::default_initializable<T> : StaticSignal(T{}) {}
    };

    template<typename T>
    class DynSignal : public SignalBase<DynReadSignal<T>> {
    public:
        explicit DynSignal(T initial)
            : SignalBase<DynReadSignal<T>>{DynReadSignal<T>{std::make_shared<SignalInner<T>>(std::move(initial))}} {}

        DynSignal() requires std::default_initializable<T> : DynSignal(T{}) {}
    };

    template<typename T>
    using Signal = StaticSignal<T>;

    template<typename T>
    using ReadSignal = StaticReadSignal<T>;

    template<typename S>
    concept ReadableSignal = requires(const S &s) {
        typename S::value_type;
        { s.get() } -> std::same_as<std::shared_ptr<const typename S::value_type>>;
        { s.get_untracked() } -> std::same_as<std::shared_ptr<const typename S::value_type>>;
        { s.as_any_ref() } -> std::same_as<AnySignalRef>;
    };

    template<typename S>
    concept WritableSignal = ReadableSignal<S> && requires(const S &s, typename S::value_type v) {
        typename S::read_signal_type;
        s.set(std::move(v));
        s.trigger_subscribers();
        { s.handle() } -> std::same_as<typename S::read_signal_type>;
    };

    /**
     * True when both handles refer to the same cell.
     */
    template<ReadableSignal L, ReadableSignal R>
    [[nodiscard]] bool same_signal(const L &lhs, const R &rhs) noexcept {
        return lhs.as_any_ref() == rhs.as_any_ref();
    }

    // Write handles compare by current value (untracked), matching the behaviour of the bare value.

    template<typename T>
        requires std::equality_comparable<T>
    bool operator==(const StaticSignal<T> &lhs, const StaticSignal<T> &rhs) {
        return *lhs.get_untracked() == *rhs.get_untracked();
    }

    template<typename T>
        requires std::equality_comparable<T>
    bool operator==(const DynSignal<T> &lhs, const DynSignal<T> &rhs) {
        return *lhs.get_untracked() == *rhs.get_untracked();
    }

} // namespace rcell

// Write handles hash by current value (untracked), consistent with operator==.

namespace std {

    template<typename T>
        requires requires(const T &v) {
            { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
        }
    struct hash<rcell::StaticSignal<T>> {
        std::size_t operator()(const rcell::StaticSignal<T> &signal) const {
            return std::hash<T>{}(*signal.get_untracked());
        }
    };

    template<typename T>
        requires requires(const T &v) {
            { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
        }
    struct hash<rcell::DynSignal<T>> {
        std::size_t operator()(const rcell::DynSignal<T> &signal) const {
            return std::hash<T>{}(*signal.get_untracked());
        }
    };

} // namespace std
