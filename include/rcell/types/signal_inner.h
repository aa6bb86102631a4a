#pragma once

/**
 * @file signal_inner.h
 * @brief The storage of a signal cell and the type-erased reference used as a dependency edge.
 *
 * AnySignalInner carries everything that does not depend on the value type: the subscriber map and the
 * propagation entry point. SignalInner<T> adds the value snapshot.
 *
 * The subscriber map is an ankerl::unordered_dense::map, which keeps its entries in a dense vector in insertion
 * order. Notification walks that vector backwards. Erasing an entry moves the last entry into the vacated slot,
 * so unsubscribing reorders at most one other subscriber.
 */

#include <rcell/rcell_export.h>
#include <rcell/rcell_forward_declarations.h>
#include <rcell/types/callback.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace rcell {

    using SubscriberMap = ankerl::unordered_dense::map<callback_ptr, Callback>;

    class RCELL_EXPORT AnySignalInner {
    public:
        AnySignalInner() = default;
        virtual ~AnySignalInner() = default;

        AnySignalInner(const AnySignalInner &) = delete;
        AnySignalInner &operator=(const AnySignalInner &) = delete;

        /**
         * Adds a callback to the subscriber map. Does nothing if the callback is already a subscriber, the
         * original position is kept.
         */
        void subscribe(Callback callback);

        /**
         * Removes a callback from the subscriber map. Does nothing if it is not a subscriber.
         */
        void unsubscribe(callback_ptr callback);

        [[nodiscard]] bool is_subscribed(callback_ptr callback) const;

        [[nodiscard]] std::size_t subscriber_count() const noexcept { return _subscribers.size(); }

        /**
         * Subscriber identities in insertion order.
         */
        [[nodiscard]] std::vector<callback_ptr> subscriber_order() const;

        /**
         * Invoke every subscriber, most recently registered first.
         *
         * The subscriber list is copied before the first call, callbacks that subscribe or unsubscribe during
         * the pass affect the next pass only. Expired, disposed and already running subscribers are skipped.
         * Exceptions thrown by a subscriber abort the pass and propagate to the caller.
         */
        void trigger_subscribers() const;

    private:
        SubscriberMap _subscribers;
    };

    template<typename T>
    class SignalInner final : public AnySignalInner {
    public:
        using value_type = T;
        using snapshot_type = std::shared_ptr<const T>;

        explicit SignalInner(T value) : _value{std::make_shared<const T>(std::move(value))} {}

        [[nodiscard]] const snapshot_type &value() const noexcept { return _value; }

        /**
         * Installs a new snapshot. Does NOT notify subscribers, call trigger_subscribers for that, so several
         * cells can be updated before a single propagation pass. Snapshots handed out earlier are unaffected.
         */
        void update(T new_value) { _value = std::make_shared<const T>(std::move(new_value)); }

    private:
        snapshot_type _value;
    };

    /**
     * A reference to a cell of any value type, in one of the two ownership flavours:
     *
     * - static: the cell is never reclaimed, the reference is a plain pointer.
     * - dynamic: the cell is shared, the reference keeps it alive.
     *
     * Two references are equal when they refer to the same cell, whatever the flavour.
     */
    class RCELL_EXPORT AnySignalRef {
    public:
        using static_ref = any_signal_inner_ptr;
        using dynamic_ref = any_signal_inner_s_ptr;

        [[nodiscard]] static AnySignalRef from_static(AnySignalInner &inner) noexcept;
        [[nodiscard]] static AnySignalRef from_dynamic(dynamic_ref inner) noexcept;

        [[nodiscard]] const AnySignalInner *as_ptr() const noexcept;

        [[nodiscard]] bool is_static() const noexcept { return std::holds_alternative<static_ref>(_ref); }

        void subscribe(Callback callback) const;

        void unsubscribe(callback_ptr callback) const;

        friend bool operator==(const AnySignalRef &lhs, const AnySignalRef &rhs) noexcept {
            return lhs.as_ptr() == rhs.as_ptr();
        }

    private:
        explicit AnySignalRef(std::variant<static_ref, dynamic_ref> ref) noexcept : _ref{std::move(ref)} {}

        [[nodiscard]] AnySignalInner &inner() const noexcept;

        std::variant<static_ref, dynamic_ref> _ref;
    };

} // namespace rcell
