#include <rcell/types/signal_inner.h>
#include <rcell/util/debug_flags.h>

#include <iterator>
#include <utility>

namespace rcell {

    void AnySignalInner::subscribe(Callback callback) {
        const auto key = callback.as_ptr();
        if (auto it = _subscribers.find(key); it != _subscribers.end()) {
            // An expired entry can share its identity with a body allocated at the same address later on.
            if (it->second.expired()) { it->second = std::move(callback); }
            return;
        }
        _subscribers.emplace(key, std::move(callback));
    }

    void AnySignalInner::unsubscribe(callback_ptr callback) { _subscribers.erase(callback); }

    bool AnySignalInner::is_subscribed(callback_ptr callback) const { return _subscribers.contains(callback); }

    std::vector<callback_ptr> AnySignalInner::subscriber_order() const {
        std::vector<callback_ptr> order;
        order.reserve(_subscribers.size());
        for (const auto &[ptr, _] : _subscribers) { order.push_back(ptr); }
        return order;
    }

    void AnySignalInner::trigger_subscribers() const {
        // Copy so that callbacks subscribing or unsubscribing (to this cell) cannot disturb the iteration.
        const auto subscribers = _subscribers.values();
        const bool debug_notify = debug_flag(RCELL_DEBUG_NOTIFY);
        if (debug_notify) {
            fmt::print(stderr, "[rcell][notify] cell={} subscribers={}\n", fmt::ptr(this), subscribers.size());
        }

        // Reverse order, so outer computations are re-run before the inner ones they created.
        for (auto it = subscribers.rbegin(); it != subscribers.rend(); ++it) {
            const auto result = it->second.try_invoke();
            if (debug_notify) {
                fmt::print(stderr, "[rcell][notify]  callback={} {}\n", fmt::ptr(it->first), to_string(result));
            }
        }
    }

    AnySignalRef AnySignalRef::from_static(AnySignalInner &inner) noexcept {
        return AnySignalRef{std::variant<static_ref, dynamic_ref>{std::in_place_type<static_ref>, &inner}};
    }

    AnySignalRef AnySignalRef::from_dynamic(dynamic_ref inner) noexcept {
        return AnySignalRef{std::variant<static_ref, dynamic_ref>{std::in_place_type<dynamic_ref>, std::move(inner)}};
    }

    AnySignalInner &AnySignalRef::inner() const noexcept {
        if (const auto *s = std::get_if<static_ref>(&_ref)) { return **s; }
        return *std::get<dynamic_ref>(_ref);
    }

    const AnySignalInner *AnySignalRef::as_ptr() const noexcept { return &inner(); }

    void AnySignalRef::subscribe(Callback callback) const { inner().subscribe(std::move(callback)); }

    void AnySignalRef::unsubscribe(callback_ptr callback) const { inner().unsubscribe(callback); }

} // namespace rcell
