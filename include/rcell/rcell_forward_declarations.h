//
// Forward declarations and pointer aliases shared across the rcell headers.
//

#ifndef RCELL_FORWARD_DECLARATIONS_H
#define RCELL_FORWARD_DECLARATIONS_H

#include <memory>

namespace rcell {
    // CallbackBody - shared_ptr owned by the Running computation, weakly held by cells
    class CallbackBody;
    using callback_ptr = const CallbackBody *;
    using callback_s_ptr = std::shared_ptr<CallbackBody>;
    using callback_w_ptr = std::weak_ptr<CallbackBody>;

    class Callback;

    // AnySignalInner - raw pointer for static cells, shared_ptr for dynamic cells
    class AnySignalInner;
    using any_signal_inner_ptr = AnySignalInner *;
    using any_signal_inner_s_ptr = std::shared_ptr<AnySignalInner>;

    template<typename T>
    class SignalInner;

    class AnySignalRef;

    // Running - shared_ptr owned by a ReactiveScope, weakly held by the listener stack
    struct Running;
    using running_ptr = Running *;
    using running_s_ptr = std::shared_ptr<Running>;
    using running_w_ptr = std::weak_ptr<Running>;

    class ReactiveScope;
    class DependencyTracker;

    template<typename T>
    class StaticReadSignal;
    template<typename T>
    class DynReadSignal;
    template<typename T>
    class StaticSignal;
    template<typename T>
    class DynSignal;
} // namespace rcell

#endif // RCELL_FORWARD_DECLARATIONS_H
