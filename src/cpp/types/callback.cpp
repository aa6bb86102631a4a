#include <rcell/types/callback.h>

#include <utility>

namespace rcell {

    namespace {
        /**
         * Holds a body in the Running state for the duration of a call. A disposal requested during the call is
         * kept, otherwise the body returns to Idle, also when the call throws.
         */
        class RunningGuard {
        public:
            explicit RunningGuard(CallbackState &state) noexcept : _state{state} { _state = CallbackState::Running; }
            RunningGuard(const RunningGuard &) = delete;
            RunningGuard &operator=(const RunningGuard &) = delete;
            ~RunningGuard() {
                if (_state == CallbackState::Running) { _state = CallbackState::Idle; }
            }

        private:
            CallbackState &_state;
        };
    } // namespace

    std::string_view to_string(CallbackState state) noexcept {
        switch (state) {
            case CallbackState::Idle: return "Idle";
            case CallbackState::Running: return "Running";
            case CallbackState::Disposed: return "Disposed";
        }
        return "Unknown";
    }

    std::string_view to_string(CallbackInvocation invocation) noexcept {
        switch (invocation) {
            case CallbackInvocation::Invoked: return "Invoked";
            case CallbackInvocation::Expired: return "Expired";
            case CallbackInvocation::Disposed: return "Disposed";
            case CallbackInvocation::Reentrant: return "Reentrant";
        }
        return "Unknown";
    }

    CallbackBody::CallbackBody(std::function<void()> fn) : _fn{std::move(fn)} {}

    callback_s_ptr CallbackBody::make(std::function<void()> fn) { return std::make_shared<CallbackBody>(std::move(fn)); }

    CallbackInvocation CallbackBody::try_invoke() {
        if (_state == CallbackState::Disposed) { return CallbackInvocation::Disposed; }
        if (_state == CallbackState::Running) { return CallbackInvocation::Reentrant; }

        RunningGuard guard{_state};
        _fn();
        return CallbackInvocation::Invoked;
    }

    void CallbackBody::dispose() noexcept { _state = CallbackState::Disposed; }

    Callback::Callback(const callback_s_ptr &body) noexcept : _body{body}, _identity{body.get()} {}

    CallbackInvocation Callback::try_invoke() const {
        // Hold a strong reference for the whole call; the owning computation may release its own body while running.
        auto body = _body.lock();
        if (!body) { return CallbackInvocation::Expired; }
        return body->try_invoke();
    }

} // namespace rcell
