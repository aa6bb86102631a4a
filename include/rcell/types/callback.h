#pragma once

/**
 * @file callback.h
 * @brief CallbackBody and Callback - the subscriber side of a cell.
 *
 * A reactive computation is represented to the cells it reads by a Callback: a weak,
 * identity-comparable handle onto the CallbackBody owned by the computation. Cells never
 * keep a computation alive, and the same computation can only appear once in a cell's
 * subscriber map because the map is keyed by the body's address.
 *
 * State machine of a body:
 *
 *     Idle --try_invoke--> Running --return/throw--> Idle
 *       \                     \
 *        +------dispose--------+----> Disposed (terminal)
 *
 * Invoking a Running or Disposed body is a no-op reported through CallbackInvocation.
 */

#include <rcell/rcell_export.h>
#include <rcell/rcell_forward_declarations.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

namespace rcell {

    enum class CallbackState : std::uint8_t {
        Idle,
        Running,
        Disposed,
    };

    /**
     * Result of attempting to run a callback. Only Invoked means the function was called, the others are
     * expected, silent skips.
     */
    enum class CallbackInvocation : std::uint8_t {
        Invoked,
        Expired,   // the backing body has been released
        Disposed,  // the owning computation has been disposed
        Reentrant, // the body is already executing further up the stack
    };

    [[nodiscard]] RCELL_EXPORT std::string_view to_string(CallbackState state) noexcept;

    [[nodiscard]] RCELL_EXPORT std::string_view to_string(CallbackInvocation invocation) noexcept;

    class RCELL_EXPORT CallbackBody {
    public:
        explicit CallbackBody(std::function<void()> fn);

        CallbackBody(const CallbackBody &) = delete;
        CallbackBody &operator=(const CallbackBody &) = delete;

        /**
         * Run the function if the body is Idle. The body is Running for the duration of the call, so a nested
         * propagation that reaches this body again is dropped rather than recursing.
         */
        CallbackInvocation try_invoke();

        /**
         * Terminal transition, may be requested while the body is running; the current call completes normally.
         */
        void dispose() noexcept;

        [[nodiscard]] CallbackState state() const noexcept { return _state; }
        [[nodiscard]] bool is_running() const noexcept { return _state == CallbackState::Running; }
        [[nodiscard]] bool is_disposed() const noexcept { return _state == CallbackState::Disposed; }

        /**
         * Bodies must be shared-allocated so the identity stays reserved while any Callback refers to it.
         */
        [[nodiscard]] static callback_s_ptr make(std::function<void()> fn);

    private:
        std::function<void()> _fn;
        CallbackState _state{CallbackState::Idle};
    };

    class RCELL_EXPORT Callback {
    public:
        explicit Callback(const callback_s_ptr &body) noexcept;

        [[nodiscard]] callback_ptr as_ptr() const noexcept { return _identity; }

        [[nodiscard]] bool expired() const noexcept { return _body.expired(); }

        /**
         * Resolve the weak reference and run the body. Reports Expired when the body no longer exists.
         */
        CallbackInvocation try_invoke() const;

        friend bool operator==(const Callback &lhs, const Callback &rhs) noexcept {
            return lhs._identity == rhs._identity;
        }

    private:
        callback_w_ptr _body;
        callback_ptr _identity;
    };

} // namespace rcell
