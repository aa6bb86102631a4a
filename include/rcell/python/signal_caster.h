//
// nanobind conversions for signal handles.
//
// A handle crosses the Python boundary as its bare value: converting to Python takes an untracked snapshot and
// converts that with the value type's own caster, converting from Python builds a brand new cell around the
// converted value. Values that fail to convert surface as nanobind's usual cast errors.
//
// Handles over nb::object are bound as classes by the _rcell module (see _rcell_types.cpp) and are therefore
// excluded here.
//

#ifndef RCELL_PYTHON_SIGNAL_CASTER_H
#define RCELL_PYTHON_SIGNAL_CASTER_H

#include <rcell/types/signal.h>

#include <nanobind/nanobind.h>

#include <optional>
#include <type_traits>
#include <utility>

namespace rcell::python {
    template<typename S>
    struct fresh_signal;

    template<typename T>
    struct fresh_signal<StaticSignal<T>> {
        static StaticSignal<T> make(T value) { return StaticSignal<T>{std::move(value)}; }
    };

    template<typename T>
    struct fresh_signal<DynSignal<T>> {
        static DynSignal<T> make(T value) { return DynSignal<T>{std::move(value)}; }
    };

    template<typename T>
    struct fresh_signal<StaticReadSignal<T>> {
        static StaticReadSignal<T> make(T value) { return StaticSignal<T>{std::move(value)}.handle(); }
    };

    template<typename T>
    struct fresh_signal<DynReadSignal<T>> {
        static DynReadSignal<T> make(T value) { return DynSignal<T>{std::move(value)}.handle(); }
    };

    template<typename T>
    inline constexpr bool is_value_castable_v = !std::is_same_v<T, nanobind::object>;
} // namespace rcell::python

NAMESPACE_BEGIN(NB_NAMESPACE)
NAMESPACE_BEGIN(detail)

template<typename Signal>
struct rcell_signal_caster {
    using Value = Signal;
    using Inner = typename Signal::value_type;
    using Caster = make_caster<Inner>;

    static constexpr auto Name = Caster::Name;

    template<typename T_>
    using Cast = movable_cast_t<T_>;

    template<typename T_>
    static constexpr bool can_cast() { return true; }

    std::optional<Value> value;

    bool from_python(handle src, uint8_t flags, cleanup_list *cleanup) noexcept {
        Caster caster;
        if (!caster.from_python(src, flags_for_local_caster<Inner>(flags), cleanup) ||
            !caster.template can_cast<Inner>()) {
            return false;
        }
        value.emplace(rcell::python::fresh_signal<Value>::make(caster.operator cast_t<Inner>()));
        return true;
    }

    template<typename T_>
    static handle from_cpp(T_ &&signal, rv_policy, cleanup_list *cleanup) noexcept {
        // The snapshot is shared with the cell, Python always receives its own copy.
        return Caster::from_cpp(*signal.get_untracked(), rv_policy::copy, cleanup);
    }

    template<typename T_, enable_if_t<std::is_same_v<std::remove_cv_t<T_>, Value>> = 0>
    static handle from_cpp(T_ *signal, rv_policy policy, cleanup_list *cleanup) noexcept {
        if (!signal) { return none().release(); }
        return from_cpp(*signal, policy, cleanup);
    }

    explicit operator Value *() { return &*value; }
    explicit operator Value &() { return *value; }
    explicit operator Value &&() { return std::move(*value); }
};

template<typename T>
    requires rcell::python::is_value_castable_v<T>
struct type_caster<rcell::StaticSignal<T>> : rcell_signal_caster<rcell::StaticSignal<T>> {};

template<typename T>
    requires rcell::python::is_value_castable_v<T>
struct type_caster<rcell::DynSignal<T>> : rcell_signal_caster<rcell::DynSignal<T>> {};

template<typename T>
    requires rcell::python::is_value_castable_v<T>
struct type_caster<rcell::StaticReadSignal<T>> : rcell_signal_caster<rcell::StaticReadSignal<T>> {};

template<typename T>
    requires rcell::python::is_value_castable_v<T>
struct type_caster<rcell::DynReadSignal<T>> : rcell_signal_caster<rcell::DynReadSignal<T>> {};

NAMESPACE_END(detail)
NAMESPACE_END(NB_NAMESPACE)

#endif // RCELL_PYTHON_SIGNAL_CASTER_H
