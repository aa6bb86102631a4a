#include <rcell/types/callback.h>
#include <rcell/types/signal.h>

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>

#include <fmt/format.h>

#include <string>
#include <utility>

namespace nb = nanobind;
using namespace nb::literals;

namespace {
    using PyReadSignal = rcell::DynReadSignal<nb::object>;
    using PySignal = rcell::DynSignal<nb::object>;

    template<typename S>
    std::string signal_repr(const char *name, const S &signal) {
        return fmt::format("{}({})", name, nb::repr(*signal.get_untracked()).c_str());
    }
} // namespace

void export_types(nb::module_ &m) {
    nb::enum_<rcell::CallbackState>(m, "CallbackState")
            .value("Idle", rcell::CallbackState::Idle)
            .value("Running", rcell::CallbackState::Running)
            .value("Disposed", rcell::CallbackState::Disposed);

    nb::class_<PyReadSignal>(m, "ReadSignal")
            .def("get", [](const PyReadSignal &self) { return *self.get(); },
                 "The current value, registering a dependency when called inside an effect or memo")
            .def("get_untracked", [](const PyReadSignal &self) { return *self.get_untracked(); },
                 "The current value, never registering a dependency")
            .def("same_signal", [](const PyReadSignal &self, const PyReadSignal &other) {
                return rcell::same_signal(self, other);
            }, "other"_a)
            .def("__repr__", [](const PyReadSignal &self) { return signal_repr("DynReadSignal", self); });

    nb::class_<PySignal, PyReadSignal>(m, "Signal")
            .def(nb::init<nb::object>(), "value"_a.none())
            .def("set", [](const PySignal &self, nb::object value) { self.set(std::move(value)); }, "value"_a.none(),
                 "Replace the value and notify every subscriber")
            .def("trigger_subscribers", &PySignal::trigger_subscribers,
                 "Notify every subscriber without replacing the value")
            .def("handle", &PySignal::handle, "A read-only handle onto the same cell")
            .def("__repr__", [](const PySignal &self) { return signal_repr("DynSignal", self); });
}
