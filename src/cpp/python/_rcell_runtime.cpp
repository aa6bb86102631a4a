#include <rcell/runtime/effect.h>
#include <rcell/runtime/reactive_scope.h>

#include <nanobind/nanobind.h>

#include <utility>

namespace nb = nanobind;
using namespace nb::literals;

void export_runtime(nb::module_ &m) {
    using namespace rcell;

    nb::class_<ReactiveScope>(m, "ReactiveScope")
            .def("dispose", &ReactiveScope::dispose)
            .def_prop_ro("effect_count", &ReactiveScope::effect_count)
            .def_prop_ro("cleanup_count", &ReactiveScope::cleanup_count)
            .def_prop_ro("is_empty", &ReactiveScope::is_empty);

    m.def("create_root", [](nb::callable fn) { return create_root([&fn] { fn(); }); }, "fn"_a,
          "Run fn with a new scope active and return that scope");

    m.def("create_effect", [](nb::callable fn) { create_effect([fn = std::move(fn)] { fn(); }); }, "fn"_a);

    m.def("create_memo", [](nb::callable fn) {
        return create_memo([fn = std::move(fn)]() -> nb::object { return fn(); });
    }, "fn"_a);

    m.def("create_selector", [](nb::callable fn) {
        return create_selector_with([fn = std::move(fn)]() -> nb::object { return fn(); },
                                    [](const nb::object &lhs, const nb::object &rhs) { return lhs.equal(rhs); });
    }, "fn"_a);

    m.def("untrack", [](nb::callable fn) -> nb::object { return untrack([&fn] { return fn(); }); }, "fn"_a);

    m.def("on_cleanup", [](nb::callable fn) { on_cleanup([fn = std::move(fn)] { fn(); }); }, "fn"_a);
}
