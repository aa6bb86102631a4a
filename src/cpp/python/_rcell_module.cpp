/*
 * The entry point into the python _rcell module exposing the reactive core to python.
 *
 * Python values live in DynSignal<nb::object> cells, so their life-time follows the python handles that refer to
 * them. Effects, memos and cleanups take python callables; exceptions they raise propagate out of the call that
 * triggered them (typically Signal.set) as the original python exception.
 */
#include <rcell/runtime/dependency_tracker.h>

#include <nanobind/nanobind.h>

namespace nb = nanobind;

void export_types(nb::module_ &);

void export_runtime(nb::module_ &);

NB_MODULE(_rcell, m) {
    m.doc() = "The rcell fine-grained reactive core";

    export_types(m);
    export_runtime(m);

    // Effects created outside create_root are owned by the thread's tracker, which outlives the interpreter.
    // Release them, and the python objects they capture, while the interpreter is still running.
    nb::module_::import_("atexit").attr("register")(nb::cpp_function([] {
        if (auto *tracker = rcell::DependencyTracker::try_instance(); tracker != nullptr) { tracker->dispose_detached(); }
    }));
}
