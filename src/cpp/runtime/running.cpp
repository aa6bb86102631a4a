#include <rcell/runtime/running.h>

#include <fmt/format.h>

#include <cstdio>
#include <exception>

namespace rcell {

    Running::~Running() {
        try {
            dispose();
        } catch (const std::exception &e) {
            fmt::print(stderr, "[rcell] warning: exception while disposing computation: {}\n", e.what());
        }
    }

    void Running::add_dependency(const AnySignalRef &cell) { dependencies.try_emplace(cell.as_ptr(), cell); }

    void Running::clear_dependencies() {
        if (execute) {
            for (const auto &[_, cell] : dependencies) { cell.unsubscribe(execute.get()); }
        }
        dependencies.clear();
    }

    void Running::subscribe_dependencies() const {
        if (_disposed || !execute) { return; }
        for (const auto &[_, cell] : dependencies) { cell.subscribe(Callback{execute}); }
    }

    void Running::dispose() {
        if (_disposed) { return; }
        _disposed = true;
        if (execute) { execute->dispose(); }
        clear_dependencies();
        // Release the body; if it is executing, the invocation holds its own reference until it returns.
        execute.reset();
        scope.dispose();
    }

} // namespace rcell
