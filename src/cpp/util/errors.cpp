#include <rcell/util/errors.h>

#include <cstdio>
#include <cstdlib>

namespace rcell {
    void fatal_invariant_violation(std::string_view msg, std::source_location loc) noexcept {
        fmt::print(stderr, "[rcell] FATAL: {}\nFile: {}({}:{}): {}\n", msg, loc.file_name(), loc.line(), loc.column(),
                   loc.function_name());
        std::fflush(stderr);
        std::abort();
    }
} // namespace rcell
