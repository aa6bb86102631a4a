#ifndef RCELL_UTIL_ERRORS
#define RCELL_UTIL_ERRORS

#include <rcell/rcell_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rcell {

    // Throws Error with msg followed by the location of the call
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    /**
     * Report a broken internal invariant of the reactive graph and abort.
     * Continuing after one of these would leave the dependency graph corrupted, so there is no recovery path.
     */
    [[noreturn]] RCELL_EXPORT void fatal_invariant_violation(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) noexcept;

} // namespace rcell

#endif // RCELL_UTIL_ERRORS
