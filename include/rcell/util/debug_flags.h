#pragma once

/**
 * @file debug_flags.h
 * @brief Environment switches for the reactive runtime's diagnostic output.
 *
 * Each flag is enabled by the presence of the environment variable, whatever its value, e.g.
 *
 *     RCELL_DEBUG_NOTIFY=1 ./my_app
 *
 * The variables are looked up where the diagnostic is produced so they can be toggled while a process runs.
 */

#include <rcell/rcell_export.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <utility>

namespace rcell {

    /// One line per subscriber visited by trigger_subscribers, with the outcome of the invocation.
    inline constexpr const char *RCELL_DEBUG_NOTIFY = "RCELL_DEBUG_NOTIFY";
    /// One line per dependency edge registered by a tracked read.
    inline constexpr const char *RCELL_DEBUG_TRACK = "RCELL_DEBUG_TRACK";
    /// One line per scope disposal with the number of effects and cleanups released.
    inline constexpr const char *RCELL_DEBUG_SCOPE = "RCELL_DEBUG_SCOPE";

    [[nodiscard]] inline bool debug_flag(const char *name) { return std::getenv(name) != nullptr; }

    /**
     * Unconditional diagnostic, used for misuse that is tolerated (the operation still completes).
     */
    template<typename... Ts>
    void warn(fmt::format_string<Ts...> fmt_str, Ts &&...xs) {
        fmt::print(stderr, "[rcell] warning: {}\n", fmt::format(fmt_str, std::forward<Ts>(xs)...));
    }

    /**
     * Channel-tagged diagnostic, printed only when the corresponding flag is set.
     */
    template<typename... Ts>
    void debug_print(const char *flag, const char *channel, fmt::format_string<Ts...> fmt_str, Ts &&...xs) {
        if (!debug_flag(flag)) { return; }
        fmt::print(stderr, "[rcell][{}] {}\n", channel, fmt::format(fmt_str, std::forward<Ts>(xs)...));
    }

} // namespace rcell
