//
// fmt support for the signal handles, e.g. fmt::format("{}", Signal<int>{3}) == "StaticSignal(3)".
// Formatting reads the value untracked, so it can be used freely inside effects.
//

#ifndef RCELL_SIGNAL_FORMAT_H
#define RCELL_SIGNAL_FORMAT_H

#include <rcell/types/signal.h>

#include <fmt/format.h>

#include <string_view>

namespace rcell {
    template<typename S>
    struct signal_debug_name;

    template<typename T>
    struct signal_debug_name<StaticReadSignal<T>> {
        static constexpr std::string_view value = "StaticReadSignal";
    };

    template<typename T>
    struct signal_debug_name<DynReadSignal<T>> {
        static constexpr std::string_view value = "DynReadSignal";
    };

    template<typename T>
    struct signal_debug_name<StaticSignal<T>> {
        static constexpr std::string_view value = "StaticSignal";
    };

    template<typename T>
    struct signal_debug_name<DynSignal<T>> {
        static constexpr std::string_view value = "DynSignal";
    };
} // namespace rcell

template<typename S, typename CharT>
    requires rcell::ReadableSignal<S> && fmt::is_formattable<typename S::value_type, CharT>::value
struct fmt::formatter<S, CharT> {
    constexpr auto parse(fmt::basic_format_parse_context<CharT> &ctx) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}') { throw fmt::format_error("signal formatting takes no format specifiers"); }
        return it;
    }

    template<typename FormatContext>
    auto format(const S &signal, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}({})", rcell::signal_debug_name<S>::value, *signal.get_untracked());
    }
};

#endif // RCELL_SIGNAL_FORMAT_H
