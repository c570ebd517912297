#pragma once

#include <concepts>
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace ipod::error_check {

// Invariant violation with the call site attached
class DetailedException : public std::runtime_error {
public:
    explicit DetailedException(
        std::string_view what_failed,
        const std::source_location& where = std::source_location::current())
        : std::runtime_error(std::format("{} [{}:{} in {}]",
                                         what_failed,
                                         where.file_name(),
                                         where.line(),
                                         where.function_name())) {}
};

namespace detail {

inline std::string with_context(std::string_view msg, std::string detail) {
    if (msg.empty()) {
        return detail;
    }
    return std::format("{}: {}", msg, detail);
}

} // namespace detail

inline void
check(bool condition,
      std::string_view msg,
      const std::source_location& loc = std::source_location::current()) {
    if (!condition) {
        throw DetailedException(msg, loc);
    }
}

inline void check_not_null(
    const void* ptr,
    std::string_view msg            = "unexpected null pointer",
    const std::source_location& loc = std::source_location::current()) {
    check(ptr != nullptr, msg, loc);
}

template <typename T, typename U>
void check_equal(
    const T& actual,
    const U& expected,
    std::string_view msg            = "",
    const std::source_location& loc = std::source_location::current()) {
    if (!(actual == expected)) {
        throw DetailedException(
            detail::with_context(
                msg, std::format("got {}, expected {}", actual, expected)),
            loc);
    }
}

template <typename T, typename U>
void check_greater_equal(
    const T& actual,
    const U& bound,
    std::string_view msg            = "",
    const std::source_location& loc = std::source_location::current()) {
    if (actual < bound) {
        throw DetailedException(
            detail::with_context(msg, std::format("got {}, expected >= {}",
                                                  actual, bound)),
            loc);
    }
}

// [start, end) must lie inside [0, size)
template <std::integral Index, std::integral Size>
void check_subrange(
    Index start,
    Index end,
    Size size,
    std::string_view msg            = "",
    const std::source_location& loc = std::source_location::current()) {
    using Common = std::common_type_t<std::make_unsigned_t<Index>,
                                      std::make_unsigned_t<Size>>;
    if (start > end || static_cast<Common>(end) > static_cast<Common>(size)) {
        throw DetailedException(
            detail::with_context(msg, std::format("[{}, {}) outside [0, {})",
                                                  start, end, size)),
            loc);
    }
}

} // namespace ipod::error_check
