#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>    // for transform
#include <ranges>       // for ranges::*
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace acplan::utils {

/// @brief Split a string into views of multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A vector of string views representing the split lines, empty parts are skipped.
auto make_multiline_view(std::string_view str, char delim = '\n') noexcept -> std::vector<std::string_view>;

/// @brief Strip leading and trailing whitespace.
auto trim(std::string_view str) noexcept -> std::string_view;

/// @brief Lowercase copy of ASCII text.
auto to_lower(std::string_view text) noexcept -> std::string;

/// @brief Make a split view from a string into multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A range view representing the split lines.
constexpr auto make_split_view(std::string_view str, char delim = '\n') noexcept {
    constexpr auto functor = [](auto&& rng) {
        return std::string_view(&*rng.begin(), static_cast<size_t>(std::ranges::distance(rng)));
    };
    constexpr auto second = [](auto&& rng) { return rng != ""; };

    return str
        | std::ranges::views::split(delim)
        | std::ranges::views::transform(functor)
        | std::ranges::views::filter(second);
}

}  // namespace acplan::utils

#endif  // STRING_UTILS_HPP
