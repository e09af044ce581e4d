#include "acplan/string_utils.hpp"

#include <cctype>  // for tolower, isspace

namespace acplan::utils {

auto make_multiline_view(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto trim(std::string_view str) noexcept -> std::string_view {
    constexpr auto is_space = [](char char_elem) { return std::isspace(static_cast<unsigned char>(char_elem)) != 0; };
    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

auto to_lower(std::string_view text) noexcept -> std::string {
    std::string res{text};
    std::ranges::transform(res, res.begin(),
        [](char char_elem) { return static_cast<char>(std::tolower(static_cast<unsigned char>(char_elem))); });
    return res;
}

}  // namespace acplan::utils
