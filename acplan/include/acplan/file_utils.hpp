#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace acplan::file_utils {

// Returns empty string when the file can't be read
auto read_whole_file(std::string_view filepath) noexcept -> std::string;

}  // namespace acplan::file_utils

#endif  // FILE_UTILS_HPP
