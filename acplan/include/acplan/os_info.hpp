#ifndef OS_INFO_HPP
#define OS_INFO_HPP

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace acplan::os {

/// Fields of os-release(5) used for family detection
struct OsRelease final {
    std::string id{};
    std::vector<std::string> id_like{};

    bool operator==(const OsRelease&) const = default;
};

/// @brief Parse the content of /etc/os-release
/// @param content The file content
/// @return Parsed ID and ID_LIKE, empty when missing
[[nodiscard]] auto parse_os_release(std::string_view content) noexcept -> OsRelease;

/// @brief Map os-release identifiers to OS family name, e.g "Debian" or "RedHat"
/// @param release The parsed os-release
/// @return The family name, "Linux" when unknown
[[nodiscard]] auto os_family_from_release(const OsRelease& release) noexcept -> std::string;

/// @brief Detect OS family of the running system
[[nodiscard]] auto detect_os_family() noexcept -> std::string;

}  // namespace acplan::os

#endif  // OS_INFO_HPP
