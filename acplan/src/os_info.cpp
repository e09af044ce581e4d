#include "acplan/os_info.hpp"
#include "acplan/file_utils.hpp"
#include "acplan/string_utils.hpp"

#include <sys/utsname.h>  // for uname

#include <array>        // for array
#include <filesystem>   // for exists
#include <optional>     // for optional
#include <utility>      // for pair

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

static constexpr auto OS_RELEASE_PATH = "/etc/os-release"sv;

static constexpr std::array<std::pair<std::string_view, std::string_view>, 11> OS_FAMILIES{{
    {"arch"sv, "Archlinux"sv},
    {"debian"sv, "Debian"sv},
    {"ubuntu"sv, "Debian"sv},
    {"rhel"sv, "RedHat"sv},
    {"fedora"sv, "RedHat"sv},
    {"centos"sv, "RedHat"sv},
    {"suse"sv, "Suse"sv},
    {"opensuse"sv, "Suse"sv},
    {"sles"sv, "Suse"sv},
    {"gentoo"sv, "Gentoo"sv},
    {"alpine"sv, "Alpine"sv},
}};

constexpr auto unquote(std::string_view value) noexcept -> std::string_view {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value.remove_prefix(1);
        value.remove_suffix(1);
    }
    return value;
}

auto family_for_id(std::string_view id) noexcept -> std::optional<std::string_view> {
    for (const auto& [known_id, family] : OS_FAMILIES) {
        if (known_id == id) {
            return family;
        }
    }
    return std::nullopt;
}

}  // namespace

namespace acplan::os {

auto parse_os_release(std::string_view content) noexcept -> OsRelease {
    OsRelease release{};
    for (auto&& line : utils::make_multiline_view(content)) {
        line = utils::trim(line);
        if (line.empty() || line.starts_with('#')) {
            continue;
        }
        const auto delim_pos = line.find('=');
        if (delim_pos == std::string_view::npos) {
            continue;
        }

        const auto& key   = line.substr(0, delim_pos);
        const auto& value = unquote(line.substr(delim_pos + 1));
        if (key == "ID"sv) {
            release.id = utils::to_lower(value);
        } else if (key == "ID_LIKE"sv) {
            release.id_like.clear();
            for (auto&& like : utils::make_multiline_view(value, ' ')) {
                release.id_like.emplace_back(utils::to_lower(like));
            }
        }
    }
    return release;
}

auto os_family_from_release(const OsRelease& release) noexcept -> std::string {
    if (auto family = family_for_id(release.id)) {
        return std::string{*family};
    }
    for (const auto& like : release.id_like) {
        if (auto family = family_for_id(like)) {
            return std::string{*family};
        }
    }
    return "Linux";
}

auto detect_os_family() noexcept -> std::string {
    struct utsname uts{};
    if (::uname(&uts) != 0) {
        spdlog::error("Failed to query kernel name, assuming Linux");
        return "Linux";
    }

    const std::string_view sysname{uts.sysname};
    if (sysname == "SunOS"sv) {
        return "Solaris";
    }
    if (sysname != "Linux"sv) {
        return std::string{sysname};
    }

    std::error_code err{};
    if (!fs::exists(OS_RELEASE_PATH, err)) {
        spdlog::warn("{} not found, assuming generic Linux", OS_RELEASE_PATH);
        return "Linux";
    }
    const auto& family = os_family_from_release(parse_os_release(file_utils::read_whole_file(OS_RELEASE_PATH)));
    spdlog::debug("Detected OS family: {}", family);
    return family;
}

}  // namespace acplan::os
