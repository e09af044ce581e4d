#include "doctest_compatibility.h"

#include "acplan/logger.hpp"
#include "acplan/os_info.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

static constexpr auto UBUNTU_OS_RELEASE = R"(PRETTY_NAME="Ubuntu 24.04.1 LTS"
NAME="Ubuntu"
VERSION_ID="24.04"
ID=ubuntu
ID_LIKE=debian
HOME_URL="https://www.ubuntu.com/"
)"sv;

static constexpr auto ROCKY_OS_RELEASE = R"(NAME="Rocky Linux"
# comment line
ID="rocky"
ID_LIKE="rhel centos fedora"

VERSION_ID="9.4"
)"sv;

static constexpr auto CACHYOS_OS_RELEASE = R"(NAME="CachyOS Linux"
PRETTY_NAME="CachyOS"
ID=cachyos
ID_LIKE=arch
)"sv;

TEST_CASE("os-release parsing")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    acplan::logger::set_logger(logger);

    using acplan::os::OsRelease;

    SECTION("unquoted values")
    {
        const auto& release = acplan::os::parse_os_release(UBUNTU_OS_RELEASE);
        REQUIRE_EQ(release.id, "ubuntu");
        REQUIRE((release.id_like == std::vector<std::string>{"debian"}));
    }
    SECTION("quoted list with comments")
    {
        const auto& release = acplan::os::parse_os_release(ROCKY_OS_RELEASE);
        REQUIRE_EQ(release.id, "rocky");
        REQUIRE((release.id_like == std::vector<std::string>{"rhel", "centos", "fedora"}));
    }
    SECTION("empty content")
    {
        const auto& release = acplan::os::parse_os_release(""sv);
        REQUIRE(release.id.empty());
        REQUIRE(release.id_like.empty());
    }
    SECTION("family from id")
    {
        REQUIRE_EQ(acplan::os::os_family_from_release(OsRelease{.id = "debian"}), "Debian");
        REQUIRE_EQ(acplan::os::os_family_from_release(OsRelease{.id = "fedora"}), "RedHat");
        REQUIRE_EQ(acplan::os::os_family_from_release(OsRelease{.id = "arch"}), "Archlinux");
        REQUIRE_EQ(acplan::os::os_family_from_release(OsRelease{.id = "alpine"}), "Alpine");
    }
    SECTION("family from id like")
    {
        REQUIRE_EQ(acplan::os::os_family_from_release(acplan::os::parse_os_release(UBUNTU_OS_RELEASE)), "Debian");
        REQUIRE_EQ(acplan::os::os_family_from_release(acplan::os::parse_os_release(ROCKY_OS_RELEASE)), "RedHat");
        REQUIRE_EQ(acplan::os::os_family_from_release(acplan::os::parse_os_release(CACHYOS_OS_RELEASE)), "Archlinux");
    }
    SECTION("unknown family")
    {
        REQUIRE_EQ(acplan::os::os_family_from_release(OsRelease{.id = "plan9"}), "Linux");
        REQUIRE_EQ(acplan::os::os_family_from_release(OsRelease{}), "Linux");
    }
    SECTION("detect on running system")
    {
        REQUIRE_FALSE(acplan::os::detect_os_family().empty());
    }
}
