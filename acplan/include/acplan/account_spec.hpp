#ifndef ACCOUNT_SPEC_HPP
#define ACCOUNT_SPEC_HPP

#include <cstdint>      // for uint8_t, uint32_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <set>          // for set
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for pair
#include <vector>       // for vector

namespace acplan::spec {

/// Target state of an account and of every resource derived from it
enum class Ensure : std::uint8_t {
    Present,
    Absent
};

/// One entry of the ssh_keys mapping as it was given
struct SshKeyParam final {
    /// Key type, ssh-rsa when unset
    std::optional<std::string> type{};
    /// Base64 key material
    std::optional<std::string> key{};

    bool operator==(const SshKeyParam&) const = default;
};

/// Raw, unvalidated account parameters of a single provisioning request
struct AccountParams final {
    /// Request identifier, used as username when none is given
    std::string title{};

    std::optional<std::string> username{};
    std::optional<std::uint32_t> uid{};
    std::optional<std::string> password{};
    std::optional<std::string> shell{};
    std::optional<bool> manage_home{};
    std::optional<std::string> home_dir{};
    std::optional<std::string> home_dir_perms{};
    std::optional<bool> create_group{};
    std::optional<std::vector<std::string>> groups{};
    std::optional<bool> system{};
    std::optional<std::string> ensure{};
    std::optional<std::string> comment{};
    std::optional<std::string> gid{};
    std::optional<bool> allowdupe{};

    // deprecated single key
    std::optional<std::string> ssh_key{};
    std::optional<std::string> ssh_key_type{};

    /// label -> key, in declaration order
    std::optional<std::vector<std::pair<std::string, SshKeyParam>>> ssh_keys{};

    bool operator==(const AccountParams&) const = default;
};

/// Fully defaulted description of one desired account
struct AccountSpec final {
    std::string username{};
    std::optional<std::uint32_t> uid{};
    std::string password{};
    std::string shell{};
    bool manage_home{false};
    std::string home_dir_perms{};
    bool create_group{true};
    bool system{false};
    std::set<std::string> groups{};
    Ensure ensure{Ensure::Present};
    std::string comment{};
    std::string gid{};
    bool allow_duplicate_uid{false};

    // derived
    std::string primary_group{};
    std::string home_dir_real{};

    bool operator==(const AccountSpec&) const = default;
};

/// Result of a successful resolution
struct ResolvedAccount final {
    AccountSpec spec{};
    std::vector<std::string> warnings{};
};

inline constexpr std::string_view DISABLED_PASSWORD  = "!";
inline constexpr std::string_view DEFAULT_SHELL      = "/bin/bash";
inline constexpr std::string_view DEFAULT_HOME_PERMS = "0750";
inline constexpr std::string_view DEFAULT_GID        = "users";

/// @brief Convert ensure string to enum, case-insensitive
/// @param ensure_str The string representation, e.g "present" or "Absent"
/// @return The Ensure value or std::nullopt if invalid
[[nodiscard]] auto ensure_from_string(std::string_view ensure_str) noexcept -> std::optional<Ensure>;

/// @brief Convert Ensure enum to lowercase string
[[nodiscard]] auto ensure_to_string(Ensure ensure) noexcept -> std::string_view;

/// @brief Default home directory for the user on the given OS family
/// @param username The username
/// @param os_family OS family name, e.g "Solaris", "Debian"
/// @return Absolute path of the home directory
[[nodiscard]] auto default_home_dir(std::string_view username, std::string_view os_family) noexcept -> std::string;

/// @brief Check that a mode is an octal permission string (e.g 750 or 0750)
[[nodiscard]] auto is_valid_mode(std::string_view mode) noexcept -> bool;

/// @brief Resolve raw parameters into a fully defaulted account spec
/// @param params The raw account parameters
/// @param os_family OS family name used for home directory defaulting
/// @return ResolvedAccount on success, or error string on validation failure.
[[nodiscard]] auto resolve_spec(const AccountParams& params, std::string_view os_family) noexcept
    -> std::expected<ResolvedAccount, std::string>;

}  // namespace acplan::spec

#endif  // ACCOUNT_SPEC_HPP
