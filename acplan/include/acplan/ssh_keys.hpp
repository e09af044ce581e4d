#ifndef SSH_KEYS_HPP
#define SSH_KEYS_HPP

#include "acplan/account_spec.hpp"

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for pair
#include <vector>       // for vector

namespace acplan::ssh {

/// Authorized key owned by the account
struct SshKeyEntry final {
    /// Unique name within one account
    std::string name{};
    std::string type{};
    std::string key{};
    std::string owner{};
    spec::Ensure ensure{spec::Ensure::Present};

    bool operator==(const SshKeyEntry&) const = default;
};

/// Canonical key set plus non-fatal diagnostics
struct Consolidation final {
    std::vector<SshKeyEntry> entries{};
    std::vector<std::string> warnings{};
};

inline constexpr std::string_view DEFAULT_KEY_TYPE = "ssh-rsa";

/// @brief Check key type against the types accepted in authorized_keys
[[nodiscard]] auto is_valid_key_type(std::string_view type) noexcept -> bool;

/// @brief Name of the entry created from the deprecated single key
[[nodiscard]] auto legacy_key_name(std::string_view username) noexcept -> std::string;

/// @brief Name of the entry created from a ssh_keys mapping label
[[nodiscard]] auto mapped_key_name(std::string_view username, std::string_view label) noexcept -> std::string;

/// @brief Merge the deprecated single key and the key mapping into one set
/// @param account The resolved account, provides owner and ensure
/// @param legacy_key Deprecated single key material
/// @param legacy_type Type of the deprecated single key
/// @param key_mapping label -> key parameters, in declaration order
/// @return Consolidation on success, or error string describing the malformed entry.
[[nodiscard]] auto consolidate_ssh_keys(const spec::AccountSpec& account,
    const std::optional<std::string>& legacy_key,
    std::string_view legacy_type,
    const std::optional<std::vector<std::pair<std::string, spec::SshKeyParam>>>& key_mapping) noexcept
    -> std::expected<Consolidation, std::string>;

/// @brief Consolidate keys straight from the raw account parameters
[[nodiscard]] auto consolidate_ssh_keys(const spec::AccountSpec& account, const spec::AccountParams& params) noexcept
    -> std::expected<Consolidation, std::string>;

}  // namespace acplan::ssh

#endif  // SSH_KEYS_HPP
