#ifndef ACCOUNT_CONFIG_HPP
#define ACCOUNT_CONFIG_HPP

#include "acplan/account_spec.hpp"

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace planner {

/// Accounts to plan, as read from the configuration file.
struct AccountsConfig {
    /// OS family override, detected from the running system when unset
    std::optional<std::string> os_family{};
    /// Accounts in declaration order, titled by their key
    std::vector<acplan::spec::AccountParams> accounts{};
};

/// Parses the accounts configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return AccountsConfig on success, or error string on failure.
[[nodiscard]] auto parse_accounts_config(std::string_view json_content) noexcept
    -> std::expected<AccountsConfig, std::string>;

}  // namespace planner

#endif  // ACCOUNT_CONFIG_HPP
