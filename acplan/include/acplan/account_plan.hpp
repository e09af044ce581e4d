#ifndef ACCOUNT_PLAN_HPP
#define ACCOUNT_PLAN_HPP

#include "acplan/account_spec.hpp"
#include "acplan/emitter.hpp"
#include "acplan/planner.hpp"
#include "acplan/ssh_keys.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace acplan {

/// Everything computed for one provisioning request
struct AccountPlan final {
    spec::AccountSpec spec{};
    std::vector<ssh::SshKeyEntry> keys{};
    std::vector<plan::ResourceOp> ops{};
    std::vector<emit::ResourceDescriptor> descriptors{};
    /// Non-fatal diagnostics of resolution and key consolidation
    std::vector<std::string> warnings{};
};

/// @brief Resolve, consolidate, plan and emit one account
/// @param params The raw account parameters
/// @param os_family OS family name used for home directory defaulting
/// @return AccountPlan on success, or error string if the parameters are invalid.
[[nodiscard]] auto build_account_plan(const spec::AccountParams& params, std::string_view os_family) noexcept
    -> std::expected<AccountPlan, std::string>;

}  // namespace acplan

#endif  // ACCOUNT_PLAN_HPP
