#include "acplan/account_plan.hpp"

#include <iterator>  // for make_move_iterator
#include <utility>   // for move

#include <spdlog/spdlog.h>

namespace acplan {

auto build_account_plan(const spec::AccountParams& params, std::string_view os_family) noexcept
    -> std::expected<AccountPlan, std::string> {
    auto resolved = spec::resolve_spec(params, os_family);
    if (!resolved) {
        return std::unexpected(std::move(resolved.error()));
    }

    AccountPlan account_plan{};
    account_plan.spec     = std::move(resolved->spec);
    account_plan.warnings = std::move(resolved->warnings);

    auto consolidated = ssh::consolidate_ssh_keys(account_plan.spec, params);
    if (!consolidated) {
        return std::unexpected(std::move(consolidated.error()));
    }
    account_plan.keys = std::move(consolidated->entries);
    account_plan.warnings.insert(account_plan.warnings.end(),
        std::make_move_iterator(consolidated->warnings.begin()),
        std::make_move_iterator(consolidated->warnings.end()));

    account_plan.ops         = plan::plan_account(account_plan.spec, account_plan.keys);
    account_plan.descriptors = emit::emit_descriptors(account_plan.ops);

    spdlog::info("Planned user {} ({}): {} resources, {} warnings", account_plan.spec.username,
        spec::ensure_to_string(account_plan.spec.ensure), account_plan.descriptors.size(), account_plan.warnings.size());
    return account_plan;
}

}  // namespace acplan
