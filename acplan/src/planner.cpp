#include "acplan/planner.hpp"

#include <algorithm>   // for reverse
#include <filesystem>  // for path

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

using acplan::plan::DirectoryResource;
using acplan::plan::ResourceKind;
using acplan::plan::ResourceOp;
using acplan::spec::AccountSpec;
using acplan::spec::Ensure;

auto make_directory(const AccountSpec& account, std::string path, std::string_view mode) noexcept -> DirectoryResource {
    if (account.ensure == Ensure::Absent) {
        return DirectoryResource{.path = std::move(path)};
    }
    return DirectoryResource{
        .path  = std::move(path),
        .owner = account.username,
        .group = account.primary_group,
        .mode  = std::string{mode},
    };
}

}  // namespace

namespace acplan::plan {

auto resource_kind_to_string(ResourceKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ResourceKind::Group:
        return "group"sv;
    case ResourceKind::User:
        return "user"sv;
    case ResourceKind::HomeDir:
        return "home_dir"sv;
    case ResourceKind::SshDir:
        return "ssh_dir"sv;
    case ResourceKind::SshKey:
        return "ssh_key"sv;
    }
    return "user"sv;
}

auto ssh_dir_path(std::string_view home_dir) noexcept -> std::string {
    return (fs::path{home_dir} / ".ssh").string();
}

auto plan_account(const spec::AccountSpec& account, const std::vector<ssh::SshKeyEntry>& keys) noexcept
    -> std::vector<ResourceOp> {
    const auto ensure = account.ensure;

    // operation classes in creation order, each class completes before the next
    std::vector<std::vector<ResourceOp>> classes{};

    if (account.create_group) {
        classes.push_back({ResourceOp{
            .kind    = ResourceKind::Group,
            .payload = GroupResource{
                .name      = account.username,
                .gid       = account.uid,
                .is_system = account.system,
            },
            .ensure = ensure,
        }});
    }

    classes.push_back({ResourceOp{
        .kind    = ResourceKind::User,
        .payload = UserResource{
            .name                 = account.username,
            .uid                  = account.uid,
            .primary_group        = account.primary_group,
            .supplementary_groups = account.groups,
            .shell                = account.shell,
            .comment              = account.comment,
            .password             = account.password,
            .home                 = account.home_dir_real,
            .manage_home_copy     = account.manage_home,
            .is_system            = account.system,
            .allow_duplicate_uid  = account.allow_duplicate_uid,
        },
        .ensure = ensure,
    }});

    classes.push_back({ResourceOp{
        .kind    = ResourceKind::HomeDir,
        .payload = make_directory(account, account.home_dir_real, account.home_dir_perms),
        .ensure  = ensure,
    }});

    classes.push_back({ResourceOp{
        .kind    = ResourceKind::SshDir,
        .payload = make_directory(account, ssh_dir_path(account.home_dir_real), SSH_DIR_MODE),
        .ensure  = ensure,
    }});

    if (!keys.empty()) {
        std::vector<ResourceOp> key_ops{};
        key_ops.reserve(keys.size());
        for (const auto& key : keys) {
            key_ops.emplace_back(ResourceOp{
                .kind    = ResourceKind::SshKey,
                .payload = key,
                .ensure  = ensure,
            });
        }
        classes.push_back(std::move(key_ops));
    }

    // a group must not be removed while its user exists, keys go before their directory
    if (ensure == Ensure::Absent) {
        std::ranges::reverse(classes);
    }

    std::vector<ResourceOp> ops{};
    for (std::uint32_t rank = 0; auto& op_class : classes) {
        for (auto& op : op_class) {
            op.rank = rank;
            ops.emplace_back(std::move(op));
        }
        ++rank;
    }

    spdlog::debug("user {}: planned {} operations ({})", account.username, ops.size(), spec::ensure_to_string(ensure));
    return ops;
}

}  // namespace acplan::plan
