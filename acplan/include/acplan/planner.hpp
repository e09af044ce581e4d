#ifndef PLANNER_HPP
#define PLANNER_HPP

#include "acplan/account_spec.hpp"
#include "acplan/ssh_keys.hpp"

#include <cstdint>      // for uint8_t, uint32_t
#include <optional>     // for optional
#include <set>          // for set
#include <string>       // for string
#include <string_view>  // for string_view
#include <variant>      // for variant
#include <vector>       // for vector

namespace acplan::plan {

/// Kind of OS-level resource derived from an account
enum class ResourceKind : std::uint8_t {
    Group,
    User,
    HomeDir,
    SshDir,
    SshKey
};

struct GroupResource final {
    std::string name{};
    std::optional<std::uint32_t> gid{};
    bool is_system{false};

    bool operator==(const GroupResource&) const = default;
};

struct UserResource final {
    std::string name{};
    std::optional<std::uint32_t> uid{};
    std::string primary_group{};
    std::set<std::string> supplementary_groups{};
    std::string shell{};
    std::string comment{};
    std::string password{};
    std::string home{};
    bool manage_home_copy{false};
    bool is_system{false};
    bool allow_duplicate_uid{false};

    bool operator==(const UserResource&) const = default;
};

/// Home directory or its .ssh subdirectory, ownership is unset on removal
struct DirectoryResource final {
    std::string path{};
    std::optional<std::string> owner{};
    std::optional<std::string> group{};
    std::optional<std::string> mode{};

    bool operator==(const DirectoryResource&) const = default;
};

using ResourcePayload = std::variant<GroupResource, UserResource, DirectoryResource, ssh::SshKeyEntry>;

/// Single planned operation
struct ResourceOp final {
    ResourceKind kind{ResourceKind::User};
    ResourcePayload payload{};
    spec::Ensure ensure{spec::Ensure::Present};
    /// Operations of rank N may start only after every operation of rank N-1
    std::uint32_t rank{0};

    bool operator==(const ResourceOp&) const = default;
};

inline constexpr std::string_view SSH_DIR_MODE = "0700";

/// @brief Convert ResourceKind enum to string
[[nodiscard]] auto resource_kind_to_string(ResourceKind kind) noexcept -> std::string_view;

/// @brief Path of the .ssh directory inside the home directory
[[nodiscard]] auto ssh_dir_path(std::string_view home_dir) noexcept -> std::string;

/// @brief Order the resources of one account
/// @param account The resolved account
/// @param keys Consolidated authorized keys of the account
/// @return Operations sorted by rank. Creation runs Group, User, HomeDir, SshDir, SshKey,
/// removal runs the same sequence reversed.
[[nodiscard]] auto plan_account(const spec::AccountSpec& account, const std::vector<ssh::SshKeyEntry>& keys) noexcept
    -> std::vector<ResourceOp>;

}  // namespace acplan::plan

#endif  // PLANNER_HPP
