#include "account_config.hpp"

#include <algorithm>    // for ranges::contains
#include <expected>     // for expected, unexpected
#include <string_view>  // for string_view
#include <utility>      // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

using acplan::spec::AccountParams;
using acplan::spec::SshKeyParam;

auto parse_string(const rapidjson::Value& obj, const char* field, std::string_view title, std::optional<std::string>& out) noexcept
    -> std::expected<void, std::string> {
    if (!obj.HasMember(field)) {
        return {};
    }
    if (!obj[field].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("account '{}': '{}' must be a string"), title, field));
    }
    out = std::string{obj[field].GetString(), obj[field].GetStringLength()};
    return {};
}

auto parse_bool(const rapidjson::Value& obj, const char* field, std::string_view title, std::optional<bool>& out) noexcept
    -> std::expected<void, std::string> {
    if (!obj.HasMember(field)) {
        return {};
    }
    if (!obj[field].IsBool()) {
        return std::unexpected(fmt::format(FMT_COMPILE("account '{}': '{}' must be a boolean"), title, field));
    }
    out = obj[field].GetBool();
    return {};
}

auto parse_ssh_keys(const rapidjson::Value& value, std::string_view title) noexcept
    -> std::expected<std::vector<std::pair<std::string, SshKeyParam>>, std::string> {
    if (!value.IsObject()) {
        return std::unexpected(fmt::format(FMT_COMPILE("account '{}': 'ssh_keys' must be an object"), title));
    }

    std::vector<std::pair<std::string, SshKeyParam>> ssh_keys{};
    for (const auto& member : value.GetObject()) {
        const std::string label{member.name.GetString(), member.name.GetStringLength()};
        if (!member.value.IsObject()) {
            return std::unexpected(fmt::format(FMT_COMPILE("account '{}': ssh key '{}' must be an object"), title, label));
        }

        SshKeyParam key_param{};
        const auto& key_obj = member.value;
        if (auto parsed = parse_string(key_obj, "type", title, key_param.type); !parsed) {
            return std::unexpected(std::move(parsed.error()));
        }
        if (auto parsed = parse_string(key_obj, "key", title, key_param.key); !parsed) {
            return std::unexpected(std::move(parsed.error()));
        }
        ssh_keys.emplace_back(label, std::move(key_param));
    }
    return ssh_keys;
}

auto parse_account(const rapidjson::Value& obj, std::string_view title) noexcept
    -> std::expected<AccountParams, std::string> {
    if (!obj.IsObject()) {
        return std::unexpected(fmt::format(FMT_COMPILE("account '{}' must be an object"), title));
    }

    AccountParams params{};
    params.title = std::string{title};

    for (auto&& [field, out] : {
             std::pair{"username", &params.username},
             std::pair{"password", &params.password},
             std::pair{"shell", &params.shell},
             std::pair{"home_dir", &params.home_dir},
             std::pair{"home_dir_perms", &params.home_dir_perms},
             std::pair{"ensure", &params.ensure},
             std::pair{"comment", &params.comment},
             std::pair{"gid", &params.gid},
             std::pair{"ssh_key", &params.ssh_key},
             std::pair{"ssh_key_type", &params.ssh_key_type},
         }) {
        if (auto parsed = parse_string(obj, field, title, *out); !parsed) {
            return std::unexpected(std::move(parsed.error()));
        }
    }

    for (auto&& [field, out] : {
             std::pair{"manage_home", &params.manage_home},
             std::pair{"create_group", &params.create_group},
             std::pair{"system", &params.system},
             std::pair{"allowdupe", &params.allowdupe},
         }) {
        if (auto parsed = parse_bool(obj, field, title, *out); !parsed) {
            return std::unexpected(std::move(parsed.error()));
        }
    }

    // Parse uid (optional)
    if (obj.HasMember("uid")) {
        if (!obj["uid"].IsUint()) {
            return std::unexpected(fmt::format(FMT_COMPILE("account '{}': 'uid' must be a non-negative integer"), title));
        }
        params.uid = obj["uid"].GetUint();
    }

    // Parse groups (optional)
    if (obj.HasMember("groups")) {
        if (!obj["groups"].IsArray()) {
            return std::unexpected(fmt::format(FMT_COMPILE("account '{}': 'groups' must be an array"), title));
        }
        std::vector<std::string> groups{};
        for (const auto& group : obj["groups"].GetArray()) {
            if (!group.IsString()) {
                return std::unexpected(fmt::format(FMT_COMPILE("account '{}': each group must be a string"), title));
            }
            groups.emplace_back(group.GetString(), group.GetStringLength());
        }
        params.groups = std::move(groups);
    }

    // Parse ssh_keys (optional)
    if (obj.HasMember("ssh_keys")) {
        auto ssh_keys = parse_ssh_keys(obj["ssh_keys"], title);
        if (!ssh_keys) {
            return std::unexpected(std::move(ssh_keys.error()));
        }
        params.ssh_keys = std::move(*ssh_keys);
    }

    return params;
}

}  // namespace

namespace planner {

auto parse_accounts_config(std::string_view json_content) noexcept
    -> std::expected<AccountsConfig, std::string> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    AccountsConfig config{};

    // Parse os_family (optional)
    if (doc.HasMember("os_family")) {
        if (!doc["os_family"].IsString()) {
            return std::unexpected("'os_family' must be a string");
        }
        config.os_family = doc["os_family"].GetString();
    }

    // Parse accounts (required)
    if (!doc.HasMember("accounts") || !doc["accounts"].IsObject()) {
        return std::unexpected("'accounts' field is required and must be an object");
    }
    for (const auto& member : doc["accounts"].GetObject()) {
        const std::string_view title{member.name.GetString(), member.name.GetStringLength()};
        if (std::ranges::contains(config.accounts, title, &AccountParams::title)) {
            return std::unexpected(fmt::format(FMT_COMPILE("account '{}' is declared more than once"), title));
        }
        auto account = parse_account(member.value, title);
        if (!account) {
            return std::unexpected(std::move(account.error()));
        }
        config.accounts.push_back(std::move(*account));
    }

    return config;
}

}  // namespace planner
