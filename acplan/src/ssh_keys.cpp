#include "acplan/ssh_keys.hpp"

#include <algorithm>  // for find_if, any_of
#include <array>      // for array
#include <cctype>     // for isspace

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

static constexpr std::array VALID_KEY_TYPES{
    "ssh-dss"sv,
    "ssh-rsa"sv,
    "ssh-ed25519"sv,
    "ecdsa-sha2-nistp256"sv,
    "ecdsa-sha2-nistp384"sv,
    "ecdsa-sha2-nistp521"sv,
    "sk-ecdsa-sha2-nistp256@openssh.com"sv,
    "sk-ssh-ed25519@openssh.com"sv,
};

auto has_whitespace(std::string_view text) noexcept -> bool {
    return std::ranges::any_of(text, [](char char_elem) { return std::isspace(static_cast<unsigned char>(char_elem)) != 0; });
}

}  // namespace

namespace acplan::ssh {

auto is_valid_key_type(std::string_view type) noexcept -> bool {
    return std::ranges::contains(VALID_KEY_TYPES, type);
}

auto legacy_key_name(std::string_view username) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{} SSH Key"), username);
}

auto mapped_key_name(std::string_view username, std::string_view label) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}:{}"), username, label);
}

auto consolidate_ssh_keys(const spec::AccountSpec& account,
    const std::optional<std::string>& legacy_key,
    std::string_view legacy_type,
    const std::optional<std::vector<std::pair<std::string, spec::SshKeyParam>>>& key_mapping) noexcept
    -> std::expected<Consolidation, std::string> {
    Consolidation result{};

    const auto& add_entry = [&](SshKeyEntry&& entry) -> std::expected<void, std::string> {
        if (!is_valid_key_type(entry.type)) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid type '{}' for ssh key '{}'"), entry.type, entry.name));
        }
        if (entry.key.empty()) {
            return std::unexpected(fmt::format(FMT_COMPILE("ssh key '{}' has no key material"), entry.name));
        }
        if (has_whitespace(entry.key)) {
            return std::unexpected(fmt::format(FMT_COMPILE("ssh key '{}' must not contain whitespace"), entry.name));
        }

        auto existing = std::ranges::find_if(result.entries, [&](auto&& elem) { return elem.name == entry.name; });
        if (existing != result.entries.end()) {
            // last declared wins, position of the first declaration is kept
            result.warnings.emplace_back(fmt::format(FMT_COMPILE("ssh key '{}' declared more than once, using the last declaration"), entry.name));
            *existing = std::move(entry);
            return {};
        }
        result.entries.emplace_back(std::move(entry));
        return {};
    };

    if (legacy_key) {
        result.warnings.emplace_back(fmt::format(FMT_COMPILE("user {}: ssh_key and ssh_key_type are deprecated, use ssh_keys instead"), account.username));

        auto added = add_entry(SshKeyEntry{
            .name   = legacy_key_name(account.username),
            .type   = std::string{legacy_type},
            .key    = *legacy_key,
            .owner  = account.username,
            .ensure = account.ensure,
        });
        if (!added) {
            return std::unexpected(std::move(added.error()));
        }
    }

    if (key_mapping) {
        for (const auto& [label, key_param] : *key_mapping) {
            if (label.empty()) {
                return std::unexpected(fmt::format(FMT_COMPILE("user {}: ssh_keys label must not be empty"), account.username));
            }
            const auto& name = mapped_key_name(account.username, label);
            if (!key_param.key) {
                return std::unexpected(fmt::format(FMT_COMPILE("ssh key '{}' has no key material"), name));
            }

            auto added = add_entry(SshKeyEntry{
                .name   = name,
                .type   = key_param.type.value_or(std::string{DEFAULT_KEY_TYPE}),
                .key    = *key_param.key,
                .owner  = account.username,
                .ensure = account.ensure,
            });
            if (!added) {
                return std::unexpected(std::move(added.error()));
            }
        }
    }

    for (const auto& warning : result.warnings) {
        spdlog::warn("{}", warning);
    }
    return result;
}

auto consolidate_ssh_keys(const spec::AccountSpec& account, const spec::AccountParams& params) noexcept
    -> std::expected<Consolidation, std::string> {
    const auto& legacy_type = params.ssh_key_type.value_or(std::string{DEFAULT_KEY_TYPE});
    return consolidate_ssh_keys(account, params.ssh_key, legacy_type, params.ssh_keys);
}

}  // namespace acplan::ssh
