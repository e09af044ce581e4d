#include "acplan/emitter.hpp"

#include <cstdint>      // for uint32_t
#include <optional>     // for optional
#include <type_traits>  // for is_same_v, decay_t
#include <variant>      // for visit

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

using acplan::emit::ResourceDescriptor;
using acplan::plan::DirectoryResource;
using acplan::plan::GroupResource;
using acplan::plan::UserResource;
using acplan::ssh::SshKeyEntry;

template <typename Writer>
void write_string(Writer& writer, std::string_view str) noexcept {
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

template <typename Writer>
void write_member(Writer& writer, std::string_view key, std::string_view value) noexcept {
    writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    write_string(writer, value);
}

template <typename Writer>
void write_optional(Writer& writer, std::string_view key, const std::optional<std::string>& value) noexcept {
    if (value) {
        write_member(writer, key, std::string_view{*value});
    }
}

template <typename Writer>
void write_bool(Writer& writer, std::string_view key, bool value) noexcept {
    writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer.Bool(value);
}

template <typename Writer>
void write_id(Writer& writer, std::string_view key, const std::optional<std::uint32_t>& value) noexcept {
    if (value) {
        writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
        writer.Uint(*value);
    }
}

template <typename Writer>
void write_payload(Writer& writer, const GroupResource& group) noexcept {
    write_member(writer, "name"sv, group.name);
    write_id(writer, "gid"sv, group.gid);
    write_bool(writer, "isSystem"sv, group.is_system);
}

template <typename Writer>
void write_payload(Writer& writer, const UserResource& user) noexcept {
    write_member(writer, "name"sv, user.name);
    write_id(writer, "uid"sv, user.uid);
    write_member(writer, "primaryGroup"sv, user.primary_group);
    writer.Key("supplementaryGroups");
    writer.StartArray();
    for (const auto& group : user.supplementary_groups) {
        write_string(writer, group);
    }
    writer.EndArray();
    write_member(writer, "shell"sv, user.shell);
    write_member(writer, "comment"sv, user.comment);
    write_member(writer, "password"sv, user.password);
    write_member(writer, "home"sv, user.home);
    write_bool(writer, "manageHomeCopy"sv, user.manage_home_copy);
    write_bool(writer, "isSystem"sv, user.is_system);
    write_bool(writer, "allowDuplicateUid"sv, user.allow_duplicate_uid);
}

template <typename Writer>
void write_payload(Writer& writer, const DirectoryResource& dir) noexcept {
    write_member(writer, "path"sv, dir.path);
    write_optional(writer, "owner"sv, dir.owner);
    write_optional(writer, "group"sv, dir.group);
    write_optional(writer, "mode"sv, dir.mode);
}

template <typename Writer>
void write_payload(Writer& writer, const SshKeyEntry& key) noexcept {
    write_member(writer, "name"sv, key.name);
    write_member(writer, "owner"sv, key.owner);
    write_member(writer, "type"sv, key.type);
    write_member(writer, "key"sv, key.key);
}

template <typename Writer>
void write_descriptors(Writer& writer, const std::vector<ResourceDescriptor>& descriptors) noexcept {
    writer.StartArray();
    for (const auto& descriptor : descriptors) {
        writer.StartObject();
        write_member(writer, "id"sv, descriptor.id);
        write_member(writer, "kind"sv, acplan::plan::resource_kind_to_string(descriptor.kind));
        write_member(writer, "ensure"sv, acplan::spec::ensure_to_string(descriptor.ensure));
        std::visit([&writer](auto&& payload) { write_payload(writer, payload); }, descriptor.payload);
        writer.Key("requires");
        writer.StartArray();
        for (const auto& required : descriptor.requires_ids) {
            write_string(writer, required);
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();
}

template <typename Func>
auto render_json(bool pretty, Func&& func) noexcept -> std::string {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        func(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        func(writer);
    }
    return std::string{buffer.GetString(), buffer.GetSize()};
}

}  // namespace

namespace acplan::emit {

auto descriptor_id(const plan::ResourceOp& op) noexcept -> std::string {
    return std::visit([](auto&& payload) -> std::string {
        using payload_t = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<payload_t, GroupResource>) {
            return fmt::format(FMT_COMPILE("group:{}"), payload.name);
        } else if constexpr (std::is_same_v<payload_t, UserResource>) {
            return fmt::format(FMT_COMPILE("user:{}"), payload.name);
        } else if constexpr (std::is_same_v<payload_t, DirectoryResource>) {
            return fmt::format(FMT_COMPILE("directory:{}"), payload.path);
        } else {
            return fmt::format(FMT_COMPILE("ssh_key:{}"), payload.name);
        }
    },
        op.payload);
}

auto emit_descriptors(const std::vector<plan::ResourceOp>& ops) noexcept
    -> std::vector<ResourceDescriptor> {
    std::vector<ResourceDescriptor> descriptors{};
    descriptors.reserve(ops.size());

    // ids of the previous rank, and of the rank being emitted
    std::vector<std::string> previous_rank{};
    std::vector<std::string> current_rank{};
    std::uint32_t rank{0};

    for (const auto& op : ops) {
        if (op.rank != rank) {
            previous_rank = std::move(current_rank);
            current_rank.clear();
            rank = op.rank;
        }

        auto id = descriptor_id(op);
        current_rank.push_back(id);
        descriptors.emplace_back(ResourceDescriptor{
            .id           = std::move(id),
            .kind         = op.kind,
            .payload      = op.payload,
            .ensure       = op.ensure,
            .requires_ids = previous_rank,
        });
    }
    return descriptors;
}

auto descriptors_to_json(const std::vector<ResourceDescriptor>& descriptors, bool pretty) noexcept
    -> std::string {
    return render_json(pretty, [&descriptors](auto& writer) { write_descriptors(writer, descriptors); });
}

auto plans_to_json(const std::vector<std::pair<std::string, std::vector<ResourceDescriptor>>>& plans, bool pretty) noexcept
    -> std::string {
    return render_json(pretty, [&plans](auto& writer) {
        writer.StartObject();
        for (const auto& [title, descriptors] : plans) {
            writer.Key(title.data(), static_cast<rapidjson::SizeType>(title.size()));
            write_descriptors(writer, descriptors);
        }
        writer.EndObject();
    });
}

}  // namespace acplan::emit
