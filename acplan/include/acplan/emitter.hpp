#ifndef EMITTER_HPP
#define EMITTER_HPP

#include "acplan/planner.hpp"

#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for pair
#include <vector>       // for vector

namespace acplan::emit {

/// Resource description handed to the external applier
struct ResourceDescriptor final {
    /// Identity other descriptors refer to, e.g "user:alice"
    std::string id{};
    plan::ResourceKind kind{plan::ResourceKind::User};
    plan::ResourcePayload payload{};
    spec::Ensure ensure{spec::Ensure::Present};
    /// Identities of the descriptors which must be applied first
    std::vector<std::string> requires_ids{};

    bool operator==(const ResourceDescriptor&) const = default;
};

/// @brief Identity of the resource described by the operation
[[nodiscard]] auto descriptor_id(const plan::ResourceOp& op) noexcept -> std::string;

/// @brief Turn ordered operations into descriptors with prerequisite edges
/// @param ops Operations as returned by plan::plan_account
/// @return Descriptors in the same order, each requiring every descriptor of the preceding rank
[[nodiscard]] auto emit_descriptors(const std::vector<plan::ResourceOp>& ops) noexcept
    -> std::vector<ResourceDescriptor>;

/// @brief Render descriptors as JSON array
/// @param descriptors The descriptors to render
/// @param pretty Indent the output
/// @return JSON text
[[nodiscard]] auto descriptors_to_json(const std::vector<ResourceDescriptor>& descriptors, bool pretty = false) noexcept
    -> std::string;

/// @brief Render the descriptors of several accounts as JSON object keyed by account title
[[nodiscard]] auto plans_to_json(const std::vector<std::pair<std::string, std::vector<ResourceDescriptor>>>& plans, bool pretty = false) noexcept
    -> std::string;

}  // namespace acplan::emit

#endif  // EMITTER_HPP
