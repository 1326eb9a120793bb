#include "eviction.hpp"

#include <array>

namespace stash::cache {

namespace {
constexpr std::array<std::pair<PolicyKind, std::string_view>, 9> kPolicyNames{{
    {PolicyKind::None, "none"},
    {PolicyKind::Fifo, "fifo"},
    {PolicyKind::Lru, "lru"},
    {PolicyKind::Lfu, "lfu"},
    {PolicyKind::TtlLru, "ttl_lru"},
    {PolicyKind::TtlLfu, "ttl_lfu"},
    {PolicyKind::SizeBased, "size"},
    {PolicyKind::Adaptive, "adaptive"},
    {PolicyKind::Random, "random"},
}};
}  // namespace

auto to_string(PolicyKind kind) noexcept -> std::string_view {
    for (const auto& [candidate, name] : kPolicyNames) {
        if (candidate == kind) {
            return name;
        }
    }
    return "unknown";
}

auto policy_from_string(std::string_view name) noexcept
    -> std::optional<PolicyKind> {
    for (const auto& [kind, candidate] : kPolicyNames) {
        if (candidate == name) {
            return kind;
        }
    }
    return std::nullopt;
}

}  // namespace stash::cache
