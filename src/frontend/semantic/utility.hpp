#pragma once

#include "semantic_context.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctbind::frontend::semantic
{

/// Report every node whose name repeats an earlier one.
template <typename Node>
void check_unique_names(Context& context, const std::vector<Node>& nodes, const std::string& owner_label,
                        const std::string& element_kind)
{
    std::unordered_map<std::string, const Node*> names;
    for (const auto& node : nodes) {
        auto [it, inserted] = names.emplace(node.name, &node);
        if (!inserted) {
            context.report_error(node.location, "Duplicate " + element_kind + " name '" + node.name + "' in " +
                                                    owner_label);
        }
    }
}

/// Report every node whose value repeats an earlier one.
template <typename Node>
void check_unique_values(Context& context, const std::vector<Node>& nodes, const std::string& owner_label,
                         const std::string& element_kind)
{
    std::unordered_map<std::uint64_t, const Node*> values;
    for (const auto& node : nodes) {
        auto [it, inserted] = values.emplace(node.value, &node);
        if (!inserted) {
            context.report_error(node.location, "Duplicate " + element_kind + " value " + std::to_string(node.value) +
                                                    " in " + owner_label + " (already used by '" +
                                                    it->second->name + "')");
        }
    }
}

/// True if @p value can be stored in an unsigned integer of @p bits bits.
inline bool fits_unsigned(std::uint64_t value, unsigned bits)
{
    return bits >= 64 || value < (std::uint64_t{1} << bits);
}

inline bool contains(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace ctbind::frontend::semantic
