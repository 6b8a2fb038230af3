#include "mapping_validation_pass.hpp"

#include "semantic_context.hpp"
#include "utility.hpp"

#include <boost/variant/get.hpp>

#include <cctype>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace ctbind::frontend::semantic
{

namespace
{

bool is_identifier(const std::string& name)
{
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

/// Names a skip list may refer to, or nullopt if skip lists do not apply.
std::optional<std::vector<std::string>> skippable_names(const model::Declaration& declaration)
{
    std::vector<std::string> names;
    if (const auto* e = boost::get<model::EnumDecl>(&declaration)) {
        for (const auto& variant : e->variants) {
            names.push_back(variant.name);
        }
        return names;
    }
    if (const auto* s = boost::get<model::StructDecl>(&declaration); s && s->layout == model::Layout::Packed) {
        for (const auto& field : s->fields) {
            names.push_back(field.name);
        }
        return names;
    }
    return std::nullopt;
}

void check_skip_list(Context& context, const model::MappingEntry& entry, const model::Declaration& declaration)
{
    if (entry.skip_fields.empty()) {
        return;
    }

    const auto names = skippable_names(declaration);
    if (!names) {
        context.report_warning(entry.location,
                               "Skip list of '" + entry.native_name + "' has no effect; only enums and packed "
                               "structs are emitted member by member");
        return;
    }

    std::unordered_set<std::string> seen;
    for (const auto& skipped : entry.skip_fields) {
        if (!contains(*names, skipped)) {
            context.report_error(entry.location,
                                 "Skip list of '" + entry.native_name + "' names unknown member '" + skipped + "'");
        } else if (!seen.insert(skipped).second) {
            context.report_warning(entry.location,
                                   "Member '" + skipped + "' is skipped twice in the mapping of '" +
                                       entry.native_name + "'");
        }
    }
}

}  // namespace

void MappingValidationPass::run(Context& context)
{
    const auto& registry = context.registry();

    std::unordered_map<std::string, const model::MappingEntry*> identities;
    std::unordered_map<std::string, std::string> targets;
    for (const auto& entry : registry.protocol()) {
        targets.emplace(entry.target_name, entry.native_name);
    }

    for (const auto& entry : context.program().mappings) {
        const auto label = "mapping of '" + entry.native_name + "'";

        if (registry.lookup(model::Table::Protocol, entry.native_name)) {
            context.report_error(entry.location,
                                 "Type '" + entry.native_name + "' is already mapped by the protocol table");
            continue;
        }

        if (auto [it, inserted] = identities.emplace(entry.native_name, &entry); !inserted) {
            context.report_error(entry.location, "Type '" + entry.native_name + "' is mapped more than once");
            continue;
        }

        if (!is_identifier(entry.target_name)) {
            context.report_error(entry.location,
                                 "Target name '" + entry.target_name + "' in " + label + " is not a valid identifier");
        } else if (auto [it, inserted] = targets.emplace(entry.target_name, entry.native_name); !inserted) {
            context.report_error(entry.location, "Target name '" + entry.target_name + "' in " + label +
                                                     " is already used for '" + it->second + "'");
        }

        const auto* declaration = context.resolve(entry.native_name, entry.location, label);
        if (!declaration) {
            continue;
        }

        if (const auto* s = boost::get<model::StructDecl>(declaration); s && s->layout == model::Layout::Auto) {
            context.report_error(entry.location, "Struct '" + s->name +
                                                     "' has auto layout and cannot be mapped; declare it extern "
                                                     "or packed");
            continue;
        }

        check_skip_list(context, entry, *declaration);
    }
}

}  // namespace ctbind::frontend::semantic
