#include "model/registry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace ctbind::model
{
namespace
{

const MappingEntry* find_entry(const MappingTable& table, std::string_view native_name)
{
    auto it = std::find_if(table.begin(), table.end(), [&](const MappingEntry& entry) {
        return entry.native_name == native_name;
    });
    return it == table.end() ? nullptr : &*it;
}

std::string_view table_name(Table table)
{
    return table == Table::Protocol ? "protocol" : "domain";
}

}  // namespace

Registry::Registry(MappingTable protocol, MappingTable domain)
    : protocol_(std::move(protocol))
    , domain_(std::move(domain))
{
}

const MappingTable& Registry::protocol() const
{
    return protocol_;
}

const MappingTable& Registry::domain() const
{
    return domain_;
}

const MappingEntry* Registry::lookup(Table table, std::string_view native_name) const
{
    return find_entry(table == Table::Protocol ? protocol_ : domain_, native_name);
}

const MappingEntry* Registry::lookup(std::string_view native_name) const
{
    if (const auto* entry = lookup(Table::Protocol, native_name)) {
        return entry;
    }
    return lookup(Table::Domain, native_name);
}

std::vector<Registry::Entry> Registry::entries() const
{
    std::vector<Entry> all;
    all.reserve(protocol_.size() + domain_.size());
    for (const auto& entry : protocol_) {
        all.emplace_back(Table::Protocol, &entry);
    }
    for (const auto& entry : domain_) {
        all.emplace_back(Table::Domain, &entry);
    }
    return all;
}

std::expected<void, std::string> Registry::check() const
{
    std::unordered_map<std::string_view, Table> identities;
    std::unordered_set<std::string_view> targets;

    for (const auto& [table, entry] : entries()) {
        auto [it, inserted] = identities.emplace(entry->native_name, table);
        if (!inserted) {
            if (it->second != table) {
                return std::unexpected(fmt::format("Domain mapping for '{}' collides with the protocol mapping",
                                                   entry->native_name));
            }
            return std::unexpected(fmt::format("Native type '{}' is mapped twice in the {} table",
                                               entry->native_name, table_name(table)));
        }
        if (!targets.insert(entry->target_name).second) {
            return std::unexpected(fmt::format("Target name '{}' is used by more than one mapping (last: '{}')",
                                               entry->target_name, entry->native_name));
        }
    }
    return {};
}

}  // namespace ctbind::model
