#pragma once

#include "model/types.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctbind::model
{

/**
 * @brief Associates a native type identity with the name it receives in generated output.
 */
struct MappingEntry {
    std::string native_name;
    std::string target_name;
    std::vector<std::string> skip_fields;  ///< enum variants / flags hidden from the public surface
    SourceLocation location;
};

using MappingTable = std::vector<MappingEntry>;

enum class Table { Protocol, Domain };

/**
 * @brief The protocol and domain mapping tables.
 *
 * The protocol table is fixed and describes client internals (handles, packets, statuses).
 * The domain table describes operation payloads and results, and is the only one
 * consulted when a type has to be exposed as a plain value.
 */
class Registry
{
public:
    using Entry = std::pair<Table, const MappingEntry*>;

    Registry() = default;
    Registry(MappingTable protocol, MappingTable domain);

    const MappingTable& protocol() const;
    const MappingTable& domain() const;

    const MappingEntry* lookup(Table table, std::string_view native_name) const;

    /// Protocol table first, then domain table.
    const MappingEntry* lookup(std::string_view native_name) const;

    /// Both tables concatenated, protocol entries first.
    std::vector<Entry> entries() const;

    /**
     * @brief Check table invariants.
     *
     * Identities must be unique within each table, a domain identity may not
     * also appear in the protocol table, and no two entries may share a target name.
     */
    std::expected<void, std::string> check() const;

private:
    MappingTable protocol_;
    MappingTable domain_;
};

}  // namespace ctbind::model
