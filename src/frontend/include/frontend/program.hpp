#pragma once

#include "model/operation.hpp"
#include "model/registry.hpp"
#include "model/types.hpp"

#include <string>
#include <vector>

namespace ctbind::frontend
{

/**
 * @brief Everything declared by one schema file.
 *
 * Declarations keep duplicates as written; the semantic passes report them and
 * schema() keeps only the first occurrence of each identity.
 */
struct Program {
    std::string path;                               ///< Path to the schema file
    std::vector<model::Declaration> declarations;   ///< Domain declarations in file order
    model::MappingTable mappings;                   ///< Domain mapping table in file order
    std::vector<model::Operation> operations;       ///< Declared operations in file order

    /// Built-in protocol declarations followed by the domain declarations.
    model::Schema schema() const;

    /// Fixed protocol table followed by the domain table.
    model::Registry registry() const;
};

}  // namespace ctbind::frontend
