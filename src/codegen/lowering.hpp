#pragma once

#include "model/registry.hpp"
#include "model/types.hpp"

#include <expected>
#include <string>

namespace ctbind::codegen
{

/**
 * @brief Translates schema type expressions into Python type expressions.
 *
 * Every lowering either yields the expression or a message naming what could
 * not be lowered.
 */
class Lowering
{
public:
    using Result = std::expected<std::string, std::string>;

    Lowering(const model::Schema& schema, const model::Registry& registry);

    /// ctypes expression describing the binary layout, e.g. "ctypes.c_uint8 * 16".
    Result ctype(const model::Type& type) const;

    /// Value-level type name; only domain mappings are visible.
    Result python(const model::Type& type) const;

    /// Class passed to the submit call: "C{Name}" for extern structs, the ctypes expression otherwise.
    Result ctype_name(const model::Type& type) const;

private:
    class CTypeVisitor;
    class PythonVisitor;

    Result ctype(const model::Type& type, std::size_t depth) const;
    Result python(const model::Type& type, std::size_t depth) const;

    const model::Schema& _schema;
    const model::Registry& _registry;
};

}  // namespace ctbind::codegen
