#pragma once

#include "codegen/options.hpp"
#include "lowering.hpp"
#include "model/operation.hpp"
#include "model/registry.hpp"
#include "model/types.hpp"

#include <expected>
#include <ostream>
#include <string>
#include <vector>

namespace ctbind::codegen
{

enum class CallingConvention {
    Blocking,
    Awaitable,
};

/**
 * @brief Writes the pieces of the generated bindings module.
 *
 * Each emit_* call appends one section to the stream; the generator decides
 * the order and discards the stream on the first failure.
 */
class Emitter
{
public:
    Emitter(const model::Schema& schema, const model::Registry& registry, const GenerationOptions& options);

    /// Banner and imports.
    void emit_preamble(std::ostream& os) const;

    /// IntEnum, IntFlag or scalar alias for one mapped type; extern structs emit nothing here.
    std::expected<void, std::string> emit_declaration(std::ostream& os, const model::MappingEntry& entry) const;

    /// @dataclass value record for a domain-mapped extern struct.
    std::expected<void, std::string> emit_dataclass(std::ostream& os, const model::MappingEntry& entry) const;

    /**
     * @brief ctypes.Structure binding for a mapped extern struct.
     *
     * @param with_to_python also emit the conversion to the value record
     */
    std::expected<void, std::string> emit_structure(std::ostream& os, const model::MappingEntry& entry,
                                                    bool with_to_python) const;

    /// Prototypes of the native lifecycle functions.
    std::expected<void, std::string> emit_lifecycle(std::ostream& os) const;

    /// One mixin class with a wrapper method per operation.
    std::expected<void, std::string> emit_method_set(std::ostream& os, const std::vector<model::Operation>& operations,
                                                     CallingConvention convention) const;

private:
    std::expected<const model::Declaration*, std::string> find_declaration(const model::MappingEntry& entry) const;
    std::expected<std::string, std::string> protocol_name(std::string_view native_name) const;

    void emit_enum(std::ostream& os, const model::EnumDecl& decl, const model::MappingEntry& entry) const;
    void emit_flags(std::ostream& os, const model::StructDecl& decl, const model::MappingEntry& entry) const;
    std::expected<void, std::string> emit_method(std::ostream& os, const model::Operation& operation,
                                                 const std::string& operation_class,
                                                 CallingConvention convention) const;

    std::expected<std::string, std::string> default_value(const model::Type& type) const;
    /// validate_uint calls for every unsigned integer of at most 64 bits reachable through arrays.
    void emit_range_checks(std::ostream& os, const model::Type& type, const std::string& access,
                           const std::string& name, int indent_level, int depth) const;
    std::string from_param_value(const model::Type& type, const std::string& access, int depth) const;
    std::string to_python_value(const model::Type& type, const std::string& access, int depth) const;

    const model::Schema& _schema;
    const model::Registry& _registry;
    const GenerationOptions& _options;
    Lowering _lowering;
};

/// ASCII upper-casing of member names, byte by byte.
std::string to_upper(std::string_view name);

}  // namespace ctbind::codegen
