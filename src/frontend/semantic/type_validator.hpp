#pragma once

#include "model/types.hpp"
#include "semantic_context.hpp"

#include <string>

namespace ctbind::frontend::semantic
{

class TypeValidator
{
public:
    explicit TypeValidator(Context& context)
        : context_(context)
    {
    }

    /// Resolve referenced names and check the shape of a type expression.
    void validate(const model::Type& type, const SourceLocation& where, const std::string& usage);

    /**
     * @brief Check that a type can be laid out as a field of an FFI structure.
     *
     * Unknown names are skipped here; validate() reports them.
     */
    void validate_layout(const model::Type& type, const SourceLocation& where, const std::string& usage);

private:
    void validate_layout(const model::Type& type, const SourceLocation& where, const std::string& usage,
                         std::size_t depth);

    Context& context_;
};

}  // namespace ctbind::frontend::semantic
