#pragma once

#include "frontend/diagnostic.hpp"
#include "frontend/program.hpp"
#include "model/registry.hpp"
#include "model/types.hpp"

#include <string>

namespace ctbind::frontend::semantic
{

/**
 * @brief State shared by the semantic passes of one validation run.
 *
 * The schema and registry are built once from the program; duplicate
 * identities keep their first declaration.
 */
class Context
{
public:
    Context(const Program& program, DiagnosticSink& sink);

    const Program& program() const;

    DiagnosticSink& diagnostics();

    const model::Schema& schema() const;
    const model::Registry& registry() const;

    /**
     * @brief Resolve a declaration referenced from a type expression.
     *
     * Aliases are not followed. Reports an error at @p where if the name is unknown.
     */
    const model::Declaration* resolve(const std::string& name, const SourceLocation& where,
                                      const std::string& usage) const;

    /// Follow aliases until a non-alias type is reached.
    const model::Type& unalias(const model::Type& type) const;

    void report_error(const SourceLocation& location, const std::string& message) const;
    void report_warning(const SourceLocation& location, const std::string& message) const;
    void report_note(const SourceLocation& location, const std::string& message) const;

private:
    void report(Severity severity, const SourceLocation& location, const std::string& message) const;

    const Program& program_;
    DiagnosticSink& sink_;
    model::Schema schema_;
    model::Registry registry_;
};

}  // namespace ctbind::frontend::semantic
