#include "semantic_context.hpp"

namespace ctbind::frontend::semantic
{

Context::Context(const Program& program, DiagnosticSink& sink)
    : program_(program)
    , sink_(sink)
    , schema_(program.schema())
    , registry_(program.registry())
{
}

const Program& Context::program() const
{
    return program_;
}

DiagnosticSink& Context::diagnostics()
{
    return sink_;
}

const model::Schema& Context::schema() const
{
    return schema_;
}

const model::Registry& Context::registry() const
{
    return registry_;
}

const model::Declaration* Context::resolve(const std::string& name, const SourceLocation& where,
                                           const std::string& usage) const
{
    const auto* declaration = schema_.find(name);
    if (!declaration) {
        report_error(where, "Unknown type '" + name + "' referenced in " + usage);
    }
    return declaration;
}

const model::Type& Context::unalias(const model::Type& type) const
{
    return model::resolve_aliases(schema_, type);
}

void Context::report(Severity severity, const SourceLocation& location, const std::string& message) const
{
    sink_.report(severity, location, message);
}

void Context::report_error(const SourceLocation& location, const std::string& message) const
{
    report(Severity::Error, location, message);
}

void Context::report_warning(const SourceLocation& location, const std::string& message) const
{
    report(Severity::Warning, location, message);
}

void Context::report_note(const SourceLocation& location, const std::string& message) const
{
    report(Severity::Note, location, message);
}

}  // namespace ctbind::frontend::semantic
