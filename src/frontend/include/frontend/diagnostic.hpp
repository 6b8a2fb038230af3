#pragma once

#include "model/types.hpp"

#include <string>
#include <vector>

namespace ctbind::frontend
{

enum class Severity {
    Note,
    Warning,
    Error,
};

using model::SourceLocation;

struct Diagnostic {
    Severity severity;
    SourceLocation location;
    std::string message;
};

/**
 * @brief Sink for diagnostics.
 *
 * This class is used to collect diagnostics from the frontend.
 */
class DiagnosticSink
{
public:
    void report(Severity severity, SourceLocation location, std::string message);
    bool has_errors() const;
    bool has_warnings() const;
    bool has_notes() const;
    std::size_t error_count() const;
    void clear();

    const std::vector<Diagnostic>& diagnostics() const;

private:
    std::vector<Diagnostic> _diagnostics;
};

/// "file:line:column: message"; built-in declarations are shown as "<builtin>".
std::string format_diagnostic(const Diagnostic& diagnostic);

}  // namespace ctbind::frontend
