#include "frontend/diagnostic.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace ctbind::frontend
{

void DiagnosticSink::report(Severity severity, SourceLocation location, std::string message)
{
    _diagnostics.push_back(Diagnostic{severity, std::move(location), std::move(message)});
}

bool DiagnosticSink::has_errors() const
{
    return error_count() > 0;
}

bool DiagnosticSink::has_warnings() const
{
    auto is_warning = [](const auto& d) {
        return d.severity == Severity::Warning;
    };
    return std::any_of(_diagnostics.begin(), _diagnostics.end(), is_warning);
}

bool DiagnosticSink::has_notes() const
{
    auto is_note = [](const auto& d) {
        return d.severity == Severity::Note;
    };
    return std::any_of(_diagnostics.begin(), _diagnostics.end(), is_note);
}

std::size_t DiagnosticSink::error_count() const
{
    auto is_error = [](const auto& d) {
        return d.severity == Severity::Error;
    };
    return static_cast<std::size_t>(std::count_if(_diagnostics.begin(), _diagnostics.end(), is_error));
}

void DiagnosticSink::clear()
{
    _diagnostics.clear();
}

const std::vector<Diagnostic>& DiagnosticSink::diagnostics() const
{
    return _diagnostics;
}

std::string format_diagnostic(const Diagnostic& diagnostic)
{
    const auto& location = diagnostic.location;
    if (location.file.empty()) {
        return fmt::format("<builtin>: {}", diagnostic.message);
    }
    return fmt::format("{}:{}:{}: {}", location.file, location.line, location.column, diagnostic.message);
}

}  // namespace ctbind::frontend
