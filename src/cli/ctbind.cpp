#include "cli/ctbind.hpp"

#include "cli/options.hpp"
#include "codegen/generator.hpp"
#include "frontend/diagnostic.hpp"
#include "frontend/frontend.hpp"
#include "frontend/semantic/validator.hpp"
#include "model/json_dump.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ctbind
{

namespace
{

/// Generated code may go to stdout, so all logging goes to stderr.
void setup_logging(bool verbose)
{
    if (!spdlog::get("ctbind")) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("ctbind"));
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void report(const frontend::DiagnosticSink& diagnostics)
{
    if (diagnostics.has_errors()) {
        spdlog::error("Semantic analysis failed:");
    } else if (diagnostics.has_warnings()) {
        spdlog::warn("Semantic analysis warnings:");
    } else if (!diagnostics.diagnostics().empty()) {
        spdlog::info("Semantic analysis diagnostics:");
    }

    for (const auto& diagnostic : diagnostics.diagnostics()) {
        const auto log_message = frontend::format_diagnostic(diagnostic);
        switch (diagnostic.severity) {
            case frontend::Severity::Error:
                spdlog::error("{}", log_message);
                break;
            case frontend::Severity::Warning:
                spdlog::warn("{}", log_message);
                break;
            case frontend::Severity::Note:
                spdlog::info("{}", log_message);
                break;
        }
    }
}

}  // namespace

int run(int argc, char* argv[], std::ostream& out)
{
    auto opts = parse_command_line(argc, argv);
    if (!opts) {
        setup_logging(false);
        spdlog::error("Failed to parse command line: {}", opts.error());
        return 1;
    }

    if (opts->help_message) {
        fmt::print(out, "{}", opts->help_message.value());
        return 0;
    }

    setup_logging(opts->verbose);
    spdlog::info("ctbind v{}.{}.{}", CTBIND_VERSION_MAJOR, CTBIND_VERSION_MINOR, CTBIND_VERSION_PATCH);
    if (opts->config_file) {
        spdlog::debug("Generation options read from {}", *opts->config_file);
    }

    // Parse
    auto maybe_program = frontend::parse_program(opts->schema_file);
    if (!maybe_program) {
        spdlog::error("Failed to parse schema: {}", maybe_program.error());
        return 1;
    }

    // Validate
    const frontend::Program& program = maybe_program.value();
    frontend::DiagnosticSink diagnostics;
    frontend::semantic::Validator validator{program, diagnostics};
    validator.run();
    report(diagnostics);

    if (diagnostics.has_errors()) {
        return 1;
    }

    spdlog::info("Schema {}: {} declarations, {} mappings, {} operations", program.path,
                 program.declarations.size(), program.mappings.size(), program.operations.size());

    if (opts->print_schema) {
        nlohmann::json schema_json;
        schema_json["path"] = program.path;
        schema_json["schema"] = model::to_json(program.schema());
        schema_json["mappings"] = model::to_json(program.registry());
        schema_json["operations"] = model::to_json(program.operations);
        fmt::print(out, "{}\n", schema_json.dump(2));
    }

    if (opts->check_only || opts->print_schema) {
        return 0;
    }

    codegen::Generator generator{program, opts->generation};
    if (auto result = generator.run(out); !result) {
        spdlog::error("Code generation failed: {}", result.error());
        return 1;
    }

    const auto& output = opts->generation.output;
    spdlog::info("Generated bindings written to {}", output.empty() || output == "-" ? "<stdout>" : output);
    return 0;
}

}  // namespace ctbind
