#include "codegen/generator.hpp"

#include "emitter.hpp"
#include "file_writer.hpp"

#include <boost/variant/get.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sstream>
#include <utility>

namespace ctbind::codegen
{

namespace
{

/// Every mapped identity must name a declaration that can be bound.
std::expected<void, std::string> check_mappings(const model::Schema& schema, const model::Registry& registry)
{
    for (const auto& [table, entry] : registry.entries()) {
        const auto* declaration = schema.find(entry->native_name);
        if (!declaration) {
            return std::unexpected(fmt::format("Mapped type '{}' is not declared", entry->native_name));
        }
        const auto* s = boost::get<model::StructDecl>(declaration);
        if (s && s->layout == model::Layout::Auto) {
            return std::unexpected(fmt::format("Invalid C struct type '{}': auto layout cannot be mapped", s->name));
        }
    }
    return {};
}

}  // namespace

Generator::Generator(const frontend::Program& program, GenerationOptions options)
    : _program(program)
    , _options(std::move(options))
{
}

std::expected<std::string, std::string> Generator::render() const
{
    const auto schema = _program.schema();
    const auto registry = _program.registry();

    if (auto checked = registry.check(); !checked) {
        return std::unexpected(checked.error());
    }
    if (auto checked = check_mappings(schema, registry); !checked) {
        return std::unexpected(checked.error());
    }

    const auto entries = registry.entries();
    Emitter emitter{schema, registry, _options};
    std::ostringstream out;

    emitter.emit_preamble(out);

    for (const auto& [table, entry] : entries) {
        if (auto emitted = emitter.emit_declaration(out, *entry); !emitted) {
            return std::unexpected(emitted.error());
        }
    }

    for (const auto& entry : registry.domain()) {
        if (auto emitted = emitter.emit_dataclass(out, entry); !emitted) {
            return std::unexpected(emitted.error());
        }
    }

    for (const auto& [table, entry] : entries) {
        const bool with_to_python = table == model::Table::Domain;
        if (auto emitted = emitter.emit_structure(out, *entry, with_to_python); !emitted) {
            return std::unexpected(emitted.error());
        }
    }

    if (auto emitted = emitter.emit_lifecycle(out); !emitted) {
        return std::unexpected(emitted.error());
    }

    for (const auto convention : {CallingConvention::Awaitable, CallingConvention::Blocking}) {
        if (auto emitted = emitter.emit_method_set(out, _program.operations, convention); !emitted) {
            return std::unexpected(emitted.error());
        }
    }

    spdlog::debug("Rendered {} mapped types and {} operations", entries.size(), _program.operations.size());
    return out.str();
}

std::expected<void, std::string> Generator::run(std::ostream& stdout_stream) const
{
    auto content = render();
    if (!content) {
        return std::unexpected(content.error());
    }
    return write_output(_options.output, *content, stdout_stream);
}

}  // namespace ctbind::codegen
