#include "frontend/frontend.hpp"

#include "idl/parser.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <expected>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>

namespace ctbind::frontend
{

namespace
{

namespace ast = idl::ast;

constexpr std::string_view kReservedAttribute = "reserved";

/**
 * @brief Converts parsed declarations into the program model.
 *
 * Declarations are kept as written; only field attributes are checked here,
 * everything else is left to the semantic passes.
 */
class ProgramBuilder : public boost::static_visitor<std::expected<void, std::string>>
{
public:
    ProgramBuilder(Program& program, const idl::parser::position_cache_type& positions)
        : program_(program)
        , positions_(positions)
    {
    }

    std::expected<void, std::string> operator()(const ast::Enum& node) const
    {
        model::EnumDecl decl{node.name, node.tag, {}, locate(node)};
        std::optional<std::uint64_t> next = 0;
        for (const auto& item : node.items) {
            if (!item.value && !next) {
                const auto location = locate(item);
                return std::unexpected(fmt::format("{}:{}:{}: Implicit value of enumerator '{}' in enum '{}' overflows "
                                                   "64 bits",
                                                   location.file, location.line, location.column, item.name,
                                                   node.name));
            }
            const auto value = item.value ? *item.value : *next;
            decl.variants.push_back(model::Variant{item.name, value, locate(item)});
            next = value == std::numeric_limits<std::uint64_t>::max() ? std::nullopt
                                                                       : std::optional<std::uint64_t>(value + 1);
        }
        program_.declarations.emplace_back(std::move(decl));
        return {};
    }

    std::expected<void, std::string> operator()(const ast::Struct& node) const
    {
        model::StructDecl decl;
        decl.name = node.name;
        decl.layout = node.layout;
        if (node.backing) {
            decl.backing = *node.backing;
        }
        decl.location = locate(node);

        for (const auto& field : node.fields) {
            bool reserved = field.name == kReservedAttribute;
            for (const auto& attr : field.attrs) {
                if (attr != kReservedAttribute) {
                    const auto location = locate(field);
                    return std::unexpected(fmt::format("{}:{}:{}: Unknown attribute '{}' on field '{}' of struct '{}'",
                                                       location.file, location.line, location.column, attr,
                                                       field.name, node.name));
                }
                reserved = true;
            }
            decl.fields.push_back(model::Field{field.name, field.type, reserved, locate(field)});
        }

        program_.declarations.emplace_back(std::move(decl));
        return {};
    }

    std::expected<void, std::string> operator()(const ast::Alias& node) const
    {
        program_.declarations.emplace_back(model::AliasDecl{node.name, node.target, locate(node)});
        return {};
    }

    std::expected<void, std::string> operator()(const ast::Mapping& node) const
    {
        program_.mappings.push_back(model::MappingEntry{node.native_name, node.target_name, node.skip_fields,
                                                        locate(node)});
        return {};
    }

    std::expected<void, std::string> operator()(const ast::Operation& node) const
    {
        program_.operations.push_back(model::Operation{
            .name = node.name,
            .value = node.value,
            .event_name = node.event_name,
            .arity = node.event.arity,
            .event = node.event.type,
            .result = node.result,
            .location = locate(node),
        });
        return {};
    }

private:
    model::SourceLocation locate(const ast::PositionTaggedNode& node) const
    {
        if (node.id_first < 0 || node.id_last < 0) {
            return {program_.path, 0, 0};
        }

        auto range = positions_.position_of(node);
        std::size_t line = 1;
        std::size_t column = 1;
        for (auto it = positions_.first(); it != range.begin(); ++it) {
            if (*it == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        return {program_.path, line, column};
    }

    Program& program_;
    const idl::parser::position_cache_type& positions_;
};

}  // namespace

std::expected<Program, std::string> parse_program(const std::string& path)
{
    auto content = detail::read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    spdlog::debug("Read {} bytes from {}", content->size(), path);
    return detail::parse_file_content(content.value(), path);
}

namespace detail
{

std::expected<std::string, std::string> read_file(const std::string& path)
{
    namespace fs = std::filesystem;

    const fs::path fs_path(path);

    std::error_code ec;
    if (!fs::is_regular_file(fs_path, ec) || ec) {
        return std::unexpected("Failed to open file: " + fs_path.string() +
                               (ec ? ": " + ec.message() : ": not a regular file"));
    }

    std::ifstream file(fs_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected("Failed to open file: " + fs_path.string());
    }

    const auto file_size = fs::file_size(fs_path, ec);
    if (ec) {
        return std::unexpected("Failed to read file: " + fs_path.string() + ": " + ec.message());
    }

    std::string content(file_size, '\0');
    if (!file.read(content.data(), static_cast<std::streamsize>(content.size()))) {
        return std::unexpected("Failed to read file: " + fs_path.string());
    }

    return content;
}

std::expected<Program, std::string> parse_file_content(const std::string& content, const std::string& path)
{
    auto parsed = idl::parser::parse_file(content, path);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    // positions refer into `content`, so the model is built before returning
    Program program;
    program.path = path;
    ProgramBuilder builder{program, parsed->position_cache};
    for (const auto& declaration : parsed->declarations) {
        if (auto added = boost::apply_visitor(builder, declaration); !added) {
            return std::unexpected(added.error());
        }
    }

    spdlog::debug("Parsed {}: {} declarations, {} mappings, {} operations", path, program.declarations.size(),
                  program.mappings.size(), program.operations.size());
    return program;
}

}  // namespace detail

}  // namespace ctbind::frontend
