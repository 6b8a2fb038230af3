#include "emitter.hpp"

#include "model/protocol.hpp"

#include <boost/variant/get.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace ctbind::codegen
{
namespace
{

constexpr int kIndentWidth = 4;

std::string indentation(int indent_level)
{
    return std::string(indent_level * kIndentWidth, ' ');
}

bool is_skipped(const model::MappingEntry& entry, const std::string& name)
{
    return std::find(entry.skip_fields.begin(), entry.skip_fields.end(), name) != entry.skip_fields.end();
}

const model::Scalar* as_unsigned(const model::Type& type)
{
    const auto* scalar = boost::get<model::Scalar>(&type);
    return scalar && scalar->kind == model::ScalarKind::Unsigned ? scalar : nullptr;
}

/// Continuation lines of a wrapped argument list line up after its opening bracket.
void write_wrapped(std::ostream& os, const std::string& head, const std::vector<std::vector<std::string>>& rows,
                   const std::string& tail)
{
    os << head;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) {
            os << ",\n" << std::string(head.size(), ' ');
        }
        os << fmt::format("{}", fmt::join(rows[i], ", "));
    }
    os << tail << '\n';
}

/// Loop variable for one level of array nesting.
std::string item_name(int depth)
{
    return depth == 0 ? "v" : fmt::format("v{}", depth);
}

}  // namespace

std::string to_upper(std::string_view name)
{
    std::string result(name);
    for (auto& c : result) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - ('a' - 'A'));
        }
    }
    return result;
}

Emitter::Emitter(const model::Schema& schema, const model::Registry& registry, const GenerationOptions& options)
    : _schema(schema)
    , _registry(registry)
    , _options(options)
    , _lowering(schema, registry)
{
}

void Emitter::emit_preamble(std::ostream& os) const
{
    const auto title = fmt::format("## This file was auto-generated by {} ##", _options.generator_name);
    const std::string border(title.size(), '#');

    os << border << '\n'
       << title << '\n'
       << fmt::format("##{:^{}}##", "Do not manually modify.", title.size() - 4) << '\n'
       << border << '\n';

    std::vector<std::string> imports{"c_uint128", "dataclass", _options.library_handle, "validate_uint"};
    std::sort(imports.begin(), imports.end());

    os << "from __future__ import annotations\n"
          "\n"
          "import ctypes\n"
          "import enum\n"
          "from collections.abc import Callable # noqa: TCH003\n"
          "from typing import Any\n"
          "\n";
    os << fmt::format("from {} import {}\n", _options.runtime_module, fmt::join(imports, ", "));
    os << "\n\n";
}

std::expected<void, std::string> Emitter::emit_declaration(std::ostream& os, const model::MappingEntry& entry) const
{
    auto declaration = find_declaration(entry);
    if (!declaration) {
        return std::unexpected(declaration.error());
    }

    if (const auto* e = boost::get<model::EnumDecl>(*declaration)) {
        emit_enum(os, *e, entry);
        return {};
    }

    if (const auto* alias = boost::get<model::AliasDecl>(*declaration)) {
        auto ctype = _lowering.ctype(alias->target);
        if (!ctype) {
            return std::unexpected(fmt::format("Alias '{}': {}", alias->name, ctype.error()));
        }
        os << fmt::format("{} = {}\n\n", entry.target_name, *ctype);
        return {};
    }

    const auto& s = boost::get<model::StructDecl>(**declaration);
    switch (s.layout) {
        case model::Layout::Packed:
            emit_flags(os, s, entry);
            return {};
        case model::Layout::Extern:
            return {};
        case model::Layout::Auto:
            break;
    }
    return std::unexpected(fmt::format("Invalid C struct type '{}': auto layout cannot be mapped", s.name));
}

void Emitter::emit_enum(std::ostream& os, const model::EnumDecl& decl, const model::MappingEntry& entry) const
{
    os << fmt::format("class {}(enum.IntEnum):\n", entry.target_name);
    bool empty = true;
    for (const auto& variant : decl.variants) {
        if (is_skipped(entry, variant.name)) {
            continue;
        }
        os << indentation(1) << fmt::format("{} = {}\n", to_upper(variant.name), variant.value);
        empty = false;
    }
    if (empty) {
        os << indentation(1) << "pass\n";
    }
    os << "\n\n";
}

void Emitter::emit_flags(std::ostream& os, const model::StructDecl& decl, const model::MappingEntry& entry) const
{
    os << fmt::format("class {}(enum.IntFlag):\n", entry.target_name);
    os << indentation(1) << "NONE = 0\n";
    // bit positions follow the declaration index, skipped members included
    for (std::size_t i = 0; i < decl.fields.size(); ++i) {
        const auto& field = decl.fields[i];
        if (is_skipped(entry, field.name)) {
            continue;
        }
        os << indentation(1) << fmt::format("{} = 1 << {}\n", to_upper(field.name), i);
    }
    os << "\n\n";
}

std::expected<void, std::string> Emitter::emit_dataclass(std::ostream& os, const model::MappingEntry& entry) const
{
    auto declaration = find_declaration(entry);
    if (!declaration) {
        return std::unexpected(declaration.error());
    }
    const auto* s = boost::get<model::StructDecl>(*declaration);
    if (!s || s->layout != model::Layout::Extern) {
        return {};
    }

    os << "@dataclass\n";
    os << fmt::format("class {}:\n", entry.target_name);
    bool empty = true;
    for (const auto& field : s->fields) {
        if (field.reserved) {
            continue;
        }
        auto python_type = _lowering.python(field.type);
        if (!python_type) {
            return std::unexpected(
                fmt::format("Field '{}' of struct '{}': {}", field.name, s->name, python_type.error()));
        }
        auto value = default_value(field.type);
        if (!value) {
            return std::unexpected(fmt::format("Field '{}' of struct '{}': {}", field.name, s->name, value.error()));
        }
        os << indentation(1) << fmt::format("{}: {} = {}\n", field.name, *python_type, *value);
        empty = false;
    }
    if (empty) {
        os << indentation(1) << "pass\n";
    }
    os << "\n\n";
    return {};
}

std::expected<void, std::string> Emitter::emit_structure(std::ostream& os, const model::MappingEntry& entry,
                                                         bool with_to_python) const
{
    auto declaration = find_declaration(entry);
    if (!declaration) {
        return std::unexpected(declaration.error());
    }
    const auto* s = boost::get<model::StructDecl>(*declaration);
    if (!s || s->layout != model::Layout::Extern) {
        return {};
    }

    std::vector<std::pair<std::string, std::string>> layout;
    layout.reserve(s->fields.size());
    for (const auto& field : s->fields) {
        auto ctype = _lowering.ctype(field.type);
        if (!ctype) {
            return std::unexpected(fmt::format("Field '{}' of struct '{}': {}", field.name, s->name, ctype.error()));
        }
        layout.emplace_back(field.name, std::move(*ctype));
    }

    const auto c_name = "C" + entry.target_name;
    os << fmt::format("class {}(ctypes.Structure):\n", c_name);
    os << indentation(1) << "@classmethod\n";
    os << indentation(1) << "def from_param(cls, obj):\n";

    // ctypes integers wrap silently on overflow; c_uint128 checks its own range
    for (const auto& field : s->fields) {
        if (!field.reserved) {
            emit_range_checks(os, field.type, "obj." + field.name, field.name, 2, 0);
        }
    }

    os << indentation(2) << "return cls(\n";
    for (const auto& field : s->fields) {
        if (!field.reserved) {
            os << indentation(3)
               << fmt::format("{}={},\n", field.name, from_param_value(field.type, "obj." + field.name, 0));
        }
    }
    os << indentation(2) << ")\n\n";

    if (with_to_python) {
        os << '\n';
        os << indentation(1) << "def to_python(self):\n";
        os << indentation(2) << fmt::format("return {}(\n", entry.target_name);
        for (const auto& field : s->fields) {
            if (!field.reserved) {
                os << indentation(3)
                   << fmt::format("{}={},\n", field.name, to_python_value(field.type, "self." + field.name, 0));
            }
        }
        os << indentation(2) << ")\n\n";
    }

    os << fmt::format("{}._fields_ = [ # noqa: SLF001\n", c_name);
    for (const auto& [name, ctype] : layout) {
        os << indentation(1) << fmt::format("(\"{}\", {}),\n", name, ctype);
    }
    os << "]\n\n\n";
    return {};
}

std::expected<void, std::string> Emitter::emit_lifecycle(std::ostream& os) const
{
    auto client = protocol_name(model::protocol::kClientType);
    auto status = protocol_name(model::protocol::kStatusType);
    auto packet = protocol_name(model::protocol::kPacketType);
    for (const auto* name : {&client, &status, &packet}) {
        if (!*name) {
            return std::unexpected(name->error());
        }
    }

    const auto packet_ptr = fmt::format("ctypes.POINTER(C{})", *packet);
    const auto& handle = _options.library_handle;

    os << "# The result is passed as pointer and length; it is not a null terminated string.\n";
    write_wrapped(os, "OnCompletion = ctypes.CFUNCTYPE(",
                  {{"None", "ctypes.c_void_p", *client, packet_ptr},
                   {"ctypes.c_uint64", "ctypes.c_void_p", "ctypes.c_uint32"}},
                  ")");
    os << '\n';

    auto declare = [&](const std::string& function, const std::vector<std::string>& comment,
                       const std::string& restype, const std::vector<std::vector<std::string>>& argtypes) {
        for (const auto& line : comment) {
            os << "# " << line << '\n';
        }
        os << fmt::format("{0} = {1}.{0}\n", function, handle);
        os << fmt::format("{}.restype = {}\n", function, restype);
        write_wrapped(os, function + ".argtypes = [", argtypes, "]");
        os << '\n';
    };

    const auto& prefix = _options.function_prefix;
    const std::vector<std::vector<std::string>> init_args{
        {fmt::format("ctypes.POINTER({})", *client), "c_uint128", "ctypes.c_char_p"},
        {"ctypes.c_uint32", "ctypes.c_void_p", "OnCompletion"},
    };

    declare(prefix + "_init",
            {"Initialize a new client which connects to the addresses provided and",
             "completes submitted packets by invoking the callback with the given context."},
            *status, init_args);
    declare(prefix + "_init_echo", {"Initialize a new client which echoes back any data submitted."}, *status,
            init_args);
    declare(prefix + "_deinit",
            {"Closes the client, completing any previously submitted packets with a shutdown status",
             "before freeing the client resources. The client must not be used after deinit."},
            "None", {{*client}});
    declare(prefix + "_submit",
            {"Submit a packet with its operation, data and data_size fields set.",
             "The completion callback is invoked on the client thread, not on the caller's thread."},
            "None", {{*client, packet_ptr}});
    os << '\n';
    return {};
}

std::expected<void, std::string> Emitter::emit_method_set(std::ostream& os,
                                                          const std::vector<model::Operation>& operations,
                                                          CallingConvention convention) const
{
    auto operation_class = protocol_name(model::protocol::kOperationType);
    if (!operation_class) {
        return std::unexpected(operation_class.error());
    }

    const auto* class_prefix = convention == CallingConvention::Awaitable ? "Async" : "";
    os << fmt::format("class {}{}:\n", class_prefix, _options.mixin_name);
    os << indentation(1) << fmt::format("_submit: Callable[[{}, Any, Any, Any], Any]\n", *operation_class);

    for (const auto& operation : operations) {
        if (operation.name == model::protocol::kHeartbeatOperation) {
            continue;
        }
        if (auto emitted = emit_method(os, operation, *operation_class, convention); !emitted) {
            return emitted;
        }
    }

    os << "\n\n";
    return {};
}

std::expected<void, std::string> Emitter::emit_method(std::ostream& os, const model::Operation& operation,
                                                      const std::string& operation_class,
                                                      CallingConvention convention) const
{
    const auto fail = [&](const std::string& what, const std::string& error) {
        return std::unexpected(fmt::format("{} of operation '{}': {}", what, operation.name, error));
    };

    auto event_type = _lowering.python(operation.event);
    if (!event_type) {
        return fail("Event", event_type.error());
    }
    auto result_type = _lowering.python(operation.result);
    if (!result_type) {
        return fail("Result", result_type.error());
    }
    auto event_ctype = _lowering.ctype_name(operation.event);
    if (!event_ctype) {
        return fail("Event", event_ctype.error());
    }
    auto result_ctype = _lowering.ctype_name(operation.result);
    if (!result_ctype) {
        return fail("Result", result_ctype.error());
    }

    const bool batch = operation.arity == model::Arity::Batch;
    const bool awaitable = convention == CallingConvention::Awaitable;

    // single events are wrapped, the submit call always takes a list
    os << indentation(1)
       << fmt::format("{}def {}(self, {}: {}) -> list[{}]:\n", awaitable ? "async " : "", operation.name,
                      operation.event_name, batch ? fmt::format("list[{}]", *event_type) : *event_type,
                      *result_type);
    os << indentation(2) << fmt::format("return {}self._submit(\n", awaitable ? "await " : "");
    os << indentation(3) << fmt::format("{}.{},\n", operation_class, to_upper(operation.name));
    os << indentation(3)
       << fmt::format("{},\n", batch ? operation.event_name : fmt::format("[{}]", operation.event_name));
    os << indentation(3) << fmt::format("{},\n", *event_ctype);
    os << indentation(3) << fmt::format("{},\n", *result_ctype);
    os << indentation(2) << ")\n\n";
    return {};
}

std::expected<const model::Declaration*, std::string> Emitter::find_declaration(
    const model::MappingEntry& entry) const
{
    const auto* declaration = _schema.find(entry.native_name);
    if (!declaration) {
        return std::unexpected(fmt::format("Mapped type '{}' is not declared", entry.native_name));
    }
    return declaration;
}

std::expected<std::string, std::string> Emitter::protocol_name(std::string_view native_name) const
{
    const auto* entry = _registry.lookup(model::Table::Protocol, native_name);
    if (!entry) {
        return std::unexpected(fmt::format("No mapping for protocol type '{}'", native_name));
    }
    return entry->target_name;
}

std::expected<std::string, std::string> Emitter::default_value(const model::Type& type) const
{
    const auto& resolved = model::resolve_aliases(_schema, type);

    if (const auto* scalar = boost::get<model::Scalar>(&resolved); scalar && scalar->kind == model::ScalarKind::Bool) {
        return "False";
    }

    if (const auto* array = boost::get<model::Array>(&resolved)) {
        auto zero = default_value(array->element);
        if (!zero) {
            return zero;
        }
        return fmt::format("({},) * {}", *zero, array->length);
    }

    if (const auto* named = boost::get<model::Named>(&resolved)) {
        const auto* s = _schema.find_as<model::StructDecl>(named->name);
        if (s && s->layout == model::Layout::Packed) {
            auto flags = _lowering.python(resolved);
            if (!flags) {
                return flags;
            }
            return *flags + ".NONE";
        }
    }

    return "0";
}

void Emitter::emit_range_checks(std::ostream& os, const model::Type& type, const std::string& access,
                                const std::string& name, int indent_level, int depth) const
{
    const auto& resolved = model::resolve_aliases(_schema, type);

    if (const auto* scalar = as_unsigned(resolved); scalar && scalar->bits <= 64) {
        os << indentation(indent_level)
           << fmt::format("validate_uint(bits={}, name=\"{}\", number={})\n", scalar->bits, name, access);
        return;
    }

    if (const auto* array = boost::get<model::Array>(&resolved)) {
        std::ostringstream checks;
        const auto item = item_name(depth);
        emit_range_checks(checks, array->element, item, name, indent_level + 1, depth + 1);
        if (!checks.str().empty()) {
            os << indentation(indent_level) << fmt::format("for {} in {}:\n", item, access) << checks.str();
        }
    }
}

std::string Emitter::from_param_value(const model::Type& type, const std::string& access, int depth) const
{
    const auto& resolved = model::resolve_aliases(_schema, type);

    if (model::is_unsigned(resolved, 128)) {
        return fmt::format("c_uint128.from_param({})", access);
    }

    if (const auto* array = boost::get<model::Array>(&resolved)) {
        const auto item = item_name(depth);
        const auto element = from_param_value(array->element, item, depth + 1);
        if (element != item) {
            return fmt::format("tuple({} for {} in {})", element, item, access);
        }
    }
    return access;
}

std::string Emitter::to_python_value(const model::Type& type, const std::string& access, int depth) const
{
    const auto& resolved = model::resolve_aliases(_schema, type);

    if (const auto* named = boost::get<model::Named>(&resolved)) {
        const auto* declaration = _schema.find(named->name);
        const bool convertible = declaration && !boost::get<model::AliasDecl>(declaration);
        if (const auto* entry = _registry.lookup(model::Table::Domain, named->name); entry && convertible) {
            return fmt::format("{}({})", entry->target_name, access);
        }
    }

    if (model::is_unsigned(resolved, 128)) {
        return access + ".to_python()";
    }

    // ctypes arrays come back as tuples, matching the record defaults
    if (const auto* array = boost::get<model::Array>(&resolved)) {
        const auto item = item_name(depth);
        const auto element = to_python_value(array->element, item, depth + 1);
        if (element == item) {
            return fmt::format("tuple({})", access);
        }
        return fmt::format("tuple({} for {} in {})", element, item, access);
    }
    return access;
}

}  // namespace ctbind::codegen
