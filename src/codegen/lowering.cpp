#include "lowering.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/static_visitor.hpp>

#include <fmt/format.h>

namespace ctbind::codegen
{

namespace
{

std::unexpected<std::string> unhandled(const model::Type& type)
{
    return std::unexpected(fmt::format("Unhandled type '{}'", model::to_string(type)));
}

}  // namespace

class Lowering::CTypeVisitor : public boost::static_visitor<Lowering::Result>
{
public:
    CTypeVisitor(const Lowering& lowering, std::size_t depth)
        : _lowering(lowering)
        , _depth(depth)
    {
    }

    Result operator()(const model::Scalar& scalar) const
    {
        if (scalar.kind == model::ScalarKind::Bool) {
            return "ctypes.c_bool";
        }
        if (scalar.kind != model::ScalarKind::Unsigned) {
            return std::unexpected(fmt::format("Invalid int type '{}': only unsigned integers can be lowered",
                                               model::to_string(scalar)));
        }
        switch (scalar.bits) {
            case 8:
            case 16:
            case 32:
            case 64:
                return fmt::format("ctypes.c_uint{}", scalar.bits);
            case 128:
                return "c_uint128";
            default:
                return std::unexpected(fmt::format("Invalid int type '{}'", model::to_string(scalar)));
        }
    }

    Result operator()(const model::Opaque& opaque) const
    {
        return unhandled(opaque);
    }

    Result operator()(const model::Void&) const
    {
        return "None";
    }

    Result operator()(const model::Named& named) const
    {
        const auto* declaration = _lowering._schema.find(named.name);
        if (!declaration) {
            return std::unexpected(fmt::format("Unknown type '{}'", named.name));
        }
        if (const auto* e = boost::get<model::EnumDecl>(declaration)) {
            return _lowering.ctype(e->tag, _depth + 1);
        }
        if (const auto* alias = boost::get<model::AliasDecl>(declaration)) {
            return _lowering.ctype(alias->target, _depth + 1);
        }

        const auto& s = boost::get<model::StructDecl>(*declaration);
        switch (s.layout) {
            case model::Layout::Packed: {
                // transmitted as one unsigned integer of the summed field widths
                const auto bits = model::bit_size(_lowering._schema, named);
                if (!bits) {
                    return std::unexpected(fmt::format("Packed struct '{}' has no fixed bit width", s.name));
                }
                return _lowering.ctype(model::unsigned_type(static_cast<unsigned>(*bits)), _depth + 1);
            }
            case model::Layout::Extern:
                return std::unexpected(fmt::format("Extern struct '{}' cannot be embedded by value", s.name));
            case model::Layout::Auto:
                return std::unexpected(fmt::format("Invalid C struct type '{}': auto layout", s.name));
        }
        return unhandled(named);
    }

    Result operator()(const model::Array& array) const
    {
        auto element = _lowering.ctype(array.element, _depth);
        if (!element) {
            return element;
        }
        return fmt::format("{} * {}", *element, array.length);
    }

    Result operator()(const model::Pointer& pointer) const
    {
        if (boost::get<model::Opaque>(&pointer.pointee)) {
            return "ctypes.c_void_p";
        }
        const auto* named = boost::get<model::Named>(&pointer.pointee);
        if (!named) {
            return unhandled(pointer);
        }
        const auto* entry = _lowering._registry.lookup(named->name);
        if (!entry) {
            return std::unexpected(fmt::format("No mapping for pointer target '{}'", named->name));
        }
        return fmt::format("ctypes.POINTER(C{})", entry->target_name);
    }

    Result operator()(const model::Optional& optional) const
    {
        if (!boost::get<model::Pointer>(&optional.child)) {
            return std::unexpected(fmt::format("Unsupported optional type '{}'", model::to_string(optional)));
        }
        return _lowering.ctype(optional.child, _depth);
    }

    Result operator()(const model::Slice& slice) const
    {
        return unhandled(slice);
    }

private:
    const Lowering& _lowering;
    std::size_t _depth;
};

class Lowering::PythonVisitor : public boost::static_visitor<Lowering::Result>
{
public:
    PythonVisitor(const Lowering& lowering, std::size_t depth)
        : _lowering(lowering)
        , _depth(depth)
    {
    }

    Result operator()(const model::Scalar& scalar) const
    {
        switch (scalar.kind) {
            case model::ScalarKind::Bool:
                return "bool";
            case model::ScalarKind::Unsigned:
                return "int";
            case model::ScalarKind::Signed:
            case model::ScalarKind::Float:
                break;
        }
        return std::unexpected(fmt::format("Invalid int type '{}': only unsigned integers can be lowered",
                                           model::to_string(scalar)));
    }

    Result operator()(const model::Void&) const
    {
        return "None";
    }

    Result operator()(const model::Named& named) const
    {
        const auto* declaration = _lowering._schema.find(named.name);
        if (!declaration) {
            return std::unexpected(fmt::format("Unknown type '{}'", named.name));
        }
        if (const auto* alias = boost::get<model::AliasDecl>(declaration)) {
            return _lowering.python(alias->target, _depth + 1);
        }
        if (const auto* s = boost::get<model::StructDecl>(declaration); s && s->layout == model::Layout::Auto) {
            return std::unexpected(fmt::format("Invalid C struct type '{}': auto layout", s->name));
        }
        const auto* entry = _lowering._registry.lookup(model::Table::Domain, named.name);
        if (!entry) {
            return std::unexpected(fmt::format("Type '{}' has no domain mapping", named.name));
        }
        return entry->target_name;
    }

    Result operator()(const model::Array& array) const
    {
        auto element = _lowering.python(array.element, _depth);
        if (!element) {
            return element;
        }
        return fmt::format("{}[{}]", *element, array.length);
    }

    template <typename Other>
    Result operator()(const Other& other) const
    {
        return unhandled(other);
    }

private:
    const Lowering& _lowering;
    std::size_t _depth;
};

Lowering::Lowering(const model::Schema& schema, const model::Registry& registry)
    : _schema(schema)
    , _registry(registry)
{
}

Lowering::Result Lowering::ctype(const model::Type& type) const
{
    return ctype(type, 0);
}

Lowering::Result Lowering::python(const model::Type& type) const
{
    return python(type, 0);
}

Lowering::Result Lowering::ctype_name(const model::Type& type) const
{
    const auto& resolved = model::resolve_aliases(_schema, type);
    if (const auto* named = boost::get<model::Named>(&resolved)) {
        const auto* s = _schema.find_as<model::StructDecl>(named->name);
        if (s && s->layout == model::Layout::Extern) {
            const auto* entry = _registry.lookup(named->name);
            if (!entry) {
                return std::unexpected(fmt::format("No mapping for struct '{}'", named->name));
            }
            return "C" + entry->target_name;
        }
    }
    return ctype(type);
}

Lowering::Result Lowering::ctype(const model::Type& type, std::size_t depth) const
{
    if (depth > _schema.declarations().size()) {
        return std::unexpected(fmt::format("Alias cycle while lowering '{}'", model::to_string(type)));
    }
    return boost::apply_visitor(CTypeVisitor{*this, depth}, type);
}

Lowering::Result Lowering::python(const model::Type& type, std::size_t depth) const
{
    if (depth > _schema.declarations().size()) {
        return std::unexpected(fmt::format("Alias cycle while lowering '{}'", model::to_string(type)));
    }
    return boost::apply_visitor(PythonVisitor{*this, depth}, type);
}

}  // namespace ctbind::codegen
