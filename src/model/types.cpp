#include "model/types.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/static_visitor.hpp>

#include <fmt/format.h>

#include <utility>

namespace ctbind::model
{

const std::string& declaration_name(const Declaration& declaration)
{
    struct Visitor : boost::static_visitor<const std::string&> {
        const std::string& operator()(const EnumDecl& decl) const
        {
            return decl.name;
        }
        const std::string& operator()(const StructDecl& decl) const
        {
            return decl.name;
        }
        const std::string& operator()(const AliasDecl& decl) const
        {
            return decl.name;
        }
    };
    return boost::apply_visitor(Visitor(), declaration);
}

const SourceLocation& declaration_location(const Declaration& declaration)
{
    struct Visitor : boost::static_visitor<const SourceLocation&> {
        const SourceLocation& operator()(const EnumDecl& decl) const
        {
            return decl.location;
        }
        const SourceLocation& operator()(const StructDecl& decl) const
        {
            return decl.location;
        }
        const SourceLocation& operator()(const AliasDecl& decl) const
        {
            return decl.location;
        }
    };
    return boost::apply_visitor(Visitor(), declaration);
}

bool Schema::add(Declaration declaration)
{
    auto [it, inserted] = index_.emplace(declaration_name(declaration), declarations_.size());
    if (!inserted) {
        return false;
    }
    declarations_.push_back(std::move(declaration));
    return true;
}

const Declaration* Schema::find(std::string_view name) const
{
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &declarations_[it->second];
}

const std::vector<Declaration>& Schema::declarations() const
{
    return declarations_;
}

Type bool_type()
{
    return Scalar{ScalarKind::Bool, 1};
}

Type unsigned_type(unsigned bits)
{
    return Scalar{ScalarKind::Unsigned, bits};
}

Type signed_type(unsigned bits)
{
    return Scalar{ScalarKind::Signed, bits};
}

Type float_type(unsigned bits)
{
    return Scalar{ScalarKind::Float, bits};
}

Type opaque_type()
{
    return Opaque{};
}

Type void_type()
{
    return Void{};
}

Type named(std::string name)
{
    return Named{std::move(name)};
}

Type array_of(Type element, std::uint64_t length)
{
    return Array{std::move(element), length};
}

Type pointer_to(Type pointee)
{
    return Pointer{std::move(pointee)};
}

Type optional_of(Type child)
{
    return Optional{std::move(child)};
}

Type slice_of(Type element)
{
    return Slice{std::move(element)};
}

std::string to_string(const Type& type)
{
    struct Visitor : boost::static_visitor<std::string> {
        std::string operator()(const Scalar& scalar) const
        {
            switch (scalar.kind) {
                case ScalarKind::Bool:
                    return "bool";
                case ScalarKind::Unsigned:
                    return fmt::format("u{}", scalar.bits);
                case ScalarKind::Signed:
                    return fmt::format("i{}", scalar.bits);
                case ScalarKind::Float:
                    return fmt::format("f{}", scalar.bits);
            }
            return "<scalar>";
        }

        std::string operator()(const Opaque&) const
        {
            return "opaque";
        }

        std::string operator()(const Void&) const
        {
            return "void";
        }

        std::string operator()(const Named& named) const
        {
            return named.name;
        }

        std::string operator()(const Array& array) const
        {
            return fmt::format("array<{}, {}>", boost::apply_visitor(*this, array.element), array.length);
        }

        std::string operator()(const Pointer& pointer) const
        {
            return fmt::format("ptr<{}>", boost::apply_visitor(*this, pointer.pointee));
        }

        std::string operator()(const Optional& optional) const
        {
            return fmt::format("optional<{}>", boost::apply_visitor(*this, optional.child));
        }

        std::string operator()(const Slice& slice) const
        {
            return fmt::format("slice<{}>", boost::apply_visitor(*this, slice.element));
        }
    };
    return boost::apply_visitor(Visitor(), type);
}

bool is_unsigned(const Type& type, unsigned bits)
{
    const auto* scalar = boost::get<Scalar>(&type);
    return scalar && scalar->kind == ScalarKind::Unsigned && scalar->bits == bits;
}

namespace
{

std::optional<std::uint64_t> bit_size_at(const Schema& schema, const Type& type, std::size_t depth)
{
    // every level resolves one declaration, so deeper nesting means a cycle
    if (depth > schema.declarations().size()) {
        return std::nullopt;
    }
    if (const auto* scalar = boost::get<Scalar>(&type)) {
        return scalar->bits;
    }
    if (const auto* array = boost::get<Array>(&type)) {
        auto element = bit_size_at(schema, array->element, depth);
        if (!element) {
            return std::nullopt;
        }
        return *element * array->length;
    }
    if (const auto* ref = boost::get<Named>(&type)) {
        const auto* declaration = schema.find(ref->name);
        if (!declaration) {
            return std::nullopt;
        }
        if (const auto* e = boost::get<EnumDecl>(declaration)) {
            return bit_size_at(schema, e->tag, depth + 1);
        }
        if (const auto* alias = boost::get<AliasDecl>(declaration)) {
            return bit_size_at(schema, alias->target, depth + 1);
        }
        if (const auto* s = boost::get<StructDecl>(declaration); s && s->layout == Layout::Packed) {
            std::uint64_t total = 0;
            for (const auto& field : s->fields) {
                auto size = bit_size_at(schema, field.type, depth + 1);
                if (!size) {
                    return std::nullopt;
                }
                total += *size;
            }
            return total;
        }
    }
    return std::nullopt;
}

}  // namespace

const Type& resolve_aliases(const Schema& schema, const Type& type)
{
    const Type* current = &type;
    for (std::size_t hops = 0; hops <= schema.declarations().size(); ++hops) {
        const auto* ref = boost::get<Named>(current);
        if (!ref) {
            break;
        }
        const auto* alias = schema.find_as<AliasDecl>(ref->name);
        if (!alias) {
            break;
        }
        current = &alias->target;
    }
    return *current;
}

std::optional<std::uint64_t> bit_size(const Schema& schema, const Type& type)
{
    return bit_size_at(schema, type, 0);
}

}  // namespace ctbind::model
