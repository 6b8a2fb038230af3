#include "type_validator.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/static_visitor.hpp>

namespace ctbind::frontend::semantic
{

namespace
{

bool is_supported_width(unsigned bits)
{
    return bits == 8 || bits == 16 || bits == 32 || bits == 64 || bits == 128;
}

}  // namespace

void TypeValidator::validate(const model::Type& type, const SourceLocation& where, const std::string& usage)
{
    struct Visitor : boost::static_visitor<void> {
        Visitor(TypeValidator& self, Context& context, const SourceLocation& where, const std::string& usage)
            : self(self)
            , context(context)
            , where(where)
            , usage(usage)
        {
        }

        TypeValidator& self;
        Context& context;
        const SourceLocation& where;
        const std::string& usage;

        void operator()(const model::Scalar& scalar) const
        {
            if (scalar.bits == 0) {
                context.report_error(where, "Zero-width integer type in " + usage);
            }
        }

        void operator()(const model::Opaque&) const {}
        void operator()(const model::Void&) const {}

        void operator()(const model::Named& named) const
        {
            (void)context.resolve(named.name, where, usage);
        }

        void operator()(const model::Array& array) const
        {
            if (array.length == 0) {
                context.report_error(where, "Array length must be positive in " + usage);
            }
            self.validate(array.element, where, usage + " (array element)");
        }

        void operator()(const model::Pointer& pointer) const
        {
            if (boost::get<model::Void>(&pointer.pointee)) {
                context.report_error(where, "Pointer to void in " + usage + "; use ptr<opaque>");
                return;
            }
            self.validate(pointer.pointee, where, usage + " (pointee)");
        }

        void operator()(const model::Optional& optional) const
        {
            if (!boost::get<model::Pointer>(&optional.child)) {
                context.report_error(where, "Optional is only supported around pointers in " + usage);
            }
            self.validate(optional.child, where, usage);
        }

        void operator()(const model::Slice& slice) const
        {
            self.validate(slice.element, where, usage + " (slice element)");
        }
    };

    boost::apply_visitor(Visitor(*this, context_, where, usage), type);
}

void TypeValidator::validate_layout(const model::Type& type, const SourceLocation& where,
                                    const std::string& usage)
{
    validate_layout(type, where, usage, 0);
}

void TypeValidator::validate_layout(const model::Type& type, const SourceLocation& where,
                                    const std::string& usage, std::size_t depth)
{
    if (depth > context_.schema().declarations().size()) {
        context_.report_error(where, "Alias cycle detected in " + usage);
        return;
    }

    struct Visitor : boost::static_visitor<void> {
        Visitor(TypeValidator& self, Context& context, const SourceLocation& where, const std::string& usage,
                std::size_t depth)
            : self(self)
            , context(context)
            , where(where)
            , usage(usage)
            , depth(depth)
        {
        }

        TypeValidator& self;
        Context& context;
        const SourceLocation& where;
        const std::string& usage;
        std::size_t depth;

        void operator()(const model::Scalar& scalar) const
        {
            switch (scalar.kind) {
                case model::ScalarKind::Bool:
                    return;
                case model::ScalarKind::Unsigned:
                    if (!is_supported_width(scalar.bits)) {
                        context.report_error(where, "Unsupported integer width u" + std::to_string(scalar.bits) +
                                                        " in " + usage);
                    }
                    return;
                case model::ScalarKind::Signed:
                case model::ScalarKind::Float:
                    context.report_error(where, "Type '" + model::to_string(scalar) + "' in " + usage +
                                                    " is not supported; only unsigned integers and bool are");
                    return;
            }
        }

        void operator()(const model::Opaque&) const
        {
            context.report_error(where, "opaque can only be used behind a pointer in " + usage);
        }

        void operator()(const model::Void&) const
        {
            context.report_error(where, "void is not a valid type in " + usage);
        }

        void operator()(const model::Named& named) const
        {
            const auto* declaration = context.schema().find(named.name);
            if (!declaration) {
                return;
            }
            if (const auto* s = boost::get<model::StructDecl>(declaration)) {
                if (s->layout == model::Layout::Extern) {
                    context.report_error(where, "Extern struct '" + s->name + "' cannot be embedded by value in " +
                                                    usage + "; use ptr<" + s->name + ">");
                } else if (s->layout == model::Layout::Auto) {
                    context.report_error(where, "Struct '" + s->name + "' has auto layout and cannot be used in " +
                                                    usage);
                }
            } else if (const auto* alias = boost::get<model::AliasDecl>(declaration)) {
                self.validate_layout(alias->target, where, usage, depth + 1);
            }
        }

        void operator()(const model::Array& array) const
        {
            self.validate_layout(array.element, where, usage + " (array element)", depth);
        }

        void operator()(const model::Pointer& pointer) const
        {
            if (boost::get<model::Opaque>(&pointer.pointee)) {
                return;
            }
            const auto* named = boost::get<model::Named>(&pointer.pointee);
            if (!named) {
                context.report_error(where, "Pointers in " + usage + " must point to opaque or a named struct");
                return;
            }
            const auto* target = context.schema().find_as<model::StructDecl>(named->name);
            if (context.schema().find(named->name) && (!target || target->layout != model::Layout::Extern)) {
                context.report_error(where, "Pointer target '" + named->name + "' in " + usage +
                                                " must be an extern struct");
                return;
            }
            if (target && !context.registry().lookup(named->name)) {
                context.report_error(where, "Pointer target '" + named->name + "' in " + usage + " has no mapping");
            }
        }

        void operator()(const model::Optional& optional) const
        {
            // non-pointer optionals are reported by validate()
            if (boost::get<model::Pointer>(&optional.child)) {
                self.validate_layout(optional.child, where, usage, depth);
            }
        }

        void operator()(const model::Slice&) const
        {
            context.report_error(where, "Slices cannot be laid out in " + usage);
        }
    };

    boost::apply_visitor(Visitor(*this, context_, where, usage, depth), type);
}

}  // namespace ctbind::frontend::semantic
