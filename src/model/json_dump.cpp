#include "model/json_dump.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>

#include <nlohmann/json.hpp>

namespace ctbind::model
{
namespace
{

using nlohmann::json;

std::string layout_to_string(Layout layout)
{
    switch (layout) {
        case Layout::Auto:
            return "auto";
        case Layout::Extern:
            return "extern";
        case Layout::Packed:
            return "packed";
    }
    return "<unknown>";
}

std::string arity_to_string(Arity arity)
{
    switch (arity) {
        case Arity::Single:
            return "single";
        case Arity::Batch:
            return "batch";
    }
    return "<unknown>";
}

json location_to_json(const SourceLocation& location)
{
    if (location.file.empty()) {
        return "<builtin>";
    }
    return json{{"file", location.file}, {"line", location.line}, {"column", location.column}};
}

json fields_to_json(const std::vector<Field>& fields)
{
    json arr = json::array();
    for (const auto& field : fields) {
        json node;
        node["name"] = field.name;
        node["type"] = to_string(field.type);
        if (field.reserved) {
            node["reserved"] = true;
        }
        arr.push_back(std::move(node));
    }
    return arr;
}

json variants_to_json(const std::vector<Variant>& variants)
{
    json arr = json::array();
    for (const auto& variant : variants) {
        arr.push_back(json{{"name", variant.name}, {"value", variant.value}});
    }
    return arr;
}

json declaration_to_json(const Declaration& declaration)
{
    struct Visitor : boost::static_visitor<json> {
        json operator()(const EnumDecl& e) const
        {
            return json{{"kind", "enum"},
                        {"name", e.name},
                        {"tag", to_string(e.tag)},
                        {"variants", variants_to_json(e.variants)},
                        {"location", location_to_json(e.location)}};
        }

        json operator()(const StructDecl& s) const
        {
            json node{{"kind", "struct"},
                      {"name", s.name},
                      {"layout", layout_to_string(s.layout)},
                      {"fields", fields_to_json(s.fields)},
                      {"location", location_to_json(s.location)}};
            if (s.backing) {
                node["backing"] = to_string(*s.backing);
            }
            return node;
        }

        json operator()(const AliasDecl& alias) const
        {
            return json{{"kind", "alias"},
                        {"name", alias.name},
                        {"target", to_string(alias.target)},
                        {"location", location_to_json(alias.location)}};
        }
    };

    return boost::apply_visitor(Visitor(), declaration);
}

json table_to_json(const MappingTable& table)
{
    json arr = json::array();
    for (const auto& entry : table) {
        json node{{"native", entry.native_name}, {"target", entry.target_name}};
        if (!entry.skip_fields.empty()) {
            node["skip"] = entry.skip_fields;
        }
        arr.push_back(std::move(node));
    }
    return arr;
}

}  // namespace

nlohmann::json to_json(const Schema& schema)
{
    json arr = json::array();
    for (const auto& declaration : schema.declarations()) {
        arr.push_back(declaration_to_json(declaration));
    }
    return arr;
}

nlohmann::json to_json(const Registry& registry)
{
    return json{{"protocol", table_to_json(registry.protocol())}, {"domain", table_to_json(registry.domain())}};
}

nlohmann::json to_json(const std::vector<Operation>& operations)
{
    json arr = json::array();
    for (const auto& operation : operations) {
        arr.push_back(json{{"name", operation.name},
                           {"value", operation.value},
                           {"event_name", operation.event_name},
                           {"arity", arity_to_string(operation.arity)},
                           {"event", to_string(operation.event)},
                           {"result", to_string(operation.result)},
                           {"location", location_to_json(operation.location)}});
    }
    return arr;
}

}  // namespace ctbind::model
