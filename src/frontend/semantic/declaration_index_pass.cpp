#include "declaration_index_pass.hpp"

#include "model/protocol.hpp"
#include "semantic_context.hpp"

#include <unordered_map>

namespace ctbind::frontend::semantic
{

void DeclarationIndexPass::run(Context& context)
{
    // built-in declarations have no location of their own
    std::unordered_map<std::string, const SourceLocation*> seen;
    for (const auto& declaration : model::protocol::declarations(context.program().operations)) {
        seen.emplace(model::declaration_name(declaration), nullptr);
    }

    for (const auto& declaration : context.program().declarations) {
        const auto& name = model::declaration_name(declaration);
        const auto& location = model::declaration_location(declaration);
        auto [it, inserted] = seen.emplace(name, &location);
        if (inserted) {
            continue;
        }
        if (!it->second) {
            context.report_error(location, "Declaration '" + name + "' clashes with a built-in protocol type");
        } else {
            context.report_error(location, "Declaration '" + name + "' already defined at line " +
                                               std::to_string(it->second->line));
        }
    }
}

}  // namespace ctbind::frontend::semantic
