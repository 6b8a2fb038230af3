#include "frontend/program.hpp"

#include "model/protocol.hpp"

namespace ctbind::frontend
{

model::Schema Program::schema() const
{
    model::Schema schema;
    for (auto& declaration : model::protocol::declarations(operations)) {
        schema.add(std::move(declaration));
    }
    for (const auto& declaration : declarations) {
        // duplicates are reported by the declaration index pass
        (void)schema.add(declaration);
    }
    return schema;
}

model::Registry Program::registry() const
{
    return model::Registry{model::protocol::mapping_table(), mappings};
}

}  // namespace ctbind::frontend
