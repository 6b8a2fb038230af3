#pragma once

#include "model/operation.hpp"
#include "model/registry.hpp"
#include "model/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <vector>

namespace ctbind::model
{

/**
 * @brief JSON representations of the resolved schema model.
 *
 * Used by the --print-schema CLI flag to show what the generator will consume,
 * built-in protocol declarations included.
 */
nlohmann::json to_json(const Schema& schema);
nlohmann::json to_json(const Registry& registry);
nlohmann::json to_json(const std::vector<Operation>& operations);

}  // namespace ctbind::model
