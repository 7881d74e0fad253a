#pragma once

#include "viewer/assets/variant_orchestrator.h"

#include <json/json.h>

namespace CVW {
namespace Assets {

// JSON view of a snapshot, as printed by cvw_resolve
Json::Value snapshotToJson(const RenderSnapshot& snapshot);

} // namespace Assets
} // namespace CVW
