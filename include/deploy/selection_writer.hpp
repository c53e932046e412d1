#pragma once

#include "deploy/deployment_selection.hpp"
#include "util/json_utils.hpp"
#include "util/result.hpp"

#include <string>

namespace deployer {

// Hand-off document for the deployment engine. ISOPath is null for non-ISO
// sources.
Json SelectionToJson(const DeploymentSelection& sel);

// Writes SelectionToJson to `<path>.tmp`, fsyncs it and renames it over `path`.
Result WriteSelectionJson(const DeploymentSelection& sel, const std::string& path);

} // namespace deployer
