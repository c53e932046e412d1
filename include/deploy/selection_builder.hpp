#pragma once

#include "catalog/image_types.hpp"
#include "config/customer_profile.hpp"
#include "deploy/deployment_selection.hpp"

#include <expected>
#include <optional>
#include <string_view>

namespace deployer {

// True for entries the operator must pick an edition for: ISOs and base
// ESD/WIM images.
bool RequiresEditionChoice(const ImageDescriptor& entry);

class DeploymentSelectionBuilder {
  public:
    explicit DeploymentSelectionBuilder(config::DeploymentSettings settings);

    // `staged_install_image` is the install image inside the mounted ISO and
    // is required for ISO entries only.
    std::expected<DeploymentSelection, SelectionError>
    BuildSelection(const ImageDescriptor& entry,
                   const std::optional<EditionOption>& edition,
                   const DeploymentContext& context,
                   std::string_view staged_install_image = {}) const;

  private:
    config::DeploymentSettings settings_;
};

} // namespace deployer
