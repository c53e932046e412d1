#pragma once

#include "catalog/catalog_resolver.hpp"
#include "config/config_store.hpp"
#include "deploy/deployment_engine.hpp"
#include "deploy/selection_builder.hpp"
#include "editions/edition_resolver.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace deployer {

// One operator session: customer -> catalog entry -> edition -> selection.
// Owns the single ISO mount a selection may hold and releases it when the
// selection has been deployed, completed or cancelled, when another entry is
// begun, when the customer changes, and on destruction.
class SelectionFlow {
  public:
    SelectionFlow(config::ConfigStore store, ImageCatalogResolver catalog, EditionResolver editions);
    ~SelectionFlow();

    SelectionFlow(const SelectionFlow&) = delete;
    SelectionFlow& operator=(const SelectionFlow&) = delete;

    std::expected<void, config::ConfigError> SelectCustomer(const std::string& customer);
    bool HasCustomer() const { return profile_.has_value(); }
    // Requires HasCustomer().
    const config::CustomerProfile& Profile() const { return *profile_; }

    // Rebuilt from disk on every call.
    Outcome<ImageList> CustomerCatalog() const;
    Outcome<ImageList> BaseCatalog() const;

    // Starts a selection for `entry`. Returns the editions to choose from;
    // empty when the entry needs no edition choice or none could be found.
    Outcome<std::vector<EditionOption>> Begin(const ImageDescriptor& entry);
    const std::optional<ImageDescriptor>& Current() const { return current_; }

    // `edition` must be one of the editions Begin offered when the entry
    // requires a choice. The mount stays held until Deploy/Complete/Cancel.
    std::expected<DeploymentSelection, SelectionError>
    Finalize(const std::optional<EditionOption>& edition, const DeploymentContext& context);

    // Hands the finalized selection to `engine`, then completes the flow
    // whether or not the engine succeeded.
    Result Deploy(const IDeploymentEngine& engine);

    Result Complete();
    Result Cancel();

    bool HasActiveMount() const { return editions_.mount.Held(); }

  private:
    Result Reset(const char* why);

    config::ConfigStore store_;
    ImageCatalogResolver catalog_;
    EditionResolver edition_resolver_;

    std::optional<config::CustomerProfile> profile_;
    std::optional<ImageDescriptor> current_;
    EditionSet editions_;
    std::optional<DeploymentSelection> selection_;
};

} // namespace deployer
