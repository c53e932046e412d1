#include "deploy/selection_flow.hpp"

#include "util/logger.hpp"

#include <cerrno>

namespace deployer {

namespace {

std::unexpected<SelectionError> Invalid(std::string msg) {
    LogWarn("InvalidSelection: %s", msg.c_str());
    return std::unexpected(SelectionError{SelectionErrorCode::InvalidSelection, std::move(msg)});
}

std::string VersionHint(const ImageDescriptor& entry) {
    std::string hint;
    if (entry.windows_version)
        hint = "Windows " + *entry.windows_version;
    if (entry.build_version)
        hint += (hint.empty() ? "" : " ") + *entry.build_version;
    return hint;
}

} // namespace

SelectionFlow::SelectionFlow(config::ConfigStore store, ImageCatalogResolver catalog, EditionResolver editions)
    : store_(std::move(store)), catalog_(std::move(catalog)), edition_resolver_(std::move(editions)) {}

SelectionFlow::~SelectionFlow() {
    if (current_)
        (void)Reset("flow destroyed");
}

std::expected<void, config::ConfigError> SelectionFlow::SelectCustomer(const std::string& customer) {
    (void)Reset("customer changed");
    profile_.reset();

    auto profile = store_.LoadCustomerConfig(customer);
    if (!profile) {
        LogError("Cannot load configuration for '%s': %s (%s)",
                 customer.c_str(),
                 profile.error().msg.c_str(),
                 config::ToString(profile.error().code));
        return std::unexpected(profile.error());
    }
    profile_ = std::move(*profile);
    return {};
}

Outcome<ImageList> SelectionFlow::CustomerCatalog() const {
    if (!profile_) {
        Outcome<ImageList> out;
        Note(out.diagnostics, Severity::Error, "no customer selected");
        return out;
    }
    return catalog_.BuildCustomerCatalog(*profile_);
}

Outcome<ImageList> SelectionFlow::BaseCatalog() const {
    if (!profile_) {
        Outcome<ImageList> out;
        Note(out.diagnostics, Severity::Error, "no customer selected");
        return out;
    }
    return catalog_.BuildBaseCatalog(*profile_);
}

Outcome<std::vector<EditionOption>> SelectionFlow::Begin(const ImageDescriptor& entry) {
    Outcome<std::vector<EditionOption>> out;
    if (auto r = Reset("new image selected"); !r.is_ok())
        Note(out.diagnostics, Severity::Error, r.msg);

    current_ = entry;
    LogInfo("Selected %s (%s, %s)", entry.id.c_str(), ToString(entry.kind), entry.path.c_str());
    if (!RequiresEditionChoice(entry))
        return out;

    auto resolved = edition_resolver_.ResolveEditions(entry.path, entry.kind, VersionHint(entry));
    out.Append(std::move(resolved.diagnostics));
    editions_ = std::move(resolved.value);
    out.value = editions_.editions;
    return out;
}

std::expected<DeploymentSelection, SelectionError>
SelectionFlow::Finalize(const std::optional<EditionOption>& edition, const DeploymentContext& context) {
    if (!current_)
        return Invalid("no image selected");

    if (edition && RequiresEditionChoice(*current_)) {
        bool offered = false;
        for (const auto& e : editions_.editions) {
            if (e.index == edition->index) {
                offered = true;
                break;
            }
        }
        if (!offered)
            return Invalid("edition index " + std::to_string(edition->index) + " was not offered for " + current_->id);
    }

    std::string staged;
    if (current_->kind == ImageKind::ISO && editions_.mount.Held())
        staged = editions_.install_image_path;

    const config::DeploymentSettings settings =
        profile_ ? profile_->deployment_settings : config::DeploymentSettings{};
    DeploymentSelectionBuilder builder(settings);
    auto sel = builder.BuildSelection(*current_, edition, context, staged);
    if (!sel)
        return sel;

    selection_ = *sel;
    return sel;
}

Result SelectionFlow::Deploy(const IDeploymentEngine& engine) {
    if (!selection_)
        return Result::Fail(EINVAL, "no finalized selection to deploy");

    const std::string id = selection_->Id();
    auto r = engine.Deploy(*selection_);
    if (auto c = Complete(); !c.is_ok())
        LogError("Cleanup after deploying %s failed: %s", id.c_str(), c.msg.c_str());
    return r;
}

Result SelectionFlow::Complete() {
    return Reset("selection complete");
}

Result SelectionFlow::Cancel() {
    return Reset("selection cancelled");
}

Result SelectionFlow::Reset(const char* why) {
    if (current_ || editions_.mount.Held())
        LogDebug("Resetting selection: %s", why);
    auto r = editions_.mount.Release();
    editions_ = EditionSet{};
    current_.reset();
    selection_.reset();
    return r;
}

} // namespace deployer
