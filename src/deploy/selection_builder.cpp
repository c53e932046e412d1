#include "deploy/selection_builder.hpp"

#include "util/logger.hpp"

namespace deployer {

namespace {

std::unexpected<SelectionError> Invalid(std::string msg) {
    LogWarn("InvalidSelection: %s", msg.c_str());
    return std::unexpected(SelectionError{SelectionErrorCode::InvalidSelection, std::move(msg)});
}

// Flags carried by the entry itself. Declared custom images are expected to
// carry all three, so each default applied to one is logged.
DeploymentFlags EntryFlags(const ImageDescriptor& entry) {
    const bool warn = entry.edition == kCustomImageEdition;
    auto pick = [&](const std::optional<bool>& v, bool def, const char* name) {
        if (v)
            return *v;
        if (warn) {
            LogWarn("Image '%s' has no %s, defaulting to %s", entry.id.c_str(), name, def ? "true" : "false");
        }
        return def;
    };
    DeploymentFlags f;
    f.required_updates = pick(entry.required_updates, false, "RequiredUpdates");
    f.apply_unattend = pick(entry.apply_unattend, true, "ApplyUnattend");
    f.driver_inject = pick(entry.driver_inject, true, "DriverInject");
    return f;
}

} // namespace

bool RequiresEditionChoice(const ImageDescriptor& entry) {
    if (entry.kind == ImageKind::FFU || entry.IsCustomerImage())
        return false;
    return true;
}

DeploymentSelectionBuilder::DeploymentSelectionBuilder(config::DeploymentSettings settings)
    : settings_(settings) {}

std::expected<DeploymentSelection, SelectionError>
DeploymentSelectionBuilder::BuildSelection(const ImageDescriptor& entry,
                                           const std::optional<EditionOption>& edition,
                                           const DeploymentContext& context,
                                           std::string_view staged_install_image) const {
    if (entry.id.empty())
        return Invalid("catalog entry has no ImageID");
    if (entry.path.empty())
        return Invalid("catalog entry '" + entry.id + "' has no path");
    if (edition && edition->index <= 0)
        return Invalid("edition '" + edition->name + "' has no valid index");

    DeploymentSelection sel;
    sel.id_ = entry.id;
    sel.name_ = entry.name.empty() ? entry.id : entry.name;
    sel.kind_ = entry.kind;
    sel.customer_name_ = context.customer_name;
    sel.order_number_ = context.order_number;
    sel.device_info_ = context.device_info;

    if (entry.kind == ImageKind::FFU) {
        sel.full_path_ = entry.path;
        sel.image_index_ = 1;
        sel.edition_ = entry.edition.empty() ? kCustomImageEdition : entry.edition;
        sel.flags_ = EntryFlags(entry);
    } else if (entry.IsCustomerImage()) {
        if (edition)
            LogDebug("Edition '%s' ignored for customer image '%s'", edition->name.c_str(), entry.id.c_str());
        sel.full_path_ = entry.path;
        sel.image_index_ = entry.image_index.value_or(1);
        sel.edition_ = entry.edition;
        sel.flags_ = EntryFlags(entry);
    } else if (entry.kind == ImageKind::ISO) {
        if (staged_install_image.empty())
            return Invalid("ISO '" + entry.id + "' is not mounted");
        if (!edition)
            return Invalid("ISO '" + entry.id + "' needs an edition");
        if (!context.operator_flags)
            return Invalid("ISO '" + entry.id + "' needs operator-chosen deployment options");
        sel.full_path_ = std::string(staged_install_image);
        sel.iso_path_ = entry.path;
        sel.image_index_ = edition->index;
        sel.edition_ = edition->name;
        sel.flags_ = *context.operator_flags;
    } else {
        if (!edition)
            return Invalid("base image '" + entry.id + "' needs an edition");
        sel.full_path_ = entry.path;
        sel.image_index_ = edition->index;
        sel.edition_ = edition->name;
        sel.flags_.required_updates = settings_.RequiredUpdates();
        sel.flags_.apply_unattend = settings_.ApplyUnattend();
        sel.flags_.driver_inject = settings_.DriverInject();
    }

    LogInfo("Selection: %s %s index=%d edition='%s' updates=%d unattend=%d drivers=%d",
            ToString(sel.kind_),
            sel.full_path_.c_str(),
            sel.image_index_,
            sel.edition_.c_str(),
            sel.flags_.required_updates ? 1 : 0,
            sel.flags_.apply_unattend ? 1 : 0,
            sel.flags_.driver_inject ? 1 : 0);
    return sel;
}

} // namespace deployer
