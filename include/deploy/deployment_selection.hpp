#pragma once

#include "catalog/image_types.hpp"

#include <optional>
#include <string>

namespace deployer {

struct DeviceInfo {
    std::string manufacturer;
    std::string model;
    std::string serial_number;
};

struct DeploymentFlags {
    bool required_updates = false;
    bool apply_unattend = true;
    bool driver_inject = true;
};

// Operator-supplied context carried through to the deployment engine.
struct DeploymentContext {
    std::string customer_name;
    std::string order_number;
    DeviceInfo device_info;
    // Chosen per deployment for ISO sources.
    std::optional<DeploymentFlags> operator_flags;
};

enum class SelectionErrorCode {
    InvalidSelection,
};

struct SelectionError {
    SelectionErrorCode code = SelectionErrorCode::InvalidSelection;
    std::string msg;
};

// What the external deployment engine consumes. Built only by
// DeploymentSelectionBuilder and read-only afterwards.
class DeploymentSelection {
  public:
    const std::string& Id() const { return id_; }
    const std::string& Name() const { return name_; }
    const std::string& FullPath() const { return full_path_; }
    const std::optional<std::string>& IsoPath() const { return iso_path_; }
    int ImageIndex() const { return image_index_; }
    const std::string& Edition() const { return edition_; }
    ImageKind Kind() const { return kind_; }
    const DeploymentFlags& Flags() const { return flags_; }
    const std::string& CustomerName() const { return customer_name_; }
    const std::string& OrderNumber() const { return order_number_; }
    const DeviceInfo& Device() const { return device_info_; }

  private:
    friend class DeploymentSelectionBuilder;
    DeploymentSelection() = default;

    std::string id_;
    std::string name_;
    std::string full_path_;
    std::optional<std::string> iso_path_;
    int image_index_ = 0;
    std::string edition_;
    ImageKind kind_ = ImageKind::WIM;
    DeploymentFlags flags_;
    std::string customer_name_;
    std::string order_number_;
    DeviceInfo device_info_;
};

} // namespace deployer
