#pragma once

#include "editions/iso_inspector.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace deployer {

// Owns one mounted ISO. Release() dismounts, retrying once; after a second
// failure the mount is abandoned (logged as an error) so the flow can go on.
// The destructor releases a lease that is still held.
class IsoMountLease {
  public:
    IsoMountLease() = default;
    IsoMountLease(std::shared_ptr<const IIsoInspector> owner, IsoMount mount);
    IsoMountLease(const IsoMountLease&) = delete;
    IsoMountLease& operator=(const IsoMountLease&) = delete;
    IsoMountLease(IsoMountLease&& other) noexcept;
    IsoMountLease& operator=(IsoMountLease&& other) noexcept;
    ~IsoMountLease();

    Result Release();

    bool Held() const { return held_; }
    const IsoMount& Mount() const { return mount_; }

  private:
    void Reset();

    std::shared_ptr<const IIsoInspector> owner_;
    IsoMount mount_;
    bool held_ = false;
};

} // namespace deployer
