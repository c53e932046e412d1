#include "editions/iso_mount_lease.hpp"

#include "util/logger.hpp"

namespace deployer {

IsoMountLease::IsoMountLease(std::shared_ptr<const IIsoInspector> owner, IsoMount mount)
    : owner_(std::move(owner)), mount_(std::move(mount)), held_(owner_ != nullptr) {}

IsoMountLease::IsoMountLease(IsoMountLease&& other) noexcept
    : owner_(std::move(other.owner_)), mount_(std::move(other.mount_)), held_(other.held_) {
    other.Reset();
}

IsoMountLease& IsoMountLease::operator=(IsoMountLease&& other) noexcept {
    if (this == &other)
        return *this;
    (void)Release();
    owner_ = std::move(other.owner_);
    mount_ = std::move(other.mount_);
    held_ = other.held_;
    other.Reset();
    return *this;
}

IsoMountLease::~IsoMountLease() {
    if (held_) {
        LogWarn("ISO %s still mounted at scope exit, releasing", mount_.iso_path.c_str());
        (void)Release();
    }
}

Result IsoMountLease::Release() {
    if (!held_)
        return Result::Ok();

    auto first = owner_->Dismount(mount_);
    if (first.is_ok()) {
        LogInfo("Dismounted %s", mount_.iso_path.c_str());
        Reset();
        return first;
    }

    LogWarn("Dismount of %s failed (%s), retrying", mount_.iso_path.c_str(), first.msg.c_str());
    auto second = owner_->Dismount(mount_);
    if (second.is_ok()) {
        LogInfo("Dismounted %s on retry", mount_.iso_path.c_str());
        Reset();
        return second;
    }

    LogError("Dismount of %s failed twice (%s); %s needs manual cleanup",
             mount_.iso_path.c_str(), second.msg.c_str(), mount_.mount_point.c_str());
    Reset();
    return second;
}

void IsoMountLease::Reset() {
    owner_.reset();
    mount_ = IsoMount{};
    held_ = false;
}

} // namespace deployer
