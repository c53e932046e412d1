#include "deploy/selection_writer.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>

namespace deployer {

namespace {

Result WriteAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            return Result::Fail(err, "write failed: " + std::string(std::strerror(err)));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

} // namespace

Json SelectionToJson(const DeploymentSelection& sel) {
    Json j = Json::object();
    j["Id"] = sel.Id();
    j["Name"] = sel.Name();
    j["FullPath"] = sel.FullPath();
    if (sel.IsoPath())
        j["ISOPath"] = *sel.IsoPath();
    else
        j["ISOPath"] = nullptr;
    j["ImageIndex"] = sel.ImageIndex();
    j["Edition"] = sel.Edition();
    j["Kind"] = ToString(sel.Kind());
    j["RequiredUpdates"] = sel.Flags().required_updates;
    j["ApplyUnattend"] = sel.Flags().apply_unattend;
    j["DriverInject"] = sel.Flags().driver_inject;
    j["CustomerName"] = sel.CustomerName();
    j["OrderNumber"] = sel.OrderNumber();
    j["DeviceInfo"] = Json{{"Manufacturer", sel.Device().manufacturer},
                           {"Model", sel.Device().model},
                           {"SerialNumber", sel.Device().serial_number}};
    return j;
}

Result WriteSelectionJson(const DeploymentSelection& sel, const std::string& path) {
    if (path.empty())
        return Result::Fail(EINVAL, "selection output path is empty");

    const std::string tmp_path = path + ".tmp";
    Fd fd;
    if (auto r = Fd::CreateForWrite(tmp_path, fd); !r.is_ok())
        return r;

    const std::string text = SelectionToJson(sel).dump(2) + "\n";
    if (auto r = WriteAll(fd.Get(), text); !r.is_ok()) {
        ::unlink(tmp_path.c_str());
        return r;
    }
    if (::fsync(fd.Get()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "fsync failed: " + std::string(std::strerror(err)));
    }
    if (auto r = fd.Close(); !r.is_ok()) {
        ::unlink(tmp_path.c_str());
        return r;
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "Atomic rename failed: " + std::string(std::strerror(err)));
    }
    LogInfo("Selection written to %s", path.c_str());
    return Result::Ok();
}

} // namespace deployer
