#pragma once

#include "util/result.hpp"

#include <string>

namespace deployer {

// Owning file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode 0644.
    static Result CreateForWrite(const std::string& path, Fd& out);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    Result Close();

  private:
    int fd_{-1};
};

} // namespace deployer
