#pragma once
#include <string>
#include <utility>
#include <vector>

namespace deployer {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

enum class Severity : int {
    Info = 0,
    Warn = 1,
    Error = 2,
};

struct Diagnostic {
    Severity severity{Severity::Info};
    std::string message;
};

// Value of a best-effort step: always present (possibly empty), plus the
// non-fatal problems met while producing it.
template <typename T>
struct Outcome {
    T value{};
    std::vector<Diagnostic> diagnostics;

    bool HasWarnings() const {
        for (const auto& d : diagnostics) {
            if (d.severity != Severity::Info)
                return true;
        }
        return false;
    }

    void Append(std::vector<Diagnostic> more) {
        for (auto& d : more)
            diagnostics.push_back(std::move(d));
    }
};

} // namespace deployer
