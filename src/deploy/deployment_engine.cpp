#include "deploy/deployment_engine.hpp"

#include "deploy/selection_writer.hpp"
#include "util/logger.hpp"
#include "util/process.hpp"

namespace deployer {

CommandDeploymentEngine::CommandDeploymentEngine(std::string command, std::string handoff_path)
    : command_(std::move(command)), handoff_path_(std::move(handoff_path)) {}

Result CommandDeploymentEngine::Deploy(const DeploymentSelection& selection) const {
    if (auto r = WriteSelectionJson(selection, handoff_path_); !r.is_ok())
        return r;
    if (command_.empty())
        return Result::Ok();

    const std::string cmd = command_ + " " + ShellQuote(handoff_path_);
    LogInfo("Running deployment engine: %s", cmd.c_str());
    std::string out;
    auto r = RunCommandCapture(cmd, out);
    if (!out.empty())
        LogDebug("Engine output:\n%s", out.c_str());
    if (!r.is_ok()) {
        LogError("Deployment of %s failed: %s", selection.Id().c_str(), r.msg.c_str());
        return r;
    }
    LogInfo("Deployment of %s finished", selection.Id().c_str());
    return r;
}

} // namespace deployer
