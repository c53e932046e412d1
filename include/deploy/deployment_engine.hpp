#pragma once

#include "deploy/deployment_selection.hpp"
#include "util/result.hpp"

#include <string>

namespace deployer {

// Consumes a finalized selection. Applying the image is out of our hands;
// the engine only has to be done with FullPath when Deploy returns.
class IDeploymentEngine {
  public:
    virtual ~IDeploymentEngine() = default;
    virtual Result Deploy(const DeploymentSelection& selection) const = 0;
};

// Writes the hand-off JSON to `handoff_path`, then runs
// "<command> '<handoff_path>'" when a command is configured.
class CommandDeploymentEngine final : public IDeploymentEngine {
  public:
    CommandDeploymentEngine(std::string command, std::string handoff_path);

    Result Deploy(const DeploymentSelection& selection) const override;

  private:
    std::string command_;
    std::string handoff_path_;
};

} // namespace deployer
