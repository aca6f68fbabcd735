#pragma once

#include "ospawn/core/common/status.hpp"
#include "ospawn/core/math/types.hpp"

#include <string>

namespace ospawn::gazebo {

using ospawn::core::Status;

struct SpawnRequest {
  std::string name;                       // entity name in the world
  std::string xml;                        // SDF or URDF text
  ospawn::core::Pose pose;                // initial pose
  std::string reference_frame{"world"};   // frame `pose` is expressed in
  bool allow_renaming{false};
};

struct SpawnResponse {
  bool success{false};
  std::string status_message;
};

// Remote capability that instantiates a model in the running world.
class SpawnService {
public:
  virtual ~SpawnService() = default;

  // Human-readable service address, used in log lines.
  virtual std::string serviceName() const = 0;

  // Blocks until the service is reachable or `timeout_s` elapses (Status::Timeout).
  virtual Status waitForService(double timeout_s) = 0;

  // Returns non-Success when the call itself failed (no reply, transport error).
  // A delivered reply, positive or negative, is reported through `response`.
  virtual Status spawn(const SpawnRequest& request, SpawnResponse* response) = 0;
};

}  // namespace ospawn::gazebo
