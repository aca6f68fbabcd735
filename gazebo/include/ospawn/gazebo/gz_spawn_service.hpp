#pragma once

#include "ospawn/gazebo/spawn_service.hpp"

#include <gz/transport/Node.hh>

#include <string>

namespace ospawn::gazebo {

// `SpawnService` backed by the Gazebo Sim entity factory: `/world/<world_name>/create`
// (gz::msgs::EntityFactory request, gz::msgs::Boolean reply).
class GzSpawnService final : public SpawnService {
public:
  explicit GzSpawnService(std::string world_name, unsigned int request_timeout_ms = 5000);

  std::string serviceName() const override { return service_; }
  Status waitForService(double timeout_s) override;
  Status spawn(const SpawnRequest& request, SpawnResponse* response) override;

private:
  bool serviceAdvertised();

  std::string world_name_;
  std::string service_;
  unsigned int request_timeout_ms_{5000};
  gz::transport::Node node_;
};

}  // namespace ospawn::gazebo
