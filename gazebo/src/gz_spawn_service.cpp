#include "ospawn/gazebo/gz_spawn_service.hpp"

#include "ospawn/core/common/logger.hpp"

// NOLINTNEXTLINE(modernize-deprecated-headers)
#include <gz/msgs/boolean.pb.h>
// NOLINTNEXTLINE(modernize-deprecated-headers)
#include <gz/msgs/entity_factory.pb.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <utility>
#include <vector>

namespace ospawn::gazebo {

using ospawn::core::LogLevel;
using ospawn::core::log;

GzSpawnService::GzSpawnService(std::string world_name, unsigned int request_timeout_ms)
  : world_name_(std::move(world_name)),
    service_("/world/" + world_name_ + "/create"),
    request_timeout_ms_(request_timeout_ms) {}

bool GzSpawnService::serviceAdvertised() {
  std::vector<std::string> services;
  node_.ServiceList(services);
  return std::find(services.begin(), services.end(), service_) != services.end();
}

Status GzSpawnService::waitForService(double timeout_s) {
  log(LogLevel::Debug, "Waiting for service " + service_);

  using Clock = std::chrono::steady_clock;
  const auto budget = std::chrono::duration<double>(std::max(0.0, timeout_s));
  const auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(budget);

  while (true) {
    if (serviceAdvertised()) return Status::Success;
    if (Clock::now() >= deadline) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  log(LogLevel::Error, "Service " + service_ + " not available after " + std::to_string(timeout_s) + " s");
  return Status::Timeout;
}

Status GzSpawnService::spawn(const SpawnRequest& request, SpawnResponse* response) {
  if (!response) {
    log(LogLevel::Error, "GzSpawnService::spawn: null response");
    return Status::InvalidParameter;
  }
  *response = SpawnResponse{};

  gz::msgs::EntityFactory req;
  req.set_name(request.name);
  req.set_sdf(request.xml);
  req.set_allow_renaming(request.allow_renaming);
  req.set_relative_to(request.reference_frame);

  auto* pose = req.mutable_pose();
  pose->mutable_position()->set_x(request.pose.position.x());
  pose->mutable_position()->set_y(request.pose.position.y());
  pose->mutable_position()->set_z(request.pose.position.z());
  pose->mutable_orientation()->set_x(request.pose.orientation.x());
  pose->mutable_orientation()->set_y(request.pose.orientation.y());
  pose->mutable_orientation()->set_z(request.pose.orientation.z());
  pose->mutable_orientation()->set_w(request.pose.orientation.w());

  gz::msgs::Boolean rep;
  bool result = false;
  const bool called = node_.Request(service_, req, request_timeout_ms_, rep, result);
  if (!called) {
    log(LogLevel::Error, "Request to '" + service_ + "' failed or timed out (" +
                             std::to_string(request_timeout_ms_) + " ms)");
    return Status::Timeout;
  }

  response->success = result && rep.data();
  response->status_message = response->success
    ? "Successfully spawned entity [" + request.name + "]"
    : "create service in world [" + world_name_ + "] rejected entity [" + request.name + "]";
  return Status::Success;
}

}  // namespace ospawn::gazebo
