#include "ospawn/gazebo/spawner.hpp"

#include "ospawn/core/common/logger.hpp"
#include "ospawn/core/math/pose.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <numeric>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

namespace ospawn::gazebo {

using ospawn::config::ModelRegistry;
using ospawn::config::ModelSpec;
using ospawn::config::modelKindToString;
using ospawn::core::LogLevel;
using ospawn::core::log;
using ospawn::core::ok;
using ospawn::core::shouldLog;

static Status finish(SpawnOutcome* outcome, Status st, std::string message) {
  outcome->status = st;
  outcome->message = std::move(message);
  return st;
}

static std::string describePose(const ospawn::core::Pose& p) {
  const auto rpy = ospawn::core::rpyFromQuat(p.orientation);
  std::ostringstream oss;
  oss << std::setprecision(4)
      << "xyz=(" << p.position.x() << ", " << p.position.y() << ", " << p.position.z() << ")"
      << " rpy=(" << rpy.x() << ", " << rpy.y() << ", " << rpy.z() << ")";
  return oss.str();
}

std::size_t SpawnReport::succeeded() const {
  return static_cast<std::size_t>(
    std::count_if(outcomes.begin(), outcomes.end(), [](const SpawnOutcome& o) { return o.succeeded(); }));
}

std::size_t SpawnReport::failed() const {
  return outcomes.size() - succeeded();
}

ObjectSpawner::ObjectSpawner(SpawnService* service,
                             const ospawn::config::PackageLocator& locator,
                             SpawnerOptions opt)
  : service_(service), resolver_(locator, opt.resolve), opt_(std::move(opt)) {}

Status ObjectSpawner::spawnModel(const ModelSpec& spec, SpawnOutcome* outcome) {
  if (!outcome) {
    log(LogLevel::Error, "ObjectSpawner::spawnModel: null outcome");
    return Status::InvalidParameter;
  }
  *outcome = SpawnOutcome{};
  outcome->unique_name = spec.unique_name.empty() ? spec.name : spec.unique_name;
  outcome->name = spec.name;
  outcome->kind = spec.kind;

  SpawnRequest request;
  request.name = outcome->unique_name;
  request.reference_frame = opt_.reference_frame;

  Status st = ospawn::core::poseFromValues(spec.pose, spec.quaternion, spec.radians, &request.pose);
  if (!ok(st)) {
    log(LogLevel::Error, "Error: model " + spec.name + " has an invalid pose");
    return finish(outcome, st, "invalid pose");
  }

  ModelSource source;
  st = resolver_.resolve(spec, &source);
  if (!ok(st)) {
    return finish(outcome, st, "cannot resolve model description");
  }
  request.xml = std::move(source.xml);

  if (opt_.dry_run) {
    log(LogLevel::Info, "Dry run: would spawn " + spec.name + " as " + request.name + " (" +
                            modelKindToString(spec.kind) + ", " + describePose(request.pose) + ")");
    return finish(outcome, Status::Success, "dry run");
  }

  if (!service_) {
    log(LogLevel::Error, "ObjectSpawner::spawnModel: no spawn service configured");
    return finish(outcome, Status::InvalidParameter, "no spawn service");
  }

  st = service_->waitForService(opt_.service_timeout);
  if (!ok(st)) {
    log(LogLevel::Error, "Service call failed: " + service_->serviceName() + " is not available");
    return finish(outcome, st, "spawn service not available");
  }

  log(LogLevel::Info, "Now spawning: " + request.name);
  log(LogLevel::Debug, "Spawn pose of " + request.name + ": " + describePose(request.pose));

  SpawnResponse response;
  st = service_->spawn(request, &response);
  if (!ok(st)) {
    log(LogLevel::Error, "Service call failed for model " + spec.name + ": " + ospawn::core::statusToString(st));
    return finish(outcome, st, "service call failed");
  }
  if (!response.success) {
    log(LogLevel::Error, "Error: model " + spec.name + " not spawned, error message = " + response.status_message);
    return finish(outcome, Status::Failure, response.status_message);
  }

  log(LogLevel::Info, response.status_message + " " + spec.name + " as " + request.name);
  return finish(outcome, Status::Success, response.status_message);
}

std::vector<std::size_t> ObjectSpawner::spawnOrder(const ModelRegistry& registry) const {
  std::vector<std::size_t> order(registry.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  if (opt_.random_order) {
    std::mt19937 rng(opt_.seed ? *opt_.seed : std::random_device{}());
    std::shuffle(order.begin(), order.end(), rng);
  }
  return order;
}

SpawnReport ObjectSpawner::spawnAll(const ModelRegistry& registry) {
  SpawnReport report;
  const auto order = spawnOrder(registry);
  report.outcomes.reserve(order.size());

  for (std::size_t i = 0; i < order.size(); ++i) {
    if (i > 0 && opt_.time_interval > 0.0 && !opt_.dry_run) {
      std::this_thread::sleep_for(std::chrono::duration<double>(opt_.time_interval));
    }
    SpawnOutcome outcome;
    // Failures are already logged and recorded in the outcome.
    (void)spawnModel(registry.models()[order[i]], &outcome);
    report.outcomes.push_back(std::move(outcome));
  }
  return report;
}

void logSpawnReport(const SpawnReport& report) {
  const std::size_t failed = report.failed();
  std::ostringstream oss;
  oss << "Spawned " << report.succeeded() << " of " << report.outcomes.size() << " model(s)";
  if (failed > 0) oss << ", " << failed << " failed";
  log(failed > 0 ? LogLevel::Warn : LogLevel::Info, oss.str());

  if (failed == 0 || !shouldLog(LogLevel::Warn)) return;
  for (const auto& o : report.outcomes) {
    if (o.succeeded()) continue;
    log(LogLevel::Warn, "  " + o.unique_name + " (" + modelKindToString(o.kind) + "): " + o.message);
  }
}

}  // namespace ospawn::gazebo
