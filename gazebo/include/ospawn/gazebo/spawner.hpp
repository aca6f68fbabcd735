#pragma once

#include "ospawn/config/model_registry.hpp"
#include "ospawn/config/package_locator.hpp"
#include "ospawn/core/common/status.hpp"
#include "ospawn/gazebo/model_source.hpp"
#include "ospawn/gazebo/spawn_service.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ospawn::gazebo {

struct SpawnerOptions {
  // Spawn in a shuffled order instead of declaration order.
  bool random_order{false};
  // Seed for `random_order`; unset means std::random_device.
  std::optional<std::uint32_t> seed;

  // Delay between two consecutive spawns (seconds); <= 0 disables it.
  double time_interval{1.0};

  // Bound on waiting for the spawn service before each call (seconds).
  double service_timeout{5.0};

  std::string reference_frame{"world"};

  // Resolve and validate every model, log what would be spawned, but never call the service.
  bool dry_run{false};

  ResolveOptions resolve;
};

struct SpawnOutcome {
  std::string unique_name;
  std::string name;
  ospawn::config::ModelKind kind{ospawn::config::ModelKind::Box};
  Status status{Status::Failure};
  std::string message;

  bool succeeded() const { return ospawn::core::ok(status); }
};

struct SpawnReport {
  std::vector<SpawnOutcome> outcomes;  // in spawn order

  std::size_t succeeded() const;
  std::size_t failed() const;
  bool allSucceeded() const { return failed() == 0; }
};

// Spawns registry models one after another through a `SpawnService`.
// A model that cannot be resolved or spawned is logged and skipped; the batch always runs to the end.
class ObjectSpawner {
public:
  ObjectSpawner(SpawnService* service, const ospawn::config::PackageLocator& locator, SpawnerOptions opt = {});

  Status spawnModel(const ospawn::config::ModelSpec& spec, SpawnOutcome* outcome);

  SpawnReport spawnAll(const ospawn::config::ModelRegistry& registry);

  // Indices into `registry.models()` in the order `spawnAll` visits them.
  std::vector<std::size_t> spawnOrder(const ospawn::config::ModelRegistry& registry) const;

  const SpawnerOptions& options() const { return opt_; }

private:
  SpawnService* service_;
  ModelSourceResolver resolver_;
  SpawnerOptions opt_;
};

// One summary line plus one line per failed model.
void logSpawnReport(const SpawnReport& report);

// Writes the report as JSON: {"spawned": N, "failed": M, "models": [...]}.
Status writeSpawnReportJson(const SpawnReport& report, const std::string& json_path);

}  // namespace ospawn::gazebo
