#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

#include "ospawn/config/package_locator.hpp"
#include "ospawn/config/yaml_loader.hpp"
#include "ospawn/core/common/logger.hpp"
#include "ospawn/core/common/parse.hpp"
#include "ospawn/core/common/status.hpp"
#include "ospawn/gazebo/gz_spawn_service.hpp"
#include "ospawn/gazebo/spawner.hpp"

using ospawn::config::PackageLocator;
using ospawn::config::joinPackagePath;
using ospawn::config::loadModelsFromFile;
using ospawn::core::LogLevel;
using ospawn::core::Status;
using ospawn::core::log;
using ospawn::core::ok;
using ospawn::core::setLogLevel;
using ospawn::gazebo::GzSpawnService;
using ospawn::gazebo::ObjectSpawner;
using ospawn::gazebo::SpawnReport;
using ospawn::gazebo::SpawnerOptions;

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

static std::string parseStringArg(int argc, char** argv, const char* key, std::string def = {}) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::string(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::string(argv[i] + prefix.size());
    }
  }
  return def;
}

static bool parseDoubleArg(int argc, char** argv, const char* key, double def, double* out) {
  const std::string text = parseStringArg(argc, argv, key);
  if (text.empty()) {
    *out = def;
    return true;
  }
  try {
    std::size_t used = 0;
    *out = std::stod(text, &used);
    if (used != text.size()) return false;
  } catch (const std::exception&) {
    return false;
  }
  return std::isfinite(*out);
}

static void printHelp() {
  std::cout << "Usage: ospawn_spawn_objects [options]\n\n";
  std::cout << "Spawns the models listed in a YAML config into a running Gazebo Sim world.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --package <name>                  Package holding the config (default: object_spawner)\n";
  std::cout << "  --config <relative path>          Config path inside the package (default: /config/models.yaml)\n";
  std::cout << "  --config-file <path>              Config file path; bypasses the package lookup\n";
  std::cout << "  --package-path <dir[:dir...]>     Extra package search roots (searched first)\n";
  std::cout << "  --world <name>                    Target world (default: default)\n";
  std::cout << "  --random-order                    Spawn models in random order\n";
  std::cout << "  --seed <n>                        Seed for --random-order\n";
  std::cout << "  --time-interval <s>               Delay between spawns (default: 1.0, <= 0 disables)\n";
  std::cout << "  --service-timeout <s>             Wait bound for the create service (default: 5.0)\n";
  std::cout << "  --request-timeout-ms <ms>         Timeout of each create request (default: 5000, max: 3600000)\n";
  std::cout << "  --no-validate                     Skip sdformat/urdfdom checks of model descriptions\n";
  std::cout << "  --dry-run                         Resolve and validate models without spawning\n";
  std::cout << "  --report <file.json>              Write a JSON report of the run\n";
  std::cout << "  --quiet                           Set log level to WARN (default: INFO)\n";
  std::cout << "  --debug                           Set log level to DEBUG\n";
  std::cout << "  --log-level <level>               error | warn | info | debug\n";
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
    printHelp();
    return 0;
  }

  // Per-model results are logged at INFO.
  setLogLevel(LogLevel::Info);
  if (parseFlag(argc, argv, "--quiet")) {
    setLogLevel(LogLevel::Warn);
  }
  if (parseFlag(argc, argv, "--debug")) {
    setLogLevel(LogLevel::Debug);
  }
  const std::string level_text = parseStringArg(argc, argv, "--log-level");
  if (!level_text.empty()) {
    LogLevel level = LogLevel::Info;
    if (!ospawn::core::parseLogLevel(level_text, &level)) {
      std::cerr << "Invalid --log-level: " << level_text << ". Run with --help for usage.\n";
      return 2;
    }
    setLogLevel(level);
  }

  SpawnerOptions opt;
  opt.random_order = parseFlag(argc, argv, "--random-order");
  opt.dry_run = parseFlag(argc, argv, "--dry-run");
  opt.resolve.validate = !parseFlag(argc, argv, "--no-validate");

  double request_timeout_ms = 5000.0;
  unsigned int request_timeout = 5000;
  if (!parseDoubleArg(argc, argv, "--time-interval", 1.0, &opt.time_interval) ||
      !parseDoubleArg(argc, argv, "--service-timeout", 5.0, &opt.service_timeout) ||
      !parseDoubleArg(argc, argv, "--request-timeout-ms", 5000.0, &request_timeout_ms) ||
      !ospawn::core::requestTimeoutFromMs(request_timeout_ms, &request_timeout)) {
    std::cerr << "Invalid numeric argument. Run with --help for usage.\n";
    return 2;
  }

  const std::string seed_text = parseStringArg(argc, argv, "--seed");
  if (!seed_text.empty()) {
    std::uint32_t seed = 0;
    if (!ospawn::core::parseUint32(seed_text, &seed)) {
      std::cerr << "Invalid --seed: " << seed_text << " (expected 0.." << UINT32_MAX << ")\n";
      return 2;
    }
    opt.seed = seed;
  }

  const PackageLocator locator = PackageLocator::fromEnvironment(parseStringArg(argc, argv, "--package-path"));

  std::string config_path = parseStringArg(argc, argv, "--config-file");
  if (config_path.empty()) {
    const std::string package = parseStringArg(argc, argv, "--package", "object_spawner");
    const std::string relative = parseStringArg(argc, argv, "--config", "/config/models.yaml");
    std::string package_dir;
    if (!ok(locator.find(package, &package_dir))) {
      log(LogLevel::Error, "Cannot find package [" + package + "] holding the model config");
      return 2;
    }
    config_path = joinPackagePath(package_dir, relative);
  }

  auto loaded = loadModelsFromFile(config_path);
  if (!ok(loaded.status)) {
    std::cerr << "Failed to load model config: " << config_path << "\n";
    return 2;
  }

  const std::string world = parseStringArg(argc, argv, "--world", "default");
  GzSpawnService service(world, request_timeout);
  ObjectSpawner spawner(&service, locator, opt);

  const SpawnReport report = spawner.spawnAll(loaded.registry);
  ospawn::gazebo::logSpawnReport(report);

  const std::string report_path = parseStringArg(argc, argv, "--report");
  if (!report_path.empty() && !ok(ospawn::gazebo::writeSpawnReportJson(report, report_path))) {
    std::cerr << "Failed to write report: " << report_path << "\n";
  }

  const bool all_ok = report.allSucceeded() && loaded.skipped == 0;
  return all_ok ? 0 : 1;
}
