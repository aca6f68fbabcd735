#include "ospawn/config/package_locator.hpp"

#include "ospawn/core/common/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace ospawn::config {

namespace fs = std::filesystem;

using ospawn::core::LogLevel;
using ospawn::core::log;

static std::vector<std::string> splitPathList(const std::string& list) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream iss(list);
  while (std::getline(iss, item, ':')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static std::string envOrEmpty(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

void PackageLocator::addRoot(const std::string& root) {
  if (root.empty()) return;
  if (std::find(roots_.begin(), roots_.end(), root) != roots_.end()) return;
  roots_.push_back(root);
}

void PackageLocator::addRootsFromPathList(const std::string& path_list) {
  for (const auto& r : splitPathList(path_list)) addRoot(r);
}

PackageLocator PackageLocator::fromEnvironment(const std::string& extra_path_list) {
  PackageLocator locator;
  locator.addRootsFromPathList(extra_path_list);
  locator.addRootsFromPathList(envOrEmpty("OSPAWN_PACKAGE_PATH"));
  locator.addRootsFromPathList(envOrEmpty("GZ_SIM_RESOURCE_PATH"));
  locator.addRootsFromPathList(envOrEmpty("IGN_GAZEBO_RESOURCE_PATH"));
  locator.addRootsFromPathList(envOrEmpty("ROS_PACKAGE_PATH"));
  for (const auto& prefix : splitPathList(envOrEmpty("AMENT_PREFIX_PATH"))) {
    locator.addRoot((fs::path(prefix) / "share").string());
  }
  return locator;
}

Status PackageLocator::find(const std::string& package, std::string* package_dir) const {
  if (!package_dir) {
    log(LogLevel::Error, "PackageLocator::find: null output");
    return Status::InvalidParameter;
  }
  if (package.empty() || package.find('/') != std::string::npos) {
    log(LogLevel::Error, "PackageLocator::find: invalid package name '" + package + "'");
    return Status::InvalidParameter;
  }

  std::error_code ec;
  for (const auto& root : roots_) {
    const fs::path root_path(root);
    const fs::path candidate = root_path / package;
    if (fs::is_directory(candidate, ec)) {
      *package_dir = candidate.string();
      return Status::Success;
    }
    fs::path normalized = root_path.lexically_normal();
    if (!normalized.has_filename()) normalized = normalized.parent_path();
    if (normalized.filename().string() == package && fs::is_directory(root_path, ec)) {
      *package_dir = root_path.string();
      return Status::Success;
    }
  }

  log(LogLevel::Debug, "PackageLocator::find: '" + package + "' not found in " +
                           std::to_string(roots_.size()) + " search root(s)");
  return Status::NotFound;
}

std::string joinPackagePath(const std::string& package_dir, std::string relative_path) {
  while (!relative_path.empty() && relative_path.front() == '/') relative_path.erase(0, 1);
  return (fs::path(package_dir) / relative_path).string();
}

}  // namespace ospawn::config
