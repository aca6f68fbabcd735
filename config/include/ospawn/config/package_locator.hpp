#pragma once

#include "ospawn/core/common/status.hpp"

#include <string>
#include <vector>

namespace ospawn::config {

using ospawn::core::Status;

// Finds package directories by name across an ordered list of search roots.
// A package `<pkg>` resolves to `<root>/<pkg>`, or to `<root>` itself when the root's directory name is `<pkg>`.
class PackageLocator {
public:
  void addRoot(const std::string& root);

  // Adds every non-empty entry of a ':'-separated list.
  void addRootsFromPathList(const std::string& path_list);

  // Roots from `extra_path_list` first, then the environment:
  // OSPAWN_PACKAGE_PATH, GZ_SIM_RESOURCE_PATH, IGN_GAZEBO_RESOURCE_PATH, ROS_PACKAGE_PATH,
  // and `<prefix>/share` for each AMENT_PREFIX_PATH entry.
  static PackageLocator fromEnvironment(const std::string& extra_path_list = {});

  Status find(const std::string& package, std::string* package_dir) const;

  const std::vector<std::string>& roots() const { return roots_; }

private:
  std::vector<std::string> roots_;
};

// Joins a package directory and a package-relative path; a leading '/' on the relative part is ignored.
std::string joinPackagePath(const std::string& package_dir, std::string relative_path);

}  // namespace ospawn::config
