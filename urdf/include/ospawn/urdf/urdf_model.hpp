#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ospawn/core/common/status.hpp"

namespace ospawn::urdf {

// URDF checks run before a robot description is handed to the simulator.
//
// Scope:
// - The description must parse with urdfdom and have a single root link.
// - Links without an `<inertial>` block are reported: the URDF -> SDF conversion drops them
//   unless they are the root of a static model.
struct UrdfSummary {
  std::string robot_name;
  std::string root_link;
  std::size_t link_count{0};
  std::size_t joint_count{0};
  std::vector<std::string> links_without_inertial;
};

struct LoadResult {
  ospawn::core::Status status{ospawn::core::Status::Failure};
  UrdfSummary summary;
  std::string message;  // optional debug info for caller
};

LoadResult loadUrdfFromString(const std::string& urdf_xml);

// Reads the file into `urdf_xml` (when non-null) and checks it.
LoadResult loadUrdfFromFile(const std::string& urdf_path, std::string* urdf_xml = nullptr);

}  // namespace ospawn::urdf
