#pragma once

#include "ospawn/config/model_registry.hpp"

#include <cstddef>
#include <string>

namespace ospawn::config {

// YAML model list -> `ModelRegistry`.
//
// Expected layout:
//   models:
//     - name: coke_can            # required
//       type: sdf                 # box | sphere | cylinder | urdf | sdf
//       package: my_models        # required for urdf / sdf
//       base_path: models         # optional, see ModelSpec::base_path
//       unique_name: can_left     # optional
//       quaternion: false         # pose orientation as [qx qy qz qw]
//       radians: false            # Euler angles in radians instead of degrees
//       pose: [0, 0, 0.5, 0, 0, 90]
//       scale: [0.1, 0.1, 0.2]    # primitives: [depth, width, height]
//       static: false             # primitives
//       mass: 1.0                 # primitives, kg
//       color: [1, 0, 0, 1]       # primitives, rgba
//
// Entries that fail to parse are skipped (and counted); the rest still load.
// A file that cannot be read, is not valid YAML, or has no `models` sequence fails as a whole.
struct LoadResult {
  Status status{Status::Failure};
  ModelRegistry registry;
  std::size_t entries{0};
  std::size_t skipped{0};
  std::string message;
};

LoadResult loadModelsFromFile(const std::string& yaml_path);

LoadResult loadModelsFromString(const std::string& yaml_text);

}  // namespace ospawn::config
