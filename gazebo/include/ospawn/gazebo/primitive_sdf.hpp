#pragma once

#include "ospawn/config/model_spec.hpp"
#include "ospawn/core/common/status.hpp"
#include "ospawn/core/math/types.hpp"

#include <string>

namespace ospawn::gazebo {

using ospawn::core::Status;
using ospawn::core::Vec3;

// Shape dimensions derived from a primitive `ModelSpec`.
// `scale` is [depth, width, height] (default 1 1 1):
// - box: size = scale
// - sphere: radius = depth / 2
// - cylinder: radius = depth / 2, length = height (SDF cylinders run along z)
struct PrimitiveGeometry {
  ospawn::config::ModelKind kind{ospawn::config::ModelKind::Box};
  Vec3 box_size{Vec3::Ones()};
  double radius{0.5};
  double length{1.0};
};

Status primitiveGeometryFromSpec(const ospawn::config::ModelSpec& spec, PrimitiveGeometry* out);

// Principal moments of inertia of the solid shape with uniform density.
Vec3 primitiveInertiaDiagonal(const PrimitiveGeometry& geom, double mass);

// Standalone `<sdf><model>` document for a box / sphere / cylinder spec.
// The model pose is left at identity; the spawn request carries the pose.
Status writePrimitiveModelSdf(const ospawn::config::ModelSpec& spec, std::string* sdf_xml);

}  // namespace ospawn::gazebo
