#pragma once
#include "ospawn/core/common/status.hpp"
#include "ospawn/core/math/types.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

namespace ospawn::core {

inline constexpr double kDegToRad = M_PI / 180.0;

// Fixed-axis roll-pitch-yaw (radians): R = Rz(yaw) * Ry(pitch) * Rx(roll).
Quat quatFromRpy(double roll, double pitch, double yaw);

// Same convention as `quatFromRpy`, angles in degrees unless `radians` is set.
Quat quatFromEuler(double roll, double pitch, double yaw, bool radians);

// Inverse of `quatFromRpy`; returns [roll, pitch, yaw] in radians.
Vec3 rpyFromQuat(const Quat& q);

// Builds a pose from a flat value list:
// - `quaternion == false`: [x, y, z, roll, pitch, yaw] (degrees unless `radians`)
// - `quaternion == true`:  [x, y, z, qx, qy, qz, qw], normalized on the way in
// An empty list yields the identity pose at the origin.
Status poseFromValues(const std::vector<double>& values,
                      bool quaternion,
                      bool radians,
                      Pose* out);

// Number of values `poseFromValues` expects for the given orientation encoding.
inline constexpr std::size_t poseValueCount(bool quaternion) { return quaternion ? 7 : 6; }

}  // namespace ospawn::core
