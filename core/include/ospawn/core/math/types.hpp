#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace ospawn::core {

// Math types shared by all modules.
// - Quaternions follow Eigen's storage; when exchanged as plain values the order is [x, y, z, w].
// - Units are meters and radians unless a field says otherwise.
using Vec3 = Eigen::Vector3d;
using Mat3 = Eigen::Matrix3d;
using Quat = Eigen::Quaterniond;

struct Pose {
  Vec3 position{Vec3::Zero()};
  Quat orientation{Quat::Identity()};
};

}  // namespace ospawn::core
