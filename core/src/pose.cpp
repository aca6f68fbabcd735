// Pose conversion.
// Euler angles use the static X-Y-Z (roll, pitch, yaw) convention shared by URDF `rpy` and SDF `<pose>`.
#include "ospawn/core/math/pose.hpp"

#include "ospawn/core/common/logger.hpp"

#include <cmath>
#include <string>

namespace ospawn::core {

Quat quatFromRpy(double roll, double pitch, double yaw) {
  const Eigen::AngleAxisd Rx(roll, Vec3::UnitX());
  const Eigen::AngleAxisd Ry(pitch, Vec3::UnitY());
  const Eigen::AngleAxisd Rz(yaw, Vec3::UnitZ());
  Quat q = Rz * Ry * Rx;
  q.normalize();
  return q;
}

Quat quatFromEuler(double roll, double pitch, double yaw, bool radians) {
  if (!radians) {
    roll *= kDegToRad;
    pitch *= kDegToRad;
    yaw *= kDegToRad;
  }
  return quatFromRpy(roll, pitch, yaw);
}

Vec3 rpyFromQuat(const Quat& q) {
  const Mat3 R = q.normalized().toRotationMatrix();
  const double sy = std::sqrt(R(0, 0) * R(0, 0) + R(1, 0) * R(1, 0));

  const double pitch = std::atan2(-R(2, 0), sy);
  if (sy < 1e-12) {
    // Gimbal lock: roll is folded into yaw.
    return Vec3(0.0, pitch, std::atan2(-R(0, 1), R(1, 1)));
  }
  return Vec3(std::atan2(R(2, 1), R(2, 2)), pitch, std::atan2(R(1, 0), R(0, 0)));
}

Status poseFromValues(const std::vector<double>& values,
                      bool quaternion,
                      bool radians,
                      Pose* out) {
  if (!out) {
    log(LogLevel::Error, "poseFromValues: null output");
    return Status::InvalidParameter;
  }
  *out = Pose{};
  if (values.empty()) return Status::Success;

  const std::size_t expected = poseValueCount(quaternion);
  if (values.size() != expected) {
    log(LogLevel::Error, "poseFromValues: expected " + std::to_string(expected) + " values (" +
                             (quaternion ? "x y z qx qy qz qw" : "x y z roll pitch yaw") + "), got " +
                             std::to_string(values.size()));
    return Status::InvalidParameter;
  }
  for (double v : values) {
    if (!std::isfinite(v)) {
      log(LogLevel::Error, "poseFromValues: NaN/Inf in pose");
      return Status::InvalidParameter;
    }
  }

  out->position = Vec3(values[0], values[1], values[2]);

  if (quaternion) {
    // Eigen's constructor takes (w, x, y, z).
    Quat q(values[6], values[3], values[4], values[5]);
    if (q.norm() < 1e-12) {
      log(LogLevel::Error, "poseFromValues: quaternion has zero norm");
      return Status::InvalidParameter;
    }
    q.normalize();
    out->orientation = q;
  } else {
    out->orientation = quatFromEuler(values[3], values[4], values[5], radians);
  }
  return Status::Success;
}

}  // namespace ospawn::core
