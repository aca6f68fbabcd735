#include "ospawn/gazebo/primitive_sdf.hpp"

#include "ospawn/core/common/logger.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace ospawn::gazebo {
namespace {

using ospawn::config::ModelKind;
using ospawn::config::ModelSpec;
using ospawn::config::isPrimitive;
using ospawn::config::modelKindToString;
using ospawn::core::LogLevel;
using ospawn::core::log;
using ospawn::core::ok;

std::string xmlEscape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '\"': out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default: out += c; break;
    }
  }
  return out;
}

void writeGeometry(std::ostream& os, const PrimitiveGeometry& g) {
  os << "        <geometry>\n";
  switch (g.kind) {
    case ModelKind::Box:
      os << "          <box><size>" << g.box_size.x() << " " << g.box_size.y() << " " << g.box_size.z()
         << "</size></box>\n";
      break;
    case ModelKind::Sphere:
      os << "          <sphere><radius>" << g.radius << "</radius></sphere>\n";
      break;
    case ModelKind::Cylinder:
      os << "          <cylinder><radius>" << g.radius << "</radius><length>" << g.length
         << "</length></cylinder>\n";
      break;
    default:
      break;
  }
  os << "        </geometry>\n";
}

void writeInertial(std::ostream& os, double mass, const Vec3& diag) {
  os << "      <inertial>\n";
  os << "        <mass>" << mass << "</mass>\n";
  os << "        <inertia>\n";
  os << "          <ixx>" << diag.x() << "</ixx><ixy>0</ixy><ixz>0</ixz>\n";
  os << "          <iyy>" << diag.y() << "</iyy><iyz>0</iyz>\n";
  os << "          <izz>" << diag.z() << "</izz>\n";
  os << "        </inertia>\n";
  os << "      </inertial>\n";
}

}  // namespace

Status primitiveGeometryFromSpec(const ModelSpec& spec, PrimitiveGeometry* out) {
  if (!out) {
    log(LogLevel::Error, "primitiveGeometryFromSpec: null output");
    return Status::InvalidParameter;
  }
  if (!isPrimitive(spec.kind)) {
    log(LogLevel::Error, std::string("primitiveGeometryFromSpec: not a primitive: ") + modelKindToString(spec.kind));
    return Status::InvalidParameter;
  }

  const Vec3 s = spec.scale ? *spec.scale : Vec3::Ones();
  if (!s.allFinite() || !(s.minCoeff() > 0.0)) {
    log(LogLevel::Error, "primitiveGeometryFromSpec: scale values must be > 0");
    return Status::InvalidParameter;
  }

  PrimitiveGeometry g;
  g.kind = spec.kind;
  g.box_size = s;
  g.radius = 0.5 * s.x();
  g.length = s.z();
  *out = g;
  return Status::Success;
}

Vec3 primitiveInertiaDiagonal(const PrimitiveGeometry& g, double mass) {
  switch (g.kind) {
    case ModelKind::Box: {
      const double x2 = g.box_size.x() * g.box_size.x();
      const double y2 = g.box_size.y() * g.box_size.y();
      const double z2 = g.box_size.z() * g.box_size.z();
      return (mass / 12.0) * Vec3(y2 + z2, x2 + z2, x2 + y2);
    }
    case ModelKind::Sphere: {
      const double i = 0.4 * mass * g.radius * g.radius;
      return Vec3(i, i, i);
    }
    case ModelKind::Cylinder: {
      const double r2 = g.radius * g.radius;
      const double ixx = mass * (3.0 * r2 + g.length * g.length) / 12.0;
      return Vec3(ixx, ixx, 0.5 * mass * r2);
    }
    default:
      break;
  }
  return Vec3::Zero();
}

Status writePrimitiveModelSdf(const ModelSpec& spec, std::string* sdf_xml) {
  if (!sdf_xml) {
    log(LogLevel::Error, "writePrimitiveModelSdf: null output");
    return Status::InvalidParameter;
  }

  PrimitiveGeometry geom;
  const Status st = primitiveGeometryFromSpec(spec, &geom);
  if (!ok(st)) return st;

  if (!(spec.mass > 0.0)) {
    log(LogLevel::Error, "writePrimitiveModelSdf: mass must be > 0");
    return Status::InvalidParameter;
  }

  const std::string& model_name = spec.unique_name.empty() ? spec.name : spec.unique_name;
  const std::array<double, 4> rgba = spec.color ? *spec.color : std::array<double, 4>{0.7, 0.7, 0.7, 1.0};

  std::ostringstream out;
  out << std::setprecision(17);
  out << "<?xml version=\"1.0\"?>\n";
  out << "<sdf version=\"1.7\">\n";
  out << "  <model name=\"" << xmlEscape(model_name) << "\">\n";
  out << "    <static>" << (spec.is_static ? "true" : "false") << "</static>\n";
  out << "    <link name=\"link\">\n";
  writeInertial(out, spec.mass, primitiveInertiaDiagonal(geom, spec.mass));
  out << "      <collision name=\"collision\">\n";
  writeGeometry(out, geom);
  out << "      </collision>\n";
  out << "      <visual name=\"visual\">\n";
  writeGeometry(out, geom);
  out << "        <material>\n";
  out << "          <ambient>" << rgba[0] << " " << rgba[1] << " " << rgba[2] << " " << rgba[3] << "</ambient>\n";
  out << "          <diffuse>" << rgba[0] << " " << rgba[1] << " " << rgba[2] << " " << rgba[3] << "</diffuse>\n";
  out << "        </material>\n";
  out << "      </visual>\n";
  out << "    </link>\n";
  out << "  </model>\n";
  out << "</sdf>\n";

  *sdf_xml = out.str();
  return Status::Success;
}

}  // namespace ospawn::gazebo
