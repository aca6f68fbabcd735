#include "ospawn/urdf/urdf_model.hpp"

#include "ospawn/core/common/logger.hpp"

#include <fstream>
#include <sstream>

#include <urdf_model/model.h>
#include <urdf_parser/urdf_parser.h>

namespace ospawn::urdf {
using namespace ospawn::core;

static Status readFileToString(const std::string& path, std::string* out) {
  if (!out) return Status::InvalidParameter;
  std::ifstream ifs(path);
  if (!ifs) return Status::NotFound;
  std::ostringstream oss;
  oss << ifs.rdbuf();
  *out = oss.str();
  return Status::Success;
}

static LoadResult fail(Status st, std::string msg) {
  LoadResult r;
  r.status = st;
  r.message = std::move(msg);
  log(LogLevel::Error, r.message);
  return r;
}

LoadResult loadUrdfFromString(const std::string& urdf_xml) {
  if (urdf_xml.empty()) {
    return fail(Status::InvalidParameter, "URDF description is empty");
  }

  ::urdf::ModelInterfaceSharedPtr model = ::urdf::parseURDF(urdf_xml);
  if (!model) {
    return fail(Status::Failure, "urdf::parseURDF failed");
  }

  ::urdf::LinkConstSharedPtr root = model->getRoot();
  if (!root) {
    return fail(Status::InvalidParameter, "URDF has no root link: " + model->getName());
  }

  LoadResult res;
  UrdfSummary& s = res.summary;
  s.robot_name = model->getName();
  s.root_link = root->name;
  s.link_count = model->links_.size();
  s.joint_count = model->joints_.size();

  std::vector<::urdf::LinkSharedPtr> links;
  model->getLinks(links);
  for (const auto& link : links) {
    if (!link) continue;
    if (!link->inertial && link->name != s.root_link) {
      s.links_without_inertial.push_back(link->name);
    }
  }

  if (!s.links_without_inertial.empty()) {
    std::ostringstream oss;
    oss << "URDF '" << s.robot_name << "': " << s.links_without_inertial.size()
        << " non-root link(s) without <inertial> will be dropped by the simulator:";
    for (const auto& name : s.links_without_inertial) oss << " " << name;
    log(LogLevel::Warn, oss.str());
  }

  res.status = Status::Success;
  res.message = "OK";
  return res;
}

LoadResult loadUrdfFromFile(const std::string& urdf_path, std::string* urdf_xml) {
  std::string xml;
  const Status st = readFileToString(urdf_path, &xml);
  if (!ok(st)) {
    return fail(st, "Failed to open URDF file: " + urdf_path);
  }
  LoadResult res = loadUrdfFromString(xml);
  if (urdf_xml) *urdf_xml = std::move(xml);
  return res;
}

}  // namespace ospawn::urdf
