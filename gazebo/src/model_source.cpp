#include "ospawn/gazebo/model_source.hpp"

#include "ospawn/core/common/logger.hpp"
#include "ospawn/gazebo/primitive_sdf.hpp"
#include "ospawn/urdf/urdf_model.hpp"

#include <sdf/Root.hh>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace ospawn::gazebo {
namespace {

namespace fs = std::filesystem;

using ospawn::config::ModelKind;
using ospawn::config::ModelSpec;
using ospawn::config::PackageLocator;
using ospawn::config::isPrimitive;
using ospawn::core::LogLevel;
using ospawn::core::log;
using ospawn::core::ok;

constexpr std::string_view kPackageScheme = "package://";

Status readFileToString(const std::string& path, std::string* out) {
  std::ifstream ifs(path);
  if (!ifs) return Status::NotFound;
  std::ostringstream oss;
  oss << ifs.rdbuf();
  *out = oss.str();
  return Status::Success;
}

std::string removeLineBreaks(std::string s) {
  s.erase(std::remove_if(s.begin(), s.end(), [](char c) { return c == '\n' || c == '\r'; }), s.end());
  return s;
}

std::string sdfErrorsToString(const sdf::Errors& errs) {
  std::ostringstream oss;
  for (const auto& e : errs) {
    oss << "- [" << static_cast<int>(e.Code()) << "] " << e.Message() << "\n";
  }
  return oss.str();
}

}  // namespace

std::string rewritePackageUris(const std::string& xml,
                               const PackageLocator& locator,
                               std::vector<std::string>* unresolved) {
  std::string out;
  out.reserve(xml.size());

  std::size_t pos = 0;
  while (true) {
    const std::size_t hit = xml.find(kPackageScheme, pos);
    if (hit == std::string::npos) {
      out.append(xml, pos, std::string::npos);
      break;
    }
    out.append(xml, pos, hit - pos);

    const std::size_t name_begin = hit + kPackageScheme.size();
    const std::size_t name_end = xml.find('/', name_begin);
    const std::size_t stop = xml.find_first_of("\"'<> \t\r\n", name_begin);
    if (name_end == std::string::npos || (stop != std::string::npos && stop < name_end) ||
        name_end == name_begin) {
      // Not a `package://<pkg>/...` URI; keep the text as is.
      out.append(kPackageScheme);
      pos = name_begin;
      continue;
    }

    const std::string package = xml.substr(name_begin, name_end - name_begin);
    std::string package_dir;
    const Status st = locator.find(package, &package_dir);
    if (ok(st)) {
      std::error_code ec;
      fs::path abs_path = fs::absolute(package_dir, ec);
      if (ec) abs_path = package_dir;
      const std::string abs_dir = abs_path.lexically_normal().string();
      out += "file://";
      out += abs_dir;
      if (abs_dir.empty() || abs_dir.back() != '/') out += '/';
    } else {
      out.append(xml, hit, name_end + 1 - hit);
      if (unresolved && std::find(unresolved->begin(), unresolved->end(), package) == unresolved->end()) {
        unresolved->push_back(package);
      }
    }
    pos = name_end + 1;
  }
  return out;
}

Status validateSdfString(const std::string& sdf_xml, std::string* message) {
  if (message) message->clear();
  if (sdf_xml.empty()) {
    if (message) *message = "SDF description is empty";
    return Status::InvalidParameter;
  }

  sdf::Root root;
  const sdf::Errors errors = root.LoadSdfString(sdf_xml);
  if (!errors.empty()) {
    if (message) *message = sdfErrorsToString(errors);
    return Status::Failure;
  }
  if (root.Model() == nullptr) {
    if (message) *message = "SDF does not contain a <model>";
    return Status::InvalidParameter;
  }
  return Status::Success;
}

Status ModelSourceResolver::modelFilePath(const ModelSpec& spec, std::string* path) const {
  if (!path) {
    log(LogLevel::Error, "ModelSourceResolver::modelFilePath: null output");
    return Status::InvalidParameter;
  }
  if (isPrimitive(spec.kind)) {
    log(LogLevel::Error, "ModelSourceResolver::modelFilePath: primitives have no model file");
    return Status::InvalidParameter;
  }

  std::string package_dir;
  const Status st = locator_.find(spec.package, &package_dir);
  if (!ok(st)) {
    log(LogLevel::Error, "Cannot find package [" + spec.package + "], check package name and that package exists");
    return st;
  }

  fs::path p = fs::path(ospawn::config::joinPackagePath(package_dir, spec.resolvedBasePath()));
  if (spec.kind == ModelKind::Sdf) {
    p /= spec.name;
    p /= "model.sdf";
  } else {
    p /= spec.name + ".urdf";
  }
  *path = p.string();
  return Status::Success;
}

Status ModelSourceResolver::resolve(const ModelSpec& spec, ModelSource* out) const {
  if (!out) {
    log(LogLevel::Error, "ModelSourceResolver::resolve: null output");
    return Status::InvalidParameter;
  }
  *out = ModelSource{};

  if (isPrimitive(spec.kind)) {
    out->format = SourceFormat::Sdf;
    const Status st = writePrimitiveModelSdf(spec, &out->xml);
    if (!ok(st)) return st;
  } else {
    if (spec.scale) {
      log(LogLevel::Warn, "Model [" + spec.name + "]: scale only applies to primitives; ignoring it");
    }

    Status st = modelFilePath(spec, &out->file_path);
    if (!ok(st)) return st;

    if (spec.kind == ModelKind::Sdf) {
      out->format = SourceFormat::Sdf;
      st = readFileToString(out->file_path, &out->xml);
      if (!ok(st)) {
        log(LogLevel::Error, "Cannot find or open model [" + spec.name + "], check model name and that model exists: " +
                                 out->file_path);
        return st;
      }
      out->xml = removeLineBreaks(std::move(out->xml));
    } else {
      out->format = SourceFormat::Urdf;
      const auto res = ospawn::urdf::loadUrdfFromFile(out->file_path, &out->xml);
      if (res.status == Status::NotFound) {
        log(LogLevel::Error, "Cannot find model [" + spec.name + "], check model name and that model exists: " +
                                 out->file_path);
        return res.status;
      }
      if (opt_.validate && !ok(res.status)) {
        log(LogLevel::Error, "Model [" + spec.name + "]: invalid URDF: " + res.message);
        return res.status;
      }
      if (ok(res.status)) {
        const auto& s = res.summary;
        log(LogLevel::Debug, "Model [" + spec.name + "]: URDF robot '" + s.robot_name + "', root link " + s.root_link +
                                 ", " + std::to_string(s.link_count) + " links, " + std::to_string(s.joint_count) +
                                 " joints");
      }
    }

    if (opt_.rewrite_package_uris) {
      std::vector<std::string> unresolved;
      out->xml = rewritePackageUris(out->xml, locator_, &unresolved);
      for (const auto& pkg : unresolved) {
        log(LogLevel::Warn, "Model [" + spec.name + "]: cannot resolve package://" + pkg + "/ URIs");
      }
    }
  }

  if (opt_.validate && out->format == SourceFormat::Sdf) {
    std::string message;
    const Status st = validateSdfString(out->xml, &message);
    if (!ok(st)) {
      log(LogLevel::Error, "Model [" + spec.name + "]: invalid SDF:\n" + message);
      return st;
    }
  }

  return Status::Success;
}

}  // namespace ospawn::gazebo
