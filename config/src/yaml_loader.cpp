#include "ospawn/config/yaml_loader.hpp"

#include "ospawn/core/common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ospawn::config {

using ospawn::core::LogLevel;
using ospawn::core::log;
using ospawn::core::ok;
using ospawn::core::shouldLog;

namespace {

const std::unordered_set<std::string>& knownKeys() {
  static const std::unordered_set<std::string> keys{
    "name", "type", "package", "base_path", "unique_name", "quaternion", "radians",
    "pose", "scale", "static", "mass", "color"};
  return keys;
}

LoadResult fail(Status st, std::string msg) {
  LoadResult r;
  r.status = st;
  r.message = std::move(msg);
  log(LogLevel::Error, r.message);
  return r;
}

std::string entryLabel(std::size_t index, const std::string& name) {
  std::ostringstream oss;
  oss << "models[" << index << "]";
  if (!name.empty()) oss << " '" << name << "'";
  return oss.str();
}

// A null value ("name:" or "name: ~") would otherwise convert to the string "null".
Status readString(const YAML::Node& node, const char* key, std::string* out, std::string* err) {
  const YAML::Node value = node[key];
  if (!value.IsScalar()) {
    *err = std::string("'") + key + "' must be a string";
    return Status::InvalidParameter;
  }
  *out = value.as<std::string>();
  return Status::Success;
}

// yaml-cpp reports conversion problems by throwing; keep that local to one entry.
Status parseEntry(const YAML::Node& node, std::size_t index, ModelSpec* out, std::string* err) {
  *out = ModelSpec{};
  out->source_index = index;

  if (!node.IsMap()) {
    *err = "entry is not a map";
    return Status::InvalidParameter;
  }

  std::string current_key;
  try {
    for (const auto& kv : node) {
      const std::string key = kv.first.as<std::string>();
      if (knownKeys().count(key) == 0) {
        log(LogLevel::Warn, entryLabel(index, {}) + ": ignoring unknown key '" + key + "'");
      }
    }

    current_key = "name";
    if (!node["name"]) {
      *err = "missing 'name'";
      return Status::InvalidParameter;
    }
    Status st = readString(node, "name", &out->name, err);
    if (!ok(st)) return st;

    current_key = "type";
    if (!node["type"]) {
      *err = "missing 'type'";
      return Status::InvalidParameter;
    }
    std::string type;
    st = readString(node, "type", &type, err);
    if (!ok(st)) return st;
    if (!ok(modelKindFromString(type, &out->kind))) {
      *err = "unknown type '" + type + "' (expected box, sphere, cylinder, urdf or sdf)";
      return Status::InvalidParameter;
    }

    current_key = "package";
    if (node["package"]) {
      st = readString(node, "package", &out->package, err);
      if (!ok(st)) return st;
    }

    current_key = "base_path";
    if (node["base_path"]) {
      st = readString(node, "base_path", &out->base_path, err);
      if (!ok(st)) return st;
    }

    current_key = "unique_name";
    if (node["unique_name"] && !node["unique_name"].IsNull()) {
      out->unique_name = node["unique_name"].as<std::string>();
      out->unique_name_declared = true;
    }

    current_key = "quaternion";
    if (node["quaternion"]) out->quaternion = node["quaternion"].as<bool>();

    current_key = "radians";
    if (node["radians"]) out->radians = node["radians"].as<bool>();

    current_key = "pose";
    if (node["pose"] && !node["pose"].IsNull()) {
      out->pose = node["pose"].as<std::vector<double>>();
    }

    current_key = "scale";
    if (node["scale"] && !node["scale"].IsNull()) {
      const YAML::Node s = node["scale"];
      if (s.IsScalar()) {
        const double v = s.as<double>();
        out->scale = Vec3(v, v, v);
      } else {
        const auto v = s.as<std::vector<double>>();
        if (v.size() != 3) {
          *err = "scale expects 3 values (depth, width, height), got " + std::to_string(v.size());
          return Status::InvalidParameter;
        }
        out->scale = Vec3(v[0], v[1], v[2]);
      }
    }

    current_key = "static";
    if (node["static"]) out->is_static = node["static"].as<bool>();

    current_key = "mass";
    if (node["mass"]) out->mass = node["mass"].as<double>();

    current_key = "color";
    if (node["color"] && !node["color"].IsNull()) {
      const auto v = node["color"].as<std::vector<double>>();
      if (v.size() != 3 && v.size() != 4) {
        *err = "color expects 3 or 4 values (r, g, b[, a])";
        return Status::InvalidParameter;
      }
      out->color = std::array<double, 4>{v[0], v[1], v[2], v.size() == 4 ? v[3] : 1.0};
    }
  } catch (const YAML::Exception& e) {
    *err = "invalid value for '" + current_key + "': " + e.what();
    return Status::InvalidParameter;
  }

  return validateModelSpec(*out, err);
}

LoadResult loadFromRoot(const YAML::Node& root) {
  if (!root || !root.IsMap() || !root["models"]) {
    return fail(Status::InvalidParameter, "loadModels: missing top-level 'models' list");
  }
  const YAML::Node models = root["models"];
  if (!models.IsSequence()) {
    return fail(Status::InvalidParameter, "loadModels: 'models' is not a list");
  }

  LoadResult r;
  r.entries = models.size();
  for (std::size_t i = 0; i < models.size(); ++i) {
    ModelSpec spec;
    std::string err;
    const Status st = parseEntry(models[i], i, &spec, &err);
    if (!ok(st)) {
      log(LogLevel::Error, entryLabel(i, spec.name) + ": " + err + "; skipping");
      ++r.skipped;
      continue;
    }
    if (!ok(r.registry.registerModel(std::move(spec)))) {
      ++r.skipped;
    }
  }

  if (r.registry.empty() && r.entries > 0) {
    r.status = Status::Failure;
    r.message = "loadModels: none of the " + std::to_string(r.entries) + " entries could be loaded";
    log(LogLevel::Error, r.message);
    return r;
  }
  if (r.entries == 0) {
    log(LogLevel::Warn, "loadModels: 'models' list is empty");
  }

  if (shouldLog(LogLevel::Info)) {
    std::ostringstream oss;
    oss << "List of model names: [";
    const auto names = r.registry.uniqueNames();
    for (std::size_t i = 0; i < names.size(); ++i) {
      oss << (i ? ", " : "") << names[i];
    }
    oss << "]";
    log(LogLevel::Info, oss.str());
  }
  log(LogLevel::Debug, "Total number of models: " + std::to_string(r.registry.size()));

  r.status = Status::Success;
  return r;
}

}  // namespace

LoadResult loadModelsFromFile(const std::string& yaml_path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(yaml_path, ec)) {
    return fail(Status::NotFound, "loadModelsFromFile: cannot open config file: " + yaml_path);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(yaml_path);
  } catch (const YAML::Exception& e) {
    return fail(Status::Failure, "loadModelsFromFile: " + yaml_path + ": " + e.what());
  }
  return loadFromRoot(root);
}

LoadResult loadModelsFromString(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    return fail(Status::Failure, std::string("loadModelsFromString: ") + e.what());
  }
  return loadFromRoot(root);
}

}  // namespace ospawn::config
