#include "ospawn/config/model_registry.hpp"

#include "ospawn/core/common/logger.hpp"

#include <utility>

namespace ospawn::config {

using ospawn::core::LogLevel;
using ospawn::core::log;
using ospawn::core::ok;

Status ModelRegistry::registerModel(ModelSpec spec, std::string* assigned_name) {
  std::string message;
  const Status st = validateModelSpec(spec, &message);
  if (!ok(st)) {
    log(LogLevel::Error, "ModelRegistry::registerModel: '" + spec.name + "': " + message);
    return st;
  }

  const std::string declared = spec.unique_name_declared ? spec.unique_name : spec.name;
  spec.unique_name = names_.next(declared);
  if (spec.unique_name != declared) {
    log(LogLevel::Debug, "ModelRegistry: renamed duplicate '" + declared + "' to '" + spec.unique_name + "'");
  }

  if (assigned_name) *assigned_name = spec.unique_name;
  models_.push_back(std::move(spec));
  return Status::Success;
}

const ModelSpec* ModelRegistry::find(const std::string& unique_name) const {
  for (const auto& m : models_) {
    if (m.unique_name == unique_name) return &m;
  }
  return nullptr;
}

std::vector<std::string> ModelRegistry::uniqueNames() const {
  std::vector<std::string> out;
  out.reserve(models_.size());
  for (const auto& m : models_) out.push_back(m.unique_name);
  return out;
}

void ModelRegistry::clear() {
  models_.clear();
  names_.clear();
}

}  // namespace ospawn::config
