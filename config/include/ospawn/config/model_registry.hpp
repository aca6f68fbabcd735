#pragma once

#include "ospawn/config/model_spec.hpp"
#include "ospawn/core/naming/unique_names.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ospawn::config {

// Ordered set of models keyed by a unique name.
// Keys are assigned on registration from the declared `unique_name` (or `name` when none is declared),
// with `_N` suffixes for repeats. Iteration follows registration order.
class ModelRegistry {
public:
  // Assigns `spec.unique_name` and stores the model. Fails only for structurally invalid specs.
  Status registerModel(ModelSpec spec, std::string* assigned_name = nullptr);

  const ModelSpec* find(const std::string& unique_name) const;
  bool contains(const std::string& unique_name) const { return find(unique_name) != nullptr; }

  const std::vector<ModelSpec>& models() const { return models_; }
  std::vector<std::string> uniqueNames() const;

  std::size_t size() const { return models_.size(); }
  bool empty() const { return models_.empty(); }
  void clear();

private:
  std::vector<ModelSpec> models_;
  ospawn::core::UniqueNameGenerator names_;
};

}  // namespace ospawn::config
