#include "ospawn/core/naming/unique_names.hpp"

namespace ospawn::core {

std::string UniqueNameGenerator::next(const std::string& name) {
  auto it = repeat_count_.find(name);
  if (it == repeat_count_.end()) {
    it = repeat_count_.emplace(name, 0).first;
    if (used_.insert(name).second) return name;
  }

  int n = it->second;
  std::string candidate;
  do {
    ++n;
    candidate = name + "_" + std::to_string(n);
  } while (used_.count(candidate) != 0);

  it->second = n;
  used_.insert(candidate);
  return candidate;
}

void UniqueNameGenerator::clear() {
  repeat_count_.clear();
  used_.clear();
}

std::vector<std::string> renameDuplicates(const std::vector<std::string>& names) {
  UniqueNameGenerator gen;
  std::vector<std::string> out;
  out.reserve(names.size());
  for (const auto& name : names) out.push_back(gen.next(name));
  return out;
}

}  // namespace ospawn::core
