#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ospawn::core {

// Hands out unique names in call order.
// The first occurrence of a name is returned unchanged; the Nth repeat becomes `<name>_N`.
// If `<name>_N` is already taken (declared earlier, or produced for another base name),
// N keeps increasing until a free name is found.
class UniqueNameGenerator {
public:
  std::string next(const std::string& name);

  bool taken(const std::string& name) const { return used_.count(name) != 0; }
  void clear();

private:
  std::unordered_map<std::string, int> repeat_count_;
  std::unordered_set<std::string> used_;
};

// Applies `UniqueNameGenerator` to a whole list; output order matches input order.
std::vector<std::string> renameDuplicates(const std::vector<std::string>& names);

}  // namespace ospawn::core
