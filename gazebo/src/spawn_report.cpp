#include "ospawn/gazebo/spawner.hpp"

#include "ospawn/core/common/logger.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace ospawn::gazebo {
namespace {

using ospawn::config::modelKindToString;
using ospawn::core::LogLevel;
using ospawn::core::log;

std::string jsonEscape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          std::ostringstream oss;
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c));
          out += oss.str();
        } else {
          out += c;
        }
    }
  }
  return out;
}

}  // namespace

Status writeSpawnReportJson(const SpawnReport& report, const std::string& json_path) {
  std::ofstream out(json_path);
  if (!out) {
    log(LogLevel::Error, "writeSpawnReportJson: failed to open output file: " + json_path);
    return Status::Failure;
  }

  out << "{\n";
  out << "  \"spawned\": " << report.succeeded() << ",\n";
  out << "  \"failed\": " << report.failed() << ",\n";
  out << "  \"models\": [\n";
  for (std::size_t i = 0; i < report.outcomes.size(); ++i) {
    const SpawnOutcome& o = report.outcomes[i];
    out << "    {\n";
    out << "      \"unique_name\": \"" << jsonEscape(o.unique_name) << "\",\n";
    out << "      \"name\": \"" << jsonEscape(o.name) << "\",\n";
    out << "      \"type\": \"" << modelKindToString(o.kind) << "\",\n";
    out << "      \"success\": " << (o.succeeded() ? "true" : "false") << ",\n";
    out << "      \"status\": \"" << ospawn::core::statusToString(o.status) << "\",\n";
    out << "      \"message\": \"" << jsonEscape(o.message) << "\"\n";
    out << "    }" << (i + 1 < report.outcomes.size() ? "," : "") << "\n";
  }
  out << "  ]\n";
  out << "}\n";

  out.close();
  if (!out) {
    log(LogLevel::Error, "writeSpawnReportJson: failed to write output file: " + json_path);
    return Status::Failure;
  }
  return Status::Success;
}

}  // namespace ospawn::gazebo
