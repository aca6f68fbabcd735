#pragma once

#include "ospawn/config/model_spec.hpp"
#include "ospawn/config/package_locator.hpp"
#include "ospawn/core/common/status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ospawn::gazebo {

using ospawn::core::Status;

enum class SourceFormat : std::uint8_t { Sdf = 0, Urdf = 1 };

// Model description ready to be sent to the simulator.
struct ModelSource {
  SourceFormat format{SourceFormat::Sdf};
  std::string xml;
  // File the description was read from; empty for generated primitives.
  std::string file_path;
};

struct ResolveOptions {
  // Rewrite `package://<pkg>/...` URIs to `file://` URIs for packages the locator can find.
  bool rewrite_package_uris{true};

  // Check the description (sdformat for SDF, urdfdom for URDF) before returning it.
  bool validate{true};
};

// Turns a `ModelSpec` into model text:
// - sdf:       <package>/<base_path>/<name>/model.sdf, line breaks removed
// - urdf:      <package>/<base_path>/<name>.urdf
// - primitive: generated SDF
class ModelSourceResolver {
public:
  explicit ModelSourceResolver(const ospawn::config::PackageLocator& locator, ResolveOptions opt = {})
    : locator_(locator), opt_(opt) {}

  // Path of the model file for URDF/SDF specs (package lookup only, the file need not exist).
  Status modelFilePath(const ospawn::config::ModelSpec& spec, std::string* path) const;

  Status resolve(const ospawn::config::ModelSpec& spec, ModelSource* out) const;

private:
  const ospawn::config::PackageLocator& locator_;
  ResolveOptions opt_;
};

// Replaces `package://<pkg>/` prefixes with `file://<package_dir>/`.
// Packages the locator cannot find are left untouched and reported in `unresolved` (unique).
std::string rewritePackageUris(const std::string& xml,
                               const ospawn::config::PackageLocator& locator,
                               std::vector<std::string>* unresolved = nullptr);

// Parses SDF text with sdformat; `message` receives the error list on failure.
Status validateSdfString(const std::string& sdf_xml, std::string* message);

}  // namespace ospawn::gazebo
