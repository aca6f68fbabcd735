#include <algorithm>
#include <array>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "ospawn/config/package_locator.hpp"
#include "ospawn/config/yaml_loader.hpp"
#include "ospawn/core/common/logger.hpp"
#include "ospawn/core/common/status.hpp"
#include "ospawn/gazebo/model_source.hpp"
#include "ospawn/gazebo/primitive_sdf.hpp"
#include "ospawn/gazebo/spawn_service.hpp"
#include "ospawn/gazebo/spawner.hpp"

namespace fs = std::filesystem;

using ospawn::config::ModelKind;
using ospawn::config::ModelSpec;
using ospawn::config::PackageLocator;
using ospawn::config::loadModelsFromString;
using ospawn::core::LogLevel;
using ospawn::core::ScopedLogSink;
using ospawn::core::Status;
using ospawn::core::Vec3;
using ospawn::core::ok;
using ospawn::gazebo::ModelSource;
using ospawn::gazebo::ModelSourceResolver;
using ospawn::gazebo::ObjectSpawner;
using ospawn::gazebo::PrimitiveGeometry;
using ospawn::gazebo::SourceFormat;
using ospawn::gazebo::SpawnReport;
using ospawn::gazebo::SpawnRequest;
using ospawn::gazebo::SpawnResponse;
using ospawn::gazebo::SpawnService;
using ospawn::gazebo::SpawnerOptions;

static std::vector<std::string> g_errors;
static void captureSink(LogLevel level, const std::string& msg) {
  if (level == LogLevel::Error) g_errors.push_back(msg);
}

static std::vector<std::string> g_debug;
static void debugSink(LogLevel level, const std::string& msg) {
  if (level == LogLevel::Debug) g_debug.push_back(msg);
}

static std::string slurp(const std::string& path) {
  std::ifstream in(path);
  assert(in && "failed to open file");
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return s;
}

static bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

class FakeSpawnService final : public SpawnService {
public:
  std::string serviceName() const override { return "/world/test/create"; }

  Status waitForService(double timeout_s) override {
    ++wait_calls;
    last_timeout = timeout_s;
    return available ? Status::Success : Status::Timeout;
  }

  Status spawn(const SpawnRequest& request, SpawnResponse* response) override {
    requests.push_back(request);
    request_times.push_back(std::chrono::steady_clock::now());
    if (transport_failures.count(request.name)) return Status::Timeout;
    response->success = rejected.count(request.name) == 0;
    response->status_message = response->success ? "SpawnModel: Successfully spawned entity"
                                                 : "SpawnModel: Failure - entity already exists.";
    return Status::Success;
  }

  bool available{true};
  std::set<std::string> rejected;
  std::set<std::string> transport_failures;
  int wait_calls{0};
  double last_timeout{0.0};
  std::vector<SpawnRequest> requests;
  std::vector<std::chrono::steady_clock::time_point> request_times;
};

// <root>/demo_models/{models/crate/model.sdf, urdf/cart.urdf, meshes/}
struct TestPackage {
  fs::path root;
  fs::path package_dir;

  TestPackage() {
    root = fs::temp_directory_path() / "ospawn_gazebo_test_pkgs";
    fs::remove_all(root);
    package_dir = root / "demo_models";
    fs::create_directories(package_dir / "models" / "crate");
    fs::create_directories(package_dir / "urdf");
    fs::create_directories(package_dir / "meshes");

    std::ofstream sdf(package_dir / "models" / "crate" / "model.sdf");
    sdf << "<?xml version=\"1.0\"?>\n"
        << "<sdf version=\"1.7\">\n"
        << "  <model name=\"crate\">\n"
        << "    <static>true</static>\n"
        << "    <link name=\"link\">\n"
        << "      <visual name=\"visual\">\n"
        << "        <geometry><box><size>0.4 0.4 0.4</size></box></geometry>\n"
        << "      </visual>\n"
        << "    </link>\n"
        << "  </model>\n"
        << "</sdf>\n";

    std::ofstream urdf(package_dir / "urdf" / "cart.urdf");
    urdf << "<robot name=\"cart\">\n"
         << "  <link name=\"base_link\">\n"
         << "    <inertial><mass value=\"1\"/>"
         << "<inertia ixx=\"0.1\" ixy=\"0\" ixz=\"0\" iyy=\"0.1\" iyz=\"0\" izz=\"0.1\"/></inertial>\n"
         << "    <visual><geometry><mesh filename=\"package://demo_models/meshes/cart.dae\"/></geometry></visual>\n"
         << "  </link>\n"
         << "</robot>\n";

    std::ofstream broken(package_dir / "urdf" / "broken.urdf");
    broken << "<robot name=\"broken\"><link name=\"a\">\n";
  }

  ~TestPackage() { fs::remove_all(root); }

  PackageLocator locator() const {
    PackageLocator l;
    l.addRoot(root.string());
    return l;
  }
};

static ModelSpec primitive(const std::string& name, ModelKind kind) {
  ModelSpec s;
  s.name = name;
  s.unique_name = name;
  s.kind = kind;
  return s;
}

static void test_primitive_geometry_and_sdf() {
  ModelSpec box = primitive("crate_box", ModelKind::Box);
  box.scale = Vec3(0.2, 0.4, 0.6);
  box.mass = 3.0;
  box.is_static = true;
  box.color = std::array<double, 4>{1.0, 0.0, 0.0, 1.0};

  PrimitiveGeometry g;
  assert(ok(ospawn::gazebo::primitiveGeometryFromSpec(box, &g)));
  const Vec3 inertia = ospawn::gazebo::primitiveInertiaDiagonal(g, 3.0);
  assert(std::abs(inertia.x() - 3.0 / 12.0 * (0.16 + 0.36)) < 1e-12);
  assert(std::abs(inertia.z() - 3.0 / 12.0 * (0.04 + 0.16)) < 1e-12);

  std::string xml;
  assert(ok(ospawn::gazebo::writePrimitiveModelSdf(box, &xml)));
  assert(contains(xml, "<model name=\"crate_box\">"));
  assert(contains(xml, "<static>true</static>"));
  assert(contains(xml, "<mass>3</mass>"));
  assert(contains(xml, "<ambient>1 0 0 1</ambient>"));
  std::string message;
  assert(ok(ospawn::gazebo::validateSdfString(xml, &message)));

  // Sphere: diameter from depth; default scale is a unit diameter.
  ModelSpec ball = primitive("ball", ModelKind::Sphere);
  assert(ok(ospawn::gazebo::primitiveGeometryFromSpec(ball, &g)));
  assert(std::abs(g.radius - 0.5) < 1e-12);
  const Vec3 ball_inertia = ospawn::gazebo::primitiveInertiaDiagonal(g, 1.0);
  assert(std::abs(ball_inertia.x() - 0.1) < 1e-12);
  assert(ok(ospawn::gazebo::writePrimitiveModelSdf(ball, &xml)));
  assert(contains(xml, "<sphere><radius>0.5</radius></sphere>"));
  assert(contains(xml, "<static>false</static>"));
  assert(ok(ospawn::gazebo::validateSdfString(xml, &message)));

  // Cylinder: radius from depth, length from height.
  ModelSpec pillar = primitive("pillar", ModelKind::Cylinder);
  pillar.scale = Vec3(0.5, 0.5, 2.0);
  assert(ok(ospawn::gazebo::writePrimitiveModelSdf(pillar, &xml)));
  assert(contains(xml, "<cylinder><radius>0.25</radius><length>2</length></cylinder>"));
  assert(ok(ospawn::gazebo::validateSdfString(xml, &message)));

  // Names are escaped.
  ModelSpec odd = primitive("a<b>&\"c\"", ModelKind::Box);
  assert(ok(ospawn::gazebo::writePrimitiveModelSdf(odd, &xml)));
  assert(contains(xml, "a&lt;b&gt;&amp;&quot;c&quot;"));

  ScopedLogSink sink(&captureSink, LogLevel::Error);
  ModelSpec urdf = primitive("cart", ModelKind::Urdf);
  assert(ospawn::gazebo::writePrimitiveModelSdf(urdf, &xml) == Status::InvalidParameter);
}

static void test_validate_sdf_string() {
  std::string message;
  assert(ospawn::gazebo::validateSdfString("", &message) == Status::InvalidParameter);
  assert(ospawn::gazebo::validateSdfString("<sdf version=\"1.7\"><model name=\"m\">", &message) == Status::Failure);
  assert(!message.empty());
}

static void test_rewrite_package_uris() {
  TestPackage pkg;
  const PackageLocator locator = pkg.locator();

  std::vector<std::string> unresolved;
  const std::string in =
    "<uri>package://demo_models/meshes/a.dae</uri>"
    "<uri>package://ghost_pkg/meshes/b.dae</uri>"
    "<uri>package://ghost_pkg/meshes/c.dae</uri>"
    "<uri>model://crate/meshes/d.dae</uri>"
    "<uri>package://</uri>";
  const std::string out = ospawn::gazebo::rewritePackageUris(in, locator, &unresolved);

  const std::string abs_pkg = fs::absolute(pkg.package_dir).lexically_normal().string();
  assert(contains(out, "<uri>file://" + abs_pkg + "/meshes/a.dae</uri>"));
  assert(contains(out, "<uri>package://ghost_pkg/meshes/b.dae</uri>"));
  assert(contains(out, "<uri>model://crate/meshes/d.dae</uri>"));
  assert(contains(out, "<uri>package://</uri>"));
  assert(unresolved.size() == 1);
  assert(unresolved[0] == "ghost_pkg");

  // Nothing to rewrite.
  assert(ospawn::gazebo::rewritePackageUris("<sdf/>", locator) == "<sdf/>");
}

static void test_resolve_sdf_and_urdf_models() {
  TestPackage pkg;
  const PackageLocator locator = pkg.locator();
  const ModelSourceResolver resolver(locator);

  ModelSpec crate;
  crate.name = "crate";
  crate.kind = ModelKind::Sdf;
  crate.package = "demo_models";

  ModelSource src;
  assert(ok(resolver.resolve(crate, &src)));
  assert(src.format == SourceFormat::Sdf);
  assert(fs::equivalent(src.file_path, pkg.package_dir / "models" / "crate" / "model.sdf"));
  assert(src.xml.find('\n') == std::string::npos);
  assert(contains(src.xml, "<model name=\"crate\">"));

  ModelSpec cart;
  cart.name = "cart";
  cart.kind = ModelKind::Urdf;
  cart.package = "demo_models";
  {
    ScopedLogSink sink(&debugSink, LogLevel::Debug);
    g_debug.clear();
    assert(ok(resolver.resolve(cart, &src)));
    const bool described = std::any_of(g_debug.begin(), g_debug.end(), [](const std::string& m) {
      return contains(m, "URDF robot 'cart', root link base_link, 1 links, 0 joints");
    });
    assert(described);
  }
  assert(src.format == SourceFormat::Urdf);
  assert(fs::equivalent(src.file_path, pkg.package_dir / "urdf" / "cart.urdf"));
  assert(contains(src.xml, "<robot name=\"cart\">"));
  assert(contains(src.xml, "file://"));
  assert(!contains(src.xml, "package://"));

  // Custom base path.
  std::string path;
  cart.base_path = "robots";
  assert(ok(resolver.modelFilePath(cart, &path)));
  assert(fs::path(path) == pkg.package_dir / "robots" / "cart.urdf");
}

static void test_resolve_errors() {
  TestPackage pkg;
  const PackageLocator locator = pkg.locator();
  const ModelSourceResolver resolver(locator);
  ScopedLogSink sink(&captureSink, LogLevel::Error);
  g_errors.clear();

  ModelSource src;

  ModelSpec missing_pkg;
  missing_pkg.name = "crate";
  missing_pkg.kind = ModelKind::Sdf;
  missing_pkg.package = "no_such_pkg";
  assert(resolver.resolve(missing_pkg, &src) == Status::NotFound);
  assert(contains(g_errors.back(), "Cannot find package [no_such_pkg]"));

  ModelSpec missing_model = missing_pkg;
  missing_model.package = "demo_models";
  missing_model.name = "barrel";
  assert(resolver.resolve(missing_model, &src) == Status::NotFound);
  assert(contains(g_errors.back(), "barrel"));

  ModelSpec broken;
  broken.name = "broken";
  broken.kind = ModelKind::Urdf;
  broken.package = "demo_models";
  assert(!ok(resolver.resolve(broken, &src)));

  // Without validation the text is passed through.
  ospawn::gazebo::ResolveOptions no_validate;
  no_validate.validate = false;
  const ModelSourceResolver lenient(locator, no_validate);
  assert(ok(lenient.resolve(broken, &src)));
  assert(contains(src.xml, "broken"));
}

static void test_spawn_batch_continues_after_failures() {
  TestPackage pkg;
  const PackageLocator locator = pkg.locator();
  ScopedLogSink sink(&captureSink, LogLevel::Error);
  g_errors.clear();

  const std::string yaml = R"(
models:
  - {name: cube, type: box, pose: [1, 2, 3, 0, 0, 90]}
  - {name: crate, type: sdf, package: demo_models, pose: [0, 0, 0, 0, 0, 0, 1], quaternion: true}
  - {name: crate, type: sdf, package: no_such_pkg}
  - {name: cube, type: box}
  - {name: cart, type: urdf, package: demo_models, radians: true, pose: [0, 0, 0, 3.141592653589793, 0, 0]}
  - {name: ball, type: sphere}
)";
  auto loaded = loadModelsFromString(yaml);
  assert(ok(loaded.status));
  assert(loaded.registry.size() == 6);

  FakeSpawnService service;
  service.rejected.insert("cube_1");
  service.transport_failures.insert("ball");

  SpawnerOptions opt;
  opt.time_interval = 0.0;
  opt.service_timeout = 2.5;
  ObjectSpawner spawner(&service, locator, opt);

  const SpawnReport report = spawner.spawnAll(loaded.registry);
  assert(report.outcomes.size() == 6);

  const std::vector<std::string> order{"cube", "crate", "crate_1", "cube_1", "cart", "ball"};
  for (std::size_t i = 0; i < order.size(); ++i) {
    assert(report.outcomes[i].unique_name == order[i]);
  }
  assert(report.outcomes[0].succeeded());
  assert(report.outcomes[1].succeeded());
  assert(report.outcomes[2].status == Status::NotFound);  // package missing, never sent
  assert(report.outcomes[3].status == Status::Failure);   // rejected by the simulator
  assert(report.outcomes[4].succeeded());
  assert(report.outcomes[5].status == Status::Timeout);   // no reply
  assert(report.succeeded() == 3);
  assert(report.failed() == 3);
  assert(!report.allSucceeded());

  // Five requests reached the service; each waited with the configured bound.
  assert(service.requests.size() == 5);
  assert(service.wait_calls == 5);
  assert(std::abs(service.last_timeout - 2.5) < 1e-12);

  const SpawnRequest& cube = service.requests[0];
  assert(cube.name == "cube");
  assert(cube.reference_frame == "world");
  assert(!cube.allow_renaming);
  assert(std::abs(cube.pose.position.z() - 3.0) < 1e-12);
  assert(std::abs(cube.pose.orientation.z() - std::sqrt(0.5)) < 1e-12);
  assert(std::abs(cube.pose.orientation.w() - std::sqrt(0.5)) < 1e-12);
  assert(contains(cube.xml, "<box>"));

  const SpawnRequest& cart = service.requests[3];
  assert(cart.name == "cart");
  assert(std::abs(std::abs(cart.pose.orientation.x()) - 1.0) < 1e-12);
  assert(contains(cart.xml, "<robot name=\"cart\">"));

  assert(!g_errors.empty());
}

static void test_service_unavailable() {
  TestPackage pkg;
  const PackageLocator locator = pkg.locator();
  ScopedLogSink sink(&captureSink, LogLevel::Error);

  auto loaded = loadModelsFromString("models: [{name: a, type: box}, {name: b, type: box}]");
  assert(ok(loaded.status));

  FakeSpawnService service;
  service.available = false;
  SpawnerOptions opt;
  opt.time_interval = 0.0;
  ObjectSpawner spawner(&service, locator, opt);

  const SpawnReport report = spawner.spawnAll(loaded.registry);
  assert(report.failed() == 2);
  assert(report.outcomes[0].status == Status::Timeout);
  assert(service.wait_calls == 2);
  assert(service.requests.empty());
}

static double secondsBetween(std::chrono::steady_clock::time_point a,
                             std::chrono::steady_clock::time_point b) {
  return std::chrono::duration<double>(b - a).count();
}

static void test_time_interval_between_spawns() {
  TestPackage pkg;
  const PackageLocator locator = pkg.locator();

  auto loaded = loadModelsFromString(
    "models: [{name: a, type: box}, {name: b, type: sphere}, {name: c, type: cylinder}]");
  assert(ok(loaded.status));

  FakeSpawnService service;
  SpawnerOptions opt;
  opt.time_interval = 0.05;
  ObjectSpawner spawner(&service, locator, opt);

  const auto start = std::chrono::steady_clock::now();
  const SpawnReport report = spawner.spawnAll(loaded.registry);
  const auto end = std::chrono::steady_clock::now();
  assert(report.allSucceeded());
  assert(service.request_times.size() == 3);

  // Two pauses for three models, none after the last one.
  const double elapsed = secondsBetween(start, end);
  assert(elapsed >= 0.1);
  assert(elapsed < 0.15 + 0.5);
  assert(secondsBetween(service.request_times[0], service.request_times[1]) >= 0.05);
  assert(secondsBetween(service.request_times[1], service.request_times[2]) >= 0.05);
  assert(secondsBetween(service.request_times[2], end) < 0.05);

  // A non-positive interval disables the pause.
  FakeSpawnService fast;
  opt.time_interval = -1.0;
  ObjectSpawner no_delay(&fast, locator, opt);
  assert(no_delay.spawnAll(loaded.registry).allSucceeded());
  assert(fast.request_times.size() == 3);
}

static void test_random_order_is_permutation() {
  TestPackage pkg;
  const PackageLocator locator = pkg.locator();

  std::string yaml = "models:\n";
  for (int i = 0; i < 12; ++i) yaml += "  - {name: m" + std::to_string(i) + ", type: box}\n";
  auto loaded = loadModelsFromString(yaml);
  assert(ok(loaded.status));

  FakeSpawnService service;
  SpawnerOptions opt;
  opt.time_interval = 0.0;
  opt.random_order = true;
  opt.seed = 42u;
  ObjectSpawner spawner(&service, locator, opt);

  const auto order = spawner.spawnOrder(loaded.registry);
  assert(order == spawner.spawnOrder(loaded.registry));  // seeded
  std::vector<std::size_t> sorted = order;
  std::sort(sorted.begin(), sorted.end());
  for (std::size_t i = 0; i < sorted.size(); ++i) assert(sorted[i] == i);

  const SpawnReport report = spawner.spawnAll(loaded.registry);
  assert(report.allSucceeded());
  assert(service.requests.size() == 12);
  for (std::size_t i = 0; i < order.size(); ++i) {
    assert(service.requests[i].name == loaded.registry.models()[order[i]].unique_name);
  }

  opt.random_order = false;
  ObjectSpawner in_order(&service, locator, opt);
  const auto identity = in_order.spawnOrder(loaded.registry);
  for (std::size_t i = 0; i < identity.size(); ++i) assert(identity[i] == i);
}

static void test_dry_run_and_report() {
  TestPackage pkg;
  const PackageLocator locator = pkg.locator();
  ScopedLogSink sink(&captureSink, LogLevel::Error);

  auto loaded = loadModelsFromString(
    "models:\n"
    "  - {name: crate, type: sdf, package: demo_models}\n"
    "  - {name: \"quoted \\\"box\\\"\", type: box}\n"
    "  - {name: barrel, type: sdf, package: demo_models}\n");
  assert(ok(loaded.status));

  FakeSpawnService service;
  SpawnerOptions opt;
  opt.dry_run = true;
  ObjectSpawner spawner(&service, locator, opt);

  const SpawnReport report = spawner.spawnAll(loaded.registry);
  assert(service.wait_calls == 0);
  assert(service.requests.empty());
  assert(report.succeeded() == 2);
  assert(report.failed() == 1);

  const std::string json_path = "ospawn_gazebo_test_report.json";
  assert(ok(ospawn::gazebo::writeSpawnReportJson(report, json_path)));
  const std::string json = slurp(json_path);
  assert(contains(json, "\"spawned\": 2"));
  assert(contains(json, "\"failed\": 1"));
  assert(contains(json, "\"unique_name\": \"barrel\""));
  assert(contains(json, "quoted \\\"box\\\""));
  assert(contains(json, "\"status\": \"NotFound\""));
  std::remove(json_path.c_str());

  ospawn::gazebo::logSpawnReport(report);
}

int main() {
  test_primitive_geometry_and_sdf();
  test_validate_sdf_string();
  test_rewrite_package_uris();
  test_resolve_sdf_and_urdf_models();
  test_resolve_errors();
  test_spawn_batch_continues_after_failures();
  test_service_unavailable();
  test_time_interval_between_spawns();
  test_random_order_is_permutation();
  test_dry_run_and_report();
  std::cout << "ospawn_gazebo_spawner_test: PASS\n";
  return 0;
}
