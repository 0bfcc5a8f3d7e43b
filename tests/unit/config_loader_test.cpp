#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "aegis_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)aegis::config::ConfigLoader::LoadFromString(yaml);
  } catch (const aegis::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestDefaultsApplied() {
  const auto yaml_path = WriteYaml("defaults", R"(folders:
  - path: /srv/photos
)");

  auto config = aegis::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.folders_size() == 1);
  assert(config.folders(0).enabled());
  assert(config.watch().enabled());
  assert(config.watch().debounce_ms() == 1000);
  assert(config.scan().on_startup());
  assert(config.scan().interval_sec() == 0);
  assert(config.workers().threads() == 3);
  assert(config.backup().root() == "aegis-data");
  assert(config.ledger().sqlite_path() == "aegis-data/ledger.db");
  assert(!config.ledger().retry_failed());
  assert(config.quarantine().mode() == "move");
  assert(config.pixel().enabled());
  assert(config.pixel().median_blur_size() == 5);
  assert(config.logging().level() == "info");
  assert(config.admin().bind_address().empty());
  assert(config.admin().shutdown_grace_ms() == 2000);
  assert(config.admin().max_message_mb() == 4);

  // default green window
  const auto params = aegis::config::ToPixelParams(config.pixel());
  assert(params.target_color.r == 0 && params.target_color.g == 255 && params.target_color.b == 0);
  assert(params.hue.min == 35 && params.hue.max == 85);
  assert(params.saturation.min == 40 && params.saturation.max == 255);
  assert(params.value.min == 40 && params.value.max == 255);
}

void TestFullConfigRoundTrips() {
  auto config = aegis::config::ConfigLoader::LoadFromString(R"(folders:
  - path: /a
  - path: /b
    enabled: false
watch:
  enabled: false
  debounce_ms: 250
scan:
  on_startup: false
  interval_sec: 600
workers:
  threads: 8
backup:
  root: /var/lib/aegis
quarantine:
  mode: copy
ledger:
  sqlite_path: ":memory:"
  retry_failed: true
pixel:
  enabled: false
  hue: { min: 10, max: 20 }
  saturation: { min: 1, max: 2 }
  value: { min: 3, max: 4 }
  median_blur_size: 4
capabilities:
  pixel_command: ["/usr/bin/clean", "{input}", "{output}"]
  pixel_formats: [jpeg, png]
admin:
  bind_address: "127.0.0.1:0"
logging:
  level: debug
  file: /var/log/aegis/aegis-watch.log
  max_files: 3
)");

  assert(!config.folders(1).enabled());
  assert(!config.watch().enabled());
  assert(config.watch().debounce_ms() == 250);
  assert(!config.scan().on_startup());
  assert(config.scan().interval_sec() == 600);
  assert(config.workers().threads() == 8);
  assert(config.quarantine().mode() == "copy");
  assert(config.ledger().sqlite_path() == ":memory:");
  assert(config.ledger().retry_failed());
  assert(!config.pixel().enabled());
  assert(config.pixel().hue().min() == 10 && config.pixel().hue().max() == 20);
  // even blur sizes are bumped to the next odd one
  assert(config.pixel().median_blur_size() == 5);
  assert(config.capabilities().pixel_command_size() == 3);
  assert(config.capabilities().pixel_formats(1) == "png");
  assert(config.admin().bind_address() == "127.0.0.1:0");
  assert(config.logging().level() == "debug");
  assert(config.logging().file() == "/var/log/aegis/aegis-watch.log");
  assert(config.logging().max_files() == 3);
}

void TestWindowDerivedFromTargetColor() {
  auto config = aegis::config::ConfigLoader::LoadFromString(R"(folders: [{path: /x}]
pixel:
  target_color: { r: 255, g: 0, b: 0 }
)");
  const auto& pixel = config.pixel();
  assert(pixel.hue().min() == 0 && pixel.hue().max() == 10);
  assert(pixel.saturation().min() == 225 && pixel.saturation().max() == 255);
  assert(pixel.value().min() == 225 && pixel.value().max() == 255);

  auto green = aegis::config::ConfigLoader::LoadFromString(R"(folders: [{path: /x}]
pixel:
  target_color: { r: 0, g: 255, b: 0 }
  hue_tolerance: 15
)");
  assert(green.pixel().hue().min() == 45 && green.pixel().hue().max() == 75);

  // an explicit zero tolerance is kept, not replaced by the default
  auto exact = aegis::config::ConfigLoader::LoadFromString(R"(folders: [{path: /x}]
pixel:
  target_color: { r: 0, g: 255, b: 0 }
  hue_tolerance: 0
)");
  assert(exact.pixel().has_hue_tolerance() && exact.pixel().hue_tolerance() == 0);
  assert(exact.pixel().hue().min() == 60 && exact.pixel().hue().max() == 60);

  auto unset = aegis::config::ConfigLoader::LoadFromString(R"(folders: [{path: /x}]
pixel:
  target_color: { r: 0, g: 255, b: 0 }
)");
  assert(unset.pixel().hue_tolerance() == 10);
  assert(unset.pixel().hue().min() == 50 && unset.pixel().hue().max() == 70);

  // dull colors still get the saturation/value floor of 50
  aegis::config::v1::PixelConfig dull;
  dull.mutable_target_color()->set_r(40);
  dull.mutable_target_color()->set_g(50);
  dull.mutable_target_color()->set_b(40);
  dull.set_hue_tolerance(10);
  aegis::config::DeriveWindowFromColor(dull);
  assert(dull.saturation().min() == 50);
  assert(dull.value().min() == 50);
}

void TestRgbToHsvMatchesOpenCvScale() {
  auto blue = aegis::config::RgbToHsv(0, 0, 255);
  assert(blue.h == 120 && blue.s == 255 && blue.v == 255);
  auto gray = aegis::config::RgbToHsv(128, 128, 128);
  assert(gray.h == 0 && gray.s == 0 && gray.v == 128);
}

void TestScalarEscapingForQuotedValues() {
  auto config = aegis::config::ConfigLoader::LoadFromString(R"(folders:
  - path: "C:\\photos\\\"quoted\""
  - path: "12345"
)");
  assert(config.folders(0).path() == "C:\\photos\\\"quoted\"");
  assert(config.folders(1).path() == "12345");
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("watch:\n  debounce_ms: 10\n"));
  assert(Rejects("folders: [{path: /a}]\nunknown_field: 123\n"));
  assert(Rejects("folders: [{path: /a}, {path: /a}]\n"));
  assert(Rejects("folders: [{path: \"\"}]\n"));
  assert(Rejects("folders: [{path: /a}]\nworkers: {threads: 65}\n"));
  assert(Rejects("folders: [{path: /a}]\nquarantine: {mode: shred}\n"));
  assert(Rejects("folders: [{path: /a}]\npixel: {hue: {min: 10, max: 200}}\n"));
  assert(Rejects("folders: [{path: /a}]\npixel: {hue_tolerance: 21}\n"));
  assert(Rejects("folders: [{path: /a}]\npixel: {saturation: {min: 90, max: 80}}\n"));
  assert(Rejects("folders: [{path: /a}]\npixel: {target_color: {r: 300, g: 0, b: 0}}\n"));
  assert(Rejects("folders: [{path: /a}]\ncapabilities: {pixel_formats: [png]}\n"));
  assert(Rejects("folders: [{path: /a}]\ncapabilities: {pixel_command: [x], pixel_formats: [gif]}\n"));
  assert(Rejects("folders: [{path: /a}]\nobservability: {transport: carrier-pigeon}\n"));
  assert(Rejects("folders: [{path: /a}]\nlogging: {level: loud}\n"));
  assert(Rejects("folders: [ unclosed\n"));

  bool threw = false;
  try {
    (void)aegis::config::ConfigLoader::LoadFromYaml("/nonexistent/aegis.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject a missing file.");
}

} // namespace

int main() {
  TestDefaultsApplied();
  TestFullConfigRoundTrips();
  TestWindowDerivedFromTargetColor();
  TestRgbToHsvMatchesOpenCvScale();
  TestScalarEscapingForQuotedValues();
  TestInvalidConfigsAreRejected();

  std::cout << "aegis_unit_config_loader: pass\n";
  return 0;
}
