#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/sanitize/image_format.hpp"
#include "internal/util/errors.hpp"

namespace aegis::config {

using aegis::config::v1::PixelConfig;
using aegis::config::v1::RuntimeConfig;

namespace {

constexpr std::uint32_t kDefaultDebounceMs       = 1000;
constexpr std::uint32_t kDefaultWorkerThreads    = 3;
constexpr std::uint32_t kMaxWorkerThreads        = 64;
constexpr std::uint32_t kDefaultHueTolerance     = 10;
constexpr std::uint32_t kMaxHueTolerance         = 20;
constexpr std::uint32_t kDefaultMedianBlur       = 5;
constexpr std::uint32_t kDefaultMorphKernel      = 3;
constexpr std::uint32_t kDefaultMorphIterations  = 2;
constexpr std::uint32_t kHueMax                  = 179;
constexpr std::uint32_t kChannelMax              = 255;
constexpr std::uint32_t kDefaultShutdownGraceMs  = 2000;
constexpr std::uint32_t kDefaultMaxMessageMb     = 4;
constexpr const char*   kDefaultBackupRoot       = "aegis-data";
constexpr const char*   kDefaultLedgerFile       = "ledger.db";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::InvalidConfig("Unsupported YAML node");
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void CheckRange(const aegis::config::v1::Range& range, std::uint32_t upper, const std::string& name) {
  if (range.min() > range.max() || range.max() > upper) {
    throw util::InvalidConfig("pixel." + name + " must satisfy 0 <= min <= max <= " + std::to_string(upper));
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = FromYamlNode(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = FromYamlNode(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* watch = config.mutable_watch();
  if (watch->debounce_ms() == 0) watch->set_debounce_ms(kDefaultDebounceMs);
  if (!watch->has_enabled()) watch->set_enabled(true);

  auto* scan = config.mutable_scan();
  if (!scan->has_on_startup()) scan->set_on_startup(true);

  if (config.workers().threads() == 0) config.mutable_workers()->set_threads(kDefaultWorkerThreads);

  for (auto& folder : *config.mutable_folders()) {
    if (!folder.has_enabled()) folder.set_enabled(true);
  }

  if (config.backup().root().empty()) config.mutable_backup()->set_root(kDefaultBackupRoot);
  if (config.ledger().sqlite_path().empty()) {
    config.mutable_ledger()->set_sqlite_path(config.backup().root() + "/" + kDefaultLedgerFile);
  }
  if (config.quarantine().mode().empty()) config.mutable_quarantine()->set_mode("move");

  auto* pixel = config.mutable_pixel();
  if (!pixel->has_enabled()) pixel->set_enabled(true);
  if (!pixel->has_hue_tolerance()) pixel->set_hue_tolerance(kDefaultHueTolerance);
  if (pixel->median_blur_size() == 0) pixel->set_median_blur_size(kDefaultMedianBlur);
  // median blur needs an odd aperture
  if (pixel->median_blur_size() % 2 == 0) pixel->set_median_blur_size(pixel->median_blur_size() + 1);
  if (pixel->morph_kernel_size() == 0) pixel->set_morph_kernel_size(kDefaultMorphKernel);
  if (pixel->morph_iterations() == 0) pixel->set_morph_iterations(kDefaultMorphIterations);

  const bool has_window = pixel->has_hue() || pixel->has_saturation() || pixel->has_value();
  if (!has_window && pixel->has_target_color()) {
    DeriveWindowFromColor(*pixel);
  }
  if (!pixel->has_target_color()) {
    pixel->mutable_target_color()->set_g(kChannelMax);
  }
  if (!pixel->has_hue()) {
    pixel->mutable_hue()->set_min(35);
    pixel->mutable_hue()->set_max(85);
  }
  if (!pixel->has_saturation()) {
    pixel->mutable_saturation()->set_min(40);
    pixel->mutable_saturation()->set_max(kChannelMax);
  }
  if (!pixel->has_value()) {
    pixel->mutable_value()->set_min(40);
    pixel->mutable_value()->set_max(kChannelMax);
  }

  auto* admin = config.mutable_admin();
  if (admin->shutdown_grace_ms() == 0) admin->set_shutdown_grace_ms(kDefaultShutdownGraceMs);
  if (admin->max_message_mb() == 0) admin->set_max_message_mb(kDefaultMaxMessageMb);

  if (config.logging().level().empty()) config.mutable_logging()->set_level("info");
  if (config.observability().transport().empty()) config.mutable_observability()->set_transport("grpc");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.folders().empty()) {
    throw util::InvalidConfig("at least one folder must be configured");
  }

  std::set<std::string> seen;
  for (const auto& folder : config.folders()) {
    if (folder.path().empty()) {
      throw util::InvalidConfig("folder path must not be empty");
    }
    if (!seen.insert(folder.path()).second) {
      throw util::InvalidConfig("folder configured twice: " + folder.path());
    }
  }

  if (config.workers().threads() > kMaxWorkerThreads) {
    throw util::InvalidConfig("workers.threads must be between 1 and " + std::to_string(kMaxWorkerThreads));
  }

  if (config.quarantine().mode() != "move" && config.quarantine().mode() != "copy") {
    throw util::InvalidConfig("quarantine.mode must be move or copy");
  }

  const auto& pixel = config.pixel();
  const auto& color = pixel.target_color();
  if (color.r() > kChannelMax || color.g() > kChannelMax || color.b() > kChannelMax) {
    throw util::InvalidConfig("pixel.target_color channels must be <= 255");
  }
  if (pixel.hue_tolerance() > kMaxHueTolerance) {
    throw util::InvalidConfig("pixel.hue_tolerance must be between 0 and " + std::to_string(kMaxHueTolerance));
  }
  CheckRange(pixel.hue(), kHueMax, "hue");
  CheckRange(pixel.saturation(), kChannelMax, "saturation");
  CheckRange(pixel.value(), kChannelMax, "value");

  for (const auto& name : config.capabilities().pixel_formats()) {
    if (!sanitize::FormatFromExtension("x." + name)) {
      throw util::InvalidConfig("capabilities.pixel_formats: unknown format " + name);
    }
  }
  if (!config.capabilities().pixel_formats().empty() && config.capabilities().pixel_command().empty()) {
    throw util::InvalidConfig("capabilities.pixel_formats requires capabilities.pixel_command");
  }

  if (!observability::IsValidLevel(config.logging().level())) {
    throw util::InvalidConfig("logging.level: unknown level " + config.logging().level());
  }

  const auto& transport = config.observability().transport();
  if (transport != "grpc" && transport != "http") {
    throw util::InvalidConfig("observability.transport must be grpc or http");
  }
}

Hsv RgbToHsv(std::uint32_t r, std::uint32_t g, std::uint32_t b) {
  const double rd = r, gd = g, bd = b;
  const double v  = std::max({rd, gd, bd});
  const double mn = std::min({rd, gd, bd});
  const double d  = v - mn;

  double h = 0;
  if (d > 0) {
    if (v == rd) {
      h = 60.0 * (gd - bd) / d;
    } else if (v == gd) {
      h = 120.0 + 60.0 * (bd - rd) / d;
    } else {
      h = 240.0 + 60.0 * (rd - gd) / d;
    }
    if (h < 0) h += 360.0;
  }

  Hsv hsv;
  hsv.h = static_cast<std::uint32_t>(h / 2.0 + 0.5) % (kHueMax + 1);
  hsv.s = v > 0 ? static_cast<std::uint32_t>(255.0 * d / v + 0.5) : 0;
  hsv.v = static_cast<std::uint32_t>(v);
  return hsv;
}

void DeriveWindowFromColor(PixelConfig& pixel) {
  const auto& c   = pixel.target_color();
  const auto  hsv = RgbToHsv(c.r(), c.g(), c.b());
  const auto  tol = pixel.hue_tolerance();

  pixel.mutable_hue()->set_min(hsv.h > tol ? hsv.h - tol : 0);
  pixel.mutable_hue()->set_max(std::min(kHueMax, hsv.h + tol));
  pixel.mutable_saturation()->set_min(std::max<std::uint32_t>(50, hsv.s > 30 ? hsv.s - 30 : 0));
  pixel.mutable_saturation()->set_max(kChannelMax);
  pixel.mutable_value()->set_min(std::max<std::uint32_t>(50, hsv.v > 30 ? hsv.v - 30 : 0));
  pixel.mutable_value()->set_max(kChannelMax);
}

sanitize::PixelParams ToPixelParams(const PixelConfig& pixel) {
  sanitize::PixelParams params;
  params.target_color      = {static_cast<std::uint8_t>(pixel.target_color().r()), static_cast<std::uint8_t>(pixel.target_color().g()),
                              static_cast<std::uint8_t>(pixel.target_color().b())};
  params.hue               = {pixel.hue().min(), pixel.hue().max()};
  params.saturation        = {pixel.saturation().min(), pixel.saturation().max()};
  params.value             = {pixel.value().min(), pixel.value().max()};
  params.median_blur_size  = pixel.median_blur_size();
  params.morph_kernel_size = pixel.morph_kernel_size();
  params.morph_iterations  = pixel.morph_iterations();
  return params;
}

} // namespace aegis::config
