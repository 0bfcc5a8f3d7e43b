#include "internal/sanitize/command_pixel_cleaner.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/test_files.hpp"

namespace {

namespace fs = std::filesystem;
using aegis::sanitize::CommandPixelCleaner;
using aegis::sanitize::ImageFormat;
using aegis::testing::TempDir;

std::shared_ptr<arrow::Buffer> Input() {
  return arrow::Buffer::FromString(aegis::testing::MinimalPng(false));
}

void TestPlaceholdersExpanded() {
  TempDir             dir("pixel_expand");
  CommandPixelCleaner cleaner({"clean", "--in={input}", "{output}", "{format}", "{hue_min}-{hue_max}", "{sat_min}", "{val_max}",
                               "{target_r},{target_g},{target_b}", "{blur}/{kernel}/{iterations}"},
                              {ImageFormat::kPng}, dir.path());

  aegis::sanitize::PixelParams params;
  params.hue              = {40, 80};
  params.saturation       = {60, 255};
  params.value            = {70, 250};
  params.median_blur_size = 7;

  auto argv = cleaner.ExpandArgv("/tmp/in.png", "/tmp/out.png", ImageFormat::kPng, params);
  assert(argv.size() == 9);
  assert(argv[0] == "clean");
  assert(argv[1] == "--in=/tmp/in.png");
  assert(argv[2] == "/tmp/out.png");
  assert(argv[3] == "png");
  assert(argv[4] == "40-80");
  assert(argv[5] == "60");
  assert(argv[6] == "250");
  assert(argv[7] == "0,255,0");
  assert(argv[8] == "7/3/2");
}

void TestExitZeroAppliesOutput() {
  TempDir             dir("pixel_apply");
  CommandPixelCleaner cleaner({"/bin/sh", "-c", "printf cleaned > \"$1\"", "sh", "{output}"}, {ImageFormat::kPng}, dir / "work");

  auto result = cleaner.Clean(*Input(), ImageFormat::kPng, {});
  assert(result.applied());
  assert(result.bytes->ToString() == "cleaned");

  // scratch files are gone
  assert(fs::is_empty(dir / "work"));
}

void TestExitThreeIsSkipped() {
  TempDir             dir("pixel_skip");
  CommandPixelCleaner cleaner({"/bin/sh", "-c", "exit 3"}, {ImageFormat::kPng}, dir.path());
  auto                result = cleaner.Clean(*Input(), ImageFormat::kPng, {});
  assert(result.skipped());
}

void TestUnsupportedFormatIsSkippedWithoutRunning() {
  TempDir             dir("pixel_format");
  CommandPixelCleaner cleaner({"/bin/false"}, {ImageFormat::kJpeg}, dir.path());
  auto                result = cleaner.Clean(*Input(), ImageFormat::kPng, {});
  assert(result.skipped());
}

void TestFailuresAreCapabilityErrors() {
  TempDir dir("pixel_fail");

  const std::vector<std::vector<std::string>> commands = {
      {"/bin/false"},
      {"/bin/sh", "-c", "exit 0"},  // success without output
      {"/nonexistent/aegis-pixel-tool", "{input}"},
      {"/bin/sh", "-c", "kill -9 $$"},
  };

  for (const auto& argv : commands) {
    CommandPixelCleaner cleaner(argv, {ImageFormat::kPng}, dir.path());
    bool                threw = false;
    try {
      (void)cleaner.Clean(*Input(), ImageFormat::kPng, {});
    } catch (const aegis::util::CapabilityError&) {
      threw = true;
    }
    assert(threw && "pixel command failure must raise CapabilityError");
  }
}

void TestEmptyCommandRejected() {
  bool threw = false;
  try {
    CommandPixelCleaner cleaner({}, {ImageFormat::kPng}, "/tmp");
  } catch (const aegis::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPlaceholdersExpanded();
  TestExitZeroAppliesOutput();
  TestExitThreeIsSkipped();
  TestUnsupportedFormatIsSkippedWithoutRunning();
  TestFailuresAreCapabilityErrors();
  TestEmptyCommandRejected();

  std::cout << "aegis_unit_command_pixel_cleaner: pass\n";
  return 0;
}
