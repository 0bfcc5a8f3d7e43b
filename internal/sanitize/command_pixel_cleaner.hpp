#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "internal/sanitize/capability.hpp"

namespace aegis::sanitize {

/*
  PixelCleaner backed by an operator-supplied executable.

  argv entries may carry placeholders, replaced per call:
    {input} {output} {format}
    {target_r} {target_g} {target_b}
    {hue_min} {hue_max} {sat_min} {sat_max} {val_min} {val_max}
    {blur} {kernel} {iterations}

  Exit status: 0 -> Applied (bytes read back from {output}),
               3 -> Skipped, anything else -> util::CapabilityError.
  The program runs without a shell.
*/
class CommandPixelCleaner final : public PixelCleaner {
 public:
  static constexpr int kExitSkipped = 3;

  CommandPixelCleaner(std::vector<std::string> argv, std::set<ImageFormat> formats, std::filesystem::path work_dir);

  PhaseResult Clean(const arrow::Buffer& bytes, ImageFormat format, const PixelParams& params) override;

  bool Supports(ImageFormat format) const {
    return formats_.count(format) > 0;
  }

  std::vector<std::string> ExpandArgv(const std::filesystem::path& input, const std::filesystem::path& output, ImageFormat format,
                                      const PixelParams& params) const;

 private:
  int Run(const std::vector<std::string>& argv) const;

  std::vector<std::string> argv_;
  std::set<ImageFormat>    formats_;
  std::filesystem::path    work_dir_;
};

} // namespace aegis::sanitize
