#include "internal/sanitize/command_pixel_cleaner.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <map>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/util/errors.hpp"

namespace aegis::sanitize {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> g_job_counter{0};

// Removes the per-call scratch files on every exit path.
struct ScratchFiles {
  fs::path input;
  fs::path output;

  ~ScratchFiles() {
    std::error_code ec;
    fs::remove(input, ec);
    fs::remove(output, ec);
  }
};

std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

} // namespace

CommandPixelCleaner::CommandPixelCleaner(std::vector<std::string> argv, std::set<ImageFormat> formats, fs::path work_dir)
    : argv_(std::move(argv)), formats_(std::move(formats)), work_dir_(std::move(work_dir)) {
  if (argv_.empty()) {
    throw util::InvalidConfig("pixel command must not be empty");
  }
}

std::vector<std::string> CommandPixelCleaner::ExpandArgv(const fs::path& input, const fs::path& output, ImageFormat format,
                                                         const PixelParams& params) const {
  const std::map<std::string, std::string> values = {
      {"{input}", input.string()},
      {"{output}", output.string()},
      {"{format}", std::string(FormatName(format))},
      {"{target_r}", std::to_string(params.target_color.r)},
      {"{target_g}", std::to_string(params.target_color.g)},
      {"{target_b}", std::to_string(params.target_color.b)},
      {"{hue_min}", std::to_string(params.hue.min)},
      {"{hue_max}", std::to_string(params.hue.max)},
      {"{sat_min}", std::to_string(params.saturation.min)},
      {"{sat_max}", std::to_string(params.saturation.max)},
      {"{val_min}", std::to_string(params.value.min)},
      {"{val_max}", std::to_string(params.value.max)},
      {"{blur}", std::to_string(params.median_blur_size)},
      {"{kernel}", std::to_string(params.morph_kernel_size)},
      {"{iterations}", std::to_string(params.morph_iterations)},
  };

  std::vector<std::string> expanded;
  expanded.reserve(argv_.size());
  for (auto arg : argv_) {
    for (const auto& [key, value] : values) {
      arg = ReplaceAll(std::move(arg), key, value);
    }
    expanded.push_back(std::move(arg));
  }
  return expanded;
}

int CommandPixelCleaner::Run(const std::vector<std::string>& argv) const {
  std::vector<char*> raw;
  raw.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    raw.push_back(const_cast<char*>(arg.c_str()));
  }
  raw.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    throw util::CapabilityError(std::string("pixel command fork: ") + std::strerror(errno));
  }
  if (pid == 0) {
    ::execvp(raw[0], raw.data());
    ::_exit(127);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw util::CapabilityError(std::string("pixel command wait: ") + std::strerror(errno));
    }
  }

  if (WIFSIGNALED(status)) {
    throw util::CapabilityError(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
  }
  return WEXITSTATUS(status);
}

PhaseResult CommandPixelCleaner::Clean(const arrow::Buffer& bytes, ImageFormat format, const PixelParams& params) {
  if (!Supports(format)) {
    return PhaseResult::Skipped("no pixel capability for " + std::string(FormatName(format)));
  }

  std::error_code ec;
  fs::create_directories(work_dir_, ec);
  if (ec) {
    throw util::CapabilityError("pixel work dir " + work_dir_.string() + ": " + ec.message());
  }

  const auto   job = std::to_string(::getpid()) + "-" + std::to_string(g_job_counter.fetch_add(1));
  const auto   ext = "." + std::string(FormatName(format));
  ScratchFiles scratch{work_dir_ / ("in-" + job + ext), work_dir_ / ("out-" + job + ext)};

  storage::AtomicWrite(scratch.input, bytes);

  const auto argv = ExpandArgv(scratch.input, scratch.output, format, params);
  const int  code = Run(argv);

  if (code == kExitSkipped) {
    return PhaseResult::Skipped(argv[0] + " reported unsupported input");
  }
  if (code != 0) {
    throw util::CapabilityError(argv[0] + " exited with status " + std::to_string(code));
  }
  if (!fs::exists(scratch.output, ec)) {
    throw util::CapabilityError(argv[0] + " produced no output");
  }

  AEGIS_LOG_DEBUG("pixel command applied", {observability::StringField("command", argv[0]), observability::StringField("format", FormatName(format))});
  return PhaseResult::Applied(storage::ReadFile(scratch.output));
}

} // namespace aegis::sanitize
