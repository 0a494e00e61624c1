#include "pml/render/environment.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace pml {

namespace {

std::string read_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) {
    core::detail::logger().debug("gethostname failed");
    return {};
  }
  return std::string(buf);
}

std::string read_username() {
  for (const char* key : {"USER", "LOGNAME", "USERNAME"}) {
    if (const char* v = std::getenv(key); v != nullptr && *v != '\0') {
      return std::string(v);
    }
  }
  return {};
}

std::string read_cwd() {
  std::error_code ec;
  auto p = std::filesystem::current_path(ec);
  if (ec) {
    core::detail::logger().debug("current_path failed: {}", ec.message());
    return {};
  }
  return p.string();
}

std::string format_local(std::time_t t, const char* fmt) {
  std::tm tm{};
  if (::localtime_r(&t, &tm) == nullptr) {
    return {};
  }
  char buf[32] = {};
  const auto n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

}  // namespace

std::string_view to_string(OutputFormat f) noexcept {
  switch (f) {
    case OutputFormat::xml: return "xml";
    case OutputFormat::markdown: return "markdown";
    case OutputFormat::json: return "json";
    case OutputFormat::text: return "text";
  }
  return "xml";
}

std::optional<OutputFormat> parse_output_format(std::string_view s) noexcept {
  if (s == "xml") return OutputFormat::xml;
  if (s == "markdown") return OutputFormat::markdown;
  if (s == "json") return OutputFormat::json;
  if (s == "text") return OutputFormat::text;
  return std::nullopt;
}

std::string_view to_string(Delimiter d) noexcept {
  switch (d) {
    case Delimiter::xml: return "xml";
    case Delimiter::markdown: return "markdown";
    case Delimiter::none: return "none";
  }
  return "none";
}

std::optional<Delimiter> parse_delimiter(std::string_view s) noexcept {
  if (s == "xml") return Delimiter::xml;
  if (s == "markdown") return Delimiter::markdown;
  if (s == "none") return Delimiter::none;
  return std::nullopt;
}

Delimiter default_delimiter(OutputFormat f) noexcept {
  switch (f) {
    case OutputFormat::xml: return Delimiter::xml;
    case OutputFormat::markdown: return Delimiter::markdown;
    default: return Delimiter::none;
  }
}

RuntimeConfig gather_runtime_config() {
  RuntimeConfig rt;
  rt.hostname = read_hostname();
  rt.username = read_username();
  rt.cwd = read_cwd();

  const auto now = std::chrono::system_clock::now();
  rt.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  rt.date = format_local(t, "%Y-%m-%d");
  rt.time = format_local(t, "%H:%M:%S");
  return rt;
}

void fill_runtime_defaults(RuntimeConfig& runtime) {
  const auto gathered = gather_runtime_config();
  if (runtime.hostname.empty()) runtime.hostname = gathered.hostname;
  if (runtime.username.empty()) runtime.username = gathered.username;
  if (runtime.cwd.empty()) runtime.cwd = gathered.cwd;
  if (runtime.timestamp == 0) runtime.timestamp = gathered.timestamp;
  if (runtime.date.empty()) runtime.date = gathered.date;
  if (runtime.time.empty()) runtime.time = gathered.time;
}

}  // namespace pml
