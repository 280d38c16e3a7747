#include "sase/diagnostics.hpp"

#include <cstdlib>
#include <optional>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sase {

namespace {
    struct level_entry { std::string_view name; spdlog::level::level_enum level; };

    constexpr level_entry kLevels[] = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    // Unset and empty variables both mean "use the default".
    auto env_setting(const char* name) -> std::optional<std::string> {
#if defined(_WIN32)
      char* buf = nullptr;
      size_t len = 0;
      const bool found = _dupenv_s(&buf, &len, name) == 0 && buf != nullptr;
      std::string value(found ? buf : "");
      std::free(buf);
#else
      const char* raw = std::getenv(name);
      if (raw == nullptr) return std::nullopt;
      std::string value(raw);
#endif
      if (value.empty()) return std::nullopt; // the Windows CRT drops empty assignments anyway
      return value;
    }
}

auto parse_log_level(std::string_view name) -> std::expected<spdlog::level::level_enum, core::error> {
  for (const auto& e : kLevels) if (e.name == name) return e.level;
  return std::unexpected(core::error{
      core::error_code::config_invalid,
      "unknown log level '" + std::string(name) + "'",
      "diagnostics.config"});
}

auto load_diagnostics_config() -> std::expected<DiagnosticsConfig, core::error> {
  DiagnosticsConfig cfg{};
  if (auto v = env_setting("SASE_LOG_LEVEL")) {
    auto lvl = parse_log_level(*v);
    if (!lvl) return std::unexpected(lvl.error());
    cfg.level = *lvl;
  }
  if (auto v = env_setting("SASE_LOG_NAME")) {
    cfg.logger_name = std::move(*v);
  }
  return cfg;
}

auto make_diagnostics_logger(const DiagnosticsConfig& cfg) -> std::shared_ptr<spdlog::logger> {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(cfg.logger_name, std::move(sink));
  logger->set_level(cfg.level);
  return logger;
}

auto discard_logger() -> std::shared_ptr<spdlog::logger> {
  static const auto logger = [] {
    auto l = std::make_shared<spdlog::logger>("sase.discard", std::make_shared<spdlog::sinks::null_sink_mt>());
    l->set_level(spdlog::level::off);
    return l;
  }();
  return logger;
}

} // namespace sase
