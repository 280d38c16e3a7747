#pragma once

/** \file diagnostics.hpp
 *  \brief Logger construction for predicate diagnostics.
 *
 * Predicates never reach for a global logger; the embedding engine builds one here (or its
 * own) and passes it to each predicate it constructs.
 *
 * Environment:
 * - SASE_LOG_LEVEL: trace | debug | info | warn | error | critical | off (default warn)
 * - SASE_LOG_NAME:  logger name (default "sase")
 */

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include "sase/error.hpp"

namespace sase {

struct DiagnosticsConfig {
    std::string logger_name{"sase"};
    spdlog::level::level_enum level{spdlog::level::warn};
};

/** \brief Parse a level name; config_invalid for anything unrecognised. */
auto parse_log_level(std::string_view name) -> std::expected<spdlog::level::level_enum, core::error>;

/** \brief Defaults overridden by SASE_LOG_LEVEL / SASE_LOG_NAME. */
auto load_diagnostics_config() -> std::expected<DiagnosticsConfig, core::error>;

/** \brief Thread-safe stderr logger, not registered in spdlog's global registry. */
auto make_diagnostics_logger(const DiagnosticsConfig& cfg) -> std::shared_ptr<spdlog::logger>;

/** \brief Shared logger with no sinks; used when a predicate is built without one. */
auto discard_logger() -> std::shared_ptr<spdlog::logger>;

} // namespace sase
