//! # Run Configuration
//!
//! Settings for one run, read from the `[run]` section of `ordo.toml` and
//! then overridden from the environment.
//!
//! ```toml
//! [run]
//! pool_size = 8
//! concurrent = true
//! parallel_tests = true
//! declared_order = true
//! sorting_timeout_ms = 10000   # 0 disables forced release
//! late_events = "discard"      # or "forward"
//! queue_capacity = 0           # 0 = unbounded
//! ```
//!
//! | Variable                  | Field             |
//! |---------------------------|-------------------|
//! | `ORDO_POOL_SIZE`          | `pool_size`       |
//! | `ORDO_SORTING_TIMEOUT_MS` | `sorting_timeout` |
//! | `ORDO_PARALLEL_TESTS`     | `parallel_tests`  |
//! | `ORDO_LATE_EVENTS`        | `late_events`     |

#ifndef ORDO_EXEC_RUN_CONFIG_HPP
#define ORDO_EXEC_RUN_CONFIG_HPP

#include "common.hpp"
#include "sorting/recorder.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace ordo::exec {

/// Hardware concurrency, at least 2.
[[nodiscard]] auto default_pool_size() -> size_t;

/// Longest accepted `sorting_timeout_ms`: one day.
constexpr int64_t MAX_SORTING_TIMEOUT_MS = 24LL * 60 * 60 * 1000;

struct RunConfig {
    size_t pool_size = default_pool_size();
    bool concurrent = true;      ///< false runs every unit inline on the caller
    bool parallel_tests = true;  ///< false bypasses TestSortingGate for every suite
    bool declared_order = true;  ///< false sorts tests by first start
    std::chrono::milliseconds sorting_timeout{10000};
    sort::LateEventPolicy late_events = sort::LateEventPolicy::Discard;
    size_t queue_capacity = 0;
};

struct ConfigError {
    std::string message;
    size_t line = 0; ///< 1-based, 0 when not from a file

    static auto make(std::string msg, size_t line = 0) -> ConfigError {
        return ConfigError{std::move(msg), line};
    }

    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

/// Parses the `[run]` section of a toml document. Other sections are skipped.
auto parse_run_config(std::string_view content, RunConfig base = {})
    -> Result<RunConfig, ConfigError>;

/// Loads `path`; a missing file yields the defaults.
auto load_run_config(const std::filesystem::path& path) -> Result<RunConfig, ConfigError>;

/// Applies the `ORDO_*` environment overrides on top of `config`.
auto apply_env_overrides(RunConfig config) -> Result<RunConfig, ConfigError>;

/// Rejects settings no run can use: an empty pool, or a sorting timeout
/// that is negative or longer than `MAX_SORTING_TIMEOUT_MS`.
auto validate(const RunConfig& config) -> Result<RunConfig, ConfigError>;

} // namespace ordo::exec

#endif // ORDO_EXEC_RUN_CONFIG_HPP
