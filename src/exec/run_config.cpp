//! # Run Configuration Loading
//!
//! Line-oriented reader for the `[run]` section of `ordo.toml`: `key = value`
//! pairs, `#` comments, optional double quotes around string values.
//! Unknown keys are logged and ignored; malformed values are errors that
//! carry the line number.

#include "exec/run_config.hpp"

#include "log/log.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <thread>

namespace ordo::exec {

namespace {

auto trim(std::string_view text) -> std::string_view {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

auto parse_size(std::string_view value) -> std::optional<size_t> {
    size_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return parsed;
}

auto parse_bool(std::string_view value) -> std::optional<bool> {
    if (value == "true" || value == "1" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "off") {
        return false;
    }
    return std::nullopt;
}

/// Applies one `key = value` pair. Returns an error message on bad input.
auto apply_setting(RunConfig& config, std::string_view key, std::string_view value)
    -> std::optional<std::string> {
    if (key == "pool_size" || key == "queue_capacity" || key == "sorting_timeout_ms") {
        auto number = parse_size(value);
        if (!number) {
            return "expected a non-negative integer for '" + std::string(key) + "'";
        }
        if (key == "pool_size") {
            config.pool_size = *number;
        } else if (key == "queue_capacity") {
            config.queue_capacity = *number;
        } else {
            if (*number > static_cast<size_t>(MAX_SORTING_TIMEOUT_MS)) {
                return "sorting_timeout_ms must be at most " +
                       std::to_string(MAX_SORTING_TIMEOUT_MS);
            }
            config.sorting_timeout =
                std::chrono::milliseconds(static_cast<int64_t>(*number));
        }
        return std::nullopt;
    }
    if (key == "concurrent" || key == "parallel_tests" || key == "declared_order") {
        auto flag = parse_bool(value);
        if (!flag) {
            return "expected true or false for '" + std::string(key) + "'";
        }
        if (key == "concurrent") {
            config.concurrent = *flag;
        } else if (key == "parallel_tests") {
            config.parallel_tests = *flag;
        } else {
            config.declared_order = *flag;
        }
        return std::nullopt;
    }
    if (key == "late_events") {
        auto policy = sort::parse_late_event_policy(value);
        if (!policy) {
            return "late_events must be \"discard\" or \"forward\"";
        }
        config.late_events = *policy;
        return std::nullopt;
    }
    ORDO_LOG_WARN("config", "ignoring unknown [run] key '" << key << "'");
    return std::nullopt;
}

} // namespace

auto default_pool_size() -> size_t {
    unsigned int hw = std::thread::hardware_concurrency();
    return hw < 2 ? 2 : static_cast<size_t>(hw);
}

// ============================================================================
// Config File Parsing
// ============================================================================

auto parse_run_config(std::string_view content, RunConfig base)
    -> Result<RunConfig, ConfigError> {
    RunConfig config = base;
    bool in_run_section = false;
    size_t line_number = 0;

    while (!content.empty()) {
        size_t newline = content.find('\n');
        std::string_view raw = content.substr(0, newline);
        content = newline == std::string_view::npos ? std::string_view{}
                                                    : content.substr(newline + 1);
        ++line_number;

        std::string_view line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line[0] == '[') {
            in_run_section = (line == "[run]");
            continue;
        }
        if (!in_run_section) {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            return ConfigError::make("expected 'key = value'", line_number);
        }
        std::string_view key = trim(line.substr(0, eq_pos));
        std::string_view value = trim(line.substr(eq_pos + 1));

        // Trailing comment
        if (!value.empty() && value[0] != '"') {
            size_t hash = value.find('#');
            if (hash != std::string_view::npos) {
                value = trim(value.substr(0, hash));
            }
        }
        // Remove quotes from string values
        if (!value.empty() && value[0] == '"') {
            size_t close = value.find('"', 1);
            if (close == std::string_view::npos) {
                return ConfigError::make("unterminated string", line_number);
            }
            value = value.substr(1, close - 1);
        }

        if (auto problem = apply_setting(config, key, value)) {
            return ConfigError::make(*problem, line_number);
        }
    }
    return config;
}

auto load_run_config(const std::filesystem::path& path) -> Result<RunConfig, ConfigError> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        ORDO_LOG_DEBUG("config", path.string() << " not found, using defaults");
        return RunConfig{};
    }
    std::ifstream file(path);
    if (!file) {
        return ConfigError::make("cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_run_config(buffer.str());
    if (is_err(parsed)) {
        auto& error = unwrap_err(parsed);
        error.message = path.string() + ": " + error.message;
    }
    return parsed;
}

// ============================================================================
// Environment Overrides
// ============================================================================

auto apply_env_overrides(RunConfig config) -> Result<RunConfig, ConfigError> {
    struct Override {
        const char* variable;
        const char* key;
    };
    static constexpr Override overrides[] = {
        {"ORDO_POOL_SIZE", "pool_size"},
        {"ORDO_SORTING_TIMEOUT_MS", "sorting_timeout_ms"},
        {"ORDO_PARALLEL_TESTS", "parallel_tests"},
        {"ORDO_LATE_EVENTS", "late_events"},
    };
    for (const auto& entry : overrides) {
        const char* value = std::getenv(entry.variable);
        if (value == nullptr || *value == '\0') {
            continue;
        }
        if (auto problem = apply_setting(config, entry.key, trim(value))) {
            return ConfigError::make(std::string(entry.variable) + ": " + *problem);
        }
        ORDO_LOG_DEBUG("config", entry.variable << "=" << value);
    }
    return config;
}

auto validate(const RunConfig& config) -> Result<RunConfig, ConfigError> {
    if (config.pool_size == 0) {
        return ConfigError::make("pool_size must be greater than zero");
    }
    auto timeout = config.sorting_timeout.count();
    if (timeout < 0 || timeout > MAX_SORTING_TIMEOUT_MS) {
        return ConfigError::make("sorting_timeout_ms must be between 0 and " +
                                 std::to_string(MAX_SORTING_TIMEOUT_MS));
    }
    return config;
}

} // namespace ordo::exec
