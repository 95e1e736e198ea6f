#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace plancalc {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + level_str);
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : console_stream_(nullptr) {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_config_loaded(
    const std::string& source,
    const std::map<std::string, std::string>& fields
) {
    std::map<std::string, std::string> out;
    out["event"] = "config_loaded";
    out["source"] = source;
    for (const auto& [key, value] : fields) {
        out["config." + key] = value;
    }

    log(LogLevel::INFO, "Configuration loaded", out);
}

void Logger::log_comparison_start(
    const RunContext& ctx,
    const std::map<std::string, std::string>& plan_fields,
    size_t upper_bound
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "comparison_start";
    add_context(fields, ctx);
    for (const auto& [key, value] : plan_fields) {
        fields["plan." + key] = value;
    }
    fields["upper_bound"] = std::to_string(upper_bound);

    log(LogLevel::INFO, "Starting strategy comparison", fields);
}

void Logger::log_catalog_summary(
    const RunContext& ctx,
    size_t strategies,
    size_t skipped
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "catalog_summary";
    add_context(fields, ctx);
    fields["strategies"] = std::to_string(strategies);
    fields["skipped"] = std::to_string(skipped);

    log(LogLevel::INFO, "Strategy catalog built", fields);
}

void Logger::log_strategy_evaluated(
    const RunContext& ctx,
    const std::string& label,
    double net_benefit
) {
    if (LogLevel::DEBUG < config_.min_level) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "strategy_evaluated";
    add_context(fields, ctx);
    fields["strategy"] = label;
    fields["net_benefit"] = std::to_string(net_benefit);

    log(LogLevel::DEBUG, "Strategy evaluated", fields);
}

void Logger::log_strategy_failed(
    const RunContext& ctx,
    const std::string& label,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "strategy_failed";
    add_context(fields, ctx);
    fields["strategy"] = label;
    fields["error_message"] = error_message;

    log(LogLevel::WARN, "Strategy evaluation failed", fields);
}

void Logger::log_comparison_cancelled(
    const RunContext& ctx,
    const RunMetrics& metrics
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "comparison_cancelled";
    add_context(fields, ctx);
    add_metrics(fields, metrics);

    log(LogLevel::WARN, "Comparison cancelled, ranking partial results", fields);
}

void Logger::log_comparison_complete(
    const RunContext& ctx,
    const RunMetrics& metrics,
    const std::string& best_label,
    double best_net_benefit
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "comparison_complete";
    add_context(fields, ctx);
    add_metrics(fields, metrics);
    fields["throughput_strategies_per_sec"] = std::to_string(
        metrics.execution_time_ms > 0 ? (metrics.strategies_evaluated * 1000.0 / metrics.execution_time_ms) : 0
    );
    if (!best_label.empty()) {
        fields["best_strategy"] = best_label;
        fields["best_net_benefit"] = std::to_string(best_net_benefit);
    }

    log(LogLevel::INFO, "Comparison completed", fields);
}

void Logger::log_error(
    const RunContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Run error", fields);
}

void Logger::log_warning(
    const RunContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (config_.enable_console) {
        (console_stream_ ? *console_stream_ : std::cerr).flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::add_context(std::map<std::string, std::string>& fields, const RunContext& ctx) const {
    fields["run_id"] = ctx.run_id;
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    fields["batch"] = std::to_string(ctx.batch);
}

void Logger::add_metrics(std::map<std::string, std::string>& fields, const RunMetrics& metrics) const {
    fields["strategies_evaluated"] = std::to_string(metrics.strategies_evaluated);
    fields["strategies_skipped"] = std::to_string(metrics.strategies_skipped);
    fields["strategies_failed"] = std::to_string(metrics.strategies_failed);
    fields["batches"] = std::to_string(metrics.batches);
    fields["execution_time_ms"] = std::to_string(metrics.execution_time_ms);
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    const std::string timestamp = get_timestamp();
    if (config_.enable_json) {
        write_output(format_json(timestamp, level, message, fields));
        return;
    }

    std::ostringstream line;
    line << timestamp << " [" << level_to_string(level) << "] " << message;
    const char* separator = " {";
    for (const auto& field : fields) {
        line << separator << field.first << "=" << field.second;
        separator = ", ";
    }
    if (!fields.empty()) {
        line << "}";
    }
    write_output(line.str());
}

// UTC, ISO 8601 with milliseconds: 2024-05-01T09:30:00.125Z
std::string Logger::get_timestamp() const {
    using namespace std::chrono;
    const system_clock::time_point now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    const long long millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string Logger::format_json(
    const std::string& timestamp,
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) const {
    nlohmann::json event(fields);
    event["timestamp"] = timestamp;
    event["level"] = level_to_string(level);
    event["message"] = message;
    // Invalid UTF-8 in user-supplied labels must not lose the event
    return event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (config_.enable_console) {
        (console_stream_ ? *console_stream_ : std::cerr) << output << '\n';
    }
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << '\n';
    }
}

} // namespace plancalc
