/**
 * @file logger.hpp
 * @brief Structured logging for comparison runs with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain text lines
 * - Run context tracking (run ID, phase, batch)
 * - Run metrics (strategy counts, execution time)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef PLANCALC_LOGGER_HPP
#define PLANCALC_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace plancalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-strategy results and intermediate values
    INFO,    ///< Run start/end, configuration loaded
    WARN,    ///< Non-fatal issues (failed strategies, cancellation)
    ERROR    ///< Fatal errors
};

std::string level_to_string(LogLevel level);

/**
 * @brief Parse log level from string (case-insensitive)
 *
 * @throws std::invalid_argument for an unknown level name
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Context attached to every event of one comparison run
 */
struct RunContext {
    std::string run_id;              ///< Identifier of the comparison run
    std::string phase;               ///< Current phase (config, catalog, evaluate, rank)
    size_t batch;                    ///< Current batch number (0-based)

    RunContext()
        : run_id(""), phase(""), batch(0) {}

    explicit RunContext(const std::string& id)
        : run_id(id), phase(""), batch(0) {}
};

/**
 * @brief Counters reported when a run finishes or is cancelled
 */
struct RunMetrics {
    size_t strategies_evaluated;
    size_t strategies_skipped;
    size_t strategies_failed;
    size_t batches;
    double execution_time_ms;

    RunMetrics()
        : strategies_evaluated(0), strategies_skipped(0), strategies_failed(0),
          batches(0), execution_time_ms(0.0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("plancalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("run-1");
 *   logger.log_comparison_start(ctx, plan_fields, 512);
 *   @endcode
 *
 * Writes are serialized so the logger may be called from evaluation workers.
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);
    const LoggerConfig& config() const { return config_; }

    /**
     * @brief Log a configuration file that was parsed
     *
     * @param source File path or "<cli>"
     * @param fields Key settings (premium, period, strategy ranges)
     */
    void log_config_loaded(
        const std::string& source,
        const std::map<std::string, std::string>& fields
    );

    /**
     * @brief Log comparison run start
     *
     * @param ctx Run context
     * @param plan_fields Plan summary
     * @param upper_bound Maximum number of strategies in the catalog
     */
    void log_comparison_start(
        const RunContext& ctx,
        const std::map<std::string, std::string>& plan_fields,
        size_t upper_bound
    );

    /**
     * @brief Log the catalog size after filtering
     */
    void log_catalog_summary(
        const RunContext& ctx,
        size_t strategies,
        size_t skipped
    );

    /**
     * @brief Log one evaluated strategy (DEBUG)
     */
    void log_strategy_evaluated(
        const RunContext& ctx,
        const std::string& label,
        double net_benefit
    );

    /**
     * @brief Log a strategy whose evaluation threw
     */
    void log_strategy_failed(
        const RunContext& ctx,
        const std::string& label,
        const std::string& error_message
    );

    void log_comparison_cancelled(
        const RunContext& ctx,
        const RunMetrics& metrics
    );

    void log_comparison_complete(
        const RunContext& ctx,
        const RunMetrics& metrics,
        const std::string& best_label,
        double best_net_benefit
    );

    void log_error(
        const RunContext& ctx,
        const std::string& error_message
    );

    void log_warning(
        const RunContext& ctx,
        const std::string& warning_message
    );

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

    /**
     * @brief Redirect console output (stderr by default); nullptr restores stderr
     */
    void set_console_stream(std::ostream* stream) { console_stream_ = stream; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::ostream* console_stream_;
    std::mutex write_mutex_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::string& timestamp, LogLevel level, const std::string& message,
                            const std::map<std::string, std::string>& fields) const;
    void add_context(std::map<std::string, std::string>& fields, const RunContext& ctx) const;
    void add_metrics(std::map<std::string, std::string>& fields, const RunMetrics& metrics) const;
    void write_output(const std::string& output);
};

} // namespace plancalc

#endif // PLANCALC_LOGGER_HPP
