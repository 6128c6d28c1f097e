/**
 * Logging utilities
 *
 * Timestamped messages to stderr, filtered by a process-wide level.
 */

#ifndef STOCKHOLM_LOGGING_HPP
#define STOCKHOLM_LOGGING_HPP

#include <string>

namespace stockholm {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

void set_log_level(LogLevel level);
LogLevel get_log_level();

/**
 * Write a message if level is at or above the current log level
 * Format: "YYYY-mm-dd HH:MM:SS - LEVEL - message"
 */
void log(LogLevel level, const std::string& message);

/**
 * Parse a log level name (debug, info, warning, error; case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
LogLevel parse_log_level(const std::string& name);

} // namespace stockholm

#endif // STOCKHOLM_LOGGING_HPP
