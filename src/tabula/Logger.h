#ifndef TABULA_LOGGER_H
#define TABULA_LOGGER_H

#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tabula {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] const char* toString(LogLevel level) noexcept;
// case-insensitive "debug" / "info" / "warn" / "error"
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view s);

// Thread-safe line logger: "2026-10-19 12:00:00 [INFO] message".
// Writes to a console stream (may be null) and, if a file name is given,
// appends to that file.
class Logger {
  public:
    explicit Logger(LogLevel level = LogLevel::Info, std::ostream* console = &std::clog,
                    const std::string& filename = "");

    void setLevel(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

  private:
    LogLevel level_;
    std::ostream* console_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

} // namespace tabula

#endif // TABULA_LOGGER_H
