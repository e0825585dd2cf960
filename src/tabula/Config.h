#ifndef TABULA_CONFIG_H
#define TABULA_CONFIG_H

#include "Logger.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Engine and shell settings. Precedence: command line > environment > defaults.
struct Config {
    std::filesystem::path dataFile = "database.json";
    bool inMemory = false; // no durable storage at all
    LogLevel logLevel = LogLevel::Info;
    std::string logFile; // empty: console only
    std::optional<std::string> script; // shell reads this instead of stdin
    bool showHelp = false;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    // args excludes the program name; throws ConfigError
    [[nodiscard]] static Config load(const std::vector<std::string>& args, const EnvLookup& env);

    // real argv and process environment
    [[nodiscard]] static Config fromCommandLine(int argc, char** argv);

    [[nodiscard]] static std::string usage(std::string_view prog);
};

} // namespace tabula

#endif // TABULA_CONFIG_H
