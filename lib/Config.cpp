#include "tabula/Config.h"

#include <cstdlib>

namespace tabula {

static LogLevel requireLogLevel(const std::string& value, const std::string& source) {
    if (auto level = parseLogLevel(value))
        return *level;
    throw ConfigError("invalid log level '" + value + "' in " + source);
}

Config Config::load(const std::vector<std::string>& args, const EnvLookup& env) {
    Config cfg;

    // ---- environment ----
    if (auto v = env("TABULA_DATA_FILE"); v && !v->empty())
        cfg.dataFile = *v;
    if (auto v = env("TABULA_LOG_LEVEL"); v && !v->empty())
        cfg.logLevel = requireLogLevel(*v, "TABULA_LOG_LEVEL");
    if (auto v = env("TABULA_LOG_FILE"); v)
        cfg.logFile = *v;

    // ---- command line ----
    auto value = [&](std::size_t& i) -> const std::string& {
        if (i + 1 >= args.size())
            throw ConfigError("option " + args[i] + " needs a value");
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--data") {
            cfg.dataFile = value(i);
        } else if (a == "--memory") {
            cfg.inMemory = true;
        } else if (a == "--log-level") {
            cfg.logLevel = requireLogLevel(value(i), "--log-level");
        } else if (a == "--log-file") {
            cfg.logFile = value(i);
        } else if (a == "--help" || a == "-h") {
            cfg.showHelp = true;
        } else if (!a.empty() && a.front() == '-') {
            throw ConfigError("unknown option " + a);
        } else if (cfg.script) {
            throw ConfigError("only one script file may be given");
        } else {
            cfg.script = a;
        }
    }
    return cfg;
}

Config Config::fromCommandLine(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    return load(args, [](const std::string& name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name.c_str()))
            return std::string{v};
        return std::nullopt;
    });
}

std::string Config::usage(std::string_view prog) {
    std::string out{prog};
    out += " [options] [script]\n"
           "  --data <path>         database file (default database.json, env TABULA_DATA_FILE)\n"
           "  --memory              keep everything in memory, never touch disk\n"
           "  --log-level <level>   debug|info|warn|error (env TABULA_LOG_LEVEL)\n"
           "  --log-file <path>     also append log lines to this file (env TABULA_LOG_FILE)\n"
           "  -h, --help            show this message\n";
    return out;
}

} // namespace tabula
