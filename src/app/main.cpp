#include "tabula/Config.h"
#include "tabula/Engine.h"
#include "tabula/Errors.h"
#include "tabula/Logger.h"
#include "tabula/Printer.h"
#include "tabula/StatementReader.h"

#include <fstream>
#include <iostream>
#include <exception>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    using namespace tabula;

    Config cfg;
    try {
        cfg = Config::fromCommandLine(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << '\n' << Config::usage(argv[0]);
        return 2;
    }
    if (cfg.showHelp) {
        std::cout << Config::usage(argv[0]);
        return 0;
    }

    Logger logger{cfg.logLevel, &std::clog, cfg.logFile};
    Printer printer{std::cout, std::cerr};

    // a database file that cannot be loaded stops startup
    std::unique_ptr<Engine> engine;
    try {
        engine = std::make_unique<Engine>(cfg, logger);
    } catch (const DbError& e) {
        logger.error(std::string{"cannot open database: "} + e.what());
        return 1;
    }

    std::ifstream script;
    if (cfg.script) {
        script.open(*cfg.script);
        if (!script) {
            logger.error("cannot open script " + *cfg.script);
            return 1;
        }
    }
    StatementReader reader{cfg.script ? static_cast<std::istream&>(script) : std::cin};

    if (reader.readsFromCin())
        printer.printHelpMessage(argv[0]);

    while (true) {
        if (reader.readsFromCin())
            reader.printPrompt();

        auto stmtTextOpt = reader.next();
        if (!stmtTextOpt)
            break; // EOF

        const std::string& stmtText = *stmtTextOpt;
        if (stmtText == "exit" || stmtText == "quit")
            break;

        try {
            printer.printResult(engine->submit(stmtText));
        } catch (const DbError& e) {
            printer.printError(e);
        } catch (const std::exception& e) {
            logger.error(std::string{"unexpected failure: "} + e.what());
            printer.printError(e);
        }
    }
    return 0;
}
