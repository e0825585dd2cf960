#include "tabula/Engine.h"

#include "tabula/Errors.h"

#include <mutex>

namespace tabula {

Engine::Engine(const Config& cfg, Logger& logger) : logger_(logger) {
    if (cfg.inMemory) {
        logger_.info("running in memory, nothing will be saved");
        return;
    }

    storage_.emplace(cfg.dataFile);
    db_ = storage_->load();
    logger_.info("loaded " + std::to_string(db_.tableCount()) + " table(s) from " +
                 cfg.dataFile.string());
}

ExecResult Engine::submit(std::string_view sql) {
    try {
        // parsing needs no lock
        const Statement st = parser_.prepareStatement(sql);

        if (isReadOnly(st)) {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return StatementExecutor{db_, storage()}.execSelect(std::get<Select>(st));
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        ExecResult result = StatementExecutor{db_, storage()}.execute(st);
        if (const auto* created = std::get_if<TableCreated>(&result))
            logger_.debug("created table '" + created->table + "'");
        else if (const auto* inserted = std::get_if<RowInserted>(&result))
            logger_.debug("inserted row into '" + inserted->table + "'");
        return result;
    } catch (const IoError& e) {
        logger_.error(std::string{"save failed, statement rolled back: "} + e.what());
        throw;
    } catch (const DbError& e) {
        logger_.debug(std::string{"statement rejected: "} + e.what());
        throw;
    }
}

Database Engine::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return db_;
}

} // namespace tabula
