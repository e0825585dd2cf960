#ifndef TABULA_ENGINE_H
#define TABULA_ENGINE_H

#include "Config.h"
#include "Database.h"
#include "Logger.h"
#include "Parser.h"
#include "StatementExecutor.h"
#include "Storage.h"

#include <optional>
#include <shared_mutex>
#include <string_view>
#include <utility>

namespace tabula {

// Shares one Database between concurrent callers. SELECT runs under a
// shared lock; CREATE TABLE and INSERT run under an exclusive lock that also
// covers the synchronous save, so whatever the next caller sees is already
// on disk. One lock acquisition per statement, never nested.
class Engine {
  public:
    // Loads cfg.dataFile (empty database if the file does not exist) unless
    // cfg.inMemory. Throws IoError / FormatError: a database that cannot be
    // read must stop startup rather than be replaced by an empty one.
    Engine(const Config& cfg, Logger& logger);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // lex -> parse -> lock -> execute -> unlock. Throws a DbError subclass.
    ExecResult submit(std::string_view sql);

    // Deep copy of the catalog taken under a shared lock.
    [[nodiscard]] Database snapshot() const;

    // Runs fn(const Database&) while holding the shared lock. fn must not
    // call back into submit() for a mutating statement.
    template <class Fn> decltype(auto) withSnapshot(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::forward<Fn>(fn)(std::as_const(db_));
    }

    [[nodiscard]] bool persistent() const noexcept { return storage_.has_value(); }

  private:
    [[nodiscard]] const Storage* storage() const noexcept {
        return storage_ ? &*storage_ : nullptr;
    }

    mutable std::shared_mutex mutex_;
    std::optional<Storage> storage_;
    Database db_;
    Parser parser_;
    Logger& logger_;
};

} // namespace tabula

#endif // TABULA_ENGINE_H
