#ifndef TABULA_STORAGE_H
#define TABULA_STORAGE_H

#include "Database.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace tabula {

// Durable copy of the catalog: one JSON document holding every table's
// schema and rows. Constraint indexes are never written; load() rebuilds
// them from the rows.
class Storage {
  public:
    static constexpr std::string_view kFormatTag = "tabula";
    static constexpr int kFormatVersion = 1;

    explicit Storage(std::filesystem::path file);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return file_; }

    // Writes and fsyncs "<file>.tmp", renames it over the file, then syncs the
    // directory. Throws IoError, including when the catalog cannot be encoded.
    void save(const Database& db) const;

    // Missing file -> empty database. Throws IoError if the file cannot be
    // read and FormatError if it is malformed or breaks a table invariant.
    [[nodiscard]] Database load() const;

    [[nodiscard]] static std::string serialize(const Database& db);
    [[nodiscard]] static Database deserialize(std::string_view document); // throws FormatError

  private:
    std::filesystem::path file_;
};

} // namespace tabula

#endif // TABULA_STORAGE_H
