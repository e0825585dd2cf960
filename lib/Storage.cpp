#include "tabula/Storage.h"

#include "tabula/Errors.h"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace tabula {

using json = nlohmann::json;

namespace {

json valueToJson(const RowValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v))
        return json(*i);
    return json(std::get<std::string>(v));
}

RowValue valueFromJson(const json& j) {
    if (j.is_string())
        return RowValue{j.get<std::string>()};
    if (j.is_number_unsigned()) {
        const auto u = j.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw FormatError("integer value out of range");
        return RowValue{static_cast<int64_t>(u)};
    }
    if (j.is_number_integer())
        return RowValue{j.get<int64_t>()};
    throw FormatError("cell must be an integer or a string, got " + std::string{j.type_name()});
}

ColumnType typeFromJson(const json& j) {
    const auto name = j.get<std::string>();
    if (name == toString(ColumnType::Int))
        return ColumnType::Int;
    if (name == toString(ColumnType::Text))
        return ColumnType::Text;
    throw FormatError("unknown column type '" + name + "'");
}

json tableToJson(const std::string& name, const Table& table) {
    json cols = json::array();
    for (const auto& c : table.getSchema().columns()) {
        cols.push_back({{"name", c.name},
                        {"type", toString(c.type)},
                        {"primary", c.primaryKey},
                        {"unique", c.unique}});
    }

    json rows = json::array();
    for (const auto& r : table.rows()) {
        json cells = json::array();
        for (const auto& v : r.values())
            cells.push_back(valueToJson(v));
        rows.push_back(std::move(cells));
    }

    return json{{"name", name}, {"columns", std::move(cols)}, {"rows", std::move(rows)}};
}

void tableFromJson(const json& jt, Database& db) {
    const auto name = jt.at("name").get<std::string>();

    std::vector<Column> cols;
    for (const auto& jc : jt.at("columns")) {
        Column c;
        c.name = jc.at("name").get<std::string>();
        c.type = typeFromJson(jc.at("type"));
        c.primaryKey = jc.at("primary").get<bool>();
        c.unique = jc.at("unique").get<bool>();
        cols.push_back(std::move(c));
    }

    std::vector<Row> rows;
    const auto& jrows = jt.at("rows");
    if (!jrows.is_array())
        throw FormatError("rows of table '" + name + "' is not an array");
    rows.reserve(jrows.size());
    for (const auto& jr : jrows) {
        if (!jr.is_array())
            throw FormatError("row of table '" + name + "' is not an array");
        std::vector<RowValue> cells;
        cells.reserve(jr.size());
        for (const auto& jv : jr)
            cells.push_back(valueFromJson(jv));
        rows.emplace_back(std::move(cells));
    }

    // restore() checks every row against the schema and rebuilds the indexes
    db.adoptTable(name, Table::restore(Schema{std::move(cols)}, std::move(rows)));
}

// write + fsync + close; the first failure wins
std::error_code writeDurably(const std::filesystem::path& path, std::string_view data) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        return std::error_code(errno, std::generic_category());

    std::error_code status;
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            status = std::error_code(errno, std::generic_category());
            break;
        }
        written += static_cast<std::size_t>(n);
    }

    if (!status && ::fsync(fd) != 0)
        status = std::error_code(errno, std::generic_category());
    if (::close(fd) != 0 && !status)
        status = std::error_code(errno, std::generic_category());
    return status;
}

// Best effort: some filesystems refuse fsync on a directory descriptor.
void syncDirectory(const std::filesystem::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
        return;
    static_cast<void>(::fsync(fd));
    static_cast<void>(::close(fd));
}

} // namespace

Storage::Storage(std::filesystem::path file) : file_(std::move(file)) {}

std::string Storage::serialize(const Database& db) {
    json tables = json::array();
    for (const auto& name : db.tableNames())
        tables.push_back(tableToJson(name, db.getTable(name)));

    json doc{{"format", std::string{kFormatTag}}, {"version", kFormatVersion}, {"tables", std::move(tables)}};
    return doc.dump(2) + "\n";
}

Database Storage::deserialize(std::string_view document) {
    try {
        const json doc = json::parse(document.begin(), document.end());
        if (!doc.is_object())
            throw FormatError("top level is not an object");
        if (doc.at("format").get<std::string>() != kFormatTag)
            throw FormatError("not a tabula database");
        const int version = doc.at("version").get<int>();
        if (version != kFormatVersion)
            throw FormatError("unsupported version " + std::to_string(version));

        const auto& tables = doc.at("tables");
        if (!tables.is_array())
            throw FormatError("tables is not an array");

        Database db;
        for (const auto& jt : tables)
            tableFromJson(jt, db);
        return db;
    } catch (const FormatError&) {
        throw;
    } catch (const DbError& e) {
        // schema or row data breaking a table invariant
        throw FormatError(e.what());
    } catch (const json::exception& e) {
        throw FormatError(e.what());
    }
}

void Storage::save(const Database& db) const {
    std::string doc;
    try {
        doc = serialize(db);
    } catch (const json::exception& e) {
        // nothing was written; the caller rolls back like any other failed save
        throw IoError(std::string{"cannot encode database: "} + e.what());
    }

    std::filesystem::path tmp = file_;
    tmp += ".tmp";
    if (const std::error_code ec = writeDurably(tmp, doc)) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw IoError("cannot write " + tmp.string() + ": " + ec.message());
    }

    std::error_code ec;
    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw IoError("cannot replace " + file_.string() + ": " + ec.message());
    }

    // Makes the rename itself survive a power loss. The new document is
    // already in place at this point, so a failure here cannot be undone and
    // is not reported as a failed save.
    syncDirectory(file_.has_parent_path() ? file_.parent_path() : std::filesystem::path{"."});
}

Database Storage::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        if (ec)
            throw IoError("cannot stat " + file_.string() + ": " + ec.message());
        return Database{};
    }

    std::ifstream in(file_, std::ios::binary);
    if (!in)
        throw IoError("cannot open " + file_.string());
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad())
        throw IoError("read of " + file_.string() + " failed");

    return deserialize(buf.str());
}

} // namespace tabula
