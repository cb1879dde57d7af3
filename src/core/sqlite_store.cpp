#include "shortener/sqlite_store.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <system_error>

namespace shortener {

namespace {

constexpr int kBusyTimeoutMs = 5000;

/*
 * RAII wrapper for a prepared statement.
 * Every SQLite failure is rethrown as StorageError.
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK)
            throw StorageError{"prepare failed: " + std::string{sqlite3_errmsg(db_)}};
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT);
        if (rc != SQLITE_OK)
            throw StorageError{"bind failed: " + std::string{sqlite3_errmsg(db_)}};
    }

    // Returns true while rows are available, false once the statement is done
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)
            return true;
        if (rc == SQLITE_DONE)
            return false;
        throw StorageError{"step failed: " + std::string{sqlite3_errmsg(db_)}};
    }

    std::string text(int column) const {
        auto data = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
        int len = sqlite3_column_bytes(stmt_, column);
        return data ? std::string(data, static_cast<size_t>(len)) : std::string{};
    }

    int64_t integer(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StorageError{msg};
    }
}

} // namespace


void SqliteMappingStore::Closer::operator()(sqlite3* db) const noexcept {
    sqlite3_close_v2(db);
}

SqliteMappingStore::ReaderLease::ReaderLease(const SqliteMappingStore& store, Handle handle)
    : store_(store), handle_(std::move(handle)) {}

SqliteMappingStore::ReaderLease::~ReaderLease() {
    std::lock_guard lock(store_.readers_mutex_);
    store_.idle_readers_.push_back(std::move(handle_));
}


SqliteMappingStore::SqliteMappingStore(const std::filesystem::path& path, OpenMode mode,
                                       std::unique_ptr<CodeGenerator> generator,
                                       size_t max_attempts)
    : MappingStore(std::move(generator), max_attempts), path_(path), mode_(mode) {
    if (mode_ == OpenMode::ReadOnly) {
        // Fails on a missing file or a file without our table
        size();
        return;
    }

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec)
            throw StorageError{"cannot create " + path_.parent_path().string() + ": " + ec.message()};
    }

    writer_ = open_connection();
    exec(writer_.get(), "PRAGMA journal_mode=WAL");
    exec(writer_.get(), "PRAGMA synchronous=FULL");
    exec(writer_.get(),
         "CREATE TABLE IF NOT EXISTS mappings ("
         "  code TEXT PRIMARY KEY NOT NULL,"
         "  url  TEXT NOT NULL"
         ") WITHOUT ROWID");
}

SqliteMappingStore::~SqliteMappingStore() = default;

SqliteMappingStore::Handle SqliteMappingStore::open_connection() const {
    int flags = SQLITE_OPEN_NOMUTEX;
    flags |= mode_ == OpenMode::ReadOnly ? SQLITE_OPEN_READONLY
                                         : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &raw, flags, nullptr);
    Handle db{raw};
    if (rc != SQLITE_OK) {
        std::string reason = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        throw StorageError{"cannot open " + path_.string() + ": " + reason};
    }

    sqlite3_busy_timeout(db.get(), kBusyTimeoutMs);
    return db;
}

SqliteMappingStore::ReaderLease SqliteMappingStore::acquire_reader() const {
    {
        std::lock_guard lock(readers_mutex_);
        if (!idle_readers_.empty()) {
            Handle handle = std::move(idle_readers_.back());
            idle_readers_.pop_back();
            return ReaderLease{*this, std::move(handle)};
        }
    }

    Handle handle = open_connection();
    {
        // Room for every reader ever opened, so handing one back never allocates
        std::lock_guard lock(readers_mutex_);
        idle_readers_.reserve(reader_count_ + 1);
        reader_count_++;
    }
    return ReaderLease{*this, std::move(handle)};
}

bool SqliteMappingStore::try_insert(const std::string& code, const std::string& url) {
    if (!writer_)
        throw StorageError{"store is open read-only"};

    // Autocommit: the row is durable once step() returns
    std::lock_guard lock(writer_mutex_);
    Statement insert(writer_.get(), "INSERT OR IGNORE INTO mappings (code, url) VALUES (?1, ?2)");
    insert.bind(1, code);
    insert.bind(2, url);
    insert.step();
    return sqlite3_changes(writer_.get()) == 1;
}

std::optional<std::string> SqliteMappingStore::get(const std::string& code) const {
    auto reader = acquire_reader();
    Statement select(reader.get(), "SELECT url FROM mappings WHERE code = ?1");
    select.bind(1, code);
    if (!select.step())
        return std::nullopt;
    return select.text(0);
}

std::vector<Mapping> SqliteMappingStore::list() const {
    auto reader = acquire_reader();
    // A single statement reads from one WAL snapshot
    Statement select(reader.get(), "SELECT code, url FROM mappings ORDER BY code");

    std::vector<Mapping> mappings;
    while (select.step())
        mappings.push_back(Mapping{select.text(0), select.text(1)});
    return mappings;
}

size_t SqliteMappingStore::size() const {
    auto reader = acquire_reader();
    Statement count(reader.get(), "SELECT COUNT(*) FROM mappings");
    if (!count.step())
        return 0;
    return static_cast<size_t>(count.integer(0));
}

} // namespace shortener
