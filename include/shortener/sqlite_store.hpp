#pragma once

#include "shortener/mapping_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

struct sqlite3;

namespace shortener {

/*
 * Durable mapping store backed by an SQLite database file.
 *
 * Inserts go through a single writer connection and commit before put()
 * returns. Lookups borrow a connection from a reader pool, so they run
 * alongside each other and alongside the writer (WAL journal).
 */
class SqliteMappingStore : public MappingStore {
public:
    enum class OpenMode {
        ReadWrite, // create file and schema when missing
        ReadOnly   // file and schema must already exist
    };

    // Throws StorageError if the database cannot be opened or initialised
    explicit SqliteMappingStore(const std::filesystem::path& path,
                                OpenMode mode = OpenMode::ReadWrite,
                                std::unique_ptr<CodeGenerator> generator = nullptr,
                                size_t max_attempts = kDefaultMaxAttempts);
    ~SqliteMappingStore() override;

    std::optional<std::string> get(const std::string& code) const override;
    std::vector<Mapping> list() const override;
    size_t size() const override;

    const std::filesystem::path& path() const noexcept { return path_; }

protected:
    bool try_insert(const std::string& code, const std::string& url) override;

private:
    struct Closer {
        void operator()(sqlite3* db) const noexcept;
    };
    using Handle = std::unique_ptr<sqlite3, Closer>;

    // Returns a pooled reader to the pool when it goes out of scope
    class ReaderLease {
    public:
        ReaderLease(const SqliteMappingStore& store, Handle handle);
        ~ReaderLease();
        ReaderLease(const ReaderLease&) = delete;
        ReaderLease& operator=(const ReaderLease&) = delete;
        sqlite3* get() const noexcept { return handle_.get(); }
    private:
        const SqliteMappingStore& store_;
        Handle handle_;
    };

    Handle open_connection() const;
    ReaderLease acquire_reader() const;

    std::filesystem::path path_;
    OpenMode mode_;

    Handle writer_;
    std::mutex writer_mutex_;

    mutable std::vector<Handle> idle_readers_;
    mutable size_t reader_count_{0};
    mutable std::mutex readers_mutex_;
};

} // namespace shortener
