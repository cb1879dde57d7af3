#pragma once

#include "shortener/code_generator.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shortener {

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Base of every failure raised by a store
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// Persistence layer failed (I/O, corruption). Nothing was written.
class StorageError : public StoreError {
    using StoreError::StoreError;
};

// Every generated candidate was already taken
class ExhaustedError : public StoreError {
    using StoreError::StoreError;
};

struct Mapping {
    std::string code;
    std::string url;

    bool operator==(const Mapping&) const = default;
};

inline constexpr size_t kDefaultMaxAttempts = 16;

/*
 * Storage API for code -> url mappings.
 *
 * put() owns code assignment: it draws candidates from the generator and
 * hands each one to try_insert() until one is free. Implementations only
 * have to make try_insert() an atomic insert-if-absent.
 * All operations are safe to call from several threads.
 */
class MappingStore {
public:
    explicit MappingStore(std::unique_ptr<CodeGenerator> generator = nullptr,
                          size_t max_attempts = kDefaultMaxAttempts);
    virtual ~MappingStore() = default;

    MappingStore(const MappingStore&) = delete;
    MappingStore& operator=(const MappingStore&) = delete;

    // Stores url under a fresh code and returns the code.
    // Throws ValidationError, StorageError or ExhaustedError.
    std::string put(const std::string& url);

    // Returns std::nullopt if nothing is stored under code
    virtual std::optional<std::string> get(const std::string& code) const = 0;

    // Snapshot of every mapping, ordered by code
    virtual std::vector<Mapping> list() const = 0;

    virtual size_t size() const = 0;

protected:
    // Returns false if code is already taken, in which case nothing is written
    virtual bool try_insert(const std::string& code, const std::string& url) = 0;

private:
    std::unique_ptr<CodeGenerator> generator_;
    size_t max_attempts_;
};

} // namespace shortener
