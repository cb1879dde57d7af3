#pragma once

#include "shortener/mapping_store.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace shortener {

/*
 * Thread-safe in-memory mapping store.
 * Nothing survives the process, used where durability does not matter.
 */
class MemoryMappingStore : public MappingStore {
public:
    using MappingStore::MappingStore;

    std::optional<std::string> get(const std::string& code) const override;
    std::vector<Mapping> list() const override;
    size_t size() const override;

protected:
    bool try_insert(const std::string& code, const std::string& url) override;

private:
    std::unordered_map<std::string, std::string> data_;
    mutable std::shared_mutex mutex_;
};

} // namespace shortener
