#include "shortener/memory_store.hpp"

#include <algorithm>
#include <mutex>

namespace shortener {

bool MemoryMappingStore::try_insert(const std::string& code, const std::string& url) {
    std::unique_lock lock(mutex_);
    return data_.try_emplace(code, url).second;
}

std::optional<std::string> MemoryMappingStore::get(const std::string& code) const {
    std::shared_lock lock(mutex_);
    auto it = data_.find(code);
    return it != data_.end() ? std::make_optional(it->second) : std::nullopt;
}

std::vector<Mapping> MemoryMappingStore::list() const {
    std::vector<Mapping> mappings;
    {
        std::shared_lock lock(mutex_);
        mappings.reserve(data_.size());
        for (const auto& [code, url] : data_)
            mappings.push_back(Mapping{code, url});
    }

    std::sort(mappings.begin(), mappings.end(), [](const Mapping& a, const Mapping& b) {
        return a.code < b.code;
    });
    return mappings;
}

size_t MemoryMappingStore::size() const {
    std::shared_lock lock(mutex_);
    return data_.size();
}

} // namespace shortener
