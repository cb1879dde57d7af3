#include "shortener/mapping_store.hpp"

namespace shortener {

MappingStore::MappingStore(std::unique_ptr<CodeGenerator> generator, size_t max_attempts)
    : generator_(generator ? std::move(generator) : std::make_unique<CodeGenerator>()),
      max_attempts_(max_attempts) {}

std::string MappingStore::put(const std::string& url) {
    if (url.empty())
        throw ValidationError{"url must not be empty"};

    // Uniqueness is decided by try_insert, not here: two threads may draw
    // the same candidate and only one of them gets to write it.
    for (size_t attempt = 0; attempt < max_attempts_; attempt++) {
        std::string code = generator_->next();
        if (try_insert(code, url))
            return code;
    }

    throw ExhaustedError{"no free code after " + std::to_string(max_attempts_) + " attempts"};
}

} // namespace shortener
