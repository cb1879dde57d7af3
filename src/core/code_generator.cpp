#include "shortener/code_generator.hpp"

#include <stdexcept>

namespace shortener {

CodeGenerator::CodeGenerator(size_t length)
    : length_(length), engine_(std::random_device{}()), dist_(0, kCodeAlphabet.size() - 1) {
    if (length_ == 0)
        throw std::invalid_argument("code length must be positive");
}

std::string CodeGenerator::next() {
    std::string code;
    code.reserve(length_);

    std::lock_guard lock(mutex_);
    for (size_t i = 0; i < length_; i++)
        code.push_back(kCodeAlphabet[dist_(engine_)]);
    return code;
}

} // namespace shortener
