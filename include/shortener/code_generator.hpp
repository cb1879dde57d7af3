#pragma once

#include <cstddef>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace shortener {

inline constexpr std::string_view kCodeAlphabet =
    "abcdefghijklmnopqrstuvwxyz"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "0123456789";

inline constexpr size_t kDefaultCodeLength = 7;

/*
 * Produces random short-code candidates.
 * Safe to share between threads.
 * Candidates are not checked for uniqueness, the store does that.
 */
class CodeGenerator {
public:
    explicit CodeGenerator(size_t length = kDefaultCodeLength);
    virtual ~CodeGenerator() = default;

    CodeGenerator(const CodeGenerator&) = delete;
    CodeGenerator& operator=(const CodeGenerator&) = delete;

    virtual std::string next();

    size_t length() const noexcept { return length_; }

private:
    size_t length_;
    std::mt19937_64 engine_;
    std::uniform_int_distribution<size_t> dist_;
    std::mutex mutex_;
};

} // namespace shortener
