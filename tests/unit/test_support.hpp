#pragma once

#include <gtest/gtest.h>
#include "shortener/code_generator.hpp"

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace shortener::testing {

// Hands out a fixed sequence of candidates, repeating the last one forever
class ScriptedGenerator : public CodeGenerator {
public:
    explicit ScriptedGenerator(std::vector<std::string> codes) : codes_(std::move(codes)) {}

    std::string next() override {
        std::lock_guard lock(mutex_);
        std::string code = codes_[std::min(next_, codes_.size() - 1)];
        next_++;
        return code;
    }

    size_t calls() {
        std::lock_guard lock(mutex_);
        return next_;
    }

private:
    std::vector<std::string> codes_;
    size_t next_{0};
    std::mutex mutex_;
};

// Fresh directory per test, removed afterwards
class TempDir {
public:
    TempDir() {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "shortener_" + std::to_string(::getpid()) + "_" +
                           (info ? std::string{info->test_suite_name()} + "_" + info->name() : "test");
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace shortener::testing
