// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <cstdlib>
#include <random>
#include <string>
#include <string_view>

namespace quarry {

static std::string random_string(size_t len) {
    static constexpr std::string_view kAlphaNum{
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"};

    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<size_t> distribution{0, kAlphaNum.length() - 1};
    std::string s;
    s.reserve(len);
    for (size_t i{0}; i < len; ++i) {
        s += kAlphaNum[distribution(generator)];
    }
    return s;
}

Directory::Directory(const std::filesystem::path& directory_path, bool must_create) {
    if (directory_path.empty()) {
        path_ = std::filesystem::current_path();
    } else {
        path_ = directory_path;
    }
    if (must_create) {
        create();
    }
}

bool Directory::is_empty() const {
    return exists() && std::filesystem::is_empty(path_);
}

const std::filesystem::path& Directory::path() const { return path_; }

void Directory::clear() const {
    if (!exists()) {
        return;
    }
    for (const auto& item : std::filesystem::directory_iterator(path_)) {
        std::filesystem::remove_all(item.path());
    }
}

bool Directory::exists() const { return (std::filesystem::exists(path_) && std::filesystem::is_directory(path_)); }

void Directory::create() {
    if (exists()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        throw std::invalid_argument("Directory " + path_.string() + " does not exist and could not be created");
    }
}

std::filesystem::path TemporaryDirectory::get_unique_temporary_path(const std::filesystem::path& base_path) {
    if (base_path.empty()) {
        throw std::invalid_argument("Temporary base path is empty");
    }

    const auto absolute_base_path{std::filesystem::absolute(base_path)};
    if (!std::filesystem::exists(absolute_base_path) || !std::filesystem::is_directory(absolute_base_path)) {
        throw std::invalid_argument("Path " + absolute_base_path.string() + " does not exist or is not a directory");
    }

    //! Build random paths appending random strings of fixed length to base path
    for (int i = 0; i < 1000; ++i) {
        auto new_absolute_base_path{absolute_base_path / random_string(10)};
        if (!std::filesystem::exists(new_absolute_base_path)) {
            return new_absolute_base_path;
        }
    }

    //! We were unable to find a valid unique non-existent path
    throw std::runtime_error("Unable to find a valid unique non-existent path");
}

std::filesystem::path TemporaryDirectory::get_unique_temporary_path() {
    return TemporaryDirectory::get_unique_temporary_path(std::filesystem::temp_directory_path());
}

std::filesystem::path DataDirectory::get_default_storage_path() {
    // C++11 guarantees some thread safety for std::getenv
    const char* env{std::getenv("XDG_DATA_HOME")};  // NOLINT(concurrency-mt-unsafe)
    if (env) {
        return std::filesystem::path{env} / "quarry";
    }
    env = std::getenv("HOME");  // NOLINT(concurrency-mt-unsafe)
    if (!env) {
        // We don't actually know where to store data, fallback to current directory
        return std::filesystem::current_path() / "quarry";
    }
    return std::filesystem::path{env} / ".local" / "share" / "quarry";
}

}  // namespace quarry
