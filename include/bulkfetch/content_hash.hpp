#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace bulkfetch {

// Incremental SHA-256. Feed chunks with update(), then call hexDigest() once.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, std::size_t size);
    [[nodiscard]] std::string hexDigest();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

std::string sha256Hex(const std::string& data);

// Hashes a file on disk. Throws std::runtime_error if it cannot be read.
std::string sha256File(const std::filesystem::path& path);

} // namespace bulkfetch
