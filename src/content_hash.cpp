#include "bulkfetch/content_hash.hpp"

#include <array>
#include <cstdio>
#include <stdexcept>

#include <fmt/format.h>
#include <openssl/evp.h>

namespace bulkfetch {

class Sha256::Impl {
public:
    Impl() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize SHA-256 context");
        }
    }

    void update(const void* data, std::size_t size) {
        if (size == 0) {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    std::string hexDigest() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
            throw std::runtime_error("SHA-256 finalize failed");
        }

        std::string hex;
        hex.reserve(length * 2);
        for (unsigned int i = 0; i < length; ++i) {
            hex += fmt::format("{:02x}", digest[i]);
        }
        return hex;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {}

Sha256::~Sha256() = default;

void Sha256::update(const void* data, std::size_t size) { impl_->update(data, size); }

std::string Sha256::hexDigest() { return impl_->hexDigest(); }

std::string sha256Hex(const std::string& data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.hexDigest();
}

std::string sha256File(const std::filesystem::path& path) {
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::unique_ptr<FILE, FileDeleter> file{std::fopen(path.c_str(), "rb")};
    if (!file) {
        throw std::runtime_error("Cannot open file for hashing: " + path.string());
    }

    Sha256 hasher;
    std::array<char, 64 * 1024> buffer{};
    std::size_t read = 0;
    while ((read = std::fread(buffer.data(), 1, buffer.size(), file.get())) > 0) {
        hasher.update(buffer.data(), read);
    }
    if (std::ferror(file.get())) {
        throw std::runtime_error("Read error while hashing: " + path.string());
    }
    return hasher.hexDigest();
}

} // namespace bulkfetch
