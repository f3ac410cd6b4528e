#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace warden {

// Incremental SHA-256. Used for code digests and the audit hash chain.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // Finalizes and returns the digest. The object must not be updated afterwards.
    std::array<uint8_t, 32> finish();
    std::string finish_hex();

private:
    uint32_t state_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_len_{0};
    bool finished_{false};
};

std::string sha256_hex(const std::string& s);

// SHA256 of a file's contents (empty string on error)
std::string sha256_hex_file(const std::filesystem::path& path);

// Cryptographically secure random bytes rendered as lowercase hex (2*n chars).
std::string random_hex(size_t n);

} // namespace warden
