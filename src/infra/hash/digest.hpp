#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace blockcopy::infra {

// Быстрый отпечаток блока (xxHash64)
using BlockFingerprint = XXH64_hash_t;

// Отпечаток всего файла (SHA-256)
using FileFingerprint = std::array<unsigned char, 32>;

class DigestService {
public:
    // xxHash64 от буфера, seed = 0
    [[nodiscard]] static auto digest_block(std::span<const char> bytes) -> BlockFingerprint;

    // SHA-256 файла, читается потоково
    [[nodiscard]] static auto digest_file(const std::filesystem::path& path)
        -> Result<FileFingerprint>;

    [[nodiscard]] static auto to_hex(BlockFingerprint fingerprint) -> std::string;
    [[nodiscard]] static auto to_hex(const FileFingerprint& fingerprint) -> std::string;

private:
    static constexpr std::size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace blockcopy::infra
