#include "digest.hpp"
#include <fstream>
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <openssl/evp.h>

namespace blockcopy::infra {

namespace {

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

} // namespace

auto DigestService::digest_block(std::span<const char> bytes) -> BlockFingerprint {
    return XXH64(bytes.data(), bytes.size(), 0);
}

auto DigestService::digest_file(const std::filesystem::path& path)
    -> Result<FileFingerprint>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    EvpContext ctx{EVP_MD_CTX_new()};
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to initialise SHA-256 context"));
    }

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(file.gcount())) != 1) {
            return std::unexpected(make_error(ErrorCode::Unknown, "SHA-256 update failed"));
        }
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::ReadFailed,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    FileFingerprint digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 || digest_len != digest.size()) {
        return std::unexpected(make_error(ErrorCode::Unknown, "SHA-256 finalisation failed"));
    }

    return digest;
}

auto DigestService::to_hex(BlockFingerprint fingerprint) -> std::string {
    return fmt::format("{:016x}", fingerprint);
}

auto DigestService::to_hex(const FileFingerprint& fingerprint) -> std::string {
    std::string out;
    out.reserve(fingerprint.size() * 2);
    for (auto byte : fingerprint) {
        out += fmt::format("{:02x}", byte);
    }
    return out;
}

} // namespace blockcopy::infra
