/*
 * parafetch/src/downloader/integrity_verifier.cpp
 *
 * Streaming digests via OpenSSL EVP (SHA-256, SHA-512, MD5) and the post-assembly checks:
 * - verifyFileSize: assembled length against the probed total
 * - verifyFileDigest: file streamed through the verifier in fixed-size buffers,
 *   hex compared case-insensitively
 *
 * Dependencies:
 * - OpenSSL::Crypto (linked by CMake in the parafetch_downloader target)
 */

#include <parafetch/downloader/downloader.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace parafetch::downloader {

namespace fs = std::filesystem;

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
        case HashAlgo::Md5:
            return EVP_md5();
    }
    return EVP_sha256();
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_hex(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

std::size_t digest_hex_length(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return 64;
        case HashAlgo::Sha512:
            return 128;
        case HashAlgo::Md5:
            return 32;
    }
    return 64;
}

const char* algo_name(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return "sha256";
        case HashAlgo::Sha512:
            return "sha512";
        case HashAlgo::Md5:
            return "md5";
    }
    return "sha256";
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit OpenSslIntegrityVerifier(HashAlgo algo) { reset(algo); }

    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        _algo = algo;
        _ctx.reset(EVP_MD_CTX_new());
        if (!_ctx)
            return;
        if (EVP_DigestInit_ex(_ctx.get(), resolve_algo(_algo), nullptr) != 1) {
            // update/finalize become no-ops and finalize() reports an empty digest
            _ctx.reset();
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.get(), data.data(), data.size()) != 1) {
            _ctx.reset();
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;
        if (!_ctx)
            return out;

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.get(), md_buf.data(), &md_len) == 1) {
            out.hex = to_hex_lower(md_buf.data(), md_len);
        }

        // Ready for reuse with the same algorithm
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    EvpMdCtxPtr _ctx;
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<OpenSslIntegrityVerifier>(algo);
}

Expected<Checksum> parseChecksum(std::string_view text) {
    Checksum out;
    std::string_view hex = text;
    auto colon = text.find(':');
    if (colon != std::string_view::npos) {
        auto algo = to_lower(text.substr(0, colon));
        hex = text.substr(colon + 1);
        if (algo == "sha256") {
            out.algo = HashAlgo::Sha256;
        } else if (algo == "sha512") {
            out.algo = HashAlgo::Sha512;
        } else if (algo == "md5") {
            out.algo = HashAlgo::Md5;
        } else {
            return Error{ErrorCode::InvalidArgument, "Unsupported checksum algorithm: " + algo};
        }
    }
    if (!is_hex(hex) || hex.size() != digest_hex_length(out.algo)) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid " + std::string(algo_name(out.algo)) + " digest: " +
                         std::string(hex)};
    }
    out.hex = to_lower(hex);
    return out;
}

Expected<std::string> computeFileDigest(const fs::path& path, HashAlgo algo,
                                        std::size_t bufferBytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open for hashing: " + path.string()};
    }

    auto verifier = makeIntegrityVerifier(algo);
    std::vector<char> buffer(bufferBytes > 0 ? bufferBytes : 1024 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto read = in.gcount();
        if (read > 0) {
            verifier->update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(read)));
        }
    }
    if (!in.eof()) {
        return Error{ErrorCode::IoError, "read failed while hashing: " + path.string()};
    }

    auto result = verifier->finalize();
    if (result.hex.empty()) {
        return Error{ErrorCode::Unknown, "Failed to finalize checksum"};
    }
    return result.hex;
}

Expected<void> verifyFileSize(const fs::path& path, std::uint64_t expected) {
    std::error_code ec;
    const auto actual = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to stat " + path.string() + ": " + ec.message()};
    }
    if (actual != expected) {
        return Error{ErrorCode::SizeMismatch, "Size mismatch: assembled " +
                                                  std::to_string(actual) + " vs expected " +
                                                  std::to_string(expected)};
    }
    return Expected<void>{};
}

Expected<void> verifyFileDigest(const fs::path& path, const Checksum& expected,
                                std::size_t bufferBytes) {
    auto digest = computeFileDigest(path, expected.algo, bufferBytes);
    if (!digest.ok())
        return digest.error();
    if (to_lower(digest.value()) != to_lower(expected.hex)) {
        return Error{ErrorCode::ChecksumMismatch,
                     std::string(algo_name(expected.algo)) + " mismatch: got " + digest.value() +
                         ", expected " + to_lower(expected.hex)};
    }
    spdlog::info("{} verified: {}", algo_name(expected.algo), digest.value());
    return Expected<void>{};
}

} // namespace parafetch::downloader
