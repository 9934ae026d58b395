/**
 * @file hash.cpp
 * @brief SHA-256 hashing through the OpenSSL EVP interface
 *
 * @author LukeFrankio
 * @date 2025-10-09
 */

#include <tessera/core/hash.hpp>

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <vector>

namespace tessera::hash {

namespace {

struct DigestContextDeleter {
    auto operator()(EVP_MD_CTX* ctx) const noexcept -> void {
        EVP_MD_CTX_free(ctx);
    }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

/**
 * @brief Runs SHA-256 over one contiguous buffer and truncates to DIGEST_BITS
 *
 * ⚠️ IMPURE (allocates an OpenSSL context)
 */
auto digest(const u8* data, usize size) -> Result<Word> {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return make_error(ErrorCode::CORE_HASH_FAILURE, "EVP_MD_CTX_new failed");
    }

    std::array<u8, Word::BYTES> out{};
    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        return make_error(ErrorCode::CORE_HASH_FAILURE, "EVP sha256 digest failed");
    }

    if (out_len != out.size()) {
        return make_error(ErrorCode::CORE_HASH_FAILURE, "Unexpected SHA-256 digest length");
    }

    return Word::from_bytes_be(out) & Word::mask(DIGEST_BITS);
}

} // anonymous namespace

auto hash_words(std::span<const Word> words) -> Result<Word> {
    std::vector<u8> buffer;
    buffer.reserve(words.size() * Word::BYTES);
    for (const auto& word : words) {
        const auto bytes = word.to_bytes_be();
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }
    return digest(buffer.data(), buffer.size());
}

auto hash_words(std::initializer_list<Word> words) -> Result<Word> {
    return hash_words(std::span<const Word>(words.begin(), words.size()));
}

auto hash_bytes(std::string_view bytes) -> Result<Word> {
    return digest(reinterpret_cast<const u8*>(bytes.data()), bytes.size());
}

auto selector_from_name(std::string_view name) -> Result<Word> {
    return hash_bytes(name);
}

} // namespace tessera::hash
