/**
 * @file byte_array.cpp
 * @brief Byte-array string codec implementation
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#include <tessera/layout/byte_array.hpp>

#include <fmt/format.h>

namespace tessera::layout {

namespace {

/**
 * @brief Packs up to 31 bytes big-endian into the low end of a word
 */
auto pack_chunk(std::string_view chunk) -> Word {
    Word word;
    for (const char c : chunk) {
        word = (word << 8) | Word{static_cast<u8>(c)};
    }
    return word;
}

auto unpack_chunk(const Word& word, usize length, std::string& out) -> void {
    for (usize i = length; i-- > 0;) {
        out.push_back(static_cast<char>((word >> static_cast<u32>(i * 8)).low_u64() & 0xFF));
    }
}

} // anonymous namespace

auto encode_byte_array(std::string_view text) -> std::vector<Word> {
    const usize full_words = text.size() / BYTES_PER_WORD;
    const usize pending_len = text.size() % BYTES_PER_WORD;

    std::vector<Word> words;
    words.reserve(full_words + 3);
    words.emplace_back(full_words);
    for (usize i = 0; i < full_words; ++i) {
        words.push_back(pack_chunk(text.substr(i * BYTES_PER_WORD, BYTES_PER_WORD)));
    }
    words.push_back(pack_chunk(text.substr(full_words * BYTES_PER_WORD)));
    words.emplace_back(pending_len);
    return words;
}

auto decode_byte_array(std::span<const Word> words) -> Result<std::string> {
    if (words.size() < 3) {
        return make_error(ErrorCode::LAYOUT_INVALID_BYTE_ARRAY,
                          fmt::format("Byte array needs at least 3 words, got {}", words.size()));
    }

    const auto& count = words.front();
    if (!count.fits_u64() || count.low_u64() != words.size() - 3) {
        return make_error(ErrorCode::LAYOUT_INVALID_BYTE_ARRAY,
                          fmt::format("Byte array declares {} data words but carries {}",
                                      count.to_hex(), words.size() - 3));
    }

    const auto& pending_len = words.back();
    if (!pending_len.fits_u64() || pending_len.low_u64() >= BYTES_PER_WORD) {
        return make_error(ErrorCode::LAYOUT_INVALID_BYTE_ARRAY,
                          fmt::format("Pending length {} must be below {}",
                                      pending_len.to_hex(), BYTES_PER_WORD));
    }

    const auto data = words.subspan(1, words.size() - 3);
    for (const auto& word : data) {
        if (word.bit_width() > BYTES_PER_WORD * 8) {
            return make_error(ErrorCode::LAYOUT_INVALID_BYTE_ARRAY,
                              fmt::format("Data word {} exceeds 31 bytes", word.to_hex()));
        }
    }

    const auto& pending = words[words.size() - 2];
    if (pending.bit_width() > pending_len.low_u64() * 8) {
        return make_error(ErrorCode::LAYOUT_INVALID_BYTE_ARRAY,
                          fmt::format("Pending word {} exceeds {} bytes",
                                      pending.to_hex(), pending_len.low_u64()));
    }

    std::string text;
    text.reserve(data.size() * BYTES_PER_WORD + pending_len.low_u64());
    for (const auto& word : data) {
        unpack_chunk(word, BYTES_PER_WORD, text);
    }
    unpack_chunk(pending, pending_len.low_u64(), text);
    return text;
}

} // namespace tessera::layout
