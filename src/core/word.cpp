/**
 * @file word.cpp
 * @brief Word conversions (hex text, big-endian bytes)
 *
 * @author LukeFrankio
 * @date 2025-10-09
 */

#include <tessera/core/word.hpp>

#include <fmt/format.h>

namespace tessera {

namespace {

/**
 * @brief Converts one hex digit to its value
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return Digit value, or -1 for non-hex characters
 */
constexpr auto hex_digit_value(char c) noexcept -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

auto Word::from_bytes_be(std::span<const u8, BYTES> bytes) noexcept -> Word {
    Word word;
    for (u32 i = 0; i < BYTES; ++i) {
        // bytes[0] is the most significant byte
        const u32 bit = (BYTES - 1 - i) * 8;
        word.limbs_[bit / 64] |= static_cast<u64>(bytes[i]) << (bit % 64);
    }
    return word;
}

auto Word::from_hex(std::string_view text) -> Result<Word> {
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }

    if (text.empty() || text.size() > 64) {
        return make_error(ErrorCode::CORE_INVALID_HEX,
                          fmt::format("Invalid hex word length: '{}'", text));
    }

    Word word;
    u32 bit = 0;
    for (auto it = text.rbegin(); it != text.rend(); ++it, bit += 4) {
        const int digit = hex_digit_value(*it);
        if (digit < 0) {
            return make_error(ErrorCode::CORE_INVALID_HEX,
                              fmt::format("Invalid hex digit '{}' in '{}'", *it, text));
        }
        word.limbs_[bit / 64] |= static_cast<u64>(digit) << (bit % 64);
    }
    return word;
}

auto Word::to_hex() const -> std::string {
    std::string out = "0x";
    bool leading = true;
    for (u32 i = LIMBS; i-- > 0;) {
        if (leading) {
            if (limbs_[i] == 0 && i != 0) {
                continue;
            }
            out += fmt::format("{:x}", limbs_[i]);
            leading = false;
        } else {
            out += fmt::format("{:016x}", limbs_[i]);
        }
    }
    return out;
}

auto Word::to_bytes_be() const noexcept -> std::array<u8, BYTES> {
    std::array<u8, BYTES> bytes{};
    for (u32 i = 0; i < BYTES; ++i) {
        const u32 bit = (BYTES - 1 - i) * 8;
        bytes[i] = static_cast<u8>(limbs_[bit / 64] >> (bit % 64));
    }
    return bytes;
}

} // namespace tessera
