/**
 * @file word.hpp
 * @brief 256-bit storage word (one addressable slot of the substrate)
 *
 * Every storage address and every stored value is a Word. Words are plain
 * unsigned 256-bit integers stored as four little-endian 64-bit limbs. Only
 * the operations the engine actually needs are provided: bitwise logic,
 * shifts (bit-packing), wrapping addition (slot offsets), ordering, and
 * hex/byte conversions (hashing, snapshots, logs).
 *
 * ✨ IMMUTABLE VALUE TYPE ✨
 *
 * @author LukeFrankio
 * @date 2025-10-09
 */

#pragma once

#include <tessera/core/types.hpp>

#include <array>
#include <compare>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace tessera {

/**
 * @brief Unsigned 256-bit value
 *
 * Constructible implicitly from u64 so value buffers read naturally
 * (`std::vector<Word>{3, 10, 20, 30}`).
 */
class Word {
public:
    static constexpr u32 BITS = 256;   ///< Total bit width
    static constexpr u32 LIMBS = 4;    ///< Number of 64-bit limbs
    static constexpr u32 BYTES = 32;   ///< Size of the big-endian encoding

    using Limbs = std::array<u64, LIMBS>;

    /**
     * @brief Zero word
     *
     * ✨ PURE FUNCTION ✨
     */
    constexpr Word() noexcept = default;

    /**
     * @brief Word holding a 64-bit value
     *
     * ✨ PURE FUNCTION ✨
     *
     * @param value Low 64 bits (upper limbs are zero)
     */
    constexpr Word(u64 value) noexcept : limbs_{value, 0, 0, 0} {}

    /**
     * @brief Builds a word from little-endian limbs (limbs[0] is least significant)
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] static constexpr auto from_limbs(const Limbs& limbs) noexcept -> Word {
        Word word;
        word.limbs_ = limbs;
        return word;
    }

    /**
     * @brief Builds a word from its 32-byte big-endian encoding
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] static auto from_bytes_be(std::span<const u8, BYTES> bytes) noexcept -> Word;

    /**
     * @brief Parses hexadecimal text ("0x" prefix optional, at most 64 digits)
     *
     * ✨ PURE FUNCTION ✨
     *
     * @param text Hex digits
     * @return Parsed word or CORE_INVALID_HEX
     */
    [[nodiscard]] static auto from_hex(std::string_view text) -> Result<Word>;

    /**
     * @brief Mask with the low `bits` bits set (bits >= 256 gives all ones)
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] static constexpr auto mask(u32 bits) noexcept -> Word {
        Word word;
        for (u32 i = 0; i < LIMBS; ++i) {
            const u32 low = i * 64;
            if (bits >= low + 64) {
                word.limbs_[i] = ~u64{0};
            } else if (bits > low) {
                word.limbs_[i] = (u64{1} << (bits - low)) - 1;
            }
        }
        return word;
    }

    /**
     * @brief Lowercase hex with "0x" prefix and no leading zeros ("0x0" for zero)
     */
    [[nodiscard]] auto to_hex() const -> std::string;

    /**
     * @brief 32-byte big-endian encoding (hash input format)
     */
    [[nodiscard]] auto to_bytes_be() const noexcept -> std::array<u8, BYTES>;

    [[nodiscard]] constexpr auto limbs() const noexcept -> const Limbs& { return limbs_; }

    [[nodiscard]] constexpr auto is_zero() const noexcept -> bool {
        return (limbs_[0] | limbs_[1] | limbs_[2] | limbs_[3]) == 0;
    }

    [[nodiscard]] constexpr auto fits_u64() const noexcept -> bool {
        return (limbs_[1] | limbs_[2] | limbs_[3]) == 0;
    }

    /// Low 64 bits (callers check fits_u64() first when truncation matters).
    [[nodiscard]] constexpr auto low_u64() const noexcept -> u64 { return limbs_[0]; }

    /**
     * @brief Number of significant bits (0 for zero)
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] constexpr auto bit_width() const noexcept -> u32 {
        for (u32 i = LIMBS; i-- > 0;) {
            if (limbs_[i] != 0) {
                u32 width = 0;
                for (u64 v = limbs_[i]; v != 0; v >>= 1) {
                    ++width;
                }
                return i * 64 + width;
            }
        }
        return 0;
    }

    // ========== Bitwise Operators ==========

    [[nodiscard]] friend constexpr auto operator&(const Word& a, const Word& b) noexcept -> Word {
        return from_limbs({a.limbs_[0] & b.limbs_[0], a.limbs_[1] & b.limbs_[1],
                           a.limbs_[2] & b.limbs_[2], a.limbs_[3] & b.limbs_[3]});
    }

    [[nodiscard]] friend constexpr auto operator|(const Word& a, const Word& b) noexcept -> Word {
        return from_limbs({a.limbs_[0] | b.limbs_[0], a.limbs_[1] | b.limbs_[1],
                           a.limbs_[2] | b.limbs_[2], a.limbs_[3] | b.limbs_[3]});
    }

    [[nodiscard]] constexpr auto operator~() const noexcept -> Word {
        return from_limbs({~limbs_[0], ~limbs_[1], ~limbs_[2], ~limbs_[3]});
    }

    /// Logical left shift; bits shifted past 255 are dropped.
    [[nodiscard]] friend constexpr auto operator<<(const Word& a, u32 shift) noexcept -> Word {
        if (shift >= BITS) {
            return Word{};
        }
        const u32 limb_shift = shift / 64;
        const u32 bit_shift = shift % 64;
        Word out;
        for (u32 i = LIMBS; i-- > limb_shift;) {
            u64 value = a.limbs_[i - limb_shift] << bit_shift;
            if (bit_shift != 0 && i > limb_shift) {
                value |= a.limbs_[i - limb_shift - 1] >> (64 - bit_shift);
            }
            out.limbs_[i] = value;
        }
        return out;
    }

    /// Logical right shift.
    [[nodiscard]] friend constexpr auto operator>>(const Word& a, u32 shift) noexcept -> Word {
        if (shift >= BITS) {
            return Word{};
        }
        const u32 limb_shift = shift / 64;
        const u32 bit_shift = shift % 64;
        Word out;
        for (u32 i = 0; i + limb_shift < LIMBS; ++i) {
            u64 value = a.limbs_[i + limb_shift] >> bit_shift;
            if (bit_shift != 0 && i + limb_shift + 1 < LIMBS) {
                value |= a.limbs_[i + limb_shift + 1] << (64 - bit_shift);
            }
            out.limbs_[i] = value;
        }
        return out;
    }

    /// Wrapping addition modulo 2^256 (slot offsets from a hashed base).
    [[nodiscard]] friend constexpr auto operator+(const Word& a, const Word& b) noexcept -> Word {
        Word out;
        u64 carry = 0;
        for (u32 i = 0; i < LIMBS; ++i) {
            const u64 sum = a.limbs_[i] + b.limbs_[i];
            const u64 carry_a = sum < a.limbs_[i] ? 1 : 0;
            out.limbs_[i] = sum + carry;
            const u64 carry_b = out.limbs_[i] < sum ? 1 : 0;
            carry = carry_a | carry_b;
        }
        return out;
    }

    // ========== Comparison ==========

    [[nodiscard]] friend constexpr auto operator==(const Word& a, const Word& b) noexcept -> bool = default;

    [[nodiscard]] friend constexpr auto operator<=>(const Word& a, const Word& b) noexcept
        -> std::strong_ordering {
        for (u32 i = LIMBS; i-- > 0;) {
            if (a.limbs_[i] != b.limbs_[i]) {
                return a.limbs_[i] <=> b.limbs_[i];
            }
        }
        return std::strong_ordering::equal;
    }

private:
    Limbs limbs_{};  ///< Little-endian limbs
};

} // namespace tessera

/**
 * @brief Hash function for Word (enables use in std::unordered_map)
 *
 * ✨ PURE FUNCTION ✨
 *
 * @note Words used as keys are mostly hash outputs already, so mixing the
 *       limbs is enough.
 */
template<>
struct std::hash<tessera::Word> {
    [[nodiscard]] auto operator()(const tessera::Word& word) const noexcept -> std::size_t {
        const auto& limbs = word.limbs();
        std::size_t seed = 0;
        for (const auto limb : limbs) {
            seed ^= std::hash<tessera::u64>{}(limb) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
