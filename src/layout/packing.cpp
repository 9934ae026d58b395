/**
 * @file packing.cpp
 * @brief Greedy bit-packing implementation
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#include <tessera/layout/packing.hpp>

#include <fmt/format.h>

namespace tessera::layout {

namespace {

auto check_sizes(std::span<const u8> sizes) -> Result<void> {
    for (usize i = 0; i < sizes.size(); ++i) {
        if (sizes[i] == 0 || sizes[i] > PACKING_MAX_BITS) {
            return make_error(ErrorCode::PACKING_INVALID_SIZE,
                              fmt::format("Field {} has size {}, expected 1..={}",
                                          i, sizes[i], PACKING_MAX_BITS));
        }
    }
    return {};
}

} // anonymous namespace

auto packed_size(std::span<const u8> sizes) -> Result<usize> {
    if (auto valid = check_sizes(sizes); !valid) {
        return std::unexpected(valid.error());
    }
    if (sizes.empty()) {
        return usize{0};
    }

    usize words = 1;
    u32 offset = 0;
    for (const auto size : sizes) {
        if (offset + size > PACKING_MAX_BITS) {
            ++words;
            offset = 0;
        }
        offset += size;
    }
    return words;
}

auto pack(std::span<const Word> values, std::span<const u8> sizes) -> Result<std::vector<Word>> {
    if (values.size() != sizes.size()) {
        return make_error(ErrorCode::PACKING_LENGTH_MISMATCH,
                          fmt::format("Got {} values for {} field sizes", values.size(), sizes.size()));
    }
    if (auto valid = check_sizes(sizes); !valid) {
        return std::unexpected(valid.error());
    }

    std::vector<Word> packed;
    Word acc;
    u32 offset = 0;
    for (usize i = 0; i < values.size(); ++i) {
        const u32 size = sizes[i];
        if (values[i].bit_width() > size) {
            return make_error(ErrorCode::PACKING_VALUE_OUT_OF_RANGE,
                              fmt::format("Value {} of field {} does not fit {} bits",
                                          values[i].to_hex(), i, size));
        }
        if (offset + size > PACKING_MAX_BITS) {
            packed.push_back(acc);
            acc = Word{};
            offset = 0;
        }
        acc = acc | (values[i] << offset);
        offset += size;
    }
    if (!values.empty()) {
        packed.push_back(acc);
    }
    return packed;
}

auto unpack(std::span<const Word> words, std::span<const u8> sizes) -> Result<std::vector<Word>> {
    auto expected_words = packed_size(sizes);
    if (!expected_words) {
        return std::unexpected(expected_words.error());
    }
    if (words.size() != *expected_words) {
        return make_error(ErrorCode::PACKING_WORD_COUNT_MISMATCH,
                          fmt::format("Expected {} packed words, got {}", *expected_words, words.size()));
    }

    std::vector<Word> values;
    values.reserve(sizes.size());
    usize index = 0;
    u32 offset = 0;
    for (const auto size : sizes) {
        if (offset + size > PACKING_MAX_BITS) {
            ++index;
            offset = 0;
        }
        values.push_back((words[index] >> offset) & Word::mask(size));
        offset += size;
    }
    return values;
}

} // namespace tessera::layout
