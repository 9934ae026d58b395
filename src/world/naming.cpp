/**
 * @file naming.cpp
 * @brief Naming rules and selector derivation
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#include <tessera/world/naming.hpp>
#include <tessera/core/hash.hpp>
#include <tessera/layout/byte_array.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tessera::world {

auto is_name_valid(std::string_view name) noexcept -> bool {
    return !name.empty() && std::ranges::all_of(name, [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_';
    });
}

auto get_tag(std::string_view namespace_name, std::string_view name) -> std::string {
    return fmt::format("{}{}{}", namespace_name, TAG_SEPARATOR, name);
}

auto split_tag(std::string_view tag) -> Result<std::pair<std::string_view, std::string_view>> {
    const auto separator = tag.find(TAG_SEPARATOR);
    if (separator == std::string_view::npos) {
        return make_error(ErrorCode::WORLD_INVALID_NAME,
                          fmt::format("Tag '{}' has no '{}' separator", tag, TAG_SEPARATOR));
    }
    const auto namespace_name = tag.substr(0, separator);
    const auto name = tag.substr(separator + 1);
    if (!is_name_valid(namespace_name) || !is_name_valid(name)) {
        return make_error(ErrorCode::WORLD_INVALID_NAME, fmt::format("Invalid tag '{}'", tag));
    }
    return std::pair{namespace_name, name};
}

auto bytearray_hash(std::string_view text) -> Result<Word> {
    return hash::hash_words(layout::encode_byte_array(text));
}

auto selector_from_names(std::string_view namespace_name, std::string_view name) -> Result<Word> {
    auto namespace_hash = bytearray_hash(namespace_name);
    if (!namespace_hash) {
        return namespace_hash;
    }
    auto name_hash = bytearray_hash(name);
    if (!name_hash) {
        return name_hash;
    }
    return hash::hash_words({*namespace_hash, *name_hash});
}

auto selector_from_tag(std::string_view tag) -> Result<Word> {
    auto parts = split_tag(tag);
    if (!parts) {
        return std::unexpected(parts.error());
    }
    return selector_from_names(parts->first, parts->second);
}

} // namespace tessera::world
