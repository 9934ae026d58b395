/**
 * @file addressing.cpp
 * @brief Hash-chained addressing
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#include <tessera/storage/addressing.hpp>
#include <tessera/core/hash.hpp>

namespace tessera::storage {

auto entity_id(std::span<const Word> keys) -> Result<Word> {
    return hash::hash_words(keys);
}

auto field_key(const Word& parent, const Word& selector) -> Result<Word> {
    return hash::hash_words({parent, selector});
}

auto slot_base(const Word& model, const Word& key) -> Result<Word> {
    return hash::hash_words({model, key});
}

auto slot_address(const Word& model, const Word& key, u64 index) -> Result<Word> {
    auto base = slot_base(model, key);
    if (!base) {
        return std::unexpected(base.error());
    }
    return *base + Word{index};
}

} // namespace tessera::storage
