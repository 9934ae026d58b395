/**
 * @file memory_backend.cpp
 * @brief MemoryBackend implementation
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#include <tessera/storage/memory_backend.hpp>
#include <tessera/core/logging.hpp>

#include <fmt/format.h>

namespace tessera::storage {

MemoryBackend::MemoryBackend(std::optional<usize> max_slots) : max_slots_(max_slots) {}

auto MemoryBackend::get(const Word& address) const -> Result<Word> {
    const auto it = slots_.find(address);
    return it != slots_.end() ? it->second : Word{};
}

auto MemoryBackend::set(const Word& address, const Word& value) -> Result<void> {
    if (value.is_zero()) {
        slots_.erase(address);
        return {};
    }

    auto it = slots_.find(address);
    if (it != slots_.end()) {
        it->second = value;
        return {};
    }

    if (max_slots_ && slots_.size() >= *max_slots_) {
        LOG_WARN("Storage quota of {} slots exhausted", *max_slots_);
        return make_error(ErrorCode::STORAGE_RESOURCE_EXHAUSTED,
                          fmt::format("Storage quota of {} slots exhausted", *max_slots_));
    }

    slots_.emplace(address, value);
    return {};
}

auto MemoryBackend::for_each_slot(const std::function<void(const Word&, const Word&)>& visitor) const
    -> void {
    for (const auto& [address, value] : slots_) {
        visitor(address, value);
    }
}

} // namespace tessera::storage
