/**
 * @file upgrade_policy.hpp
 * @brief Legality rules for model layout upgrades
 *
 * Re-registering a model under an existing selector is an upgrade. Which
 * layout changes are legal is a policy decision, so the registry takes it
 * as an interface. The default AppendOnlyUpgradePolicy accepts a new layout
 * only if every value readable through the old layout stays readable at
 * the same place:
 *
 * | Old layout | Accepted new layout |
 * |---|---|
 * | Fixed(a) | Fixed(b), len(b) >= len(a), b[i] >= a[i] |
 * | Struct | every old selector kept, same relative order, upgradable layout; new fields anywhere |
 * | Tuple | same arity, items upgradable |
 * | FixedArray | same count, item upgradable |
 * | Array | item upgradable |
 * | ByteArray | ByteArray |
 * | Enum | every old tag kept with upgradable payload; new variants allowed |
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/layout/layout.hpp>

namespace tessera::world {

/**
 * @brief Decides whether a model layout may be replaced by another
 */
class UpgradePolicy {
public:
    virtual ~UpgradePolicy() = default;

    /**
     * @brief Checks an upgrade
     *
     * @param old_layout Currently registered layout
     * @param new_layout Proposed layout
     * @return Success or WORLD_UPGRADE_REJECTED with the reason
     */
    [[nodiscard]] virtual auto check(const layout::Layout& old_layout,
                                     const layout::Layout& new_layout) const -> Result<void> = 0;

protected:
    UpgradePolicy() = default;
    UpgradePolicy(const UpgradePolicy&) = default;
    auto operator=(const UpgradePolicy&) -> UpgradePolicy& = default;
    UpgradePolicy(UpgradePolicy&&) = default;
    auto operator=(UpgradePolicy&&) -> UpgradePolicy& = default;
};

/**
 * @brief Default policy: fields may be added and widened, never removed or narrowed
 *
 * ✨ PURE FUNCTION ✨ (stateless)
 */
class AppendOnlyUpgradePolicy final : public UpgradePolicy {
public:
    [[nodiscard]] auto check(const layout::Layout& old_layout,
                             const layout::Layout& new_layout) const -> Result<void> override;
};

} // namespace tessera::world
