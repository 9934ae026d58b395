/**
 * @file permissions.cpp
 * @brief AccessControlList implementation
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#include <tessera/world/permissions.hpp>
#include <tessera/core/logging.hpp>

namespace tessera::world {

auto AccessControlList::has(const Grants& grants, const Word& resource, const Word& account)
    -> bool {
    const auto it = grants.find(resource);
    return it != grants.end() && it->second.contains(account);
}

auto AccessControlList::is_owner(const Word& caller, const Word& resource) const -> bool {
    return has(owners_, resource, caller);
}

auto AccessControlList::is_writer(const Word& caller, const Word& resource) const -> bool {
    return has(writers_, resource, caller);
}

auto AccessControlList::can_write(const Word& caller, const Word& resource) const -> bool {
    if (is_owner(caller, resource) || is_writer(caller, resource)) {
        return true;
    }
    const auto ns = namespaces_.find(resource);
    if (ns == namespaces_.end()) {
        return false;
    }
    return is_owner(caller, ns->second) || is_writer(caller, ns->second);
}

auto AccessControlList::grant_owner(const Word& account, const Word& resource) -> void {
    LOG_DEBUG("grant owner {} on {}", account.to_hex(), resource.to_hex());
    owners_[resource].insert(account);
}

auto AccessControlList::grant_writer(const Word& account, const Word& resource) -> void {
    LOG_DEBUG("grant writer {} on {}", account.to_hex(), resource.to_hex());
    writers_[resource].insert(account);
}

auto AccessControlList::revoke_owner(const Word& account, const Word& resource) -> void {
    if (auto it = owners_.find(resource); it != owners_.end()) {
        it->second.erase(account);
    }
}

auto AccessControlList::revoke_writer(const Word& account, const Word& resource) -> void {
    if (auto it = writers_.find(resource); it != writers_.end()) {
        it->second.erase(account);
    }
}

auto AccessControlList::bind_namespace(const Word& resource, const Word& namespace_selector)
    -> void {
    namespaces_[resource] = namespace_selector;
}

} // namespace tessera::world
