/**
 * @file permissions.hpp
 * @brief Owner/writer permission gate
 *
 * The engine only asks one question before mutating storage: "may this
 * caller write this resource?". Permissions is that boundary;
 * AccessControlList is the in-process implementation.
 *
 * Rules of AccessControlList:
 * - owners of a resource may write it and manage its grants
 * - writers of a resource may write it
 * - a resource bound to a namespace inherits that namespace's owners and
 *   writers (a namespace writer may write every model in it)
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>

#include <unordered_map>
#include <unordered_set>

namespace tessera::world {

/**
 * @brief Permission oracle consulted by the registry and the World facade
 */
class Permissions {
public:
    virtual ~Permissions() = default;

    /**
     * @brief Checks whether a caller may mutate a resource
     *
     * @param caller Caller account
     * @param resource Model or namespace selector
     */
    [[nodiscard]] virtual auto can_write(const Word& caller, const Word& resource) const -> bool = 0;

    /**
     * @brief Checks whether a caller owns a resource
     */
    [[nodiscard]] virtual auto is_owner(const Word& caller, const Word& resource) const -> bool = 0;

    /**
     * @brief Makes an account owner of a resource
     */
    virtual auto grant_owner(const Word& account, const Word& resource) -> void = 0;

    /**
     * @brief Attaches a resource to its namespace (inherits the namespace's grants)
     */
    virtual auto bind_namespace(const Word& resource, const Word& namespace_selector) -> void = 0;

protected:
    Permissions() = default;
    Permissions(const Permissions&) = default;
    auto operator=(const Permissions&) -> Permissions& = default;
    Permissions(Permissions&&) = default;
    auto operator=(Permissions&&) -> Permissions& = default;
};

/**
 * @brief In-memory owner/writer sets per resource
 *
 * Usage:
 * @code
 * AccessControlList acl;
 * acl.grant_owner(admin, namespace_selector);
 * acl.grant_writer(system, namespace_selector);
 * acl.bind_namespace(model_selector, namespace_selector);
 * acl.can_write(system, model_selector);  // true (via namespace)
 * @endcode
 */
class AccessControlList final : public Permissions {
public:
    [[nodiscard]] auto can_write(const Word& caller, const Word& resource) const -> bool override;
    [[nodiscard]] auto is_owner(const Word& caller, const Word& resource) const -> bool override;
    auto grant_owner(const Word& account, const Word& resource) -> void override;
    auto bind_namespace(const Word& resource, const Word& namespace_selector) -> void override;

    auto grant_writer(const Word& account, const Word& resource) -> void;
    auto revoke_owner(const Word& account, const Word& resource) -> void;
    auto revoke_writer(const Word& account, const Word& resource) -> void;

    /**
     * @brief Checks a direct writer grant (ignores ownership and namespaces)
     */
    [[nodiscard]] auto is_writer(const Word& caller, const Word& resource) const -> bool;

private:
    using Grants = std::unordered_map<Word, std::unordered_set<Word>>;

    [[nodiscard]] static auto has(const Grants& grants, const Word& resource, const Word& account)
        -> bool;

    Grants owners_;   ///< resource -> owner accounts
    Grants writers_;  ///< resource -> writer accounts
    std::unordered_map<Word, Word> namespaces_;  ///< resource -> namespace selector
};

} // namespace tessera::world
