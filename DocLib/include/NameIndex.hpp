#pragma once

#include <cstddef>
#include <map>
#include <optional>

#include "GeometryTypes.hpp"

/**
 * @brief Bidirectional name <-> version index.
 *
 * A name is the stable identity of an item across edits; a version is the id of
 * one concrete item record. Both directions are updated together so the two
 * maps always have equal size and are exact inverses of each other. Every
 * mutator checks its preconditions and throws InvalidPrecondition before
 * touching either map.
 */
class NameIndex
{
public:
    NameIndex() = default;

    /** @brief Bind a fresh name to a fresh version. */
    void insert(ItemId name, ItemId version);

    /**
     * @brief Move the name bound to @p fromVersion onto @p toVersion.
     * @return The name that was moved.
     */
    ItemId rebind(ItemId fromVersion, ItemId toVersion);

    /**
     * @brief Drop the binding of a version.
     * @return The name that was bound to it.
     */
    ItemId eraseVersion(ItemId version);

    [[nodiscard]] std::optional<ItemId> nameOf(ItemId version) const;
    [[nodiscard]] std::optional<ItemId> versionOf(ItemId name) const;

    [[nodiscard]] bool containsName(ItemId name) const noexcept
    {
        return m_name2version.count(name) != 0;
    }

    [[nodiscard]] bool containsVersion(ItemId version) const noexcept
    {
        return m_version2name.count(version) != 0;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_name2version.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_name2version.empty();
    }

    void clear() noexcept;

    /** @return True if both maps are exact inverses. */
    [[nodiscard]] bool consistent() const;

    [[nodiscard]] const std::map<ItemId, ItemId>& names() const noexcept
    {
        return m_name2version;
    }

    [[nodiscard]] const std::map<ItemId, ItemId>& versions() const noexcept
    {
        return m_version2name;
    }

    bool operator==(const NameIndex& other) const = default;

private:
    std::map<ItemId, ItemId> m_name2version;
    std::map<ItemId, ItemId> m_version2name;
};
