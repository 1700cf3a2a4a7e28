#include "NameIndex.hpp"

#include <string>

void NameIndex::insert(ItemId name, ItemId version)
{
    if (containsName(name))
        throw InvalidPrecondition("NameIndex::insert(): name " + std::to_string(name) + " already bound.");
    if (containsVersion(version))
        throw InvalidPrecondition("NameIndex::insert(): version " + std::to_string(version) + " already bound.");

    m_name2version.emplace(name, version);
    m_version2name.emplace(version, name);
}

ItemId NameIndex::rebind(ItemId fromVersion, ItemId toVersion)
{
    auto it = m_version2name.find(fromVersion);
    if (it == m_version2name.end())
        throw InvalidPrecondition("NameIndex::rebind(): version " + std::to_string(fromVersion) + " has no name.");
    if (fromVersion != toVersion && containsVersion(toVersion))
        throw InvalidPrecondition("NameIndex::rebind(): version " + std::to_string(toVersion) + " already bound.");

    const ItemId name = it->second;
    m_version2name.erase(it);
    m_version2name.emplace(toVersion, name);
    m_name2version[name] = toVersion;
    return name;
}

ItemId NameIndex::eraseVersion(ItemId version)
{
    auto it = m_version2name.find(version);
    if (it == m_version2name.end())
        throw InvalidPrecondition("NameIndex::eraseVersion(): version " + std::to_string(version) + " has no name.");

    const ItemId name = it->second;
    m_version2name.erase(it);
    m_name2version.erase(name);
    return name;
}

std::optional<ItemId> NameIndex::nameOf(ItemId version) const
{
    if (auto it = m_version2name.find(version); it != m_version2name.end())
        return it->second;
    return std::nullopt;
}

std::optional<ItemId> NameIndex::versionOf(ItemId name) const
{
    if (auto it = m_name2version.find(name); it != m_name2version.end())
        return it->second;
    return std::nullopt;
}

void NameIndex::clear() noexcept
{
    m_name2version.clear();
    m_version2name.clear();
}

bool NameIndex::consistent() const
{
    if (m_name2version.size() != m_version2name.size())
        return false;

    for (const auto& [name, version] : m_name2version)
    {
        auto it = m_version2name.find(version);
        if (it == m_version2name.end() || it->second != name)
            return false;
    }
    return true;
}
