#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @defgroup Factories Factory System
 * @brief Runtime registry for commands and other pluggable components.
 */

/**
 * @class ItemFactory
 * @brief Generic factory for constructing items by string key.
 *
 * @ingroup Factories
 *
 * Maps names to constructor functions. Constructors receive the arguments
 * given to createItem(), typically the context the item will operate on:
 *
 * @code
 * using CommandFactory = ItemFactory<Command, Editor&>;
 *
 * CommandFactory commands;
 * commands.registerItem("SelectAll", &CommandFactory::createItemType<CmdSelectAll>);
 * std::unique_ptr<Command> cmd = commands.createItem("SelectAll", editor);
 * @endcode
 *
 * @tparam T    Base type of items created by the factory.
 * @tparam Args Constructor arguments forwarded to every item.
 */
template<typename T, typename... Args>
class ItemFactory
{
public:
    ItemFactory() = default;

    using CreateFunc = std::function<std::unique_ptr<T>(Args...)>;

    /**
     * @brief Register a new item type under a name.
     *
     * If the name already exists, the previous entry is replaced.
     */
    void registerItem(const std::string& name, CreateFunc createFunc)
    {
        m_registry[name] = std::move(createFunc);
    }

    /**
     * @brief Create an item instance by name.
     * @return A newly constructed item, or nullptr if the name is unknown.
     */
    std::unique_ptr<T> createItem(const std::string& name, Args... args) const
    {
        if (auto it = m_registry.find(name); it != m_registry.end())
        {
            return it->second(std::forward<Args>(args)...);
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(const std::string& name) const
    {
        return m_registry.count(name) != 0;
    }

    /** @return Registered names in sorted order. */
    [[nodiscard]] std::vector<std::string> names() const
    {
        std::vector<std::string> result;
        result.reserve(m_registry.size());
        for (const auto& entry : m_registry)
            result.push_back(entry.first);
        return result;
    }

    /**
     * @brief Constructor helper for registration.
     * @tparam Derived The concrete type to construct (must derive from T).
     */
    template<typename Derived>
    static std::unique_ptr<Derived> createItemType(Args... args)
    {
        return std::make_unique<Derived>(std::forward<Args>(args)...);
    }

private:
    std::map<std::string, CreateFunc> m_registry;
};
