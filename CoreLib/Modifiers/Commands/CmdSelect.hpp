#pragma once

#include <vector>

#include "Command.hpp"
#include "GeometryTypes.hpp"

/**
 * @class CmdSelectAll
 * @brief Selects every user item. Automatic items are left out.
 */
class CmdSelectAll : public Command
{
public:
    using Command::Command;

    std::string title() const override
    {
        return "Select All";
    }

protected:
    Future<void> execute(std::stop_token token) override;
};

/**
 * @class CmdSelectNone
 * @brief Clears items, topology and control point selection.
 */
class CmdSelectNone : public Command
{
public:
    using Command::Command;

    std::string title() const override
    {
        return "Select None";
    }

protected:
    Future<void> execute(std::stop_token token) override;
};

/**
 * @class CmdSelectItems
 * @brief Replaces the item selection with the given items.
 */
class CmdSelectItems : public Command
{
public:
    CmdSelectItems(Editor& editor, std::vector<ItemId> items);

    std::string title() const override
    {
        return "Select";
    }

protected:
    Future<void> execute(std::stop_token token) override;

private:
    std::vector<ItemId> m_items;
};
