#pragma once

#include <optional>

#include "Command.hpp"
#include "GeometryTypes.hpp"

/**
 * @class CmdAddItem
 * @brief Adds one item to the document and selects it.
 *
 * Curves are registered with the curve database so closed planar curves get
 * their region.
 */
class CmdAddItem : public Command
{
public:
    CmdAddItem(Editor& editor, GeometryPtr model, bool select = true);

    std::string title() const override;

    /** @return Id of the created item once the database has inserted it. */
    [[nodiscard]] std::optional<ItemId> result() const noexcept
    {
        return m_result;
    }

protected:
    Future<void> execute(std::stop_token token) override;

private:
    GeometryPtr           m_model;
    bool                  m_select;
    std::optional<ItemId> m_result;
};
