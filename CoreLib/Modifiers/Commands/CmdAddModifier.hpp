#pragma once

#include "Command.hpp"
#include "ModifierManager.hpp"

/**
 * @class CmdAddModifier
 * @brief Pushes a modifier onto the stack of every selected item.
 */
class CmdAddModifier : public Command
{
public:
    CmdAddModifier(Editor& editor, const Modifier& modifier);

    std::string title() const override
    {
        return "Add Modifier";
    }

protected:
    Future<void> execute(std::stop_token token) override;

private:
    Modifier m_modifier;
};
