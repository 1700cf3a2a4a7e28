#pragma once

#include "Command.hpp"

/**
 * @class CmdDelete
 * @brief Removes every selected item from the document.
 *
 * Curves take their automatic regions with them.
 */
class CmdDelete : public Command
{
public:
    using Command::Command;

    std::string title() const override
    {
        return "Delete";
    }

protected:
    Future<void> execute(std::stop_token token) override;
};
