#pragma once

#include "Command.hpp"

/**
 * @class CmdDuplicate
 * @brief Duplicates the selected items and selects the copies.
 *
 * Copies share the source geometry; closed planar curves get their own regions.
 */
class CmdDuplicate : public Command
{
public:
    using Command::Command;

    std::string title() const override
    {
        return "Duplicate";
    }

protected:
    Future<void> execute(std::stop_token token) override;
};
