#pragma once

#include "Command.hpp"

/**
 * @class CmdUndo
 * @brief Steps the history back one entry.
 *
 * Not remembered: it moves the cursor instead of adding an entry. Finishes
 * normally at the start of the timeline, with applied() false.
 */
class CmdUndo : public Command
{
public:
    using Command::Command;

    std::string title() const override
    {
        return "Undo";
    }

    bool remember() const noexcept override
    {
        return false;
    }

    /** @return True if the run actually restored an older entry. */
    [[nodiscard]] bool applied() const noexcept
    {
        return m_applied;
    }

protected:
    Future<void> execute(std::stop_token token) override;

private:
    bool m_applied = false;
};

/**
 * @class CmdRedo
 * @brief Steps the history forward one entry.
 */
class CmdRedo : public Command
{
public:
    using Command::Command;

    std::string title() const override
    {
        return "Redo";
    }

    bool remember() const noexcept override
    {
        return false;
    }

    [[nodiscard]] bool applied() const noexcept
    {
        return m_applied;
    }

protected:
    Future<void> execute(std::stop_token token) override;

private:
    bool m_applied = false;
};
