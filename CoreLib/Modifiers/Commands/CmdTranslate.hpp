#pragma once

#include <glm/glm.hpp>

#include "Command.hpp"

/**
 * @class CmdTranslate
 * @brief Moves every selected item by a fixed offset.
 *
 * Each item is replaced by a new version with translated control points; its
 * name, selection and modifiers carry over. When grid snapping is on, the
 * offset is snapped to the grid first.
 */
class CmdTranslate : public Command
{
public:
    CmdTranslate(Editor& editor, const glm::vec3& delta);

    std::string title() const override
    {
        return "Translate";
    }

protected:
    Future<void> execute(std::stop_token token) override;

private:
    glm::vec3 m_delta;
};
