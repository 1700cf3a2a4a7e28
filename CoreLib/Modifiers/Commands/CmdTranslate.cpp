#include "CmdTranslate.hpp"

#include <vector>

#include "Cancellation.hpp"
#include "Editor.hpp"
#include "GeometryDatabase.hpp"
#include "PlanarCurveDatabase.hpp"
#include "SelectionDatabase.hpp"
#include "SnapManager.hpp"

CmdTranslate::CmdTranslate(Editor& editor, const glm::vec3& delta) : Command(editor), m_delta(delta)
{
}

Future<void> CmdTranslate::execute(std::stop_token token)
{
    Editor&           ed = editor();
    GeometryDatabase& db = ed.db();

    const glm::vec3 delta = ed.snaps().applyGrid(m_delta);

    const std::vector<ItemId> targets(ed.selection().items().begin(), ed.selection().items().end());

    std::vector<Future<void>> moves;
    moves.reserve(targets.size());

    for (ItemId id : targets)
    {
        throwIfCancelled(token);

        GeometryPtr moved = translated(*db.lookup(id), delta);
        const bool  curve = ed.curves().contains(id);

        moves.push_back(db.replaceItem(id, std::move(moved)).then([&ed, id, curve](ItemId to) {
            return curve ? ed.curves().replace(id, to) : makeReadyFuture();
        }));
    }

    return whenAll(std::move(moves));
}
