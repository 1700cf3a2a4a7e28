#include "CmdDuplicate.hpp"

#include <vector>

#include "Cancellation.hpp"
#include "Editor.hpp"
#include "GeometryDatabase.hpp"
#include "PlanarCurveDatabase.hpp"
#include "SelectionDatabase.hpp"

Future<void> CmdDuplicate::execute(std::stop_token token)
{
    Editor&           ed = editor();
    GeometryDatabase& db = ed.db();

    std::vector<Future<ItemId>> copies;
    for (ItemId id : ed.selection().items())
        copies.push_back(db.duplicate(id));

    return whenAll(std::move(copies)).then([&ed, token](const std::vector<ItemId>& ids) {
        throwIfCancelled(token);

        SelectionDatabase& selection = ed.selection();
        selection.clear();

        std::vector<Future<void>> tracking;
        for (ItemId id : ids)
        {
            selection.selectItem(id);
            if (ed.db().lookupItemById(id).type == ItemType::CURVE)
                tracking.push_back(ed.curves().add(id));
        }
        return whenAll(std::move(tracking));
    });
}
