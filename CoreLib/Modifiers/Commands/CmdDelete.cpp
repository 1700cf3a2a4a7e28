#include "CmdDelete.hpp"

#include <vector>

#include "Cancellation.hpp"
#include "Editor.hpp"
#include "GeometryDatabase.hpp"
#include "PlanarCurveDatabase.hpp"
#include "SelectionDatabase.hpp"

Future<void> CmdDelete::execute(std::stop_token token)
{
    Editor&           ed = editor();
    GeometryDatabase& db = ed.db();

    // Copy: removal prunes the selection while we iterate.
    const std::vector<ItemId> targets(ed.selection().items().begin(), ed.selection().items().end());

    std::vector<Future<void>> removals;
    removals.reserve(targets.size());

    for (ItemId id : targets)
    {
        throwIfCancelled(token);

        if (ed.curves().contains(id))
            removals.push_back(ed.curves().remove(id).then([&db, id]() { return db.removeItem(id); }));
        else
            removals.push_back(db.removeItem(id));
    }

    return whenAll(std::move(removals));
}
