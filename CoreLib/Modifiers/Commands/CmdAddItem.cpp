#include "CmdAddItem.hpp"

#include <stdexcept>

#include "Cancellation.hpp"
#include "Editor.hpp"
#include "GeometryDatabase.hpp"
#include "PlanarCurveDatabase.hpp"
#include "SelectionDatabase.hpp"

CmdAddItem::CmdAddItem(Editor& editor, GeometryPtr model, bool select) :
    Command(editor),
    m_model(std::move(model)),
    m_select(select)
{
    if (!m_model)
        throw std::invalid_argument("CmdAddItem: model is null.");
}

std::string CmdAddItem::title() const
{
    return std::string("Add ") + toString(m_model->type);
}

Future<void> CmdAddItem::execute(std::stop_token token)
{
    Editor& ed = editor();

    return ed.db().addItem(m_model).then([this, &ed, token](ItemId id) {
        m_result = id;
        throwIfCancelled(token);

        Future<void> tracked = m_model->type == ItemType::CURVE ? ed.curves().add(id) : makeReadyFuture();

        return tracked.then([this, &ed, id]() {
            if (m_select)
            {
                ed.selection().clear();
                ed.selection().selectItem(id);
            }
            return makeReadyFuture();
        });
    });
}
