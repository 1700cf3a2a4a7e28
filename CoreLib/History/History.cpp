#include "History.hpp"

#include <stdexcept>

#include "EditorOriginator.hpp"
#include "EditorSignals.hpp"

History::History(EditorOriginator& originator, EditorSignals& signals, std::size_t maxDepth) :
    m_originator(originator),
    m_signals(signals),
    m_entries(),
    m_index(-1),
    m_maxDepth(maxDepth)
{
}

// ------------------------------------------------------------

void History::add(std::string label, std::shared_ptr<const EditorMemento> memento)
{
    if (!memento)
        throw std::invalid_argument("History::add(): null memento.");
    if (busy())
        throw std::logic_error("History::add(): called while a restore is pending.");

    // Drop redo tail if user branches new edits
    while ((m_index + 1) < static_cast<int>(m_entries.size()))
        m_entries.pop_back();

    m_entries.push_back(HistoryEntry{std::move(memento), m_nextOrdinal++, std::move(label)});
    m_index = static_cast<int>(m_entries.size()) - 1;

    if (m_maxDepth > 0 && m_entries.size() > m_maxDepth)
    {
        const auto excess = static_cast<std::ptrdiff_t>(m_entries.size() - m_maxDepth);
        m_entries.erase(m_entries.begin(), m_entries.begin() + excess);
        m_index -= static_cast<int>(excess);
    }

    m_signals.historyChanged.dispatch();
}

void History::checkpoint(std::string label)
{
    add(std::move(label), m_originator.saveToMemento());
}

void History::clear()
{
    m_entries.clear();
    m_index = -1;
    m_signals.historyChanged.dispatch();
}

const HistoryEntry* History::current() const noexcept
{
    if (m_index < 0)
        return nullptr;
    return &m_entries[static_cast<std::size_t>(m_index)];
}

// ------------------------------------------------------------

Future<void> History::restore(int index)
{
    Future<void> restored = m_originator.restoreFromMemento(m_entries[static_cast<std::size_t>(index)].memento);

    if (!restored.settled())
    {
        ++m_pending;
        restored.onSettled([this]() { --m_pending; });
    }

    return restored;
}

Future<bool> History::step(int target)
{
    const int from = m_index;
    m_index        = target;

    Future<void>  restored = restore(target);
    Promise<bool> done;
    Future<bool>  result = done.future();

    restored.onSettled([this, from, target, restored, done]() mutable {
        if (restored.rejected())
        {
            // Restores land whole or not at all, so the document is still at the entry we left.
            if (m_index == target)
                m_index = from;
            done.reject(restored.error());
            return;
        }

        m_signals.historyChanged.dispatch();
        done.resolve(true);
    });

    return result;
}

Future<bool> History::undo()
{
    if (!canUndo())
        return makeReadyFuture(false);

    return step(m_index - 1);
}

Future<bool> History::redo()
{
    if (!canRedo())
        return makeReadyFuture(false);

    return step(m_index + 1);
}

Future<bool> History::restoreCurrent()
{
    if (m_index < 0)
        return makeReadyFuture(false);

    return restore(m_index).then([]() { return makeReadyFuture(true); });
}
