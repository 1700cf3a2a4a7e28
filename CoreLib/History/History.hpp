#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Future.hpp"

class EditorMemento;
class EditorOriginator;
struct EditorSignals;

/** @brief One checkpoint on the timeline. */
struct HistoryEntry
{
    std::shared_ptr<const EditorMemento> memento;
    uint64_t                             ordinal = 0; ///< Position in insertion order; never reused.
    std::string                          label;
};

/**
 * @brief Linear undo/redo timeline of document snapshots.
 *
 * Each entry is a full EditorMemento taken after a command finished. The
 * cursor points at the entry that matches the live document:
 * - add() truncates any redo tail and appends a new current entry.
 * - undo()/redo() move the cursor one step and restore that entry.
 *
 * Restores are queued on the database behind any pending mutation, so they
 * may settle later than the call. The cursor moves at once, which lets several
 * undo steps be queued back to back; historyChanged follows each restore.
 *
 * @note m_index is the index of the current entry, or -1 if the timeline is empty.
 *       The entry at index 0 is the base state and cannot be undone.
 */
class History
{
public:
    /**
     * @param originator Source and target of snapshots.
     * @param signals    historyChanged is published after every timeline change.
     * @param maxDepth   Maximum number of entries kept; 0 means unbounded.
     */
    History(EditorOriginator& originator, EditorSignals& signals, std::size_t maxDepth = 0);

    History(const History&)            = delete;
    History& operator=(const History&) = delete;

    /**
     * @brief Append a snapshot as the new current entry.
     *
     * Truncates any redo tail, then evicts the oldest entries beyond maxDepth.
     *
     * @throws std::logic_error if called while a restore is pending.
     */
    void add(std::string label, std::shared_ptr<const EditorMemento> memento);

    /** @brief Snapshot the live document and add() it. */
    void checkpoint(std::string label);

    /**
     * @brief Step back one entry.
     * @return Resolves false if there is nothing to undo, true once the
     *         entry is restored. Rejects if the restore failed; the cursor is
     *         then put back.
     */
    [[nodiscard]] Future<bool> undo();

    /** @brief Step forward one entry. Mirrors undo(). */
    [[nodiscard]] Future<bool> redo();

    /**
     * @brief Re-apply the current entry to the live document.
     *
     * Used to discard partial work of a command that did not finish.
     * @return Resolves false if the timeline is empty.
     */
    Future<bool> restoreCurrent();

    /** @brief Drop every entry. */
    void clear();

    [[nodiscard]] bool canUndo() const noexcept
    {
        return m_index > 0;
    }

    [[nodiscard]] bool canRedo() const noexcept
    {
        return (m_index + 1) < static_cast<int>(m_entries.size());
    }

    /** @return True while a restore is queued or running. */
    [[nodiscard]] bool busy() const noexcept
    {
        return m_pending > 0;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    [[nodiscard]] int cursor() const noexcept
    {
        return m_index;
    }

    /** @return The current entry, or nullptr if the timeline is empty. */
    [[nodiscard]] const HistoryEntry* current() const noexcept;

    [[nodiscard]] const std::vector<HistoryEntry>& entries() const noexcept
    {
        return m_entries;
    }

    [[nodiscard]] std::size_t maxDepth() const noexcept
    {
        return m_maxDepth;
    }

private:
    Future<void> restore(int index);
    Future<bool> step(int target);

private:
    EditorOriginator& m_originator;
    EditorSignals&    m_signals;

    std::vector<HistoryEntry> m_entries;

    int         m_index{-1};      ///< Index of the current entry, or -1 if empty.
    std::size_t m_maxDepth{0};    ///< 0 = unbounded.
    uint64_t    m_nextOrdinal{1}; ///< Ordinal of the next entry.
    std::size_t m_pending{0};     ///< Restores not yet settled.
};
