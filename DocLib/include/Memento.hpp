#pragma once

/**
 * @brief Something whose state can be captured into, and replaced from, a memento.
 *
 * saveToMemento() must not observably change the originator.
 * restoreFromMemento() replaces the originator's state wholesale: nothing that
 * was present before and absent from the memento survives.
 *
 * The memento is taken by value and swapped in, so restoring does not throw
 * once the argument has been built. Callers that restore several originators
 * together copy every memento first and then restore them all. Restoring
 * publishes nothing; the caller announces the change once every part is in.
 *
 * @tparam M Memento type. Mementos are values; the originator never keeps
 *           references into one after restore returns.
 */
template<typename M>
class MementoOriginator
{
public:
    virtual ~MementoOriginator() = default;

    [[nodiscard]] virtual M saveToMemento() const = 0;

    virtual void restoreFromMemento(M memento) = 0;
};
