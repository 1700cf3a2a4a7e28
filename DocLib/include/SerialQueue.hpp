#pragma once

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "Future.hpp"

/**
 * @ingroup Async
 * @brief FIFO execution lane: runs asynchronous operations one at a time.
 *
 * Each enqueued operation is a callable returning a Future. The operation is not
 * invoked until every earlier operation has settled, and the handle returned by
 * enqueue() settles with the operation's own outcome. A failing operation
 * (throwing synchronously or returning a rejected future) does not stop the
 * queue; the next one starts as soon as it settles.
 *
 * The queue does not own threads. Operations that complete synchronously are
 * drained in a loop rather than recursively.
 *
 * @warning The queue must outlive every operation still pending on it.
 */
class SerialQueue
{
public:
    SerialQueue() = default;
    ~SerialQueue();

    SerialQueue(const SerialQueue&)            = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    /**
     * @brief Append an operation to the lane.
     *
     * @param operation Callable with signature Future<T>().
     * @return Handle settling with the operation's result or failure.
     */
    template<typename F>
    auto enqueue(F&& operation);

    /** @return True while an operation is executing. */
    [[nodiscard]] bool busy() const noexcept
    {
        return m_running;
    }

    /** @return Number of operations waiting behind the current one. */
    [[nodiscard]] std::size_t pending() const noexcept
    {
        return m_jobs.size();
    }

private:
    void pump();
    void finish();

private:
    std::deque<std::function<void()>> m_jobs;

    bool m_running = false; ///< An operation was started and has not settled.
    bool m_pumping = false; ///< pump() is on the stack.
};

template<typename F>
auto SerialQueue::enqueue(F&& operation)
{
    using Result = std::invoke_result_t<std::decay_t<F>&>;
    static_assert(detail::FutureTraits<Result>::value, "SerialQueue::enqueue(): operation must return a Future.");
    using Value = typename detail::FutureTraits<Result>::value_type;

    Promise<Value> promise;
    Future<Value>  handle = promise.future();

    m_jobs.push_back([this, promise, op = std::forward<F>(operation)]() mutable {
        Result inner;
        try
        {
            inner = op();
            if (!inner.valid())
                throw std::logic_error("SerialQueue: operation returned an invalid future.");
        }
        catch (...)
        {
            promise.reject(std::current_exception());
            finish();
            return;
        }

        inner.onSettled([this, promise, inner]() mutable {
            promise.adopt(inner);
            finish();
        });
    });

    pump();
    return handle;
}
