#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @defgroup Async Cooperative async primitives
 * @brief Single-threaded, settle-once result handles.
 *
 * A Promise is the producing side, a Future the observing side. Both share one
 * state that settles exactly once, either with a value or with an exception.
 * Continuations run synchronously on whichever call settles the state, so there
 * is no event loop and no thread hop: "suspension" simply means returning a
 * Future that is not yet settled.
 */

template<typename T>
class Future;

template<typename T>
class Promise;

namespace detail
{
    template<typename T>
    struct FutureState
    {
        using Value = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

        std::optional<Value>               value;
        std::exception_ptr                 error;
        std::vector<std::function<void()>> callbacks;

        [[nodiscard]] bool settled() const noexcept
        {
            return value.has_value() || error != nullptr;
        }

        void notify()
        {
            // Callbacks may attach further callbacks; those run immediately
            // because the state is already settled.
            std::vector<std::function<void()>> pending;
            pending.swap(callbacks);
            for (auto& callback : pending)
                callback();
        }
    };

    template<typename T>
    struct FutureTraits : std::false_type
    {
    };

    template<typename U>
    struct FutureTraits<Future<U>> : std::true_type
    {
        using value_type = U;
    };

    template<typename T, typename F>
    struct ContinuationResult
    {
        using type = std::invoke_result_t<F&, const T&>;
    };

    template<typename F>
    struct ContinuationResult<void, F>
    {
        using type = std::invoke_result_t<F&>;
    };
} // namespace detail

/**
 * @ingroup Async
 * @brief Observing handle to an eventually settled result.
 *
 * Futures are cheap to copy; every copy observes the same state.
 *
 * @tparam T Value type, or void.
 */
template<typename T>
class Future
{
public:
    using value_type = T;

    /** @brief Construct an invalid (stateless) future. */
    Future() = default;

    [[nodiscard]] bool valid() const noexcept
    {
        return m_state != nullptr;
    }

    [[nodiscard]] bool settled() const noexcept
    {
        return m_state && m_state->settled();
    }

    [[nodiscard]] bool fulfilled() const noexcept
    {
        return m_state && m_state->value.has_value();
    }

    [[nodiscard]] bool rejected() const noexcept
    {
        return m_state && m_state->error != nullptr;
    }

    /** @return The rejection reason, or nullptr if not rejected. */
    [[nodiscard]] std::exception_ptr error() const noexcept
    {
        return m_state ? m_state->error : nullptr;
    }

    /**
     * @brief Read the settled value.
     *
     * @throws std::logic_error if the future is invalid or still pending.
     * @throws Whatever the future was rejected with.
     */
    T get() const
    {
        if (!settled())
            throw std::logic_error("Future::get(): future is not settled.");

        if (m_state->error)
            std::rethrow_exception(m_state->error);

        if constexpr (!std::is_void_v<T>)
            return *m_state->value;
    }

    /**
     * @brief Run a callback once the future settles.
     *
     * If the future is already settled the callback runs immediately.
     */
    void onSettled(std::function<void()> callback) const
    {
        if (!m_state)
            throw std::logic_error("Future::onSettled(): invalid future.");

        if (m_state->settled())
            callback();
        else
            m_state->callbacks.push_back(std::move(callback));
    }

    /**
     * @brief Chain an asynchronous continuation.
     *
     * The continuation receives the value (nothing for Future<void>) and must
     * return a Future<U>. Rejections skip the continuation and propagate.
     * A continuation that throws rejects the returned future.
     */
    template<typename F>
    auto then(F&& fn) const;

private:
    friend class Promise<T>;

    explicit Future(std::shared_ptr<detail::FutureState<T>> state) : m_state{std::move(state)}
    {
    }

    std::shared_ptr<detail::FutureState<T>> m_state;
};

/**
 * @ingroup Async
 * @brief Producing side of a Future. Settles at most once; later attempts are ignored.
 */
template<typename T>
class Promise
{
public:
    Promise() : m_state{std::make_shared<detail::FutureState<T>>()}
    {
    }

    [[nodiscard]] Future<T> future() const
    {
        return Future<T>(m_state);
    }

    [[nodiscard]] bool settled() const noexcept
    {
        return m_state->settled();
    }

    /**
     * @brief Fulfil the promise.
     * @return False if the promise was already settled.
     */
    template<typename... Args>
    bool resolve(Args&&... args)
    {
        if (m_state->settled())
            return false;

        m_state->value.emplace(std::forward<Args>(args)...);
        m_state->notify();
        return true;
    }

    /**
     * @brief Reject the promise.
     * @return False if the promise was already settled.
     */
    bool reject(std::exception_ptr error)
    {
        if (m_state->settled())
            return false;

        if (!error)
            error = std::make_exception_ptr(std::runtime_error("Promise::reject(): rejected without a reason."));

        m_state->error = std::move(error);
        m_state->notify();
        return true;
    }

    /** @brief Settle this promise with whatever the source future settles with. */
    void adopt(const Future<T>& source)
    {
        Promise self = *this;
        source.onSettled([self, source]() mutable {
            if (source.rejected())
                self.reject(source.error());
            else if constexpr (std::is_void_v<T>)
                self.resolve();
            else
                self.resolve(*source.m_state->value);
        });
    }

private:
    std::shared_ptr<detail::FutureState<T>> m_state;
};

template<typename T>
template<typename F>
auto Future<T>::then(F&& fn) const
{
    using Result = typename detail::ContinuationResult<T, std::decay_t<F>>::type;
    static_assert(detail::FutureTraits<Result>::value, "Future::then(): continuation must return a Future.");
    using Next = typename detail::FutureTraits<Result>::value_type;

    if (!m_state)
        throw std::logic_error("Future::then(): invalid future.");

    Promise<Next> promise;
    Future<Next>  next  = promise.future();
    auto          state = m_state;

    onSettled([state, promise, fn = std::forward<F>(fn)]() mutable {
        if (state->error)
        {
            promise.reject(state->error);
            return;
        }

        try
        {
            Result inner;
            if constexpr (std::is_void_v<T>)
                inner = fn();
            else
                inner = fn(*state->value);

            if (!inner.valid())
                throw std::logic_error("Future::then(): continuation returned an invalid future.");

            promise.adopt(inner);
        }
        catch (...)
        {
            promise.reject(std::current_exception());
        }
    });

    return next;
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

inline Future<void> makeReadyFuture()
{
    Promise<void> promise;
    promise.resolve();
    return promise.future();
}

template<typename T>
Future<std::decay_t<T>> makeReadyFuture(T&& value)
{
    Promise<std::decay_t<T>> promise;
    promise.resolve(std::forward<T>(value));
    return promise.future();
}

template<typename T>
Future<T> makeFailedFuture(std::exception_ptr error)
{
    Promise<T> promise;
    promise.reject(std::move(error));
    return promise.future();
}

/**
 * @brief Wait for every future; rejects with the first rejection observed.
 * @return Values in input order.
 */
template<typename T>
Future<std::vector<T>> whenAll(std::vector<Future<T>> futures)
{
    Promise<std::vector<T>> promise;
    Future<std::vector<T>>  result = promise.future();

    if (futures.empty())
    {
        promise.resolve();
        return result;
    }

    auto all       = std::make_shared<std::vector<Future<T>>>(std::move(futures));
    auto remaining = std::make_shared<std::size_t>(all->size());

    for (const auto& each : *all)
    {
        each.onSettled([promise, all, remaining, each]() mutable {
            if (each.rejected())
            {
                promise.reject(each.error());
                return;
            }

            if (--*remaining != 0 || promise.settled())
                return;

            std::vector<T> values;
            values.reserve(all->size());
            for (const auto& f : *all)
                values.push_back(f.get());

            promise.resolve(std::move(values));
        });
    }

    return result;
}

inline Future<void> whenAll(std::vector<Future<void>> futures)
{
    Promise<void> promise;
    Future<void>  result = promise.future();

    if (futures.empty())
    {
        promise.resolve();
        return result;
    }

    auto remaining = std::make_shared<std::size_t>(futures.size());

    for (const auto& each : futures)
    {
        each.onSettled([promise, remaining, each]() mutable {
            if (each.rejected())
                promise.reject(each.error());
            else if (--*remaining == 0)
                promise.resolve();
        });
    }

    return result;
}
