#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <stop_token>

#include "Future.hpp"

/**
 * @ingroup Async
 * @brief Raised by cooperative work that observed a stop request.
 */
class OperationCancelled : public std::runtime_error
{
public:
    OperationCancelled() : std::runtime_error("operation cancelled")
    {
    }
};

/**
 * @brief Throw OperationCancelled if a stop was requested on the token.
 *
 * Intended for suspension points inside command effects.
 */
inline void throwIfCancelled(const std::stop_token& token)
{
    if (token.stop_requested())
        throw OperationCancelled();
}

/**
 * @brief Race a future against a stop token.
 *
 * The returned future settles like @p inner, unless a stop is requested first,
 * in which case it rejects with OperationCancelled right away. The inner work
 * keeps running and its late result is dropped.
 */
template<typename T>
Future<T> withCancellation(const Future<T>& inner, const std::stop_token& token)
{
    Promise<T> promise;
    Future<T>  result = promise.future();

    if (token.stop_requested())
    {
        promise.reject(std::make_exception_ptr(OperationCancelled()));
        return result;
    }

    using Callback = std::stop_callback<std::function<void()>>;

    // Registration lives until the inner future settles.
    auto registration = std::make_shared<std::unique_ptr<Callback>>();
    *registration     = std::make_unique<Callback>(token, std::function<void()>([promise]() mutable {
        promise.reject(std::make_exception_ptr(OperationCancelled()));
    }));

    inner.onSettled([promise, inner, registration]() mutable {
        registration->reset();
        promise.adopt(inner);
    });

    return result;
}
