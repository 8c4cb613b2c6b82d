#pragma once
#include <functional>
#include <chrono>
#include <thread>
#include <string>
#include <future>
#include <optional>
#include <stdexcept>
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    /**
     * @brief Run func on its own detached thread
     *
     * The worker keeps running if nobody waits for it; the shared state of the
     * returned future outlives the caller, so func must own what it touches.
     * Exceptions thrown by func are delivered through the future.
     */
    template <typename Func>
    static auto launchDetached(Func func) -> std::future<decltype(func())>
    {
        using Result = decltype(func());
        std::packaged_task<Result()> task(std::move(func));
        auto future = task.get_future();
        std::thread(std::move(task)).detach();
        return future;
    }

    /**
     * @brief Wait for a future until an absolute deadline
     * @return The value, or std::nullopt if the deadline passed or the task threw
     */
    template <typename T>
    static std::optional<T> awaitWithDeadline(std::future<T> &future,
                                              std::chrono::steady_clock::time_point deadline,
                                              const std::string &operation_name)
    {
        if (future.wait_until(deadline) != std::future_status::ready)
        {
            Logger::warn("Operation '" + operation_name + "' timed out, abandoning it");
            return std::nullopt;
        }

        try
        {
            return future.get();
        }
        catch (const std::exception &e)
        {
            Logger::warn("Operation '" + operation_name + "' failed: " + e.what());
        }
        catch (...)
        {
            Logger::error("Operation '" + operation_name + "' failed with an unknown exception");
        }
        return std::nullopt;
    }

    // Timeout wrapper for calls into the media index and the file system
    template <typename Func>
    static auto callWithTimeout(Func func, int timeout_ms, const std::string &operation_name)
        -> decltype(func())
    {
        auto future = launchDetached(std::move(func));
        if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready)
        {
            Logger::error("Operation '" + operation_name + "' timed out after " +
                          std::to_string(timeout_ms) + "ms");
            throw std::runtime_error("Operation '" + operation_name + "' timed out");
        }
        return future.get();
    }
};
