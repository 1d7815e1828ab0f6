/*
Module Name:
- guarded.hpp

Abstract:
- Value paired with a std::shared_mutex; readers share, writers exclude.
- A writer that leaves by exception marks the value poisoned: the update may be half
  applied. The lock itself stays usable, callers decide whether stale data is good
  enough (registry) or must be refused (connection table).

Notes:
- Callbacks run with the lock held. Do not call back into the same Guarded from them.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>

namespace irc_bot
{

    template<class T>
    class Guarded
    {
    public:
        Guarded() = default;

        explicit Guarded(T value) :
            value_{ std::move(value) }
        {
        }

        Guarded(const Guarded&) = delete;
        Guarded& operator=(const Guarded&) = delete;

        // Run fn(const T&) under a shared lock and return its result.
        template<class F>
        auto read(F&& fn) const -> std::invoke_result_t<F, const T&>
        {
            std::shared_lock lk(mutex_);
            return std::forward<F>(fn)(value_);
        }

        // Run fn(T&) under an exclusive lock. Poisons on exception, then rethrows.
        template<class F>
        auto write(F&& fn) -> std::invoke_result_t<F, T&>
        {
            std::unique_lock lk(mutex_);
            try
            {
                return std::forward<F>(fn)(value_);
            }
            catch (...)
            {
                poisoned_.store(true, std::memory_order_release);
                throw;
            }
        }

        [[nodiscard]] bool poisoned() const noexcept
        {
            return poisoned_.load(std::memory_order_acquire);
        }

    private:
        mutable std::shared_mutex mutex_;
        std::atomic<bool> poisoned_{ false };
        T value_{};
    };

} // namespace irc_bot
