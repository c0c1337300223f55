#pragma once

#include <cstddef>
#include <semaphore>
#include <utility>

namespace util {

/**
 * @brief Bounds the number of concurrently admitted units of work
 *
 * Permits are handed out as RAII objects and go back to the limiter when the permit is destroyed.
 * No fairness is guaranteed beyond what the underlying semaphore provides.
 */
class ConcurrencyLimiter {
    std::counting_semaphore<> slots_;
    std::size_t capacity_;

public:
    class Permit {
        ConcurrencyLimiter *owner_;

    public:
        explicit Permit(ConcurrencyLimiter &owner)
            : owner_{ &owner } { }

        Permit(Permit &&other) noexcept
            : owner_{ std::exchange(other.owner_, nullptr) } { }

        Permit(Permit const &)            = delete;
        Permit &operator=(Permit const &) = delete;
        Permit &operator=(Permit &&)      = delete;

        ~Permit() {
            if(owner_ != nullptr)
                owner_->slots_.release();
        }
    };

    explicit ConcurrencyLimiter(std::size_t capacity)
        : slots_{ static_cast<std::ptrdiff_t>(capacity) }
        , capacity_{ capacity } { }

    // blocks until a slot is available
    [[nodiscard]] Permit acquire() {
        slots_.acquire();
        return Permit{ *this };
    }

    [[nodiscard]] std::size_t capacity() const {
        return capacity_;
    }
};

} // namespace util
