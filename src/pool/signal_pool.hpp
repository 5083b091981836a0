#ifndef PLUVIO_POOL_SIGNAL_POOL_HPP
#define PLUVIO_POOL_SIGNAL_POOL_HPP
/*
 * Bounded history of generated signals shown to a critic.
 * ---------------------------------------------------------------------------
 *  - capacity <= 0 turns the pool into an identity (inference / no-pool mode).
 *  - While the pool is filling, every sample is stored and served back.
 *  - Once full, each sample has a 1/2 chance to be exchanged against a
 *    uniformly chosen stored sample (the stored one is served, the new one
 *    takes its slot); otherwise the new sample is served as-is.
 *  - Fill/exchange mode is decided once per query from the state the pool had
 *    before the call. A filling pool that runs out of room mid-batch serves
 *    the remaining samples directly.
 *
 * Not thread-safe: one trainer owns one pool per domain.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/random.hpp"

namespace Pluvio::Pool {

    struct SignalPoolOptions {
        std::int64_t capacity{50};
        std::optional<std::uint64_t> seed{};
    };

    class SignalPool {
    public:
        explicit SignalPool(SignalPoolOptions options = {})
            : SignalPool(options.capacity, Common::build_rng(options.seed)) {}

        SignalPool(std::int64_t capacity, std::mt19937_64 rng)
            : capacity_(capacity), rng_(std::move(rng))
        {
            if (capacity_ > 0) {
                entries_.reserve(static_cast<std::size_t>(capacity_));
            }
        }

        [[nodiscard]] torch::Tensor query(const torch::Tensor& signals)
        {
            if (capacity_ <= 0) {
                return signals;
            }
            if (!signals.defined()) {
                throw std::invalid_argument("SignalPool::query requires a defined tensor.");
            }
            if (signals.dim() == 0) {
                throw std::invalid_argument("SignalPool::query requires a batch dimension, got a scalar.");
            }

            const auto batch = signals.size(0);
            if (batch == 0) {
                return signals;
            }

            const bool filling = static_cast<std::int64_t>(entries_.size()) < capacity_;
            std::vector<torch::Tensor> served;
            served.reserve(static_cast<std::size_t>(batch));

            for (std::int64_t index = 0; index < batch; ++index) {
                auto sample = signals.narrow(/*dim=*/0, index, /*length=*/1).detach();

                if (filling) {
                    if (static_cast<std::int64_t>(entries_.size()) < capacity_) {
                        entries_.push_back(sample.clone());
                    }
                    served.push_back(sample);
                    continue;
                }

                if (coin_(rng_) > 0.5) {
                    std::uniform_int_distribution<std::int64_t> slot_distribution(0, capacity_ - 1);
                    const auto slot = static_cast<std::size_t>(slot_distribution(rng_));
                    served.push_back(entries_[slot]);
                    entries_[slot] = sample.clone();
                } else {
                    served.push_back(sample);
                }
            }

            return torch::cat(served, /*dim=*/0);
        }

        [[nodiscard]] std::int64_t capacity() const noexcept { return capacity_; }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool full() const noexcept {
            return capacity_ > 0 && static_cast<std::int64_t>(entries_.size()) >= capacity_;
        }
        [[nodiscard]] const std::vector<torch::Tensor>& entries() const noexcept { return entries_; }

    private:
        std::int64_t capacity_;
        std::vector<torch::Tensor> entries_{};
        std::mt19937_64 rng_;
        std::uniform_real_distribution<double> coin_{0.0, 1.0};
    };

}

#endif // PLUVIO_POOL_SIGNAL_POOL_HPP
