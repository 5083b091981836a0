#ifndef PLUVIO_LRSCHEDULER_COMMON_HPP
#define PLUVIO_LRSCHEDULER_COMMON_HPP
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

namespace Pluvio::LrScheduler::Details {

    class Scheduler {
    public:
        virtual ~Scheduler() = default;
        virtual void step() = 0;
        [[nodiscard]] virtual double learning_rate() const = 0;
    };

    // Rescales every param group from the learning rate it had when the scheduler was attached.
    // Derived constructors must call apply(0) once their options are validated.
    class EpochScheduler : public Scheduler {
    public:
        void step() override {
            if (epoch_ < std::numeric_limits<std::size_t>::max()) {
                ++epoch_;
            }
            apply(epoch_);
        }

        [[nodiscard]] double learning_rate() const override {
            const auto& groups = optimizer_.param_groups();
            return groups.empty() ? 0.0 : groups.front().options().get_lr();
        }

        [[nodiscard]] std::size_t epoch() const noexcept { return epoch_; }

    protected:
        explicit EpochScheduler(torch::optim::Optimizer& optimizer)
            : optimizer_(optimizer), base_lrs_(capture_base_lrs(optimizer)) {}

        [[nodiscard]] virtual double compute_lr(double base_lr, std::size_t epoch) const = 0;

        void apply(std::size_t epoch) {
            auto& param_groups = optimizer_.param_groups();
            if (base_lrs_.size() != param_groups.size()) {
                throw std::runtime_error("Optimizer param group count changed after scheduler creation.");
            }
            for (std::size_t index = 0; index < param_groups.size(); ++index) {
                param_groups[index].options().set_lr(compute_lr(base_lrs_[index], epoch));
            }
        }

    private:
        static std::vector<double> capture_base_lrs(torch::optim::Optimizer& optimizer) {
            std::vector<double> base_lrs;
            base_lrs.reserve(optimizer.param_groups().size());
            for (auto& group : optimizer.param_groups()) {
                base_lrs.push_back(group.options().get_lr());
            }
            return base_lrs;
        }

        torch::optim::Optimizer& optimizer_;
        std::vector<double> base_lrs_{};
        std::size_t epoch_{0};
    };

}

#endif // PLUVIO_LRSCHEDULER_COMMON_HPP
