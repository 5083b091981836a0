#ifndef PLUVIO_TRAINING_TRAINER_HPP
#define PLUVIO_TRAINING_TRAINER_HPP
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/save_load.hpp"
#include "../core.hpp"
#include "../data/dataset.hpp"
#include "../lrscheduler/lrscheduler.hpp"
#include "../report/report.hpp"
#include "../utils/progressbar.hpp"

namespace Pluvio::Training {

    enum class LrPolicy { Linear, Step, Cosine };

    struct TrainOptions {
        std::string name{"experiment"};
        std::filesystem::path checkpoints_dir{"checkpoints"};
        std::int64_t epoch_count{1};           // first epoch, > 1 when resuming
        std::int64_t n_epochs{100};            // epochs at the initial learning rate
        std::int64_t n_epochs_decay{100};      // epochs to decay it to zero
        LrPolicy lr_policy{LrPolicy::Linear};
        std::int64_t lr_decay_iters{50};       // step policy period, in epochs
        std::int64_t print_freq{100};          // samples between loss tables, 0 = progress bar only
        std::int64_t save_latest_freq{5000};   // samples between "latest" checkpoints, 0 = never
        std::int64_t save_epoch_freq{5};       // epochs between numbered checkpoints, 0 = never
        bool save_by_iter{false};
        std::string continue_from{};           // checkpoint suffix to resume from
        std::ostream* stream{&std::cout};
        bool color{true};
    };

    [[nodiscard]] inline LrPolicy parse_lr_policy(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lowered == "linear") return LrPolicy::Linear;
        if (lowered == "step") return LrPolicy::Step;
        if (lowered == "cosine") return LrPolicy::Cosine;
        throw std::invalid_argument("Unknown learning rate policy '" + std::string(name) + "'; expected linear, step or cosine.");
    }

    [[nodiscard]] inline LrScheduler::Descriptor scheduler_for(const TrainOptions& options) {
        switch (options.lr_policy) {
            case LrPolicy::Step:
                return LrScheduler::Step({.step_size = static_cast<std::size_t>(std::max<std::int64_t>(options.lr_decay_iters, 1)),
                                          .gamma = 0.1});
            case LrPolicy::Cosine:
                return LrScheduler::CosineAnnealing({.T_max = static_cast<std::size_t>(std::max<std::int64_t>(options.n_epochs, 1)),
                                                     .eta_min = 0.0});
            case LrPolicy::Linear:
            default:
                return LrScheduler::Linear({.n_epochs = options.n_epochs,
                                            .n_epochs_decay = options.n_epochs_decay,
                                            .epoch_count = options.epoch_count});
        }
    }

    class Trainer {
    public:
        explicit Trainer(TrainOptions options = {}) : options_(std::move(options))
        {
            if (options_.epoch_count < 1) {
                throw std::invalid_argument("epoch_count must be at least 1.");
            }
            if (options_.n_epochs < 0 || options_.n_epochs_decay < 0) {
                throw std::invalid_argument("n_epochs and n_epochs_decay must be non-negative.");
            }
            if (options_.print_freq < 0 || options_.save_latest_freq < 0 || options_.save_epoch_freq < 0) {
                throw std::invalid_argument("Print and save frequencies must be non-negative.");
            }
        }

        // Runs epochs epoch_count .. n_epochs + n_epochs_decay. A failing step propagates.
        void fit(CycleGan& model, Data::UnpairedDataset& dataset)
        {
            using Clock = std::chrono::steady_clock;
            if (!model.is_train()) {
                throw std::logic_error("Trainer::fit requires a model built for training.");
            }

            const auto directory = checkpoint_directory();
            if (!options_.continue_from.empty()) {
                Common::SaveLoad::load_networks(model, directory, options_.continue_from);
            }
            Common::SaveLoad::print_networks(model, options_.stream);

            auto scheduler_G = LrScheduler::make(model.optimizer_G(), scheduler_for(options_));
            auto scheduler_D = LrScheduler::make(model.optimizer_D(), scheduler_for(options_));

            const auto last_epoch = options_.n_epochs + options_.n_epochs_decay;
            for (auto epoch = options_.epoch_count; epoch <= last_epoch; ++epoch) {
                const auto epoch_start = Clock::now();
                std::int64_t epoch_iterations = 0;

                const double before = scheduler_G->learning_rate();
                scheduler_G->step();
                scheduler_D->step();
                Report::print_learning_rate(options_.stream, "G", before, scheduler_G->learning_rate());

                model.train(true);
                std::optional<Utils::ProgressBar> progress;
                if (options_.print_freq == 0) {
                    progress.emplace(dataset.batches(), "epoch " + std::to_string(epoch), options_.stream);
                }

                auto data_start = Clock::now();
                try {
                    for (std::int64_t index = 0; index < dataset.batches(); ++index) {
                        const auto iteration_start = Clock::now();
                        auto batch = dataset.batch(index);
                        const double data_seconds = seconds_between(data_start, iteration_start);

                        total_iterations_ += batch.size();
                        epoch_iterations += batch.size();
                        model.set_input(batch);
                        model.optimize_parameters();

                        if (options_.print_freq > 0 && total_iterations_ % options_.print_freq == 0) {
                            Report::LossLine line;
                            line.epoch = epoch;
                            line.iterations = epoch_iterations;
                            line.compute_seconds = seconds_between(iteration_start, Clock::now())
                                                   / static_cast<double>(std::max<std::int64_t>(batch.size(), 1));
                            line.data_seconds = data_seconds;
                            line.losses = model.current_losses();
                            Report::print_losses(options_.stream, line, {.color = options_.color});
                            history_.push_back(std::move(line));
                        }

                        if (options_.save_latest_freq > 0 && total_iterations_ % options_.save_latest_freq == 0) {
                            const auto suffix = options_.save_by_iter ? "iter_" + std::to_string(total_iterations_) : std::string("latest");
                            log("saving the latest model (epoch " + std::to_string(epoch) + ", total_iters "
                                + std::to_string(total_iterations_) + ")");
                            Common::SaveLoad::save_networks(model, directory, suffix);
                        }

                        if (progress) {
                            progress->update(index + 1);
                        }
                        data_start = Clock::now();
                    }
                } catch (...) {
                    if (progress) {
                        progress->abandon();
                    }
                    throw;
                }

                if (options_.save_epoch_freq > 0 && epoch % options_.save_epoch_freq == 0) {
                    log("saving the model at the end of epoch " + std::to_string(epoch) + ", iters "
                        + std::to_string(total_iterations_));
                    Common::SaveLoad::save_networks(model, directory, "latest");
                    Common::SaveLoad::save_networks(model, directory, std::to_string(epoch));
                }

                Report::print_epoch_end(options_.stream, epoch, last_epoch,
                                        seconds_between(epoch_start, Clock::now()), options_.color);
            }
        }

        [[nodiscard]] std::filesystem::path checkpoint_directory() const { return options_.checkpoints_dir / options_.name; }
        [[nodiscard]] std::int64_t total_iterations() const noexcept { return total_iterations_; }
        [[nodiscard]] const std::vector<Report::LossLine>& history() const noexcept { return history_; }
        [[nodiscard]] const TrainOptions& options() const noexcept { return options_; }

    private:
        template <class TimePoint>
        static double seconds_between(TimePoint start, TimePoint end)
        {
            return std::chrono::duration<double>(end - start).count();
        }

        void log(const std::string& message) const
        {
            if (options_.stream != nullptr) {
                *options_.stream << message << std::endl;
            }
        }

        TrainOptions options_;
        std::int64_t total_iterations_{0};
        std::vector<Report::LossLine> history_{};
    };

}

#endif // PLUVIO_TRAINING_TRAINER_HPP
