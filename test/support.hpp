#ifndef PLUVIO_TEST_SUPPORT_HPP
#define PLUVIO_TEST_SUPPORT_HPP
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <system_error>

#include <torch/torch.h>

#include "core.hpp"
#include "data/dataset.hpp"
#include "network/network.hpp"

namespace Pluvio::Test {

    // Kernel-1 convolution with `gain` on the diagonal and no bias: returns gain * input.
    class ScalingTranslator : public Network::SignalModule {
    public:
        explicit ScalingTranslator(double gain, std::int64_t channels = 1) : Network::SignalModule("ScalingTranslator")
        {
            conv_ = register_module("conv", torch::nn::Conv1d(torch::nn::Conv1dOptions(channels, channels, 1).bias(false)));
            torch::NoGradGuard no_grad;
            conv_->weight.zero_();
            for (std::int64_t c = 0; c < channels; ++c) {
                conv_->weight[c][c][0] = gain;
            }
        }

        [[nodiscard]] torch::Tensor forward(const torch::Tensor& input) override { return conv_->forward(input); }

    private:
        torch::nn::Conv1d conv_{nullptr};
    };

    class IdentityTranslator final : public ScalingTranslator {
    public:
        explicit IdentityTranslator(std::int64_t channels = 1) : ScalingTranslator(1.0, channels) {}
    };

    inline CycleGanOptions small_options(bool is_train = true)
    {
        CycleGanOptions options;
        options.is_train = is_train;
        options.seed = 7;
        options.pool_size = 4;

        Network::ResnetTranslatorOptions translator;
        translator.filters = 4;
        translator.blocks = 1;
        options.translator_A = Network::ResnetTranslator(translator);
        options.translator_B = Network::ResnetTranslator(translator);

        Network::PatchCriticOptions critic;
        critic.filters = 4;
        critic.layers = 1;
        options.critic_A = Network::PatchCritic(critic);
        options.critic_B = Network::PatchCritic(critic);
        return options;
    }

    inline Data::Transformation link_transformation()
    {
        Data::Transformation transformation;
        transformation.emplace("link", Data::MinMaxStatistics{{0.0}, {10.0}});
        transformation.emplace("gauge", Data::MinMaxStatistics{{0.0}, {5.0}});
        return transformation;
    }

    inline Data::Batch random_batch(std::int64_t batch_size = 2, std::int64_t length = 8)
    {
        Data::Batch batch;
        batch.A = torch::rand({batch_size, 1, length}) * 2.0 - 1.0;
        batch.B = torch::rand({batch_size, 1, length}) * 2.0 - 1.0;
        batch.data_transformation = link_transformation();
        return batch;
    }

    inline Data::Domain random_domain(std::int64_t count, std::int64_t length, const std::string& prefix)
    {
        Data::Domain domain;
        domain.signals = torch::rand({count, 1, length}) * 2.0 - 1.0;
        for (std::int64_t i = 0; i < count; ++i) {
            domain.identifiers.push_back(prefix + std::to_string(i));
        }
        domain.occurrence = torch::rand({count});
        return domain;
    }

    // Fresh directory under the system temp path, removed on destruction.
    class TemporaryDirectory {
    public:
        TemporaryDirectory()
        {
            std::random_device device;
            path_ = std::filesystem::temp_directory_path() / ("pluvio_test_" + std::to_string(device()) + std::to_string(device()));
            std::filesystem::create_directories(path_);
        }
        ~TemporaryDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }
        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

}

#endif // PLUVIO_TEST_SUPPORT_HPP
