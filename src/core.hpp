#ifndef PLUVIO_CORE_HPP
#define PLUVIO_CORE_HPP
/*
 * Cycle-consistent translation between CML attenuation (A) and rain rate (B).
 * ---------------------------------------------------------------------------
 *  - G_A: A -> B and G_B: B -> A are trained jointly by one optimizer, D_A
 *    (judges B) and D_B (judges A) by another.
 *  - A training step is: forward, translator phase with both critics frozen,
 *    critic phase fed from the replay pools. The pools are only queried in
 *    the critic phase, once each.
 *  - Inference models own neither critics, pools nor optimizers; test() runs
 *    the forward pass without autograd.
 *  - The model never logs, persists or reads configuration; see trainer.hpp
 *    and common/save_load.hpp for those.
 */

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common/context.hpp"
#include "data/dataset.hpp"
#include "data/transform/normalization/minmax.hpp"
#include "loss/loss.hpp"
#include "network/network.hpp"
#include "optimizer/optimizer.hpp"
#include "pool/signal_pool.hpp"
#include "training/objective.hpp"

namespace Pluvio {

    enum class Direction { AtoB, BtoA };

    [[nodiscard]] inline Direction parse_direction(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lowered == "atob") return Direction::AtoB;
        if (lowered == "btoa") return Direction::BtoA;
        throw std::invalid_argument("Unknown direction '" + std::string(name) + "'; expected AtoB or BtoA.");
    }

    [[nodiscard]] inline std::string to_string(Direction direction) {
        return direction == Direction::AtoB ? "AtoB" : "BtoA";
    }

    struct CycleGanOptions {
        bool is_train{true};
        Direction direction{Direction::AtoB};
        Network::TranslatorDescriptor translator_A{Network::ResnetTranslator()};  // G_A: A -> B
        Network::TranslatorDescriptor translator_B{Network::ResnetTranslator()};  // G_B: B -> A
        Network::CriticDescriptor critic_A{Network::PatchCritic()};               // D_A over B
        Network::CriticDescriptor critic_B{Network::PatchCritic()};               // D_B over A
        Training::ObjectiveOptions objective{};
        std::int64_t pool_size{50};
        std::optional<std::uint64_t> seed{};
        Optimizer::Descriptor optimizer_G{Optimizer::Adam()};
        Optimizer::Descriptor optimizer_D{Optimizer::Adam()};
        std::string peak_transformation_key{"link"};
    };

    // Prebuilt networks, e.g. architectures that have no descriptor. Empty slots are built from the options.
    struct CycleGanNetworks {
        Network::SignalModulePtr G_A{};
        Network::SignalModulePtr G_B{};
        Network::SignalModulePtr D_A{};
        Network::SignalModulePtr D_B{};
    };

    // Everything the last set_input / forward / backward produced. Overwritten every iteration.
    struct CycleGanState {
        torch::Tensor real_A{};
        torch::Tensor real_B{};
        torch::Tensor fake_A{};
        torch::Tensor fake_B{};
        torch::Tensor rec_A{};
        torch::Tensor rec_B{};
        torch::Tensor idt_A{};
        torch::Tensor idt_B{};
        torch::Tensor fake_A_classification{};
        torch::Tensor fake_B_classification{};
        torch::Tensor fake_B_peak{};               // max(fake_B) in physical units, per channel

        torch::Tensor metadata_A{};
        torch::Tensor metadata_B{};
        // [N] per-sample 1 - wet fraction. Exposed for callers; no loss term reads them.
        torch::Tensor rain_rate_weight{};
        torch::Tensor attenuation_weight{};
        std::vector<std::string> link{};
        std::vector<std::string> gauge{};
        Data::Transformation data_transformation{};
        Data::Transformation metadata_transformation{};
    };

    struct CycleGanLosses {
        torch::Tensor D_A{};
        torch::Tensor G_A{};
        torch::Tensor cycle_A{};
        torch::Tensor idt_A{};
        torch::Tensor D_B{};
        torch::Tensor G_B{};
        torch::Tensor cycle_B{};
        torch::Tensor idt_B{};
        torch::Tensor mse_A{};
        torch::Tensor mse_B{};
        torch::Tensor G{};
    };

    using NamedScalars = std::vector<std::pair<std::string, double>>;
    using NamedTensors = std::vector<std::pair<std::string, torch::Tensor>>;
    using NamedNetworks = std::vector<std::pair<std::string, Network::SignalModulePtr>>;

    class CycleGan : public torch::nn::Module {
    public:
        // Freezes the critics for the lifetime of the guard.
        class FreezeGuard {
        public:
            explicit FreezeGuard(std::vector<Network::SignalModule*> modules) : modules_(std::move(modules)) {
                for (auto* module : modules_) {
                    module->set_frozen(true);
                }
            }
            ~FreezeGuard() {
                for (auto* module : modules_) {
                    module->set_frozen(false);
                }
            }
            FreezeGuard(const FreezeGuard&) = delete;
            FreezeGuard& operator=(const FreezeGuard&) = delete;

        private:
            std::vector<Network::SignalModule*> modules_;
        };

        explicit CycleGan(CycleGanOptions options = {},
                          Common::Context context = Common::Context::cpu(),
                          CycleGanNetworks networks = {})
            : torch::nn::Module("CycleGan"),
              options_(std::move(options)),
              context_(context),
              objective_(options_.objective)
        {
            if (options_.seed) {
                torch::manual_seed(*options_.seed);
            }

            G_A_ = register_module("G_A", networks.G_A ? networks.G_A : Network::make(options_.translator_A, context_));
            G_B_ = register_module("G_B", networks.G_B ? networks.G_B : Network::make(options_.translator_B, context_));
            if (networks.G_A) G_A_->to(context_.device, context_.dtype);
            if (networks.G_B) G_B_->to(context_.device, context_.dtype);

            if (!options_.is_train) {
                return;
            }

            D_A_ = register_module("D_A", networks.D_A ? networks.D_A : Network::make(options_.critic_A, context_));
            D_B_ = register_module("D_B", networks.D_B ? networks.D_B : Network::make(options_.critic_B, context_));
            if (networks.D_A) D_A_->to(context_.device, context_.dtype);
            if (networks.D_B) D_B_->to(context_.device, context_.dtype);

            const auto pool_seed_A = options_.seed ? std::optional<std::uint64_t>(*options_.seed + 1) : std::nullopt;
            const auto pool_seed_B = options_.seed ? std::optional<std::uint64_t>(*options_.seed + 2) : std::nullopt;
            fake_A_pool_.emplace(Pool::SignalPoolOptions{options_.pool_size, pool_seed_A});
            fake_B_pool_.emplace(Pool::SignalPoolOptions{options_.pool_size, pool_seed_B});

            optimizer_G_ = Optimizer::make(joint_parameters(*G_A_, *G_B_), options_.optimizer_G);
            optimizer_D_ = Optimizer::make(joint_parameters(*D_A_, *D_B_), options_.optimizer_D);
        }

        // Unpacks a batch; the direction decides which domain becomes real_A.
        void set_input(const Data::Batch& batch)
        {
            if (!batch.A.defined() || !batch.B.defined()) {
                throw std::invalid_argument("CycleGan::set_input requires both domain tensors.");
            }
            if (batch.A.dim() != 3 || batch.B.dim() != 3) {
                throw std::invalid_argument("CycleGan::set_input expects [batch, channels, length] tensors.");
            }
            if (batch.A.size(0) != batch.B.size(0)) {
                throw std::invalid_argument("CycleGan::set_input received " + std::to_string(batch.A.size(0))
                                            + " attenuation samples but " + std::to_string(batch.B.size(0))
                                            + " rain-rate samples.");
            }

            const bool a_to_b = options_.direction == Direction::AtoB;
            CycleGanState state;
            state.real_A = context_.place(a_to_b ? batch.A : batch.B);
            state.real_B = context_.place(a_to_b ? batch.B : batch.A);
            state.metadata_A = context_.place(a_to_b ? batch.metadata_A : batch.metadata_B);
            state.metadata_B = context_.place(a_to_b ? batch.metadata_B : batch.metadata_A);
            if (batch.rain_rate.defined()) {
                state.rain_rate_weight = 1.0 - context_.place(batch.rain_rate);
            }
            if (batch.attenuation.defined()) {
                state.attenuation_weight = 1.0 - context_.place(batch.attenuation);
            }
            state.link = batch.link;
            state.gauge = batch.gauge;
            state.data_transformation = batch.data_transformation;
            state.metadata_transformation = batch.metadata_transformation;

            state_ = std::move(state);
            losses_ = {};
        }

        void forward()
        {
            require_input("forward");
            state_.fake_B = G_A_->forward(state_.real_A);
            state_.fake_B_classification = torch::sigmoid(state_.fake_B);
            state_.rec_A = G_B_->forward(state_.fake_B);

            state_.fake_A = G_B_->forward(state_.real_B);
            state_.fake_A_classification = torch::sigmoid(state_.fake_A);
            state_.rec_B = G_A_->forward(state_.fake_A);
        }

        // Forward pass without autograd; parameters and pools are left untouched.
        void test()
        {
            torch::NoGradGuard no_grad;
            forward();
        }

        // Critic loss on one real and one (pooled) fake batch, followed by its backward pass.
        torch::Tensor backward_D_basic(Network::SignalModule& critic, const torch::Tensor& real, const torch::Tensor& fake)
        {
            auto loss = objective_.critic(critic, real, fake);
            loss.backward();
            return loss;
        }

        void backward_D_A()
        {
            require_training("backward_D_A");
            require_forward("backward_D_A");
            auto fake_B = fake_B_pool_->query(state_.fake_B);
            losses_.D_A = backward_D_basic(*D_A_, state_.real_B, fake_B).detach();
        }

        void backward_D_B()
        {
            require_training("backward_D_B");
            require_forward("backward_D_B");
            auto fake_A = fake_A_pool_->query(state_.fake_A);
            losses_.D_B = backward_D_basic(*D_B_, state_.real_A, fake_A).detach();
        }

        void backward_G()
        {
            require_training("backward_G");
            require_forward("backward_G");
            const auto& objective = objective_.options();

            if (objective_.identity_enabled()) {
                state_.idt_A = G_A_->forward(state_.real_B);
                losses_.idt_A = objective_.identity(state_.idt_A, state_.real_B, objective.lambda_B);
                state_.idt_B = G_B_->forward(state_.real_A);
                losses_.idt_B = objective_.identity(state_.idt_B, state_.real_A, objective.lambda_A);
            } else {
                state_.idt_A = {};
                state_.idt_B = {};
                losses_.idt_A = torch::zeros({}, context_.options());
                losses_.idt_B = torch::zeros({}, context_.options());
            }

            losses_.G_A = objective_.adversarial(*D_A_, state_.fake_B);
            losses_.G_B = objective_.adversarial(*D_B_, state_.fake_A)
                        + objective_.classification(state_.fake_B_classification, state_.real_B);

            state_.fake_B_peak = physical_peak(state_.fake_B);

            losses_.cycle_A = objective_.cycle_A(state_.real_A, state_.rec_A);
            losses_.cycle_B = objective_.cycle_B(state_.real_B, state_.rec_B);

            losses_.G = losses_.G_A + losses_.G_B + losses_.cycle_A + losses_.cycle_B + losses_.idt_A + losses_.idt_B;
            losses_.G.backward();

            losses_.mse_A = objective_.mse_A(state_.fake_A, state_.real_A);
            losses_.mse_B = objective_.mse_B(state_.real_B, state_.fake_B);

            for (auto* loss : {&losses_.G_A, &losses_.G_B, &losses_.cycle_A, &losses_.cycle_B,
                               &losses_.idt_A, &losses_.idt_B, &losses_.G}) {
                *loss = loss->detach();
            }
        }

        // Translator update; critics are frozen for the whole phase, including on error.
        void optimize_generators()
        {
            require_training("optimize_generators");
            require_forward("optimize_generators");
            FreezeGuard freeze({D_A_.get(), D_B_.get()});
            optimizer_G_->zero_grad();
            backward_G();
            optimizer_G_->step();
        }

        // Critic update on pooled fakes. Fakes are detached, translators receive no gradient.
        void optimize_critics()
        {
            require_training("optimize_critics");
            require_forward("optimize_critics");
            optimizer_D_->zero_grad();
            backward_D_A();
            backward_D_B();
            optimizer_D_->step();
        }

        void optimize_parameters()
        {
            require_training("optimize_parameters");
            forward();
            optimize_generators();
            optimize_critics();
        }

        // D_A, G_A, cycle_A, idt_A, D_B, G_B, cycle_B, idt_B, mse_A, mse_B. Unset terms read 0.
        [[nodiscard]] NamedScalars current_losses() const
        {
            const auto value = [](const torch::Tensor& tensor) {
                return tensor.defined() ? tensor.detach().to(torch::kCPU).item<double>() : 0.0;
            };
            return {
                {"D_A", value(losses_.D_A)},
                {"G_A", value(losses_.G_A)},
                {"cycle_A", value(losses_.cycle_A)},
                {"idt_A", value(losses_.idt_A)},
                {"D_B", value(losses_.D_B)},
                {"G_B", value(losses_.G_B)},
                {"cycle_B", value(losses_.cycle_B)},
                {"idt_B", value(losses_.idt_B)},
                {"mse_A", value(losses_.mse_A)},
                {"mse_B", value(losses_.mse_B)},
            };
        }

        [[nodiscard]] std::vector<std::string> visual_names() const
        {
            std::vector<std::string> names{"real_A", "fake_B", "rec_A"};
            if (options_.is_train && objective_.identity_enabled()) names.emplace_back("idt_B");
            names.insert(names.end(), {"real_B", "fake_A", "rec_B"});
            if (options_.is_train && objective_.identity_enabled()) names.emplace_back("idt_A");
            return names;
        }

        [[nodiscard]] NamedTensors current_visuals() const
        {
            NamedTensors visuals;
            for (const auto& name : visual_names()) {
                visuals.emplace_back(name, visual(name).detach());
            }
            return visuals;
        }

        // G_A, G_B and, when training, D_A, D_B.
        [[nodiscard]] NamedNetworks networks() const
        {
            NamedNetworks named{{"G_A", G_A_}, {"G_B", G_B_}};
            if (options_.is_train) {
                named.emplace_back("D_A", D_A_);
                named.emplace_back("D_B", D_B_);
            }
            return named;
        }

        [[nodiscard]] std::vector<std::string> model_names() const
        {
            std::vector<std::string> names;
            for (const auto& [name, network] : networks()) {
                names.push_back(name);
            }
            return names;
        }

        [[nodiscard]] Network::SignalModule& G_A() { return *G_A_; }
        [[nodiscard]] Network::SignalModule& G_B() { return *G_B_; }
        [[nodiscard]] Network::SignalModule& D_A() { require_training("D_A"); return *D_A_; }
        [[nodiscard]] Network::SignalModule& D_B() { require_training("D_B"); return *D_B_; }

        [[nodiscard]] torch::optim::Optimizer& optimizer_G() { require_training("optimizer_G"); return *optimizer_G_; }
        [[nodiscard]] torch::optim::Optimizer& optimizer_D() { require_training("optimizer_D"); return *optimizer_D_; }

        [[nodiscard]] const Pool::SignalPool& fake_A_pool() const { require_training("fake_A_pool"); return *fake_A_pool_; }
        [[nodiscard]] const Pool::SignalPool& fake_B_pool() const { require_training("fake_B_pool"); return *fake_B_pool_; }

        [[nodiscard]] const CycleGanState& state() const noexcept { return state_; }
        [[nodiscard]] const CycleGanLosses& losses() const noexcept { return losses_; }
        [[nodiscard]] const CycleGanOptions& options() const noexcept { return options_; }
        [[nodiscard]] const Common::Context& context() const noexcept { return context_; }
        [[nodiscard]] bool is_train() const noexcept { return options_.is_train; }

    private:
        static std::vector<torch::Tensor> joint_parameters(Network::SignalModule& first, Network::SignalModule& second)
        {
            auto parameters = first.parameters();
            auto tail = second.parameters();
            parameters.insert(parameters.end(), tail.begin(), tail.end());
            return parameters;
        }

        void require_input(const char* operation) const
        {
            if (!state_.real_A.defined() || !state_.real_B.defined()) {
                throw std::logic_error(std::string("CycleGan::") + operation + " called before set_input.");
            }
        }

        void require_forward(const char* operation) const
        {
            require_input(operation);
            if (!state_.fake_A.defined() || !state_.fake_B.defined()) {
                throw std::logic_error(std::string("CycleGan::") + operation + " called before forward.");
            }
        }

        void require_training(const char* operation) const
        {
            if (!options_.is_train) {
                throw std::logic_error(std::string("CycleGan::") + operation + " is unavailable on an inference model.");
            }
        }

        torch::Tensor physical_peak(const torch::Tensor& fake_B) const
        {
            const auto& statistics = Data::require(state_.data_transformation, options_.peak_transformation_key,
                                                   "The batch data transformation");
            torch::NoGradGuard no_grad;
            return Data::Transform::Normalization::MinMaxInverse(fake_B.max(), statistics);
        }

        torch::Tensor visual(const std::string& name) const
        {
            if (name == "real_A") return state_.real_A;
            if (name == "real_B") return state_.real_B;
            if (name == "fake_A") return state_.fake_A;
            if (name == "fake_B") return state_.fake_B;
            if (name == "rec_A") return state_.rec_A;
            if (name == "rec_B") return state_.rec_B;
            if (name == "idt_A") return state_.idt_A;
            if (name == "idt_B") return state_.idt_B;
            throw std::invalid_argument("Unknown visual '" + name + "'.");
        }

        CycleGanOptions options_;
        Common::Context context_;
        Training::Objective objective_;

        Network::SignalModulePtr G_A_{};
        Network::SignalModulePtr G_B_{};
        Network::SignalModulePtr D_A_{};
        Network::SignalModulePtr D_B_{};

        std::optional<Pool::SignalPool> fake_A_pool_{};
        std::optional<Pool::SignalPool> fake_B_pool_{};

        std::unique_ptr<torch::optim::Optimizer> optimizer_G_{};
        std::unique_ptr<torch::optim::Optimizer> optimizer_D_{};

        CycleGanState state_{};
        CycleGanLosses losses_{};
    };

}

#endif // PLUVIO_CORE_HPP
