// Training entry point: pluvio_train <config.json>
// -----------------------------------------------------------------------------
//  - Reads the run configuration, loads both domains either from tensors
//    written by torch::save ([N, C, L]) or from windowed CSV series.
//  - Normalizes each domain to [-1, 1], builds the cycle model and trains it.

#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../include/Pluvio.h"

namespace {
    Pluvio::Data::Type::RawDomain load_domain(const std::filesystem::path& tensor_path,
                                              const std::vector<Pluvio::Data::Type::SeriesSource>& series,
                                              const Pluvio::Data::Type::WindowOptions& window,
                                              const std::string& name)
    {
        if (!tensor_path.empty()) {
            Pluvio::Data::Type::RawDomain domain;
            domain.signals = Pluvio::Data::Load::Tensor(tensor_path).to(torch::kFloat32);
            if (domain.signals.dim() == 2) {
                domain.signals = domain.signals.unsqueeze(1);
            }
            domain.occurrence = (domain.signals > window.wet_threshold).to(torch::kFloat32).mean({1, 2});
            return domain;
        }
        if (!series.empty()) {
            return Pluvio::Data::Load::Domain(series, window);
        }
        throw std::invalid_argument("No " + name + " data configured; set data." + name
                                    + "_tensor or data." + name + "_series.");
    }
}

int main(int argc, char** argv)
{
    if (argc != 2) {
        std::cerr << "usage: " << (argc > 0 ? argv[0] : "pluvio_train") << " <config.json>" << std::endl;
        return 2;
    }

    try {
        const auto config = Pluvio::Config::load(argv[1]);
        const auto context = Pluvio::Common::Context::select(config.use_cuda);

        const auto attenuation = load_domain(config.data.attenuation_tensor, config.data.attenuation_series,
                                             config.data.window, "attenuation");
        const auto rain_rate = load_domain(config.data.rain_rate_tensor, config.data.rain_rate_series,
                                           config.data.window, "rain_rate");
        auto dataset = Pluvio::Data::Prepare(attenuation, rain_rate, config.dataset);

        if (config.train.stream != nullptr) {
            *config.train.stream << "device: " << context.device << ", samples: " << dataset.size()
                                 << ", batches per epoch: " << dataset.batches() << std::endl;
        }

        Pluvio::CycleGan model(config.model, context);
        Pluvio::Training::Trainer trainer(config.train);
        trainer.fit(model, dataset);
    } catch (const std::exception& error) {
        std::cerr << "pluvio_train: " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
