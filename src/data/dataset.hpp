#ifndef PLUVIO_DATA_DATASET_HPP
#define PLUVIO_DATA_DATASET_HPP
#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/random.hpp"
#include "load/types.hpp"
#include "transform/normalization/minmax.hpp"

namespace Pluvio::Data {
    using MinMaxStatistics = Transform::Normalization::MinMaxStatistics;

    // Keyed by domain: "link" for attenuation, "gauge" for rain rate.
    using Transformation = std::map<std::string, MinMaxStatistics>;

    [[nodiscard]] inline const MinMaxStatistics& require(const Transformation& transformation,
                                                         const std::string& key,
                                                         const std::string& what)
    {
        const auto it = transformation.find(key);
        if (it == transformation.end()) {
            throw std::invalid_argument(what + " has no entry for key '" + key + "'.");
        }
        return it->second;
    }

    struct Batch {
        torch::Tensor A;                       // attenuation [N, C_A, L], normalized
        torch::Tensor B;                       // rain rate   [N, C_B, L], normalized
        std::vector<std::string> link{};
        std::vector<std::string> gauge{};
        torch::Tensor metadata_A{};
        torch::Tensor metadata_B{};
        torch::Tensor attenuation{};           // [N] wet fraction of each A window
        torch::Tensor rain_rate{};             // [N] wet fraction of each B window
        Transformation data_transformation{};
        Transformation metadata_transformation{};

        [[nodiscard]] std::int64_t size() const { return A.defined() ? A.size(0) : 0; }
    };

    // One normalized domain.
    struct Domain {
        torch::Tensor signals;
        std::vector<std::string> identifiers{};
        torch::Tensor metadata{};
        torch::Tensor occurrence{};

        [[nodiscard]] std::int64_t size() const { return signals.defined() ? signals.size(0) : 0; }
    };

    struct DatasetOptions {
        std::int64_t batch_size{1};
        bool serial_batches{false};            // B rows follow A rows instead of being drawn at random
        std::int64_t max_dataset_size{std::numeric_limits<std::int64_t>::max()};
        std::optional<std::uint64_t> seed{};
    };

    namespace Details {
        inline void check_domain(const Domain& domain, const std::string& name)
        {
            if (!domain.signals.defined() || domain.signals.dim() != 3) {
                throw std::invalid_argument(name + " signals must be a [N, C, L] tensor.");
            }
            const auto count = domain.signals.size(0);
            if (count == 0) {
                throw std::invalid_argument(name + " domain is empty.");
            }
            if (!domain.identifiers.empty() && static_cast<std::int64_t>(domain.identifiers.size()) != count) {
                throw std::invalid_argument(name + " carries " + std::to_string(domain.identifiers.size())
                                            + " identifiers for " + std::to_string(count) + " samples.");
            }
            if (domain.metadata.defined() && (domain.metadata.dim() != 2 || domain.metadata.size(0) != count)) {
                throw std::invalid_argument(name + " metadata must be a [N, M] tensor with N = " + std::to_string(count) + ".");
            }
            if (domain.occurrence.defined() && domain.occurrence.numel() != count) {
                throw std::invalid_argument(name + " occurrence must hold one value per sample.");
            }
        }

        inline std::vector<std::string> gather(const std::vector<std::string>& values, const std::vector<std::int64_t>& rows)
        {
            std::vector<std::string> result;
            if (values.empty()) {
                return result;
            }
            result.reserve(rows.size());
            for (const auto row : rows) {
                result.push_back(values[static_cast<std::size_t>(row)]);
            }
            return result;
        }

        inline torch::Tensor gather(const torch::Tensor& values, const torch::Tensor& rows)
        {
            if (!values.defined()) {
                return {};
            }
            return values.index_select(0, rows.to(values.device()));
        }
    }

    class UnpairedDataset {
    public:
        UnpairedDataset(Domain attenuation,
                        Domain rain_rate,
                        Transformation data_transformation,
                        Transformation metadata_transformation = {},
                        DatasetOptions options = {})
            : attenuation_(std::move(attenuation)),
              rain_rate_(std::move(rain_rate)),
              data_transformation_(std::move(data_transformation)),
              metadata_transformation_(std::move(metadata_transformation)),
              options_(options),
              rng_(Common::build_rng(options.seed))
        {
            Details::check_domain(attenuation_, "Attenuation");
            Details::check_domain(rain_rate_, "Rain-rate");
            if (attenuation_.signals.size(2) != rain_rate_.signals.size(2)) {
                throw std::invalid_argument("Attenuation and rain-rate windows must share a length, got "
                                            + std::to_string(attenuation_.signals.size(2)) + " and "
                                            + std::to_string(rain_rate_.signals.size(2)) + ".");
            }
            if (options_.batch_size <= 0) {
                throw std::invalid_argument("Batch size must be positive.");
            }
            if (options_.max_dataset_size <= 0) {
                throw std::invalid_argument("max_dataset_size must be positive.");
            }
        }

        // Attenuation sample count, truncated by max_dataset_size.
        [[nodiscard]] std::int64_t size() const
        {
            return std::min(attenuation_.size(), options_.max_dataset_size);
        }

        [[nodiscard]] std::int64_t batches() const
        {
            return (size() + options_.batch_size - 1) / options_.batch_size;
        }

        [[nodiscard]] Batch batch(std::int64_t index)
        {
            if (index < 0 || index >= batches()) {
                throw std::out_of_range("Batch index " + std::to_string(index) + " outside [0, "
                                        + std::to_string(batches()) + ").");
            }
            const auto begin = index * options_.batch_size;
            const auto end = std::min(begin + options_.batch_size, size());

            std::vector<std::int64_t> rows_A;
            std::vector<std::int64_t> rows_B;
            rows_A.reserve(static_cast<std::size_t>(end - begin));
            rows_B.reserve(static_cast<std::size_t>(end - begin));

            std::uniform_int_distribution<std::int64_t> pick(0, rain_rate_.size() - 1);
            for (auto row = begin; row < end; ++row) {
                rows_A.push_back(row);
                rows_B.push_back(options_.serial_batches ? row % rain_rate_.size() : pick(rng_));
            }

            const auto index_A = torch::tensor(rows_A, torch::TensorOptions().dtype(torch::kLong));
            const auto index_B = torch::tensor(rows_B, torch::TensorOptions().dtype(torch::kLong));

            Batch batch;
            batch.A = Details::gather(attenuation_.signals, index_A);
            batch.B = Details::gather(rain_rate_.signals, index_B);
            batch.link = Details::gather(attenuation_.identifiers, rows_A);
            batch.gauge = Details::gather(rain_rate_.identifiers, rows_B);
            batch.metadata_A = Details::gather(attenuation_.metadata, index_A);
            batch.metadata_B = Details::gather(rain_rate_.metadata, index_B);
            batch.attenuation = Details::gather(attenuation_.occurrence, index_A);
            batch.rain_rate = Details::gather(rain_rate_.occurrence, index_B);
            batch.data_transformation = data_transformation_;
            batch.metadata_transformation = metadata_transformation_;
            return batch;
        }

        [[nodiscard]] const DatasetOptions& options() const noexcept { return options_; }
        [[nodiscard]] const Domain& attenuation() const noexcept { return attenuation_; }
        [[nodiscard]] const Domain& rain_rate() const noexcept { return rain_rate_; }
        [[nodiscard]] const Transformation& data_transformation() const noexcept { return data_transformation_; }
        [[nodiscard]] const Transformation& metadata_transformation() const noexcept { return metadata_transformation_; }

    private:
        Domain attenuation_;
        Domain rain_rate_;
        Transformation data_transformation_;
        Transformation metadata_transformation_;
        DatasetOptions options_;
        std::mt19937_64 rng_;
    };

    // Fits min/max on each raw domain and returns the normalized dataset.
    [[nodiscard]] inline UnpairedDataset Prepare(const Type::RawDomain& attenuation,
                                                 const Type::RawDomain& rain_rate,
                                                 DatasetOptions options = {})
    {
        namespace Normalization = Transform::Normalization;

        Transformation data_transformation;
        Transformation metadata_transformation;

        auto normalize = [&](const Type::RawDomain& raw, const std::string& key) {
            if (!raw.signals.defined() || raw.signals.dim() != 3 || raw.signals.size(0) == 0) {
                throw std::invalid_argument("Domain '" + key + "' has no [N, C, L] signals to normalize.");
            }
            Domain domain;
            const auto statistics = Normalization::FitMinMax(raw.signals);
            domain.signals = Normalization::MinMax(raw.signals, statistics);
            data_transformation.emplace(key, statistics);
            if (raw.metadata.defined() && raw.metadata.numel() > 0) {
                const auto metadata_statistics = Normalization::FitMinMax(raw.metadata);
                domain.metadata = Normalization::MinMax(raw.metadata, metadata_statistics);
                metadata_transformation.emplace(key, metadata_statistics);
            }
            domain.identifiers = raw.identifiers;
            domain.occurrence = raw.occurrence;
            return domain;
        };

        auto attenuation_domain = normalize(attenuation, "link");
        auto rain_rate_domain = normalize(rain_rate, "gauge");
        return UnpairedDataset(std::move(attenuation_domain), std::move(rain_rate_domain),
                               std::move(data_transformation), std::move(metadata_transformation), options);
    }
}

#endif // PLUVIO_DATA_DATASET_HPP
