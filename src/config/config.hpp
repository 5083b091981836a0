#ifndef PLUVIO_CONFIG_CONFIG_HPP
#define PLUVIO_CONFIG_CONFIG_HPP
/*
 * Run configuration read from one JSON document.
 *
 *  {
 *    "use_cuda": false,
 *    "model":   { "direction", "pool_size", "seed", "peak_transformation_key",
 *                 "objective", "translator_A", "translator_B", "critic_A", "critic_B",
 *                 "optimizer" (both), "optimizer_G", "optimizer_D" },
 *    "dataset": { "batch_size", "serial_batches", "max_dataset_size", "seed" },
 *    "data":    { "attenuation_tensor" | "attenuation_series": [{ "path", "identifier", "metadata": [] }],
 *                 "rain_rate_tensor"   | "rain_rate_series",
 *                 "window": { "length", "stride", "wet_threshold" } },
 *    "train":   { "name", "checkpoints_dir", "epoch_count", "n_epochs", "n_epochs_decay",
 *                 "lr_policy", "lr_decay_iters", "print_freq", "save_latest_freq",
 *                 "save_epoch_freq", "save_by_iter", "continue_from", "color", "quiet" }
 *  }
 *
 * Every key is optional. Relative paths are resolved against the directory holding the file.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "../common/save_load.hpp"
#include "../core.hpp"
#include "../data/dataset.hpp"
#include "../data/load/types.hpp"
#include "../training/trainer.hpp"

namespace Pluvio::Config {
    using PropertyTree = boost::property_tree::ptree;

    struct DataConfig {
        std::filesystem::path attenuation_tensor{};
        std::filesystem::path rain_rate_tensor{};
        std::vector<Data::Type::SeriesSource> attenuation_series{};
        std::vector<Data::Type::SeriesSource> rain_rate_series{};
        Data::Type::WindowOptions window{};
    };

    struct RunConfig {
        CycleGanOptions model{};
        Data::DatasetOptions dataset{};
        DataConfig data{};
        Training::TrainOptions train{};
        bool use_cuda{false};
    };

    namespace Details {
        namespace Detail = Common::SaveLoad::Detail;

        inline std::filesystem::path resolve(const std::filesystem::path& base, const std::string& value)
        {
            std::filesystem::path path(value);
            if (path.empty() || path.is_absolute()) {
                return path;
            }
            return base / path;
        }

        inline std::optional<std::uint64_t> read_seed(const PropertyTree& tree, const std::string& context,
                                                      std::optional<std::uint64_t> fallback)
        {
            if (!tree.get_child_optional("seed")) {
                return fallback;
            }
            const auto seed = Detail::read_or<std::int64_t>(tree, "seed", 0, context);
            if (seed < 0) {
                throw std::invalid_argument("Field '" + Detail::join(context, "seed") + "' must be non-negative.");
            }
            return static_cast<std::uint64_t>(seed);
        }

        inline std::vector<Data::Type::SeriesSource> read_series(const PropertyTree& tree,
                                                                 const std::string& key,
                                                                 const std::filesystem::path& base,
                                                                 const std::string& context)
        {
            std::vector<Data::Type::SeriesSource> sources;
            const auto array = tree.get_child_optional(key);
            if (!array) {
                return sources;
            }
            std::size_t index = 0;
            for (const auto& item : *array) {
                const auto& entry = item.second;
                const auto entry_context = Detail::join(context, key + "[" + std::to_string(index++) + "]");
                Data::Type::SeriesSource source;
                source.path = resolve(base, Detail::require<std::string>(entry, "path", entry_context));
                source.identifier = Detail::read_or<std::string>(entry, "identifier", "", entry_context);
                if (const auto metadata = entry.get_child_optional("metadata")) {
                    std::size_t position = 0;
                    for (const auto& value : *metadata) {
                        const auto number = value.second.get_value_optional<double>();
                        if (!number) {
                            throw std::invalid_argument("Field '" + entry_context + ".metadata["
                                                        + std::to_string(position) + "]' is not a number.");
                        }
                        source.metadata.push_back(*number);
                        ++position;
                    }
                }
                sources.push_back(std::move(source));
            }
            return sources;
        }

        inline CycleGanOptions read_model(const PropertyTree& tree)
        {
            const std::string context = "model";
            CycleGanOptions options;
            if (const auto direction = tree.get_optional<std::string>("direction")) {
                options.direction = parse_direction(*direction);
            }
            options.pool_size = Detail::read_or<std::int64_t>(tree, "pool_size", options.pool_size, context);
            options.seed = read_seed(tree, context, options.seed);
            options.peak_transformation_key =
                Detail::read_or<std::string>(tree, "peak_transformation_key", options.peak_transformation_key, context);

            if (const auto objective = tree.get_child_optional("objective")) {
                options.objective = Common::SaveLoad::deserialize_objective(*objective, "model.objective", options.objective);
            }
            if (const auto translator = tree.get_child_optional("translator_A")) {
                options.translator_A = Common::SaveLoad::deserialize_translator(*translator, "model.translator_A", options.translator_A);
            }
            if (const auto translator = tree.get_child_optional("translator_B")) {
                options.translator_B = Common::SaveLoad::deserialize_translator(*translator, "model.translator_B", options.translator_B);
            }
            if (const auto critic = tree.get_child_optional("critic_A")) {
                options.critic_A = Common::SaveLoad::deserialize_critic(*critic, "model.critic_A", options.critic_A);
            }
            if (const auto critic = tree.get_child_optional("critic_B")) {
                options.critic_B = Common::SaveLoad::deserialize_critic(*critic, "model.critic_B", options.critic_B);
            }
            if (const auto optimizer = tree.get_child_optional("optimizer")) {
                options.optimizer_G = Common::SaveLoad::deserialize_optimizer(*optimizer, "model.optimizer");
                options.optimizer_D = options.optimizer_G;
            }
            if (const auto optimizer = tree.get_child_optional("optimizer_G")) {
                options.optimizer_G = Common::SaveLoad::deserialize_optimizer(*optimizer, "model.optimizer_G");
            }
            if (const auto optimizer = tree.get_child_optional("optimizer_D")) {
                options.optimizer_D = Common::SaveLoad::deserialize_optimizer(*optimizer, "model.optimizer_D");
            }
            if (options.pool_size < 0) {
                throw std::invalid_argument("Field 'model.pool_size' must be non-negative.");
            }
            return options;
        }

        inline Data::DatasetOptions read_dataset(const PropertyTree& tree)
        {
            const std::string context = "dataset";
            Data::DatasetOptions options;
            options.batch_size = Detail::read_or<std::int64_t>(tree, "batch_size", options.batch_size, context);
            options.serial_batches = Detail::read_or<bool>(tree, "serial_batches", options.serial_batches, context);
            options.max_dataset_size = Detail::read_or<std::int64_t>(tree, "max_dataset_size", options.max_dataset_size, context);
            options.seed = read_seed(tree, context, options.seed);
            return options;
        }

        inline DataConfig read_data(const PropertyTree& tree, const std::filesystem::path& base)
        {
            const std::string context = "data";
            DataConfig data;
            data.attenuation_tensor = resolve(base, Detail::read_or<std::string>(tree, "attenuation_tensor", "", context));
            data.rain_rate_tensor = resolve(base, Detail::read_or<std::string>(tree, "rain_rate_tensor", "", context));
            data.attenuation_series = read_series(tree, "attenuation_series", base, context);
            data.rain_rate_series = read_series(tree, "rain_rate_series", base, context);
            if (const auto window = tree.get_child_optional("window")) {
                const std::string window_context = "data.window";
                data.window.length = Detail::read_or<std::int64_t>(*window, "length", data.window.length, window_context);
                data.window.stride = Detail::read_or<std::int64_t>(*window, "stride", data.window.stride, window_context);
                data.window.wet_threshold =
                    Detail::read_or<double>(*window, "wet_threshold", data.window.wet_threshold, window_context);
            }
            return data;
        }

        inline Training::TrainOptions read_train(const PropertyTree& tree, const std::filesystem::path& base)
        {
            const std::string context = "train";
            Training::TrainOptions options;
            options.name = Detail::read_or<std::string>(tree, "name", options.name, context);
            options.checkpoints_dir =
                resolve(base, Detail::read_or<std::string>(tree, "checkpoints_dir", options.checkpoints_dir.string(), context));
            options.epoch_count = Detail::read_or<std::int64_t>(tree, "epoch_count", options.epoch_count, context);
            options.n_epochs = Detail::read_or<std::int64_t>(tree, "n_epochs", options.n_epochs, context);
            options.n_epochs_decay = Detail::read_or<std::int64_t>(tree, "n_epochs_decay", options.n_epochs_decay, context);
            if (const auto policy = tree.get_optional<std::string>("lr_policy")) {
                options.lr_policy = Training::parse_lr_policy(*policy);
            }
            options.lr_decay_iters = Detail::read_or<std::int64_t>(tree, "lr_decay_iters", options.lr_decay_iters, context);
            options.print_freq = Detail::read_or<std::int64_t>(tree, "print_freq", options.print_freq, context);
            options.save_latest_freq = Detail::read_or<std::int64_t>(tree, "save_latest_freq", options.save_latest_freq, context);
            options.save_epoch_freq = Detail::read_or<std::int64_t>(tree, "save_epoch_freq", options.save_epoch_freq, context);
            options.save_by_iter = Detail::read_or<bool>(tree, "save_by_iter", options.save_by_iter, context);
            options.continue_from = Detail::read_or<std::string>(tree, "continue_from", options.continue_from, context);
            options.color = Detail::read_or<bool>(tree, "color", options.color, context);
            if (Detail::read_or<bool>(tree, "quiet", false, context)) {
                options.stream = nullptr;
            }
            return options;
        }
    }

    // Builds a RunConfig from an already parsed tree; `base` anchors relative paths.
    [[nodiscard]] inline RunConfig parse(const PropertyTree& tree, const std::filesystem::path& base = {})
    {
        static const PropertyTree empty{};
        const auto section = [&tree](const char* key) -> const PropertyTree& {
            const auto child = tree.get_child_optional(key);
            return child ? *child : empty;
        };

        RunConfig config;
        config.use_cuda = Common::SaveLoad::Detail::read_or<bool>(tree, "use_cuda", config.use_cuda, "");
        config.model = Details::read_model(section("model"));
        config.dataset = Details::read_dataset(section("dataset"));
        config.data = Details::read_data(section("data"), base);
        config.train = Details::read_train(section("train"), base);
        return config;
    }

    [[nodiscard]] inline RunConfig load(const std::filesystem::path& path)
    {
        const auto tree = Common::SaveLoad::read_json_file(path);
        return parse(tree, path.parent_path());
    }

}

#endif // PLUVIO_CONFIG_CONFIG_HPP
