#ifndef PLUVIO_COMMON_SAVE_LOAD_HPP
#define PLUVIO_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <torch/torch.h>

#include "../core.hpp"
#include "../initialization/initialization.hpp"
#include "../loss/loss.hpp"
#include "../network/network.hpp"
#include "../optimizer/optimizer.hpp"
#include "../training/objective.hpp"

namespace Pluvio::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        inline std::string join(const std::string& context, const std::string& key)
        {
            return context.empty() ? key : context + "." + key;
        }

        // Missing keys keep `fallback`; present keys of the wrong type are rejected.
        template <class T>
        T read_or(const PropertyTree& tree, const std::string& key, T fallback, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return fallback;
            }
            const auto value = child->get_value_optional<T>();
            if (!value) {
                throw std::invalid_argument("Field '" + join(context, key) + "' has an invalid value '"
                                            + child->data() + "'.");
            }
            return *value;
        }

        template <class T>
        T require(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            if (!tree.get_child_optional(key)) {
                throw std::invalid_argument("Missing field '" + join(context, key) + "'.");
            }
            return read_or<T>(tree, key, T{}, context);
        }

        inline std::string format_tensor_shape(const torch::Tensor& tensor)
        {
            std::ostringstream stream;
            stream << '[';
            for (std::int64_t d = 0; d < tensor.dim(); ++d) {
                if (d > 0) stream << ", ";
                stream << tensor.size(d);
            }
            stream << ']';
            return stream.str();
        }
    }

    inline PropertyTree serialize_initialization(const Initialization::Descriptor& descriptor)
    {
        PropertyTree tree;
        tree.put("type", Initialization::to_string(descriptor.type));
        tree.put("gain", descriptor.gain);
        return tree;
    }

    inline Initialization::Descriptor deserialize_initialization(const PropertyTree& tree,
                                                                 const std::string& context,
                                                                 Initialization::Descriptor fallback = Initialization::Normal)
    {
        Initialization::Descriptor descriptor = fallback;
        if (const auto type = tree.get_optional<std::string>("type")) {
            descriptor.type = Initialization::parse_type(*type);
        }
        descriptor.gain = Detail::read_or<double>(tree, "gain", fallback.gain, context);
        return descriptor;
    }

    inline PropertyTree serialize_translator(const Network::TranslatorDescriptor& descriptor)
    {
        PropertyTree tree;
        std::visit([&tree](const auto& concrete) {
            using DescriptorType = std::decay_t<decltype(concrete)>;
            if constexpr (std::is_same_v<DescriptorType, Network::ResnetTranslatorDescriptor>) {
                const auto& options = concrete.options;
                tree.put("type", "resnet");
                tree.put("input_channels", options.input_channels);
                tree.put("output_channels", options.output_channels);
                tree.put("filters", options.filters);
                tree.put("blocks", options.blocks);
                tree.put("downsampling", options.downsampling);
                tree.put("norm", Network::Details::to_string(options.norm));
                tree.put("dropout", options.dropout);
                tree.add_child("initialization", serialize_initialization(concrete.initialization));
            }
        }, descriptor);
        return tree;
    }

    inline Network::TranslatorDescriptor deserialize_translator(const PropertyTree& tree,
                                                                const std::string& context,
                                                                const Network::TranslatorDescriptor& fallback = Network::ResnetTranslator())
    {
        const auto type = Detail::to_lower(Detail::read_or<std::string>(tree, "type", "resnet", context));
        if (type != "resnet") {
            throw std::invalid_argument("Unknown translator type '" + type + "' in " + context + "; expected resnet.");
        }
        auto descriptor = std::get<Network::ResnetTranslatorDescriptor>(fallback);
        auto& options = descriptor.options;
        options.input_channels = Detail::read_or<std::int64_t>(tree, "input_channels", options.input_channels, context);
        options.output_channels = Detail::read_or<std::int64_t>(tree, "output_channels", options.output_channels, context);
        options.filters = Detail::read_or<std::int64_t>(tree, "filters", options.filters, context);
        options.blocks = Detail::read_or<std::int64_t>(tree, "blocks", options.blocks, context);
        options.downsampling = Detail::read_or<std::int64_t>(tree, "downsampling", options.downsampling, context);
        if (const auto norm = tree.get_optional<std::string>("norm")) {
            options.norm = Network::Details::parse_norm(*norm);
        }
        options.dropout = Detail::read_or<bool>(tree, "dropout", options.dropout, context);
        if (const auto initialization = tree.get_child_optional("initialization")) {
            descriptor.initialization = deserialize_initialization(*initialization, Detail::join(context, "initialization"),
                                                                   descriptor.initialization);
        }
        return descriptor;
    }

    inline PropertyTree serialize_critic(const Network::CriticDescriptor& descriptor)
    {
        PropertyTree tree;
        std::visit([&tree](const auto& concrete) {
            using DescriptorType = std::decay_t<decltype(concrete)>;
            if constexpr (std::is_same_v<DescriptorType, Network::PatchCriticDescriptor>) {
                const auto& options = concrete.options;
                tree.put("type", "patch");
                tree.put("input_channels", options.input_channels);
                tree.put("filters", options.filters);
                tree.put("layers", options.layers);
                tree.put("norm", Network::Details::to_string(options.norm));
                tree.add_child("initialization", serialize_initialization(concrete.initialization));
            }
        }, descriptor);
        return tree;
    }

    inline Network::CriticDescriptor deserialize_critic(const PropertyTree& tree,
                                                        const std::string& context,
                                                        const Network::CriticDescriptor& fallback = Network::PatchCritic())
    {
        const auto type = Detail::to_lower(Detail::read_or<std::string>(tree, "type", "patch", context));
        if (type != "patch") {
            throw std::invalid_argument("Unknown critic type '" + type + "' in " + context + "; expected patch.");
        }
        auto descriptor = std::get<Network::PatchCriticDescriptor>(fallback);
        auto& options = descriptor.options;
        options.input_channels = Detail::read_or<std::int64_t>(tree, "input_channels", options.input_channels, context);
        options.filters = Detail::read_or<std::int64_t>(tree, "filters", options.filters, context);
        options.layers = Detail::read_or<std::int64_t>(tree, "layers", options.layers, context);
        if (const auto norm = tree.get_optional<std::string>("norm")) {
            options.norm = Network::Details::parse_norm(*norm);
        }
        if (const auto initialization = tree.get_child_optional("initialization")) {
            descriptor.initialization = deserialize_initialization(*initialization, Detail::join(context, "initialization"),
                                                                   descriptor.initialization);
        }
        return descriptor;
    }

    inline PropertyTree serialize_optimizer(const Optimizer::Descriptor& descriptor)
    {
        PropertyTree tree;
        std::visit([&tree](const auto& concrete) {
            using DescriptorType = std::decay_t<decltype(concrete)>;
            const auto& options = concrete.options;
            if constexpr (std::is_same_v<DescriptorType, Optimizer::AdamDescriptor>) {
                tree.put("type", "adam");
            } else {
                tree.put("type", "adamw");
            }
            tree.put("options.learning_rate", options.learning_rate);
            tree.put("options.beta1", options.beta1);
            tree.put("options.beta2", options.beta2);
            tree.put("options.eps", options.eps);
            tree.put("options.weight_decay", options.weight_decay);
            tree.put("options.amsgrad", options.amsgrad);
        }, descriptor);
        return tree;
    }

    inline Optimizer::Descriptor deserialize_optimizer(const PropertyTree& tree, const std::string& context)
    {
        const auto type = Detail::to_lower(Detail::read_or<std::string>(tree, "type", "adam", context));
        auto fill = [&tree, &context](auto options) {
            options.learning_rate = Detail::read_or<double>(tree, "options.learning_rate", options.learning_rate, context);
            options.beta1 = Detail::read_or<double>(tree, "options.beta1", options.beta1, context);
            options.beta2 = Detail::read_or<double>(tree, "options.beta2", options.beta2, context);
            options.eps = Detail::read_or<double>(tree, "options.eps", options.eps, context);
            options.weight_decay = Detail::read_or<double>(tree, "options.weight_decay", options.weight_decay, context);
            options.amsgrad = Detail::read_or<bool>(tree, "options.amsgrad", options.amsgrad, context);
            return options;
        };
        if (type == "adam") {
            return Optimizer::Adam(fill(Optimizer::AdamOptions{}));
        }
        if (type == "adamw") {
            return Optimizer::AdamW(fill(Optimizer::AdamWOptions{}));
        }
        throw std::invalid_argument("Unknown optimizer type '" + type + "' in " + context + "; expected adam or adamw.");
    }

    inline PropertyTree serialize_objective(const Training::ObjectiveOptions& options)
    {
        PropertyTree tree;
        tree.put("lambda_A", options.lambda_A);
        tree.put("lambda_B", options.lambda_B);
        tree.put("lambda_identity", options.lambda_identity);
        tree.put("gan_mode", Loss::Details::to_string(options.gan.mode));
        tree.put("classification_threshold", options.classification_threshold);
        tree.put("cycle_threshold", options.cycle_threshold);
        tree.put("diagnostic_threshold", options.diagnostic_threshold);
        tree.put("cycle_mask", Training::to_string(options.cycle_mask));
        return tree;
    }

    inline Training::ObjectiveOptions deserialize_objective(const PropertyTree& tree,
                                                            const std::string& context,
                                                            Training::ObjectiveOptions options = {})
    {
        options.lambda_A = Detail::read_or<double>(tree, "lambda_A", options.lambda_A, context);
        options.lambda_B = Detail::read_or<double>(tree, "lambda_B", options.lambda_B, context);
        options.lambda_identity = Detail::read_or<double>(tree, "lambda_identity", options.lambda_identity, context);
        if (const auto mode = tree.get_optional<std::string>("gan_mode")) {
            options.gan.mode = Loss::Details::parse_gan_mode(*mode);
        }
        options.classification_threshold = Detail::read_or<double>(tree, "classification_threshold", options.classification_threshold, context);
        options.cycle_threshold = Detail::read_or<double>(tree, "cycle_threshold", options.cycle_threshold, context);
        options.diagnostic_threshold = Detail::read_or<double>(tree, "diagnostic_threshold", options.diagnostic_threshold, context);
        if (const auto mask = tree.get_optional<std::string>("cycle_mask")) {
            options.cycle_mask = Training::parse_cycle_mask(*mask);
        }
        return options;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("JSON file not found at '" + path.string() + "'.");
        }
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to parse JSON file '" + path.string() + "': " + error.what());
        }
        return tree;
    }

    [[nodiscard]] inline std::filesystem::path network_path(const std::filesystem::path& directory,
                                                            const std::string& suffix,
                                                            const std::string& name)
    {
        return directory / (suffix + "_net_" + name + ".pt");
    }

    [[nodiscard]] inline std::filesystem::path manifest_path(const std::filesystem::path& directory, const std::string& suffix)
    {
        return directory / (suffix + "_manifest.json");
    }

    // One archive per named network plus a manifest describing how they were built.
    inline std::filesystem::path save_networks(const CycleGan& model, const std::filesystem::path& directory, const std::string& suffix)
    {
        namespace fs = std::filesystem;
        if (directory.empty()) {
            throw std::invalid_argument("save_networks requires a non-empty directory path.");
        }
        if (suffix.empty()) {
            throw std::invalid_argument("save_networks requires a non-empty suffix.");
        }
        fs::create_directories(directory);

        const auto& options = model.options();
        PropertyTree manifest;
        manifest.put("suffix", suffix);
        manifest.put("is_train", options.is_train);
        manifest.put("direction", Pluvio::to_string(options.direction));
        manifest.put("pool_size", options.pool_size);
        manifest.put("peak_transformation_key", options.peak_transformation_key);
        manifest.add_child("objective", serialize_objective(options.objective));
        if (options.is_train) {
            manifest.add_child("optimizer_G", serialize_optimizer(options.optimizer_G));
            manifest.add_child("optimizer_D", serialize_optimizer(options.optimizer_D));
        }

        PropertyTree networks;
        for (const auto& [name, network] : model.networks()) {
            const auto path = network_path(directory, suffix, name);
            try {
                torch::serialize::OutputArchive archive;
                network->save(archive);
                archive.save_to(path.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to write network '" + name + "' to '" + path.string() + "': " + error.what());
            }

            PropertyTree entry;
            entry.put("file", path.filename().string());
            entry.put("module", network->name());
            entry.put("parameters", network->parameter_count());
            if (name == "G_A") entry.add_child("architecture", serialize_translator(options.translator_A));
            if (name == "G_B") entry.add_child("architecture", serialize_translator(options.translator_B));
            if (name == "D_A") entry.add_child("architecture", serialize_critic(options.critic_A));
            if (name == "D_B") entry.add_child("architecture", serialize_critic(options.critic_B));
            networks.add_child(name, entry);
        }
        manifest.add_child("networks", networks);

        const auto path = manifest_path(directory, suffix);
        try {
            write_json_file(path, manifest);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to write manifest '" + path.string() + "': " + error.what());
        }
        return path;
    }

    namespace Detail {
        // Module::save nests one archive per submodule, so "layers.1.weight" lives in archive "layers", then "1".
        inline bool try_read_nested(torch::serialize::InputArchive& archive, const std::string& key,
                                    torch::Tensor& tensor, bool is_buffer)
        {
            const auto dot = key.find('.');
            if (dot == std::string::npos) {
                return archive.try_read(key, tensor, is_buffer);
            }
            torch::serialize::InputArchive nested;
            if (!archive.try_read(key.substr(0, dot), nested)) {
                return false;
            }
            return try_read_nested(nested, key.substr(dot + 1), tensor, is_buffer);
        }

        inline void validate_archive(torch::nn::Module& network, torch::serialize::InputArchive& archive, const std::string& name)
        {
            for (const auto& item : network.named_parameters(/*recurse=*/true)) {
                torch::Tensor stored;
                if (!try_read_nested(archive, item.key(), stored, /*is_buffer=*/false) || !stored.defined()) {
                    throw std::runtime_error("Checkpoint of '" + name + "' is missing parameter '" + item.key() + "'.");
                }
                if (stored.sizes() != item.value().sizes()) {
                    throw std::runtime_error("Parameter '" + name + "." + item.key() + "' shape mismatch: expected "
                                             + format_tensor_shape(item.value()) + " but found "
                                             + format_tensor_shape(stored) + ".");
                }
            }
            for (const auto& item : network.named_buffers(/*recurse=*/true)) {
                if (!item.value().defined()) {
                    continue;
                }
                torch::Tensor stored;
                if (!try_read_nested(archive, item.key(), stored, /*is_buffer=*/true) || !stored.defined()) {
                    throw std::runtime_error("Checkpoint of '" + name + "' is missing buffer '" + item.key() + "'.");
                }
                if (stored.sizes() != item.value().sizes()) {
                    throw std::runtime_error("Buffer '" + name + "." + item.key() + "' shape mismatch: expected "
                                             + format_tensor_shape(item.value()) + " but found "
                                             + format_tensor_shape(stored) + ".");
                }
            }
        }
    }

    // Loads every network the model owns. Nothing is modified unless all archives validate.
    inline void load_networks(CycleGan& model, const std::filesystem::path& directory, const std::string& suffix)
    {
        namespace fs = std::filesystem;
        const auto path = manifest_path(directory, suffix);
        const auto manifest = read_json_file(path);

        const auto networks = manifest.get_child_optional("networks");
        if (!networks) {
            throw std::runtime_error("Manifest '" + path.string() + "' is missing the 'networks' entry.");
        }

        std::vector<std::pair<Network::SignalModulePtr, torch::serialize::InputArchive>> staged;
        for (const auto& [name, network] : model.networks()) {
            const auto entry = networks->get_child_optional(name);
            if (!entry) {
                throw std::runtime_error("Manifest '" + path.string() + "' has no entry for network '" + name + "'.");
            }
            const auto file = directory / entry->get<std::string>("file", network_path(directory, suffix, name).filename().string());
            if (!fs::exists(file)) {
                throw std::runtime_error("Archive for network '" + name + "' not found at '" + file.string() + "'.");
            }

            torch::serialize::InputArchive archive;
            try {
                archive.load_from(file.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to open archive '" + file.string() + "': " + error.what());
            }
            Detail::validate_archive(*network, archive, name);
            staged.emplace_back(network, std::move(archive));
        }

        for (auto& [network, archive] : staged) {
            try {
                network->load(archive);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to load parameters of '" + network->name() + "': " + error.what());
            }
        }
    }

    inline void print_networks(const CycleGan& model, std::ostream* stream, bool verbose = false)
    {
        if (stream == nullptr) {
            return;
        }
        auto& out = *stream;
        out << "---------- Networks initialized -------------\n";
        for (const auto& [name, network] : model.networks()) {
            if (verbose) {
                network->pretty_print(out);
                out << '\n';
            }
            std::ostringstream millions;
            millions << std::fixed << std::setprecision(3) << static_cast<double>(network->parameter_count()) / 1e6;
            out << "[Network " << name << "] Total number of parameters : " << millions.str() << " M\n";
        }
        out << "-----------------------------------------------" << std::endl;
    }
}
#endif // PLUVIO_COMMON_SAVE_LOAD_HPP
