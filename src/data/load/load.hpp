#ifndef PLUVIO_DATA_LOAD_HPP
#define PLUVIO_DATA_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "types.hpp"

namespace Pluvio::Data::Load {
    namespace Details {
        inline std::string trim_copy(const std::string& value)
        {
            const auto not_space = [](unsigned char character) { return !std::isspace(character); };
            auto first = std::find_if(value.begin(), value.end(), not_space);
            auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
            if (first >= last) {
                return {};
            }
            std::string result(first, last);
            while (!result.empty() && (result.front() == '"' || result.front() == '\'')) {
                result.erase(result.begin());
            }
            while (!result.empty() && (result.back() == '"' || result.back() == '\'')) {
                result.pop_back();
            }
            return result;
        }

        inline std::vector<std::string> split_csv_line(const std::string& line, char delimiter = ',')
        {
            std::vector<std::string> tokens;
            std::string current;
            bool in_quote = false;

            for (std::size_t i = 0; i < line.size(); ++i) {
                const char c = line[i];
                if (c == '"') {
                    if (in_quote && i + 1 < line.size() && line[i + 1] == '"') {
                        current.push_back('"');
                        ++i;
                    } else {
                        in_quote = !in_quote;
                    }
                    continue;
                }
                if (!in_quote && c == delimiter) {
                    tokens.emplace_back(trim_copy(current));
                    current.clear();
                    continue;
                }
                current.push_back(c);
            }
            tokens.emplace_back(trim_copy(current));
            return tokens;
        }

        inline std::string strip_utf8_bom(std::string value)
        {
            constexpr unsigned char bom[] = {0xEF, 0xBB, 0xBF};
            if (value.size() >= 3 &&
                static_cast<unsigned char>(value[0]) == bom[0] &&
                static_cast<unsigned char>(value[1]) == bom[1] &&
                static_cast<unsigned char>(value[2]) == bom[2]) {
                value.erase(0, 3);
            }
            return value;
        }

        inline std::optional<double> parse_float(const std::string& token)
        {
            const auto trimmed = trim_copy(token);
            if (trimmed.empty()) return std::nullopt;

            double value{};
            const auto* first = trimmed.data();
            const auto* last = trimmed.data() + trimmed.size();
            const auto result = std::from_chars(first, last, value);
            if (result.ec == std::errc() && result.ptr == last) {
                return value;
            }

            // Older standard libraries lack floating-point from_chars for some formats.
            try {
                std::size_t processed = 0;
                const double fallback = std::stod(trimmed, &processed);
                if (processed != trimmed.size()) return std::nullopt;
                return fallback;
            } catch (const std::invalid_argument&) {
                return std::nullopt;
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }

        // Rows of a "timestamp,channel_0,...,channel_k" file as a [T, C] float tensor.
        // Rows with a missing or non-numeric reading are dropped.
        inline torch::Tensor read_series_csv(const std::filesystem::path& file_path)
        {
            if (!std::filesystem::exists(file_path)) {
                throw std::runtime_error("Series CSV file does not exist: " + file_path.string());
            }
            std::ifstream file(file_path);
            if (!file) {
                throw std::runtime_error("Failed to open series CSV file: " + file_path.string());
            }

            std::string header_line;
            if (!std::getline(file, header_line)) {
                throw std::runtime_error("Series CSV file is empty: " + file_path.string());
            }
            const auto header = split_csv_line(strip_utf8_bom(header_line));
            if (header.size() < 2) {
                throw std::runtime_error("Series CSV header must contain a timestamp and at least one reading column: "
                                         + file_path.string());
            }
            const std::size_t channels = header.size() - 1;

            std::vector<float> buffer;
            buffer.reserve(static_cast<std::size_t>(4096) * channels);
            std::vector<float> row;
            row.reserve(channels);

            std::string line;
            while (std::getline(file, line)) {
                if (line.empty()) {
                    continue;
                }
                const auto tokens = split_csv_line(line);
                if (tokens.size() < header.size()) {
                    continue;
                }
                row.clear();
                bool valid = true;
                for (std::size_t index = 1; index < header.size(); ++index) {
                    const auto value = parse_float(tokens[index]);
                    if (!value) {
                        valid = false;
                        break;
                    }
                    row.push_back(static_cast<float>(*value));
                }
                if (valid) {
                    buffer.insert(buffer.end(), row.begin(), row.end());
                }
            }

            const auto steps = static_cast<std::int64_t>(buffer.size() / channels);
            return torch::from_blob(buffer.data(), {steps, static_cast<std::int64_t>(channels)},
                                    torch::TensorOptions().dtype(torch::kFloat32)).clone();
        }

        // [T, C] -> [W, C, L] windows of `length` steps every `stride` steps.
        inline torch::Tensor window(const torch::Tensor& series, std::int64_t length, std::int64_t stride)
        {
            if (series.size(0) < length) {
                return torch::empty({0, series.size(1), length}, series.options());
            }
            return series.transpose(0, 1).unfold(/*dimension=*/1, length, stride).transpose(0, 1).contiguous();
        }
    }

    // Tensor written by torch::save.
    [[nodiscard]] inline torch::Tensor Tensor(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Tensor file does not exist: " + path.string());
        }
        torch::Tensor tensor;
        try {
            torch::load(tensor, path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to load tensor from '" + path.string() + "': " + error.what());
        }
        return tensor;
    }

    // Windows every series of one domain and stacks them. Identifiers default to the file stem.
    [[nodiscard]] inline Type::RawDomain Domain(const std::vector<Type::SeriesSource>& sources, const Type::WindowOptions& options)
    {
        if (options.length <= 0 || options.stride <= 0) {
            throw std::invalid_argument("Window length and stride must be positive.");
        }
        if (sources.empty()) {
            throw std::invalid_argument("A domain needs at least one series source.");
        }

        std::vector<torch::Tensor> signals;
        std::vector<torch::Tensor> metadata;
        std::vector<torch::Tensor> occurrence;
        Type::RawDomain domain;
        std::optional<std::size_t> metadata_width{};

        for (const auto& source : sources) {
            auto series = Details::read_series_csv(source.path);
            auto windows = Details::window(series, options.length, options.stride);
            const auto count = windows.size(0);
            if (count == 0) {
                continue;
            }

            if (!metadata_width) {
                metadata_width = source.metadata.size();
            } else if (*metadata_width != source.metadata.size()) {
                throw std::invalid_argument("Series '" + source.path.string() + "' carries "
                                            + std::to_string(source.metadata.size()) + " metadata values, expected "
                                            + std::to_string(*metadata_width) + ".");
            }

            const auto identifier = source.identifier.empty() ? source.path.stem().string() : source.identifier;
            domain.identifiers.insert(domain.identifiers.end(), static_cast<std::size_t>(count), identifier);

            if (!source.metadata.empty()) {
                auto row = torch::tensor(source.metadata, torch::TensorOptions().dtype(torch::kDouble)).to(torch::kFloat32);
                metadata.push_back(row.unsqueeze(0).expand({count, row.size(0)}).clone());
            }
            occurrence.push_back((windows > options.wet_threshold).to(torch::kFloat32).mean({1, 2}));
            signals.push_back(std::move(windows));
        }

        if (signals.empty()) {
            throw std::invalid_argument("No series was long enough for a window of "
                                        + std::to_string(options.length) + " steps.");
        }

        domain.signals = torch::cat(signals, 0);
        domain.occurrence = torch::cat(occurrence, 0);
        if (!metadata.empty()) {
            domain.metadata = torch::cat(metadata, 0);
        }
        return domain;
    }
}

#endif // PLUVIO_DATA_LOAD_HPP
