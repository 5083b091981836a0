#ifndef PLUVIO_REPORT_HPP
#define PLUVIO_REPORT_HPP
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../utils/terminal.hpp"

namespace Pluvio::Report {
    struct LossLine {
        std::int64_t epoch{0};
        std::int64_t iterations{0};            // samples seen in the current epoch
        double compute_seconds{0.0};           // per sample
        double data_seconds{0.0};              // per batch
        std::vector<std::pair<std::string, double>> losses{};
    };

    struct ReportOptions {
        bool color{true};
        int precision{3};
    };

    namespace Details {
        inline std::string format_number(double value, int precision)
        {
            std::ostringstream stream;
            stream << std::fixed << std::setprecision(precision) << value;
            return stream.str();
        }
    }

    // One framed two-row table: names on top, values below.
    inline void print_losses(std::ostream* stream, const LossLine& line, const ReportOptions& options = {})
    {
        if (stream == nullptr) {
            return;
        }
        namespace Terminal = Utils::Terminal;
        const std::string_view frame = options.color ? Terminal::Colors::kBrightCyan : std::string_view{};

        std::vector<std::string> header{"epoch", "iters", "time", "data"};
        std::vector<std::string> values{
            std::to_string(line.epoch),
            std::to_string(line.iterations),
            Details::format_number(line.compute_seconds, options.precision),
            Details::format_number(line.data_seconds, options.precision),
        };
        for (const auto& [name, value] : line.losses) {
            header.push_back(name);
            values.push_back(Details::format_number(value, options.precision));
        }

        std::vector<std::size_t> spacings;
        spacings.reserve(header.size());
        for (std::size_t i = 0; i < header.size(); ++i) {
            spacings.push_back(std::max(header[i].size(), values[i].size()) + 2);
        }
        auto pad = [](const std::vector<std::string>& cells) {
            std::vector<std::string> padded;
            padded.reserve(cells.size());
            for (const auto& cell : cells) padded.push_back(" " + cell);
            return padded;
        };

        auto& out = *stream;
        out << Terminal::HTop(spacings, frame) << '\n'
            << Terminal::HRow(pad(header), spacings, frame) << '\n'
            << Terminal::HMid(spacings, frame) << '\n'
            << Terminal::HRow(pad(values), spacings, frame) << '\n'
            << Terminal::HBottom(spacings, frame) << std::endl;
    }

    inline void print_learning_rate(std::ostream* stream, std::string_view name, double before, double after)
    {
        if (stream == nullptr) {
            return;
        }
        *stream << "learning rate (" << name << ") " << std::setprecision(7) << before << " -> " << after << std::endl;
    }

    inline void print_epoch_end(std::ostream* stream, std::int64_t epoch, std::int64_t last_epoch, double seconds, bool color = true)
    {
        if (stream == nullptr) {
            return;
        }
        namespace Terminal = Utils::Terminal;
        const std::string_view accent = color ? Terminal::Colors::kGoldenrod : std::string_view{};
        *stream << Terminal::ApplyColor(Terminal::Symbols::kClock, accent)
                << " End of epoch " << epoch << " / " << last_epoch
                << "\t Time Taken: " << static_cast<std::int64_t>(seconds) << " sec" << std::endl;
    }
}

#endif // PLUVIO_REPORT_HPP
