#ifndef PLUVIO_UTILS_PROGRESSBAR_HPP
#define PLUVIO_UTILS_PROGRESSBAR_HPP

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace Pluvio::Utils {
    // One-line batch counter for an epoch: "epoch 3 [█████     ]  50% (6/12)".
    // A null stream turns every call into a no-op.
    class ProgressBar {
    public:
        ProgressBar(std::int64_t batches, std::string label, std::ostream* stream = &std::cout, std::int64_t width = 30)
            : batches_(std::max<std::int64_t>(batches, 0)),
              label_(std::move(label)),
              stream_(stream),
              width_(std::max<std::int64_t>(width, 1)) {}

        // Redraws only when the filled cell count or the percentage moves.
        void update(std::int64_t done) {
            if (closed_ || batches_ == 0 || stream_ == nullptr) {
                return;
            }
            done = std::clamp<std::int64_t>(done, 0, batches_);
            const auto percent = done * 100 / batches_;
            const auto cells = done * width_ / batches_;
            if (percent == drawn_percent_ && cells == drawn_cells_) {
                return;
            }
            drawn_percent_ = percent;
            drawn_cells_ = cells;

            std::ostringstream line;
            line << '\r' << label_ << " [";
            for (std::int64_t i = 0; i < cells; ++i) {
                line << "\xE2\x96\x88";
            }
            line << std::string(static_cast<std::size_t>(width_ - cells), ' ') << "] "
                 << std::setw(3) << percent << "% (" << done << '/' << batches_ << ')';
            *stream_ << line.str() << std::flush;

            if (done == batches_) {
                close();
            }
        }

        // Ends the line early, e.g. when the loop is left through an exception.
        void abandon() {
            if (drawn_percent_ >= 0) {
                close();
            }
            closed_ = true;
        }

    private:
        void close() {
            if (closed_) {
                return;
            }
            closed_ = true;
            if (stream_ != nullptr) {
                *stream_ << std::endl;
            }
        }

        std::int64_t batches_;
        std::string label_;
        std::ostream* stream_;
        std::int64_t width_;
        std::int64_t drawn_percent_{-1};
        std::int64_t drawn_cells_{-1};
        bool closed_{false};
    };
}

#endif // PLUVIO_UTILS_PROGRESSBAR_HPP
