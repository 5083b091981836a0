#ifndef PLUVIO_UTILS_TERMINAL_HPP
#define PLUVIO_UTILS_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Pluvio::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kRed           = "\033[31m";
        inline constexpr std::string_view kGreen         = "\033[32m";
        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightCyan    = "\033[96m";

        inline constexpr std::string_view kAzure         = "\033[38;5;33m";
        inline constexpr std::string_view kGoldenrod     = "\033[38;5;221m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kClock = "⏱";

        inline constexpr std::string_view kBoxTopLeft         = "┏";
        inline constexpr std::string_view kBoxTopSeparator    = "┳";
        inline constexpr std::string_view kBoxTopRight        = "┓";
        inline constexpr std::string_view kBoxMiddleLeft      = "┣";
        inline constexpr std::string_view kBoxMiddleSeparator = "╋";
        inline constexpr std::string_view kBoxMiddleRight     = "┫";
        inline constexpr std::string_view kBoxBottomLeft      = "┗";
        inline constexpr std::string_view kBoxBottomSeparator = "┻";
        inline constexpr std::string_view kBoxBottomRight     = "┛";
        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";
    }

    // ---------- Small helpers ----------
    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }

    // Empty color means plain output (non-tty streams, tests).
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        if (color.empty()) return std::string(s);
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Left-aligns `text` in a cell of `width` columns, truncating if needed.
    inline std::string Cell(std::string_view text, std::size_t width) {
        std::string out(text.substr(0, width));
        out.append(width - out.size(), ' ');
        return out;
    }

    // ---------- Table separators ----------
    enum class HSepKind { Top, Middle, Bottom };

    // spacings = widths of each segment between vertical junctions.
    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  HSepKind kind) {
        using namespace Symbols;

        std::string_view left;
        std::string_view junction;
        std::string_view right;
        switch (kind) {
            case HSepKind::Top:
                left = kBoxTopLeft; junction = kBoxTopSeparator; right = kBoxTopRight;
                break;
            case HSepKind::Middle:
                left = kBoxMiddleLeft; junction = kBoxMiddleSeparator; right = kBoxMiddleRight;
                break;
            case HSepKind::Bottom:
                left = kBoxBottomLeft; junction = kBoxBottomSeparator; right = kBoxBottomRight;
                break;
        }

        std::string out;
        out.reserve(16 + spacings.size() * 8);
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(junction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    inline std::string HTop(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Top);
    }
    inline std::string HMid(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Middle);
    }
    inline std::string HBottom(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Bottom);
    }

    // ┃ a ┃ b ┃ c ┃ with every cell padded to its spacing.
    inline std::string HRow(const std::vector<std::string>& cells,
                            const std::vector<std::size_t>& spacings,
                            std::string_view frame_color) {
        const auto bar = ApplyColor(Symbols::kBoxVertical, frame_color);
        std::string out = bar;
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Cell(i < cells.size() ? cells[i] : std::string{}, spacings[i]));
            out.append(bar);
        }
        return out;
    }
}

/* Instance:
using namespace Pluvio::Utils::Terminal;

std::vector<std::size_t> spans{6,4,8};
auto top = HTop(spans, Colors::kBrightCyan);   // ┏━━━━━━┳━━━━┳━━━━━━━━┓
auto mid = HMid(spans, Colors::kBrightCyan);   // ┣━━━━━━╋━━━━╋━━━━━━━━┫
auto bot = HBottom(spans, Colors::kBrightCyan);// ┗━━━━━━┻━━━━┻━━━━━━━━┛
*/
#endif // PLUVIO_UTILS_TERMINAL_HPP
