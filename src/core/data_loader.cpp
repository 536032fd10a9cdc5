/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for daily OHLCV bars.

#include "tafeat/data_loader.hpp"
#include "tafeat/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>

namespace tafeat::core {

namespace {

/// Column positions resolved from the header row; -1 when absent.
struct Layout {
    int date   = -1;
    int open   = -1;
    int high   = -1;
    int low    = -1;
    int close  = -1;
    int volume = -1;

};

/// Split a CSV line on commas and trim each field.
std::vector<std::string> split_csv(std::string_view line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        std::string_view field = line.substr(start, comma == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : comma - start);
        const auto first = field.find_first_not_of(" \t\r\n\"");
        const auto last  = field.find_last_not_of(" \t\r\n\"");
        fields.emplace_back(first == std::string_view::npos
                                ? std::string_view{}
                                : field.substr(first, last - first + 1));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return fields;
}

Layout resolve_layout(const std::vector<std::string>& header) {
    Layout layout;
    for (int i = 0; i < static_cast<int>(header.size()); ++i) {
        std::string h = header[static_cast<std::size_t>(i)];
        std::transform(h.begin(), h.end(), h.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (h == "date" || h == "timestamp" || h == "datetime") layout.date = i;
        else if (h == "open")   layout.open   = i;
        else if (h == "high")   layout.high   = i;
        else if (h == "low")    layout.low    = i;
        else if (h == "close")  layout.close  = i;
        else if (h == "volume") layout.volume = i;
    }
    return layout;
}

/// Parse a finite double. Returns nullopt on empty text, trailing garbage or
/// NaN/inf.
std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    double val = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

/// Optional column: absent → `fallback`, present but malformed → nullopt.
std::optional<double> field_or(const std::vector<std::string>& fields, int col, double fallback) {
    if (col < 0) return fallback;
    return parse_double(fields[static_cast<std::size_t>(col)]);
}

std::optional<Bar> parse_row(const std::vector<std::string>& fields, const Layout& layout) {
    const int widest = std::max({layout.date, layout.open, layout.high,
                                 layout.low, layout.close, layout.volume});
    if (static_cast<int>(fields.size()) <= widest) {
        return std::nullopt;
    }

    const auto day   = DataLoader::parse_date(fields[static_cast<std::size_t>(layout.date)]);
    const auto close = parse_double(fields[static_cast<std::size_t>(layout.close)]);
    if (!day || !close) {
        return std::nullopt;
    }
    // Missing open/high/low columns default to the close; missing volume to 0.
    const auto open   = field_or(fields, layout.open,   *close);
    const auto high   = field_or(fields, layout.high,   *close);
    const auto low    = field_or(fields, layout.low,    *close);
    const auto volume = field_or(fields, layout.volume, 0.0);
    if (!open || !high || !low || !volume) {
        return std::nullopt;
    }

    Bar bar{
        .timestamp = *day,
        .open      = *open,
        .high      = *high,
        .low       = *low,
        .close     = *close,
        .volume    = *volume,
    };
    if (!DataLoader::validate_bar(bar)) {
        return std::nullopt;
    }
    return bar;
}

}  // namespace

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const Bar& bar) noexcept {
    const double fields[] = {bar.open, bar.high, bar.low, bar.close, bar.volume};
    if (!std::all_of(std::begin(fields), std::end(fields),
                     [](double v) { return std::isfinite(v); })) {
        return false;
    }
    // The range [low, high] must contain both open and close.
    const auto [body_lo, body_hi] = std::minmax(bar.open, bar.close);
    return bar.low <= body_lo && body_hi <= bar.high && bar.volume >= 0.0;
}

// ─── DataLoader::parse_date ───────────────────────────────────────────────────

std::optional<std::chrono::sys_days>
DataLoader::parse_date(std::string_view text) noexcept {
    // YYYY-MM-DD, optionally followed by a time/zone suffix.
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
        return std::nullopt;
    }

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    const char* base = text.data();
    if (std::from_chars(base, base + 4, y).ptr != base + 4 ||
        std::from_chars(base + 5, base + 7, m).ptr != base + 7 ||
        std::from_chars(base + 8, base + 10, d).ptr != base + 10) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

ParsedBars DataLoader::parse_csv_string(std::string_view csv_content) {
    ParsedBars out;
    std::istringstream stream{std::string(csv_content)};
    std::string line;
    std::optional<Layout> layout;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Skip blank lines and comment lines.
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (!layout) {
            // First non-empty, non-comment line is the header.
            layout = resolve_layout(split_csv(line));
            if (layout->date < 0) {
                out.missing_column = "date";
                return out;
            }
            if (layout->close < 0) {
                out.missing_column = "close";
                return out;
            }
            continue;
        }

        auto bar = parse_row(split_csv(line), *layout);
        if (bar) {
            out.bars.push_back(*bar);
        } else {
            ++out.skipped;
        }
    }

    return out;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<ParsedBars> DataLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

// ─── DataLoader::load_series ──────────────────────────────────────────────────

PriceSeries DataLoader::load_series(const std::string& filepath) {
    auto parsed = load_csv(filepath);
    if (!parsed) {
        throw DataUnavailableError(fmt::format("cannot open '{}'", filepath));
    }
    if (parsed->missing_column) {
        throw StructuralError(fmt::format(
            "'{}': header has no '{}' column", filepath, *parsed->missing_column));
    }
    if (parsed->bars.empty()) {
        throw DataUnavailableError(fmt::format(
            "'{}': no data returned ({} malformed rows skipped)", filepath, parsed->skipped));
    }
    return PriceSeries(std::move(parsed->bars));
}

}  // namespace tafeat::core
