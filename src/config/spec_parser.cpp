/// @file src/config/spec_parser.cpp
/// @brief Spec-string tokenizer and typed option access.

#include "tafeat/config.hpp"
#include "tafeat/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace tafeat::config {

namespace {

/// Lower-case ASCII copy of `s`.
std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

// ─── parse_spec ───────────────────────────────────────────────────────────────

Spec parse_spec(std::string_view text) {
    std::istringstream ss{std::string(text)};
    std::string token;

    Spec spec;
    if (!(ss >> token)) {
        throw ParameterError("kind", "empty transform/label spec");
    }
    spec.kind = lower(token);

    while (ss >> token) {
        const auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == token.size()) {
            throw ParameterError(token, fmt::format(
                "'{}': option '{}' must have the form key=value", spec.kind, token));
        }
        std::string key = lower(std::string_view(token).substr(0, eq));
        std::string value = token.substr(eq + 1);

        const bool repeated = std::any_of(spec.options.begin(), spec.options.end(),
            [&](const auto& kv) { return kv.first == key; });
        if (repeated) {
            throw ParameterError(key, fmt::format(
                "'{}': option '{}' given more than once", spec.kind, key));
        }
        spec.options.emplace_back(std::move(key), std::move(value));
    }
    return spec;
}

// ─── OptionReader ─────────────────────────────────────────────────────────────

OptionReader::OptionReader(const Spec& spec)
    : spec_(spec), used_(spec.options.size(), false)
{}

const std::string* OptionReader::find(std::string_view key) {
    for (std::size_t i = 0; i < spec_.options.size(); ++i) {
        if (spec_.options[i].first == key) {
            used_[i] = true;
            return &spec_.options[i].second;
        }
    }
    return nullptr;
}

std::size_t OptionReader::get_size(std::string_view key, std::size_t fallback) {
    const std::string* raw = find(key);
    if (!raw) {
        return fallback;
    }
    std::size_t value = 0;
    const char* first = raw->data();
    const char* last  = raw->data() + raw->size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw ParameterError(std::string(key), fmt::format(
            "'{}': {} must be a non-negative integer (got '{}')", spec_.kind, key, *raw));
    }
    return value;
}

double OptionReader::get_double(std::string_view key, double fallback) {
    const std::string* raw = find(key);
    if (!raw) {
        return fallback;
    }
    double value = 0.0;
    std::size_t pos = 0;
    try {
        value = std::stod(*raw, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != raw->size() || !std::isfinite(value)) {
        throw ParameterError(std::string(key), fmt::format(
            "'{}': {} must be a finite number (got '{}')", spec_.kind, key, *raw));
    }
    return value;
}

bool OptionReader::get_bool(std::string_view key, bool fallback) {
    const std::string* raw = find(key);
    if (!raw) {
        return fallback;
    }
    const std::string v = lower(*raw);
    if (v == "true" || v == "1" || v == "yes")  return true;
    if (v == "false" || v == "0" || v == "no")  return false;
    throw ParameterError(std::string(key), fmt::format(
        "'{}': {} must be true or false (got '{}')", spec_.kind, key, *raw));
}

std::string OptionReader::get_string(std::string_view key, std::string fallback) {
    const std::string* raw = find(key);
    return raw ? *raw : std::move(fallback);
}

void OptionReader::finish() const {
    for (std::size_t i = 0; i < spec_.options.size(); ++i) {
        if (!used_[i]) {
            const std::string& key = spec_.options[i].first;
            throw ParameterError(key, fmt::format(
                "'{}': unrecognized option '{}'", spec_.kind, key));
        }
    }
}

}  // namespace tafeat::config
