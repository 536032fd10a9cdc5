#pragma once

/// @file include/tafeat/labels.hpp
/// @brief Forward-looking regime label constructors.
///
/// # Module: Label Constructors
///
/// ## Responsibility
/// Assign one categorical regime label per row for supervised-learning
/// targets. Unlike the feature transforms these look FORWARD in time on
/// purpose; their output is a `LabelColumn`, a distinct type that a
/// `FeatureTable` does not accept, so labels cannot leak into the causal
/// feature set.
///
/// ## Strategies
/// - ThresholdHorizonLabeler: classify the forward return over `horizon`
///   rows against ±threshold (binary or ternary alphabet).
/// - CrossoverLabeler: Bullish while SMA(short) > SMA(long).
///
/// ## Missing Labels
/// Rows whose forward horizon extends past the last bar, or whose averages
/// are not yet defined, carry `std::nullopt`. They are never defaulted to a
/// class and must be dropped from any training split (see
/// `pipeline::complete_rows`).
///
/// ## Guarantees
/// - Parameters are validated in the constructor (`ParameterError`)
/// - `label()` is const, deterministic and never throws on numeric gaps

#include "tafeat/constants.hpp"
#include "tafeat/series.hpp"
#include "tafeat/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace tafeat::labels {

// ─── Forward Return ───────────────────────────────────────────────────────────

/// close[i+horizon] / close[i] - 1, or ln(close[i+horizon] / close[i]) when
/// `use_log`. Missing for the last `horizon` rows and where close[i] == 0.
/// NON-CAUSAL: a target, never a feature.
[[nodiscard]] Column
forward_return(const PriceSeries& series, std::size_t horizon, bool use_log);

// ─── Labeler ──────────────────────────────────────────────────────────────────

/// Common interface of the label constructors.
class Labeler {
public:
    virtual ~Labeler() = default;

    /// Name of the produced label column.
    [[nodiscard]] virtual std::string name() const = 0;

    /// Label every row of `series`.
    [[nodiscard]] virtual LabelColumn label(const PriceSeries& series) const = 0;
};

// ─── ThresholdHorizonLabeler ──────────────────────────────────────────────────

/// Which alphabet a threshold-horizon labeler draws from.
enum class RegimePolicy {
    Binary,   ///< {Bullish, NonBullish}
    Ternary,  ///< {Bull, Bear, Range}
};

/// Parameters of the threshold-horizon labeler.
struct ThresholdHorizonParams {
    std::size_t  horizon   = constants::LABEL_HORIZON;    ///< Rows to look ahead, ≥ 1
    double       threshold = constants::LABEL_THRESHOLD;  ///< Return cut-off, > 0
    bool         use_log   = false;                       ///< Compare log returns
    RegimePolicy policy    = RegimePolicy::Binary;
};

class ThresholdHorizonLabeler final : public Labeler {
public:
    /// # Throws
    /// `ParameterError` if horizon == 0 or threshold is not a positive
    /// finite number.
    explicit ThresholdHorizonLabeler(ThresholdHorizonParams params);

    [[nodiscard]] std::string name() const override;

    /// Binary: Bullish if fwd > threshold, else NonBullish.
    /// Ternary: Bull if fwd > threshold, Bear if fwd < -threshold, else Range.
    [[nodiscard]] LabelColumn label(const PriceSeries& series) const override;

    [[nodiscard]] const ThresholdHorizonParams& params() const noexcept { return params_; }

private:
    ThresholdHorizonParams params_;
};

// ─── CrossoverLabeler ─────────────────────────────────────────────────────────

class CrossoverLabeler final : public Labeler {
public:
    /// # Throws
    /// `ParameterError` if either window is zero or short_window ≥ long_window
    /// (an inverted pair would compute fine but label the opposite regime).
    CrossoverLabeler(std::size_t short_window, std::size_t long_window);

    [[nodiscard]] std::string name() const override;

    /// Bullish if SMA(short)[i] > SMA(long)[i], else NonBullish;
    /// missing before row long_window - 1.
    [[nodiscard]] LabelColumn label(const PriceSeries& series) const override;

    [[nodiscard]] std::size_t short_window() const noexcept { return short_window_; }
    [[nodiscard]] std::size_t long_window()  const noexcept { return long_window_; }

private:
    std::size_t short_window_;
    std::size_t long_window_;
};

// ─── Factory ──────────────────────────────────────────────────────────────────

/// Build a labeler from a spec string, e.g.
///   "threshold horizon=10 threshold=0.05 policy=ternary log=false"
///   "crossover short=10 long=50"
///
/// # Throws
/// `ParameterError` for an unknown kind, unknown option or invalid value.
[[nodiscard]] std::unique_ptr<Labeler> make_labeler(std::string_view spec);

}  // namespace tafeat::labels
