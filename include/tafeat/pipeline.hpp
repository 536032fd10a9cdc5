#pragma once

/// @file include/tafeat/pipeline.hpp
/// @brief Feature Pipeline: ordered composition of named column transforms.
///
/// # Module: Feature Pipeline
///
/// ## Responsibility
/// Apply an ordered list of transforms to a running `FeatureTable`. Each
/// transform declares the columns it reads and the columns it appends, which
/// lets the pipeline check the whole plan before computing anything:
///   - a transform reading a column no earlier step provides → ParameterError
///   - two steps writing the same column name → ParameterError
///
/// ## Usage
/// ```cpp
/// auto pipeline = FeaturePipeline(config::default_pipeline_config());
/// FeatureTable table = pipeline.run(series);
/// const Column& ma10 = table.column("MA10");
/// ```
///
/// ## Guarantees
/// - Fail fast: configuration errors surface at construction, never mid-run
/// - No partial tables: `run` either returns a complete table or throws
/// - `run` is const and deterministic

#include "tafeat/config.hpp"
#include "tafeat/constants.hpp"
#include "tafeat/feature_table.hpp"
#include "tafeat/series.hpp"
#include "tafeat/types.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tafeat::pipeline {

// ─── Transform ────────────────────────────────────────────────────────────────

/// One pipeline step: reads named columns, appends named columns.
class Transform {
public:
    virtual ~Transform() = default;

    /// Spec kind of the step ("sma", "ema", ...).
    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

    /// Columns the step reads; each must already be in the table.
    [[nodiscard]] virtual std::vector<std::string> inputs() const = 0;

    /// Columns the step appends, in order.
    [[nodiscard]] virtual std::vector<std::string> outputs() const = 0;

    /// Compute the output columns. Row i of every output depends only on
    /// rows ≤ i of the inputs.
    [[nodiscard]] virtual std::vector<NamedColumn> apply(const FeatureTable& table) const = 0;
};

using TransformPtr = std::unique_ptr<Transform>;

// ─── Concrete Transforms ──────────────────────────────────────────────────────

/// Simple moving average → "MA{window}" (or "{source}_MA{window}").
class SmaTransform final : public Transform {
public:
    explicit SmaTransform(std::size_t window,
                          std::string source = "close",
                          std::string name   = {});
    [[nodiscard]] std::string_view kind() const noexcept override { return "sma"; }
    [[nodiscard]] std::vector<std::string> inputs() const override { return {source_}; }
    [[nodiscard]] std::vector<std::string> outputs() const override { return {name_}; }
    [[nodiscard]] std::vector<NamedColumn> apply(const FeatureTable& table) const override;

private:
    std::size_t window_;
    std::string source_;
    std::string name_;
};

/// Exponential moving average → "EMA{span}" (or "{source}_EMA{span}").
class EmaTransform final : public Transform {
public:
    explicit EmaTransform(std::size_t span,
                          std::string source = "close",
                          std::string name   = {});
    [[nodiscard]] std::string_view kind() const noexcept override { return "ema"; }
    [[nodiscard]] std::vector<std::string> inputs() const override { return {source_}; }
    [[nodiscard]] std::vector<std::string> outputs() const override { return {name_}; }
    [[nodiscard]] std::vector<NamedColumn> apply(const FeatureTable& table) const override;

private:
    std::size_t span_;
    std::string source_;
    std::string name_;
};

/// Simple and log returns → "Return", "Log Return".
class ReturnsTransform final : public Transform {
public:
    explicit ReturnsTransform(std::string source = "close");
    [[nodiscard]] std::string_view kind() const noexcept override { return "returns"; }
    [[nodiscard]] std::vector<std::string> inputs() const override { return {source_}; }
    [[nodiscard]] std::vector<std::string> outputs() const override;
    [[nodiscard]] std::vector<NamedColumn> apply(const FeatureTable& table) const override;

private:
    std::string source_;
};

/// Rolling return volatility → "Volatility{window}".
class VolatilityTransform final : public Transform {
public:
    explicit VolatilityTransform(std::size_t window,
                                 std::string source = "close",
                                 std::string name   = {});
    [[nodiscard]] std::string_view kind() const noexcept override { return "volatility"; }
    [[nodiscard]] std::vector<std::string> inputs() const override { return {source_}; }
    [[nodiscard]] std::vector<std::string> outputs() const override { return {name_}; }
    [[nodiscard]] std::vector<NamedColumn> apply(const FeatureTable& table) const override;

private:
    std::size_t window_;
    std::string source_;
    std::string name_;
};

/// Compounded return over `period` bars → "Cumulated_Return_{period}d".
class CumulatedReturnTransform final : public Transform {
public:
    explicit CumulatedReturnTransform(std::size_t period,
                                      std::string source = "close",
                                      std::string name   = {});
    [[nodiscard]] std::string_view kind() const noexcept override { return "cumulated_return"; }
    [[nodiscard]] std::vector<std::string> inputs() const override { return {source_}; }
    [[nodiscard]] std::vector<std::string> outputs() const override { return {name_}; }
    [[nodiscard]] std::vector<NamedColumn> apply(const FeatureTable& table) const override;

private:
    std::size_t period_;
    std::string source_;
    std::string name_;
};

/// Distance of `source` to an average column already in the table
/// → "Distance_{average}".
class DistanceTransform final : public Transform {
public:
    explicit DistanceTransform(std::string average,
                               std::string source = "close",
                               std::string name   = {});
    [[nodiscard]] std::string_view kind() const noexcept override { return "distance"; }
    [[nodiscard]] std::vector<std::string> inputs() const override { return {source_, average_}; }
    [[nodiscard]] std::vector<std::string> outputs() const override { return {name_}; }
    [[nodiscard]] std::vector<NamedColumn> apply(const FeatureTable& table) const override;

private:
    std::string average_;
    std::string source_;
    std::string name_;
};

/// Relative Strength Index → "RSI{period}".
class RsiTransform final : public Transform {
public:
    explicit RsiTransform(std::size_t period,
                          std::string source = "close",
                          std::string name   = {});
    [[nodiscard]] std::string_view kind() const noexcept override { return "rsi"; }
    [[nodiscard]] std::vector<std::string> inputs() const override { return {source_}; }
    [[nodiscard]] std::vector<std::string> outputs() const override { return {name_}; }
    [[nodiscard]] std::vector<NamedColumn> apply(const FeatureTable& table) const override;

private:
    std::size_t period_;
    std::string source_;
    std::string name_;
};

/// Build a transform from a spec string, e.g. `"sma window=10"`.
///
/// | kind             | options                          |
/// |------------------|----------------------------------|
/// | sma              | window, source, name             |
/// | ema              | span, source, name               |
/// | returns          | source                           |
/// | volatility       | window, source, name             |
/// | cumulated_return | period, source, name             |
/// | distance         | average (required), source, name |
/// | rsi              | period, source, name             |
///
/// # Throws
/// `ParameterError` for an unknown kind, unknown option or invalid value.
[[nodiscard]] TransformPtr make_transform(std::string_view spec);

// ─── FeaturePipeline ──────────────────────────────────────────────────────────

class FeaturePipeline {
public:
    /// Validate the plan.
    ///
    /// # Throws
    /// `ParameterError` if a step reads a column that neither the price
    /// columns nor an earlier step provides, or if an output name repeats.
    explicit FeaturePipeline(std::vector<TransformPtr> steps, bool verbose = false);

    /// Build every step from `cfg.transforms`, then validate the plan.
    explicit FeaturePipeline(const config::PipelineConfig& cfg);

    /// Apply all steps in order to a table seeded from `series`.
    [[nodiscard]] FeatureTable run(const PriceSeries& series) const;

    /// Every column the pipeline appends, in order.
    [[nodiscard]] std::vector<std::string> output_names() const;

    [[nodiscard]] std::size_t size() const noexcept { return steps_.size(); }

private:
    void validate() const;

    std::vector<TransformPtr> steps_;
    bool                      verbose_;
};

/// Validate `steps` and apply them to `series` in one call.
[[nodiscard]] FeatureTable
build_feature_table(const PriceSeries& series, std::vector<TransformPtr> steps);

}  // namespace tafeat::pipeline
