/// @file src/pipeline/feature_pipeline.cpp
/// @brief FeaturePipeline: plan validation and ordered application.

#include "tafeat/pipeline.hpp"
#include "tafeat/cell_ops.hpp"
#include "tafeat/errors.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <set>

namespace tafeat::pipeline {

namespace {

std::vector<TransformPtr> build_steps(const config::PipelineConfig& cfg) {
    std::vector<TransformPtr> steps;
    steps.reserve(cfg.transforms.size());
    for (const std::string& spec : cfg.transforms) {
        steps.push_back(make_transform(spec));
    }
    return steps;
}

}  // namespace

// ─── FeaturePipeline constructors ─────────────────────────────────────────────

FeaturePipeline::FeaturePipeline(std::vector<TransformPtr> steps, bool verbose)
    : steps_(std::move(steps)), verbose_(verbose)
{
    validate();
}

FeaturePipeline::FeaturePipeline(const config::PipelineConfig& cfg)
    : FeaturePipeline(build_steps(cfg), cfg.verbose)
{}

// ─── FeaturePipeline::validate ────────────────────────────────────────────────

void FeaturePipeline::validate() const {
    std::set<std::string, std::less<>> available;
    for (std::string_view name : PriceSeries::price_column_names()) {
        available.emplace(name);
    }

    for (std::size_t i = 0; i < steps_.size(); ++i) {
        if (!steps_[i]) {
            throw ParameterError("transform", fmt::format("step {} is null", i));
        }
        const Transform& step = *steps_[i];

        for (const std::string& in : step.inputs()) {
            if (available.find(in) == available.end()) {
                throw ParameterError(in, fmt::format(
                    "step {} ({}) reads column '{}', which no earlier step produces",
                    i, step.kind(), in));
            }
        }
        for (const std::string& out : step.outputs()) {
            if (!available.insert(out).second) {
                throw ParameterError(out, fmt::format(
                    "step {} ({}) writes column '{}', which already exists",
                    i, step.kind(), out));
            }
        }
    }
}

// ─── FeaturePipeline::run ─────────────────────────────────────────────────────

FeatureTable FeaturePipeline::run(const PriceSeries& series) const {
    FeatureTable table(series);

    for (const TransformPtr& step : steps_) {
        for (NamedColumn& col : step->apply(table)) {
            if (verbose_) {
                fmt::print(stderr, "[tafeat] {:<16} -> {:<22} missing={}/{}\n",
                           step->kind(), col.name,
                           cells::missing_count(col.values), col.values.size());
            }
            table.add_column(std::move(col));
        }
    }
    return table;
}

// ─── FeaturePipeline::output_names ────────────────────────────────────────────

std::vector<std::string> FeaturePipeline::output_names() const {
    std::vector<std::string> names;
    for (const TransformPtr& step : steps_) {
        for (std::string& out : step->outputs()) {
            names.push_back(std::move(out));
        }
    }
    return names;
}

// ─── build_feature_table ──────────────────────────────────────────────────────

FeatureTable build_feature_table(const PriceSeries& series, std::vector<TransformPtr> steps) {
    const FeaturePipeline pipeline(std::move(steps));
    return pipeline.run(series);
}

}  // namespace tafeat::pipeline
