/// @file tests/config/test_config.cpp
/// @brief Tests for spec-string parsing, option access and config files.

#include "tafeat/config.hpp"
#include "tafeat/errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace tafeat;
using namespace tafeat::config;

// ─── parse_spec ───────────────────────────────────────────────────────────────

TEST(ParseSpec, KindAndOptions) {
    Spec s = parse_spec("  SMA  Window=10 source=volume ");
    EXPECT_EQ(s.kind, "sma");
    ASSERT_EQ(s.options.size(), 2u);
    EXPECT_EQ(s.options[0].first, "window");
    EXPECT_EQ(s.options[0].second, "10");
    EXPECT_EQ(s.options[1].second, "volume");
}

TEST(ParseSpec, BlankIsError) {
    try {
        (void)parse_spec("   ");
        FAIL() << "expected ParameterError";
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.parameter(), "kind");
    }
}

TEST(ParseSpec, MalformedOptionsRejected) {
    EXPECT_THROW((void)parse_spec("sma window"), ParameterError);
    EXPECT_THROW((void)parse_spec("sma =10"), ParameterError);
    EXPECT_THROW((void)parse_spec("sma window="), ParameterError);
    EXPECT_THROW((void)parse_spec("sma window=1 window=2"), ParameterError);
}

// ─── OptionReader ─────────────────────────────────────────────────────────────

TEST(OptionReader, TypedGettersWithFallbacks) {
    const Spec s = parse_spec("x n=7 t=0.25 flag=yes name=abc");
    OptionReader r(s);
    EXPECT_EQ(r.get_size("n", 1), 7u);
    EXPECT_EQ(r.get_size("absent", 3), 3u);
    EXPECT_DOUBLE_EQ(r.get_double("t", 0.0), 0.25);
    EXPECT_TRUE(r.get_bool("flag", false));
    EXPECT_EQ(r.get_string("name", ""), "abc");
    EXPECT_NO_THROW(r.finish());
}

TEST(OptionReader, BadValuesNameTheKey) {
    const Spec s = parse_spec("x n=-3 t=abc b=maybe");
    OptionReader r(s);
    try {
        (void)r.get_size("n", 0);
        FAIL();
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.parameter(), "n");
    }
    EXPECT_THROW((void)r.get_double("t", 0.0), ParameterError);
    EXPECT_THROW((void)r.get_bool("b", false), ParameterError);
}

TEST(OptionReader, FinishRejectsUnusedOption) {
    const Spec s = parse_spec("x used=1 stray=2");
    OptionReader r(s);
    (void)r.get_size("used", 0);
    try {
        r.finish();
        FAIL();
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.parameter(), "stray");
    }
}

// ─── parse_config ─────────────────────────────────────────────────────────────

TEST(ParseConfig, TransformsLabelAndVerbose) {
    const PipelineConfig cfg = parse_config(
        "# features\n"
        "transform = sma window=10\n"
        "\n"
        "transform = rsi period=14\r\n"
        "label     = crossover short=10 long=50\n"
        "verbose   = true\n");
    ASSERT_EQ(cfg.transforms.size(), 2u);
    EXPECT_EQ(cfg.transforms[0], "sma window=10");
    EXPECT_EQ(cfg.transforms[1], "rsi period=14");
    ASSERT_TRUE(cfg.label.has_value());
    EXPECT_EQ(*cfg.label, "crossover short=10 long=50");
    EXPECT_TRUE(cfg.verbose);
}

TEST(ParseConfig, Errors) {
    EXPECT_THROW((void)parse_config("transform sma\n"), ParameterError);
    EXPECT_THROW((void)parse_config("window = 3\n"), ParameterError);
    EXPECT_THROW((void)parse_config("label = crossover\nlabel = threshold\n"), ParameterError);
    EXPECT_THROW((void)parse_config("verbose = sometimes\n"), ParameterError);
    EXPECT_THROW((void)parse_config("transform =\n"), ParameterError);
}

TEST(DefaultPipelineConfig, ReferenceFeatureSet) {
    const PipelineConfig cfg = default_pipeline_config();
    EXPECT_EQ(cfg.transforms.size(), 9u);
    EXPECT_EQ(cfg.transforms.front(), "sma window=10");
    EXPECT_FALSE(cfg.label.has_value());
    EXPECT_FALSE(cfg.verbose);
}

// ─── load_config ──────────────────────────────────────────────────────────────

TEST(LoadConfig, ReadsFile) {
    const std::string path = ::testing::TempDir() + "tafeat_config_test.conf";
    {
        std::ofstream out(path);
        out << "transform = ema span=5\n";
    }
    const PipelineConfig cfg = load_config(path);
    ASSERT_EQ(cfg.transforms.size(), 1u);
    EXPECT_EQ(cfg.transforms[0], "ema span=5");
    std::remove(path.c_str());
}

TEST(LoadConfig, MissingFileIsParameterError) {
    try {
        (void)load_config("/nonexistent/tafeat.conf");
        FAIL();
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.parameter(), "config");
    }
}
