// test_config.cpp - INI parsing and the typed FrisConfig view

#include <gtest/gtest.h>

#include "fris/config/ConfigLoader.hpp"

#include <sstream>

using namespace fris;

namespace {

ConfigLoader fromText(const std::string& text) {
    ConfigLoader cfg;
    std::istringstream in(text);
    if (!cfg.loadFromStream(in)) ADD_FAILURE() << "no values parsed";
    return cfg;
}

} // namespace

TEST(ConfigLoaderTest, ParsesSectionsCommentsAndWhitespace) {
    const ConfigLoader cfg = fromText(
        "# comment\n"
        "[artifacts]\n"
        "  root =  /var/fris  \n"
        "; another comment\n"
        "version=2024.01\n"
        "[pipeline]\n"
        "seed = 7\n");

    EXPECT_EQ(cfg.get("artifacts", "root"), "/var/fris");
    EXPECT_EQ(cfg.get("artifacts", "version"), "2024.01");
    EXPECT_EQ(cfg.getInt("pipeline", "seed", 0), 7);
    EXPECT_TRUE(cfg.has("pipeline", "seed"));
    EXPECT_FALSE(cfg.has("pipeline", "rolling_window"));
    EXPECT_EQ(cfg.getInt("pipeline", "rolling_window", 5), 5);
}

TEST(ConfigLoaderTest, BadNumberIsConfigError) {
    const ConfigLoader cfg = fromText("[pipeline]\nseed = forty-two\nratio = 1.5x\n");
    EXPECT_THROW(cfg.getInt("pipeline", "seed", 0), ConfigError);
    EXPECT_THROW(cfg.getDouble("pipeline", "ratio", 0.0), ConfigError);
}

TEST(ConfigLoaderTest, BooleanSpellings) {
    const ConfigLoader cfg = fromText("[runtime]\na = true\nb = on\nc = 0\n");
    EXPECT_TRUE(cfg.getBool("runtime", "a"));
    EXPECT_TRUE(cfg.getBool("runtime", "b"));
    EXPECT_FALSE(cfg.getBool("runtime", "c", true));
    EXPECT_TRUE(cfg.getBool("runtime", "absent", true));
}

TEST(FrisConfigTest, DefaultsApplyWhenKeysAbsent) {
    const FrisConfig c = FrisConfig::fromLoader(fromText("[artifacts]\nversion = v9\n"));
    EXPECT_EQ(c.artifact_root, "artifacts");
    EXPECT_EQ(c.model_version, "v9");
    EXPECT_EQ(c.seed, 42u);
    EXPECT_EQ(c.rolling_window, 5);
    EXPECT_EQ(c.label_column, "Class");
    EXPECT_EQ(c.id_column, "transaction_id");
    EXPECT_EQ(c.top_k, 5);
    EXPECT_FALSE(c.quiet);
}

TEST(FrisConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(FrisConfig::fromLoader(fromText("[pipeline]\nseed = -1\n")), ConfigError);
    EXPECT_THROW(FrisConfig::fromLoader(fromText("[pipeline]\nrolling_window = 0\n")), ConfigError);
    EXPECT_THROW(FrisConfig::fromLoader(fromText("[explain]\ntop_k = 0\n")), ConfigError);
}

TEST(FrisConfigTest, MissingFileIsConfigError) {
    EXPECT_THROW(FrisConfig::load("definitely/not/here/fris.ini"), ConfigError);
}
