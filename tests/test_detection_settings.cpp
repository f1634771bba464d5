#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include "formreg/DetectionSettings.hpp"

using namespace formreg;

namespace {

std::string writeConfig(const std::string& name, const std::string& body) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream(path) << body;
    return path;
}

}

TEST(DetectionSettings, DefaultsMatchEditorDefaults) {
    DetectionSettings s;
    EXPECT_EQ(s.minSize, 15);
    EXPECT_EQ(s.threshold, 160);
    EXPECT_EQ(s.padding, 0);
}

TEST(DetectionSettings, ReadsJson) {
    auto path = writeConfig("formreg_full.json",
        "{ \"detection\": { \"min_size\": 22, \"threshold\": 140, \"padding\": -4 } }");
    DetectionSettings s = loadDetectionSettings(path);
    EXPECT_EQ(s.minSize, 22);
    EXPECT_EQ(s.threshold, 140);
    EXPECT_EQ(s.padding, -4);
}

TEST(DetectionSettings, ReadsYaml) {
    auto path = writeConfig("formreg_part.yml",
        "%YAML:1.0\n---\ndetection:\n   threshold: 200\n");
    DetectionSettings s = loadDetectionSettings(path);
    EXPECT_EQ(s.threshold, 200);
    EXPECT_EQ(s.minSize, 15);
}

TEST(DetectionSettings, OutOfRangeValuesKeepDefaults) {
    auto path = writeConfig("formreg_range.json",
        "{ \"detection\": { \"min_size\": 0, \"threshold\": 300, \"padding\": 6 } }");
    DetectionSettings s = loadDetectionSettings(path);
    EXPECT_EQ(s.minSize, 15);
    EXPECT_EQ(s.threshold, 160);
    EXPECT_EQ(s.padding, 6);
}

TEST(DetectionSettings, OversizedValuesKeepDefaults) {
    auto path = writeConfig("formreg_huge.json",
        "{ \"detection\": { \"min_size\": 50000, \"padding\": 2000000000 } }");
    DetectionSettings s = loadDetectionSettings(path);
    EXPECT_EQ(s.minSize, 15);
    EXPECT_EQ(s.padding, 0);

    auto negative = writeConfig("formreg_neg_pad.json",
        "{ \"detection\": { \"min_size\": 46340, \"padding\": -2000000000 } }");
    s = loadDetectionSettings(negative);
    EXPECT_EQ(s.minSize, kMaxMinSize);
    EXPECT_EQ(s.padding, 0);
}

TEST(DetectionSettings, MissingFileGivesDefaults) {
    DetectionSettings s = loadDetectionSettings(::testing::TempDir() + "formreg_missing.json");
    EXPECT_EQ(s.minSize, 15);
    EXPECT_EQ(s.threshold, 160);
}

TEST(DetectionSettings, TemplateCorners) {
    auto path = writeConfig("formreg_tmpl.json",
        "{ \"template\": { \"corners\": [ 27.5, 27.5, 822.0, 27.5, 822.0, 1072.0, 27.5, 1072.0 ] } }");
    CornerSet c;
    ASSERT_TRUE(loadTemplateCorners(path, c));
    EXPECT_FLOAT_EQ(c[TR].x, 822.0f);
    EXPECT_FLOAT_EQ(c[BL].y, 1072.0f);

    auto shortList = writeConfig("formreg_tmpl_short.json",
        "{ \"template\": { \"corners\": [ 1, 2, 3 ] } }");
    EXPECT_FALSE(loadTemplateCorners(shortList, c));
}
