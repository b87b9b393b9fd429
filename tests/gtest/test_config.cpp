// =============================================================================
// Config, Error and Logging Tests
// =============================================================================

#include <gtest/gtest.h>
#include "tokvec/build/token_trainer.hpp"
#include "tokvec/build/vocabulary_builder.hpp"
#include "tokvec/config.hpp"
#include "tokvec/error.hpp"
#include "tokvec/logging.hpp"
#include "tokvec/model/encoder.hpp"
#include "tokvec/types.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace tokvec;

// =============================================================================
// Config
// =============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        // Restore the defaults other tests rely on
        Config& config = Config::getInstance();
        config.set("train.min_pos", "512");
        config.set("train.precision", "float32");
        config.set("train.intercept", "false");
        config.set("encode.merge_idf", "true");
        config.set("voc.size_exponent", "13");
        config.set("voc.lang", "es");
    }
};

TEST_F(ConfigTest, TypedGetters) {
    Config& config = Config::getInstance();
    config.set("test.int", "42");
    config.set("test.bool", "Yes");
    config.set("test.double", "0.5");
    config.set("test.bad", "not a number");

    EXPECT_EQ(config.get<int>("test.int"), 42);
    EXPECT_TRUE(config.get<bool>("test.bool"));
    EXPECT_DOUBLE_EQ(config.get<double>("test.double"), 0.5);
    EXPECT_EQ(config.get<int>("test.bad", 7), 7);
    EXPECT_EQ(config.get<std::string>("test.missing", "fallback"), "fallback");
    EXPECT_TRUE(config.contains("test.int"));
    EXPECT_FALSE(config.contains("test.missing"));
}

TEST_F(ConfigTest, FileValuesOverrideDefaults) {
    const auto path = std::filesystem::temp_directory_path() / "tokvec_config_test.conf";
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "voc.size_exponent = 10\n";
        out << "voc.lang=en\n";
        out << "not a pair\n";
    }

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.get<int>("voc.size_exponent"), 10);

    auto options = build::VocabularyBuildOptions::from_config();
    EXPECT_EQ(options.size_exponent, 10);
    EXPECT_EQ(options.lang, "en");
    EXPECT_EQ(options.budget(), 1024u);

    std::filesystem::remove(path);
}

TEST_F(ConfigTest, InvalidExponentFailsValidation) {
    Config& config = Config::getInstance();
    config.set("voc.size_exponent", "40");
    EXPECT_FALSE(config.load());
}

TEST_F(ConfigTest, TrainerOptionsFromConfig) {
    Config& config = Config::getInstance();
    config.set("train.min_pos", "3");
    config.set("train.precision", "float16");
    config.set("train.intercept", "true");

    auto options = build::TrainerOptions::from_config();
    EXPECT_EQ(options.min_pos, 3u);
    EXPECT_EQ(options.precision, Precision::Float16);
    EXPECT_TRUE(options.intercept);
}

TEST_F(ConfigTest, InterceptEncoderDisablesIdfMerge) {
    Config& config = Config::getInstance();
    config.set("train.intercept", "true");
    config.set("encode.merge_idf", "true");

    auto encoder_config = model::EncoderConfig::from_config();
    EXPECT_TRUE(encoder_config.assemble.intercept);
    EXPECT_FALSE(encoder_config.assemble.merge_idf);
    EXPECT_TRUE(encoder_config.classifier.class_weight_balanced);
}

// =============================================================================
// Errors and precision names
// =============================================================================

TEST(ErrorTest, MessageCarriesCodeContextAndSuggestion) {
    try {
        throw MalformedArtifactError("bad record", "load_model", "check the file");
    } catch (const TokvecException& e) {
        EXPECT_EQ(e.code(), ErrorCode::MALFORMED_ARTIFACT);
        EXPECT_EQ(e.context(), "load_model");
        const std::string what = e.what();
        EXPECT_NE(what.find("[100]"), std::string::npos);
        EXPECT_NE(what.find("bad record"), std::string::npos);
        EXPECT_NE(what.find("Suggestion: check the file"), std::string::npos);
    }
}

TEST(ErrorTest, CheckMacros) {
    EXPECT_NO_THROW(TOKVEC_CHECK_ARGUMENT(true, "fine"));
    EXPECT_THROW(TOKVEC_CHECK_ARGUMENT(false, "broken"), InvalidArgumentError);
    EXPECT_THROW(TOKVEC_CHECK(false, ErrorCode::NUMERICAL_ERROR, "nan"), TokvecException);
}

TEST(PrecisionTest, ParseAndName) {
    EXPECT_EQ(parse_precision("float16"), Precision::Float16);
    EXPECT_EQ(parse_precision("f64"), Precision::Float64);
    EXPECT_STREQ(precision_name(Precision::Float32), "float32");
    EXPECT_EQ(precision_width(Precision::Float16), 2u);
    EXPECT_THROW(parse_precision("bfloat16"), InvalidArgumentError);
}

TEST(PrecisionTest, HalfRoundingOnlyForFloat16) {
    Vector v = Vector::Constant(1, 0.1f);
    round_to_precision(v, Precision::Float32);
    EXPECT_FLOAT_EQ(v[0], 0.1f);
    round_to_precision(v, Precision::Float16);
    EXPECT_FLOAT_EQ(v[0], static_cast<float>(Eigen::half(0.1f)));
}

// =============================================================================
// Logging
// =============================================================================

TEST(LoggingTest, LevelNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
}

TEST(LoggingTest, FileSinkReceivesMessages) {
    const auto path = std::filesystem::temp_directory_path() / "tokvec_logging_test.log";
    std::filesystem::remove(path);

    ASSERT_TRUE(set_log_file(path.string()));
    set_log_level(LogLevel::DEBUG);
    LOG_WARN("vocabulary size ", 42);  // warnings flush the sinks
    set_log_level(LogLevel::INFO);

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("vocabulary size 42"), std::string::npos);
}

TEST(LoggingTest, FileSinkAddedWhileOtherThreadsLog) {
    const auto path = std::filesystem::temp_directory_path() / "tokvec_logging_concurrent.log";
    std::filesystem::remove(path);

    std::atomic<bool> stop{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&stop, t]() {
            for (int i = 0; i < 200 && !stop.load(); ++i) {
                LOG_WARN("writer ", t, " message ", i);
            }
        });
    }
    const bool added = set_log_file(path.string());
    stop = true;
    for (auto& writer : writers) {
        writer.join();
    }

    ASSERT_TRUE(added);
    LOG_WARN("after concurrent sink registration");
    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("after concurrent sink registration"), std::string::npos);
}
