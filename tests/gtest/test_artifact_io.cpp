// =============================================================================
// Artifact I/O Tests
// =============================================================================

#include <gtest/gtest.h>
#include "tokvec/error.hpp"
#include "tokvec/io/artifact_io.hpp"
#include "tokvec/io/json_lines.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>

using namespace tokvec;
using namespace tokvec::io;

namespace fs = std::filesystem;

class ArtifactIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("tokvec_io_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);

        text::TextModelParams params;
        params.token_list = {-1, 3};
        vocabulary_ = test_support::make_vocabulary({{"de", 8}, {"q:~la", 4}, {"sol", 2}}, 9, {}, params);

        TrainedTokenArtifact de;
        de.label = "de";
        de.N = 12;
        de.coef = Vector(3);
        de.coef << 0.5f, -1.25f, 2.0f;
        de.intercept = 0.25f;
        artifacts_.push_back(de);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string path(const std::string& name) const {
        return (dir_ / name).string();
    }

    void write_file(const std::string& name, const std::vector<std::string>& lines) const {
        std::ofstream out(path(name));
        for (const auto& line : lines) out << line << "\n";
    }

    std::string vocabulary_line() const {
        return boost::json::serialize(vocabulary_to_json(*vocabulary_));
    }

    fs::path dir_;
    std::shared_ptr<text::Vocabulary> vocabulary_;
    std::vector<TrainedTokenArtifact> artifacts_;
};

// =============================================================================
// Coefficient codec
// =============================================================================

TEST_F(ArtifactIOTest, CoefficientsAreLittleEndianHex) {
    Vector one = Vector::Constant(1, 1.0f);
    EXPECT_EQ(encode_coef(one, Precision::Float16), "003c");
    EXPECT_EQ(encode_coef(one, Precision::Float32), "0000803f");
    EXPECT_EQ(encode_coef(one, Precision::Float64), "000000000000f03f");

    Vector decoded = decode_coef("0000803f000000c0", Precision::Float32, 2);
    EXPECT_FLOAT_EQ(decoded[0], 1.0f);
    EXPECT_FLOAT_EQ(decoded[1], -2.0f);
}

TEST_F(ArtifactIOTest, DecodeRejectsBadBuffers) {
    EXPECT_THROW(decode_coef("0000803f", Precision::Float32, 2), MalformedArtifactError);
    EXPECT_THROW(decode_coef("0000803f", Precision::Float16, 1), MalformedArtifactError);
    EXPECT_THROW(decode_coef("zz00803f", Precision::Float32, 1), MalformedArtifactError);
}

// =============================================================================
// Vocabulary records
// =============================================================================

TEST_F(ArtifactIOTest, VocabularyRecordKeepsOrderAndParams) {
    save_vocabulary(*vocabulary_, path("voc.json.gz"));
    auto loaded = load_vocabulary(path("voc.json.gz"));

    EXPECT_EQ(loaded->names(), vocabulary_->names());
    EXPECT_EQ(loaded->counter().items(), vocabulary_->counter().items());
    EXPECT_EQ(loaded->counter().update_calls(), 9u);
    EXPECT_EQ(loaded->params().token_list, (std::vector<int>{-1, 3}));
    EXPECT_EQ(loaded->params().lang, "es");
}

TEST_F(ArtifactIOTest, VocabularyRecordRequiresCounter) {
    auto record = boost::json::parse(R"({"params": {"lang": "es"}})");
    EXPECT_THROW(vocabulary_from_json(record), MalformedArtifactError);

    auto no_calls = boost::json::parse(R"({"params": {}, "counter": {"dict": {"a": 1}}})");
    EXPECT_THROW(vocabulary_from_json(no_calls), MalformedArtifactError);

    auto not_object = boost::json::parse("[1, 2]");
    EXPECT_THROW(vocabulary_from_json(not_object), MalformedArtifactError);
}

TEST_F(ArtifactIOTest, FractionalFrequencyIsMalformed) {
    auto fractional = boost::json::parse(
        R"({"params": {}, "counter": {"dict": {"a": 1.5}, "update_calls": 2}})");
    EXPECT_THROW(vocabulary_from_json(fractional), MalformedArtifactError);

    auto text_value = boost::json::parse(
        R"({"params": {}, "counter": {"dict": {"a": "3"}, "update_calls": 2}})");
    EXPECT_THROW(vocabulary_from_json(text_value), MalformedArtifactError);

    auto whole = boost::json::parse(
        R"({"params": {}, "counter": {"dict": {"a": 3.0}, "update_calls": 4}})");
    EXPECT_EQ(vocabulary_from_json(whole)->counter().get("a"), 3);
}

TEST_F(ArtifactIOTest, VocabularyLargerThanBudgetIsMalformed) {
    auto record = boost::json::parse(
        R"({"params": {}, "counter": {"dict": {"a": 3, "b": 2, "c": 1}, "update_calls": 3}})");
    EXPECT_THROW(vocabulary_from_json(record, 1), MalformedArtifactError);
    EXPECT_EQ(vocabulary_from_json(record, 2)->size(), 3u);
    EXPECT_EQ(vocabulary_from_json(record)->size_exponent(), 2);
}

TEST_F(ArtifactIOTest, SymbolsLoadFromObject) {
    write_file("symbols.json", {R"({"❤": "_heart", ":)": "_smile"})"});
    auto symbols = load_symbols(path("symbols.json"));
    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[0].first, "❤");
    EXPECT_EQ(symbols[0].second, "_heart");

    write_file("bad_symbols.json", {R"({"x": 3})"});
    EXPECT_THROW(load_symbols(path("bad_symbols.json")), MalformedArtifactError);
}

// =============================================================================
// Model files
// =============================================================================

TEST_F(ArtifactIOTest, ModelRoundTrip) {
    save_model(path("model.json.gz"), *vocabulary_, artifacts_, Precision::Float32);
    ModelArtifact model = load_model(path("model.json.gz"), Precision::Float32);

    EXPECT_EQ(model.vocabulary->names(), vocabulary_->names());
    ASSERT_EQ(model.artifacts.size(), 1u);
    const auto& de = model.artifacts[0];
    EXPECT_EQ(de.label, "de");
    EXPECT_EQ(de.N, 12u);
    EXPECT_FLOAT_EQ(de.intercept, 0.25f);
    EXPECT_EQ(de.coef, artifacts_[0].coef);
}

TEST_F(ArtifactIOTest, PlainModelFilesAreReadable) {
    write_file("model.json", {vocabulary_line(), "",
                              R"({"N": 3, "coef": "0000803f0000803f0000803f", "intercept": 0, "label": "sol"})"});
    ModelArtifact model = load_model(path("model.json"), Precision::Float32);
    ASSERT_EQ(model.artifacts.size(), 1u);
    EXPECT_EQ(model.artifacts[0].label, "sol");
    EXPECT_TRUE(model.artifacts[0].coef.isOnes());
}

TEST_F(ArtifactIOTest, MalformedTokenRecordsThrow) {
    write_file("missing_coef.json", {vocabulary_line(),
                                     R"({"N": 3, "intercept": 0, "label": "sol"})"});
    EXPECT_THROW(load_model(path("missing_coef.json"), Precision::Float32), MalformedArtifactError);

    write_file("short_coef.json", {vocabulary_line(),
                                   R"({"N": 3, "coef": "0000803f", "intercept": 0, "label": "sol"})"});
    EXPECT_THROW(load_model(path("short_coef.json"), Precision::Float32), MalformedArtifactError);

    write_file("unknown_label.json", {vocabulary_line(),
                                      R"({"N": 3, "coef": "0000803f0000803f0000803f", "intercept": 0, "label": "luna"})"});
    EXPECT_THROW(load_model(path("unknown_label.json"), Precision::Float32), MalformedArtifactError);

    write_file("bad_json.json", {vocabulary_line(), "{not json"});
    EXPECT_THROW(load_model(path("bad_json.json"), Precision::Float32), MalformedArtifactError);

    write_file("empty.json", {});
    EXPECT_THROW(load_model(path("empty.json"), Precision::Float32), MalformedArtifactError);
}

TEST_F(ArtifactIOTest, WrongDeclaredPrecisionIsDetected) {
    save_model(path("model32.json"), *vocabulary_, artifacts_, Precision::Float32);
    EXPECT_THROW(load_model(path("model32.json"), Precision::Float16), MalformedArtifactError);
}

TEST_F(ArtifactIOTest, ConvertPrecisionRewritesCoefficients) {
    artifacts_[0].coef[0] = 0.1f;
    save_model(path("model32.json.gz"), *vocabulary_, artifacts_, Precision::Float32);

    EXPECT_EQ(convert_precision(path("model32.json.gz"), path("model16.json.gz"),
                                Precision::Float32, Precision::Float16), 1u);

    ModelArtifact half = load_model(path("model16.json.gz"), Precision::Float16);
    ASSERT_EQ(half.artifacts.size(), 1u);
    EXPECT_FLOAT_EQ(half.artifacts[0].coef[0], static_cast<float>(Eigen::half(0.1f)));
    EXPECT_FLOAT_EQ(half.artifacts[0].coef[1], -1.25f);
    EXPECT_EQ(half.vocabulary->names(), vocabulary_->names());
}

TEST_F(ArtifactIOTest, MissingFileIsIOError) {
    EXPECT_THROW(load_model(path("nope.json.gz"), Precision::Float32), IOError);
}

// =============================================================================
// JSON lines
// =============================================================================

TEST_F(ArtifactIOTest, ReadTextsAcceptsObjectsAndStrings) {
    write_file("corpus.json", {R"({"text": "hola mundo", "klass": 1})",
                               R"("buenos dias")",
                               R"({"text": "adios", "klass": 0})"});

    EXPECT_EQ(read_texts(path("corpus.json")),
              (std::vector<std::string>{"hola mundo", "buenos dias", "adios"}));
    EXPECT_EQ(read_texts(path("corpus.json"), 2).size(), 2u);
    EXPECT_TRUE(is_gzip_path("x.json.gz"));
    EXPECT_FALSE(is_gzip_path("x.json"));
}

TEST_F(ArtifactIOTest, ReadLabelsRejectsFractionalLabels) {
    write_file("labels.json", {R"({"text": "a", "klass": 1})", R"({"text": "b", "klass": 0})"});
    EXPECT_EQ(read_labels(path("labels.json")), (std::vector<int>{1, 0}));

    write_file("fractional.json", {R"({"text": "a", "klass": 1.5})"});
    EXPECT_THROW(read_labels(path("fractional.json")), MalformedArtifactError);
}

TEST_F(ArtifactIOTest, GzipLinesRoundTrip) {
    {
        LineWriter writer(path("lines.gz"));
        writer.write("first");
        writer.write(boost::json::value("second"));
    }
    LineReader reader(path("lines.gz"));
    std::string line;
    ASSERT_TRUE(reader.next(line));
    EXPECT_EQ(line, "first");
    ASSERT_TRUE(reader.next(line));
    EXPECT_EQ(line, "\"second\"");
    EXPECT_FALSE(reader.next(line));
}
