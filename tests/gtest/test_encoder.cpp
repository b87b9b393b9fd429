// =============================================================================
// Encoder Tests
// =============================================================================

#include <gtest/gtest.h>
#include "tokvec/error.hpp"
#include "tokvec/io/artifact_io.hpp"
#include "tokvec/model/encoder.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <filesystem>
#include <set>

using namespace tokvec;
using namespace tokvec::model;

namespace {

// Scores +1 for rows whose argmax column it was fit on, -1 otherwise
class MemorizingClassifier : public LinearClassifier {
public:
    void fit(const SparseMatrix& X, const std::vector<int>& y) override {
        fit(Matrix(X), y);
    }

    void fit(const Matrix& X, const std::vector<int>& y) override {
        seen_.clear();
        for (Eigen::Index i = 0; i < X.rows(); ++i) {
            Eigen::Index col;
            X.row(i).maxCoeff(&col);
            seen_.insert(col);
        }
        std::set<int> labels(y.begin(), y.end());
        classes_.assign(labels.begin(), labels.end());
    }

    Matrix decision_function(const Matrix& X) const override {
        Matrix scores(X.rows(), 1);
        for (Eigen::Index i = 0; i < X.rows(); ++i) {
            Eigen::Index col;
            X.row(i).maxCoeff(&col);
            scores(i, 0) = seen_.count(col) ? 1.0f : -1.0f;
        }
        return scores;
    }

    const Matrix& coef() const override { return coef_; }
    const Vector& intercept() const override { return intercept_; }
    const std::vector<int>& classes() const override { return classes_; }

    std::unique_ptr<LinearClassifier> clone() const override {
        return std::make_unique<MemorizingClassifier>();
    }

private:
    std::set<Eigen::Index> seen_;
    Matrix coef_;
    Vector intercept_;
    std::vector<int> classes_;
};

} // namespace

class EncoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        vocabulary_ = test_support::make_vocabulary({{"hola", 1}, {"mundo", 1}, {"adios", 1}});
    }

    // Rows for hola and mundo, identity on their own columns
    EmbeddingModel two_rows() const {
        Matrix W = Matrix::Zero(2, 3);
        W(0, 0) = 1.0f;
        W(1, 1) = 1.0f;
        Vector bias(2);
        bias << 0.5f, -0.5f;
        return EmbeddingModel(vocabulary_, W, bias, {"hola", "mundo"});
    }

    EmbeddingModel identity() const {
        return EmbeddingModel(vocabulary_, Matrix::Identity(3, 3), Vector::Zero(3),
                              {"hola", "mundo", "adios"});
    }

    static void repeat(const std::string& text, int label, int n,
                       std::vector<std::string>& texts, std::vector<int>& labels) {
        for (int i = 0; i < n; ++i) {
            texts.push_back(text);
            labels.push_back(label);
        }
    }

    std::shared_ptr<text::Vocabulary> vocabulary_;
};

TEST_F(EncoderTest, EncodeSelectsColumnsWithRepeats) {
    Encoder encoder(two_rows());
    Matrix columns = encoder.encode("hola mundo hola");

    ASSERT_EQ(columns.rows(), 2);
    ASSERT_EQ(columns.cols(), 3);
    EXPECT_FLOAT_EQ(columns(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(columns(1, 1), 1.0f);
    EXPECT_FLOAT_EQ(columns(0, 2), 1.0f);
    EXPECT_FLOAT_EQ(columns(1, 2), 0.0f);
}

TEST_F(EncoderTest, UnknownTextEncodesToOnes) {
    Encoder encoder(two_rows());
    Matrix columns = encoder.encode("zzz qqq");
    ASSERT_EQ(columns.cols(), 1);
    EXPECT_TRUE(columns.isOnes());
}

TEST_F(EncoderTest, TransformRowsAreUnitOrZero) {
    Encoder encoder(two_rows());
    Matrix X = encoder.transform({"hola", "adios", "", "hola mundo"});

    ASSERT_EQ(X.rows(), 4);
    ASSERT_EQ(X.cols(), 2);
    EXPECT_FLOAT_EQ(X(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(X(0, 1), 0.0f);
    EXPECT_TRUE(X.row(1).isZero(0.0f));  // known token with a zero column
    EXPECT_NEAR(X(2, 0), 1.0f / std::sqrt(2.0f), 1e-6f);
    EXPECT_NEAR(X(3, 1), 1.0f / std::sqrt(2.0f), 1e-6f);
    for (Eigen::Index r : {0, 2, 3}) {
        EXPECT_NEAR(X.row(r).norm(), 1.0f, 1e-6f);
    }
}

TEST_F(EncoderTest, InterceptModeAddsBias) {
    EncoderConfig config;
    config.assemble.merge_idf = false;
    config.assemble.intercept = true;
    Encoder encoder(two_rows(), config);

    Matrix X = encoder.transform({"hola hola", "zzz"});
    const float n0 = std::sqrt(1.5f * 1.5f + 0.5f * 0.5f);
    EXPECT_NEAR(X(0, 0), 1.5f / n0, 1e-6f);
    EXPECT_NEAR(X(0, 1), -0.5f / n0, 1e-6f);
    EXPECT_NEAR(X(1, 0), 1.0f / std::sqrt(2.0f), 1e-6f);
    EXPECT_NEAR(X(1, 1), -1.0f / std::sqrt(2.0f), 1e-6f);
}

TEST_F(EncoderTest, FitAndPredictBinary) {
    std::vector<std::string> texts;
    std::vector<int> labels;
    repeat("hola", 0, 10, texts, labels);
    repeat("mundo", 1, 10, texts, labels);

    Encoder encoder(two_rows());
    encoder.fit(texts, labels);
    EXPECT_EQ(encoder.predict(texts), labels);
    EXPECT_EQ(encoder.decision_function(texts).cols(), 1);
    EXPECT_THROW(encoder.fit(texts, {0, 1}), InvalidArgumentError);
}

TEST_F(EncoderTest, OutOfFoldScoresMulticlass) {
    std::vector<std::string> texts;
    std::vector<int> labels;
    repeat("hola", 0, 10, texts, labels);
    repeat("mundo", 1, 10, texts, labels);
    repeat("adios", 2, 10, texts, labels);

    Encoder encoder(identity());
    Matrix hy = encoder.train_predict_decision_function(texts, labels);
    ASSERT_EQ(hy.rows(), 30);
    ASSERT_EQ(hy.cols(), 3);
    for (Eigen::Index i = 0; i < hy.rows(); ++i) {
        Eigen::Index best;
        hy.row(i).maxCoeff(&best);
        EXPECT_EQ(best, labels[static_cast<size_t>(i)]);
    }
}

TEST_F(EncoderTest, EveryRowScoredByModelThatNeverSawIt) {
    std::vector<std::pair<std::string, int64_t>> tokens;
    std::vector<std::string> names;
    std::vector<std::string> texts;
    std::vector<int> labels;
    for (int i = 0; i < 20; ++i) {
        names.push_back("t" + std::to_string(i));
        tokens.emplace_back(names.back(), 1);
        texts.push_back(names.back());
        labels.push_back(i % 2);
    }
    auto vocabulary = test_support::make_vocabulary(tokens);
    EmbeddingModel model(vocabulary, Matrix::Identity(20, 20), Vector::Zero(20), names);
    Encoder encoder(std::move(model), EncoderConfig{}, std::make_unique<MemorizingClassifier>());

    Matrix hy = encoder.train_predict_decision_function(texts, labels);
    ASSERT_EQ(hy.cols(), 1);
    for (Eigen::Index i = 0; i < hy.rows(); ++i) {
        EXPECT_FLOAT_EQ(hy(i, 0), -1.0f) << "row " << i;
    }
}

TEST_F(EncoderTest, FoldMissingAClassIsRejected) {
    std::vector<std::string> texts;
    std::vector<int> labels;
    repeat("hola", 0, 19, texts, labels);
    repeat("mundo", 1, 1, texts, labels);

    Encoder encoder(two_rows());
    EXPECT_THROW(encoder.train_predict_decision_function(texts, labels), InvalidArgumentError);
}

TEST_F(EncoderTest, CloneIsIndependent) {
    std::vector<std::string> texts;
    std::vector<int> labels;
    repeat("hola", 0, 5, texts, labels);
    repeat("mundo", 1, 5, texts, labels);

    Encoder encoder(two_rows());
    encoder.fit(texts, labels);

    Encoder copy = encoder.clone();
    EXPECT_EQ(copy.classifier().coef().size(), 0);
    EXPECT_EQ(copy.tokenizer().tokenize("hola mundo"), encoder.tokenizer().tokenize("hola mundo"));

    copy.model().fill(true);
    EXPECT_EQ(copy.model().rows(), 3);
    EXPECT_EQ(encoder.model().rows(), 2);
    EXPECT_EQ(encoder.predict(texts), labels);
}

TEST_F(EncoderTest, LoadAssemblesSavedModel) {
    const auto path = std::filesystem::temp_directory_path() / "tokvec_encoder_model.json.gz";

    TrainedTokenArtifact hola;
    hola.label = "hola";
    hola.N = 4;
    hola.coef = Vector::Zero(3);
    hola.coef[0] = 2.0f;
    hola.coef[2] = -1.0f;
    io::save_model(path.string(), *vocabulary_, {hola}, Precision::Float32);

    EncoderConfig config;
    config.assemble.merge_idf = false;
    Encoder encoder = Encoder::load(path.string(), config);

    ASSERT_EQ(encoder.model().rows(), 1);
    EXPECT_EQ(encoder.model().names(), std::vector<std::string>{"hola"});
    EXPECT_FLOAT_EQ(encoder.model().weights()(0, 0), 2.0f);  // already the row max
    EXPECT_FLOAT_EQ(encoder.model().weights()(0, 2), -1.0f);
    EXPECT_EQ(encoder.model().vocabulary().names(), vocabulary_->names());

    std::filesystem::remove(path);
}

TEST_F(EncoderTest, LoadRegistersSymbolSurfaceForms) {
    const auto path = std::filesystem::temp_directory_path() / "tokvec_encoder_symbols.json.gz";
    const text::SymbolTable symbols = {{"❤", "_heart"}};
    auto vocabulary = test_support::make_vocabulary({{"hola", 2}, {"_heart", 1}}, 2, symbols);

    TrainedTokenArtifact hola;
    hola.label = "hola";
    hola.N = 2;
    hola.coef = Vector::Zero(2);
    hola.coef << 2.0f, -1.0f;
    TrainedTokenArtifact heart;
    heart.label = "_heart";
    heart.N = 2;
    heart.coef = Vector::Zero(2);
    heart.coef << -1.0f, 3.0f;
    io::save_model(path.string(), *vocabulary, {hola, heart}, Precision::Float32);

    EncoderConfig config;
    config.assemble.merge_idf = false;

    Encoder with_symbols = Encoder::load(path.string(), config, symbols);
    const Matrix columns = with_symbols.encode("hola ❤");
    ASSERT_EQ(columns.cols(), 2);
    EXPECT_FLOAT_EQ(columns(0, 1), -1.0f);
    EXPECT_FLOAT_EQ(columns(1, 1), 3.0f);

    Encoder without_symbols = Encoder::load(path.string(), config);
    EXPECT_EQ(without_symbols.encode("hola ❤").cols(), 1);
    EXPECT_TRUE(without_symbols.encode("❤").isOnes());

    std::filesystem::remove(path);
}

TEST_F(EncoderTest, TransformRunsOnInjectedPool) {
    ThreadPool pool(2);
    Encoder pooled(identity(), {}, nullptr, pool);
    Encoder shared(identity());

    const std::vector<std::string> texts = {"hola mundo", "adios", "hola hola", "nada"};
    EXPECT_TRUE(pooled.transform(texts).isApprox(shared.transform(texts)));
    EXPECT_EQ(pooled.clone().transform(texts), pooled.transform(texts));
}
