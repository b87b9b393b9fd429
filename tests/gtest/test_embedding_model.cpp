// =============================================================================
// Embedding Model Tests
// =============================================================================

#include <gtest/gtest.h>
#include "tokvec/error.hpp"
#include "tokvec/model/embedding_model.hpp"
#include "test_helpers.hpp"

using namespace tokvec;
using namespace tokvec::model;

class EmbeddingModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        // idf = [0, 1, 2, 3]
        vocabulary_ = test_support::make_vocabulary({{"a", 8}, {"b", 4}, {"c", 2}, {"d", 1}}, 8);
        artifacts_ = {artifact("b", {1.0f, -2.0f, 3.0f, 0.5f}, 0.5f),
                      artifact("d", {0.25f, 1.0f, -1.0f, 0.5f}, -1.0f)};
    }

    static TrainedTokenArtifact artifact(const std::string& label, std::vector<float> coef,
                                         float intercept) {
        TrainedTokenArtifact result;
        result.label = label;
        result.N = 10;
        result.coef = Eigen::Map<Vector>(coef.data(), static_cast<Eigen::Index>(coef.size()));
        result.intercept = intercept;
        return result;
    }

    static Matrix rows(std::initializer_list<std::initializer_list<float>> values) {
        Matrix m(static_cast<Eigen::Index>(values.size()), static_cast<Eigen::Index>(values.begin()->size()));
        Eigen::Index r = 0;
        for (const auto& row : values) {
            Eigen::Index c = 0;
            for (float v : row) m(r, c++) = v;
            ++r;
        }
        return m;
    }

    AssembleOptions plain() const {
        AssembleOptions options;
        options.merge_idf = false;
        options.force_token = false;
        return options;
    }

    std::shared_ptr<text::Vocabulary> vocabulary_;
    std::vector<TrainedTokenArtifact> artifacts_;
};

TEST_F(EmbeddingModelTest, StacksArtifactsInOrder) {
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_, plain());

    EXPECT_EQ(model.rows(), 2);
    EXPECT_EQ(model.dimension(), 4);
    EXPECT_EQ(model.names(), (std::vector<std::string>{"b", "d"}));
    EXPECT_TRUE(model.weights().isApprox(rows({{1.0f, -2.0f, 3.0f, 0.5f}, {0.25f, 1.0f, -1.0f, 0.5f}})));
    EXPECT_FLOAT_EQ(model.bias()[0], 0.5f);
    EXPECT_FLOAT_EQ(model.bias()[1], -1.0f);
}

TEST_F(EmbeddingModelTest, MergeIdfScalesColumns) {
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_, plain());
    Matrix merged = model.merge_idf();

    EXPECT_TRUE(merged.isApprox(rows({{0.0f, -2.0f, 6.0f, 1.5f}, {0.0f, 1.0f, -2.0f, 1.5f}})));
    // Not in place
    EXPECT_FLOAT_EQ(model.weights()(0, 2), 3.0f);

    model.merge_idf(Precision::Float32, true);
    EXPECT_FLOAT_EQ(model.weights()(0, 2), 6.0f);
}

TEST_F(EmbeddingModelTest, ForceTokenSetsOwnColumnToRowMax) {
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_, plain());
    Matrix forced = model.force_token();

    EXPECT_TRUE(forced.isApprox(rows({{1.0f, 3.0f, 3.0f, 0.5f}, {0.25f, 1.0f, -1.0f, 1.0f}})));
}

TEST_F(EmbeddingModelTest, ForceTokenWithIdfDividesByOwnWeight) {
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_, plain());
    Matrix forced = model.force_token(true);

    // b: max(w * idf) = 6, idf(b) = 1;  d: max(w * idf) = 1.5, idf(d) = 3
    EXPECT_FLOAT_EQ(forced(0, 1), 6.0f);
    EXPECT_FLOAT_EQ(forced(1, 3), 0.5f);
}

TEST_F(EmbeddingModelTest, ForceTokenWithZeroIdfFallsBackToPlainMax) {
    artifacts_.push_back(artifact("a", {0.0f, 4.0f, -1.0f, 2.0f}, 0.0f));
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_, plain());
    Matrix forced = model.force_token(true);
    EXPECT_FLOAT_EQ(forced(2, 0), 4.0f);
}

TEST_F(EmbeddingModelTest, DefaultAssemblyMergesThenForces) {
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_);
    EXPECT_TRUE(model.weights().isApprox(rows({{0.0f, 6.0f, 6.0f, 1.5f}, {0.0f, 1.0f, -2.0f, 1.5f}})));
}

TEST_F(EmbeddingModelTest, InterceptExcludesMergeIdf) {
    AssembleOptions options;
    options.intercept = true;
    options.merge_idf = true;
    EXPECT_THROW(EmbeddingModel::assemble(vocabulary_, artifacts_, options), InvalidArgumentError);

    options.merge_idf = false;
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_, options);
    EXPECT_FLOAT_EQ(model.weights()(0, 1), 6.0f);
}

TEST_F(EmbeddingModelTest, FillPlacesRowsInVocabularyOrder) {
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_, plain());
    Matrix full = model.fill();

    ASSERT_EQ(full.rows(), 4);
    EXPECT_TRUE(full.row(0).isZero(0.0f));
    EXPECT_TRUE(full.row(2).isZero(0.0f));
    EXPECT_EQ(full.row(1), model.weights().row(0));
    EXPECT_EQ(full.row(3), model.weights().row(1));
    EXPECT_EQ(model.rows(), 2);

    model.fill(true);
    EXPECT_EQ(model.rows(), 4);
    EXPECT_EQ(model.names(), vocabulary_->names());
    EXPECT_FLOAT_EQ(model.bias()[0], 0.0f);
    EXPECT_FLOAT_EQ(model.bias()[3], -1.0f);
}

TEST_F(EmbeddingModelTest, MisfitArtifactsAreMalformed) {
    std::vector<TrainedTokenArtifact> short_coef = {artifact("b", {1.0f, 2.0f}, 0.0f)};
    EXPECT_THROW(EmbeddingModel::assemble(vocabulary_, short_coef, plain()), MalformedArtifactError);

    std::vector<TrainedTokenArtifact> unknown = {artifact("zzz", {1.0f, 2.0f, 3.0f, 4.0f}, 0.0f)};
    EXPECT_THROW(EmbeddingModel::assemble(vocabulary_, unknown, plain()), MalformedArtifactError);
}

TEST_F(EmbeddingModelTest, ConstructorValidatesShapes) {
    EXPECT_THROW(EmbeddingModel(vocabulary_, Matrix::Zero(2, 3), Vector::Zero(2), {"a", "b"}),
                 InvalidArgumentError);
    EXPECT_THROW(EmbeddingModel(vocabulary_, Matrix::Zero(2, 4), Vector::Zero(1), {"a", "b"}),
                 InvalidArgumentError);
}

TEST_F(EmbeddingModelTest, Float16AssemblyRoundsMergedWeights) {
    artifacts_[0].coef[2] = 0.1f;
    AssembleOptions options;
    options.force_token = false;
    options.precision = Precision::Float16;
    auto model = EmbeddingModel::assemble(vocabulary_, artifacts_, options);
    EXPECT_FLOAT_EQ(model.weights()(0, 2), static_cast<float>(Eigen::half(0.2f)));
}
