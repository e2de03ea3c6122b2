// Tests for cross-encoder reranking

#include <gtest/gtest.h>

#include <ragrank/reranker.hpp>
#include <ragrank/test_utils.hpp>

#include <memory>
#include <string>
#include <vector>

namespace ragrank {
namespace {

std::vector<RerankCandidate> Candidates() {
  return {{"c1", "first passage"}, {"c2", "second passage"}, {"c3", "third passage"},
          {"c4", "fourth passage"}};
}

std::vector<std::string> Ids(const std::vector<RerankResult>& results) {
  std::vector<std::string> out;
  for (const auto& r : results) out.push_back(r.chunk_id);
  return out;
}

// =============================================================================
// Scoring applied
// =============================================================================

TEST(RerankerTest, ReordersByCrossEncoderScore) {
  auto model = std::make_shared<testing::ScriptedCrossEncoder>(0.1);
  model->SetScore("third passage", 0.9);
  model->SetScore("second passage", 0.5);
  Reranker reranker(model);

  bool applied = false;
  std::string error;
  auto out = reranker.Rerank("query", Candidates(), 10, &applied, &error);

  EXPECT_TRUE(applied);
  EXPECT_TRUE(error.empty());
  ASSERT_EQ(Ids(out), (std::vector<std::string>{"c3", "c2", "c1", "c4"}));
  EXPECT_FLOAT_EQ(static_cast<float>(out[0].score), 0.9f);
  EXPECT_EQ(out[0].original_rank, 3u);
  EXPECT_EQ(out[0].final_rank, 1u);
  EXPECT_EQ(out[3].final_rank, 4u);
  EXPECT_EQ(model->Batches(), 1u);
}

TEST(RerankerTest, EqualScoresKeepInputOrder) {
  auto model = std::make_shared<testing::ScriptedCrossEncoder>(0.5);
  Reranker reranker(model);
  bool applied = false;
  auto out = reranker.Rerank("q", Candidates(), 10, &applied);
  EXPECT_TRUE(applied);
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c1", "c2", "c3", "c4"}));
}

TEST(RerankerTest, TruncatesToTopK) {
  auto model = std::make_shared<testing::ScriptedCrossEncoder>(0.0);
  model->SetScore("fourth passage", 1.0);
  Reranker reranker(model, RerankerOptions{2, std::nullopt});

  EXPECT_EQ(Ids(reranker.Rerank("q", Candidates(), 1)), (std::vector<std::string>{"c4"}));
  // top_k == 0 uses the configured default.
  EXPECT_EQ(reranker.Rerank("q", Candidates(), 0).size(), 2u);
}

TEST(RerankerTest, MinScoreDropsLowScoringResults) {
  auto model = std::make_shared<testing::ScriptedCrossEncoder>(0.1);
  model->SetScore("second passage", 0.8);
  model->SetScore("fourth passage", 0.6);
  Reranker reranker(model, RerankerOptions{10, 0.5});

  bool applied = false;
  auto out = reranker.Rerank("q", Candidates(), 10, &applied);
  EXPECT_TRUE(applied);
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c2", "c4"}));
}

TEST(RerankerTest, DuplicateCandidatesKeepFirstOccurrence) {
  auto model = std::make_shared<testing::ScriptedCrossEncoder>(0.0);
  model->SetScore("copy", 0.9);
  Reranker reranker(model);

  auto out = reranker.Rerank("q", {{"a", "original"}, {"b", "other"}, {"a", "copy"}}, 10);
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"a", "b"}));
  EXPECT_DOUBLE_EQ(out[0].score, 0.0);
}

// =============================================================================
// Fallback
// =============================================================================

TEST(RerankerTest, NullModelReturnsInputOrder) {
  Reranker reranker(nullptr);
  EXPECT_FALSE(reranker.Available());

  bool applied = true;
  std::string error;
  auto out = reranker.Rerank("q", Candidates(), 3, &applied, &error);
  EXPECT_FALSE(applied);
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c1", "c2", "c3"}));
  for (const auto& r : out) EXPECT_DOUBLE_EQ(r.score, 0.0);
}

TEST(RerankerTest, ScoringFailureReturnsInputOrder) {
  auto model = std::make_shared<testing::ScriptedCrossEncoder>(0.5);
  model->SetScore("fourth passage", 0.99);
  model->SetFailure("inference failed");
  Reranker reranker(model);

  bool applied = true;
  std::string error;
  auto out = reranker.Rerank("q", Candidates(), 10, &applied, &error);
  EXPECT_FALSE(applied);
  EXPECT_EQ(error, "inference failed");
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c1", "c2", "c3", "c4"}));
}

TEST(RerankerTest, EmptyCandidatesGiveEmptyOutput) {
  auto model = std::make_shared<testing::ScriptedCrossEncoder>();
  Reranker reranker(model);
  bool applied = true;
  EXPECT_TRUE(reranker.Rerank("q", {}, 10, &applied).empty());
  EXPECT_FALSE(applied);
  EXPECT_EQ(model->Batches(), 0u);
}

TEST(RerankerTest, OutputIdsAlwaysComeFromInput) {
  auto model = std::make_shared<testing::ScriptedCrossEncoder>(0.3);
  Reranker reranker(model);
  auto input = Candidates();
  for (const auto& r : reranker.Rerank("q", input, 10)) {
    bool found = false;
    for (const auto& c : input) found = found || c.chunk_id == r.chunk_id;
    EXPECT_TRUE(found) << r.chunk_id;
  }
}

TEST(CrossEncoderFactoryTest, MissingModelFails) {
  std::string error;
  EXPECT_EQ(CreateCrossEncoder("/nonexistent/reranker.onnx", 0, &error), nullptr);
  EXPECT_FALSE(error.empty());
}

}  // namespace
}  // namespace ragrank
