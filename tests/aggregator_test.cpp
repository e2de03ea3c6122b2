// Unit tests for sub-query aggregation
// Tests: MAX / SUM / WEIGHTED, attribution, ordering, configuration errors

#include <gtest/gtest.h>

#include <ragrank/aggregator.hpp>
#include <ragrank/errors.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace ragrank {
namespace {

FusedResult Fused(const std::string& id, double score,
                  AdapterKind adapter = AdapterKind::kSemantic, size_t rank = 1) {
  FusedResult f;
  f.chunk_id = id;
  f.fused_score = score;
  f.contributing_lists.push_back(std::string(AdapterName(adapter)));
  f.contributions.push_back(ListContribution{std::string(AdapterName(adapter)), adapter, rank,
                                             0.5, 0.75});
  return f;
}

SubQuery Sq(const std::string& text, double weight = 1.0) {
  return SubQuery{text, weight, SubQueryOrigin::kRule};
}

const AggregatedResult* Find(const std::vector<AggregatedResult>& v, const std::string& id) {
  for (const auto& r : v) {
    if (r.chunk_id == id) return &r;
  }
  return nullptr;
}

class AggregatorTest : public ::testing::Test {
 protected:
  // "shared" is found by both sub-queries; each also has its own hit.
  void SetUp() override {
    sub_queries_ = {Sq("python"), Sq("rust")};
    fused_ = {
        {Fused("shared", 0.03), Fused("only0", 0.02)},
        {Fused("only1", 0.025, AdapterKind::kLexical), Fused("shared", 0.02, AdapterKind::kLexical, 2)},
    };
  }

  std::vector<SubQuery> sub_queries_;
  std::vector<std::vector<FusedResult>> fused_;
};

// =============================================================================
// Methods
// =============================================================================

TEST_F(AggregatorTest, MaxTakesBestSubQueryScore) {
  Aggregator agg(AggregatorOptions{AggregationMethod::kMax, 0.5});
  std::vector<AggregatedResult> out;
  ASSERT_TRUE(agg.Aggregate(sub_queries_, fused_, &out).ok());

  ASSERT_EQ(out.size(), 3u);
  const auto* shared = Find(out, "shared");
  ASSERT_NE(shared, nullptr);
  EXPECT_DOUBLE_EQ(shared->aggregate_score, 0.03);
  EXPECT_EQ(out[0].chunk_id, "shared");
  EXPECT_EQ(out[1].chunk_id, "only1");
  EXPECT_EQ(out[2].chunk_id, "only0");
}

TEST_F(AggregatorTest, SumRewardsChunksFoundByManySubQueries) {
  Aggregator agg(AggregatorOptions{AggregationMethod::kSum, 0.5});
  std::vector<AggregatedResult> out;
  ASSERT_TRUE(agg.Aggregate(sub_queries_, fused_, &out).ok());

  const auto* shared = Find(out, "shared");
  ASSERT_NE(shared, nullptr);
  EXPECT_DOUBLE_EQ(shared->aggregate_score, 0.05);
  EXPECT_EQ(out[0].chunk_id, "shared");
}

TEST_F(AggregatorTest, WeightedDecaysLaterSubQueries) {
  Aggregator agg(AggregatorOptions{AggregationMethod::kWeighted, 0.5});
  std::vector<AggregatedResult> out;
  ASSERT_TRUE(agg.Aggregate(sub_queries_, fused_, &out).ok());

  EXPECT_DOUBLE_EQ(Find(out, "shared")->aggregate_score, 0.03 + 0.5 * 0.02);
  EXPECT_DOUBLE_EQ(Find(out, "only1")->aggregate_score, 0.5 * 0.025);
  EXPECT_DOUBLE_EQ(Find(out, "only0")->aggregate_score, 0.02);
  EXPECT_DOUBLE_EQ(agg.EffectiveWeight(Sq("x", 2.0), 2), 0.5);
}

TEST_F(AggregatorTest, SubQueryWeightsScaleScores) {
  sub_queries_[1].weight = 3.0;
  Aggregator agg(AggregatorOptions{AggregationMethod::kMax, 0.5});
  std::vector<AggregatedResult> out;
  ASSERT_TRUE(agg.Aggregate(sub_queries_, fused_, &out).ok());

  EXPECT_DOUBLE_EQ(Find(out, "only1")->aggregate_score, 0.075);
  EXPECT_DOUBLE_EQ(Find(out, "shared")->aggregate_score, 0.06);
  EXPECT_EQ(out[0].chunk_id, "only1");
}

// =============================================================================
// Provenance
// =============================================================================

TEST_F(AggregatorTest, MatchedSubQueriesAndAttributions) {
  Aggregator agg;
  std::vector<AggregatedResult> out;
  ASSERT_TRUE(agg.Aggregate(sub_queries_, fused_, &out).ok());

  const auto* shared = Find(out, "shared");
  EXPECT_EQ(shared->matched_sub_queries, (std::vector<size_t>{0, 1}));
  ASSERT_EQ(shared->attributions.size(), 2u);
  EXPECT_EQ(shared->attributions[0].sub_query_index, 0u);
  EXPECT_EQ(shared->attributions[0].adapter, AdapterKind::kSemantic);
  EXPECT_EQ(shared->attributions[1].sub_query_index, 1u);
  EXPECT_EQ(shared->attributions[1].adapter, AdapterKind::kLexical);
  EXPECT_EQ(shared->attributions[1].rank, 2u);
  EXPECT_DOUBLE_EQ(shared->sub_query_scores.at(1), 0.02);

  EXPECT_EQ(Find(out, "only1")->matched_sub_queries, (std::vector<size_t>{1}));
}

TEST_F(AggregatorTest, SingleSubQueryKeepsFusedOrder) {
  Aggregator agg;
  std::vector<AggregatedResult> out;
  ASSERT_TRUE(agg.Aggregate({Sq("q")}, {{Fused("b", 0.03), Fused("a", 0.01)}}, &out).ok());
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].chunk_id, "b");
  EXPECT_EQ(out[1].chunk_id, "a");
}

TEST_F(AggregatorTest, TiesBrokenByChunkId) {
  Aggregator agg;
  std::vector<AggregatedResult> out;
  ASSERT_TRUE(agg.Aggregate({Sq("q")}, {{Fused("zeta", 0.02), Fused("alpha", 0.02)}}, &out).ok());
  EXPECT_EQ(out[0].chunk_id, "alpha");
  EXPECT_EQ(out[1].chunk_id, "zeta");
}

TEST_F(AggregatorTest, EmptyInputsGiveEmptyOutput) {
  Aggregator agg;
  std::vector<AggregatedResult> out;
  ASSERT_TRUE(agg.Aggregate({Sq("a"), Sq("b")}, {{}, {}}, &out).ok());
  EXPECT_TRUE(out.empty());
}

// =============================================================================
// Configuration errors
// =============================================================================

TEST_F(AggregatorTest, RejectsNonPositiveWeight) {
  Aggregator agg;
  std::vector<AggregatedResult> out;
  sub_queries_[0].weight = 0.0;
  EXPECT_TRUE(IsConfigurationError(agg.Aggregate(sub_queries_, fused_, &out)));
  sub_queries_[0].weight = -1.0;
  EXPECT_TRUE(IsConfigurationError(agg.Aggregate(sub_queries_, fused_, &out)));
  sub_queries_[0].weight = std::nan("");
  EXPECT_TRUE(IsConfigurationError(agg.Aggregate(sub_queries_, fused_, &out)));
}

TEST_F(AggregatorTest, RejectsMismatchedInputSizes) {
  Aggregator agg;
  std::vector<AggregatedResult> out;
  sub_queries_.push_back(Sq("third"));
  EXPECT_TRUE(agg.Aggregate(sub_queries_, fused_, &out).IsInvalidArgument());
}

TEST_F(AggregatorTest, RejectsDecayOutsideUnitInterval) {
  EXPECT_TRUE(IsConfigurationError(
      Aggregator(AggregatorOptions{AggregationMethod::kWeighted, 0.0}).Validate()));
  EXPECT_TRUE(IsConfigurationError(
      Aggregator(AggregatorOptions{AggregationMethod::kWeighted, 1.5}).Validate()));
  EXPECT_TRUE(Aggregator(AggregatorOptions{AggregationMethod::kWeighted, 1.0}).Validate().ok());
}

TEST(AggregationMethodTest, ParseKnownAndUnknownNames) {
  AggregationMethod m = AggregationMethod::kMax;
  ASSERT_TRUE(ParseAggregationMethod("SUM", &m).ok());
  EXPECT_EQ(m, AggregationMethod::kSum);
  ASSERT_TRUE(ParseAggregationMethod("weighted", &m).ok());
  EXPECT_EQ(m, AggregationMethod::kWeighted);
  EXPECT_TRUE(IsConfigurationError(ParseAggregationMethod("median", &m)));
  EXPECT_EQ(AggregationMethodName(AggregationMethod::kMax), "max");
}

}  // namespace
}  // namespace ragrank
