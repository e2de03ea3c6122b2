// Unit tests for the vector store adapter and the exact-scan backend

#include <gtest/gtest.h>

#include <ragrank/chunk_store.hpp>
#include <ragrank/errors.hpp>
#include <ragrank/test_utils.hpp>
#include <ragrank/vector_index.hpp>
#include <ragrank/vector_store.hpp>

#include <cmath>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace ragrank {
namespace {

std::vector<std::string> Ids(const RankedList& list) {
  std::vector<std::string> out;
  for (const auto& r : list) out.push_back(r.chunk_id);
  return out;
}

const std::vector<float> kQuery = testing::AxisVector(8, 0);

// =============================================================================
// Normalisation per declared metric
// =============================================================================

TEST(VectorStoreAdapterTest, CosineHitsNormalised) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kCosine);
  backend->SetHits({{"a", 0.9}, {"b", 0.1}, {"c", -0.5}});
  VectorStoreAdapter adapter(backend, nullptr);

  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 10, {}, &out).ok());
  EXPECT_EQ(out.Adapter(), AdapterKind::kSemantic);
  ASSERT_EQ(Ids(out), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_DOUBLE_EQ(out[0].raw_score, 0.9);
  EXPECT_DOUBLE_EQ(out[0].normalised_score, 0.95);
  EXPECT_DOUBLE_EQ(out[2].normalised_score, 0.25);
  EXPECT_EQ(out[2].rank, 3u);
}

TEST(VectorStoreAdapterTest, L2SmallerDistanceRanksFirst) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kL2);
  // Out of order on purpose: the adapter sorts by normalised score.
  backend->SetHits({{"far", 3.0}, {"near", 0.0}, {"mid", 1.0}});
  VectorStoreAdapter adapter(backend, nullptr);

  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 10, {}, &out).ok());
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"near", "mid", "far"}));
  EXPECT_DOUBLE_EQ(out[0].normalised_score, 1.0);
  EXPECT_DOUBLE_EQ(out[1].normalised_score, 0.5);
  EXPECT_DOUBLE_EQ(out[2].normalised_score, 0.25);
}

TEST(VectorStoreAdapterTest, DotIsBatchRelative) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kDot);
  backend->SetHits({{"a", 20.0}, {"b", 15.0}, {"c", 10.0}});
  VectorStoreAdapter adapter(backend, nullptr);

  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 10, {}, &out).ok());
  EXPECT_DOUBLE_EQ(out[0].normalised_score, 1.0);
  EXPECT_DOUBLE_EQ(out[1].normalised_score, 0.5);
  EXPECT_DOUBLE_EQ(out[2].normalised_score, 0.0);
}

TEST(VectorStoreAdapterTest, DuplicateIdsKeepFirstAndRespectK) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kCosine);
  backend->SetHits({{"a", 0.9}, {"a", 0.8}, {"b", 0.7}, {"c", 0.6}});
  VectorStoreAdapter adapter(backend, nullptr);

  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 3, {}, &out).ok());
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"a", "b"}));
  EXPECT_DOUBLE_EQ(out[0].raw_score, 0.9);
}

TEST(VectorStoreAdapterTest, ZeroKOrNoHitsIsEmpty) {
  auto backend = std::make_shared<testing::FakeVectorBackend>();
  VectorStoreAdapter adapter(backend, nullptr);
  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 10, {}, &out).ok());
  EXPECT_TRUE(out.Empty());

  backend->SetHits({{"a", 0.5}});
  ASSERT_TRUE(adapter.Search(kQuery, 0, {}, &out).ok());
  EXPECT_TRUE(out.Empty());
  EXPECT_EQ(backend->Searches(), 1u);
}

// =============================================================================
// Errors
// =============================================================================

TEST(VectorStoreAdapterTest, DimensionMismatchIsConfigurationError) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kCosine, 8);
  VectorStoreAdapter adapter(backend, nullptr);
  RankedList out;
  EXPECT_TRUE(IsConfigurationError(adapter.Search(testing::AxisVector(4, 0), 5, {}, &out)));
  EXPECT_TRUE(IsConfigurationError(adapter.Search({}, 5, {}, &out)));
  EXPECT_EQ(backend->Searches(), 0u);
}

TEST(VectorStoreAdapterTest, BackendFailureIsUnavailable) {
  auto backend = std::make_shared<testing::FakeVectorBackend>();
  backend->SetFailure(rocksdb::Status::Corruption("segment lost"));
  VectorStoreAdapter adapter(backend, nullptr);

  RankedList out;
  rocksdb::Status s = adapter.Search(kQuery, 5, {}, &out);
  EXPECT_TRUE(IsBackendUnavailable(s)) << s.ToString();
  EXPECT_NE(s.ToString().find("fake_vector"), std::string::npos);
  EXPECT_TRUE(out.Empty());
}

// =============================================================================
// Filtering
// =============================================================================

class VectorStoreFilterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    test_dir_ = std::filesystem::temp_directory_path() /
                ("ragrank_vector_test_" + std::to_string(rd() % 1000000));
    std::filesystem::create_directories(test_dir_);
    ASSERT_TRUE(ChunkStore::Open((test_dir_ / "db").string(), &store_).ok());

    // Chunk i points along axis i; even chunks belong to "even".
    for (uint32_t i = 0; i < 8; ++i) {
      Chunk c;
      c.id = "c" + std::to_string(i);
      c.text = "chunk " + std::to_string(i);
      c.source_document_id = i % 2 == 0 ? "even" : "odd";
      c.position = i;
      c.embedding = testing::AxisVector(8, i);
      c.metadata["parity"] = i % 2 == 0 ? "even" : "odd";
      ASSERT_TRUE(store_->Put(c).ok());
    }
  }

  void TearDown() override {
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::filesystem::path test_dir_;
  std::unique_ptr<ChunkStore> store_;
};

TEST_F(VectorStoreFilterTest, NativeFilterPassedThrough) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kCosine, 8, true);
  backend->SetHits({{"c0", 0.9}});
  VectorStoreAdapter adapter(backend, store_.get());

  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 5, {{"parity", "even"}}, &out).ok());
  EXPECT_EQ(backend->LastFilter(), (MetadataFilter{{"parity", "even"}}));
  EXPECT_EQ(backend->Searches(), 1u);
}

TEST_F(VectorStoreFilterTest, PostFilterOverFetchesUntilKMatches) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kCosine, 8, false);
  // Best-first with the odd chunks crowding the top.
  backend->SetHits({{"c1", 0.99}, {"c3", 0.98}, {"c5", 0.97}, {"c7", 0.96}, {"c0", 0.5},
                    {"c2", 0.4}, {"c4", 0.3}, {"c6", 0.2}});
  VectorStoreAdapter adapter(backend, store_.get(), 2);

  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 2, {{"parity", "even"}}, &out).ok());
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c0", "c2"}));
  // 4 hits, then 8.
  EXPECT_EQ(backend->Searches(), 2u);
  EXPECT_TRUE(backend->LastFilter().empty());
}

TEST_F(VectorStoreFilterTest, PostFilterByDocumentId) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kCosine, 8, false);
  backend->SetHits({{"c0", 0.9}, {"c1", 0.8}, {"c2", 0.7}});
  VectorStoreAdapter adapter(backend, store_.get());

  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 5, {{"document_id", "odd"}}, &out).ok());
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c1"}));
}

TEST_F(VectorStoreFilterTest, PostFilterSkipsChunksMissingFromStore) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kCosine, 8, false);
  backend->SetHits({{"ghost", 0.99}, {"c0", 0.9}});
  VectorStoreAdapter adapter(backend, store_.get());

  RankedList out;
  ASSERT_TRUE(adapter.Search(kQuery, 5, {{"parity", "even"}}, &out).ok());
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c0"}));
}

TEST_F(VectorStoreFilterTest, PostFilterWithoutStoreIsConfigurationError) {
  auto backend = std::make_shared<testing::FakeVectorBackend>(NativeMetric::kCosine, 8, false);
  VectorStoreAdapter adapter(backend, nullptr);
  RankedList out;
  EXPECT_TRUE(IsConfigurationError(adapter.Search(kQuery, 5, {{"parity", "even"}}, &out)));
}

// =============================================================================
// Exact backend
// =============================================================================

TEST_F(VectorStoreFilterTest, ExactBackendFindsNearest) {
  std::shared_ptr<VectorBackend> backend = CreateExactVectorBackend(store_.get(), NativeMetric::kCosine);
  ASSERT_NE(backend, nullptr);
  EXPECT_EQ(backend->Dimension(), 8u);
  EXPECT_TRUE(backend->Capability().supports_metadata_filtering);

  VectorStoreAdapter adapter(backend, store_.get());
  RankedList out;
  ASSERT_TRUE(adapter.Search(testing::AxisVector(8, 3, 5, 0.5f), 2, {}, &out).ok());
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c3", "c5"}));
  EXPECT_GT(out[0].normalised_score, out[1].normalised_score);
}

TEST_F(VectorStoreFilterTest, ExactBackendFiltersNatively) {
  std::shared_ptr<VectorBackend> backend = CreateExactVectorBackend(store_.get(), NativeMetric::kL2);
  VectorStoreAdapter adapter(backend, store_.get());

  RankedList out;
  ASSERT_TRUE(adapter.Search(testing::AxisVector(8, 3), 2, {{"parity", "even"}}, &out).ok());
  ASSERT_EQ(out.Size(), 2u);
  for (const auto& r : out) {
    EXPECT_EQ(std::stoi(r.chunk_id.substr(1)) % 2, 0) << r.chunk_id;
    EXPECT_NEAR(r.raw_score, std::sqrt(2.0), 1e-6);
  }
  // Equal distances fall back to chunk id order.
  EXPECT_EQ(Ids(out), (std::vector<std::string>{"c0", "c2"}));
}

TEST_F(VectorStoreFilterTest, ExactBackendOnClosedStoreIsUnavailable) {
  std::shared_ptr<VectorBackend> backend = CreateExactVectorBackend(store_.get(), NativeMetric::kCosine);
  VectorStoreAdapter adapter(backend, store_.get());
  store_->Close();

  RankedList out;
  EXPECT_TRUE(IsBackendUnavailable(adapter.Search(kQuery, 2, {}, &out)));
}

TEST(HnswBackendTest, RejectsCosineMetric) {
  std::string error;
  EXPECT_EQ(CreateHnswVectorBackend(8, NativeMetric::kCosine, HnswOptions{}, &error), nullptr);
  EXPECT_NE(error.find("cosine"), std::string::npos);
}

// Graph index whose searches either return fixed results or fail.
class StubGraphIndex : public internal::VectorIndex {
 public:
  explicit StubGraphIndex(internal::HnswSpace space, bool fail_search)
      : space_(space), fail_search_(fail_search) {}

  bool Add(const std::vector<float>&, const std::string&) override { return true; }

  bool Search(const std::vector<float>&, size_t k, std::vector<internal::SearchResult>* out,
              std::string* error_out) const override {
    out->clear();
    if (fail_search_) {
      if (error_out) *error_out = "searchKnn failed: corrupted level";
      return false;
    }
    out->push_back({"near", 0.25f});
    out->push_back({"far", 4.0f});
    if (out->size() > k) out->resize(k);
    return true;
  }

  bool Remove(const std::string&) override { return true; }
  size_t Size() const override { return 2; }
  size_t Dimension() const override { return 8; }
  size_t DeletedCount() const override { return 0; }
  internal::HnswSpace Space() const override { return space_; }
  void SetSearchParam(const std::string&, int) override {}

 private:
  internal::HnswSpace space_;
  bool fail_search_;
};

TEST(HnswBackendTest, GraphSearchFailureIsUnavailable) {
  std::shared_ptr<VectorBackend> backend = CreateGraphVectorBackend(
      std::make_unique<StubGraphIndex>(internal::HnswSpace::kL2, true), NativeMetric::kL2);
  ASSERT_NE(backend, nullptr);

  std::vector<RawHit> hits;
  rocksdb::Status s = backend->Search(testing::AxisVector(8, 0), 2, nullptr, &hits);
  EXPECT_TRUE(s.IsIOError()) << s.ToString();
  EXPECT_NE(s.ToString().find("hnsw"), std::string::npos) << s.ToString();

  VectorStoreAdapter adapter(backend, nullptr);
  RankedList out;
  s = adapter.Search(testing::AxisVector(8, 0), 2, {}, &out);
  EXPECT_TRUE(IsBackendUnavailable(s)) << s.ToString();
  EXPECT_TRUE(out.Empty());
}

TEST(HnswBackendTest, GraphDistancesBecomeEuclidean) {
  std::shared_ptr<VectorBackend> backend = CreateGraphVectorBackend(
      std::make_unique<StubGraphIndex>(internal::HnswSpace::kL2, false), NativeMetric::kL2);
  ASSERT_NE(backend, nullptr);

  std::vector<RawHit> hits;
  ASSERT_TRUE(backend->Search(testing::AxisVector(8, 0), 2, nullptr, &hits).ok());
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk_id, "near");
  EXPECT_NEAR(hits[0].raw_score, 0.5, 1e-6);
  EXPECT_NEAR(hits[1].raw_score, 2.0, 1e-6);
}

TEST(HnswBackendTest, GraphMetricMustMatchSpace) {
  std::string error;
  EXPECT_EQ(CreateGraphVectorBackend(
                std::make_unique<StubGraphIndex>(internal::HnswSpace::kInnerProduct, false),
                NativeMetric::kL2, &error),
            nullptr);
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(CreateGraphVectorBackend(nullptr, NativeMetric::kL2, &error), nullptr);
}

}  // namespace
}  // namespace ragrank
