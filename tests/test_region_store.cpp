#include "RegionStore.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace exam;

Region detected(int x, int y, int width, int height, double confidence = 0.7) {
  return Region::fromRect(cv::Rect(x, y, width, height), 1,
                          RegionType::QuestionGroup, confidence);
}

TEST(RegionStoreTest, ReplaceDetectedAssignsIds) {
  RegionStore store;
  std::vector<Region> stored = store.replaceDetected(
      "doc", 1, {detected(0, 200, 50, 50), detected(0, 10, 50, 50)});

  ASSERT_EQ(stored.size(), 2u);
  EXPECT_EQ(stored[0].y, 10);
  EXPECT_FALSE(stored[0].id().empty());
  EXPECT_NE(stored[0].id(), stored[1].id());
  EXPECT_EQ(store.region("doc", stored[1].id()).y, 200);
}

TEST(RegionStoreTest, RedetectionKeepsManualRegions) {
  RegionStore store;
  store.replaceDetected("doc", 1, {detected(0, 0, 50, 50)});
  Region manual =
      store.create("doc", cv::Rect(100, 100, 40, 40), 1, RegionType::Question, "alice");
  store.replaceDetected("doc", 2, {detected(0, 0, 50, 50)});

  std::vector<Region> page1 =
      store.replaceDetected("doc", 1, {detected(5, 5, 60, 60), detected(5, 300, 60, 60)});
  ASSERT_EQ(page1.size(), 3u);
  EXPECT_EQ(store.region("doc", manual.id()).rect(), cv::Rect(100, 100, 40, 40));
  EXPECT_EQ(store.regions("doc", 2).size(), 1u);
  EXPECT_EQ(store.regions("doc").size(), 4u);
}

TEST(RegionStoreTest, UnknownIdsThrow) {
  RegionStore store;
  EXPECT_THROW(store.region("missing", "r1"), std::out_of_range);

  store.replaceDetected("doc", 1, {detected(0, 0, 50, 50)});
  EXPECT_THROW(store.region("doc", "r99"), std::out_of_range);
  EXPECT_THROW(store.resize("doc", "r99", cv::Rect(0, 0, 5, 5), "a"),
               std::out_of_range);
  EXPECT_THROW(store.remove("doc", "r99", "a"), std::out_of_range);
  EXPECT_THROW(store.merge("doc", {"r1", "r99"}, "a"), std::out_of_range);
  EXPECT_TRUE(store.corrections("doc").empty());
}

TEST(RegionStoreTest, EditsUpdateStoredRegions) {
  RegionStore store;
  std::vector<Region> stored =
      store.replaceDetected("doc", 1, {detected(0, 0, 100, 100, 0.8)});
  std::string id = stored[0].id();

  Region resized = store.resize("doc", id, cv::Rect(0, 0, 120, 120), "alice");
  EXPECT_EQ(resized.id(), id);
  EXPECT_EQ(store.region("doc", id).width, 120);

  store.move("doc", id, 10, 10, "alice");
  EXPECT_EQ(store.region("doc", id).x, 10);

  store.retype("doc", id, RegionType::Table, "bob");
  EXPECT_EQ(store.region("doc", id).type, RegionType::Table);

  CorrectionStats stats = store.correctionStats("doc");
  EXPECT_EQ(stats.total, 3u);
  EXPECT_EQ(stats.actors.size(), 2u);
}

TEST(RegionStoreTest, SplitReplacesRegionWithTwoHalves) {
  RegionStore store;
  std::string id =
      store.replaceDetected("doc", 1, {detected(0, 0, 100, 100, 0.8)})[0].id();

  store.split("doc", id, cv::Point(50, 40), SplitAxis::Horizontal, "alice");
  std::vector<Region> regions = store.regions("doc");
  ASSERT_EQ(regions.size(), 2u);
  EXPECT_THROW(store.region("doc", id), std::out_of_range);
  EXPECT_EQ(regions[0].height, 40);
  EXPECT_EQ(regions[1].height, 60);
  EXPECT_FALSE(regions[0].id().empty());
  EXPECT_NE(regions[0].id(), regions[1].id());
}

TEST(RegionStoreTest, MergeAndRemove) {
  RegionStore store;
  std::vector<Region> stored = store.replaceDetected(
      "doc", 1, {detected(0, 0, 100, 40), detected(0, 60, 100, 40),
                 detected(0, 300, 100, 40)});

  Region merged = store.merge("doc", {stored[0].id(), stored[1].id()}, "alice");
  EXPECT_EQ(merged.rect(), cv::Rect(0, 0, 100, 100));
  EXPECT_FALSE(merged.id().empty());

  store.remove("doc", stored[2].id(), "alice");
  std::vector<Region> remaining = store.regions("doc");
  ASSERT_EQ(remaining.size(), 1u);
  EXPECT_EQ(remaining[0].id(), merged.id());
  EXPECT_EQ(store.corrections("doc").size(), 2u);
}

TEST(RegionStoreTest, ConcurrentEditsOnOneDocument) {
  RegionStore store;
  std::vector<Region> seed;
  for (int i = 0; i < 8; ++i) {
    seed.push_back(detected(0, i * 100, 50, 50));
  }
  std::vector<Region> stored = store.replaceDetected("doc", 1, seed);

  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&store, &stored, t]() {
      const std::string id = stored[t].id();
      for (int i = 0; i < 25; ++i) {
        store.resize("doc", id, cv::Rect(0, t * 100, 50 + i, 50), "worker");
      }
      store.create("doc", cv::Rect(500, t * 100, 20, 20), 1, RegionType::Question,
                   "worker");
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  EXPECT_EQ(store.regions("doc").size(), 16u);
  EXPECT_EQ(store.correctionStats("doc").total, 8u * 26u);
  for (int t = 0; t < 8; ++t) {
    EXPECT_EQ(store.region("doc", stored[t].id()).width, 74);
  }
}

TEST(RegionStoreTest, DocumentsAreIndependent) {
  RegionStore store;
  store.replaceDetected("a", 1, {detected(0, 0, 50, 50)});
  store.replaceDetected("b", 1, {detected(0, 0, 50, 50), detected(0, 100, 50, 50)});
  EXPECT_EQ(store.regions("a").size(), 1u);
  EXPECT_EQ(store.regions("b").size(), 2u);
  EXPECT_TRUE(store.regions("c").empty());
}

} // anonymous namespace
