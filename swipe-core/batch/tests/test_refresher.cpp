#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>
#include <swipe/batch/refresher.hpp>

#include "fakes.hpp"

using namespace swipe;
using namespace swipe::batch;
using namespace swipe::batch::fakes;

TEST(EmbeddingRefresherTest, RejectsZeroBounds) {
  EXPECT_THROW(EmbeddingRefresher(0, 10), std::invalid_argument);
  EXPECT_THROW(EmbeddingRefresher(10, 0), std::invalid_argument);
}

TEST(EmbeddingRefresherTest, RefreshesEveryId) {
  FakeIdSource ids(make_ids("u", 23));
  FakeEmbeddingService service;
  EmbeddingRefresher refresher(10, 1000);

  auto summary = refresher.refresh(ids, service, EntityType::User);
  EXPECT_EQ(summary.processed, 23u);
  EXPECT_EQ(summary.succeeded, 23u);
  EXPECT_EQ(summary.failed, 0u);
  EXPECT_EQ(service.refreshed().size(), 23u);
  EXPECT_EQ(ids.calls.load(), 3);
}

TEST(EmbeddingRefresherTest, EmptyIdSource) {
  FakeIdSource ids({});
  FakeEmbeddingService service;
  EmbeddingRefresher refresher(10, 100);

  auto summary = refresher.refresh(ids, service, EntityType::Post);
  EXPECT_EQ(summary.processed, 0u);
  EXPECT_EQ(ids.calls.load(), 1);
}

TEST(EmbeddingRefresherTest, FailingEntityDoesNotAbortPage) {
  FakeIdSource ids({"p1", "p2", "p3", "p4"});
  FakeEmbeddingService service({"p2"});
  EmbeddingRefresher refresher(10, 100);

  auto summary = refresher.refresh(ids, service, EntityType::Post);
  EXPECT_EQ(summary.processed, 4u);
  EXPECT_EQ(summary.succeeded, 3u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(service.refreshed(), (std::vector<std::string>{"p1", "p3", "p4"}));
}

TEST(EmbeddingRefresherTest, NonStandardExceptionCountsAsFailure) {
  FakeIdSource ids({"p1", "p2", "p3", "p4"});
  FakeEmbeddingService service({}, {"p1"});
  EmbeddingRefresher refresher(10, 100);

  RefreshSummary summary;
  EXPECT_NO_THROW(summary = refresher.refresh(ids, service, EntityType::Post));
  EXPECT_EQ(summary.processed, 4u);
  EXPECT_EQ(summary.succeeded, 3u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(service.refreshed(), (std::vector<std::string>{"p2", "p3", "p4"}));
}

TEST(EmbeddingRefresherTest, MaxItemsBoundsThePass) {
  FakeIdSource ids(make_ids("p", 100));
  FakeEmbeddingService service;
  EmbeddingRefresher refresher(10, 25);

  auto summary = refresher.refresh(ids, service, EntityType::Post);
  // The bound is checked per page, so the last page is finished.
  EXPECT_EQ(summary.processed, 30u);
  EXPECT_EQ(ids.calls.load(), 3);
}

TEST(EmbeddingRefresherTest, IdSourceErrorPropagates) {
  FakeIdSource ids(make_ids("u", 5));
  ids.fail = true;
  FakeEmbeddingService service;
  EmbeddingRefresher refresher(10, 100);

  EXPECT_THROW((void)refresher.refresh(ids, service, EntityType::User), std::runtime_error);
}
