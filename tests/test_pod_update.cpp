/**
 * @file test_pod_update.cpp
 * @brief Tests for the PodUpdate contract and the enum labels.
 */
#include <gtest/gtest.h>
#include <memory>

#include "podcfg/types/pod_update.hpp"
#include "podcfg/types/sync_pod_type.hpp"

using podcfg::types::Pod;
using podcfg::types::PodList;
using podcfg::types::PodOperation;
using podcfg::types::PodUpdate;
using podcfg::types::SyncPodType;
using podcfg::types::make_update;
using podcfg::types::to_string;

// ---------- PodUpdate ----------

/**
 * @test Default_HasEmptyPodsNotAbsent
 * @brief A default update carries an empty pod list, op Set and no source.
 */
TEST(PodUpdate, Default_HasEmptyPodsNotAbsent) {
  PodUpdate u;
  EXPECT_TRUE(u.pods.empty());
  EXPECT_EQ(u.op, PodOperation::Set);
  EXPECT_TRUE(u.source.empty());
}

/**
 * @test SetWithNoPods_RemovesAll
 * @brief "Remove all pods of a source" has exactly one representation.
 */
TEST(PodUpdate, SetWithNoPods_RemovesAll) {
  auto a = make_update(PodOperation::Set, "file");
  auto b = make_update(PodOperation::Set, "file", PodList{});
  EXPECT_EQ(a, b);
  EXPECT_TRUE(a.pods.empty());
}

/**
 * @test Equality_ComparesPodsByValue
 * @brief Distinct snapshots with equal contents compare equal.
 */
TEST(PodUpdate, Equality_ComparesPodsByValue) {
  auto p1 = std::make_shared<const Pod>(Pod{.uid = "u1", .name = "web"});
  auto p2 = std::make_shared<const Pod>(Pod{.uid = "u1", .name = "web"});
  ASSERT_NE(p1, p2); // distinct snapshots

  auto a = make_update(PodOperation::Add, "api", {p1});
  auto b = make_update(PodOperation::Add, "api", {p2});
  EXPECT_EQ(a, b);

  auto c = make_update(PodOperation::Add, "api", {std::make_shared<const Pod>(Pod{.uid = "u2"})});
  EXPECT_FALSE(a == c);
}

/**
 * @test Equality_OpSourceAndOrderMatter
 * @brief Op, source, pod order and pod count all take part in equality.
 */
TEST(PodUpdate, Equality_OpSourceAndOrderMatter) {
  auto p1 = std::make_shared<const Pod>(Pod{.uid = "u1"});
  auto p2 = std::make_shared<const Pod>(Pod{.uid = "u2"});

  const auto base = make_update(PodOperation::Update, "http", {p1, p2});
  EXPECT_FALSE(base == make_update(PodOperation::Add, "http", {p1, p2}));
  EXPECT_FALSE(base == make_update(PodOperation::Update, "file", {p1, p2}));
  EXPECT_FALSE(base == make_update(PodOperation::Update, "http", {p2, p1}));
  EXPECT_FALSE(base == make_update(PodOperation::Update, "http", {p1}));
  EXPECT_FALSE(base == make_update(PodOperation::Update, "http"));
}

/**
 * @test NullEntries_DoNotCrashEquality
 * @brief Null pod references compare equal to each other and unequal to real pods.
 */
TEST(PodUpdate, NullEntries_DoNotCrashEquality) {
  PodUpdate a{PodList{nullptr}, PodOperation::Remove, "api"};
  PodUpdate b{PodList{nullptr}, PodOperation::Remove, "api"};
  PodUpdate c{PodList{std::make_shared<const Pod>()}, PodOperation::Remove, "api"};
  EXPECT_EQ(a, b);
  EXPECT_FALSE(a == c);
}

/**
 * @test PodNamespace_DefaultsToDefault
 * @brief A pod without namespace lands in NAMESPACE_DEFAULT.
 */
TEST(PodUpdate, PodNamespace_DefaultsToDefault) {
  Pod p;
  EXPECT_EQ(p.namespace_name, podcfg::types::NAMESPACE_DEFAULT);
}

// ---------- Labels ----------

/**
 * @test PodOperation_Labels_Stable
 * @brief Operation labels render as upper-case names.
 */
TEST(PodOperation, Labels_Stable) {
  EXPECT_EQ(to_string(PodOperation::Set), "SET");
  EXPECT_EQ(to_string(PodOperation::Add), "ADD");
  EXPECT_EQ(to_string(PodOperation::Delete), "DELETE");
  EXPECT_EQ(to_string(PodOperation::Remove), "REMOVE");
  EXPECT_EQ(to_string(PodOperation::Update), "UPDATE");
  EXPECT_EQ(to_string(PodOperation::Reconcile), "RECONCILE");
  EXPECT_EQ(to_string(static_cast<PodOperation>(6)), "UNKNOWN");
}

/**
 * @test Ordinals_Stable
 * @brief Operation ordinals stay fixed for consumers that persist them.
 */
TEST(PodOperation, Ordinals_Stable) {
  EXPECT_EQ(static_cast<int>(PodOperation::Set), 0);
  EXPECT_EQ(static_cast<int>(PodOperation::Reconcile), 5);
}

/**
 * @test SyncPodType_Labels_Stable
 * @brief Sync labels render as lower-case names.
 */
TEST(SyncPodType, Labels_Stable) {
  EXPECT_EQ(to_string(SyncPodType::Sync), "sync");
  EXPECT_EQ(to_string(SyncPodType::Update), "update");
  EXPECT_EQ(to_string(SyncPodType::Create), "create");
  EXPECT_EQ(to_string(SyncPodType::Kill), "kill");
}

/**
 * @test Unrecognized_RendersUnknown
 * @brief Out-of-range sync labels render as "unknown".
 */
TEST(SyncPodType, Unrecognized_RendersUnknown) {
  EXPECT_EQ(to_string(static_cast<SyncPodType>(4)), "unknown");
  EXPECT_EQ(to_string(static_cast<SyncPodType>(200)), "unknown");
}
