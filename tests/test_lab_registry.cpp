#include <gtest/gtest.h>
#include "LabRegistry.h"
#include "Logger.h"
#include "TestUtil.h"

class LabRegistryTest : public ::testing::Test {
protected:
    Reservation reserve(const std::string& owner, const std::string& type, int seed = 0) {
        return registry.reserve(owner, type, 80, type + "-" + owner, seed, quota, clock.now());
    }

    testutil::TempDir dir;
    testutil::ManualClock clock;
    Logger logger{dir.path() + "/logs", clock.fn()};
    LabRegistry registry{dir.file("data/active_labs.json"), logger};
    QuotaPolicy quota;
};

TEST(LabStatusTest, TransitionTable) {
    EXPECT_TRUE(is_valid_transition(LabStatus::Created, LabStatus::Running));
    EXPECT_TRUE(is_valid_transition(LabStatus::Created, LabStatus::Failed));
    EXPECT_TRUE(is_valid_transition(LabStatus::Running, LabStatus::Stopped));
    EXPECT_TRUE(is_valid_transition(LabStatus::Running, LabStatus::Failed));
    EXPECT_TRUE(is_valid_transition(LabStatus::Stopped, LabStatus::Deleted));
    EXPECT_TRUE(is_valid_transition(LabStatus::Failed, LabStatus::Deleted));

    EXPECT_FALSE(is_valid_transition(LabStatus::Running, LabStatus::Deleted));
    EXPECT_FALSE(is_valid_transition(LabStatus::Stopped, LabStatus::Running));
    EXPECT_FALSE(is_valid_transition(LabStatus::Deleted, LabStatus::Running));
}

TEST(LabStatusTest, OnlyCreatedAndRunningHoldQuota) {
    EXPECT_TRUE(counts_toward_quota(LabStatus::Created));
    EXPECT_TRUE(counts_toward_quota(LabStatus::Running));
    EXPECT_FALSE(counts_toward_quota(LabStatus::Stopped));
    EXPECT_FALSE(counts_toward_quota(LabStatus::Failed));
}

TEST_F(LabRegistryTest, ReserveInsertsCreatedRecord) {
    Reservation r = reserve("alice", "dvwa", 42);
    ASSERT_EQ(r.outcome, Reservation::Outcome::Reserved);
    EXPECT_EQ(r.name, "dvwa-alice-0042");

    auto lab = registry.find(r.name);
    ASSERT_TRUE(lab.has_value());
    EXPECT_EQ(lab->status, LabStatus::Created);
    EXPECT_EQ(lab->owner, "alice");
    EXPECT_EQ(lab->port, 80);
}

TEST_F(LabRegistryTest, ReserveSkipsTakenNames) {
    Reservation first = reserve("alice", "dvwa", 9999);
    Reservation second = reserve("alice", "dvwa", 9999);
    EXPECT_EQ(first.name, "dvwa-alice-9999");
    EXPECT_EQ(second.name, "dvwa-alice-0000");
}

TEST_F(LabRegistryTest, OwnerCeilingBlocksReservation) {
    quota.max_per_owner = 2;
    reserve("alice", "dvwa");
    reserve("alice", "webgoat");
    Reservation r = reserve("alice", "juice-shop");
    EXPECT_EQ(r.outcome, Reservation::Outcome::OwnerQuota);
    EXPECT_EQ(r.owner_count, 2);
    EXPECT_EQ(r.owner_lab_types, (std::vector<std::string>{"dvwa", "webgoat"}));
    EXPECT_EQ(registry.list().size(), 2u);
}

TEST_F(LabRegistryTest, GlobalCeilingBlocksReservation) {
    quota.max_total = 2;
    reserve("alice", "dvwa");
    reserve("bob", "dvwa");
    Reservation r = reserve("carol", "dvwa");
    EXPECT_EQ(r.outcome, Reservation::Outcome::GlobalQuota);
    EXPECT_EQ(r.global_count, 2);
}

TEST_F(LabRegistryTest, StoppedEntriesFreeTheirSlot) {
    quota.max_per_owner = 1;
    Reservation r = reserve("alice", "dvwa");
    ASSERT_EQ(registry.mark_running(r.name, "172.20.0.2", clock.now()), StoreStatus::Ok);
    ASSERT_EQ(registry.transition(r.name, LabStatus::Running, LabStatus::Stopped), StoreStatus::Ok);
    EXPECT_EQ(reserve("alice", "webgoat").outcome, Reservation::Outcome::Reserved);
}

TEST_F(LabRegistryTest, MarkRunningPromotesOnlyReservations) {
    Reservation r = reserve("alice", "dvwa");
    bool promoted = false;
    ASSERT_EQ(registry.mark_running(r.name, "172.20.0.9", clock.now() + 5, &promoted), StoreStatus::Ok);
    EXPECT_TRUE(promoted);
    auto lab = registry.find(r.name);
    EXPECT_EQ(lab->status, LabStatus::Running);
    EXPECT_EQ(lab->address, "172.20.0.9");
    EXPECT_DOUBLE_EQ(lab->started_at, clock.now() + 5);

    ASSERT_EQ(registry.mark_running("dvwa-ghost-0001", "172.20.0.10", clock.now(), &promoted), StoreStatus::Ok);
    EXPECT_FALSE(promoted);
}

TEST_F(LabRegistryTest, TransitionChecksExpectedState) {
    Reservation r = reserve("alice", "dvwa");
    bool changed = true;
    ASSERT_EQ(registry.transition(r.name, LabStatus::Running, LabStatus::Stopped, &changed), StoreStatus::Ok);
    EXPECT_FALSE(changed);
    EXPECT_EQ(registry.find(r.name)->status, LabStatus::Created);
}

TEST_F(LabRegistryTest, InvalidTransitionIsIgnored) {
    Reservation r = reserve("alice", "dvwa");
    registry.mark_running(r.name, "172.20.0.2", clock.now());
    bool changed = true;
    EXPECT_EQ(registry.transition(r.name, LabStatus::Running, LabStatus::Deleted, &changed), StoreStatus::Ok);
    EXPECT_FALSE(changed);
    EXPECT_TRUE(registry.find(r.name).has_value());
}

TEST_F(LabRegistryTest, DeletedTransitionErasesEntry) {
    Reservation r = reserve("alice", "dvwa");
    registry.mark_running(r.name, "172.20.0.2", clock.now());
    registry.transition(r.name, LabStatus::Running, LabStatus::Stopped);
    ASSERT_EQ(registry.transition(r.name, LabStatus::Stopped, LabStatus::Deleted), StoreStatus::Ok);
    EXPECT_FALSE(registry.find(r.name).has_value());
}

TEST_F(LabRegistryTest, EraseUnchangedSkipsEntriesModifiedSinceSnapshot) {
    Reservation kept = reserve("alice", "dvwa", 1);
    Reservation gone = reserve("bob", "dvwa", 2);
    std::vector<LabInstance> snapshot = registry.list();

    registry.mark_running(kept.name, "172.20.0.2", clock.now());

    std::vector<std::string> erased;
    ASSERT_EQ(registry.erase_unchanged(snapshot, &erased), StoreStatus::Ok);
    ASSERT_EQ(erased.size(), 1u);
    EXPECT_EQ(erased[0], gone.name);
    EXPECT_FALSE(registry.find(gone.name).has_value());
    ASSERT_TRUE(registry.find(kept.name).has_value());
    EXPECT_EQ(registry.find(kept.name)->status, LabStatus::Running);
}

TEST_F(LabRegistryTest, EraseUnchangedKeepsReReservedName) {
    Reservation r = reserve("alice", "dvwa", 5);
    std::vector<LabInstance> snapshot = registry.list();
    registry.erase(r.name);
    clock.advance(10);
    Reservation again = reserve("alice", "dvwa", 5);
    ASSERT_EQ(again.name, r.name);

    std::vector<std::string> erased;
    ASSERT_EQ(registry.erase_unchanged(snapshot, &erased), StoreStatus::Ok);
    EXPECT_TRUE(erased.empty());
    EXPECT_TRUE(registry.find(r.name).has_value());
}

TEST_F(LabRegistryTest, PersistsInSharedFormat) {
    Reservation r = reserve("alice", "dvwa");
    registry.mark_running(r.name, "172.20.0.2", clock.now());

    nlohmann::json doc = nlohmann::json::parse(testutil::read_file(dir.file("data/active_labs.json")));
    const auto& entry = doc[r.name];
    EXPECT_EQ(entry["owner"], "alice");
    EXPECT_EQ(entry["lab_type"], "dvwa");
    EXPECT_EQ(entry["container_name"], r.name);
    EXPECT_EQ(entry["ip_address"], "172.20.0.2");
    EXPECT_EQ(entry["status"], "running");
}

TEST_F(LabRegistryTest, CorruptFileReadsAsEmpty) {
    testutil::write_file(dir.file("data/active_labs.json"), "{ not json");
    EXPECT_TRUE(registry.list().empty());
    EXPECT_NE(testutil::read_file(logger.error_path()).find("PersistenceCorrupt"), std::string::npos);

    // The next write replaces the corrupt document
    EXPECT_EQ(reserve("alice", "dvwa").outcome, Reservation::Outcome::Reserved);
    EXPECT_EQ(registry.list().size(), 1u);
}

TEST_F(LabRegistryTest, MalformedEntriesAreSkipped) {
    testutil::write_file(dir.file("data/active_labs.json"),
                         R"({"bad": {"owner": 5}, "dvwa-bob-0001": {"owner": "bob", "lab_type": "dvwa",
                             "status": "running", "ip_address": "172.20.0.3", "port": 80,
                             "created_at": 1.0, "started_at": 2.0}})");
    auto labs = registry.list();
    ASSERT_EQ(labs.size(), 1u);
    EXPECT_EQ(labs[0].name, "dvwa-bob-0001");
    EXPECT_EQ(labs[0].status, LabStatus::Running);
}
