#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "FileLock.h"
#include "JsonStore.h"
#include "Logger.h"
#include "TestUtil.h"

using json = nlohmann::json;

class JsonStoreTest : public ::testing::Test {
protected:
    testutil::TempDir dir;
    Logger logger{dir.path() + "/logs"};
};

TEST_F(JsonStoreTest, MissingFileReadsAsEmptyObject) {
    JsonStore store(dir.file("data/none.json"), logger);
    json doc = store.load();
    EXPECT_TRUE(doc.is_object());
    EXPECT_TRUE(doc.empty());
}

TEST_F(JsonStoreTest, NonObjectDocumentReadsAsEmpty) {
    testutil::write_file(dir.file("list.json"), "[1, 2, 3]");
    JsonStore store(dir.file("list.json"), logger);
    EXPECT_TRUE(store.load().empty());
    EXPECT_NE(testutil::read_file(logger.error_path()).find("PersistenceCorrupt"), std::string::npos);
}

TEST_F(JsonStoreTest, UpdateSkipsWriteWhenMutatorDeclines) {
    JsonStore store(dir.file("skip.json"), logger);
    EXPECT_EQ(store.update([](json& doc) { doc["x"] = 1; return false; }), StoreStatus::Ok);
    EXPECT_FALSE(std::filesystem::exists(dir.file("skip.json")));
}

TEST_F(JsonStoreTest, ConcurrentUpdatesAreNotLost) {
    JsonStore store(dir.file("counter.json"), logger);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&store]() {
            for (int i = 0; i < 25; ++i) {
                store.update([](json& doc) {
                    doc["n"] = doc.value("n", 0) + 1;
                    return true;
                });
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(store.load()["n"], 100);
}

TEST_F(JsonStoreTest, HeldLockTimesOutUpdate) {
    std::string path = dir.file("busy.json");
    JsonStore store(path, logger, std::chrono::milliseconds(100));
    auto held = FileLock::acquire(path + ".lock", std::chrono::milliseconds(100));
    ASSERT_TRUE(held.has_value());

    EXPECT_EQ(store.update([](json& doc) { doc["x"] = 1; return true; }), StoreStatus::LockTimeout);

    held->release();
    EXPECT_EQ(store.update([](json& doc) { doc["x"] = 1; return true; }), StoreStatus::Ok);
}

TEST_F(JsonStoreTest, InvalidUtf8IsStoredReplaced) {
    JsonStore store(dir.file("utf.json"), logger);
    ASSERT_EQ(store.update([](json& doc) { doc["name"] = std::string("bad\xff" "byte"); return true; }),
              StoreStatus::Ok);
    EXPECT_TRUE(store.load().contains("name"));
}

TEST(LockFileNameTest, EncodesUnsafeCharacters) {
    EXPECT_EQ(lock_file_name("owner", "alice"), "owner-alice.lock");
    EXPECT_EQ(lock_file_name("owner", "../x y"), "owner-%2E%2E%2Fx%20y.lock");
}
