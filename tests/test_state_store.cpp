#include <gtest/gtest.h>
#include "resumable/errors.hpp"
#include "resumable/state_store.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace resumable;

class StateStoreTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_root = fs::absolute(std::string{"tmp_state_store_test_"} + info->name());
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }

    static TransferState pausedAt(std::uint64_t bytes) {
        TransferState state;
        state.total_size = 10485760;
        state.bytes_completed = bytes;
        state.validator = "\"v1\"";
        state.status = TransferStatus::Paused;
        return state;
    }

    void writeRecord(StateStore& store, const std::string& key, const std::string& text) {
        std::ofstream out(store.recordPath(key));
        out << text;
    }
};

TEST_F(StateStoreTest, CreatesDirectory) {
    StateStore store(test_root / "nested" / "state");
    EXPECT_TRUE(fs::is_directory(test_root / "nested" / "state"));
}

TEST_F(StateStoreTest, MissingRecordLoadsNothing) {
    StateStore store(test_root);
    EXPECT_FALSE(store.load("0123456789abcdef").has_value());
}

TEST_F(StateStoreTest, SaveThenLoad) {
    StateStore store(test_root);
    store.save("k1", pausedAt(4194304));

    const auto loaded = store.load("k1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->bytes_completed, 4194304u);
    EXPECT_EQ(loaded->total_size.value_or(0), 10485760u);
    EXPECT_EQ(loaded->validator.value_or(""), "\"v1\"");
    EXPECT_EQ(loaded->status, TransferStatus::Paused);
}

TEST_F(StateStoreTest, UnknownSizeAndValidatorAreKept) {
    StateStore store(test_root);
    TransferState state;
    state.bytes_completed = 512;
    state.status = TransferStatus::InProgress;
    store.save("k1", state);

    const auto loaded = store.load("k1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->total_size.has_value());
    EXPECT_FALSE(loaded->validator.has_value());
    EXPECT_EQ(loaded->status, TransferStatus::InProgress);
}

TEST_F(StateStoreTest, SaveReplacesPreviousRecordWithoutLeftovers) {
    StateStore store(test_root);
    store.save("k1", pausedAt(1024));
    store.save("k1", pausedAt(2048));

    EXPECT_EQ(store.load("k1")->bytes_completed, 2048u);

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(test_root)) {
        names.push_back(entry.path().filename().string());
    }
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "k1.json");
}

TEST_F(StateStoreTest, RemoveDeletesRecord) {
    StateStore store(test_root);
    store.save("k1", pausedAt(1024));
    store.remove("k1");
    EXPECT_FALSE(store.load("k1").has_value());
    EXPECT_FALSE(fs::exists(store.recordPath("k1")));

    EXPECT_NO_THROW(store.remove("k1"));
}

TEST_F(StateStoreTest, CorruptRecordIsIgnored) {
    StateStore store(test_root);
    writeRecord(store, "k1", "{\"format\": 1, \"bytes_completed\": ");
    EXPECT_FALSE(store.load("k1").has_value());

    writeRecord(store, "k2", "{\"format\": 1, \"bytes_completed\": 10, \"status\": \"exploded\", "
                             "\"total_size\": null, \"validator\": null}");
    EXPECT_FALSE(store.load("k2").has_value());
}

TEST_F(StateStoreTest, UnsupportedFormatIsIgnored) {
    StateStore store(test_root);
    writeRecord(store, "k1", "{\"format\": 2, \"bytes_completed\": 10, \"status\": \"paused\", "
                             "\"total_size\": 100, \"validator\": null}");
    EXPECT_FALSE(store.load("k1").has_value());
}

TEST_F(StateStoreTest, RecordClaimingMoreThanTotalIsIgnored) {
    StateStore store(test_root);
    writeRecord(store, "k1", "{\"format\": 1, \"bytes_completed\": 200, \"status\": \"paused\", "
                             "\"total_size\": 100, \"validator\": null}");
    EXPECT_FALSE(store.load("k1").has_value());
}

TEST_F(StateStoreTest, UnknownFieldsAreTolerated) {
    StateStore store(test_root);
    writeRecord(store, "k1", "{\"format\": 1, \"bytes_completed\": 10, \"status\": \"paused\", "
                             "\"total_size\": 100, \"validator\": \"\\\"abc\\\"\", \"note\": \"extra\"}");
    const auto loaded = store.load("k1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->validator.value_or(""), "\"abc\"");
}

TEST_F(StateStoreTest, SaveIntoMissingDirectoryThrowsStorageError) {
    StateStore store(test_root / "state");
    fs::remove_all(test_root / "state");

    try {
        store.save("k1", pausedAt(1));
        FAIL() << "save into a missing directory succeeded";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::Storage);
    }
}

TEST_F(StateStoreTest, ConcurrentSavesToDistinctKeys) {
    StateStore store(test_root);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, t] {
            for (std::uint64_t i = 1; i <= 20; ++i) {
                store.save("key" + std::to_string(t), pausedAt(i * 1024));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < 8; ++t) {
        const auto loaded = store.load("key" + std::to_string(t));
        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ(loaded->bytes_completed, 20u * 1024);
    }
}
