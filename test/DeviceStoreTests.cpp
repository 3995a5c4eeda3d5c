#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <type_traits>
#include "STS/DeviceStore.hpp"
#include "STS/Helpers.h"

using namespace STS;

namespace {

InventoryRecord makeRecord(const std::string& deviceId, const std::string& ip, const std::string& name,
                           const std::string& lastSeen, const std::string& mac = "") {
    InventoryRecord record;
    record.deviceId = deviceId;
    record.ip = ip;
    record.name = name;
    record.model = "SoundTouch 20";
    record.macAddress = mac.empty() ? deviceId : mac;
    record.firmwareVersion = "28.0.3.46454";
    record.schemaVersion = "28.0.3";
    record.lastSeen = *Helpers::parseIso8601(lastSeen);
    return record;
}

} // namespace

// Runs the shared contract against both implementations.
template <typename Store>
class DeviceStoreContractTest : public ::testing::Test {
protected:
    void SetUp() override {
        if constexpr (std::is_same_v<Store, JsonFileDeviceStore>) {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            // Typed suite names contain '/'.
            std::string fileName = std::string("sts-store-") + info->test_suite_name() + "-" + info->name() + ".json";
            std::replace(fileName.begin(), fileName.end(), '/', '_');
            path_ = std::filesystem::temp_directory_path() / fileName;
            std::filesystem::remove(path_);
            auto store = std::make_unique<JsonFileDeviceStore>(path_);
            ASSERT_TRUE(store->open().has_value());
            store_ = std::move(store);
        } else {
            store_ = std::make_unique<InMemoryDeviceStore>();
        }
    }

    void TearDown() override {
        if (!path_.empty()) {
            std::filesystem::remove(path_);
        }
    }

    std::filesystem::path path_;
    std::unique_ptr<IDeviceStore> store_;
};

using StoreTypes = ::testing::Types<InMemoryDeviceStore, JsonFileDeviceStore>;
TYPED_TEST_SUITE(DeviceStoreContractTest, StoreTypes);

TYPED_TEST(DeviceStoreContractTest, InsertAssignsIds) {
    auto first = this->store_->upsert(makeRecord("A", "10.0.0.1", "Kitchen", "2024-01-01T00:00:00Z"));
    auto second = this->store_->upsert(makeRecord("B", "10.0.0.2", "Den", "2024-01-01T00:00:00Z"));

    ASSERT_TRUE(first && second);
    ASSERT_TRUE(first->id && second->id);
    EXPECT_NE(*first->id, *second->id);
    EXPECT_EQ(this->store_->getAll().size(), 2u);
}

TYPED_TEST(DeviceStoreContractTest, UpsertUpdatesInPlace) {
    auto inserted = this->store_->upsert(makeRecord("A", "10.0.0.1", "Kitchen", "2024-01-01T00:00:00Z", "MAC-1"));
    ASSERT_TRUE(inserted.has_value());

    auto updated = this->store_->upsert(makeRecord("A", "10.0.0.9", "Kitchen 2", "2024-01-02T00:00:00Z", "MAC-2"));

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->id, inserted->id);
    EXPECT_EQ(updated->ip, "10.0.0.9");
    EXPECT_EQ(updated->name, "Kitchen 2");
    EXPECT_EQ(updated->macAddress, "MAC-1");
    EXPECT_EQ(this->store_->getAll().size(), 1u);

    auto fetched = this->store_->getByDeviceId("A");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->ip, "10.0.0.9");
}

TYPED_TEST(DeviceStoreContractTest, GetAllIsMostRecentFirst) {
    ASSERT_TRUE(this->store_->upsert(makeRecord("old", "10.0.0.1", "Old", "2023-06-01T00:00:00Z")));
    ASSERT_TRUE(this->store_->upsert(makeRecord("new", "10.0.0.2", "New", "2024-06-01T00:00:00Z")));
    ASSERT_TRUE(this->store_->upsert(makeRecord("mid", "10.0.0.3", "Mid", "2024-01-01T00:00:00Z")));

    auto all = this->store_->getAll();

    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].deviceId, "new");
    EXPECT_EQ(all[1].deviceId, "mid");
    EXPECT_EQ(all[2].deviceId, "old");
}

TYPED_TEST(DeviceStoreContractTest, UnknownDeviceIsAbsent) {
    EXPECT_FALSE(this->store_->getByDeviceId("nope").has_value());
}

TYPED_TEST(DeviceStoreContractTest, EmptyDeviceIdIsRejected) {
    auto result = this->store_->upsert(makeRecord("", "10.0.0.1", "X", "2024-01-01T00:00:00Z", "M"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), DeviceError::MissingDeviceId);
}

TYPED_TEST(DeviceStoreContractTest, DeleteAllReturnsCount) {
    ASSERT_TRUE(this->store_->upsert(makeRecord("A", "10.0.0.1", "A", "2024-01-01T00:00:00Z")));
    ASSERT_TRUE(this->store_->upsert(makeRecord("B", "10.0.0.2", "B", "2024-01-01T00:00:00Z")));

    auto removed = this->store_->deleteAll();

    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 2u);
    EXPECT_TRUE(this->store_->getAll().empty());
}

TYPED_TEST(DeviceStoreContractTest, ConcurrentUpsertsOfOneDeviceKeepOneRecord) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, i]() {
            auto result = this->store_->upsert(makeRecord("A", "10.0.0." + std::to_string(i), "A",
                                                          "2024-01-01T00:00:00Z"));
            EXPECT_TRUE(result.has_value());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(this->store_->getAll().size(), 1u);
}

// ---------------------------------------------------------------------------
// JsonFileDeviceStore specifics
// ---------------------------------------------------------------------------

class JsonFileDeviceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() / (std::string("sts-json-store-") + info->name() + ".json");
        std::filesystem::remove(path_);
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        auto tmp = path_;
        tmp += ".tmp";
        std::filesystem::remove(tmp);
    }

    std::filesystem::path path_;
};

TEST_F(JsonFileDeviceStoreTest, ReloadKeepsRecordsAndIds) {
    {
        JsonFileDeviceStore store(path_);
        ASSERT_TRUE(store.open().has_value());
        ASSERT_TRUE(store.upsert(makeRecord("A", "10.0.0.1", "Kitchen", "2024-01-01T00:00:00Z")));
        ASSERT_TRUE(store.upsert(makeRecord("B", "10.0.0.2", "Den", "2024-01-02T00:00:00Z")));
    }

    JsonFileDeviceStore reopened(path_);
    ASSERT_TRUE(reopened.open().has_value());
    auto a = reopened.getByDeviceId("A");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->id, 1);
    EXPECT_EQ(a->name, "Kitchen");

    auto c = reopened.upsert(makeRecord("C", "10.0.0.3", "Bath", "2024-01-03T00:00:00Z"));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->id, 3);
}

TEST_F(JsonFileDeviceStoreTest, IdsAreNotReusedAfterClear) {
    JsonFileDeviceStore store(path_);
    ASSERT_TRUE(store.open().has_value());
    ASSERT_TRUE(store.upsert(makeRecord("A", "10.0.0.1", "Kitchen", "2024-01-01T00:00:00Z")));
    ASSERT_TRUE(store.deleteAll().has_value());

    auto again = store.upsert(makeRecord("A", "10.0.0.1", "Kitchen", "2024-01-01T00:00:00Z"));

    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->id, 2);
}

TEST_F(JsonFileDeviceStoreTest, CorruptFileFailsToOpen) {
    {
        std::ofstream out(path_);
        out << "{ this is not json";
    }

    JsonFileDeviceStore store(path_);
    auto opened = store.open();

    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), DeviceError::StorageFailed);
}

TEST_F(JsonFileDeviceStoreTest, WrongShapeFailsToOpen) {
    {
        std::ofstream out(path_);
        out << R"({"nextId": 1, "devices": [{"name": "no id"}]})";
    }

    JsonFileDeviceStore store(path_);

    EXPECT_EQ(store.open().error(), DeviceError::StorageFailed);
}
