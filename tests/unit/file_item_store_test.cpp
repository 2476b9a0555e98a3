#include "store/file_item_store.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace fs = std::filesystem;
using namespace itemvault;
using namespace itemvault::store;

class FileItemStoreTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        const std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        temp_dir = fs::temp_directory_path() / ("itemvault_file_store_test_" + test_name);
        fs::remove_all(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    model::Item sample_item(const std::string &id, const std::string &name = "Widget") {
        return model::make_item(id, {name, "desc"}, model::Timestamp(std::chrono::milliseconds(1704067200000LL)));
    }

    void write_file(const fs::path &path, const std::string &content) {
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }
};

TEST_F(FileItemStoreTest, OpenCreatesDataDirAndStartsEmpty) {
    FileItemStore store(temp_dir / "nested", "items");
    std::string error;

    ASSERT_TRUE(store.open(error)) << error;
    EXPECT_TRUE(fs::is_directory(temp_dir / "nested"));
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.file_path(), temp_dir / "nested" / "items.json");
}

TEST_F(FileItemStoreTest, MutationsSurviveReopen) {
    std::string error;
    {
        FileItemStore store(temp_dir, "items");
        ASSERT_TRUE(store.open(error)) << error;
        ASSERT_TRUE(store.put("a", sample_item("a"), true).ok());
        ASSERT_TRUE(store.put("b", sample_item("b"), true).ok());
        ASSERT_TRUE(store.replace("a", sample_item("a", "renamed")).ok());
        ASSERT_TRUE(store.remove("b").ok());
    }

    FileItemStore reopened(temp_dir, "items");
    ASSERT_TRUE(reopened.open(error)) << error;
    EXPECT_EQ(reopened.size(), 1u);

    auto result = reopened.get("a");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result.item, sample_item("a", "renamed"));
    EXPECT_EQ(reopened.get("b").status, StoreStatus::NOT_FOUND);
}

TEST_F(FileItemStoreTest, TablesAreSeparateFiles) {
    std::string error;
    FileItemStore first(temp_dir, "alpha");
    FileItemStore second(temp_dir, "beta");
    ASSERT_TRUE(first.open(error)) << error;
    ASSERT_TRUE(second.open(error)) << error;

    ASSERT_TRUE(first.put("a", sample_item("a"), true).ok());
    EXPECT_EQ(second.get("a").status, StoreStatus::NOT_FOUND);
    EXPECT_TRUE(fs::exists(temp_dir / "alpha.json"));
    EXPECT_FALSE(fs::exists(temp_dir / "beta.json"));
}

TEST_F(FileItemStoreTest, FileLayoutIsTableDocument) {
    std::string error;
    FileItemStore store(temp_dir, "items");
    ASSERT_TRUE(store.open(error)) << error;
    ASSERT_TRUE(store.put("a", sample_item("a"), true).ok());

    std::ifstream in(temp_dir / "items.json");
    nlohmann::json doc;
    in >> doc;

    EXPECT_EQ(doc["table"], "items");
    ASSERT_TRUE(doc["items"].is_array());
    ASSERT_EQ(doc["items"].size(), 1u);
    EXPECT_EQ(doc["items"][0]["id"], "a");
    EXPECT_EQ(doc["items"][0]["createdAt"], "2024-01-01T00:00:00.000Z");
    EXPECT_FALSE(fs::exists(temp_dir / "items.json.tmp"));
}

TEST_F(FileItemStoreTest, CorruptFileFailsOpen) {
    write_file(temp_dir / "items.json", "{ not json");

    FileItemStore store(temp_dir, "items");
    std::string error;
    EXPECT_FALSE(store.open(error));
    EXPECT_NE(error.find("Corrupt"), std::string::npos);
}

TEST_F(FileItemStoreTest, InvalidItemFailsOpen) {
    write_file(temp_dir / "items.json", R"({"table": "items", "items": [{"id": "a", "name": "Widget"}]})");

    FileItemStore store(temp_dir, "items");
    std::string error;
    EXPECT_FALSE(store.open(error));
    EXPECT_NE(error.find("description"), std::string::npos);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(FileItemStoreTest, DuplicateIdsFailOpen) {
    nlohmann::json item = {{"id", "a"},
                           {"name", "Widget"},
                           {"description", ""},
                           {"createdAt", "2024-01-01T00:00:00.000Z"},
                           {"updatedAt", "2024-01-01T00:00:00.000Z"}};
    nlohmann::json doc = {{"table", "items"}, {"items", {item, item}}};
    write_file(temp_dir / "items.json", doc.dump());

    FileItemStore store(temp_dir, "items");
    std::string error;
    EXPECT_FALSE(store.open(error));
    EXPECT_NE(error.find("Duplicate"), std::string::npos);
}

TEST_F(FileItemStoreTest, UncheckableTablePathFailsOpen) {
    // A symlink pointing at itself cannot be resolved, whatever the permissions
    fs::create_directories(temp_dir);
    fs::create_symlink(temp_dir / "items.json", temp_dir / "items.json");

    FileItemStore store(temp_dir, "items");
    std::string error;
    EXPECT_FALSE(store.open(error));
    EXPECT_NE(error.find("Cannot check table file"), std::string::npos);
    EXPECT_TRUE(fs::is_symlink(temp_dir / "items.json"));
}

TEST_F(FileItemStoreTest, FailedWriteRollsBackAndReportsUnavailable) {
    std::string error;
    FileItemStore store(temp_dir, "items");
    ASSERT_TRUE(store.open(error)) << error;
    ASSERT_TRUE(store.put("a", sample_item("a"), true).ok());

    // A directory squatting on the temp path makes the next write fail
    fs::create_directories(temp_dir / "items.json.tmp");

    auto put = store.put("b", sample_item("b"), true);
    EXPECT_EQ(put.status, StoreStatus::UNAVAILABLE);
    EXPECT_EQ(store.get("b").status, StoreStatus::NOT_FOUND);

    auto replace = store.replace("a", sample_item("a", "renamed"));
    EXPECT_EQ(replace.status, StoreStatus::UNAVAILABLE);
    EXPECT_EQ(store.get("a").item->name, "Widget");

    auto remove = store.remove("a");
    EXPECT_EQ(remove.status, StoreStatus::UNAVAILABLE);
    EXPECT_TRUE(store.get("a").ok());
}

TEST_F(FileItemStoreTest, DescribeNamesFile) {
    FileItemStore store(temp_dir, "items");
    EXPECT_EQ(store.describe(), "file:" + (temp_dir / "items.json").string());
}
