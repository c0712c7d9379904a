#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/storage/dataset.hpp"

using namespace Trawl::Storage;
namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }
};

TEST_F(StorageTest, DatasetCreation) {
    Dataset dataset("test_storage_out");
    dataset.push_data({{"url", "https://a.example/"}, {"statusCode", 200}});

    EXPECT_TRUE(fs::exists("test_storage_out/datasets/default.jsonl"));
    EXPECT_EQ(dataset.file_path(), fs::path("test_storage_out/datasets/default.jsonl"));

    std::ifstream file("test_storage_out/datasets/default.jsonl");
    std::string   line;
    std::getline(file, line);
    EXPECT_EQ(nlohmann::json::parse(line)["statusCode"], 200);
}

TEST_F(StorageTest, ArrayStoresOneRecordPerItem) {
    Dataset dataset("test_storage_out", "pages");
    dataset.push_data(nlohmann::json::array({{{"n", 1}}, {{"n", 2}}, {{"n", 3}}}));

    EXPECT_EQ(dataset.item_count(), 3);
    auto items = dataset.read_items();
    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(items[2]["n"], 3);
}

TEST_F(StorageTest, RejectsNonObjects) {
    Dataset dataset("test_storage_out");
    EXPECT_THROW(dataset.push_data(42), std::invalid_argument);
    EXPECT_THROW(dataset.push_data(nlohmann::json::array({1, 2})), std::invalid_argument);
}

TEST_F(StorageTest, ReopenCountsExistingItems) {
    {
        Dataset dataset("test_storage_out");
        dataset.push_data({{"a", 1}});
        dataset.push_data({{"b", 2}});
    }
    Dataset reopened("test_storage_out");
    EXPECT_EQ(reopened.item_count(), 2);
    reopened.push_data({{"c", 3}});
    EXPECT_EQ(reopened.read_items().size(), 3);
}

TEST_F(StorageTest, UnicodeContent) {
    Dataset dataset("test_storage_out");
    dataset.push_data({{"title", "Ñandú 🌍"}});
    EXPECT_EQ(dataset.read_items()[0]["title"], "Ñandú 🌍");
}

TEST_F(StorageTest, InvalidUtf8IsReplacedNotRejected) {
    Dataset dataset("test_storage_out");
    dataset.push_data({{"title", std::string("caf\xE9")}, {"n", 1}});
    dataset.push_data({{"title", "fine"}, {"n", 2}});

    auto items = dataset.read_items();
    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(items[0]["title"], "caf\xEF\xBF\xBD");
    EXPECT_EQ(items[1]["n"], 2);
}

TEST_F(StorageTest, MixedArrayWritesNothing) {
    Dataset dataset("test_storage_out");
    EXPECT_THROW(dataset.push_data(nlohmann::json::array({{{"n", 1}}, 2})), std::invalid_argument);
    EXPECT_EQ(dataset.item_count(), 0);
    EXPECT_TRUE(dataset.read_items().empty());
}
