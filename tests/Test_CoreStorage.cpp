#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

import Core;

#include "TestHelpers.h"

namespace
{
    std::filesystem::path MakeTempPath(const std::string& name)
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        return std::filesystem::temp_directory_path() / (name + "_" + std::to_string(stamp) + ".json");
    }
}

TEST(KeyValueStore, InMemory_SetGetRemove)
{
    Core::Storage::KeyValueStore store;
    EXPECT_FALSE(store.IsPersistent());
    EXPECT_FALSE(store.GetItem("missing").has_value());

    ASSERT_TRUE(store.SetItem("loop", {{"maxFPS", 30}}).has_value());
    ASSERT_TRUE(store.Contains("loop"));
    EXPECT_EQ((*store.GetItem("loop"))["maxFPS"].get<int>(), 30);

    ASSERT_TRUE(store.RemoveItem("loop").has_value());
    EXPECT_FALSE(store.Contains("loop"));
    EXPECT_EQ(store.Size(), 0u);
}

TEST(KeyValueStore, RemoveUnknownKeyIsOk)
{
    Core::Storage::KeyValueStore store;
    EXPECT_TRUE(store.RemoveItem("nothing").has_value());
}

TEST(KeyValueStore, File_WriteThroughAndReload)
{
    const auto path = MakeTempPath("hearth_store");
    {
        Core::Storage::KeyValueStore store(path);
        EXPECT_TRUE(store.IsPersistent());
        EXPECT_EQ(store.Size(), 0u); // Missing file = empty store
        ASSERT_TRUE(store.SetItem("hearth.loop", {{"masterPlay", false}, {"appPlay", true}}).has_value());
    }

    ASSERT_TRUE(std::filesystem::exists(path));

    Core::Storage::KeyValueStore reopened(path);
    auto item = reopened.GetItem("hearth.loop");
    ASSERT_TRUE(item.has_value());
    EXPECT_FALSE((*item)["masterPlay"].get<bool>());
    EXPECT_TRUE((*item)["appPlay"].get<bool>());

    std::filesystem::remove(path);
}

TEST(KeyValueStore, File_MalformedStartsEmptyWithWarning)
{
    const auto path = MakeTempPath("hearth_store_bad");
    {
        std::ofstream out(path);
        out << "{ this is not json";
    }

    LogCapture logs;
    Core::Storage::KeyValueStore store(path);
    EXPECT_EQ(store.Size(), 0u);
    EXPECT_EQ(logs.Warnings(), 1u);

    std::filesystem::remove(path);
}

TEST(KeyValueStore, File_NonObjectRootIsRejected)
{
    const auto path = MakeTempPath("hearth_store_array");
    {
        std::ofstream out(path);
        out << "[1, 2, 3]";
    }

    LogCapture logs;
    Core::Storage::KeyValueStore store(path);
    EXPECT_EQ(store.Size(), 0u);
    EXPECT_EQ(logs.Warnings(), 1u);

    std::filesystem::remove(path);
}

TEST(KeyValueStore, File_UnwritablePathReportsWriteError)
{
    const auto path = std::filesystem::temp_directory_path() / "hearth_no_such_dir" / "nested" / "store.json";
    Core::Storage::KeyValueStore store(path);

    LogCapture logs;
    auto result = store.SetItem("key", 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::FileWriteError);
    EXPECT_EQ(logs.Errors(), 1u);

    // The in-memory value is kept
    EXPECT_TRUE(store.Contains("key"));
}
