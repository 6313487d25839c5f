#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

import Core;
import Graphics;
import Runtime.Registry;

#include "TestHelpers.h"

namespace
{
    struct Item
    {
        int Value = 0;
        bool* DisposedFlag = nullptr;

        void Dispose()
        {
            if (DisposedFlag) *DisposedFlag = true;
        }
    };

    std::unique_ptr<Item> MakeItem(int value, bool* disposed = nullptr)
    {
        auto item = std::make_unique<Item>();
        item->Value = value;
        item->DisposedFlag = disposed;
        return item;
    }
}

class RegistryTest : public ::testing::Test
{
protected:
    Runtime::Registry<Item> m_Registry{Graphics::ResourceKind::Geometry};
};

TEST_F(RegistryTest, InsertThenGetReturnsSameEntry)
{
    auto inserted = m_Registry.Insert("a", MakeItem(1));
    ASSERT_TRUE(inserted.has_value());

    EXPECT_EQ(m_Registry.Get("a"), *inserted);
    EXPECT_EQ(m_Registry.Get("a")->Value, 1);
    EXPECT_TRUE(m_Registry.Contains("a"));
}

TEST_F(RegistryTest, DuplicateIdFailsAndKeepsFirstEntry)
{
    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(1)).has_value());

    LogCapture logs;
    auto second = m_Registry.Insert("a", MakeItem(2));
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), Core::ErrorCode::DuplicateId);
    EXPECT_EQ(logs.Errors(), 1u);
    EXPECT_EQ(m_Registry.Get("a")->Value, 1);
    EXPECT_EQ(m_Registry.Size(), 1u);
}

TEST_F(RegistryTest, GetMissingWarnsAndReturnsNull)
{
    LogCapture logs;
    EXPECT_EQ(m_Registry.Get("nope"), nullptr);
    EXPECT_EQ(logs.Warnings(), 1u);

    // TryGet is silent
    EXPECT_EQ(m_Registry.TryGet("nope"), nullptr);
    EXPECT_EQ(logs.Warnings(), 1u);
}

TEST_F(RegistryTest, GetManyIsPositional)
{
    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(1)).has_value());
    ASSERT_TRUE(m_Registry.Insert("c", MakeItem(3)).has_value());

    LogCapture logs;
    auto found = m_Registry.GetMany({"c", "b", "a"});
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0]->Value, 3);
    EXPECT_EQ(found[1], nullptr);
    EXPECT_EQ(found[2]->Value, 1);
    EXPECT_EQ(logs.Warnings(), 1u);
}

TEST_F(RegistryTest, DeleteDisposesAndRemoves)
{
    bool disposed = false;
    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(1, &disposed)).has_value());

    EXPECT_TRUE(m_Registry.Delete("a"));
    EXPECT_TRUE(disposed);
    EXPECT_FALSE(m_Registry.Contains("a"));

    LogCapture logs;
    EXPECT_EQ(m_Registry.Get("a"), nullptr);
    EXPECT_EQ(logs.Warnings(), 1u);
}

TEST_F(RegistryTest, DeleteManyContinuesPastMissing)
{
    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(1)).has_value());
    ASSERT_TRUE(m_Registry.Insert("b", MakeItem(2)).has_value());

    LogCapture logs;
    m_Registry.DeleteMany({"a", "missing", "b"});

    EXPECT_EQ(logs.Warnings(), 1u);
    EXPECT_TRUE(m_Registry.Empty());
}

TEST_F(RegistryTest, HandleGoesStaleAfterDeleteAndSlotReuse)
{
    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(1)).has_value());
    auto handle = m_Registry.GetHandle("a");
    ASSERT_TRUE(handle.IsValid());
    EXPECT_EQ(m_Registry.Resolve(handle)->Value, 1);

    m_Registry.Delete("a");
    EXPECT_EQ(m_Registry.Resolve(handle), nullptr);

    // Same id, recycled slot, new generation
    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(2)).has_value());
    auto fresh = m_Registry.GetHandle("a");
    EXPECT_EQ(fresh.Index, handle.Index);
    EXPECT_NE(fresh.Generation, handle.Generation);
    EXPECT_EQ(m_Registry.Resolve(handle), nullptr);
    EXPECT_EQ(m_Registry.Resolve(fresh)->Value, 2);
}

TEST_F(RegistryTest, GetAllIsSnapshot)
{
    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(1)).has_value());
    ASSERT_TRUE(m_Registry.Insert("b", MakeItem(2)).has_value());

    auto all = m_Registry.GetAll();
    m_Registry.Delete("a");

    EXPECT_EQ(all.size(), 2u);
    EXPECT_TRUE(all.contains("a"));
    EXPECT_EQ(m_Registry.GetAll().size(), 1u);
}

TEST_F(RegistryTest, IterationFollowsInsertionOrder)
{
    ASSERT_TRUE(m_Registry.Insert("z", MakeItem(1)).has_value());
    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(2)).has_value());
    ASSERT_TRUE(m_Registry.Insert("m", MakeItem(3)).has_value());
    m_Registry.Delete("a");
    ASSERT_TRUE(m_Registry.Insert("b", MakeItem(4)).has_value());

    EXPECT_EQ(m_Registry.Ids(), (std::vector<std::string>{"z", "m", "b"}));

    std::vector<int> values;
    m_Registry.ForEach([&](const Item& item) { values.push_back(item.Value); });
    EXPECT_EQ(values, (std::vector<int>{1, 3, 4}));
}

TEST_F(RegistryTest, GeneratedIdsAreUniqueAndNamedAfterKind)
{
    ASSERT_TRUE(m_Registry.Insert("geometry-1", MakeItem(1)).has_value());

    const std::string id = m_Registry.GenerateId();
    EXPECT_NE(id, "geometry-1");
    EXPECT_EQ(id.rfind("geometry-", 0), 0u);
    EXPECT_FALSE(m_Registry.Contains(id));
}

TEST_F(RegistryTest, DisposeHookReceivesKindAndId)
{
    std::vector<std::pair<Graphics::ResourceKind, std::string>> seen;
    m_Registry.SetDisposeHook([&](Graphics::ResourceKind kind, std::string_view id)
    {
        seen.emplace_back(kind, std::string(id));
    });

    ASSERT_TRUE(m_Registry.Insert("a", MakeItem(1)).has_value());
    ASSERT_TRUE(m_Registry.Insert("b", MakeItem(2)).has_value());
    m_Registry.Delete("a");
    m_Registry.Clear();

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, Graphics::ResourceKind::Geometry);
    EXPECT_EQ(seen[0].second, "a");
    EXPECT_EQ(seen[1].second, "b");
}
