#include <gtest/gtest.h>
#include <vector>

#include <entt/entity/registry.hpp>

import ECS;
import Core;

#include "TestHelpers.h"

namespace Hierarchy = ECS::Components::Hierarchy;

class HierarchyTest : public ::testing::Test
{
protected:
    entt::entity Make()
    {
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Hierarchy::Component>(e);
        return e;
    }

    entt::registry m_Registry;
};

TEST_F(HierarchyTest, ChildrenKeepAppendOrder)
{
    auto parent = Make();
    auto a = Make();
    auto b = Make();
    auto c = Make();

    Hierarchy::Attach(m_Registry, a, parent);
    Hierarchy::Attach(m_Registry, b, parent);
    Hierarchy::Attach(m_Registry, c, parent);

    EXPECT_EQ(Hierarchy::GetChildren(m_Registry, parent), (std::vector<entt::entity>{a, b, c}));
    EXPECT_EQ(Hierarchy::GetChildAt(m_Registry, parent, 1), b);
    EXPECT_EQ(Hierarchy::GetChildAt(m_Registry, parent, 3), entt::null);
    EXPECT_EQ(Hierarchy::GetChildCount(m_Registry, parent), 3u);
}

TEST_F(HierarchyTest, ReattachToSameParentIsNoOp)
{
    auto parent = Make();
    auto a = Make();
    auto b = Make();
    Hierarchy::Attach(m_Registry, a, parent);
    Hierarchy::Attach(m_Registry, b, parent);
    Hierarchy::Attach(m_Registry, a, parent);

    EXPECT_EQ(Hierarchy::GetChildren(m_Registry, parent), (std::vector<entt::entity>{a, b}));
}

TEST_F(HierarchyTest, AttachMovesBetweenParents)
{
    auto p1 = Make();
    auto p2 = Make();
    auto child = Make();

    Hierarchy::Attach(m_Registry, child, p1);
    Hierarchy::Attach(m_Registry, child, p2);

    EXPECT_TRUE(Hierarchy::GetChildren(m_Registry, p1).empty());
    EXPECT_EQ(Hierarchy::GetParent(m_Registry, child), p2);
}

TEST_F(HierarchyTest, DetachMiddleKeepsSiblingsLinked)
{
    auto parent = Make();
    auto a = Make();
    auto b = Make();
    auto c = Make();
    Hierarchy::Attach(m_Registry, a, parent);
    Hierarchy::Attach(m_Registry, b, parent);
    Hierarchy::Attach(m_Registry, c, parent);

    Hierarchy::Detach(m_Registry, b);
    EXPECT_EQ(Hierarchy::GetChildren(m_Registry, parent), (std::vector<entt::entity>{a, c}));

    // Tail bookkeeping: a new child goes after c
    auto d = Make();
    Hierarchy::Attach(m_Registry, d, parent);
    EXPECT_EQ(Hierarchy::GetChildren(m_Registry, parent), (std::vector<entt::entity>{a, c, d}));

    Hierarchy::Detach(m_Registry, d);
    Hierarchy::Attach(m_Registry, b, parent);
    EXPECT_EQ(Hierarchy::GetChildren(m_Registry, parent), (std::vector<entt::entity>{a, c, b}));
}

TEST_F(HierarchyTest, CycleIsRejected)
{
    auto root = Make();
    auto child = Make();
    auto grandChild = Make();
    Hierarchy::Attach(m_Registry, child, root);
    Hierarchy::Attach(m_Registry, grandChild, child);

    LogCapture logs;
    Hierarchy::Attach(m_Registry, root, grandChild);

    EXPECT_EQ(logs.Warnings(), 1u);
    EXPECT_EQ(Hierarchy::GetParent(m_Registry, root), entt::null);
}

TEST_F(HierarchyTest, DetachChildrenLeavesThemAlive)
{
    auto parent = Make();
    auto a = Make();
    auto b = Make();
    Hierarchy::Attach(m_Registry, a, parent);
    Hierarchy::Attach(m_Registry, b, parent);

    Hierarchy::DetachChildren(m_Registry, parent);

    EXPECT_EQ(Hierarchy::GetChildCount(m_Registry, parent), 0u);
    EXPECT_TRUE(m_Registry.valid(a));
    EXPECT_EQ(Hierarchy::GetParent(m_Registry, b), entt::null);
}

TEST_F(HierarchyTest, AttachToNullDetaches)
{
    auto parent = Make();
    auto a = Make();
    Hierarchy::Attach(m_Registry, a, parent);
    Hierarchy::Attach(m_Registry, a, entt::null);
    EXPECT_EQ(Hierarchy::GetParent(m_Registry, a), entt::null);
}
