module;

#include <cstddef>
#include <cstdint>
#include <vector>
#include <entt/entity/registry.hpp>

module ECS:Components.Hierarchy.Impl;
import :Components.Hierarchy;
import Core;

namespace ECS::Components::Hierarchy::Detail
{
    using namespace ECS::Components::Hierarchy;

    // Returns true if 'potentialAncestor' is actually a child/grandchild of 'entity'
    bool IsDescendant(const entt::registry& registry, entt::entity entity, entt::entity potentialAncestor)
    {
        entt::entity current = potentialAncestor;
        while (current != entt::null && registry.valid(current))
        {
            if (current == entity) return true;

            // Walk up
            if (auto* comp = registry.try_get<Component>(current))
            {
                current = comp->Parent;
            }
            else
            {
                break; // Root reached
            }
        }
        return false;
    }

    void AppendHelper(entt::registry& registry, entt::entity child, Component& childComp,
                      entt::entity parent, Component& parentComp)
    {
        // 1. Set Parent
        childComp.Parent = parent;

        // 2. Insert at Tail of Parent's list
        childComp.PrevSibling = parentComp.LastChild;
        childComp.NextSibling = entt::null;

        if (parentComp.LastChild != entt::null)
        {
            auto& oldTail = registry.get<Component>(parentComp.LastChild);
            oldTail.NextSibling = child;
        }
        else
        {
            parentComp.FirstChild = child;
        }

        parentComp.LastChild = child;
        parentComp.ChildCount++;
    }

    void DetachHelper(entt::registry& registry, Component& childComp)
    {
        auto& parentComp = registry.get<Component>(childComp.Parent);

        // 1. Fix Previous Sibling or Parent Head
        if (childComp.PrevSibling != entt::null)
        {
            registry.get<Component>(childComp.PrevSibling).NextSibling = childComp.NextSibling;
        }
        else
        {
            parentComp.FirstChild = childComp.NextSibling;
        }

        // 2. Fix Next Sibling or Parent Tail
        if (childComp.NextSibling != entt::null)
        {
            registry.get<Component>(childComp.NextSibling).PrevSibling = childComp.PrevSibling;
        }
        else
        {
            parentComp.LastChild = childComp.PrevSibling;
        }

        // 3. Update Parent Data
        parentComp.ChildCount--;

        // 4. Clear Child Data
        childComp.Parent = entt::null;
        childComp.NextSibling = entt::null;
        childComp.PrevSibling = entt::null;
    }
}

namespace ECS::Components::Hierarchy
{
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent)
    {
        if (!registry.valid(child) || child == newParent) return;

        auto& childComp = registry.get_or_emplace<Component>(child);

        // 1. Handle Detachment / Null Parent
        if (newParent == entt::null)
        {
            Detach(registry, child);
            return;
        }

        if (!registry.valid(newParent))
        {
            Core::Log::Warn("Hierarchy::Attach -- parent entity {} is not alive", static_cast<uint32_t>(newParent));
            return;
        }

        // 2. Already a child of this parent: the tree de-duplicates by identity.
        if (childComp.Parent == newParent) return;

        // 3. Cycle Detection
        if (Detail::IsDescendant(registry, child, newParent))
        {
            Core::Log::Warn("Hierarchy::Attach -- cycle detected: cannot attach entity {} to its own descendant {}",
                            static_cast<uint32_t>(child), static_cast<uint32_t>(newParent));
            return;
        }

        // 4. If attached to someone else, detach first
        if (childComp.Parent != entt::null)
        {
            Detail::DetachHelper(registry, childComp);
        }

        // get_or_emplace may relocate storage; re-fetch the child afterwards.
        auto& parentComp = registry.get_or_emplace<Component>(newParent);
        auto& freshChildComp = registry.get<Component>(child);
        Detail::AppendHelper(registry, child, freshChildComp, newParent, parentComp);
    }

    void Detach(entt::registry& registry, entt::entity child)
    {
        if (!registry.valid(child)) return;

        // Use try_get. If it doesn't have a component, it's effectively detached.
        auto* childComp = registry.try_get<Component>(child);
        if (childComp && childComp->Parent != entt::null)
        {
            Detail::DetachHelper(registry, *childComp);
        }
    }

    void DetachChildren(entt::registry& registry, entt::entity parent)
    {
        for (entt::entity child : GetChildren(registry, parent))
        {
            Detach(registry, child);
        }
    }

    entt::entity GetParent(const entt::registry& registry, entt::entity entity)
    {
        if (!registry.valid(entity)) return entt::null;
        const auto* comp = registry.try_get<Component>(entity);
        return comp ? comp->Parent : entt::null;
    }

    std::vector<entt::entity> GetChildren(const entt::registry& registry, entt::entity parent)
    {
        std::vector<entt::entity> children;
        if (!registry.valid(parent)) return children;

        const auto* parentComp = registry.try_get<Component>(parent);
        if (!parentComp) return children;

        children.reserve(parentComp->ChildCount);
        for (entt::entity e = parentComp->FirstChild; e != entt::null;
             e = registry.get<Component>(e).NextSibling)
        {
            children.push_back(e);
        }
        return children;
    }

    entt::entity GetChildAt(const entt::registry& registry, entt::entity parent, size_t index)
    {
        if (!registry.valid(parent)) return entt::null;

        const auto* parentComp = registry.try_get<Component>(parent);
        if (!parentComp || index >= parentComp->ChildCount) return entt::null;

        entt::entity e = parentComp->FirstChild;
        for (size_t i = 0; i < index; ++i)
        {
            e = registry.get<Component>(e).NextSibling;
        }
        return e;
    }

    uint32_t GetChildCount(const entt::registry& registry, entt::entity parent)
    {
        if (!registry.valid(parent)) return 0;
        const auto* comp = registry.try_get<Component>(parent);
        return comp ? comp->ChildCount : 0u;
    }
}
