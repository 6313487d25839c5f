module;
#include <cstddef>
#include <cstdint>
#include <vector>
#include <entt/entity/registry.hpp>

export module ECS:Components.Hierarchy;

export namespace ECS::Components::Hierarchy
{
    // Intrusive doubly linked child list. Children are appended at the tail so
    // iteration order is attachment order.
    struct Component
    {
        entt::entity Parent = entt::null;
        entt::entity FirstChild = entt::null;
        entt::entity LastChild = entt::null;
        entt::entity NextSibling = entt::null;
        entt::entity PrevSibling = entt::null;
        uint32_t ChildCount = 0;
    };

    // Appends 'child' to 'newParent'. A child has at most one parent: an
    // attached child is detached from its old parent first. Attaching to the
    // current parent again is a no-op. Passing entt::null detaches.
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent);
    void Detach(entt::registry& registry, entt::entity child);

    // Detaches every child of 'parent' (children keep living, parentless).
    void DetachChildren(entt::registry& registry, entt::entity parent);

    [[nodiscard]] entt::entity GetParent(const entt::registry& registry, entt::entity entity);
    [[nodiscard]] std::vector<entt::entity> GetChildren(const entt::registry& registry, entt::entity parent);
    [[nodiscard]] entt::entity GetChildAt(const entt::registry& registry, entt::entity parent, size_t index);
    [[nodiscard]] uint32_t GetChildCount(const entt::registry& registry, entt::entity parent);
}
