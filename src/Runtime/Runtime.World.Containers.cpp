module;

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <entt/entity/registry.hpp>

module Runtime.World;

import Core;
import Graphics;
import ECS;

namespace Runtime
{
    using NodeKind = ECS::Components::SceneNode::Kind;
    using NodeInfo = ECS::Components::SceneNode::Component;
    namespace Hierarchy = ECS::Components::Hierarchy;

    namespace
    {
        template <class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };

        void AttachChild(entt::registry& tree, entt::entity root, entt::entity container,
                         entt::entity child, std::string_view containerId)
        {
            if (!tree.valid(child) || !tree.all_of<NodeInfo>(child))
            {
                Core::Log::Warn("Cannot add an invalid node to '{}'", containerId);
                return;
            }
            if (child == root)
            {
                Core::Log::Warn("Cannot add the root node to '{}'", containerId);
                return;
            }
            Hierarchy::Attach(tree, child, container);
        }

        void CollectDescendants(const entt::registry& tree, entt::entity node, std::vector<entt::entity>& out)
        {
            for (entt::entity child : Hierarchy::GetChildren(tree, node))
            {
                out.push_back(child);
                CollectDescendants(tree, child, out);
            }
        }
    }

    // -------------------------------------------------------------------------
    // Tree queries
    // -------------------------------------------------------------------------

    std::vector<entt::entity> World::GetChildren(entt::entity node) const
    {
        if (!m_Tree.valid(node)) return {};
        return Hierarchy::GetChildren(m_Tree, node);
    }

    std::vector<std::string> World::GetChildIds(entt::entity node) const
    {
        std::vector<std::string> ids;
        for (entt::entity child : GetChildren(node))
        {
            if (const auto* info = m_Tree.try_get<NodeInfo>(child)) ids.push_back(info->Id);
        }
        return ids;
    }

    entt::entity World::GetParent(entt::entity node) const
    {
        if (!m_Tree.valid(node)) return entt::null;
        return Hierarchy::GetParent(m_Tree, node);
    }

    const NodeInfo* World::GetNodeInfo(entt::entity node) const
    {
        if (!m_Tree.valid(node)) return nullptr;
        return m_Tree.try_get<NodeInfo>(node);
    }

    // -------------------------------------------------------------------------
    // Add
    // -------------------------------------------------------------------------

    Graphics::Group* World::AddToGroup(std::string_view groupId, entt::entity child)
    {
        return AddToGroup(groupId, std::vector<entt::entity>{child});
    }

    Graphics::Group* World::AddToGroup(std::string_view groupId, const std::vector<entt::entity>& children)
    {
        Graphics::Group* group = m_Groups.Get(groupId);
        if (!group) return nullptr;

        for (entt::entity child : children)
        {
            if (child == group->Node)
            {
                Core::Log::Warn("Cannot add group '{}' to itself", groupId);
                continue;
            }
            AttachChild(m_Tree, m_Root, group->Node, child, groupId);
        }
        return group;
    }

    Graphics::Scene* World::AddToScene(std::string_view sceneId, entt::entity child)
    {
        return AddToScene(sceneId, std::vector<entt::entity>{child});
    }

    Graphics::Scene* World::AddToScene(std::string_view sceneId, const std::vector<entt::entity>& children)
    {
        Graphics::Scene* scene = m_Scenes.Get(sceneId);
        if (!scene) return nullptr;

        for (entt::entity child : children)
        {
            if (child == scene->Node)
            {
                Core::Log::Warn("Cannot add scene '{}' to itself", sceneId);
                continue;
            }
            AttachChild(m_Tree, m_Root, scene->Node, child, sceneId);
        }
        return scene;
    }

    // -------------------------------------------------------------------------
    // Remove
    // -------------------------------------------------------------------------

    void World::RemoveChildren(entt::entity container, std::string_view containerId,
                               const ChildSelector& selector, const CascadeOptions& options)
    {
        std::vector<entt::entity> targets;

        auto byId = [&](const std::string& id)
        {
            for (entt::entity child : Hierarchy::GetChildren(m_Tree, container))
            {
                const auto* info = m_Tree.try_get<NodeInfo>(child);
                if (info && info->Id == id)
                {
                    targets.push_back(child);
                    return;
                }
            }
            Core::Log::Warn("Could not find child with id '{}' in '{}'", id, containerId);
        };

        auto byIndex = [&](size_t index)
        {
            const entt::entity child = Hierarchy::GetChildAt(m_Tree, container, index);
            if (child == entt::null)
            {
                Core::Log::Warn("No child at index {} in '{}' ({} children)", index, containerId,
                                Hierarchy::GetChildCount(m_Tree, container));
                return;
            }
            targets.push_back(child);
        };

        // Resolve everything first so indices refer to positions before any removal
        std::visit(Overloaded{
            [&](const std::string& id) { byId(id); },
            [&](size_t index) { byIndex(index); },
            [&](const std::vector<std::string>& ids) { for (const auto& id : ids) byId(id); },
            [&](const std::vector<size_t>& indices) { for (size_t index : indices) byIndex(index); }
        }, selector);

        std::vector<entt::entity> done;
        for (entt::entity target : targets)
        {
            if (std::find(done.begin(), done.end(), target) != done.end()) continue;
            done.push_back(target);

            const NodeInfo info = m_Tree.get<NodeInfo>(target);
            Hierarchy::Detach(m_Tree, target);

            if (info.NodeKind == NodeKind::Mesh && options.DeleteMeshes)
                DeleteMesh(info.Id, options);
        }
    }

    Graphics::Group* World::RemoveFromGroup(std::string_view groupId, const ChildSelector& selector, const CascadeOptions& options)
    {
        Graphics::Group* group = m_Groups.Get(groupId);
        if (!group) return nullptr;

        RemoveChildren(group->Node, groupId, selector, options);
        return group;
    }

    Graphics::Scene* World::RemoveFromScene(std::string_view sceneId, const ChildSelector& selector, const CascadeOptions& options)
    {
        Graphics::Scene* scene = m_Scenes.Get(sceneId);
        if (!scene) return nullptr;

        RemoveChildren(scene->Node, sceneId, selector, options);
        return scene;
    }

    // -------------------------------------------------------------------------
    // Delete containers
    // -------------------------------------------------------------------------

    void World::DeleteGroup(std::string_view id, const CascadeOptions& options)
    {
        Graphics::Group* group = m_Groups.TryGet(id);
        if (!group) return;

        const entt::entity node = group->Node;
        if (options.Meshes())
        {
            std::vector<std::string> meshIds;
            for (entt::entity child : Hierarchy::GetChildren(m_Tree, node))
            {
                const auto& info = m_Tree.get<NodeInfo>(child);
                if (info.NodeKind == NodeKind::Mesh) meshIds.push_back(info.Id);
            }
            for (const auto& meshId : meshIds)
            {
                if (m_Meshes.Contains(meshId)) DeleteMesh(meshId, options);
            }
        }

        // Remaining children are detached and stay in their registries
        DestroyNode(node);
        m_Groups.Delete(id);
    }

    void World::DeleteGroups(const std::vector<std::string>& ids, const CascadeOptions& options)
    {
        for (const auto& id : ids) DeleteGroup(id, options);
    }

    void World::DeleteScene(std::string_view id, const CascadeOptions& options)
    {
        Graphics::Scene* scene = m_Scenes.TryGet(id);
        if (!scene) return;

        std::vector<entt::entity> descendants;
        CollectDescendants(m_Tree, scene->Node, descendants);

        std::vector<std::pair<NodeKind, std::string>> nodes;
        nodes.reserve(descendants.size());
        for (entt::entity node : descendants)
        {
            const auto& info = m_Tree.get<NodeInfo>(node);
            nodes.emplace_back(info.NodeKind, info.Id);
        }

        for (const auto& [kind, nodeId] : nodes)
        {
            switch (kind)
            {
                case NodeKind::Mesh:
                    if (!m_Meshes.Contains(nodeId)) break;
                    if (options.Meshes())
                    {
                        DeleteMesh(nodeId, options);
                    }
                    else if (options.Geometries() || options.Materials())
                    {
                        // The mesh stays, its sub-resources go
                        DeleteMeshReferences(*m_Meshes.TryGet(nodeId), options);
                    }
                    break;
                case NodeKind::Light:
                    if (options.Lights() && m_Lights.Contains(nodeId)) DeleteLight(nodeId);
                    break;
                case NodeKind::Group:
                    if (options.Groups()) DeleteGroup(nodeId, options);
                    break;
                default:
                    break;
            }
        }

        if (options.Textures())
        {
            if (const std::string* textureId = scene->GetBackgroundTextureId())
            {
                const std::string backgroundId = *textureId;
                if (m_Textures.Contains(backgroundId)) DeleteTexture(backgroundId);
            }
        }

        // Loopers and resizers are owned by the scene and go with it
        DestroyNode(scene->Node);
        m_Scenes.Delete(id);
    }

    void World::DeleteScenes(const std::vector<std::string>& ids, const CascadeOptions& options)
    {
        for (const auto& id : ids) DeleteScene(id, options);
    }
}
