module;

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
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
import Runtime.Registry;

namespace Runtime
{
    using NodeKind = ECS::Components::SceneNode::Kind;

    World::World()
    {
        m_Root = CreateNode("root", NodeKind::Root);
    }

    World::~World()
    {
        Clear();
        DisconnectGpuHooks();
    }

    // -------------------------------------------------------------------------
    // Render tree nodes
    // -------------------------------------------------------------------------

    entt::entity World::CreateNode(const std::string& id, NodeKind kind)
    {
        entt::entity node = m_Tree.create();
        m_Tree.emplace<ECS::Components::SceneNode::Component>(node, id, kind);
        m_Tree.emplace<ECS::Components::Hierarchy::Component>(node);
        return node;
    }

    void World::DestroyNode(entt::entity node)
    {
        if (!m_Tree.valid(node)) return;
        ECS::Components::Hierarchy::DetachChildren(m_Tree, node);
        ECS::Components::Hierarchy::Detach(m_Tree, node);
        m_Tree.destroy(node);
    }

    template <typename T>
    Core::Expected<std::string> World::ResolveNewId(Registry<T>& registry, const std::optional<std::string>& id)
    {
        if (!id || id->empty()) return registry.GenerateId();

        if (registry.Contains(*id))
        {
            Core::Log::Error("A {} with id '{}' already exists", Graphics::ResourceKindToString(registry.GetKind()), *id);
            return Core::Err<std::string>(Core::ErrorCode::DuplicateId);
        }
        return *id;
    }

    // -------------------------------------------------------------------------
    // Cameras
    // -------------------------------------------------------------------------

    Core::Expected<Graphics::Camera*> World::CreateCamera(std::optional<std::string> id, const Graphics::CameraParams& params)
    {
        auto resolved = ResolveNewId(m_Cameras, id);
        if (!resolved) return Core::Err<Graphics::Camera*>(resolved.error());

        auto camera = std::make_unique<Graphics::Camera>();
        camera->Id = *resolved;
        camera->Fov = params.Fov;
        camera->Near = params.Near;
        camera->Far = params.Far;
        camera->AspectRatio = params.AspectRatio.value_or(m_Viewport.Aspect());
        camera->Position = params.Position;
        camera->Target = params.Target;
        Graphics::UpdateProjection(*camera);

        const entt::entity node = CreateNode(*resolved, NodeKind::Camera);
        camera->Node = node;

        auto inserted = m_Cameras.Insert(*resolved, std::move(camera));
        if (!inserted)
        {
            DestroyNode(node);
            return inserted;
        }

        if (params.MakeCurrent) SetCurrentCamera(*resolved);
        return inserted;
    }

    void World::DeleteCamera(std::string_view id)
    {
        Graphics::Camera* camera = m_Cameras.Get(id);
        if (!camera) return;

        DestroyNode(camera->Node);
        m_Cameras.Delete(id);
    }

    void World::DeleteCameras(const std::vector<std::string>& ids)
    {
        for (const auto& id : ids) DeleteCamera(id);
    }

    // -------------------------------------------------------------------------
    // Scenes / Groups (deletion lives with the container code)
    // -------------------------------------------------------------------------

    Core::Expected<Graphics::Scene*> World::CreateScene(std::optional<std::string> id, Graphics::SceneOptions options)
    {
        auto resolved = ResolveNewId(m_Scenes, id);
        if (!resolved) return Core::Err<Graphics::Scene*>(resolved.error());

        auto scene = std::make_unique<Graphics::Scene>();
        scene->Id = *resolved;
        scene->Name = options.Name.empty() ? *resolved : std::move(options.Name);
        scene->Background = std::move(options.Background);
        scene->MainLoopers = std::move(options.MainLoopers);
        scene->MainLateLoopers = std::move(options.MainLateLoopers);
        scene->AppLoopers = std::move(options.AppLoopers);

        const entt::entity node = CreateNode(*resolved, NodeKind::Scene);
        scene->Node = node;

        auto inserted = m_Scenes.Insert(*resolved, std::move(scene));
        if (!inserted)
        {
            DestroyNode(node);
            return inserted;
        }

        if (options.MakeCurrent || m_CurrentScene.Id.empty()) SetCurrentScene(*resolved);
        return inserted;
    }

    Core::Expected<Graphics::Group*> World::CreateGroup(std::optional<std::string> id, const std::vector<entt::entity>& children)
    {
        auto resolved = ResolveNewId(m_Groups, id);
        if (!resolved) return Core::Err<Graphics::Group*>(resolved.error());

        auto group = std::make_unique<Graphics::Group>();
        group->Id = *resolved;
        group->Name = *resolved;

        const entt::entity node = CreateNode(*resolved, NodeKind::Group);
        group->Node = node;

        auto inserted = m_Groups.Insert(*resolved, std::move(group));
        if (!inserted)
        {
            DestroyNode(node);
            return inserted;
        }

        if (!children.empty()) AddToGroup(*resolved, children);
        return inserted;
    }

    // -------------------------------------------------------------------------
    // Geometries
    // -------------------------------------------------------------------------

    Core::Expected<Graphics::Geometry*> World::CreateGeometry(const Graphics::GeometryDesc& desc)
    {
        auto resolved = ResolveNewId(m_Geometries, desc.Id);
        if (!resolved) return Core::Err<Graphics::Geometry*>(resolved.error());

        auto buffers = Graphics::BuildGeometry(desc.Params);
        if (!buffers)
        {
            Core::Log::Error("Failed to build geometry '{}': {}", *resolved, Core::ErrorCodeToString(buffers.error()));
            return Core::Err<Graphics::Geometry*>(buffers.error());
        }

        auto geometry = std::make_unique<Graphics::Geometry>();
        geometry->Id = *resolved;
        geometry->Params = desc.Params;
        geometry->Buffers = std::move(*buffers);
        return m_Geometries.Insert(*resolved, std::move(geometry));
    }

    void World::DeleteGeometry(std::string_view id)
    {
        m_Geometries.Delete(id);
    }

    void World::DeleteGeometries(const std::vector<std::string>& ids)
    {
        m_Geometries.DeleteMany(ids);
    }

    // -------------------------------------------------------------------------
    // Materials
    // -------------------------------------------------------------------------

    Core::Expected<Graphics::Material*> World::CreateMaterial(const Graphics::MaterialDesc& desc)
    {
        auto resolved = ResolveNewId(m_Materials, desc.Id);
        if (!resolved) return Core::Err<Graphics::Material*>(resolved.error());

        auto material = std::make_unique<Graphics::Material>();
        material->Id = *resolved;
        material->Params = desc.Params;
        material->Common = desc.Common;
        material->Textures = desc.Textures;
        return m_Materials.Insert(*resolved, std::move(material));
    }

    void World::DeleteMaterial(std::string_view id, bool deleteTextures)
    {
        Graphics::Material* material = m_Materials.Get(id);
        if (!material) return;

        const std::vector<std::string> textureIds = deleteTextures ? material->TextureIds() : std::vector<std::string>{};
        m_Materials.Delete(id);

        for (const auto& textureId : textureIds) DeleteTexture(textureId);
    }

    void World::DeleteMaterials(const std::vector<std::string>& ids, bool deleteTextures)
    {
        for (const auto& id : ids) DeleteMaterial(id, deleteTextures);
    }

    // -------------------------------------------------------------------------
    // Textures
    // -------------------------------------------------------------------------

    Core::Expected<Graphics::Texture*> World::CreateTexture(Graphics::TextureDesc desc)
    {
        auto resolved = ResolveNewId(m_Textures, desc.Id);
        if (!resolved) return Core::Err<Graphics::Texture*>(resolved.error());

        if (auto valid = Graphics::ValidateTexture(desc); !valid)
            return Core::Err<Graphics::Texture*>(valid.error());

        auto texture = std::make_unique<Graphics::Texture>();
        texture->Id = *resolved;
        texture->Width = desc.Width;
        texture->Height = desc.Height;
        texture->Format = desc.Format;
        texture->Pixels = std::move(desc.Pixels);
        texture->Sampler = desc.Sampler;
        return m_Textures.Insert(*resolved, std::move(texture));
    }

    void World::DeleteTexture(std::string_view id)
    {
        m_Textures.Delete(id);
    }

    void World::DeleteTextures(const std::vector<std::string>& ids)
    {
        m_Textures.DeleteMany(ids);
    }

    // -------------------------------------------------------------------------
    // Lights
    // -------------------------------------------------------------------------

    Core::Expected<Graphics::Light*> World::CreateLight(const Graphics::LightDesc& desc)
    {
        auto resolved = ResolveNewId(m_Lights, desc.Id);
        if (!resolved) return Core::Err<Graphics::Light*>(resolved.error());

        auto light = std::make_unique<Graphics::Light>();
        light->Id = *resolved;
        light->Params = desc.Params;

        const entt::entity node = CreateNode(*resolved, NodeKind::Light);
        light->Node = node;

        auto inserted = m_Lights.Insert(*resolved, std::move(light));
        if (!inserted) DestroyNode(node);
        return inserted;
    }

    void World::DeleteLight(std::string_view id)
    {
        Graphics::Light* light = m_Lights.Get(id);
        if (!light) return;

        DestroyNode(light->Node);
        m_Lights.Delete(id);
    }

    void World::DeleteLights(const std::vector<std::string>& ids)
    {
        for (const auto& id : ids) DeleteLight(id);
    }

    // -------------------------------------------------------------------------
    // Meshes
    // -------------------------------------------------------------------------

    Core::Expected<std::string> World::CreateInlineGeometry(const Graphics::GeometryDesc& desc)
    {
        auto geometry = CreateGeometry(desc);
        if (!geometry) return Core::Err<std::string>(geometry.error());
        return (*geometry)->Id;
    }

    Core::Expected<std::string> World::CreateInlineMaterial(const Graphics::MaterialDesc& desc)
    {
        auto material = CreateMaterial(desc);
        if (!material) return Core::Err<std::string>(material.error());
        return (*material)->Id;
    }

    Core::Expected<Graphics::Mesh*> World::CreateMesh(const Graphics::MeshDesc& desc)
    {
        // 1. Validate everything up front
        if (desc.Id && !desc.Id->empty() && m_Meshes.Contains(*desc.Id))
        {
            Core::Log::Error("A mesh with id '{}' already exists", *desc.Id);
            return Core::Err<Graphics::Mesh*>(Core::ErrorCode::DuplicateId);
        }

        if (const auto* geometryId = std::get_if<std::string>(&desc.Geometry))
        {
            if (!m_Geometries.Contains(*geometryId))
            {
                Core::Log::Error("Cannot create mesh: geometry '{}' does not exist", *geometryId);
                return Core::Err<Graphics::Mesh*>(Core::ErrorCode::ResourceNotFound);
            }
        }
        else
        {
            const auto& inlineDesc = std::get<Graphics::GeometryDesc>(desc.Geometry);
            if (inlineDesc.Id && !inlineDesc.Id->empty() && m_Geometries.Contains(*inlineDesc.Id))
            {
                Core::Log::Error("Cannot create mesh: geometry '{}' already exists", *inlineDesc.Id);
                return Core::Err<Graphics::Mesh*>(Core::ErrorCode::DuplicateId);
            }
        }

        if (desc.Materials.empty())
        {
            Core::Log::Error("Cannot create mesh: no material given");
            return Core::Err<Graphics::Mesh*>(Core::ErrorCode::InvalidArgument);
        }

        std::vector<std::string> inlineMaterialIds;
        for (const auto& ref : desc.Materials)
        {
            if (const auto* materialId = std::get_if<std::string>(&ref))
            {
                if (!m_Materials.Contains(*materialId))
                {
                    Core::Log::Error("Cannot create mesh: material '{}' does not exist", *materialId);
                    return Core::Err<Graphics::Mesh*>(Core::ErrorCode::ResourceNotFound);
                }
            }
            else
            {
                const auto& inlineDesc = std::get<Graphics::MaterialDesc>(ref);
                if (!inlineDesc.Id || inlineDesc.Id->empty()) continue;

                if (m_Materials.Contains(*inlineDesc.Id) ||
                    std::find(inlineMaterialIds.begin(), inlineMaterialIds.end(), *inlineDesc.Id) != inlineMaterialIds.end())
                {
                    Core::Log::Error("Cannot create mesh: material '{}' already exists", *inlineDesc.Id);
                    return Core::Err<Graphics::Mesh*>(Core::ErrorCode::DuplicateId);
                }
                inlineMaterialIds.push_back(*inlineDesc.Id);
            }
        }

        // Inline geometry parameters are checked before any registry is touched
        if (const auto* inlineGeometry = std::get_if<Graphics::GeometryDesc>(&desc.Geometry))
        {
            if (auto built = Graphics::BuildGeometry(inlineGeometry->Params); !built)
                return Core::Err<Graphics::Mesh*>(built.error());
        }

        // 2. Create inline sub-resources
        auto meshId = ResolveNewId(m_Meshes, desc.Id);
        if (!meshId) return Core::Err<Graphics::Mesh*>(meshId.error());

        auto mesh = std::make_unique<Graphics::Mesh>();
        mesh->Id = *meshId;
        mesh->CastShadow = desc.CastShadow;
        mesh->ReceiveShadow = desc.ReceiveShadow;

        if (const auto* geometryId = std::get_if<std::string>(&desc.Geometry))
        {
            mesh->GeometryId = *geometryId;
        }
        else
        {
            auto created = CreateInlineGeometry(std::get<Graphics::GeometryDesc>(desc.Geometry));
            if (!created) return Core::Err<Graphics::Mesh*>(created.error());
            mesh->GeometryId = *created;
        }

        for (const auto& ref : desc.Materials)
        {
            if (const auto* materialId = std::get_if<std::string>(&ref))
            {
                mesh->MaterialIds.push_back(*materialId);
                continue;
            }

            auto created = CreateInlineMaterial(std::get<Graphics::MaterialDesc>(ref));
            if (!created) return Core::Err<Graphics::Mesh*>(created.error());
            mesh->MaterialIds.push_back(*created);
        }

        // 3. Insert the mesh itself
        const entt::entity node = CreateNode(*meshId, NodeKind::Mesh);
        mesh->Node = node;

        auto inserted = m_Meshes.Insert(*meshId, std::move(mesh));
        if (!inserted) DestroyNode(node);
        return inserted;
    }

    void World::DeleteMeshReferences(const Graphics::Mesh& mesh, const CascadeOptions& options)
    {
        if (options.Geometries()) DeleteGeometry(mesh.GeometryId);
        if (options.Materials()) DeleteMaterials(mesh.MaterialIds, options.Textures());
    }

    void World::DeleteMesh(std::string_view id, const CascadeOptions& options)
    {
        Graphics::Mesh* mesh = m_Meshes.Get(id);
        if (!mesh) return;

        // Copy what the cascade needs; the mesh is gone after Delete
        Graphics::Mesh references;
        references.GeometryId = mesh->GeometryId;
        references.MaterialIds = mesh->MaterialIds;

        DestroyNode(mesh->Node);
        m_Meshes.Delete(id);

        DeleteMeshReferences(references, options);
    }

    void World::DeleteMeshes(const std::vector<std::string>& ids, const CascadeOptions& options)
    {
        for (const auto& id : ids) DeleteMesh(id, options);
    }

    // -------------------------------------------------------------------------
    // Viewport / hooks / teardown
    // -------------------------------------------------------------------------

    void World::SetViewport(uint32_t width, uint32_t height)
    {
        m_Viewport.Width = width;
        m_Viewport.Height = height;
    }

    void World::ConnectGpuHooks(Graphics::IGpuResourceSink& sink)
    {
        m_GpuSink = &sink;
        auto forward = [this](Graphics::ResourceKind kind, std::string_view id)
        {
            if (m_GpuSink) m_GpuSink->OnResourceDisposed(kind, id);
        };

        m_Cameras.SetDisposeHook(forward);
        m_Scenes.SetDisposeHook(forward);
        m_Groups.SetDisposeHook(forward);
        m_Geometries.SetDisposeHook(forward);
        m_Materials.SetDisposeHook(forward);
        m_Textures.SetDisposeHook(forward);
        m_Lights.SetDisposeHook(forward);
        m_Meshes.SetDisposeHook(forward);
    }

    void World::DisconnectGpuHooks()
    {
        m_GpuSink = nullptr;
        m_Cameras.SetDisposeHook({});
        m_Scenes.SetDisposeHook({});
        m_Groups.SetDisposeHook({});
        m_Geometries.SetDisposeHook({});
        m_Materials.SetDisposeHook({});
        m_Textures.SetDisposeHook({});
        m_Lights.SetDisposeHook({});
        m_Meshes.SetDisposeHook({});
    }

    void World::Clear()
    {
        m_Scenes.Clear();
        m_Groups.Clear();
        m_Meshes.Clear();
        m_Lights.Clear();
        m_Cameras.Clear();
        m_Materials.Clear();
        m_Geometries.Clear();
        m_Textures.Clear();

        m_CurrentCamera = {};
        m_CurrentScene = {};

        m_Tree.clear();
        m_Root = CreateNode("root", NodeKind::Root);
    }
}
