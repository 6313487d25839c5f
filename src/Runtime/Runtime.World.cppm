module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <entt/entity/registry.hpp>

export module Runtime.World;

import Core;
import Graphics;
import ECS;
import Runtime.Registry;

export namespace Runtime
{
    // Which child (or children) to take out of a container: by id, by index,
    // or a list of either. Indices refer to positions before any removal.
    using ChildSelector = std::variant<std::string, size_t, std::vector<std::string>, std::vector<size_t>>;

    // Controls what a delete takes with it. Everything defaults to off;
    // DeleteAll turns everything on. DeleteTextures defaults to DeleteAll.
    struct CascadeOptions
    {
        bool DeleteMeshes = false;
        bool DeleteGeometries = false;
        bool DeleteMaterials = false;
        std::optional<bool> DeleteTextures;
        bool DeleteLights = false;
        bool DeleteGroups = false;
        bool DeleteAll = false;

        [[nodiscard]] bool Meshes() const { return DeleteMeshes || DeleteAll; }
        [[nodiscard]] bool Geometries() const { return DeleteGeometries || DeleteAll; }
        [[nodiscard]] bool Materials() const { return DeleteMaterials || DeleteAll; }
        [[nodiscard]] bool Textures() const { return DeleteTextures.value_or(DeleteAll); }
        [[nodiscard]] bool Lights() const { return DeleteLights || DeleteAll; }
        [[nodiscard]] bool Groups() const { return DeleteGroups || DeleteAll; }
    };

    struct Viewport
    {
        uint32_t Width = 1280;
        uint32_t Height = 720;

        [[nodiscard]] float Aspect() const { return Height > 0 ? (float)Width / (float)Height : 1.0f; }
    };

    // -------------------------------------------------------------------------
    // World - owns every registry, the render tree and the current selection
    // -------------------------------------------------------------------------
    // Each camera/scene/group/mesh/light gets a node entity in the render tree
    // (ECS::Components::SceneNode + Hierarchy). Geometries, materials and
    // textures are shared by reference and have no node.
    //
    // Deletes never reference count: deleting a mesh with DeleteGeometries
    // removes the geometry even if another mesh still points at it.
    // -------------------------------------------------------------------------
    class World
    {
    public:
        World();
        ~World();

        World(const World&) = delete;
        World& operator=(const World&) = delete;
        World(World&&) = delete;
        World& operator=(World&&) = delete;

        // --- Cameras ---
        Core::Expected<Graphics::Camera*> CreateCamera(std::optional<std::string> id, const Graphics::CameraParams& params = {});
        [[nodiscard]] Graphics::Camera* GetCamera(std::string_view id) const { return m_Cameras.Get(id); }
        [[nodiscard]] std::vector<Graphics::Camera*> GetCameras(const std::vector<std::string>& ids) const { return m_Cameras.GetMany(ids); }
        [[nodiscard]] std::unordered_map<std::string, Graphics::Camera*> GetAllCameras() const { return m_Cameras.GetAll(); }
        [[nodiscard]] bool HasCamera(std::string_view id) const { return m_Cameras.Contains(id); }
        void DeleteCamera(std::string_view id);
        void DeleteCameras(const std::vector<std::string>& ids);

        // --- Scenes ---
        Core::Expected<Graphics::Scene*> CreateScene(std::optional<std::string> id, Graphics::SceneOptions params = {});
        [[nodiscard]] Graphics::Scene* GetScene(std::string_view id) const { return m_Scenes.Get(id); }
        [[nodiscard]] std::vector<Graphics::Scene*> GetScenes(const std::vector<std::string>& ids) const { return m_Scenes.GetMany(ids); }
        [[nodiscard]] std::unordered_map<std::string, Graphics::Scene*> GetAllScenes() const { return m_Scenes.GetAll(); }
        [[nodiscard]] bool HasScene(std::string_view id) const { return m_Scenes.Contains(id); }
        [[nodiscard]] std::vector<std::string> GetSceneIds() const { return m_Scenes.Ids(); }
        // Unknown ids are skipped silently.
        void DeleteScene(std::string_view id, const CascadeOptions& options = {});
        void DeleteScenes(const std::vector<std::string>& ids, const CascadeOptions& options = {});

        // --- Groups ---
        Core::Expected<Graphics::Group*> CreateGroup(std::optional<std::string> id, const std::vector<entt::entity>& children = {});
        [[nodiscard]] Graphics::Group* GetGroup(std::string_view id) const { return m_Groups.Get(id); }
        [[nodiscard]] std::vector<Graphics::Group*> GetGroups(const std::vector<std::string>& ids) const { return m_Groups.GetMany(ids); }
        [[nodiscard]] std::unordered_map<std::string, Graphics::Group*> GetAllGroups() const { return m_Groups.GetAll(); }
        [[nodiscard]] bool HasGroup(std::string_view id) const { return m_Groups.Contains(id); }
        // Unknown ids are skipped silently.
        void DeleteGroup(std::string_view id, const CascadeOptions& options = {});
        void DeleteGroups(const std::vector<std::string>& ids, const CascadeOptions& options = {});

        // --- Geometries ---
        Core::Expected<Graphics::Geometry*> CreateGeometry(const Graphics::GeometryDesc& desc);
        [[nodiscard]] Graphics::Geometry* GetGeometry(std::string_view id) const { return m_Geometries.Get(id); }
        [[nodiscard]] std::vector<Graphics::Geometry*> GetGeometries(const std::vector<std::string>& ids) const { return m_Geometries.GetMany(ids); }
        [[nodiscard]] std::unordered_map<std::string, Graphics::Geometry*> GetAllGeometries() const { return m_Geometries.GetAll(); }
        [[nodiscard]] bool HasGeometry(std::string_view id) const { return m_Geometries.Contains(id); }
        void DeleteGeometry(std::string_view id);
        void DeleteGeometries(const std::vector<std::string>& ids);

        // --- Materials ---
        Core::Expected<Graphics::Material*> CreateMaterial(const Graphics::MaterialDesc& desc);
        [[nodiscard]] Graphics::Material* GetMaterial(std::string_view id) const { return m_Materials.Get(id); }
        [[nodiscard]] std::vector<Graphics::Material*> GetMaterials(const std::vector<std::string>& ids) const { return m_Materials.GetMany(ids); }
        [[nodiscard]] std::unordered_map<std::string, Graphics::Material*> GetAllMaterials() const { return m_Materials.GetAll(); }
        [[nodiscard]] bool HasMaterial(std::string_view id) const { return m_Materials.Contains(id); }
        void DeleteMaterial(std::string_view id, bool deleteTextures = false);
        void DeleteMaterials(const std::vector<std::string>& ids, bool deleteTextures = false);

        // --- Textures ---
        Core::Expected<Graphics::Texture*> CreateTexture(Graphics::TextureDesc desc);
        [[nodiscard]] Graphics::Texture* GetTexture(std::string_view id) const { return m_Textures.Get(id); }
        [[nodiscard]] std::vector<Graphics::Texture*> GetTextures(const std::vector<std::string>& ids) const { return m_Textures.GetMany(ids); }
        [[nodiscard]] std::unordered_map<std::string, Graphics::Texture*> GetAllTextures() const { return m_Textures.GetAll(); }
        [[nodiscard]] bool HasTexture(std::string_view id) const { return m_Textures.Contains(id); }
        void DeleteTexture(std::string_view id);
        void DeleteTextures(const std::vector<std::string>& ids);

        // --- Lights ---
        Core::Expected<Graphics::Light*> CreateLight(const Graphics::LightDesc& desc);
        [[nodiscard]] Graphics::Light* GetLight(std::string_view id) const { return m_Lights.Get(id); }
        [[nodiscard]] std::vector<Graphics::Light*> GetLights(const std::vector<std::string>& ids) const { return m_Lights.GetMany(ids); }
        [[nodiscard]] std::unordered_map<std::string, Graphics::Light*> GetAllLights() const { return m_Lights.GetAll(); }
        [[nodiscard]] bool HasLight(std::string_view id) const { return m_Lights.Contains(id); }
        void DeleteLight(std::string_view id);
        void DeleteLights(const std::vector<std::string>& ids);

        // --- Meshes ---
        // Every referenced id is checked before anything is created, so a
        // failed call leaves no inline geometry/material behind.
        Core::Expected<Graphics::Mesh*> CreateMesh(const Graphics::MeshDesc& desc);
        [[nodiscard]] Graphics::Mesh* GetMesh(std::string_view id) const { return m_Meshes.Get(id); }
        [[nodiscard]] std::vector<Graphics::Mesh*> GetMeshes(const std::vector<std::string>& ids) const { return m_Meshes.GetMany(ids); }
        [[nodiscard]] std::unordered_map<std::string, Graphics::Mesh*> GetAllMeshes() const { return m_Meshes.GetAll(); }
        [[nodiscard]] bool HasMesh(std::string_view id) const { return m_Meshes.Contains(id); }
        // Honors DeleteGeometries, DeleteMaterials and DeleteTextures.
        void DeleteMesh(std::string_view id, const CascadeOptions& options = {});
        void DeleteMeshes(const std::vector<std::string>& ids, const CascadeOptions& options = {});

        // --- Containers ---
        // Appends children in order. A child already parented elsewhere moves.
        Graphics::Group* AddToGroup(std::string_view groupId, entt::entity child);
        Graphics::Group* AddToGroup(std::string_view groupId, const std::vector<entt::entity>& children);
        Graphics::Scene* AddToScene(std::string_view sceneId, entt::entity child);
        Graphics::Scene* AddToScene(std::string_view sceneId, const std::vector<entt::entity>& children);

        // Detaches the selected children. Removed meshes are deleted (with the
        // mesh cascade flags) only when options.DeleteMeshes is set.
        Graphics::Group* RemoveFromGroup(std::string_view groupId, const ChildSelector& selector, const CascadeOptions& options = {});
        Graphics::Scene* RemoveFromScene(std::string_view sceneId, const ChildSelector& selector, const CascadeOptions& options = {});

        [[nodiscard]] std::vector<entt::entity> GetChildren(entt::entity node) const;
        [[nodiscard]] std::vector<std::string> GetChildIds(entt::entity node) const;
        [[nodiscard]] entt::entity GetParent(entt::entity node) const;
        [[nodiscard]] const ECS::Components::SceneNode::Component* GetNodeInfo(entt::entity node) const;

        // --- Current selection ---
        // Setting an unknown id warns and keeps the previous selection.
        Graphics::Camera* SetCurrentCamera(std::string_view id);
        // nullptr when nothing is selected or the selected camera was deleted.
        [[nodiscard]] Graphics::Camera* GetCurrentCamera() const;
        [[nodiscard]] const std::string& GetCurrentCameraId() const { return m_CurrentCamera.Id; }

        Graphics::Scene* SetCurrentScene(std::string_view id);
        [[nodiscard]] Graphics::Scene* GetCurrentScene() const;
        [[nodiscard]] const std::string& GetCurrentSceneId() const { return m_CurrentScene.Id; }

        // --- Scene callbacks (sceneId defaults to the current scene) ---
        // Each returns false (with a warning) when the scene cannot be found.
        bool AddSceneMainLooper(Graphics::Looper looper, std::optional<std::string_view> sceneId = {}, bool late = false);
        bool AddSceneAppLooper(Graphics::Looper looper, std::optional<std::string_view> sceneId = {});
        bool RemoveSceneMainLooper(size_t index, std::optional<std::string_view> sceneId = {}, bool late = false);
        bool RemoveSceneMainLoopers(const std::vector<size_t>& indices, std::optional<std::string_view> sceneId = {}, bool late = false);
        bool RemoveSceneAppLooper(size_t index, std::optional<std::string_view> sceneId = {});
        bool RemoveSceneAppLoopers(const std::vector<size_t>& indices, std::optional<std::string_view> sceneId = {});
        // Clears main, late and app loopers.
        bool ClearSceneLoopers(std::optional<std::string_view> sceneId = {});

        bool AddSceneResizer(Graphics::Resizer resizer, std::optional<std::string_view> sceneId = {});
        bool RemoveSceneResizer(size_t index, std::optional<std::string_view> sceneId = {});
        bool RemoveSceneResizers(const std::vector<size_t>& indices, std::optional<std::string_view> sceneId = {});

        // --- Viewport ---
        [[nodiscard]] const Viewport& GetViewport() const { return m_Viewport; }
        void SetViewport(uint32_t width, uint32_t height);

        // --- GPU hook management ---
        // Forwards every registry disposal to the sink until disconnected.
        void ConnectGpuHooks(Graphics::IGpuResourceSink& sink);
        void DisconnectGpuHooks();

        // --- Render tree ---
        [[nodiscard]] entt::registry& GetTree() { return m_Tree; }
        [[nodiscard]] const entt::registry& GetTree() const { return m_Tree; }
        [[nodiscard]] entt::entity GetRootNode() const { return m_Root; }

        // Deletes everything, scenes first.
        void Clear();

    private:
        template <typename T>
        struct Selection
        {
            std::string Id;
            typename Registry<T>::Handle Handle;
        };

        entt::entity CreateNode(const std::string& id, ECS::Components::SceneNode::Kind kind);
        void DestroyNode(entt::entity node);

        template <typename T>
        Core::Expected<std::string> ResolveNewId(Registry<T>& registry, const std::optional<std::string>& id);

        Core::Expected<std::string> CreateInlineGeometry(const Graphics::GeometryDesc& desc);
        Core::Expected<std::string> CreateInlineMaterial(const Graphics::MaterialDesc& desc);

        void RemoveChildren(entt::entity container, std::string_view containerId,
                            const ChildSelector& selector, const CascadeOptions& options);
        void DeleteMeshReferences(const Graphics::Mesh& mesh, const CascadeOptions& options);

        [[nodiscard]] Graphics::Scene* ResolveSceneArg(std::optional<std::string_view> sceneId, std::string_view caller) const;

        entt::registry m_Tree;
        entt::entity m_Root = entt::null;

        Registry<Graphics::Camera> m_Cameras{Graphics::ResourceKind::Camera};
        Registry<Graphics::Scene> m_Scenes{Graphics::ResourceKind::Scene};
        Registry<Graphics::Group> m_Groups{Graphics::ResourceKind::Group};
        Registry<Graphics::Geometry> m_Geometries{Graphics::ResourceKind::Geometry};
        Registry<Graphics::Material> m_Materials{Graphics::ResourceKind::Material};
        Registry<Graphics::Texture> m_Textures{Graphics::ResourceKind::Texture};
        Registry<Graphics::Light> m_Lights{Graphics::ResourceKind::Light};
        Registry<Graphics::Mesh> m_Meshes{Graphics::ResourceKind::Mesh};

        Selection<Graphics::Camera> m_CurrentCamera;
        Selection<Graphics::Scene> m_CurrentScene;

        Viewport m_Viewport;
        Graphics::IGpuResourceSink* m_GpuSink = nullptr;
    };
}
