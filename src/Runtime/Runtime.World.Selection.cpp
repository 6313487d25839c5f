module;

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <entt/entity/registry.hpp>

module Runtime.World;

import Core;
import Graphics;
import ECS;

namespace Runtime
{
    namespace
    {
        // Erases by pre-removal position, highest first. Out of range
        // positions are reported and skipped.
        template <typename T>
        void EraseIndices(std::vector<T>& list, std::vector<size_t> indices,
                          std::string_view what, std::string_view sceneId)
        {
            std::sort(indices.begin(), indices.end(), std::greater<>());
            indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

            for (size_t index : indices)
            {
                if (index >= list.size())
                {
                    Core::Log::Warn("No {} at index {} in scene '{}' ({} registered)", what, index, sceneId, list.size());
                    continue;
                }
                list.erase(list.begin() + static_cast<std::ptrdiff_t>(index));
            }
        }
    }

    // -------------------------------------------------------------------------
    // Current camera
    // -------------------------------------------------------------------------

    Graphics::Camera* World::SetCurrentCamera(std::string_view id)
    {
        if (!m_CurrentCamera.Id.empty() && m_CurrentCamera.Id == id)
        {
            if (Graphics::Camera* current = m_Cameras.Resolve(m_CurrentCamera.Handle)) return current;
        }

        Graphics::Camera* camera = m_Cameras.TryGet(id);
        if (!camera)
        {
            Core::Log::Warn("Could not find camera with id '{}', keeping current camera '{}'", id, m_CurrentCamera.Id);
            return GetCurrentCamera();
        }

        m_CurrentCamera.Id = std::string(id);
        m_CurrentCamera.Handle = m_Cameras.GetHandle(id);
        return camera;
    }

    Graphics::Camera* World::GetCurrentCamera() const
    {
        if (m_CurrentCamera.Id.empty()) return nullptr;

        Graphics::Camera* camera = m_Cameras.Resolve(m_CurrentCamera.Handle);
        if (!camera) Core::Log::Warn("Current camera '{}' has been deleted", m_CurrentCamera.Id);
        return camera;
    }

    // -------------------------------------------------------------------------
    // Current scene
    // -------------------------------------------------------------------------

    Graphics::Scene* World::SetCurrentScene(std::string_view id)
    {
        if (!m_CurrentScene.Id.empty() && m_CurrentScene.Id == id)
        {
            if (Graphics::Scene* current = m_Scenes.Resolve(m_CurrentScene.Handle)) return current;
        }

        Graphics::Scene* scene = m_Scenes.TryGet(id);
        if (!scene)
        {
            Core::Log::Warn("Could not find scene with id '{}', keeping current scene '{}'", id, m_CurrentScene.Id);
            return GetCurrentScene();
        }

        // The root holds exactly the current scene
        if (Graphics::Scene* previous = m_Scenes.Resolve(m_CurrentScene.Handle))
            ECS::Components::Hierarchy::Detach(m_Tree, previous->Node);
        ECS::Components::Hierarchy::Attach(m_Tree, scene->Node, m_Root);

        m_CurrentScene.Id = std::string(id);
        m_CurrentScene.Handle = m_Scenes.GetHandle(id);
        return scene;
    }

    Graphics::Scene* World::GetCurrentScene() const
    {
        if (m_CurrentScene.Id.empty()) return nullptr;

        Graphics::Scene* scene = m_Scenes.Resolve(m_CurrentScene.Handle);
        if (!scene) Core::Log::Warn("Current scene '{}' has been deleted", m_CurrentScene.Id);
        return scene;
    }

    // -------------------------------------------------------------------------
    // Scene loopers / resizers
    // -------------------------------------------------------------------------

    Graphics::Scene* World::ResolveSceneArg(std::optional<std::string_view> sceneId, std::string_view caller) const
    {
        if (sceneId)
        {
            Graphics::Scene* scene = m_Scenes.TryGet(*sceneId);
            if (!scene) Core::Log::Warn("Could not find scene with id '{}' in {}", *sceneId, caller);
            return scene;
        }

        Graphics::Scene* current = GetCurrentScene();
        if (!current) Core::Log::Warn("No current scene in {}", caller);
        return current;
    }

    bool World::AddSceneMainLooper(Graphics::Looper looper, std::optional<std::string_view> sceneId, bool late)
    {
        Graphics::Scene* scene = ResolveSceneArg(sceneId, "AddSceneMainLooper");
        if (!scene) return false;

        (late ? scene->MainLateLoopers : scene->MainLoopers).push_back(std::move(looper));
        return true;
    }

    bool World::AddSceneAppLooper(Graphics::Looper looper, std::optional<std::string_view> sceneId)
    {
        Graphics::Scene* scene = ResolveSceneArg(sceneId, "AddSceneAppLooper");
        if (!scene) return false;

        scene->AppLoopers.push_back(std::move(looper));
        return true;
    }

    bool World::RemoveSceneMainLooper(size_t index, std::optional<std::string_view> sceneId, bool late)
    {
        return RemoveSceneMainLoopers(std::vector<size_t>{index}, sceneId, late);
    }

    bool World::RemoveSceneMainLoopers(const std::vector<size_t>& indices, std::optional<std::string_view> sceneId, bool late)
    {
        Graphics::Scene* scene = ResolveSceneArg(sceneId, "RemoveSceneMainLooper");
        if (!scene) return false;

        EraseIndices(late ? scene->MainLateLoopers : scene->MainLoopers, indices,
                     late ? "late main looper" : "main looper", scene->Id);
        return true;
    }

    bool World::RemoveSceneAppLooper(size_t index, std::optional<std::string_view> sceneId)
    {
        return RemoveSceneAppLoopers(std::vector<size_t>{index}, sceneId);
    }

    bool World::RemoveSceneAppLoopers(const std::vector<size_t>& indices, std::optional<std::string_view> sceneId)
    {
        Graphics::Scene* scene = ResolveSceneArg(sceneId, "RemoveSceneAppLooper");
        if (!scene) return false;

        EraseIndices(scene->AppLoopers, indices, "app looper", scene->Id);
        return true;
    }

    bool World::ClearSceneLoopers(std::optional<std::string_view> sceneId)
    {
        Graphics::Scene* scene = ResolveSceneArg(sceneId, "ClearSceneLoopers");
        if (!scene) return false;

        scene->MainLoopers.clear();
        scene->MainLateLoopers.clear();
        scene->AppLoopers.clear();
        return true;
    }

    bool World::AddSceneResizer(Graphics::Resizer resizer, std::optional<std::string_view> sceneId)
    {
        Graphics::Scene* scene = ResolveSceneArg(sceneId, "AddSceneResizer");
        if (!scene) return false;

        scene->Resizers.push_back(std::move(resizer));
        return true;
    }

    bool World::RemoveSceneResizer(size_t index, std::optional<std::string_view> sceneId)
    {
        return RemoveSceneResizers(std::vector<size_t>{index}, sceneId);
    }

    bool World::RemoveSceneResizers(const std::vector<size_t>& indices, std::optional<std::string_view> sceneId)
    {
        Graphics::Scene* scene = ResolveSceneArg(sceneId, "RemoveSceneResizer");
        if (!scene) return false;

        EraseIndices(scene->Resizers, indices, "resizer", scene->Id);
        return true;
    }
}
