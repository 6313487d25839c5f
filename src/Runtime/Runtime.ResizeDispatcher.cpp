module;

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

module Runtime.ResizeDispatcher;

import Core;
import Graphics;
import Runtime.World;

namespace Runtime
{
    Core::Result ResizeDispatcher::AddResizer(std::string id, Graphics::Resizer resizer)
    {
        if (HasResizer(id))
        {
            Core::Log::Error("A resizer with id '{}' already exists", id);
            return Core::Err(Core::ErrorCode::DuplicateId);
        }
        m_Resizers.emplace_back(std::move(id), std::move(resizer));
        return Core::Ok();
    }

    void ResizeDispatcher::DeleteResizer(std::string_view id)
    {
        auto it = std::find_if(m_Resizers.begin(), m_Resizers.end(),
                               [&](const auto& entry) { return entry.first == id; });
        if (it == m_Resizers.end())
        {
            Core::Log::Warn("Could not find resizer with id '{}' to delete", id);
            return;
        }
        m_Resizers.erase(it);
    }

    bool ResizeDispatcher::HasResizer(std::string_view id) const
    {
        return std::any_of(m_Resizers.begin(), m_Resizers.end(),
                           [&](const auto& entry) { return entry.first == id; });
    }

    std::vector<std::string> ResizeDispatcher::GetResizerIds() const
    {
        std::vector<std::string> ids;
        ids.reserve(m_Resizers.size());
        for (const auto& [id, resizer] : m_Resizers) ids.push_back(id);
        return ids;
    }

    void ResizeDispatcher::OnResize(uint32_t width, uint32_t height)
    {
        m_World.SetViewport(width, height);

        // Copies: a resizer may add or delete resizers
        const auto globals = m_Resizers;
        for (const auto& [id, resizer] : globals)
        {
            if (resizer) resizer();
        }

        for (const auto& sceneId : m_World.GetSceneIds())
        {
            // A resizer may have deleted a later scene
            if (!m_World.HasScene(sceneId)) continue;
            Graphics::Scene* scene = m_World.GetScene(sceneId);

            const auto resizers = scene->Resizers;
            for (const auto& resizer : resizers)
            {
                if (resizer) resizer();
            }
        }
    }
}
