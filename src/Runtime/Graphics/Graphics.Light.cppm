module;
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Graphics:Light;

export namespace Graphics
{
    // Shadow camera settings for shadow-casting lights.
    struct ShadowParams
    {
        glm::uvec2 MapSize{512, 512};
        float CameraNear = 0.1f;
        float CameraFar = 2000.0f;
        // Orthographic extents (directional lights)
        float CameraLeft = -1.0f;
        float CameraRight = 1.0f;
        float CameraTop = 1.0f;
        float CameraBottom = -1.0f;
        float Bias = 0.0f;
        float NormalBias = 0.0f;
        float Radius = 1.0f;
        uint32_t BlurSamples = 8;
    };

    struct AmbientLightParams
    {
        glm::vec3 Color{1.0f};
        float Intensity = 1.0f;
    };

    struct HemisphereLightParams
    {
        glm::vec3 SkyColor{1.0f};
        glm::vec3 GroundColor{1.0f};
        float Intensity = 1.0f;
        glm::vec3 Position{0.0f, 1.0f, 0.0f};
    };

    struct PointLightParams
    {
        glm::vec3 Color{1.0f};
        float Intensity = 1.0f;
        float Distance = 0.0f; // 0 = no cutoff
        float Decay = 2.0f;
        glm::vec3 Position{0.0f};
        bool CastShadow = false;
        ShadowParams Shadow;
    };

    struct DirectionalLightParams
    {
        glm::vec3 Color{1.0f};
        float Intensity = 1.0f;
        glm::vec3 Position{0.0f, 1.0f, 0.0f};
        glm::vec3 Target{0.0f};
        bool CastShadow = false;
        ShadowParams Shadow;
    };

    using LightParams = std::variant<AmbientLightParams, HemisphereLightParams, PointLightParams, DirectionalLightParams>;

    struct LightDesc
    {
        std::optional<std::string> Id;
        LightParams Params = AmbientLightParams{};
    };

    struct Light
    {
        std::string Id;
        entt::entity Node = entt::null;
        LightParams Params;
        bool Disposed = false;

        [[nodiscard]] std::string_view TypeName() const
        {
            switch (Params.index())
            {
                case 0: return "Ambient";
                case 1: return "Hemisphere";
                case 2: return "Point";
                default: return "Directional";
            }
        }

        [[nodiscard]] bool CastsShadow() const
        {
            if (const auto* p = std::get_if<PointLightParams>(&Params)) return p->CastShadow;
            if (const auto* d = std::get_if<DirectionalLightParams>(&Params)) return d->CastShadow;
            return false;
        }

        // Releases the shadow map, if any.
        void Dispose() { Disposed = true; }
    };
}
