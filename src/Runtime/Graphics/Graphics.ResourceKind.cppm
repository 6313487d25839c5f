module;
#include <cstdint>
#include <string_view>

export module Graphics:ResourceKind;

export namespace Graphics
{
    // One value per registry. Disposal hooks and log lines identify entries
    // as (kind, id).
    enum class ResourceKind : uint8_t
    {
        Camera,
        Scene,
        Group,
        Mesh,
        Geometry,
        Material,
        Texture,
        Light
    };

    constexpr std::string_view ResourceKindToString(ResourceKind kind)
    {
        switch (kind)
        {
            case ResourceKind::Camera:   return "camera";
            case ResourceKind::Scene:    return "scene";
            case ResourceKind::Group:    return "group";
            case ResourceKind::Mesh:     return "mesh";
            case ResourceKind::Geometry: return "geometry";
            case ResourceKind::Material: return "material";
            case ResourceKind::Texture:  return "texture";
            case ResourceKind::Light:    return "light";
        }
        return "unknown";
    }
}
