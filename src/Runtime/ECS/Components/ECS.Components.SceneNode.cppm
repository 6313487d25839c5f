module;
#include <cstdint>
#include <string>
#include <string_view>

export module ECS:Components.SceneNode;

export namespace ECS::Components::SceneNode
{
    enum class Kind : uint8_t
    {
        Root,
        Scene,
        Group,
        Mesh,
        Light,
        Camera
    };

    // Identity of a render-tree node: which registry it belongs to and the
    // id it is stored under there. Container lookups by id scan this.
    struct Component
    {
        std::string Id;
        Kind NodeKind = Kind::Group;
    };

    constexpr std::string_view KindToString(Kind kind)
    {
        switch (kind)
        {
            case Kind::Root:   return "Root";
            case Kind::Scene:  return "Scene";
            case Kind::Group:  return "Group";
            case Kind::Mesh:   return "Mesh";
            case Kind::Light:  return "Light";
            case Kind::Camera: return "Camera";
        }
        return "Unknown";
    }
}
