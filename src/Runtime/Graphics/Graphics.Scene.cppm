module;
#include <functional>
#include <string>
#include <variant>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Graphics:Scene;

export namespace Graphics
{
    // Per-tick callback. Receives the scaled delta in seconds.
    using Looper = std::function<void(double)>;
    // Called after the viewport changed size.
    using Resizer = std::function<void()>;

    // Nothing, a clear color, or a texture registry id.
    using SceneBackground = std::variant<std::monostate, glm::vec3, std::string>;

    struct SceneOptions
    {
        std::string Name;
        SceneBackground Background;
        bool MakeCurrent = false;
        std::vector<Looper> MainLoopers;
        std::vector<Looper> MainLateLoopers;
        std::vector<Looper> AppLoopers;
    };

    struct Scene
    {
        std::string Id;
        entt::entity Node = entt::null;
        std::string Name;
        SceneBackground Background;

        std::vector<Looper> MainLoopers;
        std::vector<Looper> MainLateLoopers;
        std::vector<Looper> AppLoopers;
        std::vector<Resizer> Resizers;

        [[nodiscard]] const std::string* GetBackgroundTextureId() const
        {
            return std::get_if<std::string>(&Background);
        }
    };

    struct Group
    {
        std::string Id;
        entt::entity Node = entt::null;
        std::string Name;
    };
}
