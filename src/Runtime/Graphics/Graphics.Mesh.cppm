module;
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <entt/entity/entity.hpp>

export module Graphics:Mesh;

import :Geometry;
import :Material;

export namespace Graphics
{
    // A mesh references its geometry and materials either by registry id or
    // by an inline descriptor that is created alongside the mesh.
    using GeometryRef = std::variant<std::string, GeometryDesc>;
    using MaterialRef = std::variant<std::string, MaterialDesc>;

    struct MeshDesc
    {
        std::optional<std::string> Id;
        GeometryRef Geometry;
        std::vector<MaterialRef> Materials; // One entry, or one per geometry group
        bool CastShadow = false;
        bool ReceiveShadow = false;
    };

    struct Mesh
    {
        std::string Id;
        entt::entity Node = entt::null;
        std::string GeometryId;
        std::vector<std::string> MaterialIds;
        bool CastShadow = false;
        bool ReceiveShadow = false;

        [[nodiscard]] bool IsMultiMaterial() const { return MaterialIds.size() > 1; }
    };
}
