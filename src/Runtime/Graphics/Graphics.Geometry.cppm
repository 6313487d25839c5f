module;
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:Geometry;

import Core;

export namespace Graphics
{
    // --- Parameter sets -------------------------------------------------------

    struct BoxParams
    {
        float Width = 1.0f;
        float Height = 1.0f;
        float Depth = 1.0f;
        uint32_t WidthSegments = 1;
        uint32_t HeightSegments = 1;
        uint32_t DepthSegments = 1;
    };

    struct SphereParams
    {
        float Radius = 1.0f;
        uint32_t WidthSegments = 32;  // Clamped to >= 3
        uint32_t HeightSegments = 16; // Clamped to >= 2
        float PhiStart = 0.0f;
        float PhiLength = 2.0f * std::numbers::pi_v<float>;
        float ThetaStart = 0.0f;
        float ThetaLength = std::numbers::pi_v<float>;
    };

    struct PlaneParams
    {
        float Width = 1.0f;
        float Height = 1.0f;
        uint32_t WidthSegments = 1;
        uint32_t HeightSegments = 1;
    };

    // Caller-provided vertex data. Normals/UVs may be empty; when present
    // they must match the position count.
    struct BufferParams
    {
        std::vector<glm::vec3> Positions;
        std::vector<glm::vec3> Normals;
        std::vector<glm::vec2> UVs;
        std::vector<uint32_t> Indices;
    };

    using GeometryParams = std::variant<BoxParams, SphereParams, PlaneParams, BufferParams>;

    struct GeometryDesc
    {
        std::optional<std::string> Id;
        GeometryParams Params = BoxParams{};
    };

    // --- Built data -----------------------------------------------------------

    struct GeometryBuffers
    {
        std::vector<glm::vec3> Positions;
        std::vector<glm::vec3> Normals;
        std::vector<glm::vec2> UVs;
        std::vector<uint32_t> Indices;
    };

    struct Geometry
    {
        std::string Id;
        GeometryParams Params;
        GeometryBuffers Buffers;
        bool Disposed = false;

        [[nodiscard]] size_t VertexCount() const { return Buffers.Positions.size(); }
        [[nodiscard]] size_t IndexCount() const { return Buffers.Indices.size(); }
        [[nodiscard]] std::string_view TypeName() const;

        // Releases CPU-side buffers. Called by the registry on delete.
        void Dispose();
    };

    // Generates vertex data for the given parameters. Fails with
    // InvalidArgument on negative extents or inconsistent buffers.
    [[nodiscard]] Core::Expected<GeometryBuffers> BuildGeometry(const GeometryParams& params);
}
