module;
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <string_view>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

module Graphics:Geometry.Impl;
import :Geometry;
import Core;

namespace Graphics
{
    namespace
    {
        template <class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };

        // One face of a box. u/v/w are axis indices (0=x, 1=y, 2=z); the face
        // lies at w = depth/2 and spans width x height along u and v.
        void BuildBoxFace(GeometryBuffers& out, int u, int v, int w,
                          float uDir, float vDir,
                          float width, float height, float depth,
                          uint32_t gridX, uint32_t gridY)
        {
            const float segmentWidth = width / (float)gridX;
            const float segmentHeight = height / (float)gridY;
            const float widthHalf = width * 0.5f;
            const float heightHalf = height * 0.5f;
            const float depthHalf = depth * 0.5f;
            const uint32_t gridX1 = gridX + 1;
            const uint32_t gridY1 = gridY + 1;
            const uint32_t start = (uint32_t)out.Positions.size();

            for (uint32_t iy = 0; iy < gridY1; ++iy)
            {
                const float y = (float)iy * segmentHeight - heightHalf;
                for (uint32_t ix = 0; ix < gridX1; ++ix)
                {
                    const float x = (float)ix * segmentWidth - widthHalf;

                    glm::vec3 position{0.0f};
                    position[u] = x * uDir;
                    position[v] = y * vDir;
                    position[w] = depthHalf;
                    out.Positions.push_back(position);

                    glm::vec3 normal{0.0f};
                    normal[w] = depth > 0.0f ? 1.0f : -1.0f;
                    out.Normals.push_back(normal);

                    out.UVs.emplace_back((float)ix / (float)gridX, 1.0f - (float)iy / (float)gridY);
                }
            }

            for (uint32_t iy = 0; iy < gridY; ++iy)
            {
                for (uint32_t ix = 0; ix < gridX; ++ix)
                {
                    const uint32_t a = start + ix + gridX1 * iy;
                    const uint32_t b = start + ix + gridX1 * (iy + 1);
                    const uint32_t c = start + (ix + 1) + gridX1 * (iy + 1);
                    const uint32_t d = start + (ix + 1) + gridX1 * iy;
                    out.Indices.insert(out.Indices.end(), {a, b, d, b, c, d});
                }
            }
        }

        Core::Expected<GeometryBuffers> BuildBox(const BoxParams& p)
        {
            if (p.Width < 0.0f || p.Height < 0.0f || p.Depth < 0.0f)
            {
                Core::Log::Error("Box geometry extents must be non-negative ({}, {}, {})", p.Width, p.Height, p.Depth);
                return Core::Err<GeometryBuffers>(Core::ErrorCode::InvalidArgument);
            }

            const uint32_t ws = std::max(p.WidthSegments, 1u);
            const uint32_t hs = std::max(p.HeightSegments, 1u);
            const uint32_t ds = std::max(p.DepthSegments, 1u);

            GeometryBuffers out;
            BuildBoxFace(out, 2, 1, 0, -1.0f, -1.0f, p.Depth, p.Height, p.Width, ds, hs);  // +x
            BuildBoxFace(out, 2, 1, 0, 1.0f, -1.0f, p.Depth, p.Height, -p.Width, ds, hs);  // -x
            BuildBoxFace(out, 0, 2, 1, 1.0f, 1.0f, p.Width, p.Depth, p.Height, ws, ds);    // +y
            BuildBoxFace(out, 0, 2, 1, 1.0f, -1.0f, p.Width, p.Depth, -p.Height, ws, ds);  // -y
            BuildBoxFace(out, 0, 1, 2, 1.0f, -1.0f, p.Width, p.Height, p.Depth, ws, hs);   // +z
            BuildBoxFace(out, 0, 1, 2, -1.0f, -1.0f, p.Width, p.Height, -p.Depth, ws, hs); // -z
            return out;
        }

        Core::Expected<GeometryBuffers> BuildSphere(const SphereParams& p)
        {
            if (p.Radius < 0.0f)
            {
                Core::Log::Error("Sphere geometry radius must be non-negative ({})", p.Radius);
                return Core::Err<GeometryBuffers>(Core::ErrorCode::InvalidArgument);
            }

            constexpr float kPi = std::numbers::pi_v<float>;
            const uint32_t ws = std::max(p.WidthSegments, 3u);
            const uint32_t hs = std::max(p.HeightSegments, 2u);
            const float thetaEnd = std::min(p.ThetaStart + p.ThetaLength, kPi);

            GeometryBuffers out;
            std::vector<std::vector<uint32_t>> grid;
            grid.reserve(hs + 1);
            uint32_t index = 0;

            for (uint32_t iy = 0; iy <= hs; ++iy)
            {
                std::vector<uint32_t> row;
                row.reserve(ws + 1);
                const float v = (float)iy / (float)hs;

                // Poles: shift u so the triangle fan meets in the middle of the segment
                float uOffset = 0.0f;
                if (iy == 0 && p.ThetaStart == 0.0f) uOffset = 0.5f / (float)ws;
                else if (iy == hs && thetaEnd == kPi) uOffset = -0.5f / (float)ws;

                for (uint32_t ix = 0; ix <= ws; ++ix)
                {
                    const float u = (float)ix / (float)ws;
                    const float phi = p.PhiStart + u * p.PhiLength;
                    const float theta = p.ThetaStart + v * p.ThetaLength;

                    const glm::vec3 position{
                        -p.Radius * std::cos(phi) * std::sin(theta),
                        p.Radius * std::cos(theta),
                        p.Radius * std::sin(phi) * std::sin(theta)};
                    out.Positions.push_back(position);

                    const float len = glm::length(position);
                    out.Normals.push_back(len > 0.0f ? position / len : glm::vec3(0.0f, 1.0f, 0.0f));
                    out.UVs.emplace_back(u + uOffset, 1.0f - v);
                    row.push_back(index++);
                }
                grid.push_back(std::move(row));
            }

            for (uint32_t iy = 0; iy < hs; ++iy)
            {
                for (uint32_t ix = 0; ix < ws; ++ix)
                {
                    const uint32_t a = grid[iy][ix + 1];
                    const uint32_t b = grid[iy][ix];
                    const uint32_t c = grid[iy + 1][ix];
                    const uint32_t d = grid[iy + 1][ix + 1];

                    if (iy != 0 || p.ThetaStart > 0.0f) out.Indices.insert(out.Indices.end(), {a, b, d});
                    if (iy != hs - 1 || thetaEnd < kPi) out.Indices.insert(out.Indices.end(), {b, c, d});
                }
            }
            return out;
        }

        Core::Expected<GeometryBuffers> BuildPlane(const PlaneParams& p)
        {
            if (p.Width < 0.0f || p.Height < 0.0f)
            {
                Core::Log::Error("Plane geometry extents must be non-negative ({}, {})", p.Width, p.Height);
                return Core::Err<GeometryBuffers>(Core::ErrorCode::InvalidArgument);
            }

            const uint32_t gridX = std::max(p.WidthSegments, 1u);
            const uint32_t gridY = std::max(p.HeightSegments, 1u);
            const uint32_t gridX1 = gridX + 1;
            const uint32_t gridY1 = gridY + 1;
            const float segmentWidth = p.Width / (float)gridX;
            const float segmentHeight = p.Height / (float)gridY;

            GeometryBuffers out;
            for (uint32_t iy = 0; iy < gridY1; ++iy)
            {
                const float y = (float)iy * segmentHeight - p.Height * 0.5f;
                for (uint32_t ix = 0; ix < gridX1; ++ix)
                {
                    const float x = (float)ix * segmentWidth - p.Width * 0.5f;
                    out.Positions.emplace_back(x, -y, 0.0f);
                    out.Normals.emplace_back(0.0f, 0.0f, 1.0f);
                    out.UVs.emplace_back((float)ix / (float)gridX, 1.0f - (float)iy / (float)gridY);
                }
            }

            for (uint32_t iy = 0; iy < gridY; ++iy)
            {
                for (uint32_t ix = 0; ix < gridX; ++ix)
                {
                    const uint32_t a = ix + gridX1 * iy;
                    const uint32_t b = ix + gridX1 * (iy + 1);
                    const uint32_t c = (ix + 1) + gridX1 * (iy + 1);
                    const uint32_t d = (ix + 1) + gridX1 * iy;
                    out.Indices.insert(out.Indices.end(), {a, b, d, b, c, d});
                }
            }
            return out;
        }

        Core::Expected<GeometryBuffers> BuildBuffer(const BufferParams& p)
        {
            const size_t count = p.Positions.size();
            if (!p.Normals.empty() && p.Normals.size() != count)
            {
                Core::Log::Error("Buffer geometry has {} normals for {} positions", p.Normals.size(), count);
                return Core::Err<GeometryBuffers>(Core::ErrorCode::InvalidArgument);
            }
            if (!p.UVs.empty() && p.UVs.size() != count)
            {
                Core::Log::Error("Buffer geometry has {} uvs for {} positions", p.UVs.size(), count);
                return Core::Err<GeometryBuffers>(Core::ErrorCode::InvalidArgument);
            }
            for (uint32_t idx : p.Indices)
            {
                if (idx >= count)
                {
                    Core::Log::Error("Buffer geometry index {} out of range ({} positions)", idx, count);
                    return Core::Err<GeometryBuffers>(Core::ErrorCode::InvalidArgument);
                }
            }

            return GeometryBuffers{p.Positions, p.Normals, p.UVs, p.Indices};
        }
    }

    Core::Expected<GeometryBuffers> BuildGeometry(const GeometryParams& params)
    {
        return std::visit(Overloaded{
            [](const BoxParams& p) { return BuildBox(p); },
            [](const SphereParams& p) { return BuildSphere(p); },
            [](const PlaneParams& p) { return BuildPlane(p); },
            [](const BufferParams& p) { return BuildBuffer(p); }
        }, params);
    }

    std::string_view Geometry::TypeName() const
    {
        switch (Params.index())
        {
            case 0: return "Box";
            case 1: return "Sphere";
            case 2: return "Plane";
            default: return "Buffer";
        }
    }

    void Geometry::Dispose()
    {
        Buffers = {};
        Disposed = true;
    }
}
