module;
#include <cstdint>
#include <optional>
#include <string>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Graphics:Camera;

export namespace Graphics
{
    struct CameraParams
    {
        float Fov = 45.0f; // Degrees, vertical
        float Near = 0.1f;
        float Far = 1000.0f;
        std::optional<float> AspectRatio; // Derived from the viewport when unset
        glm::vec3 Position{0.0f, 0.0f, 5.0f};
        glm::vec3 Target{0.0f, 0.0f, 0.0f};
        bool MakeCurrent = false;
    };

    struct Camera
    {
        std::string Id;
        entt::entity Node = entt::null;

        glm::vec3 Position{0.0f, 0.0f, 5.0f};
        glm::vec3 Target{0.0f, 0.0f, 0.0f};
        glm::vec3 Up{0.0f, 1.0f, 0.0f};

        float Fov = 45.0f;
        float AspectRatio = 1.0f;
        float Near = 0.1f;
        float Far = 1000.0f;

        glm::mat4 ViewMatrix{1.0f};
        glm::mat4 ProjectionMatrix{1.0f};
    };

    // Recomputes view and projection from the camera's current fields.
    void UpdateProjection(Camera& camera);

    // Adopts width/height as the new aspect ratio. Zero height is ignored.
    void OnResize(Camera& camera, uint32_t width, uint32_t height);
}
