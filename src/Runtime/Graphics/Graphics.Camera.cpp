module;
#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

module Graphics:Camera.Impl;
import :Camera;

namespace Graphics
{
    void UpdateProjection(Camera& camera)
    {
        camera.ViewMatrix = glm::lookAt(camera.Position, camera.Target, camera.Up);
        camera.ProjectionMatrix = glm::perspective(glm::radians(camera.Fov), camera.AspectRatio, camera.Near, camera.Far);
    }

    void OnResize(Camera& camera, uint32_t width, uint32_t height)
    {
        if (height > 0) camera.AspectRatio = (float)width / (float)height;
    }
}
