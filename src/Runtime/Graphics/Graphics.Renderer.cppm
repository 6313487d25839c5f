module;
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

export module Graphics:Renderer;

import :ResourceKind;
import :Camera;
import :Scene;

export namespace Graphics
{
    // Receives registry disposals so GPU-side copies can be released.
    class IGpuResourceSink
    {
    public:
        virtual ~IGpuResourceSink() = default;
        virtual void OnResourceDisposed(ResourceKind kind, std::string_view id) = 0;
    };

    // The presentation backend. Draws one scene through one camera.
    class IRenderer : public IGpuResourceSink
    {
    public:
        virtual void Present(const Scene& scene, const Camera& camera) = 0;
        virtual void SetSize(uint32_t width, uint32_t height) = 0;

        void OnResourceDisposed(ResourceKind, std::string_view) override {}
    };

    // Records every call. Used headless and in tests.
    class NullRenderer final : public IRenderer
    {
    public:
        struct Presentation
        {
            std::string SceneId;
            std::string CameraId;
        };

        void Present(const Scene& scene, const Camera& camera) override
        {
            m_Presentations.push_back({scene.Id, camera.Id});
        }

        void SetSize(uint32_t width, uint32_t height) override
        {
            m_Width = width;
            m_Height = height;
            ++m_ResizeCount;
        }

        void OnResourceDisposed(ResourceKind kind, std::string_view id) override
        {
            m_Disposed.emplace_back(kind, std::string(id));
        }

        [[nodiscard]] size_t GetPresentCount() const { return m_Presentations.size(); }
        [[nodiscard]] const std::vector<Presentation>& GetPresentations() const { return m_Presentations; }
        [[nodiscard]] const std::vector<std::pair<ResourceKind, std::string>>& GetDisposed() const { return m_Disposed; }
        [[nodiscard]] uint32_t GetWidth() const { return m_Width; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Height; }
        [[nodiscard]] uint32_t GetResizeCount() const { return m_ResizeCount; }

    private:
        std::vector<Presentation> m_Presentations;
        std::vector<std::pair<ResourceKind, std::string>> m_Disposed;
        uint32_t m_Width = 0;
        uint32_t m_Height = 0;
        uint32_t m_ResizeCount = 0;
    };
}
