module;
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>

export module Core.Window;

import Core;

export namespace Core::Windowing
{
    struct WindowProps
    {
        std::string Title = "Hearth";
        uint32_t Width = 1280;
        uint32_t Height = 720;
        bool Resizable = true;
    };

    struct WindowCloseEvent
    {
    };

    // Drawable size in pixels. Zero while minimized.
    struct FramebufferResizeEvent
    {
        uint32_t Width;
        uint32_t Height;
    };

    struct KeyEvent
    {
        int KeyCode; // GLFW_KEY_*; printable keys match their upper-case ASCII
        bool IsPressed;
    };

    using Event = std::variant<WindowCloseEvent, FramebufferResizeEvent, KeyEvent>;
    using EventCallbackFn = std::function<void(const Event&)>;

    // -------------------------------------------------------------------------
    // Window - host surface for the sandbox
    // -------------------------------------------------------------------------
    // Opens a GLFW window without a client API; drawing belongs to whatever
    // IRenderer the host installs. GLFW is initialised with the first window
    // and terminated with the last one.
    // -------------------------------------------------------------------------
    class Window
    {
    public:
        [[nodiscard]] static Expected<std::unique_ptr<Window>> Create(const WindowProps& props);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        // Polls GLFW. Events are delivered to the callback from here.
        void PollEvents();

        [[nodiscard]] bool ShouldClose() const;
        [[nodiscard]] void* GetNativeHandle() const { return m_Handle; } // GLFWwindow*
        [[nodiscard]] uint32_t GetFramebufferWidth() const { return m_State.FramebufferWidth; }
        [[nodiscard]] uint32_t GetFramebufferHeight() const { return m_State.FramebufferHeight; }

        void SetEventCallback(EventCallbackFn callback) { m_State.Callback = std::move(callback); }
        void SetTitle(const std::string& title) const;

    private:
        // Reachable from GLFW callbacks through the window user pointer.
        struct State
        {
            uint32_t FramebufferWidth = 0;
            uint32_t FramebufferHeight = 0;
            EventCallbackFn Callback;
        };

        Window() = default;
        void InstallCallbacks();

        void* m_Handle = nullptr;
        State m_State;
    };
}
