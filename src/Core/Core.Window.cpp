module;
#include <GLFW/glfw3.h>
#include <cstdint>
#include <memory>
#include <string>

module Core.Window;

import Core;

namespace Core::Windowing
{
    namespace
    {
        uint32_t s_LiveWindows = 0;

        void OnGlfwError(int error, const char* description)
        {
            Log::Error("GLFW error ({}): {}", error, description);
        }

        bool AcquireGlfw()
        {
            if (s_LiveWindows == 0)
            {
                glfwSetErrorCallback(OnGlfwError);
                if (!glfwInit())
                {
                    Log::Error("Could not initialize GLFW");
                    return false;
                }
            }
            ++s_LiveWindows;
            return true;
        }

        void ReleaseGlfw()
        {
            if (s_LiveWindows == 0) return;
            if (--s_LiveWindows == 0) glfwTerminate();
        }

        uint32_t ToExtent(int value)
        {
            return value > 0 ? static_cast<uint32_t>(value) : 0u;
        }
    }

    Expected<std::unique_ptr<Window>> Window::Create(const WindowProps& props)
    {
        if (props.Width == 0 || props.Height == 0)
        {
            Log::Error("Cannot create window '{}' with size {}x{}", props.Title, props.Width, props.Height);
            return Err<std::unique_ptr<Window>>(ErrorCode::InvalidArgument);
        }

        if (!AcquireGlfw()) return Err<std::unique_ptr<Window>>(ErrorCode::WindowCreationFailed);

        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        glfwWindowHint(GLFW_RESIZABLE, props.Resizable ? GLFW_TRUE : GLFW_FALSE);

        GLFWwindow* handle = glfwCreateWindow(static_cast<int>(props.Width), static_cast<int>(props.Height),
                                              props.Title.c_str(), nullptr, nullptr);
        if (!handle)
        {
            Log::Error("Failed to create window '{}'", props.Title);
            ReleaseGlfw();
            return Err<std::unique_ptr<Window>>(ErrorCode::WindowCreationFailed);
        }

        std::unique_ptr<Window> window(new Window());
        window->m_Handle = handle;

        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(handle, &width, &height);
        window->m_State.FramebufferWidth = ToExtent(width);
        window->m_State.FramebufferHeight = ToExtent(height);
        window->InstallCallbacks();

        Log::Info("Window '{}' opened ({}x{} framebuffer)", props.Title,
                  window->m_State.FramebufferWidth, window->m_State.FramebufferHeight);
        return window;
    }

    Window::~Window()
    {
        if (!m_Handle) return;
        glfwDestroyWindow(static_cast<GLFWwindow*>(m_Handle));
        m_Handle = nullptr;
        ReleaseGlfw();
    }

    void Window::InstallCallbacks()
    {
        auto* handle = static_cast<GLFWwindow*>(m_Handle);
        glfwSetWindowUserPointer(handle, &m_State);

        glfwSetFramebufferSizeCallback(handle, [](GLFWwindow* w, int width, int height)
        {
            State& state = *static_cast<State*>(glfwGetWindowUserPointer(w));
            state.FramebufferWidth = ToExtent(width);
            state.FramebufferHeight = ToExtent(height);
            if (state.Callback) state.Callback(FramebufferResizeEvent{state.FramebufferWidth, state.FramebufferHeight});
        });

        glfwSetWindowCloseCallback(handle, [](GLFWwindow* w)
        {
            State& state = *static_cast<State*>(glfwGetWindowUserPointer(w));
            if (state.Callback) state.Callback(WindowCloseEvent{});
        });

        glfwSetKeyCallback(handle, [](GLFWwindow* w, int key, int, int action, int)
        {
            if (action == GLFW_REPEAT) return;
            State& state = *static_cast<State*>(glfwGetWindowUserPointer(w));
            if (state.Callback) state.Callback(KeyEvent{key, action == GLFW_PRESS});
        });
    }

    void Window::PollEvents()
    {
        glfwPollEvents();
    }

    bool Window::ShouldClose() const
    {
        return glfwWindowShouldClose(static_cast<GLFWwindow*>(m_Handle)) == GLFW_TRUE;
    }

    void Window::SetTitle(const std::string& title) const
    {
        glfwSetWindowTitle(static_cast<GLFWwindow*>(m_Handle), title.c_str());
    }
}
