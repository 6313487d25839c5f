module;

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

module Runtime.Engine;

import Core;
import Graphics;
import Runtime.World;
import Runtime.FrameQueue;
import Runtime.ResizeDispatcher;
import Runtime.MainLoop;

namespace Runtime
{
    void ApplyEnvironmentOverrides(EngineConfig& config)
    {
        if (const char* maxFps = std::getenv("HEARTH_MAX_FPS"))
        {
            const std::string_view text(maxFps);
            double value = 0.0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || ptr != text.data() + text.size() || value < 0.0)
                Core::Log::Warn("Ignoring HEARTH_MAX_FPS='{}': expected a non-negative number", text);
            else
                config.MaxFPS = value;
        }

        if (const char* storage = std::getenv("HEARTH_STORAGE_PATH"))
            config.StoragePath = storage;
    }

    Engine::Engine(const EngineConfig& config)
        : m_Config(config),
          m_Store(config.StoragePath.empty()
                      ? std::make_unique<Core::Storage::KeyValueStore>()
                      : std::make_unique<Core::Storage::KeyValueStore>(config.StoragePath)),
          m_Resizers(m_World)
    {
        m_World.SetViewport(config.Width, config.Height);
        m_MainLoop = std::make_unique<MainLoop>(m_World, m_Frames, m_Resizers, m_Store.get());
        Core::Log::Info("Engine '{}' created ({}x{})", config.AppName, config.Width, config.Height);
    }

    Engine::~Engine()
    {
        // Loopers may capture the renderer; drop the world first
        m_World.Clear();
        m_World.DisconnectGpuHooks();
    }

    void Engine::SetRenderer(std::unique_ptr<Graphics::IRenderer> renderer)
    {
        m_World.DisconnectGpuHooks();
        m_Renderer = std::move(renderer);
        m_MainLoop->SetRenderer(m_Renderer.get());
        if (m_Renderer)
        {
            m_World.ConnectGpuHooks(*m_Renderer);
            m_Renderer->SetSize(m_World.GetViewport().Width, m_World.GetViewport().Height);
        }
    }

    Core::Result Engine::InitLoop()
    {
        LoopConfig initial;
        initial.MaxFPS = m_Config.MaxFPS;
        return m_MainLoop->Init(initial);
    }

    void Engine::OnResize(uint32_t width, uint32_t height)
    {
        m_Resizers.OnResize(width, height);
    }

    size_t Engine::RunFrame()
    {
        return m_Frames.Dispatch();
    }

    void Engine::RunOnMainThread(std::function<void()> task)
    {
        m_Frames.Post(std::move(task));
    }
}
