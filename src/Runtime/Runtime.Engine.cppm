module;

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

export module Runtime.Engine;

import Core;
import Graphics;
import Runtime.World;
import Runtime.FrameQueue;
import Runtime.ResizeDispatcher;
import Runtime.MainLoop;

export namespace Runtime
{
    struct EngineConfig
    {
        std::string AppName = "Hearth App";
        uint32_t Width = 1600;
        uint32_t Height = 900;
        double MaxFPS = 0.0;     // 0 = uncapped
        std::string StoragePath; // Empty = settings kept in memory only
    };

    // Reads HEARTH_MAX_FPS and HEARTH_STORAGE_PATH. Invalid values are
    // reported and ignored.
    void ApplyEnvironmentOverrides(EngineConfig& config);

    // Owns the world and everything that drives it. The host feeds resize
    // events through OnResize() and calls RunFrame() once per display frame.
    class Engine
    {
    public:
        explicit Engine(const EngineConfig& config);
        ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        [[nodiscard]] World& GetWorld() { return m_World; }
        [[nodiscard]] FrameQueue& GetFrameQueue() { return m_Frames; }
        [[nodiscard]] ResizeDispatcher& GetResizeDispatcher() { return m_Resizers; }
        [[nodiscard]] MainLoop& GetMainLoop() { return *m_MainLoop; }
        [[nodiscard]] const MainLoop& GetMainLoop() const { return *m_MainLoop; }
        [[nodiscard]] Core::Storage::KeyValueStore& GetStore() { return *m_Store; }
        [[nodiscard]] const EngineConfig& GetConfig() const { return m_Config; }

        // Takes ownership and connects the renderer's disposal hooks.
        void SetRenderer(std::unique_ptr<Graphics::IRenderer> renderer);
        [[nodiscard]] Graphics::IRenderer* GetRenderer() const { return m_Renderer.get(); }

        [[nodiscard]] Core::Result InitLoop();

        void OnResize(uint32_t width, uint32_t height);

        // One "next frame" signal. Returns the number of frame callbacks run.
        size_t RunFrame();

        // Thread-safe. The task runs at the start of the next RunFrame().
        void RunOnMainThread(std::function<void()> task);

    private:
        EngineConfig m_Config;
        std::unique_ptr<Core::Storage::KeyValueStore> m_Store;
        World m_World;
        FrameQueue m_Frames;
        ResizeDispatcher m_Resizers;
        std::unique_ptr<Graphics::IRenderer> m_Renderer;
        std::unique_ptr<MainLoop> m_MainLoop;
    };
}
