module;

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

export module Runtime.MainLoop;

import Core;
import Graphics;
import Runtime.World;
import Runtime.FrameQueue;
import Runtime.ResizeDispatcher;

export namespace Runtime
{
    // Persisted part of the loop state.
    struct LoopConfig
    {
        bool MasterPlay = true;
        bool AppPlay = true;
        double MaxFPS = 0.0; // 0 = present every tick
        double PlaySpeedMultiplier = 1.0;
    };

    // Read-only snapshot for UI/debug.
    struct LoopState
    {
        LoopConfig Config;
        bool IsMasterPlaying = false;
        bool IsAppPlaying = false;
        double MaxFPSInterval = 0.0;
        double Accumulator = 0.0;
        double Delta = 0.0;
        bool Initialized = false;
    };

    // -------------------------------------------------------------------------
    // MainLoop - cooperative frame scheduler
    // -------------------------------------------------------------------------
    // Each tick reschedules itself on the FrameQueue while MasterPlay holds.
    // Order within a tick: main loopers, app loopers (if AppPlay), presentation
    // gating, late loopers (after a presentation only).
    //
    // With MaxFPS > 0 time is accumulated and a frame is presented once the
    // accumulator exceeds 1/MaxFPS; the remainder carries over.
    // -------------------------------------------------------------------------
    class MainLoop
    {
    public:
        using DeltaProvider = std::function<double()>;

        static constexpr std::string_view kStorageKey = "hearth.loop";
        static constexpr std::string_view kViewportResizerId = "canvasResizer";

        MainLoop(World& world, FrameQueue& frames, ResizeDispatcher& resizers,
                 Core::Storage::KeyValueStore* store = nullptr);

        MainLoop(const MainLoop&) = delete;
        MainLoop& operator=(const MainLoop&) = delete;

        void SetRenderer(Graphics::IRenderer* renderer) { m_Renderer = renderer; }
        [[nodiscard]] Graphics::IRenderer* GetRenderer() const { return m_Renderer; }

        // Seconds since the previous tick. Defaults to a steady clock.
        void SetDeltaProvider(DeltaProvider provider);

        // Fails with MissingPrecondition unless a renderer, a current scene
        // and a current camera exist. A second successful call is a no-op.
        // Persisted settings override 'initial'.
        [[nodiscard]] Core::Result Init(const LoopConfig& initial = {});

        void Tick();

        // Flips when no value is given. Turning master play back on restarts
        // a halted loop immediately.
        void ToggleMainPlay(std::optional<bool> value = {});
        void ToggleAppPlay(std::optional<bool> value = {});
        void SetMaxFPS(double maxFPS);
        void SetPlaySpeedMultiplier(double multiplier);

        [[nodiscard]] double GetDelta() const { return m_Delta; }
        [[nodiscard]] double TransformSpeedValue(double unitsPerSecond) const { return m_Delta * unitsPerSecond; }
        [[nodiscard]] double TransformTimeValue(double milliseconds) const { return milliseconds * m_Config.PlaySpeedMultiplier; }

        [[nodiscard]] LoopState GetLoopState() const;
        [[nodiscard]] const LoopConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] double GetAccumulator() const { return m_Accumulator; }
        [[nodiscard]] bool IsInitialized() const { return m_Initialized; }
        [[nodiscard]] const Core::Telemetry::FrameStats& GetStats() const { return m_Stats; }

    private:
        void Present();
        void RunLoopers(const std::vector<Graphics::Looper>& loopers);
        void LoadConfig();
        void SaveConfig();
        void UpdateInterval();
        void ResizeViewport();

        World& m_World;
        FrameQueue& m_Frames;
        ResizeDispatcher& m_Resizers;
        Core::Storage::KeyValueStore* m_Store = nullptr;
        Graphics::IRenderer* m_Renderer = nullptr;

        DeltaProvider m_DeltaProvider;
        Core::Telemetry::FrameClock m_Clock;
        Core::Telemetry::FrameStats m_Stats;

        LoopConfig m_Config;
        bool m_IsMasterPlaying = false;
        bool m_IsAppPlaying = false;
        bool m_Initialized = false;

        double m_MaxFPSInterval = 0.0;
        double m_Accumulator = 0.0;
        double m_Delta = 0.0;
        double m_SincePresent = 0.0;
    };
}
