module;

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

module Runtime.MainLoop;

import Core;
import Graphics;
import Runtime.World;
import Runtime.FrameQueue;
import Runtime.ResizeDispatcher;

namespace Runtime
{
    MainLoop::MainLoop(World& world, FrameQueue& frames, ResizeDispatcher& resizers,
                       Core::Storage::KeyValueStore* store)
        : m_World(world), m_Frames(frames), m_Resizers(resizers), m_Store(store)
    {
        m_DeltaProvider = [this]() { return m_Clock.Tick(); };
    }

    void MainLoop::SetDeltaProvider(DeltaProvider provider)
    {
        if (provider) m_DeltaProvider = std::move(provider);
        else m_DeltaProvider = [this]() { return m_Clock.Tick(); };
    }

    // -------------------------------------------------------------------------
    // Init
    // -------------------------------------------------------------------------

    Core::Result MainLoop::Init(const LoopConfig& initial)
    {
        if (m_Initialized) return Core::Ok();

        if (!m_Renderer)
        {
            Core::Log::Error("Cannot start the main loop: no renderer");
            return Core::Err(Core::ErrorCode::MissingPrecondition);
        }
        if (!m_World.GetCurrentScene())
        {
            Core::Log::Error("Cannot start the main loop: no current scene");
            return Core::Err(Core::ErrorCode::MissingPrecondition);
        }
        if (!m_World.GetCurrentCamera())
        {
            Core::Log::Error("Cannot start the main loop: no current camera");
            return Core::Err(Core::ErrorCode::MissingPrecondition);
        }

        if (!m_Resizers.HasResizer(kViewportResizerId))
        {
            if (auto added = m_Resizers.AddResizer(std::string(kViewportResizerId), [this]() { ResizeViewport(); }); !added)
                return added;
        }

        m_Config = initial;
        LoadConfig();
        UpdateInterval();

        m_Initialized = true;
        Core::Log::Info("Main loop started (masterPlay={}, appPlay={}, maxFPS={})",
                        m_Config.MasterPlay, m_Config.AppPlay, m_Config.MaxFPS);

        if (m_Config.MasterPlay) m_Frames.RequestFrame([this]() { Tick(); });
        return Core::Ok();
    }

    void MainLoop::ResizeViewport()
    {
        Graphics::Camera* camera = m_World.GetCurrentCamera();
        if (!camera) return;

        const Viewport& viewport = m_World.GetViewport();
        Graphics::OnResize(*camera, viewport.Width, viewport.Height);
        Graphics::UpdateProjection(*camera);
        if (m_Renderer) m_Renderer->SetSize(viewport.Width, viewport.Height);
    }

    // -------------------------------------------------------------------------
    // Tick
    // -------------------------------------------------------------------------

    void MainLoop::RunLoopers(const std::vector<Graphics::Looper>& loopers)
    {
        for (const auto& looper : loopers)
        {
            if (looper) looper(m_Delta);
        }
    }

    void MainLoop::Tick()
    {
        if (!m_Config.MasterPlay)
        {
            m_IsMasterPlaying = false;
            return;
        }

        m_Frames.RequestFrame([this]() { Tick(); });
        m_IsMasterPlaying = true;
        m_Delta = m_DeltaProvider() * m_Config.PlaySpeedMultiplier;
        m_SincePresent += m_Delta;
        m_Stats.RecordTick(m_Delta);

        // Lists are copied: a looper may add or remove loopers
        if (Graphics::Scene* scene = m_World.GetCurrentScene())
        {
            const auto loopers = scene->MainLoopers;
            RunLoopers(loopers);
        }

        if (m_Config.AppPlay)
        {
            m_IsAppPlaying = true;
            if (Graphics::Scene* scene = m_World.GetCurrentScene())
            {
                const auto loopers = scene->AppLoopers;
                RunLoopers(loopers);
            }
        }
        else
        {
            m_IsAppPlaying = false;
        }

        if (m_Config.MaxFPS > 0.0)
        {
            m_Accumulator += m_Delta;
            if (m_Accumulator > m_MaxFPSInterval)
            {
                Present();
                m_Accumulator = std::fmod(m_Accumulator, m_MaxFPSInterval);
            }
        }
        else
        {
            Present();
        }
    }

    void MainLoop::Present()
    {
        Graphics::Scene* scene = m_World.GetCurrentScene();
        Graphics::Camera* camera = m_World.GetCurrentCamera();
        if (!m_Renderer || !scene || !camera)
        {
            Core::Log::Warn("Skipping presentation: renderer, current scene or current camera missing");
            return;
        }

        m_Renderer->Present(*scene, *camera);
        m_Stats.RecordPresent(m_SincePresent);
        m_SincePresent = 0.0;

        const auto late = scene->MainLateLoopers;
        RunLoopers(late);
    }

    // -------------------------------------------------------------------------
    // Controls
    // -------------------------------------------------------------------------

    void MainLoop::ToggleMainPlay(std::optional<bool> value)
    {
        m_Config.MasterPlay = value.value_or(!m_Config.MasterPlay);
        SaveConfig();

        // A halted loop does not reschedule itself
        if (m_Initialized && m_Config.MasterPlay && !m_IsMasterPlaying) Tick();
    }

    void MainLoop::ToggleAppPlay(std::optional<bool> value)
    {
        m_Config.AppPlay = value.value_or(!m_Config.AppPlay);
        SaveConfig();
    }

    void MainLoop::SetMaxFPS(double maxFPS)
    {
        m_Config.MaxFPS = std::max(0.0, maxFPS);
        UpdateInterval();
        SaveConfig();
    }

    void MainLoop::SetPlaySpeedMultiplier(double multiplier)
    {
        m_Config.PlaySpeedMultiplier = std::max(0.0, multiplier);
        SaveConfig();
    }

    void MainLoop::UpdateInterval()
    {
        if (m_Config.MaxFPS > 0.0)
        {
            m_MaxFPSInterval = 1.0 / m_Config.MaxFPS;
        }
        else
        {
            m_MaxFPSInterval = 0.0;
            m_Accumulator = 0.0;
        }
    }

    LoopState MainLoop::GetLoopState() const
    {
        LoopState state;
        state.Config = m_Config;
        state.IsMasterPlaying = m_IsMasterPlaying;
        state.IsAppPlaying = m_IsAppPlaying;
        state.MaxFPSInterval = m_MaxFPSInterval;
        state.Accumulator = m_Accumulator;
        state.Delta = m_Delta;
        state.Initialized = m_Initialized;
        return state;
    }

    // -------------------------------------------------------------------------
    // Persistence
    // -------------------------------------------------------------------------

    void MainLoop::LoadConfig()
    {
        if (!m_Store) return;

        const auto stored = m_Store->GetItem(kStorageKey);
        if (!stored) return;
        if (!stored->is_object())
        {
            Core::Log::Warn("Ignoring persisted loop config '{}': not an object", kStorageKey);
            return;
        }

        const auto& json = *stored;
        if (auto it = json.find("masterPlay"); it != json.end() && it->is_boolean()) m_Config.MasterPlay = it->get<bool>();
        if (auto it = json.find("appPlay"); it != json.end() && it->is_boolean()) m_Config.AppPlay = it->get<bool>();
        if (auto it = json.find("maxFPS"); it != json.end() && it->is_number())
            m_Config.MaxFPS = std::max(0.0, it->get<double>());
        if (auto it = json.find("playSpeedMultiplier"); it != json.end() && it->is_number())
            m_Config.PlaySpeedMultiplier = std::max(0.0, it->get<double>());
    }

    void MainLoop::SaveConfig()
    {
        if (!m_Store) return;

        Core::Storage::Json json = {
            {"masterPlay", m_Config.MasterPlay},
            {"appPlay", m_Config.AppPlay},
            {"maxFPS", m_Config.MaxFPS},
            {"playSpeedMultiplier", m_Config.PlaySpeedMultiplier},
        };
        if (auto saved = m_Store->SetItem(kStorageKey, std::move(json)); !saved)
            Core::Log::Warn("Loop config not persisted: {}", Core::ErrorCodeToString(saved.error()));
    }
}
