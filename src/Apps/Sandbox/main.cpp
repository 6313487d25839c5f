#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <variant>
#include <glm/glm.hpp>

import Core;
import Core.Window;
import Graphics;
import Runtime.World;
import Runtime.MainLoop;
import Runtime.Engine;

using namespace Core;
using namespace Runtime;

// --- The Application Class ---
class SandboxApp
{
public:
    explicit SandboxApp(const EngineConfig& config) : m_Engine(config)
    {
    }

    Result OnStart()
    {
        Log::Info("Sandbox Started!");

        m_Engine.SetRenderer(std::make_unique<Graphics::NullRenderer>());
        World& world = m_Engine.GetWorld();

        Graphics::CameraParams cameraParams;
        cameraParams.Position = {0.0f, 2.0f, 8.0f};
        cameraParams.MakeCurrent = true;
        if (auto camera = world.CreateCamera("mainCamera", cameraParams); !camera) return Err(camera.error());

        Graphics::SceneOptions sceneOptions;
        sceneOptions.Name = "Sandbox";
        sceneOptions.Background = glm::vec3(0.1f, 0.1f, 0.12f);
        if (auto scene = world.CreateScene("sandboxScene", std::move(sceneOptions)); !scene) return Err(scene.error());

        // Shared geometry, two materials
        if (auto geo = world.CreateGeometry({"cubeGeo", Graphics::BoxParams{}}); !geo) return Err(geo.error());

        Graphics::MaterialDesc red{.Id = "redMat", .Params = Graphics::StandardParams{.Roughness = 0.4f}};
        red.Common.Color = {0.8f, 0.1f, 0.1f};
        Graphics::MaterialDesc blue{.Id = "blueMat", .Params = Graphics::PhongParams{}};
        blue.Common.Color = {0.1f, 0.2f, 0.8f};

        Graphics::MeshDesc left{.Id = "leftCube", .Geometry = std::string("cubeGeo"), .Materials = {red}};
        Graphics::MeshDesc right{.Id = "rightCube", .Geometry = std::string("cubeGeo"), .Materials = {blue}};
        auto leftMesh = world.CreateMesh(left);
        if (!leftMesh) return Err(leftMesh.error());
        auto rightMesh = world.CreateMesh(right);
        if (!rightMesh) return Err(rightMesh.error());

        Graphics::MeshDesc floor{.Id = "floor",
                                 .Geometry = Graphics::GeometryDesc{"floorGeo", Graphics::PlaneParams{.Width = 20.0f, .Height = 20.0f}},
                                 .Materials = {Graphics::MaterialDesc{.Id = "floorMat"}},
                                 .ReceiveShadow = true};
        auto floorMesh = world.CreateMesh(floor);
        if (!floorMesh) return Err(floorMesh.error());

        auto cubes = world.CreateGroup("cubes", {(*leftMesh)->Node, (*rightMesh)->Node});
        if (!cubes) return Err(cubes.error());

        auto ambient = world.CreateLight({"ambient", Graphics::AmbientLightParams{.Intensity = 0.3f}});
        if (!ambient) return Err(ambient.error());
        auto sun = world.CreateLight({"sun", Graphics::DirectionalLightParams{.Position = {5.0f, 10.0f, 5.0f}, .CastShadow = true}});
        if (!sun) return Err(sun.error());

        world.AddToScene("sandboxScene", {(*cubes)->Node, (*floorMesh)->Node, (*ambient)->Node, (*sun)->Node});

        world.AddSceneMainLooper([this](double) { ++m_Ticks; });
        world.AddSceneAppLooper([this](double delta)
        {
            m_Elapsed += m_Engine.GetMainLoop().TransformTimeValue(delta * 1000.0) / 1000.0;
        });

        return m_Engine.InitLoop();
    }

    int RunHeadless(uint64_t frames)
    {
        for (uint64_t i = 0; i < frames; ++i) m_Engine.RunFrame();
        Report();
        return EXIT_SUCCESS;
    }

    int RunWindowed()
    {
        Windowing::WindowProps props;
        props.Title = m_Engine.GetConfig().AppName;
        props.Width = m_Engine.GetConfig().Width;
        props.Height = m_Engine.GetConfig().Height;

        auto created = Windowing::Window::Create(props);
        if (!created)
        {
            Log::Error("Window creation failed: {}", ErrorCodeToString(created.error()));
            return EXIT_FAILURE;
        }
        Windowing::Window& window = **created;

        bool running = true;
        window.SetEventCallback([&](const Windowing::Event& e)
        {
            std::visit([&](auto&& arg)
            {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, Windowing::WindowCloseEvent>)
                {
                    running = false;
                }
                else if constexpr (std::is_same_v<T, Windowing::FramebufferResizeEvent>)
                {
                    // Minimized
                    if (arg.Width == 0 || arg.Height == 0) return;
                    m_Engine.OnResize(arg.Width, arg.Height);
                }
                else if constexpr (std::is_same_v<T, Windowing::KeyEvent>)
                {
                    if (!arg.IsPressed) return;
                    if (arg.KeyCode == 'P') m_Engine.GetMainLoop().ToggleMainPlay();
                    if (arg.KeyCode == 'A') m_Engine.GetMainLoop().ToggleAppPlay();
                }
            }, e);
        });

        m_Engine.OnResize(window.GetFramebufferWidth(), window.GetFramebufferHeight());

        while (running && !window.ShouldClose())
        {
            window.PollEvents();
            m_Engine.RunFrame();

            const auto& stats = m_Engine.GetMainLoop().GetStats();
            if (stats.TickCount % 60 == 0)
                window.SetTitle(std::format("{} - {:.1f} fps", props.Title, stats.AverageFps()));

            // No swapchain to block on
            std::this_thread::sleep_for(std::chrono::milliseconds(16));
        }

        Report();
        return EXIT_SUCCESS;
    }

private:
    void Report() const
    {
        const auto& stats = m_Engine.GetMainLoop().GetStats();
        Log::Info("Ticks: {}, presented: {}, avg frame {:.2f} ms, app time {:.2f} s",
                  m_Ticks, stats.PresentedFrames, stats.AverageFrameTimeMs(), m_Elapsed);
    }

    Engine m_Engine;
    uint64_t m_Ticks = 0;
    double m_Elapsed = 0.0;
};

int main(int argc, char** argv)
{
    EngineConfig config{"Hearth Sandbox", 1600, 900};
    ApplyEnvironmentOverrides(config);

    std::optional<uint64_t> headlessFrames;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (arg == "--headless")
        {
            headlessFrames = 120;
            if (i + 1 < argc) headlessFrames = std::strtoull(argv[++i], nullptr, 10);
        }
    }

    SandboxApp app(config);
    if (auto started = app.OnStart(); !started)
    {
        Log::Error("Sandbox failed to start: {}", ErrorCodeToString(started.error()));
        return EXIT_FAILURE;
    }

    return headlessFrames ? app.RunHeadless(*headlessFrames) : app.RunWindowed();
}
