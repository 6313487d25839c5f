module;

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

export module Runtime.ResizeDispatcher;

import Core;
import Graphics;
import Runtime.World;

export namespace Runtime
{
    // Keyed resize callbacks, separate from the per-scene resizer lists.
    // OnResize() updates the world viewport, runs the global resizers in
    // registration order, then each scene's resizers (scenes in creation
    // order, each list in registration order).
    class ResizeDispatcher
    {
    public:
        explicit ResizeDispatcher(World& world) : m_World(world) {}

        // Fails with DuplicateId when 'id' is taken.
        [[nodiscard]] Core::Result AddResizer(std::string id, Graphics::Resizer resizer);
        // Warns when 'id' is unknown.
        void DeleteResizer(std::string_view id);

        [[nodiscard]] bool HasResizer(std::string_view id) const;
        [[nodiscard]] size_t GetResizerCount() const { return m_Resizers.size(); }
        [[nodiscard]] std::vector<std::string> GetResizerIds() const;

        void OnResize(uint32_t width, uint32_t height);

    private:
        World& m_World;
        std::vector<std::pair<std::string, Graphics::Resizer>> m_Resizers;
    };
}
