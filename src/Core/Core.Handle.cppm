module;
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <vector>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - typed generational reference to a registry slot
    // -------------------------------------------------------------------------
    // The slot index is recycled after a delete, the generation is not, so a
    // handle kept across a delete no longer resolves instead of silently
    // pointing at a newer entry that reused the slot.
    //
    //   struct CameraTag {};
    //   using CameraHandle = Core::StrongHandle<CameraTag>;
    //
    //   // CameraHandle c = sceneHandle; // Compile error - different types!
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        constexpr void Reset() noexcept
        {
            Index = INVALID_INDEX;
            Generation = 0;
        }

        auto operator<=>(const StrongHandle&) const = default;
    };

    // -------------------------------------------------------------------------
    // SlotAllocator - index/generation bookkeeping behind StrongHandle
    // -------------------------------------------------------------------------
    // Hands out slot indices, oldest freed slot first. Each Acquire() bumps the
    // slot's generation, so handles from the previous occupant go stale.
    // Owners keep their payload in a parallel array indexed by Handle::Index.
    // -------------------------------------------------------------------------
    template <typename Tag>
    class SlotAllocator
    {
    public:
        using Handle = StrongHandle<Tag>;

        [[nodiscard]] Handle Acquire()
        {
            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                index = static_cast<uint32_t>(m_Generations.size());
                m_Generations.push_back(0);
                m_Alive.push_back(false);
            }

            ++m_Generations[index];
            m_Alive[index] = true;
            return {index, m_Generations[index]};
        }

        // Returns false for stale or invalid handles.
        bool Release(Handle handle)
        {
            if (!IsAlive(handle)) return false;
            m_Alive[handle.Index] = false;
            m_FreeIndices.push_back(handle.Index);
            return true;
        }

        [[nodiscard]] bool IsAlive(Handle handle) const
        {
            return handle.Index < m_Generations.size()
                && m_Alive[handle.Index]
                && m_Generations[handle.Index] == handle.Generation;
        }

        // Current handle for an occupied slot, invalid for a free one.
        [[nodiscard]] Handle HandleAt(uint32_t index) const
        {
            if (index >= m_Generations.size() || !m_Alive[index]) return {};
            return {index, m_Generations[index]};
        }

        [[nodiscard]] size_t Capacity() const { return m_Generations.size(); }
        [[nodiscard]] size_t LiveCount() const { return m_Generations.size() - m_FreeIndices.size(); }

    private:
        std::vector<uint32_t> m_Generations;
        std::vector<bool> m_Alive;
        std::deque<uint32_t> m_FreeIndices;
    };
}
