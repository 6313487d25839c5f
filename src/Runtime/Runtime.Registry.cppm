module;

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

export module Runtime.Registry;

import Core;
import Graphics;

export namespace Runtime
{
    // Heterogeneous lookup so string_view keys do not allocate.
    struct StringHash
    {
        using is_transparent = void;

        std::size_t operator()(std::string_view s) const noexcept
        {
            return std::hash<std::string_view>{}(s);
        }
    };

    // -------------------------------------------------------------------------
    // Registry - id keyed store for one resource kind
    // -------------------------------------------------------------------------
    // Entries live in Core::SlotAllocator slots, so a Handle taken before a
    // delete never resolves to a later entry that reused the slot. Iteration follows insertion order.
    //
    // Lookups of unknown ids return nullptr and log a warning. Deletes of
    // unknown ids log a warning and keep going.
    // -------------------------------------------------------------------------
    template <typename T>
    class Registry
    {
    public:
        using Handle = Core::StrongHandle<T>;
        using DisposeFn = std::function<void(Graphics::ResourceKind, std::string_view)>;

        explicit Registry(Graphics::ResourceKind kind) : m_Kind(kind) {}

        Registry(const Registry&) = delete;
        Registry& operator=(const Registry&) = delete;

        ~Registry() { Clear(); }

        [[nodiscard]] Graphics::ResourceKind GetKind() const { return m_Kind; }

        // Called with (kind, id) for every entry that leaves the registry.
        void SetDisposeHook(DisposeFn fn) { m_OnDispose = std::move(fn); }

        [[nodiscard]] bool Contains(std::string_view id) const
        {
            return m_Index.find(id) != m_Index.end();
        }

        // Returns "<kind>-<n>" not present in the registry.
        [[nodiscard]] std::string GenerateId()
        {
            std::string id;
            do
            {
                id = std::format("{}-{}", Graphics::ResourceKindToString(m_Kind), m_NextGeneratedId++);
            } while (Contains(id));
            return id;
        }

        // Takes ownership. Fails with DuplicateId (leaving the registry
        // unchanged) when the id is already taken.
        [[nodiscard]] Core::Expected<T*> Insert(std::string id, std::unique_ptr<T> resource)
        {
            if (Contains(id))
            {
                Core::Log::Error("A {} with id '{}' already exists", Graphics::ResourceKindToString(m_Kind), id);
                return Core::Err<T*>(Core::ErrorCode::DuplicateId);
            }

            const Handle handle = m_Allocator.Acquire();
            const uint32_t index = handle.Index;
            if (index >= m_Slots.size()) m_Slots.resize(index + 1);

            Slot& slot = m_Slots[index];
            slot.Data = std::move(resource);
            slot.Id = id;

            m_Index.emplace(std::move(id), index);
            m_Order.push_back(index);
            return slot.Data.get();
        }

        // Silent lookup.
        [[nodiscard]] T* TryGet(std::string_view id) const
        {
            auto it = m_Index.find(id);
            if (it == m_Index.end()) return nullptr;
            return m_Slots[it->second].Data.get();
        }

        [[nodiscard]] T* Get(std::string_view id) const
        {
            T* found = TryGet(id);
            if (!found)
                Core::Log::Warn("Could not find {} with id '{}'", Graphics::ResourceKindToString(m_Kind), id);
            return found;
        }

        // Positional: result[i] belongs to ids[i], nullptr for misses.
        [[nodiscard]] std::vector<T*> GetMany(const std::vector<std::string>& ids) const
        {
            std::vector<T*> result;
            result.reserve(ids.size());
            for (const auto& id : ids) result.push_back(Get(id));
            return result;
        }

        [[nodiscard]] Handle GetHandle(std::string_view id) const
        {
            auto it = m_Index.find(id);
            if (it == m_Index.end()) return {};
            return m_Allocator.HandleAt(it->second);
        }

        // nullptr when the entry the handle was taken from is gone.
        [[nodiscard]] T* Resolve(Handle handle) const
        {
            if (!m_Allocator.IsAlive(handle)) return nullptr;
            return m_Slots[handle.Index].Data.get();
        }

        // Disposes and removes. Returns false (with a warning) for unknown ids.
        bool Delete(std::string_view id)
        {
            auto it = m_Index.find(id);
            if (it == m_Index.end())
            {
                Core::Log::Warn("Could not find {} with id '{}' to delete", Graphics::ResourceKindToString(m_Kind), id);
                return false;
            }

            const uint32_t index = it->second;
            m_Index.erase(it);
            std::erase(m_Order, index);
            Release(index);
            return true;
        }

        void DeleteMany(const std::vector<std::string>& ids)
        {
            for (const auto& id : ids) Delete(id);
        }

        // Snapshot. Mutating the registry afterwards does not affect the map.
        [[nodiscard]] std::unordered_map<std::string, T*> GetAll() const
        {
            std::unordered_map<std::string, T*> all;
            all.reserve(m_Order.size());
            for (uint32_t index : m_Order) all.emplace(m_Slots[index].Id, m_Slots[index].Data.get());
            return all;
        }

        // Ids in insertion order.
        [[nodiscard]] std::vector<std::string> Ids() const
        {
            std::vector<std::string> ids;
            ids.reserve(m_Order.size());
            for (uint32_t index : m_Order) ids.push_back(m_Slots[index].Id);
            return ids;
        }

        template <typename Fn>
        void ForEach(Fn&& fn) const
        {
            for (uint32_t index : m_Order) fn(*m_Slots[index].Data);
        }

        [[nodiscard]] size_t Size() const { return m_Order.size(); }
        [[nodiscard]] bool Empty() const { return m_Order.empty(); }

        // Disposes every entry, newest first.
        void Clear()
        {
            while (!m_Order.empty())
            {
                const uint32_t index = m_Order.back();
                m_Order.pop_back();
                m_Index.erase(m_Slots[index].Id);
                Release(index);
            }
        }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data;
            std::string Id;
        };

        void Release(uint32_t index)
        {
            Slot& slot = m_Slots[index];
            if constexpr (requires(T& t) { t.Dispose(); })
            {
                slot.Data->Dispose();
            }
            if (m_OnDispose) m_OnDispose(m_Kind, slot.Id);

            slot.Data.reset();
            slot.Id.clear();
            m_Allocator.Release(m_Allocator.HandleAt(index));
        }

        Graphics::ResourceKind m_Kind;
        std::vector<Slot> m_Slots;
        Core::SlotAllocator<T> m_Allocator;
        std::unordered_map<std::string, uint32_t, StringHash, std::equal_to<>> m_Index;
        std::vector<uint32_t> m_Order;
        uint64_t m_NextGeneratedId = 1;
        DisposeFn m_OnDispose;
    };
}
