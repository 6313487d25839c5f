module;

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

export module Core:Storage;

import :Error;

// -------------------------------------------------------------------------
// Core::Storage::KeyValueStore - JSON-encoded persisted settings
// -------------------------------------------------------------------------
// Holds one JSON object. Opened with a path it is loaded from disk once and
// written through on every SetItem/RemoveItem; default-constructed it only
// lives in memory. Not thread-safe; used from the main thread only.
// -------------------------------------------------------------------------

export namespace Core::Storage
{
    using Json = nlohmann::json;

    class KeyValueStore
    {
    public:
        KeyValueStore() = default;
        explicit KeyValueStore(std::filesystem::path path);

        [[nodiscard]] std::optional<Json> GetItem(std::string_view key) const;
        [[nodiscard]] bool Contains(std::string_view key) const;

        Result SetItem(std::string_view key, Json value);
        Result RemoveItem(std::string_view key);

        [[nodiscard]] bool IsPersistent() const { return !m_Path.empty(); }
        [[nodiscard]] const std::filesystem::path& GetPath() const { return m_Path; }
        [[nodiscard]] size_t Size() const { return m_Document.size(); }

    private:
        void Load();
        [[nodiscard]] Result Flush() const;

        std::filesystem::path m_Path;
        Json m_Document = Json::object();
    };
}
