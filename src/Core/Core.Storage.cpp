module;

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

module Core:Storage.Impl;

import :Storage;
import :Error;
import :Logging;

namespace Core::Storage
{
    KeyValueStore::KeyValueStore(std::filesystem::path path) : m_Path(std::move(path))
    {
        Load();
    }

    void KeyValueStore::Load()
    {
        std::error_code ec;
        if (!std::filesystem::exists(m_Path, ec) || ec)
        {
            Log::Debug("KeyValueStore: '{}' does not exist yet, starting empty.", m_Path.string());
            return;
        }

        std::ifstream in(m_Path, std::ios::binary);
        if (!in)
        {
            Log::Warn("KeyValueStore: could not open '{}' for reading, starting empty.", m_Path.string());
            return;
        }

        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (text.empty()) return;

        // Non-throwing parse: a discarded value signals malformed input.
        Json parsed = Json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object())
        {
            Log::Warn("KeyValueStore: '{}' is not a JSON object, starting empty.", m_Path.string());
            return;
        }

        m_Document = std::move(parsed);
        Log::Info("KeyValueStore: loaded {} item(s) from '{}'.", m_Document.size(), m_Path.string());
    }

    std::optional<Json> KeyValueStore::GetItem(std::string_view key) const
    {
        auto it = m_Document.find(std::string(key));
        if (it == m_Document.end()) return std::nullopt;
        return *it;
    }

    bool KeyValueStore::Contains(std::string_view key) const
    {
        return m_Document.contains(std::string(key));
    }

    Result KeyValueStore::SetItem(std::string_view key, Json value)
    {
        m_Document[std::string(key)] = std::move(value);
        return Flush();
    }

    Result KeyValueStore::RemoveItem(std::string_view key)
    {
        if (m_Document.erase(std::string(key)) == 0) return Ok();
        return Flush();
    }

    Result KeyValueStore::Flush() const
    {
        if (!IsPersistent()) return Ok();

        std::ofstream out(m_Path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            Log::Error("KeyValueStore: could not open '{}' for writing.", m_Path.string());
            return Err(ErrorCode::FileWriteError);
        }

        out << m_Document.dump(2);
        if (!out)
        {
            Log::Error("KeyValueStore: failed writing '{}'.", m_Path.string());
            return Err(ErrorCode::FileWriteError);
        }
        return Ok();
    }
}
