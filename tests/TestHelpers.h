#pragma once

// =============================================================================
// Shared helpers for the runtime test suites.
//
// Usage: #include "TestHelpers.h" AFTER `import Core;`. Everything is inline
// to avoid ODR issues across translation units.
// =============================================================================

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Captures log output for the lifetime of the object. Messages still go to
// stdout; the copy kept here lets tests count warnings.
class LogCapture
{
public:
    LogCapture()
    {
        Core::Log::SetSink([this](Core::Log::Level level, std::string_view msg)
        {
            m_Entries.emplace_back(level, std::string(msg));
        });
    }

    ~LogCapture() { Core::Log::SetSink({}); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] size_t Count(Core::Log::Level level) const
    {
        size_t n = 0;
        for (const auto& [lvl, msg] : m_Entries)
            if (lvl == level) ++n;
        return n;
    }

    [[nodiscard]] size_t Warnings() const { return Count(Core::Log::Level::Warning); }
    [[nodiscard]] size_t Errors() const { return Count(Core::Log::Level::Error); }

    [[nodiscard]] bool Contains(std::string_view needle) const
    {
        for (const auto& [lvl, msg] : m_Entries)
            if (msg.find(needle) != std::string::npos) return true;
        return false;
    }

    void Clear() { m_Entries.clear(); }

private:
    std::vector<std::pair<Core::Log::Level, std::string>> m_Entries;
};

// Delta provider returning a fixed script, then 'fallback' once exhausted.
class ScriptedDelta
{
public:
    explicit ScriptedDelta(std::vector<double> deltas, double fallback = 0.0)
        : m_Deltas(std::move(deltas)), m_Fallback(fallback)
    {
    }

    double operator()()
    {
        if (m_Next < m_Deltas.size()) return m_Deltas[m_Next++];
        return m_Fallback;
    }

private:
    std::vector<double> m_Deltas;
    size_t m_Next = 0;
    double m_Fallback;
};
