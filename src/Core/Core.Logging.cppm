module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Info,
        Warning,
        Error,
        Debug
    };

    // Observer that receives every formatted message after it was printed.
    // Tests use it to count warnings; hosts can forward messages elsewhere.
    using SinkFn = std::function<void(Level, std::string_view)>;

    // Install (or clear, with {}) the secondary sink.
    void SetSink(SinkFn sink);

    namespace Detail
    {
        void Emit(Level level, std::string_view msg);
    }

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        Detail::Emit(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        Detail::Emit(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        Detail::Emit(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        Detail::Emit(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
