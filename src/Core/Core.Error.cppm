module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations whose failure aborts the
    //                          calling operation and MUST be handled:
    //                          - Creating an entity with an id already in use
    //                          - Starting the loop without renderer/scene/camera
    //                          - Persisted store I/O
    //                          - Opening the host window
    //
    // 2. Raw pointers (T*)   - For lookups. nullptr means "not found"; the
    //                          lookup logs a warning and the caller continues.
    //                          Registries keep ownership, callers only observe.
    //
    // 3. Log::Warn + no-op   - For removals of unknown ids/indices. Batches
    //                          keep going past the missing entry.
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Registry errors (100-199)
        DuplicateId = 100,
        ResourceNotFound = 101,

        // I/O errors (200-299)
        FileReadError = 200,
        FileWriteError = 201,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        MissingPrecondition = 302,

        // Platform errors (400-499)
        WindowCreationFailed = 400,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:             return "Success";
            case ErrorCode::DuplicateId:         return "DuplicateId";
            case ErrorCode::ResourceNotFound:    return "ResourceNotFound";
            case ErrorCode::FileReadError:       return "FileReadError";
            case ErrorCode::FileWriteError:      return "FileWriteError";
            case ErrorCode::InvalidArgument:     return "InvalidArgument";
            case ErrorCode::InvalidState:        return "InvalidState";
            case ErrorCode::MissingPrecondition: return "MissingPrecondition";
            case ErrorCode::WindowCreationFailed: return "WindowCreationFailed";
            default:                             return "Unknown";
        }
    }

    // Type alias for common expected patterns
    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    // Helper to create success result
    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    // Helper to create error result
    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    inline constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
