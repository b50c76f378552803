#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the guest shutdown agent.

#include <cstdint>
#include <string_view>

namespace gsa::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    Cancelled = 0x0003,

    // Metadata (0x0100 - 0x01FF)
    MetadataClientInitFailed = 0x0100,

    // Script (0x0300 - 0x03FF)
    ExecutablePathUnavailable = 0x0300,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Process (0x0700 - 0x07FF)
    ProcessSpawnFailed = 0x0700,
    ProcessWaitFailed = 0x0701,
    ProcessSignaled = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0800,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Metadata";
        case 0x0300: return "Script";
        case 0x0600: return "Config";
        case 0x0700: return "Process";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace gsa::foundation
