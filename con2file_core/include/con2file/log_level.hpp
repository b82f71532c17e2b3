#pragma once
#include <cstdint>
#include <string_view>

namespace con2file
{

// Severity of internal diagnostics. Debug traces successful redirections and
// rotations, Warn reports recovered failures (aborted rotation, out-of-order
// release), Error reports failures the library could not recover from.
enum class LogLevel : uint8_t
{
  Debug,
  Info,
  Warn,
  Error,
  Off,  // threshold only; never attached to an entry
};

constexpr std::string_view to_string(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off: return "OFF";
  }
  return "?";
}

}  // namespace con2file

// Calls below this level compile away (-DC2F_ACTIVE_LEVEL=N, N = enum value)
#ifndef C2F_ACTIVE_LEVEL
#ifdef NDEBUG
#define C2F_ACTIVE_LEVEL 1  // Info
#else
#define C2F_ACTIVE_LEVEL 0  // Debug
#endif
#endif
