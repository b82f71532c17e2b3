#pragma once
#include "log_level.hpp"
#include "platform.hpp"
#include <cstdint>
#include <type_traits>

namespace con2file {

struct DiagEntry {
    uint64_t    wall_clock_ns;

    LogLevel    level;

    const char* file_name;
    const char* function_name;
    uint32_t    line;

    uint32_t    thread_id;

    uint16_t    msg_len;
    char        msg[C2F_MAX_MSG_LEN];
};

static_assert(std::is_trivially_copyable_v<DiagEntry>,
    "DiagEntry is copied by value into sinks");

} // namespace con2file
