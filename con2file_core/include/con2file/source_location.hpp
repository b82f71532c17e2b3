#pragma once
#include <cstdint>

namespace con2file {

struct SourceLocation {
    const char* file_name;
    const char* function_name;
    uint32_t    line;

    static constexpr const char* extract_filename(const char* path) {
        const char* name = path;
        for (const char* p = path; *p != '\0'; ++p) {
            if (*p == '/') name = p + 1;
        }
        return name;
    }
};

#define C2F_CURRENT_LOCATION() \
    ::con2file::SourceLocation { \
        ::con2file::SourceLocation::extract_filename(__FILE__), \
        __func__, \
        static_cast<uint32_t>(__LINE__) \
    }

} // namespace con2file
