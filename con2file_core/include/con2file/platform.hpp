#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define C2F_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define C2F_PLATFORM_MACOS 1
#endif

#if !defined(C2F_PLATFORM_LINUX) && !defined(C2F_PLATFORM_MACOS)
    #error "con2file requires a POSIX platform"
#endif

// ===== 时间戳默认格式 (strftime) =====
#ifndef C2F_DEFAULT_TIMESTAMP_FORMAT
    #define C2F_DEFAULT_TIMESTAMP_FORMAT "%Y%m%d-%H%M%S"
#endif

// ===== 轮转默认值 =====
#ifndef C2F_DEFAULT_MAX_SIZE_BYTES
    #define C2F_DEFAULT_MAX_SIZE_BYTES (10LL * 1024 * 1024)
#endif
#ifndef C2F_DEFAULT_MAX_FILES
    #define C2F_DEFAULT_MAX_FILES 10
#endif

// GetRotationInfo stops after this many numbered backups
#ifndef C2F_MAX_ROTATION_SCAN
    #define C2F_MAX_ROTATION_SCAN 100
#endif
// CleanupRotatedFiles probes indices up to this value
#ifndef C2F_MAX_CLEANUP_SCAN
    #define C2F_MAX_CLEANUP_SCAN 1000
#endif

// ===== 诊断消息最大长度 =====
#ifndef C2F_MAX_MSG_LEN
    #define C2F_MAX_MSG_LEN 512
#endif

// ===== 重定向文件写缓冲大小 =====
#ifndef C2F_FILE_BUF_SIZE
    #define C2F_FILE_BUF_SIZE 4096
#endif

// ===== 编译信息注入（CMake 设置） =====
#ifndef C2F_GIT_HASH
    #define C2F_GIT_HASH "unknown"
#endif
#ifndef C2F_BUILD_TYPE
    #define C2F_BUILD_TYPE "unknown"
#endif
