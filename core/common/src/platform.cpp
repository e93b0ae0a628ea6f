#include <configs/common/platform.hpp>

#include <cstdlib>
#include <cstdio>
#include <functional>
#include <thread>

#if defined(CONFIGS_OS_POSIX)
#include <pthread.h>
#include <unistd.h>
#elif defined(CONFIGS_OS_WINDOWS)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <io.h>
#endif

namespace configs::common::platform {

uint64_t get_thread_id() noexcept {
#if defined(CONFIGS_OS_WINDOWS)
    return static_cast<uint64_t>(GetCurrentThreadId());
#elif defined(CONFIGS_OS_MACOS)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(CONFIGS_OS_POSIX)
    return static_cast<uint64_t>(pthread_self());
#else
    return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
}

std::string get_env(std::string_view name) {
    std::string name_str(name);
    const char* value = std::getenv(name_str.c_str());
    return value ? std::string(value) : std::string{};
}

bool stdout_is_terminal() noexcept {
#if defined(CONFIGS_OS_POSIX)
    return isatty(fileno(stdout)) != 0;
#elif defined(CONFIGS_OS_WINDOWS)
    return _isatty(_fileno(stdout)) != 0;
#else
    return false;
#endif
}

}  // namespace configs::common::platform
