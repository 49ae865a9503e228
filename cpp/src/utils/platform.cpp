/**
 * @file platform.cpp
 * @brief Provides cross-platform implementations for core OS-specific utilities.
 *
 * This file contains the platform-specific logic for functions declared in the
 * `relayhub::platform` namespace: process and thread IDs, process liveness probing
 * for the instance lock, and monotonic time.
 */
#include "rh_platform.hpp"

#include <functional>
#include <thread>

#if defined(RELAYHUB_IS_POSIX)
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>  // For ESRCH
#include <signal.h> // For kill
#endif

#if defined(RELAYHUB_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace relayhub::platform
{

/**
 * @brief Gets the current process ID in a cross-platform way.
 * @return The process ID (PID) of the calling process.
 */
uint64_t get_pid()
{
#if defined(RELAYHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Suitable for logging and debugging. Uses the most efficient OS-specific
 *          API available (`GetCurrentThreadId`, `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(RELAYHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX or unknown systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        // PID 0 is typically invalid or refers to the system/kernel
        return false;
    }

#if defined(RELAYHUB_PLATFORM_WIN64)
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
    {
        // ERROR_INVALID_PARAMETER means the PID does not exist; anything else
        // (e.g. access denied) means it does.
        return GetLastError() != ERROR_INVALID_PARAMETER;
    }

    DWORD exitCode = 0;
    BOOL result = GetExitCodeProcess(process, &exitCode);
    CloseHandle(process);

    if (!result)
    {
        return false;
    }
    return exitCode == STILL_ACTIVE;

#else // POSIX systems
    // kill(pid, 0) checks for existence without sending a signal
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }

    // ESRCH: no such process -> dead
    // EPERM: not permitted -> alive but owned by someone else
    return errno != ESRCH;
#endif
}

} // namespace relayhub::platform
