#pragma once

#include "core/backend/media_backend.hpp"
#include <string>
#include <sys/types.h>
#include <vector>

/**
 * @brief Runs the ffmpeg executable as a child process.
 *
 * The child is started with posix_spawnp and `-progress pipe:1`, so progress
 * arrives as key=value lines on stdout. stderr is kept (last few KB) for the
 * failure reason. Cancelling the token sends SIGTERM, then SIGKILL if the
 * child does not exit within the grace period. If its output can no longer
 * be polled the child is killed outright.
 */
class FFmpegProcess
{
public:
    explicit FFmpegProcess(std::string executable);

    /**
     * @param args Arguments after the executable name; the common flags
     *        (-hide_banner, -nostdin, -y, -progress) are prepended
     * @param expected_duration_seconds Output duration used to scale progress, 0 if unknown
     */
    BackendResult run(const std::vector<std::string> &args, double expected_duration_seconds,
                      const ProgressCallback &progress, const CancellationToken &token) const;

    const std::string &executable() const { return executable_; }

    /**
     * @brief Parse one `-progress` line; returns seconds of output written, or a negative value
     */
    static double parseProgressLine(const std::string &line);

    /**
     * @brief SIGKILL and reap a child whose output can no longer be read
     * @return A failure carrying reason
     */
    static BackendResult killChild(pid_t pid, const std::string &reason);

private:
    std::string executable_;
};
