#include "core/backend/ffmpeg_process.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

extern char **environ;

namespace
{
    constexpr size_t kStderrTailBytes = 4096;
    constexpr int kPollIntervalMs = 100;
    constexpr auto kTerminateGrace = std::chrono::seconds(2);

    struct Pipe
    {
        int fds[2] = {-1, -1};

        bool open() { return ::pipe(fds) == 0; }
        void closeRead()
        {
            if (fds[0] >= 0)
            {
                ::close(fds[0]);
                fds[0] = -1;
            }
        }
        void closeWrite()
        {
            if (fds[1] >= 0)
            {
                ::close(fds[1]);
                fds[1] = -1;
            }
        }
        ~Pipe()
        {
            closeRead();
            closeWrite();
        }
    };

    // Reads everything currently available; returns false on EOF or error
    bool drain(int fd, std::string &buffer)
    {
        char chunk[4096];
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0)
        {
            buffer.append(chunk, static_cast<size_t>(n));
            return true;
        }
        return n < 0 && (errno == EINTR || errno == EAGAIN);
    }

    void terminateChild(pid_t pid, int &status)
    {
        ::kill(pid, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (::waitpid(pid, &status, WNOHANG) == pid)
            {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        Logger::warn("ffmpeg (pid " + std::to_string(pid) + ") ignored SIGTERM, killing");
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
    }
}

FFmpegProcess::FFmpegProcess(std::string executable) : executable_(std::move(executable)) {}

BackendResult FFmpegProcess::killChild(pid_t pid, const std::string &reason)
{
    Logger::error("Abandoning ffmpeg (pid " + std::to_string(pid) + "): " + reason);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }
    return BackendResult::failure(reason);
}

double FFmpegProcess::parseProgressLine(const std::string &line)
{
    // out_time_us and out_time_ms both carry microseconds
    static const char *keys[] = {"out_time_us=", "out_time_ms="};
    for (const char *key : keys)
    {
        size_t key_len = std::strlen(key);
        if (line.compare(0, key_len, key) == 0)
        {
            try
            {
                long long micros = std::stoll(line.substr(key_len));
                return micros < 0 ? -1.0 : static_cast<double>(micros) / 1e6;
            }
            catch (const std::exception &)
            {
                return -1.0;
            }
        }
    }
    return -1.0;
}

BackendResult FFmpegProcess::run(const std::vector<std::string> &args, double expected_duration_seconds,
                                 const ProgressCallback &progress, const CancellationToken &token) const
{
    std::vector<std::string> full_args = {executable_, "-hide_banner", "-nostdin", "-y",
                                          "-loglevel", "error", "-nostats", "-progress", "pipe:1"};
    full_args.insert(full_args.end(), args.begin(), args.end());

    std::vector<char *> argv;
    for (auto &arg : full_args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    Pipe out_pipe, err_pipe;
    if (!out_pipe.open() || !err_pipe.open())
    {
        return BackendResult::failure("Could not create pipes for ffmpeg: " + std::string(std::strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, out_pipe.fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe.fds[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, out_pipe.fds[0]);
    posix_spawn_file_actions_addclose(&actions, err_pipe.fds[0]);

    Logger::debug("Spawning " + executable_ + " with " + std::to_string(args.size()) + " arguments");

    pid_t pid = 0;
    int spawn_result = posix_spawnp(&pid, executable_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    out_pipe.closeWrite();
    err_pipe.closeWrite();

    if (spawn_result != 0)
    {
        return BackendResult::failure("Could not start " + executable_ + ": " + std::strerror(spawn_result));
    }

    std::string out_buffer;
    std::string err_buffer;
    bool out_open = true;
    bool err_open = true;
    bool cancelled = false;
    int poll_error = 0;
    int status = 0;

    while (out_open || err_open)
    {
        if (token.isCancelled())
        {
            cancelled = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_open)
        {
            fds[count++] = {out_pipe.fds[0], POLLIN, 0};
        }
        if (err_open)
        {
            fds[count++] = {err_pipe.fds[0], POLLIN, 0};
        }

        int ready = ::poll(fds, count, kPollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            poll_error = errno;
            break;
        }
        if (ready == 0)
        {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i)
        {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
            {
                continue;
            }
            if (fds[i].fd == out_pipe.fds[0])
            {
                out_open = drain(fds[i].fd, out_buffer);
                size_t newline;
                while ((newline = out_buffer.find('\n')) != std::string::npos)
                {
                    std::string line = out_buffer.substr(0, newline);
                    out_buffer.erase(0, newline + 1);
                    double written = parseProgressLine(line);
                    if (progress && written >= 0.0 && expected_duration_seconds > 0.0)
                    {
                        progress(std::min(1.0, written / expected_duration_seconds));
                    }
                    else if (progress && line == "progress=end")
                    {
                        progress(1.0);
                    }
                }
            }
            else
            {
                err_open = drain(fds[i].fd, err_buffer);
                if (err_buffer.size() > kStderrTailBytes)
                {
                    err_buffer.erase(0, err_buffer.size() - kStderrTailBytes);
                }
            }
        }
    }

    if (cancelled)
    {
        terminateChild(pid, status);
        Logger::info("ffmpeg (pid " + std::to_string(pid) + ") stopped on cancellation");
        return BackendResult::failure("ffmpeg cancelled");
    }

    if (poll_error != 0)
    {
        // Nobody reads the pipes any more; a child blocked writing to them would never exit
        out_pipe.closeRead();
        err_pipe.closeRead();
        return killChild(pid, "poll on ffmpeg output failed: " + std::string(std::strerror(poll_error)));
    }

    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0)
    {
        return BackendResult::ok();
    }

    std::string reason = WIFEXITED(status) ? "ffmpeg exited with status " + std::to_string(WEXITSTATUS(status))
                                           : "ffmpeg terminated by signal";
    while (!err_buffer.empty() && (err_buffer.back() == '\n' || err_buffer.back() == '\r'))
    {
        err_buffer.pop_back();
    }
    if (!err_buffer.empty())
    {
        reason += ": " + err_buffer;
    }
    return BackendResult::failure(reason);
}
