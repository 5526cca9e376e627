#include "executable_renderer.hpp"

#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/logger.hpp"

extern char **environ;

namespace opr {
namespace render {

namespace {
using Clock = std::chrono::steady_clock;

constexpr size_t kReadChunk = 64 * 1024;

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Inherited environment with the render data variable replaced
std::vector<std::string> child_environment(const std::string &render_data) {
    const std::string prefix = std::string(kRenderDataEnvironmentVariable) + "=";
    std::vector<std::string> env;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        if (std::strncmp(*entry, prefix.c_str(), prefix.size()) != 0) {
            env.emplace_back(*entry);
        }
    }
    env.push_back(prefix + render_data);
    return env;
}
}  // namespace

ExecutableRenderer::ExecutableRenderer(const std::string &content_directory, int timeout_ms)
    : content_directory_(content_directory), timeout_ms_(timeout_ms) {}

RenderResult ExecutableRenderer::render(const content::ContentSource &source, const content::RenderContext &context,
                                        const RenderTrace &) {
    const std::string render_data =
        content::RenderContext::with_target_media_type(context, source.media_type).serialize();

    ChildProcess child;
    std::string error;
    if (!spawn(source, render_data, child, error)) {
        LOG_WARN("[Exec] " << source.relative_path << ": " << error);
        return RenderResult::failed(content::ErrorKind::EXECUTABLE_ERROR,
                                    "Failed to start '" + source.relative_path + "': " + error);
    }
    LOG_DEBUG("[Exec] Started " << source.relative_path << " (PID=" << child.pid << ")");

    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms_);
    std::string out;
    std::string err;
    bool drained = collect_output(child, out, err, error);
    close_fd(child.stdout_fd);
    close_fd(child.stderr_fd);

    int status = 0;
    bool exited = false;
    if (drained) {
        // Output is closed; give the process what is left of the timeout to exit
        while (true) {
            pid_t result = waitpid(child.pid, &status, WNOHANG);
            if (result == child.pid) {
                exited = true;
                break;
            }
            if (result < 0 && errno != EINTR) {
                error = std::string("waitpid failed: ") + std::strerror(errno);
                break;
            }
            if (remaining_ms(deadline) == 0) {
                error = "timed out after " + std::to_string(timeout_ms_) + " ms";
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    if (!exited) {
        LOG_WARN("[Exec] " << source.relative_path << " " << error << "; killing process group " << child.pid);
        kill_and_reap(child);
        content::Failure failure(content::ErrorKind::EXECUTABLE_ERROR,
                                 "Executable '" + source.relative_path + "' " + error);
        failure.stderr_text = err;
        return RenderResult::failed(failure);
    }
    child.pid = -1;

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        if (!err.empty()) {
            LOG_DEBUG("[Exec] " << source.relative_path << " stderr: " << err);
        }
        return RenderResult::rendered(std::move(out), source.media_type);
    }

    content::Failure failure(content::ErrorKind::EXECUTABLE_ERROR, "");
    failure.stderr_text = err;
    if (WIFEXITED(status)) {
        failure.exit_code = WEXITSTATUS(status);
        failure.message = "Executable '" + source.relative_path + "' exited with status " +
                          std::to_string(*failure.exit_code);
    } else if (WIFSIGNALED(status)) {
        failure.message = "Executable '" + source.relative_path + "' was terminated by signal " +
                          std::to_string(WTERMSIG(status));
    } else {
        failure.message = "Executable '" + source.relative_path + "' ended abnormally";
    }
    if (!err.empty()) {
        failure.message += ": " + err;
    }
    LOG_WARN("[Exec] " << failure.message);
    return RenderResult::failed(failure);
}

bool ExecutableRenderer::spawn(const content::ContentSource &source, const std::string &render_data,
                               ChildProcess &child, std::string &error) {
    // Everything the child needs is prepared before fork; the child only
    // makes async-signal-safe calls
    std::vector<std::string> env = child_environment(render_data);
    std::vector<char *> envp;
    for (auto &entry : env) {
        envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::string path = source.absolute_path;
    std::vector<char *> argv = {const_cast<char *>(path.c_str()), nullptr};

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec failure errno; closed by a successful exec
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        error = std::string("Failed to open /dev/null: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0 || pipe2(stderr_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error = std::string("Failed to create pipe: ") + std::strerror(errno);
        for (int *fds : {stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        close_fd(devnull);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("Fork failed: ") + std::strerror(errno);
        for (int *fds : {stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        close_fd(devnull);
        return false;
    }

    if (pid == 0) {
        // Child process, leading its own process group so a timeout can
        // kill everything it started
        setpgid(0, 0);
        dup2(devnull, STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        if (chdir(content_directory_.c_str()) == 0) {
            execve(path.c_str(), argv.data(), envp.data());
        }
        int code = errno;
        ssize_t ignored = write(exec_pipe[1], &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close_fd(devnull);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    child.pid = pid;
    child.stdout_fd = stdout_pipe[0];
    child.stderr_fd = stderr_pipe[0];

    if (n > 0) {
        error = std::string("exec failed: ") + std::strerror(exec_errno);
        close_fd(child.stdout_fd);
        close_fd(child.stderr_fd);
        int status = 0;
        reap(child, status);
        return false;
    }
    return true;
}

bool ExecutableRenderer::collect_output(ChildProcess &child, std::string &out, std::string &err,
                                        std::string &error) {
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms_);
    std::vector<char> buffer(kReadChunk);

    while (child.stdout_fd >= 0 || child.stderr_fd >= 0) {
        struct pollfd fds[2];
        int *owners[2];
        std::string *sinks[2];
        nfds_t count = 0;
        if (child.stdout_fd >= 0) {
            fds[count] = {child.stdout_fd, POLLIN, 0};
            owners[count] = &child.stdout_fd;
            sinks[count++] = &out;
        }
        if (child.stderr_fd >= 0) {
            fds[count] = {child.stderr_fd, POLLIN, 0};
            owners[count] = &child.stderr_fd;
            sinks[count++] = &err;
        }

        int wait = remaining_ms(deadline);
        if (wait == 0) {
            error = "timed out after " + std::to_string(timeout_ms_) + " ms";
            return false;
        }
        int result = poll(fds, count, wait);
        if (result < 0) {
            if (errno == EINTR) continue;
            error = std::string("poll failed: ") + std::strerror(errno);
            return false;
        }
        if (result == 0) {
            error = "timed out after " + std::to_string(timeout_ms_) + " ms";
            return false;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            ssize_t r = read(fds[i].fd, buffer.data(), buffer.size());
            if (r < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                error = std::string("read failed: ") + std::strerror(errno);
                return false;
            }
            if (r == 0) {
                close_fd(*owners[i]);
                continue;
            }
            sinks[i]->append(buffer.data(), static_cast<size_t>(r));
        }
    }
    return true;
}

bool ExecutableRenderer::reap(ChildProcess &child, int &status) {
    while (child.pid > 0) {
        pid_t result = waitpid(child.pid, &status, 0);
        if (result == child.pid) {
            child.pid = -1;
            return true;
        }
        if (result < 0 && errno != EINTR) {
            child.pid = -1;
            return false;
        }
    }
    return true;
}

void ExecutableRenderer::kill_and_reap(ChildProcess &child) {
    close_fd(child.stdout_fd);
    close_fd(child.stderr_fd);
    if (child.pid > 0) {
        // The child became a group leader before exec, so its pid is the group id
        if (kill(-child.pid, SIGKILL) != 0) {
            LOG_DEBUG("[Exec] Killing process group " << child.pid << " failed: " << std::strerror(errno));
            if (kill(child.pid, SIGKILL) != 0) {
                LOG_DEBUG("[Exec] Killing PID " << child.pid << " failed: " << std::strerror(errno));
            }
        }
        int status = 0;
        reap(child, status);
    }
}

}  // namespace render
}  // namespace opr
