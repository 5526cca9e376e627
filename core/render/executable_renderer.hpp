#pragma once

#include <string>
#include <sys/types.h>

#include "render/renderer.hpp"

namespace opr {
namespace render {

// Environment variable carrying the serialized render context
constexpr const char *kRenderDataEnvironmentVariable = "OPERATOR_RENDER_DATA";

/**
 * @brief Runs executable content files
 *
 * The program is started directly (its shebang picks an interpreter) with:
 * - working directory: the content directory
 * - stdin: /dev/null
 * - environment: inherited plus OPERATOR_RENDER_DATA
 *
 * stdout becomes the body once the program exits with status 0. stderr is
 * kept for diagnostics only. A nonzero exit, a signal, a spawn failure or
 * running past the timeout yields ExecutableError. The program runs in its
 * own process group; on timeout the whole group is killed with SIGKILL and
 * the program is reaped.
 */
class ExecutableRenderer : public IRenderer {
public:
    ExecutableRenderer(const std::string &content_directory, int timeout_ms);

    RenderResult render(const content::ContentSource &source, const content::RenderContext &context,
                        const RenderTrace &trace) override;

private:
    struct ChildProcess {
        pid_t pid = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
    };

    bool spawn(const content::ContentSource &source, const std::string &render_data, ChildProcess &child,
               std::string &error);

    // Drains both pipes until EOF or the deadline. Returns false on timeout
    // or poll failure (error set).
    bool collect_output(ChildProcess &child, std::string &out, std::string &err, std::string &error);

    // Blocking reap; returns the raw wait status
    bool reap(ChildProcess &child, int &status);

    void kill_and_reap(ChildProcess &child);

    std::string content_directory_;
    int timeout_ms_;
};

}  // namespace render
}  // namespace opr
