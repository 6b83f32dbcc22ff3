/*
* @license
* (C) zachbabanov
*
*/

#include <player.hpp>
#include <logger.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>

using namespace framecast::player;

struct PlayerProcess::Impl {
    int write_fd; // write end of the pipe connected to child's stdin
    pid_t pid;

    Impl() : write_fd(-1), pid(-1) {}
};

PlayerProcess::PlayerProcess(): impl_(new Impl()) {}
PlayerProcess::~PlayerProcess() { stop(); }

/**
 * @brief Helper to build argv-like array for execvp.
 */
static std::vector<char*> build_argv(const std::string &cmd, const std::vector<std::string> &args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cmd.c_str()));
    for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

std::vector<std::string> PlayerProcess::default_args(const std::string &window_title) {
    return {
            "-fflags", "nobuffer",
            "-flags", "low_delay",
            "-framedrop",
            "-strict", "experimental",
            "-loglevel", "error",
            "-f", "h264",
            "-i", "-",  // Read from stdin
            "-window_title", window_title
    };
}

std::unique_ptr<PlayerProcess> PlayerProcess::launch(const std::string &player_cmd, const std::vector<std::string> &app_args) {
    auto p = std::unique_ptr<PlayerProcess>(new PlayerProcess());

    // build argv before fork: the child must only exec
    std::vector<std::string> args = app_args.empty() ? default_args("framecast") : app_args;
    std::vector<char*> argv = build_argv(player_cmd, args);

    int pipefd[2];
    if (pipe(pipefd) != 0) {
        LOG_VIDEO_ERROR("Player: pipe creation failed: {}", strerror(errno));
        return nullptr;
    }
    pid_t pid = fork();
    if (pid < 0) {
        LOG_VIDEO_ERROR("Player: fork failed: {}", strerror(errno));
        close(pipefd[0]);
        close(pipefd[1]);
        return nullptr;
    }
    if (pid == 0) {
        dup2(pipefd[0], STDIN_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);

        execvp(player_cmd.c_str(), argv.data());
        perror("execvp player");
        _exit(127);
    }

    close(pipefd[0]);
    p->impl_->write_fd = pipefd[1];
    int flags = fcntl(p->impl_->write_fd, F_GETFL, 0);
    fcntl(p->impl_->write_fd, F_SETFL, flags | O_NONBLOCK);
    p->impl_->pid = pid;
    LOG_VIDEO_INFO("Player started: cmd='{}' pid={} write_fd={}", player_cmd, (int)pid, p->impl_->write_fd);
    return p;
}

ssize_t PlayerProcess::write_data(const char *buf, size_t len) {
    if (impl_->write_fd < 0) return -1;
    ssize_t n = ::write(impl_->write_fd, buf, len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            LOG_VIDEO_TRACE("Player write would block write_fd={}", impl_->write_fd);
            return 0;
        }
        LOG_VIDEO_WARN("Player write error: {}", strerror(errno));
        return -1;
    }
    return n;
}

int PlayerProcess::get_write_fd() const {
    return impl_->write_fd;
}

pid_t PlayerProcess::pid() const {
    return impl_->pid;
}

void PlayerProcess::stop() {
    if (impl_->write_fd >= 0) {
        close(impl_->write_fd);
        LOG_VIDEO_DEBUG("Player write_fd closed {}", impl_->write_fd);
        impl_->write_fd = -1;
    }
    if (impl_->pid > 0) {
        kill(impl_->pid, SIGTERM);
        waitpid(impl_->pid, nullptr, 0);
        LOG_VIDEO_INFO("Player process terminated pid={}", (int)impl_->pid);
        impl_->pid = -1;
    }
}
