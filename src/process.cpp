#include "process.hpp"
#include "logging.hpp"

#include <csignal>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

// ---------------- Child side ----------------
// The parent may block SIGINT/SIGTERM (for sigwait) and ignore SIGPIPE;
// both are inherited across exec, so restore defaults first.
static void exec_child(const std::vector<std::string>& argv) {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    std::signal(SIGPIPE, SIG_DFL);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    execvp(args[0], args.data());
    _exit(127);
}

static void redirect_to_devnull(int target_fd, int flags) {
    int fd = open("/dev/null", flags);
    if (fd >= 0) {
        dup2(fd, target_fd);
        close(fd);
    }
}

static bool wait_child(pid_t pid, const std::string& what) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            audit_log_level(LogLevel::ERROR,
                "waitpid failed for " + what,
                "process_module",
                "failure");
            return false;
        }
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}


// ---------------- Writer ----------------
bool run_with_input(const std::vector<std::string>& argv,
    const Bytes& input,
    bool quiet)
{
    if (argv.empty()) return false;

    int pipefd[2];
    if (pipe(pipefd) != 0) return false;

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        // child: replace stdin with read end
        dup2(pipefd[0], STDIN_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        if (quiet) {
            redirect_to_devnull(STDOUT_FILENO, O_WRONLY);
            redirect_to_devnull(STDERR_FILENO, O_WRONLY);
        }
        exec_child(argv);
    }

    // parent: write input; EPIPE means the child stopped reading
    close(pipefd[0]);
    const byte* ptr = input.data();
    size_t remaining = input.size();
    bool write_ok = true;

    while (remaining > 0) {
        ssize_t w = write(pipefd[1], ptr, remaining);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) {
            write_ok = false;
            break;
        }
        ptr += w;
        remaining -= static_cast<size_t>(w);
    }
    close(pipefd[1]);

    bool exited_ok = wait_child(pid, argv[0]);
    return write_ok && exited_ok;
}


// ---------------- Reader ----------------
bool read_fd_capped(int fd, Bytes& out, size_t max_size) {
    Bytes s;
    byte buf[4096];
    for (;;) {
        ssize_t r = read(fd, buf, sizeof(buf));
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) return false;
        if (r == 0) break;
        if (s.size() + static_cast<size_t>(r) > max_size) {
            errno = EFBIG;
            return false;
        }
        s.insert(s.end(), buf, buf + r);
    }
    out = std::move(s);
    return true;
}

bool run_capture(const std::vector<std::string>& argv,
    Bytes& out,
    bool quiet,
    size_t max_size)
{
    if (argv.empty()) return false;

    int pipefd[2];
    if (pipe(pipefd) != 0) return false;

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        // child: stdout -> pipe write end
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        redirect_to_devnull(STDIN_FILENO, O_RDONLY);
        if (quiet) {
            redirect_to_devnull(STDERR_FILENO, O_WRONLY);
        }
        exec_child(argv);
    }

    // parent: read from pipe
    close(pipefd[1]);
    Bytes s;
    bool read_ok = read_fd_capped(pipefd[0], s, max_size);
    bool too_large = !read_ok && errno == EFBIG;
    // closing the read end early makes the child die of SIGPIPE
    close(pipefd[0]);

    bool exited_ok = wait_child(pid, argv[0]);
    if (too_large) {
        audit_log_level(LogLevel::WARN,
            "run_capture: output of " + argv[0] + " exceeds size cap",
            "process_module",
            "failure");
        return false;
    }
    if (!read_ok || !exited_ok) {
        return false;
    }

    out = std::move(s);
    return true;
}


// ---------------- Filter ----------------
bool run_filter(const std::vector<std::string>& argv,
    const Bytes& input,
    Bytes& out,
    size_t max_size)
{
    if (argv.empty()) return false;

    int in_pipe[2];
    int out_pipe[2];
    if (pipe(in_pipe) != 0) return false;
    if (pipe(out_pipe) != 0) {
        close(in_pipe[0]);
        close(in_pipe[1]);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return false;
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        exec_child(argv);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);
    int wfd = in_pipe[1];
    int rfd = out_pipe[0];
    fcntl(wfd, F_SETFL, fcntl(wfd, F_GETFL) | O_NONBLOCK);

    // stdin and stdout are pumped together so a filter that writes before it
    // has read everything cannot deadlock against us
    size_t written = 0;
    if (input.empty()) {
        close(wfd);
        wfd = -1;
    }

    Bytes s;
    bool io_ok = true;
    bool too_large = false;
    byte buf[4096];

    while (rfd >= 0) {
        struct pollfd fds[2];
        nfds_t n = 0;
        fds[n++] = { rfd, POLLIN, 0 };
        if (wfd >= 0) fds[n++] = { wfd, POLLOUT, 0 };

        if (poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            io_ok = false;
            break;
        }

        if (wfd >= 0 && fds[1].revents != 0) {
            ssize_t w = write(wfd, input.data() + written, input.size() - written);
            if (w > 0) {
                written += static_cast<size_t>(w);
            }
            // EPIPE: the filter stopped reading; what it printed still counts
            if ((w < 0 && errno != EINTR && errno != EAGAIN) || written == input.size()) {
                close(wfd);
                wfd = -1;
            }
        }

        if (fds[0].revents != 0) {
            ssize_t r = read(rfd, buf, sizeof(buf));
            if (r < 0 && errno == EINTR) continue;
            if (r < 0) {
                io_ok = false;
                break;
            }
            if (r == 0) break;
            if (s.size() + static_cast<size_t>(r) > max_size) {
                too_large = true;
                break;
            }
            s.insert(s.end(), buf, buf + r);
        }
    }

    if (wfd >= 0) close(wfd);
    close(rfd);

    bool exited_ok = wait_child(pid, argv[0]);
    if (too_large) {
        audit_log_level(LogLevel::WARN,
            "run_filter: output of " + argv[0] + " exceeds size cap",
            "process_module",
            "failure");
        return false;
    }
    if (!io_ok || !exited_ok) {
        return false;
    }

    out = std::move(s);
    return true;
}


// ---------------- Pass-through ----------------
bool run_command(const std::vector<std::string>& argv) {
    if (argv.empty()) return false;

    pid_t pid = fork();
    if (pid < 0) return false;

    if (pid == 0) {
        redirect_to_devnull(STDIN_FILENO, O_RDONLY);
        exec_child(argv);
    }

    return wait_child(pid, argv[0]);
}


// ---------------- PATH lookup ----------------
bool find_in_path(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env || !*path_env) return false;

    std::istringstream iss(path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}
