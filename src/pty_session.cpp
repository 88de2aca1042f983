//
// Pseudo-terminal session: shell process attached to a PTY.
//
// Copyright (c) 2025 Serge Vakulenko
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#include "pty_session.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <vector>

extern char **environ;

static bool is_executable(const std::string &path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

//
// Find the shell binary the way execvp() would.
// Returns empty string when not found.
//
static std::string resolve_shell(const std::string &shell)
{
    if (shell.empty()) {
        return std::string();
    }
    if (shell.find('/') != std::string::npos) {
        return is_executable(shell) ? shell : std::string();
    }

    const char *path = getenv("PATH");
    std::string dirs = path ? path : "/usr/bin:/bin";
    size_t start     = 0;
    for (;;) {
        size_t end      = dirs.find(':', start);
        std::string dir = dirs.substr(start, end == std::string::npos ? end : end - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + shell;
        if (is_executable(candidate)) {
            return candidate;
        }
        if (end == std::string::npos) {
            return std::string();
        }
        start = end + 1;
    }
}

static void set_cloexec(int fd)
{
    fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | FD_CLOEXEC);
}

static std::string error_text(const char *what, int err)
{
    return std::string(what) + ": " + strerror(err);
}

//
// Report errno to the parent through the pipe and exit.
// Runs in the forked child: async-signal-safe calls only.
//
static void child_failed(int err_fd)
{
    int err = errno;
    if (write(err_fd, &err, sizeof(err)) != static_cast<ssize_t>(sizeof(err))) {
        _exit(126);
    }
    _exit(127);
}

static void exec_child(const char *slave_name, const char *path, char *const argv[],
                       char *const envp[], int err_fd)
{
    if (setsid() == -1) {
        child_failed(err_fd);
    }

    int slave_fd = open(slave_name, O_RDWR);
    if (slave_fd == -1) {
        child_failed(err_fd);
    }
    if (ioctl(slave_fd, TIOCSCTTY, 0) == -1) {
        child_failed(err_fd);
    }

    struct termios slave_termios;
    if (tcgetattr(slave_fd, &slave_termios) == 0) {
        slave_termios.c_lflag |= ISIG;
        slave_termios.c_iflag |= ICRNL;
        slave_termios.c_oflag |= OPOST | ONLCR;
        tcsetattr(slave_fd, TCSANOW, &slave_termios);
    }

    if (dup2(slave_fd, STDIN_FILENO) == -1 || dup2(slave_fd, STDOUT_FILENO) == -1 ||
        dup2(slave_fd, STDERR_FILENO) == -1) {
        child_failed(err_fd);
    }
    if (slave_fd > 2) {
        close(slave_fd);
    }

    // The shell expects default dispositions and an empty signal mask.
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGHUP, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGQUIT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);

    execve(path, argv, envp);
    child_failed(err_fd);
}

std::unique_ptr<PtySession> PtySession::open(const std::string &shell, int cols, int rows)
{
    std::unique_ptr<PtySession> session(new PtySession(shell, cols, rows));
    session->spawn();
    session->start_reader();
    return session;
}

PtySession::PtySession(const std::string &shell, int cols, int rows)
    : shell_name(shell), term_cols(std::max(cols, 1)), term_rows(std::max(rows, 1))
{
}

PtySession::~PtySession()
{
    close();
}

void PtySession::spawn()
{
    std::string path = resolve_shell(shell_name);
    if (path.empty()) {
        throw SpawnError(shell_name, "command not found");
    }

    master_fd = posix_openpt(O_RDWR | O_NOCTTY);
    if (master_fd == -1) {
        throw SpawnError(shell_name, error_text("Error opening pseudo-terminal", errno));
    }
    set_cloexec(master_fd);
    if (grantpt(master_fd) == -1 || unlockpt(master_fd) == -1) {
        throw SpawnError(shell_name, error_text("PTY setup failed", errno));
    }
    const char *name = ptsname(master_fd);
    if (!name) {
        throw SpawnError(shell_name, error_text("Error getting slave name", errno));
    }
    std::string slave_name = name;

    struct winsize ws = {};
    ws.ws_col         = term_cols;
    ws.ws_row         = term_rows;
    if (ioctl(master_fd, TIOCSWINSZ, &ws) == -1) {
        std::cerr << "Error setting slave window size: " << strerror(errno) << std::endl;
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> env_strings;
    for (char **env = environ; env && *env; ++env) {
        if (strncmp(*env, "TERM=", 5) != 0) {
            env_strings.push_back(*env);
        }
    }
    env_strings.push_back("TERM=xterm-256color");
    std::vector<char *> envp;
    for (auto &s : env_strings) {
        envp.push_back(&s[0]);
    }
    envp.push_back(nullptr);
    std::string arg0 = shell_name;
    char *argv[]     = { &arg0[0], nullptr };

    int err_pipe[2];
    if (pipe(err_pipe) == -1) {
        throw SpawnError(shell_name, error_text("Error creating pipe", errno));
    }
    set_cloexec(err_pipe[0]);
    set_cloexec(err_pipe[1]);

    child_pid = fork();
    if (child_pid == -1) {
        int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw SpawnError(shell_name, error_text("Error forking", err));
    }
    if (child_pid == 0) {
        ::close(err_pipe[0]);
        exec_child(slave_name.c_str(), path.c_str(), argv, envp.data(), err_pipe[1]);
        _exit(127);
    }

    // Pipe is closed by a successful exec; a payload means failure.
    ::close(err_pipe[1]);
    int child_errno = 0;
    ssize_t bytes;
    do {
        bytes = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (bytes == -1 && errno == EINTR);
    ::close(err_pipe[0]);

    if (bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        while (waitpid(child_pid, &status, 0) == -1 && errno == EINTR) {
        }
        exited      = true;
        exit_status = 127;
        throw SpawnError(shell_name, strerror(child_errno));
    }
}

void PtySession::start_reader()
{
    if (pipe(stop_pipe) == -1) {
        throw SpawnError(shell_name, error_text("Error creating pipe", errno));
    }
    set_cloexec(stop_pipe[0]);
    set_cloexec(stop_pipe[1]);

    channel = std::make_shared<ByteChannel>();
    reader  = std::thread(reader_loop, master_fd, stop_pipe[0], channel);
}

void PtySession::reader_loop(int fd, int stop_fd, std::shared_ptr<ByteChannel> channel)
{
    char buffer[4096];
    for (;;) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(fd, &read_fds);
        FD_SET(stop_fd, &read_fds);

        if (select(std::max(fd, stop_fd) + 1, &read_fds, nullptr, nullptr, nullptr) == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (FD_ISSET(stop_fd, &read_fds)) {
            break;
        }
        if (FD_ISSET(fd, &read_fds)) {
            ssize_t bytes = read(fd, buffer, sizeof(buffer));
            if (bytes > 0) {
                channel->push(std::string(buffer, bytes));
            } else if (bytes == -1 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            } else {
                // EOF, or EIO once the slave side is gone.
                break;
            }
        }
    }
    channel->finish();
}

void PtySession::stop_reader()
{
    if (reader.joinable()) {
        if (exited) {
            // Give the reader a moment to collect the last output of the shell.
            for (int attempt = 0; attempt < 50 && !channel->is_finished(); ++attempt) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
        }
        char c = 0;
        while (::write(stop_pipe[1], &c, 1) == -1 && errno == EINTR) {
        }
        reader.join();
    }
    for (int &fd : stop_pipe) {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
}

void PtySession::write(const char *data, size_t length)
{
    if (closed || master_fd == -1) {
        throw WriteError("Error writing to PTY: session is closed");
    }
    size_t done = 0;
    while (done < length) {
        ssize_t bytes = ::write(master_fd, data + done, length - done);
        if (bytes == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw WriteError(error_text("Error writing to PTY", errno));
        }
        done += bytes;
    }
}

std::string PtySession::read_available()
{
    if (!channel) {
        return std::string();
    }
    return channel->drain();
}

void PtySession::resize(int cols, int rows)
{
    term_cols = std::max(cols, 1);
    term_rows = std::max(rows, 1);
    if (closed || master_fd == -1) {
        throw ResizeError("Error setting slave window size: session is closed");
    }

    struct winsize ws = {};
    ws.ws_col         = term_cols;
    ws.ws_row         = term_rows;
    if (ioctl(master_fd, TIOCSWINSZ, &ws) == -1) {
        throw ResizeError(error_text("Error setting slave window size", errno));
    }
}

bool PtySession::is_alive()
{
    if (exited || child_pid <= 0) {
        return false;
    }
    int status;
    pid_t pid = waitpid(child_pid, &status, WNOHANG);
    if (pid == 0 || (pid == -1 && errno == EINTR)) {
        return true;
    }
    exited = true;
    if (pid == child_pid) {
        exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    }
    return false;
}

void PtySession::send_key(KeyCode key)
{
    std::string input = key_sequence(key);
    if (!input.empty()) {
        write(input);
    }
}

void PtySession::close()
{
    if (closed) {
        return;
    }
    closed = true;

    stop_reader();
    terminate_child();
    if (master_fd != -1) {
        ::close(master_fd);
        master_fd = -1;
    }
}

void PtySession::terminate_child()
{
    if (child_pid <= 0 || exited) {
        return;
    }

    // Hang up, as a terminal being closed would.
    kill(child_pid, SIGHUP);
    int status;
    for (int attempt = 0; attempt < 50; ++attempt) {
        pid_t pid = waitpid(child_pid, &status, WNOHANG);
        if (pid == child_pid || (pid == -1 && errno != EINTR)) {
            exited = true;
            if (pid == child_pid) {
                exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
            }
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    kill(child_pid, SIGKILL);
    while (waitpid(child_pid, &status, 0) == -1 && errno == EINTR) {
    }
    exited      = true;
    exit_status = 128 + SIGKILL;
}
