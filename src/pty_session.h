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
#ifndef PTY_SESSION_H
#define PTY_SESSION_H

#include <sys/types.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "byte_channel.h"
#include "key_input.h"

// Failure of a PTY operation
class PtyError : public std::runtime_error {
public:
    explicit PtyError(const std::string &message) : std::runtime_error(message) {}
};

// Shell not found, or the OS refused to start it
class SpawnError : public PtyError {
public:
    SpawnError(const std::string &shell, const std::string &reason)
        : PtyError("Failed to start " + shell + ": " + reason), shell_name(shell) {}
    const std::string &get_shell_name() const { return shell_name; }

private:
    std::string shell_name;
};

// Write to the PTY master failed, usually a broken pipe
class WriteError : public PtyError {
public:
    explicit WriteError(const std::string &message) : PtyError(message) {}
};

// Window size could not be changed
class ResizeError : public PtyError {
public:
    explicit ResizeError(const std::string &message) : PtyError(message) {}
};

//
// Shell process running on the slave side of a pseudo-terminal.
// Output is collected by a background thread and picked up with
// read_available(), which never blocks.
//
class PtySession {
public:
    // Start the shell, resolved through PATH. Throws SpawnError.
    static std::unique_ptr<PtySession> open(const std::string &shell, int cols, int rows);

    ~PtySession();
    PtySession(const PtySession &) = delete;
    PtySession &operator=(const PtySession &) = delete;

    void write(const char *data, size_t length);
    void write(const std::string &data) { write(data.data(), data.size()); }
    std::string read_available();
    void resize(int cols, int rows);
    bool is_alive();
    void send_key(KeyCode key);
    void close();

    const std::string &get_shell_name() const { return shell_name; }
    pid_t get_pid() const { return child_pid; }
    int get_cols() const { return term_cols; }
    int get_rows() const { return term_rows; }
    bool has_exited() const { return exited; }
    int get_exit_status() const { return exit_status; }

private:
    PtySession(const std::string &shell, int cols, int rows);

    std::string shell_name;
    int term_cols;
    int term_rows;

    // PTY and child process
    int master_fd{ -1 };
    pid_t child_pid{ -1 };
    bool exited{};
    int exit_status{};
    bool closed{};

    // Output reader
    std::shared_ptr<ByteChannel> channel;
    std::thread reader;
    int stop_pipe[2]{ -1, -1 };

    void spawn();
    void start_reader();
    void stop_reader();
    void terminate_child();

    static void reader_loop(int fd, int stop_fd, std::shared_ptr<ByteChannel> channel);
};

#endif // PTY_SESSION_H
