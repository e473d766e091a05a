/*
 * Child Process Helper for Handler Tests
 *
 * Copyright (C) 2024 Cyberus Technology GmbH.
 *
 * This file is part of Deadstop.
 *
 * Deadstop is free software: you can redistribute it and/or modify it
 * under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * Deadstop is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License version 2 for more details.
 */

#pragma once

#include <catch2/catch.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

// The real panic handlers halt, trap or end the process. To observe them, the tests run the faulting code in
// a forked child and watch it from the outside.
//
// The child's stdout and stderr go to a pipe that the parent collects. If the child is still alive when the
// Child_process is destroyed, it is killed.
class Child_process
{
private:
    pid_t pid{-1};
    int output_fd{-1};
    int status_{0};
    bool reaped{false};

    // The status a child exits with if its body returns. None of the handlers use it.
    static constexpr int BODY_RETURNED{99};

public:
    template <typename F> explicit Child_process(F&& body)
    {
        int fds[2];

        REQUIRE(pipe(fds) == 0);

        pid = fork();
        REQUIRE(pid >= 0);

        if (pid == 0) {
            close(fds[0]);
            dup2(fds[1], STDOUT_FILENO);
            dup2(fds[1], STDERR_FILENO);
            close(fds[1]);

            // Catch2 installs its own handlers for fatal signals. The child must die from them like any other
            // program would and it shouldn't leave core dumps behind.
            for (int sig : {SIGILL, SIGTRAP, SIGABRT, SIGSEGV, SIGBUS, SIGFPE}) {
                signal(sig, SIG_DFL);
            }

            rlimit const no_core{0, 0};
            setrlimit(RLIMIT_CORE, &no_core);

            body();
            _exit(BODY_RETURNED);
        }

        close(fds[1]);
        output_fd = fds[0];
    }

    Child_process(Child_process const&) = delete;
    Child_process& operator=(Child_process const&) = delete;

    ~Child_process()
    {
        if (not reaped) {
            kill();
        }

        close(output_fd);
    }

    // Wait for the child to terminate. Returns false if it is still running after the timeout.
    bool wait_for_exit(std::chrono::milliseconds timeout)
    {
        auto const deadline{std::chrono::steady_clock::now() + timeout};

        while (not reaped) {
            pid_t const result{waitpid(pid, &status_, WNOHANG)};

            REQUIRE(result >= 0);

            if (result == pid) {
                reaped = true;
                break;
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        return reaped;
    }

    void send_signal(int sig)
    {
        REQUIRE(not reaped);
        REQUIRE(::kill(pid, sig) == 0);
    }

    void kill()
    {
        if (reaped) {
            return;
        }

        ::kill(pid, SIGKILL);

        while (waitpid(pid, &status_, 0) < 0 and errno == EINTR) {
        }

        reaped = true;
    }

    // Everything the child wrote. Only complete once the child has terminated.
    std::string output()
    {
        std::string result;
        char buffer[256];

        REQUIRE(reaped);

        for (;;) {
            ssize_t const len{read(output_fd, buffer, sizeof(buffer))};

            if (len < 0 and errno == EINTR) {
                continue;
            }

            if (len <= 0) {
                break;
            }

            result.append(buffer, static_cast<size_t>(len));
        }

        return result;
    }

    bool exited() const { return reaped and WIFEXITED(status_); }
    int exit_status() const { return WEXITSTATUS(status_); }

    bool signaled() const { return reaped and WIFSIGNALED(status_); }
    int signal_number() const { return WTERMSIG(status_); }
};

// Code after a fault writes this marker. It must never show up in the output.
inline void mark_reached()
{
    static char const marker[] = "REACHED\n";

    ssize_t const written{write(STDERR_FILENO, marker, sizeof(marker) - 1)};
    static_cast<void>(written);
}
