/* **********************************************************
 * Copyright (c) 2026 Google, Inc.  All rights reserved.
 * **********************************************************/

/*
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice,
 *   this list of conditions and the following disclaimer.
 *
 * * Redistributions in binary form must reproduce the above copyright notice,
 *   this list of conditions and the following disclaimer in the documentation
 *   and/or other materials provided with the distribution.
 *
 * * Neither the name of Google, Inc. nor the names of its contributors may be
 *   used to endorse or promote products derived from this software without
 *   specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL VMWARE, INC. OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 * LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY
 * OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH
 * DAMAGE.
 */
#include "child_process.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "utils.h"

extern char **environ;

namespace fibertrace {

child_process_t::child_process_t(unsigned int verbosity)
    : verbosity_(verbosity)
    , exited_(false)
{
}

child_process_t::~child_process_t()
{
    if (pid_ > 0 && !has_exited()) {
        terminate();
        int status;
        std::string error = wait(&status);
        if (!error.empty())
            WARN("%s", error.c_str());
    }
}

std::string
child_process_t::spawn(const std::vector<std::string> &argv,
                       const std::vector<std::string> &extra_env)
{
    if (argv.empty())
        return "No program to run";
    if (pid_ > 0)
        return "A child process was already started";

    // Everything the child needs is built before fork(): after it, only
    // async-signal-safe calls are allowed.
    std::vector<char *> child_argv;
    for (const std::string &arg : argv)
        child_argv.push_back(const_cast<char *>(arg.c_str()));
    child_argv.push_back(nullptr);
    std::vector<char *> child_env;
    for (const std::string &var : extra_env)
        child_env.push_back(const_cast<char *>(var.c_str()));
    for (char **var = environ; var != nullptr && *var != nullptr; ++var)
        child_env.push_back(*var);
    child_env.push_back(nullptr);

    // The child reports an exec failure through this pipe; a successful exec
    // closes it.
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0)
        return std::string("Failed to create pipe: ") + strerror(errno);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        return std::string("Failed to fork: ") + strerror(err);
    }
    if (pid == 0) {
        close(err_pipe[0]);
        environ = child_env.data();
        execvp(child_argv[0], child_argv.data());
        int err = errno;
        ssize_t res = write(err_pipe[1], &err, sizeof(err));
        (void)res; // Nothing more we can do.
        _exit(CHILD_EXIT_EXEC_FAILED);
    }
    close(err_pipe[1]);
    int child_errno = 0;
    ssize_t len;
    do {
        len = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (len < 0 && errno == EINTR);
    close(err_pipe[0]);
    pid_ = pid;
    if (len == sizeof(child_errno)) {
        int status;
        std::string error = wait(&status);
        if (!error.empty())
            WARN("%s", error.c_str());
        return "Failed to execute " + argv[0] + ": " + strerror(child_errno);
    }
    VPRINT(1, "Started %s as pid %d\n", argv[0].c_str(), static_cast<int>(pid));
    return "";
}

std::string
child_process_t::wait(int *status)
{
    if (pid_ <= 0)
        return "No child process to wait for";
    if (has_exited()) {
        *status = status_;
        return "";
    }
    int wstatus = 0;
    pid_t res;
    do {
        res = waitpid(pid_, &wstatus, 0);
    } while (res < 0 && errno == EINTR);
    if (res != pid_)
        return "Failed to wait for pid " + std::to_string(pid_) + ": " + strerror(errno);
    if (WIFEXITED(wstatus))
        status_ = WEXITSTATUS(wstatus);
    else if (WIFSIGNALED(wstatus))
        status_ = 128 + WTERMSIG(wstatus);
    else
        status_ = wstatus;
    *status = status_;
    exited_.store(true, std::memory_order_release);
    VPRINT(1, "pid %d exited with status %d\n", static_cast<int>(pid_), status_);
    return "";
}

std::string
child_process_t::try_wait(int *status, bool *exited)
{
    *exited = false;
    if (pid_ <= 0)
        return "No child process to wait for";
    if (has_exited()) {
        *exited = true;
        *status = status_;
        return "";
    }
    // Only reap once it is known to be a zombie, so that a blocked wait()
    // elsewhere is not raced.
    siginfo_t info;
    info.si_pid = 0;
    if (waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return "Failed to check on pid " + std::to_string(pid_) + ": " + strerror(errno);
    if (info.si_pid != pid_)
        return "";
    *exited = true;
    return wait(status);
}

void
child_process_t::terminate(int grace_ms)
{
    if (pid_ <= 0 || has_exited())
        return;
    VPRINT(1, "Interrupting pid %d\n", static_cast<int>(pid_));
    kill(pid_, SIGINT);
    const int step_ms = 10;
    for (int waited = 0; waited < grace_ms; waited += step_ms) {
        if (has_exited())
            return;
        // Nobody may be waiting yet: check for a zombie ourselves.
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
            info.si_pid == pid_)
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(step_ms));
    }
    if (!has_exited()) {
        VPRINT(1, "Killing pid %d\n", static_cast<int>(pid_));
        kill(pid_, SIGKILL);
    }
}

} // namespace fibertrace
