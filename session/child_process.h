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
/* child_process_t: launches a program and waits for it to exit. */

#ifndef _CHILD_PROCESS_H_
#define _CHILD_PROCESS_H_ 1

#include <sys/types.h>

#include <atomic>
#include <string>
#include <vector>

namespace fibertrace {

#define CHILD_EXIT_EXEC_FAILED 127

// How long terminate() waits after SIGINT before sending SIGKILL.
#define CHILD_TERMINATE_GRACE_MS 2000

/**
 * One child process.  spawn() and terminate() are called from one thread
 * while wait() may block on another; has_exited() may be read from anywhere.
 */
class child_process_t {
public:
    explicit child_process_t(unsigned int verbosity = 0);
    // Kills and reaps a child that is still running.
    ~child_process_t();

    child_process_t(const child_process_t &) = delete;
    child_process_t &
    operator=(const child_process_t &) = delete;

    /**
     * Starts argv[0], looked up in PATH, with \p extra_env placed ahead of
     * this process's own environment.  Returns "" once the program is
     * running, or a description if it could not be started, including when
     * exec failed.
     */
    std::string
    spawn(const std::vector<std::string> &argv, const std::vector<std::string> &extra_env);

    pid_t
    get_pid() const
    {
        return pid_;
    }

    /**
     * Blocks until the child exits and reaps it.  Returns "" and stores the
     * exit code (128 + signal number for a signal) in \p status.
     */
    std::string
    wait(int *status);

    /**
     * Like wait() but never blocks: \p exited says whether the child had
     * exited and been reaped, in which case \p status holds its exit code.
     */
    std::string
    try_wait(int *status, bool *exited);

    bool
    has_exited() const
    {
        return exited_.load(std::memory_order_acquire);
    }

    /**
     * Asks a running child to stop with SIGINT and sends SIGKILL if it is
     * still running after \p grace_ms.  Does not reap it: that is left to
     * whoever calls wait().
     */
    void
    terminate(int grace_ms = CHILD_TERMINATE_GRACE_MS);

private:
    unsigned int verbosity_;
    pid_t pid_ = 0;
    std::atomic<bool> exited_;
    int status_ = 0;
};

} // namespace fibertrace

#endif /* _CHILD_PROCESS_H_ */
