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
/* launcher: the fibertrace front end */

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <atomic>
#include <string>
#include <vector>

#include "common/ftoption.h"
#include "common/options.h"
#include "common/utils.h"
#include "session/recording_session.h"

using namespace ::fibertrace;
using ::fibertrace::ftoption::ftoption_parser_t;

namespace {

#define FATAL_ERROR(msg, ...)                               \
    do {                                                    \
        fprintf(stderr, "ERROR: " msg "\n", ##__VA_ARGS__); \
        fflush(stderr);                                     \
        exit(1);                                            \
    } while (0)

#undef NOTIFY
#define NOTIFY(level, prefix, msg, ...)                              \
    do {                                                             \
        if (op_verbose.get_value() >= level) {                       \
            fprintf(stderr, "%s: " msg "\n", prefix, ##__VA_ARGS__); \
            fflush(stderr);                                          \
        }                                                            \
    } while (0)

std::atomic<bool> interrupted(false);

void
signal_handler(int sig, siginfo_t *info, void *cxt)
{
#define INTERRUPT_MSG "Interrupted: cleaning up.\n"
    ssize_t res = write(STDERR_FILENO, INTERRUPT_MSG, sizeof(INTERRUPT_MSG) - 1);
    (void)res; // Work around compiler warnings.
    // The session notices this at its next sleep or read and unwinds,
    // stopping the child and removing its temporary directory.
    interrupted.store(true);
}

} // namespace

int
main(int argc, const char *argv[])
{
    struct sigaction act;
    act.sa_sigaction = signal_handler;
    sigfillset(&act.sa_mask); // Block all within handler.
    act.sa_flags = SA_SIGINFO;
    if (sigaction(SIGINT, &act, nullptr) != 0 || sigaction(SIGTERM, &act, nullptr) != 0)
        NOTIFY(0, "WARNING", "Failed to set up interrupt handler");

    std::string parse_err;
    int app_idx = 1;
    if (!ftoption_parser_t::parse_argv(argc, argv, &parse_err, &app_idx)) {
        FATAL_ERROR("Usage error: %s\nUsage:\n%s", parse_err.c_str(),
                    ftoption_parser_t::usage_short().c_str());
    }
    if (app_idx >= argc) {
        FATAL_ERROR("Usage error: no application specified\nUsage:\n%s",
                    ftoption_parser_t::usage_short().c_str());
    }

    session_config_t config;
    config.argv.assign(argv + app_idx, argv + argc);
    config.outfile = op_outfile.get_value();
    config.freq = op_freq.get_value();
    config.ui = op_ui.get_value();
    config.tmpdir = op_tmpdir.get_value();
    config.verbosity = op_verbose.get_value();
    config.cancel = &interrupted;
    NOTIFY(1, "INFO", "targeting application: \"%s\"", config.argv[0].c_str());

    recording_session_t session(config);
    if (!session.run()) {
        std::string error_string_ = session.get_error_string();
        FATAL_ERROR("failed to record%s%s", error_string_.empty() ? "" : ": ",
                    error_string_.c_str());
    }
    NOTIFY(1, "INFO", "recorded %llu events from pid %d into %s",
           static_cast<unsigned long long>(session.get_event_count()),
           static_cast<int>(session.get_child_pid()), session.get_trace_path().c_str());
    // The application's own exit code is reported but is not ours.
    NOTIFY(0, "INFO", "---- <application exited with code %d> ----",
           session.get_child_status());
    return 0;
}
