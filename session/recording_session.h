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
/* recording_session_t: records one run of an instrumented program into a
 * trace file.
 */

#ifndef _RECORDING_SESSION_H_
#define _RECORDING_SESSION_H_ 1

#include <stdint.h>

#include <atomic>
#include <future>
#include <memory>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "child_process.h"
#include "event_cursor.h"
#include "event_translator.h"
#include "fxt_writer.h"
#include "temp_dir.h"

namespace fibertrace {

#define TRACE_PROVIDER_NAME "fibertrace"

// Delay before each attempt to open the child's event buffers.
#define CURSOR_RETRY_DELAY_MS 100

// How long the viewer hand-off waits for recording to finish.
#define VIEWER_DELAY_MS 1000

typedef enum {
    SESSION_SPAWNING,
    SESSION_WAITING_FOR_CURSOR,
    SESSION_POLLING,
    SESSION_DRAINING,
    SESSION_CLOSED,
} session_state_t;

/** Everything one recording needs. */
struct session_config_t {
    // The program to record and its arguments.
    std::vector<std::string> argv;
    // Trace path; see the -outfile option for how an empty path is resolved.
    std::string outfile;
    // Poll frequency in Hz.
    double freq = 100.;
    // Viewer command, or empty for none.
    std::string ui;
    // Parent of the temporary directory, or empty for the default.
    std::string tmpdir;
    unsigned int verbosity = 0;
    // Set to true from outside to abandon the recording.  Optional.
    const std::atomic<bool> *cancel = nullptr;
    // Where to write the trace instead of opening outfile.  Not owned.
    std::ostream *out_stream = nullptr;
};

/**
 * Runs the program with event emission enabled, polls its event buffers
 * until it exits and translates every event into the trace.
 *
 * Three threads are involved: the one calling run(), which owns the cursor,
 * translator and writer; a waiter blocked on the child's exit, which only
 * sets child_exited_; and, with a viewer configured, one that starts the
 * viewer and waits for it.  Whatever way run() ends, the child is stopped,
 * the trace is closed and the temporary directory is removed before it
 * returns.
 */
class recording_session_t {
public:
    explicit recording_session_t(const session_config_t &config);
    ~recording_session_t();

    recording_session_t(const recording_session_t &) = delete;
    recording_session_t &
    operator=(const recording_session_t &) = delete;

    /**
     * Records the program.  Returns true if the trace was written completely;
     * otherwise get_error_string() says why.  May only be called once.
     */
    bool
    run();

    std::string
    get_error_string() const
    {
        return error_string_;
    }

    session_state_t
    get_state() const
    {
        return state_;
    }

    // Path the trace was written to.  Set once run() has started.
    const std::string &
    get_trace_path() const
    {
        return trace_path_;
    }

    // Path of the directory handed to the child.  Stays set after removal.
    const std::string &
    get_events_dir() const
    {
        return events_dir_;
    }

    pid_t
    get_child_pid() const
    {
        return child_.get_pid();
    }

    // The child's exit code, valid once run() has returned.
    int
    get_child_status() const
    {
        return child_status_;
    }

    uint64_t
    get_event_count() const
    {
        return event_count_;
    }

    uint64_t
    get_lost_event_count() const
    {
        return translator_ == nullptr ? 0 : translator_->get_lost_event_count();
    }

private:
    bool
    set_error(const std::string &error);
    bool
    cancelled() const;
    // These sleep for the given time, returning false early when cancelled.
    bool
    sleep_ms(int ms);
    bool
    sleep_us(int64_t us);
    bool
    open_output();
    bool
    close_output();
    bool
    spawn_child();
    bool
    wait_for_cursor();
    bool
    poll_events();
    bool
    read_events();
    void
    start_viewer();
    void
    close();

    session_config_t config_;
    unsigned int verbosity_;
    session_state_t state_ = SESSION_SPAWNING;
    std::string error_string_;
    std::string trace_path_;
    std::string events_dir_;
    temp_dir_t temp_dir_;
    std::unique_ptr<std::ostream> owned_out_;
    std::ostream *out_ = nullptr;
    std::unique_ptr<fxt_writer_t> writer_;
    std::unique_ptr<event_translator_t> translator_;
    event_cursor_t cursor_;
    child_process_t child_;
    std::thread waiter_;
    std::atomic<bool> child_exited_;
    int child_status_ = -1;
    std::promise<void> finished_;
    bool finished_set_ = false;
    std::thread viewer_thread_;
    child_process_t viewer_;
    uint64_t event_count_ = 0;
    bool ran_ = false;
};

} // namespace fibertrace

#endif /* _RECORDING_SESSION_H_ */
