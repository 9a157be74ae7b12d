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
#include "recording_session.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "event_entry.h"
#include "options.h"
#include "utils.h"
#ifdef HAS_ZLIB
#    include "gzip_ostream.h"
#endif
#ifdef HAS_LZ4
#    include "lz4_ostream.h"
#endif

namespace fibertrace {

recording_session_t::recording_session_t(const session_config_t &config)
    : config_(config)
    , verbosity_(config.verbosity)
    , temp_dir_(config.verbosity)
    , cursor_(config.verbosity)
    , child_(config.verbosity)
    , child_exited_(false)
    , viewer_(config.verbosity)
{
}

recording_session_t::~recording_session_t()
{
    close();
}

bool
recording_session_t::set_error(const std::string &error)
{
    // The first failure is the one worth reporting.
    if (error_string_.empty())
        error_string_ = error;
    return false;
}

bool
recording_session_t::cancelled() const
{
    return config_.cancel != nullptr && config_.cancel->load(std::memory_order_acquire);
}

bool
recording_session_t::sleep_ms(int ms)
{
    return sleep_us(static_cast<int64_t>(ms) * 1000);
}

bool
recording_session_t::sleep_us(int64_t us)
{
    // Sleep in slices so that cancellation is noticed promptly.
    const int64_t slice_us = 10000;
    while (us > 0) {
        if (cancelled())
            return false;
        int64_t step = std::min(us, slice_us);
        std::this_thread::sleep_for(std::chrono::microseconds(step));
        us -= step;
    }
    return !cancelled();
}

bool
recording_session_t::run()
{
    if (ran_)
        return set_error("A recording session can only be run once");
    ran_ = true;
    std::string error = temp_dir_.create(config_.tmpdir);
    bool ok;
    if (!error.empty()) {
        ok = set_error(error);
    } else {
        events_dir_ = temp_dir_.get_path();
        ok = open_output() && spawn_child() && wait_for_cursor() && poll_events();
    }
    close();
    return ok && error_string_.empty();
}

bool
recording_session_t::open_output()
{
    if (!config_.outfile.empty())
        trace_path_ = config_.outfile;
    else if (!config_.ui.empty())
        trace_path_ = events_dir_ + DIRSEP DEFAULT_TRACE_FILE;
    else
        trace_path_ = DEFAULT_TRACE_FILE;

    if (config_.out_stream != nullptr) {
        out_ = config_.out_stream;
    } else if (ends_with(trace_path_, TRACE_SUFFIX_GZ)) {
#ifdef HAS_ZLIB
        owned_out_.reset(new gzip_ostream_t(trace_path_));
#else
        return set_error("This build does not support gzip output: " + trace_path_);
#endif
    } else if (ends_with(trace_path_, TRACE_SUFFIX_LZ4)) {
#ifdef HAS_LZ4
        owned_out_.reset(new lz4_ostream_t(trace_path_));
#else
        return set_error("This build does not support lz4 output: " + trace_path_);
#endif
    } else {
        owned_out_.reset(new std::ofstream(trace_path_, std::ofstream::binary));
    }
    if (owned_out_)
        out_ = owned_out_.get();
    if (!*out_)
        return set_error("Failed to open " + trace_path_ + " for writing");
    writer_.reset(new fxt_writer_t(out_, verbosity_));
    if (!writer_->init(TRACE_PROVIDER_NAME))
        return set_error(writer_->get_error_string());
    VPRINT(0, "Recording to %s\n", trace_path_.c_str());
    return true;
}

bool
recording_session_t::close_output()
{
    bool ok = true;
    if (writer_ && !writer_->flush())
        ok = set_error(writer_->get_error_string());
    if (owned_out_) {
#ifdef HAS_ZLIB
        gzip_ostream_t *gz = dynamic_cast<gzip_ostream_t *>(owned_out_.get());
        if (gz != nullptr)
            gz->close();
#endif
#ifdef HAS_LZ4
        lz4_ostream_t *lz4 = dynamic_cast<lz4_ostream_t *>(owned_out_.get());
        if (lz4 != nullptr)
            lz4->close();
#endif
        std::ofstream *file = dynamic_cast<std::ofstream *>(owned_out_.get());
        if (file != nullptr)
            file->close();
        if (!*owned_out_)
            ok = set_error("Failed to write " + trace_path_);
        owned_out_.reset();
    }
    out_ = nullptr;
    return ok;
}

bool
recording_session_t::spawn_child()
{
    state_ = SESSION_SPAWNING;
    if (cancelled())
        return set_error("Recording interrupted");
    std::vector<std::string> env = {
        EVENTS_ENV_START "=1",
        std::string(EVENTS_ENV_DIR "=") + events_dir_,
        EVENTS_ENV_PRESERVE "=1",
    };
    std::string error = child_.spawn(config_.argv, env);
    if (!error.empty())
        return set_error(error);
    translator_.reset(new event_translator_t(
        writer_.get(), static_cast<uint64_t>(child_.get_pid()), verbosity_));
    waiter_ = std::thread([this]() {
        int status = -1;
        std::string error = child_.wait(&status);
        if (!error.empty())
            WARN("%s", error.c_str());
        child_status_ = status;
        child_exited_.store(true, std::memory_order_release);
    });
    if (!config_.ui.empty())
        start_viewer();
    return true;
}

bool
recording_session_t::wait_for_cursor()
{
    state_ = SESSION_WAITING_FOR_CURSOR;
    while (true) {
        if (!sleep_ms(CURSOR_RETRY_DELAY_MS))
            return set_error("Recording interrupted");
        // Sampled before the attempt: a child that exits right after creating
        // its buffers still gets them read.
        bool exited = child_exited_.load(std::memory_order_acquire);
        bool retryable;
        std::string error = cursor_.open(events_dir_, child_.get_pid(), &retryable);
        if (error.empty())
            return true;
        if (!retryable)
            return set_error(error);
        if (exited)
            return set_error("Child exited before creating its event buffers: " + error);
        WARN("%s (will retry)", error.c_str());
    }
}

bool
recording_session_t::read_events()
{
    std::string translate_error;
    event_cursor_t::callbacks_t callbacks;
    callbacks.on_event = [this, &translate_error](const fiber_event_t &event) {
        translate_error = translator_->process_event(event);
        return translate_error.empty();
    };
    callbacks.on_lost_events = [this](ring_id_t ring, uint64_t count) {
        translator_->process_lost_events(ring, count);
    };
    uint64_t count = 0;
    std::string error = cursor_.read(callbacks, &count);
    event_count_ += count;
    if (!translate_error.empty())
        return set_error(translate_error);
    if (!error.empty())
        return set_error(error);
    return true;
}

bool
recording_session_t::poll_events()
{
    state_ = SESSION_POLLING;
    const int64_t delay_us = static_cast<int64_t>(1000000. / config_.freq);
    while (true) {
        if (cancelled())
            return set_error("Recording interrupted");
        // The flag is read before the events: once it is seen, one more
        // read picks up whatever the child wrote before exiting.
        bool stop = child_exited_.load(std::memory_order_acquire);
        if (stop) {
            state_ = SESSION_DRAINING;
            VPRINT(1, "Child exited: reading the remaining events\n");
        }
        if (!read_events())
            return false;
        if (stop)
            return true;
        if (!sleep_us(delay_us))
            return set_error("Recording interrupted");
    }
}

void
recording_session_t::start_viewer()
{
    std::future<void> finished = finished_.get_future();
    viewer_thread_ = std::thread([this, finished = std::move(finished)]() {
        // Give a short recording the chance to finish first.
        finished.wait_for(std::chrono::milliseconds(VIEWER_DELAY_MS));
        if (cancelled())
            return;
        std::string error = viewer_.spawn({ config_.ui, trace_path_ }, {});
        if (!error.empty()) {
            WARN("Failed to start the viewer: %s", error.c_str());
            return;
        }
        bool exited = false;
        bool interrupted = false;
        int status = 0;
        while (true) {
            error = viewer_.try_wait(&status, &exited);
            if (!error.empty()) {
                WARN("%s", error.c_str());
                return;
            }
            if (exited)
                break;
            if (!interrupted && cancelled()) {
                viewer_.terminate();
                interrupted = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        VPRINT(1, "Viewer exited with status %d\n", status);
    });
}

void
recording_session_t::close()
{
    if (state_ == SESSION_CLOSED)
        return;
    // A child still running here means the recording failed or was cancelled.
    if (waiter_.joinable()) {
        if (!child_exited_.load(std::memory_order_acquire))
            child_.terminate();
        waiter_.join();
    }
    close_output();
    state_ = SESSION_CLOSED;
    // The viewer may be reading a trace inside the temporary directory.
    if (viewer_thread_.joinable()) {
        if (!finished_set_) {
            finished_.set_value();
            finished_set_ = true;
        }
        viewer_thread_.join();
    }
    cursor_.close();
    std::string error = temp_dir_.remove();
    if (!error.empty())
        set_error(error);
    VPRINT(1, "Recording closed after %llu events\n",
           static_cast<unsigned long long>(event_count_));
}

} // namespace fibertrace
