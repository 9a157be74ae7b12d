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
/* event_cursor_t: reads the events a running (or exited) instrumented
 * process has written into its event buffer file.
 */

#ifndef _EVENT_CURSOR_H_
#define _EVENT_CURSOR_H_ 1

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <string>
#include <vector>

#include "event_entry.h"
#include "fiber_event.h"

namespace fibertrace {

/**
 * Reads the per-ring circular buffers of one process's event file.  The file
 * is mapped read-only and never modified, so any number of cursors may read
 * the same file.  Each cursor remembers, per ring, the position up to which it
 * has delivered events.
 *
 * A cursor is not thread-safe: it is meant to be owned by a single polling
 * thread.
 */
class event_cursor_t {
public:
    // Returning false stops the current read().
    typedef std::function<bool(const fiber_event_t &)> event_callback_t;
    typedef std::function<void(ring_id_t ring, uint64_t count)> lost_events_callback_t;

    struct callbacks_t {
        event_callback_t on_event;
        lost_events_callback_t on_lost_events;
    };

    explicit event_cursor_t(unsigned int verbosity = 0);
    ~event_cursor_t();

    event_cursor_t(const event_cursor_t &) = delete;
    event_cursor_t &
    operator=(const event_cursor_t &) = delete;

    /**
     * Opens the event file that process \p pid writes inside \p dir.  Returns
     * "" on success.  On failure returns a description and sets \p retryable
     * to whether the failure may go away on its own: the file not existing
     * yet, being shorter than its layout, or lacking its header are
     * retryable; a foreign or incompatible file is not.
     */
    std::string
    open(const std::string &dir, int64_t pid, bool *retryable);

    // Like open() but takes the path of the event file itself.
    std::string
    open_file(const std::string &path, bool *retryable);

    /**
     * Delivers every complete event written since the previous read().  Events
     * from all rings are merged by timestamp; events from one ring keep their
     * order.  Events the writer overwrote before this cursor saw them are
     * reported per ring through callbacks.on_lost_events, before any event of
     * this read.  Returns "" on success, or a description if the cursor is not
     * open or callbacks.on_event asked to stop.  The number of events
     * delivered is stored in \p count if it is non-NULL.
     */
    std::string
    read(const callbacks_t &callbacks, uint64_t *count = nullptr);

    bool
    is_open() const
    {
        return map_ != nullptr;
    }

    void
    close();

    uint32_t
    get_max_rings() const
    {
        return max_rings_;
    }

    const std::string &
    get_path() const
    {
        return path_;
    }

private:
    struct ring_position_t {
        // Absolute word index of the next event to read.
        uint64_t pos = 0;
        // Sequence number of the event at pos.
        uint64_t seq = 0;
    };

    const ring_header_t *
    ring_header(uint32_t ring) const;
    uint64_t
    ring_word(uint32_t ring, uint64_t index) const;
    // Reads the ring's new events into batch_.
    void
    read_ring(uint32_t ring, const callbacks_t &callbacks);
    // Turns the raw words of one event into a fiber_event_t.
    bool
    decode_event(ring_id_t ring, const std::vector<uint64_t> &words,
                 fiber_event_t *event);
    bool
    decode_string(const std::vector<uint64_t> &words, size_t index, std::string *str);

    unsigned int verbosity_;
    std::string path_;
    int fd_ = -1;
    const unsigned char *map_ = nullptr;
    size_t map_size_ = 0;
    uint32_t max_rings_ = 0;
    uint64_t ring_size_words_ = 0;
    uint64_t ring_headers_offset_ = 0;
    uint64_t ring_data_offset_ = 0;
    std::vector<ring_position_t> positions_;
    // Scratch space reused across reads.
    std::vector<uint64_t> words_;
    std::vector<fiber_event_t> batch_;
};

} // namespace fibertrace

#endif /* _EVENT_CURSOR_H_ */
