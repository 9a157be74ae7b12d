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
/* event_translator_t: turns the runtime's scheduling events into trace records. */

#ifndef _EVENT_TRANSLATOR_H_
#define _EVENT_TRANSLATOR_H_ 1

#include <stdint.h>

#include <string>

#include "fiber_event.h"
#include "registry.h"
#include "trace_writer.h"

namespace fibertrace {

// Record categories.  Viewers filter on these, so they are part of the output.
#define CATEGORY_FIBER "fiber"
#define CATEGORY_SUSPEND "suspend"
#define CATEGORY_SPAN "span"
#define CATEGORY_GC "gc"

/**
 * Consumes the decoded events of one process in delivery order and writes
 * the corresponding records.  Every ring gets a trace thread the first time
 * it is seen, and every fiber gets one when its creation is seen.  Records are
 * attributed to the fiber running on the event's ring, or to the ring itself
 * when it runs no fiber; ring idling and gc phases always go to the ring.
 *
 * The translator, its registry and the writer belong to a single thread.
 */
class event_translator_t {
public:
    // The writer is not owned.  \p pid is the traced process.
    event_translator_t(trace_writer_t *writer, uint64_t pid, unsigned int verbosity = 0);

    /**
     * Translates one event.  Returns "" on success, or the writer's error
     * once it has failed; the translator must not be used after a failure.
     */
    std::string
    process_event(const fiber_event_t &event);

    /**
     * Reports that \p count events of \p ring were lost.  No record is
     * written: the loss is only warned about.
     */
    void
    process_lost_events(ring_id_t ring, uint64_t count);

    const registry_t &
    get_registry() const
    {
        return registry_;
    }

    uint64_t
    get_lost_event_count() const
    {
        return lost_events_;
    }

    uint64_t
    get_ignored_event_count() const
    {
        return ignored_events_;
    }

private:
    thread_ref_t
    ring_thread(ring_id_t ring) const;
    thread_ref_t
    fiber_thread(fiber_id_t fiber) const;
    bool
    register_ring(const ring_state_t &ring);
    bool
    schedule_fiber(ring_state_t *ring, const fiber_event_t &event);
    bool
    create_fiber(ring_state_t *ring, const fiber_event_t &event);
    bool
    suspend_fiber(ring_state_t *ring, const thread_ref_t &thread,
                  const fiber_event_t &event);

    trace_writer_t *writer_;
    uint64_t pid_;
    unsigned int verbosity_;
    registry_t registry_;
    uint64_t lost_events_ = 0;
    uint64_t ignored_events_ = 0;
};

} // namespace fibertrace

#endif /* _EVENT_TRANSLATOR_H_ */
