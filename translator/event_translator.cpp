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
#include "event_translator.h"

#include <inttypes.h>

#include <string>

#include "event_entry.h"
#include "flat_id.h"
#include "utils.h"

namespace fibertrace {

event_translator_t::event_translator_t(trace_writer_t *writer, uint64_t pid,
                                       unsigned int verbosity)
    : writer_(writer)
    , pid_(pid)
    , verbosity_(verbosity)
{
}

thread_ref_t
event_translator_t::ring_thread(ring_id_t ring) const
{
    return thread_ref_t { pid_, flat_id_of_ring(ring) };
}

thread_ref_t
event_translator_t::fiber_thread(fiber_id_t fiber) const
{
    return thread_ref_t { pid_, flat_id_of_fiber(fiber) };
}

bool
event_translator_t::register_ring(const ring_state_t &ring)
{
    VPRINT(2, "New ring %d\n", ring.id);
    return writer_->register_thread(pid_, flat_id_of_ring(ring.id),
                                    "ring" + std::to_string(ring.id),
                                    { trace_arg_t::koid("process", pid_) });
}

bool
event_translator_t::schedule_fiber(ring_state_t *ring, const fiber_event_t &event)
{
    fiber_state_t &fiber = registry_.get_fiber(event.id);
    ring->has_current_fiber = true;
    ring->current_fiber = fiber.id;
    if (!writer_->wakeup(static_cast<uint32_t>(event.ring), event.timestamp,
                         flat_id_of_fiber(fiber.id)))
        return false;
    if (fiber.suspended) {
        // Closes the span opened when the fiber blocked.
        if (!writer_->duration_end(fiber_thread(fiber.id), fiber.pending_op,
                                   CATEGORY_SUSPEND, event.timestamp, {}))
            return false;
        fiber.suspended = false;
        fiber.pending_op.clear();
    }
    return true;
}

bool
event_translator_t::create_fiber(ring_state_t *ring, const fiber_event_t &event)
{
    fiber_state_t &fiber = registry_.get_fiber(event.id);
    if (!fiber.registered) {
        VPRINT(2, "New fiber %" PRId64 " on ring %d\n", fiber.id, ring->id);
        if (!writer_->register_thread(pid_, flat_id_of_fiber(fiber.id),
                                      "fiber" + std::to_string(fiber.id),
                                      { trace_arg_t::koid("process", pid_) }))
            return false;
        fiber.registered = true;
    }
    // The new fiber runs straight away, without a wakeup.
    ring->has_current_fiber = true;
    ring->current_fiber = fiber.id;
    return writer_->instant_event(
        fiber_thread(fiber.id), "create-fiber", CATEGORY_FIBER, event.timestamp,
        { trace_arg_t::pointer("id", static_cast<uint64_t>(fiber.id)),
          trace_arg_t::pointer("cc", static_cast<uint64_t>(event.detail)) });
}

bool
event_translator_t::suspend_fiber(ring_state_t *ring, const thread_ref_t &thread,
                                  const fiber_event_t &event)
{
    if (ring->has_current_fiber) {
        fiber_state_t &fiber = registry_.get_fiber(ring->current_fiber);
        fiber.suspended = true;
        fiber.pending_op = event.text;
    }
    ring->has_current_fiber = false;
    return writer_->duration_begin(thread, event.text, CATEGORY_SUSPEND, event.timestamp,
                                   {});
}

std::string
event_translator_t::process_event(const fiber_event_t &event)
{
    bool created;
    ring_state_t &ring = registry_.get_ring(event.ring, &created);
    if (created && !register_ring(ring))
        return writer_->get_error_string();

    // Resolved before the event changes which fiber is current.
    const thread_ref_t thread =
        ring.has_current_fiber ? fiber_thread(ring.current_fiber) : ring_thread(ring.id);
    const uint64_t ts = event.timestamp;
    bool ok = true;
    switch (event.kind) {
    case FIBER_EVENT_SCHEDULED: ok = schedule_fiber(&ring, event); break;
    case FIBER_EVENT_CREATED: ok = create_fiber(&ring, event); break;
    case FIBER_EVENT_SCOPE_OPENED:
        ok = writer_->duration_begin(
            thread, "cc", CATEGORY_FIBER, ts,
            { trace_arg_t::pointer("id", static_cast<uint64_t>(event.id)),
              trace_arg_t::string("type", scope_kind_name(event.detail)),
              trace_arg_t::int64("cpu", event.ring) });
        break;
    case FIBER_EVENT_OBJECT_CREATED:
        // Only fibers and scopes show up in the trace.
        break;
    case FIBER_EVENT_FIBER_EXITED:
        ok = writer_->instant_event(
            thread, "exit-fiber", CATEGORY_FIBER, ts,
            { trace_arg_t::pointer("id", static_cast<uint64_t>(event.id)) });
        break;
    case FIBER_EVENT_NAMED:
        ok = writer_->name_object(thread, event.text, static_cast<uint64_t>(event.id));
        break;
    case FIBER_EVENT_SUSPENDING: ok = suspend_fiber(&ring, thread, event); break;
    case FIBER_EVENT_SPAN_ENTERED:
        ok = writer_->duration_begin(thread, event.text, CATEGORY_SPAN, ts, {});
        break;
    case FIBER_EVENT_SPAN_EXITED:
        // The viewer pairs this with the innermost open span of the thread.
        ok = writer_->duration_end(thread, "", CATEGORY_SPAN, ts, {});
        break;
    case FIBER_EVENT_SCOPE_CLOSED:
        ok = writer_->duration_end(thread, "cc", CATEGORY_FIBER, ts, {});
        break;
    case FIBER_EVENT_LOGGED:
        ok = writer_->instant_event(thread, "log", CATEGORY_FIBER, ts,
                                    { trace_arg_t::string("message", event.text) });
        break;
    case FIBER_EVENT_RING_IDLING:
        if (event.begin) {
            ok = writer_->duration_begin(ring_thread(ring.id), "suspend-domain",
                                         CATEGORY_FIBER, ts, {});
        } else {
            ok = writer_->duration_end(ring_thread(ring.id), "suspend-domain",
                                       CATEGORY_FIBER, ts, {});
        }
        break;
    case FIBER_EVENT_GC_PHASE: {
        std::string phase = gc_phase_name(static_cast<uint64_t>(event.detail));
        if (event.begin)
            ok = writer_->duration_begin(ring_thread(ring.id), phase, CATEGORY_GC, ts, {});
        else
            ok = writer_->duration_end(ring_thread(ring.id), phase, CATEGORY_GC, ts, {});
        break;
    }
    case FIBER_EVENT_UNKNOWN:
    default:
        ++ignored_events_;
        VPRINT(3, "Ignoring event of type %" PRId64 " on ring %d\n", event.detail,
               event.ring);
        break;
    }
    if (!ok)
        return writer_->get_error_string();
    return "";
}

void
event_translator_t::process_lost_events(ring_id_t ring, uint64_t count)
{
    lost_events_ += count;
    WARN("ring %d lost %" PRIu64 " events", ring, count);
}

} // namespace fibertrace
