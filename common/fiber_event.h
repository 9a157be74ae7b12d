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
/* This is the decoded event that the cursor delivers and the translator consumes. */

#ifndef _FIBER_EVENT_H_
#define _FIBER_EVENT_H_ 1

#include <stdint.h>

#include <string>

#include "event_entry.h"

namespace fibertrace {

/**
 * The kinds of decoded event.  Every raw event_type_t maps onto one of these;
 * raw types this build does not understand are delivered as
 * #FIBER_EVENT_UNKNOWN so that consumers can ignore them explicitly.
 */
typedef enum {
    FIBER_EVENT_UNKNOWN,
    FIBER_EVENT_SCHEDULED,      /**< A fiber was scheduled onto the ring. */
    FIBER_EVENT_CREATED,        /**< A fiber was created inside a scope. */
    FIBER_EVENT_SCOPE_OPENED,   /**< A scope ("cc") was opened. */
    FIBER_EVENT_OBJECT_CREATED, /**< Some other runtime object was created. */
    FIBER_EVENT_FIBER_EXITED,   /**< A fiber finished. */
    FIBER_EVENT_NAMED,          /**< An object was given a name. */
    FIBER_EVENT_SUSPENDING,     /**< The current fiber is about to block. */
    FIBER_EVENT_SPAN_ENTERED,   /**< An instrumentation span began. */
    FIBER_EVENT_SPAN_EXITED,    /**< The innermost span ended. */
    FIBER_EVENT_SCOPE_CLOSED,   /**< The innermost scope ended. */
    FIBER_EVENT_LOGGED,         /**< A log message. */
    FIBER_EVENT_RING_IDLING,    /**< The ring itself began or stopped idling. */
    FIBER_EVENT_GC_PHASE,       /**< A runtime phase began or ended. */
} fiber_event_kind_t;

/**
 * One decoded event.  Which fields are meaningful depends on #kind:
 *
 * - SCHEDULED, FIBER_EXITED: #id is the fiber id.
 * - CREATED: #id is the fiber id, #detail the parent scope id.
 * - SCOPE_OPENED, OBJECT_CREATED: #id is the object id, #detail its kind.
 * - NAMED: #id is the object id, #text the name.
 * - SUSPENDING, SPAN_ENTERED: #text is the operation or span name.
 * - LOGGED: #text is the message.
 * - RING_IDLING: #begin.
 * - GC_PHASE: #begin, #detail is the phase number.
 * - UNKNOWN: #detail is the raw event type.
 */
struct fiber_event_t {
    fiber_event_kind_t kind = FIBER_EVENT_UNKNOWN;
    ring_id_t ring = 0;
    event_timestamp_t timestamp = 0;
    int64_t id = 0;
    int64_t detail = 0;
    bool begin = false;
    std::string text;
};

} // namespace fibertrace

#endif /* _FIBER_EVENT_H_ */
