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
/* This is the binary layout of the event buffers an instrumented process
 * writes and the recorder reads.  The process maps one file per process,
 * holding one circular buffer ("ring") per execution context, and appends
 * variable-length events made of 64-bit words.  The recorder only ever reads.
 */

#ifndef _EVENT_ENTRY_H_
#define _EVENT_ENTRY_H_ 1

#include <stddef.h>
#include <stdint.h>

#include "utils.h"

namespace fibertrace {

// The environment variables that turn event emission on in the child.
#define EVENTS_ENV_START "FIBERTRACE_EVENTS_START"
#define EVENTS_ENV_DIR "FIBERTRACE_EVENTS_DIR"
#define EVENTS_ENV_PRESERVE "FIBERTRACE_EVENTS_PRESERVE"

// The buffer file is named <pid>.events inside the events directory.
#define EVENT_FILE_SUFFIX ".events"

// "FIBTRACE" read as a little-endian 64-bit value.
#define EVENT_FILE_MAGIC 0x4543415254424946ULL

#define EVENT_FILE_VERSION_INITIAL 1
#define EVENT_FILE_VERSION EVENT_FILE_VERSION_INITIAL

typedef int ring_id_t;
typedef int64_t fiber_id_t;
typedef uint64_t event_timestamp_t;

/**
 * The header at offset 0 of the buffer file.  The writer fills it in last,
 * so a zero magic means the file is still being set up.
 */
struct event_file_header_t {
    uint64_t magic;
    uint32_t version;
    uint32_t max_rings;
    // Capacity of each ring in 64-bit words.
    uint64_t ring_size_words;
    // File offsets of the ring_header_t array and of the first ring's data.
    uint64_t ring_headers_offset;
    uint64_t ring_data_offset;
    uint64_t reserved[3];
};
static_assert(sizeof(event_file_header_t) == 64, "header layout is fixed");

/**
 * The per-ring indices.  All four are absolute and only grow: word indices
 * are reduced modulo ring_size_words to address the data.  The writer
 * publishes each field with release ordering and stores head_seq before
 * head, and the event words before tail.
 */
struct ring_header_t {
    // Index of the oldest word still in the buffer.
    uint64_t head;
    // Sequence number of the event starting at head.
    uint64_t head_seq;
    // Index one past the last word of the newest complete event.
    uint64_t tail;
    // Number of events ever written to this ring.
    uint64_t tail_seq;
};
static_assert(sizeof(ring_header_t) == 32, "ring header layout is fixed");

// The first word of every event.
#define EVENT_HEADER_LENGTH_BITS 10
#define EVENT_HEADER_TYPE_BITS 8
#define EVENT_HEADER_SUBTYPE_BITS 8
#define EVENT_HEADER_TYPE_SHIFT EVENT_HEADER_LENGTH_BITS
#define EVENT_HEADER_SUBTYPE_SHIFT (EVENT_HEADER_LENGTH_BITS + EVENT_HEADER_TYPE_BITS)

// An event is at least the header word and the timestamp word.
#define EVENT_MIN_WORDS 2
#define EVENT_MAX_WORDS ((1 << EVENT_HEADER_LENGTH_BITS) - 1)

static inline uint64_t
event_header_make(uint32_t length, uint32_t type, uint32_t subtype)
{
    return static_cast<uint64_t>(length & ((1u << EVENT_HEADER_LENGTH_BITS) - 1)) |
        (static_cast<uint64_t>(type & ((1u << EVENT_HEADER_TYPE_BITS) - 1))
         << EVENT_HEADER_TYPE_SHIFT) |
        (static_cast<uint64_t>(subtype & ((1u << EVENT_HEADER_SUBTYPE_BITS) - 1))
         << EVENT_HEADER_SUBTYPE_SHIFT);
}

static inline uint32_t
event_header_length(uint64_t header)
{
    return static_cast<uint32_t>(header & ((1u << EVENT_HEADER_LENGTH_BITS) - 1));
}

static inline uint32_t
event_header_type(uint64_t header)
{
    return static_cast<uint32_t>((header >> EVENT_HEADER_TYPE_SHIFT) &
                                 ((1u << EVENT_HEADER_TYPE_BITS) - 1));
}

static inline uint32_t
event_header_subtype(uint64_t header)
{
    return static_cast<uint32_t>((header >> EVENT_HEADER_SUBTYPE_SHIFT) &
                                 ((1u << EVENT_HEADER_SUBTYPE_BITS) - 1));
}

// The event type in the header word.  The payload that follows the
// timestamp word is listed for each.  A string is a byte-count word followed
// by the bytes, zero-padded to a whole word.
// N.B.: when adding new values, be sure to update event_type_names[].
typedef enum {
    EVENT_TYPE_INVALID,
    // Payload: fiber id.
    EVENT_TYPE_FIBER,
    // Subtype is an event_create_t.  Payload: id, then a second word that is
    // the parent scope id for fibers and the kind for scopes and objects.
    EVENT_TYPE_CREATE,
    // Payload: fiber id.
    EVENT_TYPE_EXIT_FIBER,
    // Payload: object id, string.
    EVENT_TYPE_NAME,
    // Payload: string naming the blocking operation.
    EVENT_TYPE_SUSPEND_FIBER,
    // Payload: string.
    EVENT_TYPE_ENTER_SPAN,
    // No payload.
    EVENT_TYPE_EXIT_SPAN,
    // No payload.
    EVENT_TYPE_EXIT_SCOPE,
    // Payload: string.
    EVENT_TYPE_LOG,
    // Subtype is an event_phase_t.  No payload.
    EVENT_TYPE_SUSPEND_RING,
    // Payload: gc phase number.
    EVENT_TYPE_GC_BEGIN,
    // Payload: gc phase number.
    EVENT_TYPE_GC_END,
    // Update event_type_names[] when adding here.
    EVENT_TYPE_LAST,
} event_type_t;

typedef enum {
    EVENT_CREATE_FIBER,
    EVENT_CREATE_SCOPE,
    EVENT_CREATE_OBJECT,
} event_create_t;

typedef enum {
    EVENT_PHASE_BEGIN,
    EVENT_PHASE_END,
} event_phase_t;

// The kinds of scope a runtime reports in EVENT_CREATE_SCOPE.
// N.B.: when adding new values, be sure to update scope_kind_names[].
typedef enum {
    SCOPE_KIND_SWITCH,
    SCOPE_KIND_PROTECT,
    SCOPE_KIND_SUB,
    SCOPE_KIND_ROOT,
    SCOPE_KIND_ANY,
    SCOPE_KIND_VALUE,
    SCOPE_KIND_LAST,
} scope_kind_t;

// The runtime phases reported by EVENT_TYPE_GC_BEGIN and EVENT_TYPE_GC_END.
// N.B.: when adding new values, be sure to update gc_phase_names[].
typedef enum {
    GC_PHASE_COMPACT,
    GC_PHASE_MAJOR,
    GC_PHASE_MAJOR_SWEEP,
    GC_PHASE_MAJOR_MARK_ROOTS,
    GC_PHASE_MAJOR_MARK,
    GC_PHASE_MINOR,
    GC_PHASE_MINOR_LOCAL_ROOTS,
    GC_PHASE_MINOR_FINALIZED,
    GC_PHASE_EXPLICIT_GC_MAJOR_SLICE,
    GC_PHASE_FINALISE_UPDATE_FIRST,
    GC_PHASE_FINALISE_UPDATE_LAST,
    GC_PHASE_INTERRUPT_REMOTE,
    GC_PHASE_MAJOR_EPHE_MARK,
    GC_PHASE_MAJOR_EPHE_SWEEP,
    GC_PHASE_MAJOR_FINISH_MARKING,
    GC_PHASE_MAJOR_GC_CYCLE_DOMAINS,
    GC_PHASE_MAJOR_GC_PHASE_CHANGE,
    GC_PHASE_MAJOR_GC_STW,
    GC_PHASE_MAJOR_MARK_OPPORTUNISTIC,
    GC_PHASE_MAJOR_SLICE,
    GC_PHASE_MAJOR_FINISH_CYCLE,
    GC_PHASE_MINOR_CLEAR,
    GC_PHASE_MINOR_FINALIZERS_OLDIFY,
    GC_PHASE_MINOR_GLOBAL_ROOTS,
    GC_PHASE_MINOR_LEAVE_BARRIER,
    GC_PHASE_STW_API_BARRIER,
    GC_PHASE_STW_HANDLER,
    GC_PHASE_STW_LEADER,
    GC_PHASE_MAJOR_FINISH_SWEEPING,
    GC_PHASE_MINOR_FINALIZERS_ADMIN,
    GC_PHASE_MINOR_REMEMBERED_SET,
    GC_PHASE_MINOR_REMEMBERED_SET_PROMOTE,
    GC_PHASE_MINOR_LOCAL_ROOTS_PROMOTE,
    GC_PHASE_DOMAIN_CONDITION_WAIT,
    GC_PHASE_DOMAIN_RESIZE_HEAP_RESERVATION,
    GC_PHASE_LAST,
} gc_phase_t;

extern const char *const event_type_names[];
extern const char *const scope_kind_names[];
extern const char *const gc_phase_names[];

// Returns the display name of a gc phase, "phase<n>" for numbers this build
// does not know.
std::string
gc_phase_name(uint64_t phase);

// Returns the display name of a scope kind, "unknown" for kinds this build
// does not know.
std::string
scope_kind_name(uint64_t kind);

// Number of words a string payload of the given byte length occupies.
static inline uint32_t
event_string_words(size_t length)
{
    return static_cast<uint32_t>(1 + ALIGN_FORWARD(length, sizeof(uint64_t)) /
                                     sizeof(uint64_t));
}

} // namespace fibertrace

#endif /* _EVENT_ENTRY_H_ */
