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
#include "event_entry.h"

#include <string>

namespace fibertrace {

/* Keep synched with event_type_t enum in event_entry.h.
 */
const char *const event_type_names[] = {
    "invalid",    "fiber",    "create", "exit_fiber",   "name",     "suspend_fiber",
    "enter_span", "exit_span", "exit_cc", "log", "suspend_ring", "gc_begin",
    "gc_end",
};
static_assert(sizeof(event_type_names) / sizeof(event_type_names[0]) ==
                  EVENT_TYPE_LAST,
              "event_type_names[] is out of sync with event_type_t");

/* Keep synched with scope_kind_t enum in event_entry.h.
 */
const char *const scope_kind_names[] = {
    "switch", "protect", "sub", "root", "any", "value",
};
static_assert(sizeof(scope_kind_names) / sizeof(scope_kind_names[0]) ==
                  SCOPE_KIND_LAST,
              "scope_kind_names[] is out of sync with scope_kind_t");

/* Keep synched with gc_phase_t enum in event_entry.h.
 */
const char *const gc_phase_names[] = {
    "compact",
    "major",
    "major_sweep",
    "major_mark_roots",
    "major_mark",
    "minor",
    "minor_local_roots",
    "minor_finalized",
    "explicit_gc_major_slice",
    "finalise_update_first",
    "finalise_update_last",
    "interrupt_remote",
    "major_ephe_mark",
    "major_ephe_sweep",
    "major_finish_marking",
    "major_gc_cycle_domains",
    "major_gc_phase_change",
    "major_gc_stw",
    "major_mark_opportunistic",
    "major_slice",
    "major_finish_cycle",
    "minor_clear",
    "minor_finalizers_oldify",
    "minor_global_roots",
    "minor_leave_barrier",
    "stw_api_barrier",
    "stw_handler",
    "stw_leader",
    "major_finish_sweeping",
    "minor_finalizers_admin",
    "minor_remembered_set",
    "minor_remembered_set_promote",
    "minor_local_roots_promote",
    "domain_condition_wait",
    "domain_resize_heap_reservation",
};
static_assert(sizeof(gc_phase_names) / sizeof(gc_phase_names[0]) == GC_PHASE_LAST,
              "gc_phase_names[] is out of sync with gc_phase_t");

std::string
gc_phase_name(uint64_t phase)
{
    if (phase < GC_PHASE_LAST)
        return gc_phase_names[phase];
    return "phase" + std::to_string(phase);
}

std::string
scope_kind_name(uint64_t kind)
{
    if (kind < SCOPE_KIND_LAST)
        return scope_kind_names[kind];
    return "unknown";
}

} // namespace fibertrace
