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
/* registry_t: the rings and fibers seen so far in one recording. */

#ifndef _REGISTRY_H_
#define _REGISTRY_H_ 1

#include <stddef.h>

#include <string>
#include <unordered_map>

#include "event_entry.h"

namespace fibertrace {

struct fiber_state_t {
    explicit fiber_state_t(fiber_id_t fiber_id)
        : id(fiber_id)
    {
    }
    fiber_id_t id;
    // Whether the trace has a thread record for this fiber yet.
    bool registered = false;
    // Set while the fiber is blocked, to the name of the blocking operation.
    bool suspended = false;
    std::string pending_op;
};

struct ring_state_t {
    explicit ring_state_t(ring_id_t ring_id)
        : id(ring_id)
    {
    }
    ring_id_t id;
    // The fiber running on the ring, if any.  This names an entry in the
    // registry's fiber table; the ring does not own it.
    bool has_current_fiber = false;
    fiber_id_t current_fiber = 0;
};

/**
 * Get-or-create tables of rings and fibers, keyed by their ids.  Entries are
 * never removed, so references returned stay valid for the registry's
 * lifetime.  Not thread-safe: owned by the thread that translates events.
 */
class registry_t {
public:
    // Sets *created to whether the ring was seen for the first time.
    ring_state_t &
    get_ring(ring_id_t id, bool *created);

    fiber_state_t &
    get_fiber(fiber_id_t id);

    // Returns nullptr if the fiber has never been referenced.
    const fiber_state_t *
    find_fiber(fiber_id_t id) const;
    const ring_state_t *
    find_ring(ring_id_t id) const;

    size_t
    ring_count() const
    {
        return rings_.size();
    }
    size_t
    fiber_count() const
    {
        return fibers_.size();
    }

private:
    std::unordered_map<ring_id_t, ring_state_t> rings_;
    std::unordered_map<fiber_id_t, fiber_state_t> fibers_;
};

} // namespace fibertrace

#endif /* _REGISTRY_H_ */
