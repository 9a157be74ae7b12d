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
/* flat_id.h: maps ring ids and fiber ids into the single thread id space of
 * the trace.  The low FLAT_ID_TAG_BITS bits say which space an id came from,
 * so the two never collide however their numbers overlap.  A third id space
 * needs a tag value of its own, which means widening the shift first.
 */

#ifndef _FLAT_ID_H_
#define _FLAT_ID_H_ 1

#include <stdint.h>

#include "event_entry.h"

namespace fibertrace {

#define FLAT_ID_TAG_BITS 2
#define FLAT_ID_TAG_MASK ((1ULL << FLAT_ID_TAG_BITS) - 1)
#define FLAT_ID_TAG_RING 1
#define FLAT_ID_TAG_FIBER 2

static inline uint64_t
flat_id_of_ring(ring_id_t ring)
{
    return (static_cast<uint64_t>(ring) << FLAT_ID_TAG_BITS) | FLAT_ID_TAG_RING;
}

static inline uint64_t
flat_id_of_fiber(fiber_id_t fiber)
{
    return (static_cast<uint64_t>(fiber) << FLAT_ID_TAG_BITS) | FLAT_ID_TAG_FIBER;
}

static inline bool
flat_id_is_ring(uint64_t flat_id)
{
    return (flat_id & FLAT_ID_TAG_MASK) == FLAT_ID_TAG_RING;
}

static inline bool
flat_id_is_fiber(uint64_t flat_id)
{
    return (flat_id & FLAT_ID_TAG_MASK) == FLAT_ID_TAG_FIBER;
}

} // namespace fibertrace

#endif /* _FLAT_ID_H_ */
