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
/* trace_writer_t: the primitives the translator needs from a trace format. */

#ifndef _TRACE_WRITER_H_
#define _TRACE_WRITER_H_ 1

#include <stdint.h>

#include <string>
#include <vector>

namespace fibertrace {

/** The location a record is attributed to. */
struct thread_ref_t {
    uint64_t pid;
    uint64_t tid;
};

static inline bool
operator==(const thread_ref_t &a, const thread_ref_t &b)
{
    return a.pid == b.pid && a.tid == b.tid;
}

typedef enum {
    TRACE_ARG_INT64,
    TRACE_ARG_STRING,
    TRACE_ARG_POINTER,
    TRACE_ARG_KOID,
} trace_arg_type_t;

/** One named argument attached to a record. */
struct trace_arg_t {
    std::string name;
    trace_arg_type_t type;
    // For TRACE_ARG_INT64 this holds the value reinterpreted as unsigned.
    uint64_t value;
    std::string str;

    static trace_arg_t
    int64(const std::string &name, int64_t value)
    {
        return trace_arg_t { name, TRACE_ARG_INT64, static_cast<uint64_t>(value), "" };
    }
    static trace_arg_t
    string(const std::string &name, const std::string &value)
    {
        return trace_arg_t { name, TRACE_ARG_STRING, 0, value };
    }
    static trace_arg_t
    pointer(const std::string &name, uint64_t value)
    {
        return trace_arg_t { name, TRACE_ARG_POINTER, value, "" };
    }
    static trace_arg_t
    koid(const std::string &name, uint64_t value)
    {
        return trace_arg_t { name, TRACE_ARG_KOID, value, "" };
    }
};

typedef std::vector<trace_arg_t> trace_args_t;

/**
 * A sink for trace records.  Every method returns false once the output
 * has failed, after which get_error_string() describes the failure and no
 * further records are written.
 */
class trace_writer_t {
public:
    virtual ~trace_writer_t() = default;

    /** Declares thread \p tid of process \p pid with a display name. */
    virtual bool
    register_thread(uint64_t pid, uint64_t tid, const std::string &name,
                    const trace_args_t &args) = 0;

    virtual bool
    duration_begin(const thread_ref_t &thread, const std::string &name,
                   const std::string &category, uint64_t timestamp,
                   const trace_args_t &args) = 0;

    virtual bool
    duration_end(const thread_ref_t &thread, const std::string &name,
                 const std::string &category, uint64_t timestamp,
                 const trace_args_t &args) = 0;

    virtual bool
    instant_event(const thread_ref_t &thread, const std::string &name,
                  const std::string &category, uint64_t timestamp,
                  const trace_args_t &args) = 0;

    /** Marks thread \p tid, a flat fiber id, as woken on \p cpu. */
    virtual bool
    wakeup(uint32_t cpu, uint64_t timestamp, uint64_t tid) = 0;

    /** Gives the object \p object_id a name, as seen from \p thread. */
    virtual bool
    name_object(const thread_ref_t &thread, const std::string &name,
                uint64_t object_id) = 0;

    /** Pushes everything written so far to the underlying output. */
    virtual bool
    flush() = 0;

    virtual std::string
    get_error_string() const = 0;
};

} // namespace fibertrace

#endif /* _TRACE_WRITER_H_ */
