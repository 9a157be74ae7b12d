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
/* fxt_writer_t: writes trace records in the Fuchsia trace format (FXT),
 * which Perfetto and the Fuchsia trace viewer read.
 */

#ifndef _FXT_WRITER_H_
#define _FXT_WRITER_H_ 1

#include <stdint.h>

#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "trace_writer.h"

namespace fibertrace {

// Longer strings are truncated so that every record fits the 12-bit size field.
#define FXT_WRITER_MAX_STRING_BYTES 4096

#define FXT_WRITER_PROVIDER_ID 1

class fxt_writer_t : public trace_writer_t {
public:
    // The stream is not owned and must outlive the writer.
    explicit fxt_writer_t(std::ostream *out, unsigned int verbosity = 0);

    /**
     * Writes the magic number, provider and clock records that every trace
     * starts with.  Must be called once before any other record.
     */
    bool
    init(const std::string &provider_name);

    bool
    register_thread(uint64_t pid, uint64_t tid, const std::string &name,
                    const trace_args_t &args) override;
    bool
    duration_begin(const thread_ref_t &thread, const std::string &name,
                   const std::string &category, uint64_t timestamp,
                   const trace_args_t &args) override;
    bool
    duration_end(const thread_ref_t &thread, const std::string &name,
                 const std::string &category, uint64_t timestamp,
                 const trace_args_t &args) override;
    bool
    instant_event(const thread_ref_t &thread, const std::string &name,
                  const std::string &category, uint64_t timestamp,
                  const trace_args_t &args) override;
    bool
    wakeup(uint32_t cpu, uint64_t timestamp, uint64_t tid) override;
    bool
    name_object(const thread_ref_t &thread, const std::string &name,
                uint64_t object_id) override;
    bool
    flush() override;

    std::string
    get_error_string() const override
    {
        return error_;
    }

    bool
    operator!()
    {
        return failed_;
    }

    // Number of strings placed in the string table so far.
    size_t
    get_interned_count() const
    {
        return strings_.size();
    }

private:
    bool
    write_event(uint32_t event_type, const thread_ref_t &thread, const std::string &name,
                const std::string &category, uint64_t timestamp,
                const trace_args_t &args);
    // Returns the reference to use for str.  A string seen for the first time
    // is added to the string table, with its string record written right
    // away, while the table has room; afterwards new strings are inline.
    uint16_t
    string_ref(const std::string &str);
    // Appends str's bytes if ref is an inline reference.
    static void
    append_inline(std::vector<uint64_t> *words, uint16_t ref, const std::string &str);
    static void
    append_string(std::vector<uint64_t> *words, const std::string &str);
    bool
    append_args(std::vector<uint64_t> *words, const trace_args_t &args);
    bool
    emit(std::vector<uint64_t> *words);

    std::ostream *out_;
    unsigned int verbosity_;
    std::unordered_map<std::string, uint16_t> strings_;
    uint16_t next_string_index_ = 1;
    bool failed_ = false;
    std::string error_;
};

} // namespace fibertrace

#endif /* _FXT_WRITER_H_ */
