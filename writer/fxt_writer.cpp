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
#include "fxt_writer.h"

#include <string.h>

#include <ostream>
#include <string>
#include <vector>

#include "fxt_format.h"
#include "utils.h"

namespace fibertrace {

namespace {

std::string
clamp_string(const std::string &str)
{
    if (str.size() <= FXT_WRITER_MAX_STRING_BYTES)
        return str;
    return str.substr(0, FXT_WRITER_MAX_STRING_BYTES);
}

uint64_t
string_words(size_t length)
{
    return ALIGN_FORWARD(length, sizeof(uint64_t)) / sizeof(uint64_t);
}

} // namespace

fxt_writer_t::fxt_writer_t(std::ostream *out, unsigned int verbosity)
    : out_(out)
    , verbosity_(verbosity)
{
}

bool
fxt_writer_t::init(const std::string &provider_name)
{
    const uint64_t magic = FXT_MAGIC_RECORD;
    if (!out_->write(reinterpret_cast<const char *>(&magic), sizeof(magic))) {
        failed_ = true;
        error_ = "Failed to write the trace header";
        return false;
    }

    // The provider name length field is 8 bits wide.
    std::string name = provider_name.substr(0, 0xff);
    std::vector<uint64_t> provider = {
        static_cast<uint64_t>(FXT_RECORD_METADATA) |
        (static_cast<uint64_t>(FXT_METADATA_PROVIDER_INFO) << 16) |
        (static_cast<uint64_t>(FXT_WRITER_PROVIDER_ID) << 20) |
        (static_cast<uint64_t>(name.size()) << 52)
    };
    append_string(&provider, name);
    if (!emit(&provider))
        return false;

    std::vector<uint64_t> clock = { static_cast<uint64_t>(FXT_RECORD_INITIALIZATION),
                                    FXT_TICKS_PER_SECOND };
    if (!emit(&clock))
        return false;
    VPRINT(1, "Trace header written for provider %s\n", name.c_str());
    return true;
}

void
fxt_writer_t::append_string(std::vector<uint64_t> *words, const std::string &str)
{
    size_t start = words->size();
    words->resize(start + string_words(str.size()), 0);
    if (!str.empty())
        memcpy(&(*words)[start], str.data(), str.size());
}

void
fxt_writer_t::append_inline(std::vector<uint64_t> *words, uint16_t ref,
                            const std::string &str)
{
    if (TESTANY(FXT_STRING_REF_INLINE, ref))
        append_string(words, str);
}

uint16_t
fxt_writer_t::string_ref(const std::string &str)
{
    if (str.empty())
        return FXT_STRING_REF_EMPTY;
    auto it = strings_.find(str);
    if (it != strings_.end())
        return it->second;
    if (next_string_index_ > FXT_MAX_STRING_INDEX || failed_)
        return static_cast<uint16_t>(FXT_STRING_REF_INLINE | str.size());
    uint16_t index = next_string_index_++;
    std::vector<uint64_t> record = {
        static_cast<uint64_t>(FXT_RECORD_STRING) | (static_cast<uint64_t>(index) << 16) |
        (static_cast<uint64_t>(str.size()) << 32)
    };
    append_string(&record, str);
    if (!emit(&record))
        return static_cast<uint16_t>(FXT_STRING_REF_INLINE | str.size());
    strings_.emplace(str, index);
    if (index == FXT_MAX_STRING_INDEX)
        VPRINT(1, "String table is full: new strings are written inline\n");
    return index;
}

bool
fxt_writer_t::append_args(std::vector<uint64_t> *words, const trace_args_t &args)
{
    for (const trace_arg_t &arg : args) {
        std::string name = clamp_string(arg.name);
        uint16_t name_ref = string_ref(name);
        std::vector<uint64_t> arg_words(1, 0);
        append_inline(&arg_words, name_ref, name);
        uint64_t type;
        uint64_t value_field = 0;
        switch (arg.type) {
        case TRACE_ARG_INT64:
            type = FXT_ARG_INT64;
            arg_words.push_back(arg.value);
            break;
        case TRACE_ARG_STRING: {
            type = FXT_ARG_STRING;
            std::string value = clamp_string(arg.str);
            uint16_t value_ref = string_ref(value);
            value_field = value_ref;
            append_inline(&arg_words, value_ref, value);
            break;
        }
        case TRACE_ARG_POINTER:
            type = FXT_ARG_POINTER;
            arg_words.push_back(arg.value);
            break;
        case TRACE_ARG_KOID:
            type = FXT_ARG_KOID;
            arg_words.push_back(arg.value);
            break;
        default:
            failed_ = true;
            error_ = "Unknown argument type for " + arg.name;
            return false;
        }
        arg_words[0] = type | (static_cast<uint64_t>(arg_words.size()) << 4) |
            (static_cast<uint64_t>(name_ref) << 16) | (value_field << 32);
        words->insert(words->end(), arg_words.begin(), arg_words.end());
    }
    return true;
}

bool
fxt_writer_t::emit(std::vector<uint64_t> *words)
{
    if (failed_)
        return false;
    if (words->size() > FXT_MAX_RECORD_WORDS) {
        failed_ = true;
        error_ = "Trace record of " + std::to_string(words->size()) + " words is too large";
        return false;
    }
    // The size field occupies bits 4-15 of every record header.
    (*words)[0] = ((*words)[0] & ~0xfff0ULL) | (static_cast<uint64_t>(words->size()) << 4);
    // FXT is little-endian, as are the hosts we support.
    if (!out_->write(reinterpret_cast<const char *>(words->data()),
                     words->size() * sizeof(uint64_t))) {
        failed_ = true;
        error_ = "Failed to write to the trace output";
        return false;
    }
    return true;
}

bool
fxt_writer_t::register_thread(uint64_t pid, uint64_t tid, const std::string &name_in,
                              const trace_args_t &args)
{
    if (failed_)
        return false;
    if (args.size() > 15) {
        failed_ = true;
        error_ = "Too many arguments for thread " + name_in;
        return false;
    }
    std::string name = clamp_string(name_in);
    uint16_t name_ref = string_ref(name);
    std::vector<uint64_t> record(2, 0);
    record[1] = tid;
    append_inline(&record, name_ref, name);
    if (!append_args(&record, args))
        return false;
    record[0] = static_cast<uint64_t>(FXT_RECORD_KERNEL_OBJECT) |
        (static_cast<uint64_t>(FXT_KOBJ_THREAD) << 16) |
        (static_cast<uint64_t>(name_ref) << 24) |
        (static_cast<uint64_t>(args.size()) << 40);
    VPRINT(2, "Thread %llu of process %llu is %s\n", static_cast<unsigned long long>(tid),
           static_cast<unsigned long long>(pid), name.c_str());
    return emit(&record);
}

bool
fxt_writer_t::write_event(uint32_t event_type, const thread_ref_t &thread,
                          const std::string &name_in, const std::string &category_in,
                          uint64_t timestamp, const trace_args_t &args)
{
    if (failed_)
        return false;
    if (args.size() > 15) {
        failed_ = true;
        error_ = "Too many arguments for event " + name_in;
        return false;
    }
    std::string name = clamp_string(name_in);
    std::string category = clamp_string(category_in);
    uint16_t category_ref = string_ref(category);
    uint16_t name_ref = string_ref(name);
    std::vector<uint64_t> record = { 0, timestamp, thread.pid, thread.tid };
    append_inline(&record, category_ref, category);
    append_inline(&record, name_ref, name);
    if (!append_args(&record, args))
        return false;
    record[0] = static_cast<uint64_t>(FXT_RECORD_EVENT) |
        (static_cast<uint64_t>(event_type) << 16) |
        (static_cast<uint64_t>(args.size()) << 20) |
        (static_cast<uint64_t>(FXT_THREAD_REF_INLINE) << 24) |
        (static_cast<uint64_t>(category_ref) << 32) |
        (static_cast<uint64_t>(name_ref) << 48);
    return emit(&record);
}

bool
fxt_writer_t::duration_begin(const thread_ref_t &thread, const std::string &name,
                             const std::string &category, uint64_t timestamp,
                             const trace_args_t &args)
{
    return write_event(FXT_EVENT_DURATION_BEGIN, thread, name, category, timestamp, args);
}

bool
fxt_writer_t::duration_end(const thread_ref_t &thread, const std::string &name,
                           const std::string &category, uint64_t timestamp,
                           const trace_args_t &args)
{
    return write_event(FXT_EVENT_DURATION_END, thread, name, category, timestamp, args);
}

bool
fxt_writer_t::instant_event(const thread_ref_t &thread, const std::string &name,
                            const std::string &category, uint64_t timestamp,
                            const trace_args_t &args)
{
    return write_event(FXT_EVENT_INSTANT, thread, name, category, timestamp, args);
}

bool
fxt_writer_t::wakeup(uint32_t cpu, uint64_t timestamp, uint64_t tid)
{
    std::vector<uint64_t> record = {
        static_cast<uint64_t>(FXT_RECORD_SCHEDULING) |
            (static_cast<uint64_t>(cpu & 0xffff) << 20) |
            (static_cast<uint64_t>(FXT_SCHEDULING_THREAD_WAKEUP) << 60),
        timestamp, tid
    };
    return emit(&record);
}

bool
fxt_writer_t::name_object(const thread_ref_t &thread, const std::string &name_in,
                          uint64_t object_id)
{
    if (failed_)
        return false;
    std::string name = clamp_string(name_in);
    uint16_t name_ref = string_ref(name);
    std::vector<uint64_t> record = { 0, object_id, thread.pid, thread.tid };
    append_inline(&record, name_ref, name);
    record[0] = static_cast<uint64_t>(FXT_RECORD_USERSPACE_OBJECT) |
        (static_cast<uint64_t>(FXT_THREAD_REF_INLINE) << 16) |
        (static_cast<uint64_t>(name_ref) << 24);
    return emit(&record);
}

bool
fxt_writer_t::flush()
{
    if (failed_)
        return false;
    if (!out_->flush()) {
        failed_ = true;
        error_ = "Failed to flush the trace output";
        return false;
    }
    return true;
}

} // namespace fibertrace
