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
#include "event_cursor.h"

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

#include "utils.h"

namespace fibertrace {

namespace {

// The writer is another process, so every shared word is read atomically.
inline uint64_t
load_acquire(const uint64_t *addr)
{
    return __atomic_load_n(addr, __ATOMIC_ACQUIRE);
}

inline uint64_t
load_relaxed(const uint64_t *addr)
{
    return __atomic_load_n(addr, __ATOMIC_RELAXED);
}

} // namespace

event_cursor_t::event_cursor_t(unsigned int verbosity)
    : verbosity_(verbosity)
{
}

event_cursor_t::~event_cursor_t()
{
    close();
}

void
event_cursor_t::close()
{
    if (map_ != nullptr) {
        munmap(const_cast<unsigned char *>(map_), map_size_);
        map_ = nullptr;
        map_size_ = 0;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    positions_.clear();
}

std::string
event_cursor_t::open(const std::string &dir, int64_t pid, bool *retryable)
{
    return open_file(dir + DIRSEP + std::to_string(pid) + EVENT_FILE_SUFFIX, retryable);
}

std::string
event_cursor_t::open_file(const std::string &path, bool *retryable)
{
    close();
    path_ = path;
    *retryable = true;
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        int err = errno;
        *retryable = (err == ENOENT);
        return "Failed to open " + path + ": " + strerror(err);
    }
    struct stat st;
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        close();
        *retryable = false;
        return "Failed to stat " + path + ": " + strerror(err);
    }
    if (static_cast<size_t>(st.st_size) < sizeof(event_file_header_t)) {
        close();
        return path + " is too short to hold an event file header";
    }
    size_t size = static_cast<size_t>(st.st_size);
    void *map = mmap(nullptr, size, PROT_READ, MAP_SHARED, fd_, 0);
    if (map == MAP_FAILED) {
        int err = errno;
        close();
        *retryable = false;
        return "Failed to map " + path + ": " + strerror(err);
    }
    map_ = static_cast<const unsigned char *>(map);
    map_size_ = size;

    const event_file_header_t *header =
        reinterpret_cast<const event_file_header_t *>(map_);
    uint64_t magic = load_acquire(&header->magic);
    if (magic == 0) {
        close();
        return path + " has no header yet";
    }
    if (magic != EVENT_FILE_MAGIC) {
        close();
        *retryable = false;
        return path + " is not an event file (magic " + to_hex_string(magic) + ")";
    }
    if (header->version != EVENT_FILE_VERSION) {
        std::string error = path + " has unsupported version " +
            std::to_string(header->version) + " (expected " +
            std::to_string(EVENT_FILE_VERSION) + ")";
        close();
        *retryable = false;
        return error;
    }
    max_rings_ = header->max_rings;
    ring_size_words_ = header->ring_size_words;
    ring_headers_offset_ = header->ring_headers_offset;
    ring_data_offset_ = header->ring_data_offset;
    if (max_rings_ == 0 || ring_size_words_ < EVENT_MIN_WORDS ||
        ring_headers_offset_ < sizeof(event_file_header_t) ||
        ring_headers_offset_ % sizeof(uint64_t) != 0 ||
        ring_data_offset_ % sizeof(uint64_t) != 0 ||
        ring_headers_offset_ > ring_data_offset_ ||
        max_rings_ >
            (ring_data_offset_ - ring_headers_offset_) / sizeof(ring_header_t)) {
        close();
        *retryable = false;
        return path + " has an inconsistent ring layout";
    }
    // The ring data must be addressable without wrapping.
    if (ring_size_words_ >
        (UINT64_MAX - ring_data_offset_) / sizeof(uint64_t) / max_rings_) {
        close();
        *retryable = false;
        return path + " has a ring size too large to map";
    }
    uint64_t needed =
        ring_data_offset_ + max_rings_ * ring_size_words_ * sizeof(uint64_t);
    if (map_size_ < needed) {
        std::string error = path + " is truncated: " + std::to_string(map_size_) +
            " bytes but the layout needs " + std::to_string(needed);
        close();
        return error;
    }
    positions_.assign(max_rings_, ring_position_t());
    VPRINT(1, "Opened %s: %u rings of %llu words\n", path.c_str(), max_rings_,
           static_cast<unsigned long long>(ring_size_words_));
    *retryable = false;
    return "";
}

const ring_header_t *
event_cursor_t::ring_header(uint32_t ring) const
{
    return reinterpret_cast<const ring_header_t *>(map_ + ring_headers_offset_) + ring;
}

uint64_t
event_cursor_t::ring_word(uint32_t ring, uint64_t index) const
{
    const uint64_t *data = reinterpret_cast<const uint64_t *>(map_ + ring_data_offset_) +
        ring * ring_size_words_;
    return load_relaxed(&data[index % ring_size_words_]);
}

std::string
event_cursor_t::read(const callbacks_t &callbacks, uint64_t *count)
{
    if (count != nullptr)
        *count = 0;
    if (!is_open())
        return "Event cursor is not open";
    batch_.clear();
    for (uint32_t ring = 0; ring < max_rings_; ++ring)
        read_ring(ring, callbacks);
    // Each ring's events are already in timestamp order; a stable sort keeps
    // that order for equal timestamps while interleaving the rings.
    std::stable_sort(batch_.begin(), batch_.end(),
                     [](const fiber_event_t &a, const fiber_event_t &b) {
                         return a.timestamp < b.timestamp;
                     });
    uint64_t delivered = 0;
    for (const fiber_event_t &event : batch_) {
        ++delivered;
        if (!callbacks.on_event(event)) {
            if (count != nullptr)
                *count = delivered;
            return "Event processing stopped by the consumer";
        }
    }
    if (count != nullptr)
        *count = delivered;
    return "";
}

void
event_cursor_t::read_ring(uint32_t ring, const callbacks_t &callbacks)
{
    ring_position_t &cur = positions_[ring];
    const ring_header_t *hdr = ring_header(ring);
    uint64_t tail = load_acquire(&hdr->tail);
    while (true) {
        uint64_t head = load_acquire(&hdr->head);
        if (cur.pos < head) {
            uint64_t head_seq = load_acquire(&hdr->head_seq);
            uint64_t lost = head_seq > cur.seq ? head_seq - cur.seq : 0;
            VPRINT(2, "Ring %u: skipping from word %llu to %llu\n", ring,
                   static_cast<unsigned long long>(cur.pos),
                   static_cast<unsigned long long>(head));
            cur.pos = head;
            cur.seq = head_seq;
            if (lost > 0 && callbacks.on_lost_events)
                callbacks.on_lost_events(static_cast<ring_id_t>(ring), lost);
        }
        if (cur.pos >= tail)
            break;
        uint64_t header = ring_word(ring, cur.pos);
        uint32_t length = event_header_length(header);
        if (length < EVENT_MIN_WORDS || length > tail - cur.pos) {
            std::atomic_thread_fence(std::memory_order_acquire);
            if (load_acquire(&hdr->head) > cur.pos)
                continue; // Overwritten under us.
            // The writer never produces this: give up on what is there now.
            uint64_t tail_seq = load_acquire(&hdr->tail_seq);
            WARN("Ring %u: malformed event header %s at word %llu", ring,
                 to_hex_string(header).c_str(), static_cast<unsigned long long>(cur.pos));
            uint64_t lost = tail_seq > cur.seq ? tail_seq - cur.seq : 0;
            cur.pos = tail;
            cur.seq = tail_seq;
            if (lost > 0 && callbacks.on_lost_events)
                callbacks.on_lost_events(static_cast<ring_id_t>(ring), lost);
            break;
        }
        words_.resize(length);
        for (uint32_t i = 0; i < length; ++i)
            words_[i] = ring_word(ring, cur.pos + i);
        // If the writer moved head past this event while we copied it, the
        // copy may be torn: go around again to account for it as lost.
        std::atomic_thread_fence(std::memory_order_acquire);
        if (load_acquire(&hdr->head) > cur.pos)
            continue;
        fiber_event_t event;
        if (decode_event(static_cast<ring_id_t>(ring), words_, &event))
            batch_.push_back(std::move(event));
        cur.pos += length;
        ++cur.seq;
    }
}

bool
event_cursor_t::decode_string(const std::vector<uint64_t> &words, size_t index,
                              std::string *str)
{
    if (index >= words.size())
        return false;
    uint64_t length = words[index];
    uint64_t available = (words.size() - index - 1) * sizeof(uint64_t);
    if (length > available)
        return false;
    str->assign(reinterpret_cast<const char *>(&words[index + 1]),
                static_cast<size_t>(length));
    return true;
}

bool
event_cursor_t::decode_event(ring_id_t ring, const std::vector<uint64_t> &words,
                             fiber_event_t *event)
{
    uint64_t header = words[0];
    uint32_t type = event_header_type(header);
    uint32_t subtype = event_header_subtype(header);
    size_t payload = words.size() - EVENT_MIN_WORDS;
    event->ring = ring;
    event->timestamp = words[1];
    event->kind = FIBER_EVENT_UNKNOWN;
    event->detail = type;
    bool ok = true;
    switch (type) {
    case EVENT_TYPE_FIBER:
        ok = payload >= 1;
        if (ok) {
            event->kind = FIBER_EVENT_SCHEDULED;
            event->id = static_cast<int64_t>(words[2]);
        }
        break;
    case EVENT_TYPE_CREATE:
        ok = payload >= 2;
        if (!ok)
            break;
        event->id = static_cast<int64_t>(words[2]);
        if (subtype == EVENT_CREATE_FIBER)
            event->kind = FIBER_EVENT_CREATED;
        else if (subtype == EVENT_CREATE_SCOPE)
            event->kind = FIBER_EVENT_SCOPE_OPENED;
        else if (subtype == EVENT_CREATE_OBJECT)
            event->kind = FIBER_EVENT_OBJECT_CREATED;
        else
            return true; // Left as unknown.
        event->detail = static_cast<int64_t>(words[3]);
        break;
    case EVENT_TYPE_EXIT_FIBER:
        ok = payload >= 1;
        if (ok) {
            event->kind = FIBER_EVENT_FIBER_EXITED;
            event->id = static_cast<int64_t>(words[2]);
        }
        break;
    case EVENT_TYPE_NAME:
        ok = payload >= 2 && decode_string(words, 3, &event->text);
        if (ok) {
            event->kind = FIBER_EVENT_NAMED;
            event->id = static_cast<int64_t>(words[2]);
        }
        break;
    case EVENT_TYPE_SUSPEND_FIBER:
        ok = decode_string(words, 2, &event->text);
        if (ok)
            event->kind = FIBER_EVENT_SUSPENDING;
        break;
    case EVENT_TYPE_ENTER_SPAN:
        ok = decode_string(words, 2, &event->text);
        if (ok)
            event->kind = FIBER_EVENT_SPAN_ENTERED;
        break;
    case EVENT_TYPE_EXIT_SPAN: event->kind = FIBER_EVENT_SPAN_EXITED; break;
    case EVENT_TYPE_EXIT_SCOPE: event->kind = FIBER_EVENT_SCOPE_CLOSED; break;
    case EVENT_TYPE_LOG:
        ok = decode_string(words, 2, &event->text);
        if (ok)
            event->kind = FIBER_EVENT_LOGGED;
        break;
    case EVENT_TYPE_SUSPEND_RING:
        event->kind = FIBER_EVENT_RING_IDLING;
        event->begin = (subtype == EVENT_PHASE_BEGIN);
        break;
    case EVENT_TYPE_GC_BEGIN:
    case EVENT_TYPE_GC_END:
        ok = payload >= 1;
        if (ok) {
            event->kind = FIBER_EVENT_GC_PHASE;
            event->begin = (type == EVENT_TYPE_GC_BEGIN);
            event->detail = static_cast<int64_t>(words[2]);
        }
        break;
    default:
        // A newer writer: delivered so the consumer can ignore it.
        break;
    }
    if (!ok) {
        VPRINT(1, "Ring %d: dropping truncated %s event of %zu words\n", ring,
               type < EVENT_TYPE_LAST ? event_type_names[type] : "unknown",
               words.size());
        return false;
    }
    return true;
}

} // namespace fibertrace
