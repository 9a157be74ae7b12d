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
/* Unit tests for event_cursor_t, reading files produced by event_buffer_writer_t. */

#include <assert.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <iostream>
#include <string>
#include <vector>

#include "directory_iterator.h"
#include "event_buffer_gen.h"
#include "event_cursor.h"
#include "test_helpers.h"

namespace fibertrace {

namespace {

const int64_t TEST_PID = 31337;

std::string
event_path(const std::string &dir)
{
    return dir + DIRSEP + std::to_string(TEST_PID) + EVENT_FILE_SUFFIX;
}

struct collected_t {
    std::vector<fiber_event_t> events;
    std::vector<std::pair<ring_id_t, uint64_t>> lost;
};

std::string
read_all(event_cursor_t *cursor, collected_t *into, uint64_t *count = nullptr)
{
    event_cursor_t::callbacks_t callbacks;
    callbacks.on_event = [into](const fiber_event_t &event) {
        into->events.push_back(event);
        return true;
    };
    callbacks.on_lost_events = [into](ring_id_t ring, uint64_t count) {
        into->lost.emplace_back(ring, count);
    };
    return cursor->read(callbacks, count);
}

void
write_file(const std::string &path, const void *data, size_t size)
{
    FILE *file = fopen(path.c_str(), "wb");
    assert(file != nullptr);
    if (size > 0)
        assert(fwrite(data, 1, size, file) == size);
    fclose(file);
}

void
cleanup(const std::string &dir)
{
    std::string error = directory_iterator_t::remove_tree(dir);
    assert(error.empty());
}

} // namespace

static bool
check_open_retryable()
{
    std::cerr << "Testing files that are not ready yet\n";
    std::string dir = make_scratch_dir("cursor");
    event_cursor_t cursor;
    bool retryable = false;

    // Not created yet.
    std::string error = cursor.open(dir, TEST_PID, &retryable);
    assert(!error.empty() && retryable);
    assert(!cursor.is_open());

    // Shorter than the header.
    char partial[10] = {};
    write_file(event_path(dir), partial, sizeof(partial));
    retryable = false;
    error = cursor.open(dir, TEST_PID, &retryable);
    assert(!error.empty() && retryable);

    // Laid out but the header not yet published.
    {
        event_buffer_writer_t gen(2, 64);
        assert(gen.create(event_path(dir)).empty());
        retryable = false;
        error = cursor.open(dir, TEST_PID, &retryable);
        assert(!error.empty() && retryable);
        // Once published, it opens.
        gen.publish_header();
        error = cursor.open(dir, TEST_PID, &retryable);
        assert(error.empty());
        assert(cursor.is_open());
        assert(cursor.get_max_rings() == 2);
        assert(cursor.get_path() == event_path(dir));
    }
    cursor.close();

    // A published header whose rings have not been sized yet.
    event_file_header_t header = {};
    header.magic = EVENT_FILE_MAGIC;
    header.version = EVENT_FILE_VERSION;
    header.max_rings = 2;
    header.ring_size_words = 64;
    header.ring_headers_offset = sizeof(event_file_header_t);
    header.ring_data_offset = sizeof(event_file_header_t) + 2 * sizeof(ring_header_t);
    write_file(event_path(dir), &header, sizeof(header));
    retryable = false;
    error = cursor.open(dir, TEST_PID, &retryable);
    assert(!error.empty() && retryable);
    cleanup(dir);
    return true;
}

static bool
check_open_permanent()
{
    std::cerr << "Testing incompatible files\n";
    std::string dir = make_scratch_dir("cursor");
    event_cursor_t cursor;
    bool retryable = true;
    {
        event_buffer_writer_t gen(1, 64);
        assert(gen.create(event_path(dir)).empty());
        gen.publish_header(EVENT_FILE_VERSION + 1);
        std::string error = cursor.open(dir, TEST_PID, &retryable);
        assert(!error.empty() && !retryable);
        assert(error.find("version") != std::string::npos);
    }
    {
        event_buffer_writer_t gen(1, 64);
        assert(gen.create(event_path(dir)).empty());
        gen.publish_header(EVENT_FILE_VERSION, 0x1234);
        retryable = true;
        std::string error = cursor.open(dir, TEST_PID, &retryable);
        assert(!error.empty() && !retryable);
        assert(!cursor.is_open());
    }
    // Ring headers overlapping the data.
    event_file_header_t header = {};
    header.magic = EVENT_FILE_MAGIC;
    header.version = EVENT_FILE_VERSION;
    header.max_rings = 4;
    header.ring_size_words = 8;
    header.ring_headers_offset = sizeof(event_file_header_t);
    header.ring_data_offset = sizeof(event_file_header_t);
    std::vector<char> bytes(4096, 0);
    memcpy(bytes.data(), &header, sizeof(header));
    write_file(event_path(dir), bytes.data(), bytes.size());
    retryable = true;
    std::string error = cursor.open(dir, TEST_PID, &retryable);
    assert(!error.empty() && !retryable);

    // A ring size whose byte count wraps would otherwise fit a tiny file.
    header.max_rings = 1;
    header.ring_size_words = 1ULL << 61;
    header.ring_headers_offset = sizeof(event_file_header_t);
    header.ring_data_offset = sizeof(event_file_header_t) + sizeof(ring_header_t);
    ring_header_t ring = {};
    ring.head = 1000000;
    ring.tail = 2000000;
    std::vector<char> small(header.ring_data_offset, 0);
    memcpy(small.data(), &header, sizeof(header));
    memcpy(small.data() + header.ring_headers_offset, &ring, sizeof(ring));
    write_file(event_path(dir), small.data(), small.size());
    retryable = true;
    error = cursor.open(dir, TEST_PID, &retryable);
    assert(!error.empty() && !retryable);
    assert(!cursor.is_open());

    // A ring count whose header array wraps past the data offset.
    header.max_rings = UINT32_MAX;
    header.ring_size_words = 8;
    header.ring_headers_offset = UINT64_MAX - 7;
    header.ring_data_offset = sizeof(event_file_header_t);
    memcpy(bytes.data(), &header, sizeof(header));
    write_file(event_path(dir), bytes.data(), bytes.size());
    retryable = true;
    error = cursor.open(dir, TEST_PID, &retryable);
    assert(!error.empty() && !retryable);
    assert(!cursor.is_open());

    collected_t got;
    assert(read_all(&cursor, &got) == "Event cursor is not open");
    cleanup(dir);
    return true;
}

static bool
check_merge_order()
{
    std::cerr << "Testing events are merged by timestamp\n";
    std::string dir = make_scratch_dir("cursor");
    event_buffer_writer_t gen(3, 256);
    assert(gen.create(event_path(dir)).empty());
    gen.publish_header();
    gen.scheduled(0, 1, 100);
    gen.scheduled(1, 2, 101);
    gen.scheduled(1, 3, 102);
    gen.scheduled(0, 4, 103);
    gen.scheduled(0, 5, 104);
    gen.scheduled(1, 6, 105);
    // Equal timestamps within a ring keep their order.
    gen.logged(2, 6, "first");
    gen.logged(2, 6, "second");

    event_cursor_t cursor;
    bool retryable;
    assert(cursor.open(dir, TEST_PID, &retryable).empty());
    collected_t got;
    uint64_t count = 0;
    assert(read_all(&cursor, &got, &count).empty());
    assert(count == 8 && got.events.size() == 8);
    assert(got.lost.empty());
    for (int i = 0; i < 6; ++i) {
        assert(got.events[i].kind == FIBER_EVENT_SCHEDULED);
        assert(got.events[i].timestamp == static_cast<uint64_t>(i + 1));
        assert(got.events[i].id == 100 + i);
    }
    assert(got.events[0].ring == 0 && got.events[1].ring == 1);
    int first = -1;
    int second = -1;
    for (int i = 0; i < 8; ++i) {
        if (got.events[i].text == "first")
            first = i;
        if (got.events[i].text == "second")
            second = i;
    }
    assert(first >= 0 && second > first);

    // Only new events are delivered by the next read.
    got.events.clear();
    assert(read_all(&cursor, &got, &count).empty());
    assert(count == 0 && got.events.empty());
    gen.fiber_exited(2, 10, 104);
    assert(read_all(&cursor, &got, &count).empty());
    assert(count == 1);
    assert(got.events[0].kind == FIBER_EVENT_FIBER_EXITED && got.events[0].id == 104);
    assert(got.events[0].ring == 2);
    cleanup(dir);
    return true;
}

static bool
check_decoding()
{
    std::cerr << "Testing every event kind decodes\n";
    std::string dir = make_scratch_dir("cursor");
    event_buffer_writer_t gen(1, 512);
    assert(gen.create(event_path(dir)).empty());
    gen.publish_header();
    uint64_t ts = 1;
    gen.created(0, ts++, 7, 3);
    gen.scope_opened(0, ts++, 8, SCOPE_KIND_PROTECT);
    gen.object_created(0, ts++, 9, 4);
    gen.named(0, ts++, 7, "worker-seven");
    gen.suspending(0, ts++, "read");
    gen.span_entered(0, ts++, "parse");
    gen.span_exited(0, ts++);
    gen.scope_closed(0, ts++);
    gen.logged(0, ts++, "");
    gen.ring_idling(0, ts++, true);
    gen.ring_idling(0, ts++, false);
    gen.gc_phase(0, ts++, true, GC_PHASE_MAJOR_SLICE);
    gen.gc_phase(0, ts++, false, GC_PHASE_MAJOR_SLICE);
    // A type from a newer writer.
    gen.append(0, ts++, 200, 5, { 1, 2, 3 });

    event_cursor_t cursor;
    bool retryable;
    assert(cursor.open(dir, TEST_PID, &retryable).empty());
    collected_t got;
    assert(read_all(&cursor, &got).empty());
    const std::vector<fiber_event_t> &e = got.events;
    assert(e.size() == 14);
    assert(e[0].kind == FIBER_EVENT_CREATED && e[0].id == 7 && e[0].detail == 3);
    assert(e[1].kind == FIBER_EVENT_SCOPE_OPENED && e[1].id == 8 &&
           e[1].detail == SCOPE_KIND_PROTECT);
    assert(e[2].kind == FIBER_EVENT_OBJECT_CREATED && e[2].id == 9 && e[2].detail == 4);
    assert(e[3].kind == FIBER_EVENT_NAMED && e[3].id == 7 && e[3].text == "worker-seven");
    assert(e[4].kind == FIBER_EVENT_SUSPENDING && e[4].text == "read");
    assert(e[5].kind == FIBER_EVENT_SPAN_ENTERED && e[5].text == "parse");
    assert(e[6].kind == FIBER_EVENT_SPAN_EXITED);
    assert(e[7].kind == FIBER_EVENT_SCOPE_CLOSED);
    assert(e[8].kind == FIBER_EVENT_LOGGED && e[8].text.empty());
    assert(e[9].kind == FIBER_EVENT_RING_IDLING && e[9].begin);
    assert(e[10].kind == FIBER_EVENT_RING_IDLING && !e[10].begin);
    assert(e[11].kind == FIBER_EVENT_GC_PHASE && e[11].begin &&
           e[11].detail == GC_PHASE_MAJOR_SLICE);
    assert(e[12].kind == FIBER_EVENT_GC_PHASE && !e[12].begin);
    assert(e[13].kind == FIBER_EVENT_UNKNOWN && e[13].detail == 200);
    for (size_t i = 0; i < e.size(); ++i)
        assert(e[i].timestamp == i + 1 && e[i].ring == 0);
    cleanup(dir);
    return true;
}

static bool
check_lost_events()
{
    std::cerr << "Testing overwritten events are reported as lost\n";
    std::string dir = make_scratch_dir("cursor");
    // Room for five three-word events.
    event_buffer_writer_t gen(2, 16);
    assert(gen.create(event_path(dir)).empty());
    gen.publish_header();
    event_cursor_t cursor;
    bool retryable;
    assert(cursor.open(dir, TEST_PID, &retryable).empty());

    for (int i = 0; i < 10; ++i)
        gen.scheduled(1, i + 1, i);
    assert(gen.get_overwritten(1) == 5);
    collected_t got;
    assert(read_all(&cursor, &got).empty());
    assert(got.lost.size() == 1);
    assert(got.lost[0].first == 1 && got.lost[0].second == 5);
    assert(got.events.size() == 5);
    for (int i = 0; i < 5; ++i)
        assert(got.events[i].id == 5 + i);

    // Keeping up loses nothing, across many laps of the ring.
    got = collected_t();
    for (int i = 10; i < 100; ++i) {
        gen.scheduled(1, i + 1, i);
        if (i % 4 == 0)
            assert(read_all(&cursor, &got).empty());
    }
    assert(read_all(&cursor, &got).empty());
    assert(got.lost.empty());
    assert(got.events.size() == 90);
    for (int i = 0; i < 90; ++i)
        assert(got.events[i].id == 10 + i);

    // Falling behind again reports only the new gap.
    for (int i = 100; i < 107; ++i)
        gen.scheduled(1, i + 1, i);
    got = collected_t();
    assert(read_all(&cursor, &got).empty());
    assert(got.lost.size() == 1 && got.lost[0].second == 2);
    assert(got.events.size() == 5 && got.events[0].id == 102);
    cleanup(dir);
    return true;
}

static bool
check_corrupt_header()
{
    std::cerr << "Testing a malformed event is skipped\n";
    std::string dir = make_scratch_dir("cursor");
    event_buffer_writer_t gen(1, 64);
    assert(gen.create(event_path(dir)).empty());
    gen.publish_header();
    event_cursor_t cursor;
    bool retryable;
    assert(cursor.open(dir, TEST_PID, &retryable).empty());
    gen.scheduled(0, 1, 1);
    gen.append_corrupt(0, event_header_make(1, EVENT_TYPE_FIBER, 0));
    collected_t got;
    assert(read_all(&cursor, &got).empty());
    assert(got.events.size() == 1);
    assert(got.lost.size() == 1 && got.lost[0].second == 1);
    // The cursor resynchronizes at the tail.
    gen.scheduled(0, 2, 2);
    got = collected_t();
    assert(read_all(&cursor, &got).empty());
    assert(got.events.size() == 1 && got.events[0].id == 2);
    assert(got.lost.empty());
    cleanup(dir);
    return true;
}

static bool
check_consumer_stop()
{
    std::cerr << "Testing the consumer can stop a read\n";
    std::string dir = make_scratch_dir("cursor");
    event_buffer_writer_t gen(1, 64);
    assert(gen.create(event_path(dir)).empty());
    gen.publish_header();
    for (int i = 0; i < 5; ++i)
        gen.scheduled(0, i + 1, i);
    event_cursor_t cursor;
    bool retryable;
    assert(cursor.open(dir, TEST_PID, &retryable).empty());
    int seen = 0;
    event_cursor_t::callbacks_t callbacks;
    callbacks.on_event = [&seen](const fiber_event_t &event) { return ++seen < 2; };
    uint64_t count = 0;
    std::string error = cursor.read(callbacks, &count);
    assert(error == "Event processing stopped by the consumer");
    assert(count == 2 && seen == 2);
    cleanup(dir);
    return true;
}

int
test_main(int argc, const char *argv[])
{
    if (check_open_retryable() && check_open_permanent() && check_merge_order() &&
        check_decoding() && check_lost_events() && check_corrupt_header() &&
        check_consumer_stop()) {
        std::cerr << "event_cursor tests passed\n";
        return 0;
    }
    std::cerr << "event_cursor tests FAILED\n";
    exit(1);
}

} // namespace fibertrace
