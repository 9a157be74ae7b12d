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
/* Unit tests for the event translator, run against a recording writer. */

#include <assert.h>
#include <stdint.h>
#include <stdlib.h>

#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "event_translator.h"
#include "fiber_event.h"
#include "flat_id.h"
#include "recording_writer.h"
#include "test_helpers.h"

namespace fibertrace {

namespace {

const uint64_t TEST_PID = 4242;

fiber_event_t
make_event(fiber_event_kind_t kind, ring_id_t ring, uint64_t ts, int64_t id = 0,
           int64_t detail = 0, const std::string &text = "", bool begin = false)
{
    fiber_event_t event;
    event.kind = kind;
    event.ring = ring;
    event.timestamp = ts;
    event.id = id;
    event.detail = detail;
    event.text = text;
    event.begin = begin;
    return event;
}

fiber_event_t
scheduled(ring_id_t ring, uint64_t ts, fiber_id_t fiber)
{
    return make_event(FIBER_EVENT_SCHEDULED, ring, ts, fiber);
}

fiber_event_t
created(ring_id_t ring, uint64_t ts, fiber_id_t fiber, int64_t scope = 0)
{
    return make_event(FIBER_EVENT_CREATED, ring, ts, fiber, scope);
}

fiber_event_t
suspending(ring_id_t ring, uint64_t ts, const std::string &op)
{
    return make_event(FIBER_EVENT_SUSPENDING, ring, ts, 0, 0, op);
}

fiber_event_t
fiber_exited(ring_id_t ring, uint64_t ts, fiber_id_t fiber)
{
    return make_event(FIBER_EVENT_FIBER_EXITED, ring, ts, fiber);
}

fiber_event_t
gc_phase(ring_id_t ring, uint64_t ts, bool begin, uint64_t phase)
{
    return make_event(FIBER_EVENT_GC_PHASE, ring, ts, 0, static_cast<int64_t>(phase), "",
                      begin);
}

fiber_event_t
ring_idling(ring_id_t ring, uint64_t ts, bool begin)
{
    return make_event(FIBER_EVENT_RING_IDLING, ring, ts, 0, 0, "", begin);
}

void
run_events(event_translator_t *translator, const std::vector<fiber_event_t> &events)
{
    for (const fiber_event_t &event : events) {
        std::string error = translator->process_event(event);
        assert(error.empty());
    }
}

std::vector<std::string>
translate(const std::vector<fiber_event_t> &events)
{
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    run_events(&translator, events);
    std::vector<std::string> out;
    for (const trace_record_t &record : writer.records)
        out.push_back(record.to_string());
    return out;
}

thread_ref_t
ring_ref(ring_id_t ring)
{
    return thread_ref_t { TEST_PID, flat_id_of_ring(ring) };
}

thread_ref_t
fiber_ref(fiber_id_t fiber)
{
    return thread_ref_t { TEST_PID, flat_id_of_fiber(fiber) };
}

bool
has_arg(const trace_record_t &record, const std::string &name, trace_arg_type_t type,
        uint64_t value)
{
    for (const trace_arg_t &arg : record.args) {
        if (arg.name == name && arg.type == type && arg.value == value)
            return true;
    }
    return false;
}

// A deterministic mix of events over several rings and fibers.
std::vector<fiber_event_t>
mixed_workload()
{
    std::vector<fiber_event_t> events;
    uint64_t ts = 100;
    for (int round = 0; round < 4; ++round) {
        for (ring_id_t ring = 0; ring < 3; ++ring) {
            fiber_id_t fiber = round * 3 + ring;
            events.push_back(created(ring, ts++, fiber, ring));
            events.push_back(make_event(FIBER_EVENT_SPAN_ENTERED, ring, ts++, 0, 0,
                                        "work" + std::to_string(round)));
            events.push_back(make_event(FIBER_EVENT_LOGGED, ring, ts++, 0, 0, "hello"));
            events.push_back(make_event(FIBER_EVENT_SPAN_EXITED, ring, ts++));
            events.push_back(suspending(ring, ts++, round % 2 == 0 ? "read" : "sleep"));
            events.push_back(ring_idling(ring, ts++, true));
            events.push_back(ring_idling(ring, ts++, false));
            events.push_back(scheduled(ring, ts++, fiber));
            events.push_back(gc_phase(ring, ts++, true, GC_PHASE_MINOR));
            events.push_back(gc_phase(ring, ts++, false, GC_PHASE_MINOR));
            if (round > 0) {
                // Resume a fiber from an earlier round on a different ring.
                events.push_back(suspending(ring, ts++, "yield"));
                events.push_back(scheduled(ring, ts++, (round - 1) * 3 + (ring + 1) % 3));
            }
            events.push_back(fiber_exited(ring, ts++, fiber));
        }
    }
    return events;
}

} // namespace

static bool
check_create_suspend_resume_exit()
{
    std::cerr << "Testing a fiber that is created, blocks, resumes and exits\n";
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    run_events(&translator,
               { created(0, 10, 1, 0), scheduled(0, 20, 1), suspending(0, 30, "read"),
                 scheduled(0, 40, 1), fiber_exited(0, 50, 1) });
    const std::vector<trace_record_t> &r = writer.records;
    assert(r.size() == 8);

    assert(r[0].kind == RECORD_REGISTER_THREAD);
    assert(r[0].thread == ring_ref(0));
    assert(r[0].name == "ring0");
    assert(has_arg(r[0], "process", TRACE_ARG_KOID, TEST_PID));

    assert(r[1].kind == RECORD_REGISTER_THREAD);
    assert(r[1].thread == fiber_ref(1));
    assert(r[1].name == "fiber1");
    assert(has_arg(r[1], "process", TRACE_ARG_KOID, TEST_PID));

    assert(r[2].kind == RECORD_INSTANT);
    assert(r[2].thread == fiber_ref(1));
    assert(r[2].name == "create-fiber" && r[2].category == CATEGORY_FIBER);
    assert(r[2].timestamp == 10);
    assert(has_arg(r[2], "id", TRACE_ARG_POINTER, 1));
    assert(has_arg(r[2], "cc", TRACE_ARG_POINTER, 0));

    // Every scheduling is a wakeup, including that of an already running fiber.
    assert(r[3].kind == RECORD_WAKEUP);
    assert(r[3].thread.tid == flat_id_of_fiber(1) && r[3].extra == 0);
    assert(r[3].timestamp == 20);

    assert(r[4].kind == RECORD_DURATION_BEGIN);
    assert(r[4].thread == fiber_ref(1));
    assert(r[4].name == "read" && r[4].category == CATEGORY_SUSPEND);
    assert(r[4].timestamp == 30);

    assert(r[5].kind == RECORD_WAKEUP);
    assert(r[5].thread.tid == flat_id_of_fiber(1) && r[5].timestamp == 40);

    assert(r[6].kind == RECORD_DURATION_END);
    assert(r[6].thread == fiber_ref(1));
    assert(r[6].name == "read" && r[6].category == CATEGORY_SUSPEND);
    assert(r[6].timestamp == 40);

    assert(r[7].kind == RECORD_INSTANT);
    assert(r[7].thread == fiber_ref(1));
    assert(r[7].name == "exit-fiber" && r[7].timestamp == 50);
    assert(has_arg(r[7], "id", TRACE_ARG_POINTER, 1));

    const fiber_state_t *fiber = translator.get_registry().find_fiber(1);
    assert(fiber != nullptr && fiber->registered && !fiber->suspended);
    return true;
}

static bool
check_gc_goes_to_ring()
{
    std::cerr << "Testing gc phases are attributed to the ring\n";
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    run_events(&translator,
               { created(3, 1, 7), scheduled(3, 2, 7), gc_phase(3, 3, true, GC_PHASE_MINOR),
                 gc_phase(3, 4, false, GC_PHASE_MINOR) });
    const trace_record_t &begin = writer.records[writer.records.size() - 2];
    const trace_record_t &end = writer.records.back();
    assert(begin.kind == RECORD_DURATION_BEGIN && end.kind == RECORD_DURATION_END);
    assert(begin.thread == ring_ref(3) && end.thread == ring_ref(3));
    assert(begin.thread.tid == 13);
    assert(begin.name == "minor" && end.name == "minor");
    assert(begin.category == CATEGORY_GC && end.category == CATEGORY_GC);
    // The fiber is still current afterwards.
    const ring_state_t *ring = translator.get_registry().find_ring(3);
    assert(ring != nullptr && ring->has_current_fiber && ring->current_fiber == 7);
    // An unnamed phase still produces a balanced pair.
    writer.records.clear();
    run_events(&translator, { gc_phase(3, 5, true, 999), gc_phase(3, 6, false, 999) });
    assert(writer.records.size() == 2);
    assert(writer.records[0].name == "phase999" && writer.records[1].name == "phase999");
    return true;
}

static bool
check_ring_registration()
{
    std::cerr << "Testing each ring is registered exactly once before use\n";
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    run_events(&translator, mixed_workload());
    std::map<uint64_t, size_t> registered_at;
    for (size_t i = 0; i < writer.records.size(); ++i) {
        const trace_record_t &record = writer.records[i];
        if (record.kind == RECORD_REGISTER_THREAD && flat_id_is_ring(record.thread.tid)) {
            assert(registered_at.find(record.thread.tid) == registered_at.end());
            registered_at[record.thread.tid] = i;
        }
    }
    assert(registered_at.size() == 3);
    assert(translator.get_registry().ring_count() == 3);
    for (size_t i = 0; i < writer.records.size(); ++i) {
        const trace_record_t &record = writer.records[i];
        uint64_t ring_tid = 0;
        if (record.kind == RECORD_WAKEUP)
            ring_tid = flat_id_of_ring(static_cast<ring_id_t>(record.extra));
        else if (flat_id_is_ring(record.thread.tid))
            ring_tid = record.thread.tid;
        else
            continue;
        assert(registered_at.find(ring_tid) != registered_at.end());
        assert(registered_at[ring_tid] <= i);
    }
    // The very first record is the first ring's registration.
    assert(writer.records[0].kind == RECORD_REGISTER_THREAD);
    assert(writer.records[0].thread == ring_ref(0));
    return true;
}

static bool
check_fiber_registration()
{
    std::cerr << "Testing fibers are registered only on creation\n";
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    // A fiber created before recording started is scheduled but never registered.
    run_events(&translator, { scheduled(0, 1, 5), suspending(0, 2, "read"),
                              scheduled(0, 3, 5) });
    for (const trace_record_t &record : writer.records) {
        assert(!(record.kind == RECORD_REGISTER_THREAD &&
                 record.thread.tid == flat_id_of_fiber(5)));
    }
    // The pending operation is still closed on the fiber's thread.
    assert(writer.records.back().kind == RECORD_DURATION_END);
    assert(writer.records.back().thread == fiber_ref(5));
    const fiber_state_t *fiber = translator.get_registry().find_fiber(5);
    assert(fiber != nullptr && !fiber->registered);

    // A repeated creation registers once.
    writer.records.clear();
    run_events(&translator, { created(0, 4, 6), created(0, 5, 6) });
    int registrations = 0;
    int instants = 0;
    for (const trace_record_t &record : writer.records) {
        if (record.kind == RECORD_REGISTER_THREAD)
            ++registrations;
        if (record.kind == RECORD_INSTANT && record.name == "create-fiber")
            ++instants;
    }
    assert(registrations == 1);
    assert(instants == 2);
    // Created makes the fiber current without a wakeup.
    for (const trace_record_t &record : writer.records)
        assert(record.kind != RECORD_WAKEUP);
    const ring_state_t *ring = translator.get_registry().find_ring(0);
    assert(ring->has_current_fiber && ring->current_fiber == 6);
    return true;
}

static bool
check_suspend_pairing()
{
    std::cerr << "Testing every suspension is closed with the same name\n";
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    run_events(&translator, mixed_workload());
    // Per fiber thread, the open suspension name.
    std::map<uint64_t, std::string> open;
    int pairs = 0;
    for (const trace_record_t &record : writer.records) {
        if (record.category != CATEGORY_SUSPEND)
            continue;
        if (record.kind == RECORD_DURATION_BEGIN) {
            if (!flat_id_is_fiber(record.thread.tid))
                continue; // Blocking with no current fiber.
            assert(open.find(record.thread.tid) == open.end());
            open[record.thread.tid] = record.name;
        } else {
            assert(record.kind == RECORD_DURATION_END);
            auto it = open.find(record.thread.tid);
            assert(it != open.end());
            assert(it->second == record.name);
            open.erase(it);
            ++pairs;
        }
    }
    assert(pairs > 0);
    // The last round's yields are never resumed.
    for (const auto &it : open)
        assert(it.second == "yield");
    return true;
}

static bool
check_replay_is_identical()
{
    std::cerr << "Testing translation is deterministic\n";
    std::vector<fiber_event_t> events = mixed_workload();
    std::vector<std::string> first = translate(events);
    std::vector<std::string> second = translate(events);
    assert(!first.empty());
    assert(first == second);
    return true;
}

static bool
check_attribution()
{
    std::cerr << "Testing records go to the current fiber or the ring\n";
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    // No fiber yet: everything goes to the ring.
    run_events(&translator,
               { make_event(FIBER_EVENT_LOGGED, 1, 1, 0, 0, "boot"),
                 make_event(FIBER_EVENT_SCOPE_OPENED, 1, 2, 77, SCOPE_KIND_SWITCH),
                 make_event(FIBER_EVENT_SCOPE_CLOSED, 1, 3) });
    const std::vector<trace_record_t> &r = writer.records;
    assert(r.size() == 4);
    assert(r[1].kind == RECORD_INSTANT && r[1].name == "log" && r[1].thread == ring_ref(1));
    assert(r[1].args.size() == 1 && r[1].args[0].name == "message" &&
           r[1].args[0].type == TRACE_ARG_STRING && r[1].args[0].str == "boot");
    assert(r[2].kind == RECORD_DURATION_BEGIN && r[2].name == "cc");
    assert(r[2].category == CATEGORY_FIBER && r[2].thread == ring_ref(1));
    assert(has_arg(r[2], "id", TRACE_ARG_POINTER, 77));
    assert(has_arg(r[2], "cpu", TRACE_ARG_INT64, 1));
    bool found_type = false;
    for (const trace_arg_t &arg : r[2].args) {
        if (arg.name == "type") {
            assert(arg.type == TRACE_ARG_STRING && arg.str == "switch");
            found_type = true;
        }
    }
    assert(found_type);
    assert(r[3].kind == RECORD_DURATION_END && r[3].name == "cc");

    // With a fiber current, records go to the fiber.
    writer.records.clear();
    run_events(&translator,
               { created(1, 4, 9), make_event(FIBER_EVENT_NAMED, 1, 5, 9, 0, "worker"),
                 make_event(FIBER_EVENT_SPAN_ENTERED, 1, 6, 0, 0, "parse"),
                 make_event(FIBER_EVENT_SPAN_EXITED, 1, 7) });
    assert(r.size() == 5);
    assert(r[2].kind == RECORD_NAME_OBJECT && r[2].thread == fiber_ref(9));
    assert(r[2].name == "worker" && r[2].extra == 9);
    assert(r[3].kind == RECORD_DURATION_BEGIN && r[3].name == "parse");
    assert(r[3].category == CATEGORY_SPAN && r[3].thread == fiber_ref(9));
    assert(r[4].kind == RECORD_DURATION_END && r[4].category == CATEGORY_SPAN);
    assert(r[4].thread == fiber_ref(9));

    // Suspending is drawn on the fiber that blocks, and later events go to
    // the ring.
    writer.records.clear();
    run_events(&translator,
               { suspending(1, 8, "accept"), make_event(FIBER_EVENT_LOGGED, 1, 9, 0, 0,
                                                        "idle") });
    assert(r.size() == 2);
    assert(r[0].kind == RECORD_DURATION_BEGIN && r[0].thread == fiber_ref(9));
    assert(r[1].kind == RECORD_INSTANT && r[1].thread == ring_ref(1));
    // Object creation has no record.
    writer.records.clear();
    run_events(&translator, { make_event(FIBER_EVENT_OBJECT_CREATED, 1, 10, 3, 1) });
    assert(r.empty());
    return true;
}

static bool
check_ring_idling()
{
    std::cerr << "Testing ring idling goes to the ring thread\n";
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    run_events(&translator,
               { created(2, 1, 4), ring_idling(2, 2, true), ring_idling(2, 3, false) });
    const std::vector<trace_record_t> &r = writer.records;
    const trace_record_t &begin = r[r.size() - 2];
    const trace_record_t &end = r.back();
    assert(begin.kind == RECORD_DURATION_BEGIN && end.kind == RECORD_DURATION_END);
    assert(begin.thread == ring_ref(2) && end.thread == ring_ref(2));
    assert(begin.name == "suspend-domain" && end.name == "suspend-domain");
    assert(begin.category == CATEGORY_FIBER);
    const ring_state_t *ring = translator.get_registry().find_ring(2);
    assert(ring->has_current_fiber && ring->current_fiber == 4);
    return true;
}

static bool
check_unknown_and_lost()
{
    std::cerr << "Testing unknown events and lost events leave no records\n";
    recording_writer_t writer;
    event_translator_t translator(&writer, TEST_PID);
    run_events(&translator, { make_event(FIBER_EVENT_UNKNOWN, 0, 1, 0, 200),
                              make_event(FIBER_EVENT_UNKNOWN, 0, 2, 0, 201) });
    // Only the ring registration.
    assert(writer.records.size() == 1);
    assert(writer.records[0].kind == RECORD_REGISTER_THREAD);
    assert(translator.get_ignored_event_count() == 2);

    translator.process_lost_events(0, 5);
    translator.process_lost_events(1, 7);
    assert(translator.get_lost_event_count() == 12);
    assert(writer.records.size() == 1);
    return true;
}

static bool
check_writer_failure()
{
    std::cerr << "Testing writer failures are reported\n";
    recording_writer_t writer(2);
    event_translator_t translator(&writer, TEST_PID);
    // Two registrations succeed; the creation instant fails.
    std::string error = translator.process_event(created(0, 1, 1));
    assert(error == "Simulated write failure");

    recording_writer_t early(0);
    event_translator_t early_translator(&early, TEST_PID);
    error = early_translator.process_event(scheduled(0, 1, 1));
    assert(error == "Simulated write failure");
    assert(early.records.empty());
    return true;
}

int
test_main(int argc, const char *argv[])
{
    if (check_create_suspend_resume_exit() && check_gc_goes_to_ring() &&
        check_ring_registration() && check_fiber_registration() &&
        check_suspend_pairing() && check_replay_is_identical() && check_attribution() &&
        check_ring_idling() && check_unknown_and_lost() && check_writer_failure()) {
        std::cerr << "translator tests passed\n";
        return 0;
    }
    std::cerr << "translator tests FAILED\n";
    exit(1);
}

} // namespace fibertrace
