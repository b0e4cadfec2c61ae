/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/TemporaryChange.h>
#include <LibStreams/Debug.h>
#include <LibStreams/Realm.h>

namespace Streams {

Realm::Realm(GC::Heap& heap, Settings settings)
    : m_heap(heap)
    , m_settings(move(settings))
{
}

Realm::~Realm()
{
    if (!m_microtask_queue.is_empty())
        dbgln_if(STREAMS_DEBUG, "Realm destroyed with {} pending microtask(s)", m_microtask_queue.size());
}

void Realm::queue_microtask(GC::Ref<GC::Function<void()>> job)
{
    m_microtask_queue.append(GC::make_root(job));
}

// https://html.spec.whatwg.org/multipage/webappapis.html#perform-a-microtask-checkpoint
void Realm::perform_a_microtask_checkpoint()
{
    // 1. If the event loop's performing a microtask checkpoint is true, then return.
    if (m_performing_a_microtask_checkpoint)
        return;

    // 2. Set the event loop's performing a microtask checkpoint to true.
    TemporaryChange change { m_performing_a_microtask_checkpoint, true };

    // 3. While the event loop's microtask queue is not empty:
    while (!m_microtask_queue.is_empty()) {
        // 1. Let oldestMicrotask be the result of dequeuing from the event loop's microtask queue.
        auto oldest_microtask = m_microtask_queue.take_first();

        // 2. Run oldestMicrotask.
        oldest_microtask->function()();
    }
}

}
