/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "TestHeap.h"
#include <LibGC/Heap.h>
#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Realm.h>
#include <LibStreams/Value.h>

GC::Heap& test_gc_heap()
{
    // Stream objects are only reachable from the stack and from realm roots, so the embedder has none to add.
    thread_local GC::Heap heap(nullptr, [](auto&) {});
    return heap;
}

Streams::Value make_uint8_array(Streams::Realm& realm, StringView text)
{
    return MUST(Streams::ArrayBufferView::create_uint8_array(realm, text.bytes()));
}

StringView chunk_as_string_view(Streams::Value const& chunk)
{
    if (chunk.is_array_buffer_view())
        return StringView { chunk.as_array_buffer_view().bytes() };
    if (chunk.is_array_buffer())
        return StringView { chunk.as_array_buffer().bytes() };
    VERIFY_NOT_REACHED();
}
