/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Noncopyable.h>
#include <AK/SinglyLinkedList.h>
#include <LibGC/Function.h>
#include <LibGC/Heap.h>
#include <LibGC/Root.h>
#include <LibStreams/Settings.h>

namespace Streams {

// The environment every stream object lives in: the GC heap it is allocated on, the microtask queue promise
// reactions are run from, and the settings in effect.
class Realm {
    AK_MAKE_NONCOPYABLE(Realm);
    AK_MAKE_NONMOVABLE(Realm);

public:
    explicit Realm(GC::Heap&, Settings = {});
    ~Realm();

    GC::Heap& heap() const { return m_heap; }

    template<typename T, typename... Args>
    GC::Ref<T> create(Args&&... args)
    {
        return m_heap.allocate<T>(forward<Args>(args)...);
    }

    Settings const& settings() const { return m_settings; }
    Settings& settings() { return m_settings; }

    void queue_microtask(GC::Ref<GC::Function<void()>>);
    void perform_a_microtask_checkpoint();

    bool has_pending_microtasks() const { return !m_microtask_queue.is_empty(); }

private:
    GC::Heap& m_heap;
    Settings m_settings;

    SinglyLinkedList<GC::Root<GC::Function<void()>>> m_microtask_queue;
    bool m_performing_a_microtask_checkpoint { false };
};

}
