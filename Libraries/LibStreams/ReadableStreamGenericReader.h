/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibGC/Cell.h>
#include <LibGC/Ptr.h>
#include <LibStreams/Forward.h>
#include <LibStreams/Promise.h>

namespace Streams {

// https://streams.spec.whatwg.org/#readablestreamgenericreader
class ReadableStreamGenericReaderMixin {
public:
    GC::Ref<Promise<Value>> closed();

    GC::Ref<Promise<Value>> cancel(Value reason);

    GC::Ptr<ReadableStream> stream() const { return m_stream; }
    void set_stream(GC::Ptr<ReadableStream> stream) { m_stream = stream; }

    GC::Ptr<Promise<Value>> closed_promise() const { return m_closed_promise; }
    void set_closed_promise(GC::Ptr<Promise<Value>> promise) { m_closed_promise = promise; }

    Realm& realm() const { return m_realm; }

protected:
    explicit ReadableStreamGenericReaderMixin(Realm&);
    virtual ~ReadableStreamGenericReaderMixin() = default;

    void visit_edges(GC::Cell::Visitor&);

    // https://streams.spec.whatwg.org/#readablestreamgenericreader-closedpromise
    // A promise returned by the reader's closed getter
    GC::Ptr<Promise<Value>> m_closed_promise;

    // https://streams.spec.whatwg.org/#readablestreamgenericreader-stream
    // A ReadableStream instance that owns this reader
    GC::Ptr<ReadableStream> m_stream;

    Realm& m_realm;
};

}
