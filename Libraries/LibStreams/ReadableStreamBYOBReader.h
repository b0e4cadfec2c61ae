/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/SinglyLinkedList.h>
#include <LibGC/CellAllocator.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>
#include <LibStreams/ReadableStreamDefaultReader.h>
#include <LibStreams/ReadableStreamGenericReader.h>

namespace Streams {

// https://streams.spec.whatwg.org/#dictdef-readablestreambyobreaderreadoptions
struct ReadableStreamBYOBReaderReadOptions {
    u64 min { 1 };
};

// https://streams.spec.whatwg.org/#read-into-request
class ReadIntoRequest : public GC::Cell {
    GC_CELL(ReadIntoRequest, GC::Cell);

public:
    virtual ~ReadIntoRequest() override = default;

    // https://streams.spec.whatwg.org/#read-into-request-chunk-steps
    virtual void on_chunk(Value chunk) = 0;

    // https://streams.spec.whatwg.org/#read-into-request-close-steps
    virtual void on_close(Value chunk) = 0;

    // https://streams.spec.whatwg.org/#read-into-request-error-steps
    virtual void on_error(Value error) = 0;
};

// Read-into request whose steps settle the promise returned from ReadableStreamBYOBReader::read().
class BYOBReaderReadIntoRequest final : public ReadIntoRequest {
    GC_CELL(BYOBReaderReadIntoRequest, ReadIntoRequest);
    GC_DECLARE_ALLOCATOR(BYOBReaderReadIntoRequest);

public:
    virtual void on_chunk(Value chunk) override;
    virtual void on_close(Value chunk) override;
    virtual void on_error(Value error) override;

private:
    explicit BYOBReaderReadIntoRequest(GC::Ref<Promise<ReadResult>>);

    virtual void visit_edges(Cell::Visitor&) override;

    GC::Ref<Promise<ReadResult>> m_promise;
};

// https://streams.spec.whatwg.org/#readablestreambyobreader
class ReadableStreamBYOBReader final
    : public GC::Cell
    , public ReadableStreamGenericReaderMixin {
    GC_CELL(ReadableStreamBYOBReader, GC::Cell);
    GC_DECLARE_ALLOCATOR(ReadableStreamBYOBReader);

public:
    static ExceptionOr<GC::Ref<ReadableStreamBYOBReader>> construct_impl(Realm&, GC::Ref<ReadableStream>);

    virtual ~ReadableStreamBYOBReader() override = default;

    GC::Ref<Promise<ReadResult>> read(GC::Ref<ArrayBufferView>, ReadableStreamBYOBReaderReadOptions const& = {});

    void release_lock();

    SinglyLinkedList<GC::Ref<ReadIntoRequest>>& read_into_requests() { return m_read_into_requests; }

private:
    explicit ReadableStreamBYOBReader(Realm&);

    virtual void visit_edges(Cell::Visitor&) override;

    // https://streams.spec.whatwg.org/#readablestreambyobreader-readintorequests
    SinglyLinkedList<GC::Ref<ReadIntoRequest>> m_read_into_requests;
};

}
