/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/ByteBuffer.h>
#include <AK/SinglyLinkedList.h>
#include <LibGC/CellAllocator.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>
#include <LibStreams/ReadableStreamGenericReader.h>

namespace Streams {

// https://streams.spec.whatwg.org/#dictdef-readablestreamreadresult
struct ReadResult {
    Value value;
    bool done { false };
};

inline void visit_promise_result(GC::Cell::Visitor& visitor, ReadResult const& result)
{
    result.value.visit_edges(visitor);
}

// https://streams.spec.whatwg.org/#read-request
class ReadRequest : public GC::Cell {
    GC_CELL(ReadRequest, GC::Cell);

public:
    virtual ~ReadRequest() override = default;

    // https://streams.spec.whatwg.org/#read-request-chunk-steps
    virtual void on_chunk(Value chunk) = 0;

    // https://streams.spec.whatwg.org/#read-request-close-steps
    virtual void on_close() = 0;

    // https://streams.spec.whatwg.org/#read-request-error-steps
    virtual void on_error(Value error) = 0;
};

// Read request whose steps settle the promise returned from ReadableStreamDefaultReader::read().
class DefaultReaderReadRequest final : public ReadRequest {
    GC_CELL(DefaultReaderReadRequest, ReadRequest);
    GC_DECLARE_ALLOCATOR(DefaultReaderReadRequest);

public:
    virtual void on_chunk(Value chunk) override;
    virtual void on_close() override;
    virtual void on_error(Value error) override;

private:
    explicit DefaultReaderReadRequest(GC::Ref<Promise<ReadResult>>);

    virtual void visit_edges(Cell::Visitor&) override;

    GC::Ref<Promise<ReadResult>> m_promise;
};

// https://streams.spec.whatwg.org/#read-loop
class ReadLoopReadRequest final : public ReadRequest {
    GC_CELL(ReadLoopReadRequest, ReadRequest);
    GC_DECLARE_ALLOCATOR(ReadLoopReadRequest);

public:
    // successSteps, which is an algorithm accepting a byte sequence
    using SuccessSteps = GC::Function<void(ByteBuffer)>;

    // failureSteps, which is an algorithm accepting a JavaScript value
    using FailureSteps = GC::Function<void(Value const& error)>;

    virtual void on_chunk(Value chunk) override;
    virtual void on_close() override;
    virtual void on_error(Value error) override;

private:
    ReadLoopReadRequest(Realm&, GC::Ref<ReadableStreamDefaultReader>, GC::Ref<SuccessSteps>, GC::Ref<FailureSteps>);

    virtual void visit_edges(Cell::Visitor&) override;

    Realm& m_realm;
    GC::Ref<ReadableStreamDefaultReader> m_reader;
    ByteBuffer m_bytes;
    GC::Ref<SuccessSteps> m_success_steps;
    GC::Ref<FailureSteps> m_failure_steps;
};

// https://streams.spec.whatwg.org/#readablestreamdefaultreader
class ReadableStreamDefaultReader final
    : public GC::Cell
    , public ReadableStreamGenericReaderMixin {
    GC_CELL(ReadableStreamDefaultReader, GC::Cell);
    GC_DECLARE_ALLOCATOR(ReadableStreamDefaultReader);

public:
    static ExceptionOr<GC::Ref<ReadableStreamDefaultReader>> construct_impl(Realm&, GC::Ref<ReadableStream>);

    virtual ~ReadableStreamDefaultReader() override = default;

    GC::Ref<Promise<ReadResult>> read();

    void read_a_chunk(ReadRequest&);
    void read_all_bytes(GC::Ref<ReadLoopReadRequest::SuccessSteps>, GC::Ref<ReadLoopReadRequest::FailureSteps>);
    GC::Ref<Promise<Value>> read_all_bytes_as_promise();

    void release_lock();

    SinglyLinkedList<GC::Ref<ReadRequest>>& read_requests() { return m_read_requests; }

private:
    explicit ReadableStreamDefaultReader(Realm&);

    virtual void visit_edges(Cell::Visitor&) override;

    // https://streams.spec.whatwg.org/#readablestreamdefaultreader-readrequests
    SinglyLinkedList<GC::Ref<ReadRequest>> m_read_requests;
};

}
