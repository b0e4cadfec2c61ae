/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Promise.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamDefaultReader.h>
#include <LibStreams/ReadableStreamOperations.h>

namespace Streams {

GC_DEFINE_ALLOCATOR(DefaultReaderReadRequest);
GC_DEFINE_ALLOCATOR(ReadLoopReadRequest);
GC_DEFINE_ALLOCATOR(ReadableStreamDefaultReader);

DefaultReaderReadRequest::DefaultReaderReadRequest(GC::Ref<Promise<ReadResult>> promise)
    : m_promise(promise)
{
}

void DefaultReaderReadRequest::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    visitor.visit(m_promise);
}

// chunk steps, given chunk
void DefaultReaderReadRequest::on_chunk(Value chunk)
{
    // 1. Resolve promise with «[ "value" → chunk, "done" → false ]».
    m_promise->fulfill(ReadResult { move(chunk), false });
}

// close steps
void DefaultReaderReadRequest::on_close()
{
    // 1. Resolve promise with «[ "value" → undefined, "done" → true ]».
    m_promise->fulfill(ReadResult { js_undefined(), true });
}

// error steps, given e
void DefaultReaderReadRequest::on_error(Value error)
{
    // 1. Reject promise with e.
    m_promise->reject(move(error));
}

ReadLoopReadRequest::ReadLoopReadRequest(Realm& realm, GC::Ref<ReadableStreamDefaultReader> reader, GC::Ref<SuccessSteps> success_steps, GC::Ref<FailureSteps> failure_steps)
    : m_realm(realm)
    , m_reader(reader)
    , m_success_steps(success_steps)
    , m_failure_steps(failure_steps)
{
}

void ReadLoopReadRequest::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    visitor.visit(m_reader);
    visitor.visit(m_success_steps);
    visitor.visit(m_failure_steps);
}

// chunk steps, given chunk
void ReadLoopReadRequest::on_chunk(Value chunk)
{
    // 1. If chunk is not a Uint8Array object, call failureSteps with a TypeError and abort these steps.
    if (!chunk.is_array_buffer_view() || chunk.as_array_buffer_view().type() != ArrayBufferViewType::Uint8Array) {
        m_failure_steps->function()(SimpleException { SimpleExceptionType::TypeError, "Chunk data is not a Uint8Array"sv });
        return;
    }

    // 2. Append the bytes represented by chunk to bytes.
    m_bytes.append(chunk.as_array_buffer_view().bytes());

    // 3. Read-loop given reader, bytes, successSteps, and failureSteps.
    // NOTE: The next read is started from a microtask rather than recursively, so a long run of chunks that are
    //       already queued does not grow the stack.
    m_realm.queue_microtask(GC::create_function(m_realm.heap(), [read_request = GC::Ref { *this }]() {
        if (!read_request->m_reader->stream()) {
            read_request->m_failure_steps->function()(SimpleException { SimpleExceptionType::TypeError, "Reader has been released"sv });
            return;
        }
        readable_stream_default_reader_read(read_request->m_reader, read_request);
    }));
}

// close steps
void ReadLoopReadRequest::on_close()
{
    // 1. Call successSteps with bytes.
    m_success_steps->function()(move(m_bytes));
}

// error steps, given e
void ReadLoopReadRequest::on_error(Value error)
{
    // 1. Call failureSteps with e.
    m_failure_steps->function()(error);
}

// https://streams.spec.whatwg.org/#default-reader-constructor
ExceptionOr<GC::Ref<ReadableStreamDefaultReader>> ReadableStreamDefaultReader::construct_impl(Realm& realm, GC::Ref<ReadableStream> stream)
{
    auto reader = realm.create<ReadableStreamDefaultReader>(realm);

    // 1. Perform ? SetUpReadableStreamDefaultReader(this, stream).
    TRY(set_up_readable_stream_default_reader(reader, stream));

    return reader;
}

ReadableStreamDefaultReader::ReadableStreamDefaultReader(Realm& realm)
    : ReadableStreamGenericReaderMixin(realm)
{
}

void ReadableStreamDefaultReader::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    ReadableStreamGenericReaderMixin::visit_edges(visitor);
    for (auto& request : m_read_requests)
        visitor.visit(request);
}

// https://streams.spec.whatwg.org/#default-reader-read
GC::Ref<Promise<ReadResult>> ReadableStreamDefaultReader::read()
{
    auto& realm = this->realm();

    // 1. If this.[[stream]] is undefined, return a promise rejected with a TypeError exception.
    if (!m_stream) {
        auto rejected = Promise<ReadResult>::create(realm);
        rejected->reject(SimpleException { SimpleExceptionType::TypeError, "Cannot read from a released reader"sv });
        return rejected;
    }

    // 2. Let promise be a new promise.
    auto promise = Promise<ReadResult>::create(realm);

    // 3. Let readRequest be a new read request with the following items:
    //    chunk steps, given chunk
    //        Resolve promise with «[ "value" → chunk, "done" → false ]».
    //    close steps
    //        Resolve promise with «[ "value" → undefined, "done" → true ]».
    //    error steps, given e
    //        Reject promise with e.
    auto read_request = realm.create<DefaultReaderReadRequest>(promise);

    // 4. Perform ! ReadableStreamDefaultReaderRead(this, readRequest).
    readable_stream_default_reader_read(*this, read_request);

    // 5. Return promise.
    return promise;
}

// https://streams.spec.whatwg.org/#readablestreamdefaultreader-read-a-chunk
void ReadableStreamDefaultReader::read_a_chunk(ReadRequest& read_request)
{
    // To read a chunk from a ReadableStreamDefaultReader reader, given a read request readRequest,
    // perform ! ReadableStreamDefaultReaderRead(reader, readRequest).
    readable_stream_default_reader_read(*this, read_request);
}

// https://streams.spec.whatwg.org/#readablestreamdefaultreader-read-all-bytes
void ReadableStreamDefaultReader::read_all_bytes(GC::Ref<ReadLoopReadRequest::SuccessSteps> success_steps, GC::Ref<ReadLoopReadRequest::FailureSteps> failure_steps)
{
    auto& realm = this->realm();

    // 1. Let readRequest be a new read request with the following items:
    //    NOTE: items and steps in ReadLoopReadRequest.
    auto read_request = realm.create<ReadLoopReadRequest>(realm, *this, success_steps, failure_steps);

    // 2. Perform ! ReadableStreamDefaultReaderRead(this, readRequest).
    readable_stream_default_reader_read(*this, read_request);
}

// Settles with an ArrayBuffer holding every byte read, or rejects with the failure.
GC::Ref<Promise<Value>> ReadableStreamDefaultReader::read_all_bytes_as_promise()
{
    auto& realm = this->realm();
    auto promise = create_promise(realm);

    auto success_steps = GC::create_function(realm.heap(), [&realm, promise](ByteBuffer bytes) {
        resolve_promise(promise, ArrayBuffer::create(realm, move(bytes)));
    });

    auto failure_steps = GC::create_function(realm.heap(), [promise](Value const& error) {
        reject_promise(promise, error);
    });

    read_all_bytes(success_steps, failure_steps);

    return promise;
}

// https://streams.spec.whatwg.org/#default-reader-release-lock
void ReadableStreamDefaultReader::release_lock()
{
    // 1. If this.[[stream]] is undefined, return.
    if (!m_stream)
        return;

    // 2. Perform ! ReadableStreamDefaultReaderRelease(this).
    readable_stream_default_reader_release(*this);
}

}
