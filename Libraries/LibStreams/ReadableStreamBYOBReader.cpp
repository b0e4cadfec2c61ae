/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Promise.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamBYOBReader.h>
#include <LibStreams/ReadableStreamOperations.h>

namespace Streams {

GC_DEFINE_ALLOCATOR(BYOBReaderReadIntoRequest);
GC_DEFINE_ALLOCATOR(ReadableStreamBYOBReader);

BYOBReaderReadIntoRequest::BYOBReaderReadIntoRequest(GC::Ref<Promise<ReadResult>> promise)
    : m_promise(promise)
{
}

void BYOBReaderReadIntoRequest::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    visitor.visit(m_promise);
}

// chunk steps, given chunk
void BYOBReaderReadIntoRequest::on_chunk(Value chunk)
{
    // 1. Resolve promise with «[ "value" → chunk, "done" → false ]».
    m_promise->fulfill(ReadResult { move(chunk), false });
}

// close steps, given chunk
void BYOBReaderReadIntoRequest::on_close(Value chunk)
{
    // 1. Resolve promise with «[ "value" → chunk, "done" → true ]».
    m_promise->fulfill(ReadResult { move(chunk), true });
}

// error steps, given e
void BYOBReaderReadIntoRequest::on_error(Value error)
{
    // 1. Reject promise with e.
    m_promise->reject(move(error));
}

// https://streams.spec.whatwg.org/#byob-reader-constructor
ExceptionOr<GC::Ref<ReadableStreamBYOBReader>> ReadableStreamBYOBReader::construct_impl(Realm& realm, GC::Ref<ReadableStream> stream)
{
    auto reader = realm.create<ReadableStreamBYOBReader>(realm);

    // 1. Perform ? SetUpReadableStreamBYOBReader(this, stream).
    TRY(set_up_readable_stream_byob_reader(reader, stream));

    return reader;
}

ReadableStreamBYOBReader::ReadableStreamBYOBReader(Realm& realm)
    : ReadableStreamGenericReaderMixin(realm)
{
}

void ReadableStreamBYOBReader::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    ReadableStreamGenericReaderMixin::visit_edges(visitor);
    for (auto& request : m_read_into_requests)
        visitor.visit(request);
}

// https://streams.spec.whatwg.org/#byob-reader-release-lock
void ReadableStreamBYOBReader::release_lock()
{
    // 1. If this.[[stream]] is undefined, return.
    if (!m_stream)
        return;

    // 2. Perform ! ReadableStreamBYOBReaderRelease(this).
    readable_stream_byob_reader_release(*this);
}

// https://streams.spec.whatwg.org/#byob-reader-read
GC::Ref<Promise<ReadResult>> ReadableStreamBYOBReader::read(GC::Ref<ArrayBufferView> view, ReadableStreamBYOBReaderReadOptions const& options)
{
    auto& realm = this->realm();
    auto promise = Promise<ReadResult>::create(realm);

    auto reject_with = [&](SimpleExceptionType type, StringView message) {
        promise->reject(SimpleException { type, message });
        return promise;
    };

    // 1. If view.[[ByteLength]] is 0, return a promise rejected with a TypeError exception.
    if (view->byte_length() == 0)
        return reject_with(SimpleExceptionType::TypeError, "Cannot read in an empty buffer"sv);

    // 2. If view.[[ViewedArrayBuffer]].[[ArrayBufferByteLength]] is 0, return a promise rejected with a TypeError exception.
    if (view->viewed_array_buffer().byte_length() == 0)
        return reject_with(SimpleExceptionType::TypeError, "Cannot read in an empty buffer"sv);

    // 3. If ! IsDetachedBuffer(view.[[ViewedArrayBuffer]]) is true, return a promise rejected with a TypeError exception.
    if (view->viewed_array_buffer().is_detached())
        return reject_with(SimpleExceptionType::TypeError, "Cannot read in a detached buffer"sv);

    // 4. If options["min"] is 0, return a promise rejected with a TypeError exception.
    if (options.min == 0)
        return reject_with(SimpleExceptionType::TypeError, "options[\"min\"] cannot have a value of 0."sv);

    // 5. If view has a [[TypedArrayName]] internal slot,
    //    1. If options["min"] > view.[[ArrayLength]], return a promise rejected with a RangeError exception.
    // 6. Otherwise (i.e., it is a DataView),
    //    1. If options["min"] > view.[[ByteLength]], return a promise rejected with a RangeError exception.
    // NOTE: A DataView's element size is 1, so its length is its byte length.
    if (options.min > view->length())
        return reject_with(SimpleExceptionType::RangeError, "options[\"min\"] cannot be larger than the length of the view."sv);

    // 7. If this.[[stream]] is undefined, return a promise rejected with a TypeError exception.
    if (!m_stream)
        return reject_with(SimpleExceptionType::TypeError, "Cannot read from a released reader"sv);

    // 8. Let promise be a new promise.
    // 9. Let readIntoRequest be a new read-into request with the following items:
    //    chunk steps, given chunk
    //        Resolve promise with «[ "value" → chunk, "done" → false ]».
    //    close steps, given chunk
    //        Resolve promise with «[ "value" → chunk, "done" → true ]».
    //    error steps, given e
    //        Reject promise with e.
    auto read_into_request = realm.create<BYOBReaderReadIntoRequest>(promise);

    // 10. Perform ! ReadableStreamBYOBReaderRead(this, view, options["min"], readIntoRequest).
    readable_stream_byob_reader_read(*this, view, options.min, read_into_request);

    // 11. Return promise.
    return promise;
}

}
