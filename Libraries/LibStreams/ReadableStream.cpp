/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibStreams/ActivityLog.h>
#include <LibStreams/Promise.h>
#include <LibStreams/ReadableByteStreamController.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamBYOBReader.h>
#include <LibStreams/ReadableStreamBYOBRequest.h>
#include <LibStreams/ReadableStreamDefaultController.h>
#include <LibStreams/ReadableStreamDefaultReader.h>
#include <LibStreams/ReadableStreamOperations.h>

namespace Streams {

GC_DEFINE_ALLOCATOR(ReadableStream);

// https://streams.spec.whatwg.org/#rs-constructor
ExceptionOr<GC::Ref<ReadableStream>> ReadableStream::construct_impl(Realm& realm, Optional<UnderlyingSource> const& underlying_source, QueuingStrategy const& strategy)
{
    auto readable_stream = realm.create<ReadableStream>(realm);

    // 1. If underlyingSource is missing, set it to null.
    // 2. Let underlyingSourceDict be underlyingSource, converted to an IDL value of type UnderlyingSource.
    auto underlying_source_dict = underlying_source.value_or({});

    // 3. Perform ! InitializeReadableStream(this).
    initialize_readable_stream(*readable_stream);

    // 4. If underlyingSourceDict["type"] is "bytes":
    if (underlying_source_dict.type.has_value() && *underlying_source_dict.type == ReadableStreamType::Bytes) {
        if (!realm.settings().byte_streams_enabled())
            return SimpleException { SimpleExceptionType::TypeError, "Readable byte streams are disabled"sv };

        // 1. If strategy["size"] exists, throw a RangeError exception.
        if (strategy.size)
            return SimpleException { SimpleExceptionType::RangeError, "Size strategy not allowed for byte stream"sv };

        // 2. Let highWaterMark be ? ExtractHighWaterMark(strategy, 0).
        auto high_water_mark = TRY(extract_high_water_mark(strategy, 0));

        // 3. Perform ? SetUpReadableByteStreamControllerFromUnderlyingSource(this, underlyingSource, underlyingSourceDict, highWaterMark).
        TRY(set_up_readable_byte_stream_controller_from_underlying_source(*readable_stream, underlying_source_dict, high_water_mark));
    }
    // 5. Otherwise,
    else {
        // 1. Assert: underlyingSourceDict["type"] does not exist.
        VERIFY(!underlying_source_dict.type.has_value());

        // 2. Let sizeAlgorithm be ! ExtractSizeAlgorithm(strategy).
        auto size_algorithm = extract_size_algorithm(realm, strategy);

        // 3. Let highWaterMark be ? ExtractHighWaterMark(strategy, 1).
        auto high_water_mark = TRY(extract_high_water_mark(strategy, 1));

        // 4. Perform ? SetUpReadableStreamDefaultControllerFromUnderlyingSource(this, underlyingSource, underlyingSourceDict, highWaterMark, sizeAlgorithm).
        TRY(set_up_readable_stream_default_controller_from_underlying_source(*readable_stream, underlying_source_dict, high_water_mark, size_algorithm));
    }

    return readable_stream;
}

GC::Ref<ReadableStream> ReadableStream::create(Realm& realm)
{
    return realm.create<ReadableStream>(realm);
}

ReadableStream::ReadableStream(Realm& realm)
    : m_realm(realm)
{
}

ReadableStream::~ReadableStream() = default;

// https://streams.spec.whatwg.org/#rs-locked
bool ReadableStream::locked() const
{
    // 1. Return ! IsReadableStreamLocked(this).
    return is_readable_stream_locked(*this);
}

// https://streams.spec.whatwg.org/#rs-cancel
GC::Ref<Promise<Value>> ReadableStream::cancel(Value reason)
{
    // 1. If ! IsReadableStreamLocked(this) is true, return a promise rejected with a TypeError exception.
    if (is_readable_stream_locked(*this)) {
        auto exception = SimpleException { SimpleExceptionType::TypeError, "Cannot cancel a locked stream"sv };
        return create_rejected_promise(m_realm, exception);
    }

    // 2. Return ! ReadableStreamCancel(this, reason).
    return readable_stream_cancel(*this, move(reason));
}

// https://streams.spec.whatwg.org/#rs-get-reader
ExceptionOr<ReadableStreamReader> ReadableStream::get_reader(ReadableStreamGetReaderOptions const& options)
{
    // 1. If options["mode"] does not exist, return ? AcquireReadableStreamDefaultReader(this).
    if (!options.mode.has_value())
        return ReadableStreamReader { TRY(acquire_readable_stream_default_reader(*this)) };

    // 2. Assert: options["mode"] is "byob".
    VERIFY(*options.mode == ReadableStreamReaderMode::Byob);

    // 3. Return ? AcquireReadableStreamBYOBReader(this).
    return ReadableStreamReader { TRY(acquire_readable_stream_byob_reader(*this)) };
}

// https://streams.spec.whatwg.org/#rs-tee
ExceptionOr<ReadableStreamPair> ReadableStream::tee()
{
    // 1. Return ? ReadableStreamTee(this, false).
    return readable_stream_tee(m_realm, *this, false);
}

// https://streams.spec.whatwg.org/#readablestream-set-up
void ReadableStream::set_up(GC::Ref<PullAlgorithm> pull_algorithm, GC::Ptr<CancelAlgorithm> cancel_algorithm, double high_water_mark, GC::Ptr<SizeAlgorithm> size_algorithm)
{
    // 1. Let startAlgorithm be an algorithm that returns undefined.
    auto start_algorithm = GC::create_function(m_realm.heap(), []() -> ExceptionOr<Value> { return js_undefined(); });

    // 2. Let pullAlgorithmWrapper be an algorithm that runs these steps:
    //    1. Let result be the result of running pullAlgorithm, if pullAlgorithm was given, or null otherwise. If this throws an exception e, return a promise rejected with e.
    //    2. If result is a Promise, then return result.
    //    3. Return a promise resolved with undefined.
    // NOTE: PullAlgorithm already returns a promise, so it is used as-is.

    // 3. Let cancelAlgorithmWrapper be an algorithm that runs these steps given reason:
    //    1. Let result be the result of running cancelAlgorithm given reason, if cancelAlgorithm was given, or null otherwise. If this throws an exception e, return a promise rejected with e.
    //    2. If result is a Promise, then return result.
    //    3. Return a promise resolved with undefined.
    auto cancel_algorithm_wrapper = GC::create_function(m_realm.heap(), [&realm = m_realm, cancel_algorithm](Value const& reason) -> GC::Ref<Promise<Value>> {
        if (cancel_algorithm)
            return cancel_algorithm->function()(reason);
        return create_resolved_promise(realm, js_undefined());
    });

    // 4. If sizeAlgorithm was not given, then set it to an algorithm that returns 1.
    if (!size_algorithm)
        size_algorithm = GC::create_function(m_realm.heap(), [](Value const&) -> ExceptionOr<double> { return 1.0; });

    // 5. Perform ! InitializeReadableStream(stream).
    initialize_readable_stream(*this);

    // 6. Let controller be a new ReadableStreamDefaultController.
    auto controller = m_realm.create<ReadableStreamDefaultController>(m_realm);

    // 7. Perform ! SetUpReadableStreamDefaultController(stream, controller, startAlgorithm, pullAlgorithmWrapper, cancelAlgorithmWrapper, highWaterMark, sizeAlgorithm).
    MUST(set_up_readable_stream_default_controller(*this, controller, start_algorithm, pull_algorithm, cancel_algorithm_wrapper, high_water_mark, *size_algorithm));
}

// https://streams.spec.whatwg.org/#readablestream-set-up-with-byte-reading-support
void ReadableStream::set_up_with_byte_reading_support(GC::Ptr<PullAlgorithm> pull_algorithm, GC::Ptr<CancelAlgorithm> cancel_algorithm, double high_water_mark)
{
    // 1. Let startAlgorithm be an algorithm that returns undefined.
    auto start_algorithm = GC::create_function(m_realm.heap(), []() -> ExceptionOr<Value> { return js_undefined(); });

    // 2. Let pullAlgorithmWrapper be an algorithm that runs these steps:
    //    1. Let result be the result of running pullAlgorithm, if pullAlgorithm was given, or null otherwise. If this throws an exception e, return a promise rejected with e.
    //    2. If result is a Promise, then return result.
    //    3. Return a promise resolved with undefined.
    auto pull_algorithm_wrapper = GC::create_function(m_realm.heap(), [&realm = m_realm, pull_algorithm]() -> GC::Ref<Promise<Value>> {
        if (pull_algorithm)
            return pull_algorithm->function()();
        return create_resolved_promise(realm, js_undefined());
    });

    // 3. Let cancelAlgorithmWrapper be an algorithm that runs these steps:
    //    1. Let result be the result of running cancelAlgorithm, if cancelAlgorithm was given, or null otherwise. If this throws an exception e, return a promise rejected with e.
    //    2. If result is a Promise, then return result.
    //    3. Return a promise resolved with undefined.
    auto cancel_algorithm_wrapper = GC::create_function(m_realm.heap(), [&realm = m_realm, cancel_algorithm](Value const& reason) -> GC::Ref<Promise<Value>> {
        if (cancel_algorithm)
            return cancel_algorithm->function()(reason);
        return create_resolved_promise(realm, js_undefined());
    });

    // 4. Perform ! InitializeReadableStream(stream).
    initialize_readable_stream(*this);

    // 5. Let controller be a new ReadableByteStreamController.
    auto controller = m_realm.create<ReadableByteStreamController>(m_realm);

    // 6. Perform ! SetUpReadableByteStreamController(stream, controller, startAlgorithm, pullAlgorithmWrapper, cancelAlgorithmWrapper, highWaterMark, undefined).
    MUST(set_up_readable_byte_stream_controller(*this, controller, start_algorithm, pull_algorithm_wrapper, cancel_algorithm_wrapper, high_water_mark, {}));
}

// https://streams.spec.whatwg.org/#readablestream-enqueue
ExceptionOr<void> ReadableStream::enqueue(Value chunk)
{
    VERIFY(m_controller.has_value());

    // 1. If stream.[[controller]] implements ReadableStreamDefaultController,
    if (auto* controller = m_controller->get_pointer<GC::Ref<ReadableStreamDefaultController>>()) {
        // 1. Perform ! ReadableStreamDefaultControllerEnqueue(stream.[[controller]], chunk).
        return readable_stream_default_controller_enqueue(**controller, move(chunk));
    }

    // 2. Otherwise,
    // 1. Assert: stream.[[controller]] implements ReadableByteStreamController.
    auto& readable_byte_controller = *m_controller->get<GC::Ref<ReadableByteStreamController>>();

    // 2. Assert: chunk is an ArrayBufferView.
    VERIFY(chunk.is_array_buffer_view());
    auto& chunk_view = chunk.as_array_buffer_view();

    // 3. Let byobView be the current BYOB request view for stream.
    auto byob_view = current_byob_request_view();

    // 4. If byobView is non-null, and chunk.[[ViewedArrayBuffer]] is byobView.[[ViewedArrayBuffer]], then:
    if (byob_view && &chunk_view.viewed_array_buffer() == &byob_view->viewed_array_buffer()) {
        // 1. Assert: chunk.[[ByteOffset]] is byobView.[[ByteOffset]].
        VERIFY(chunk_view.byte_offset() == byob_view->byte_offset());

        // 2. Assert: chunk.[[ByteLength]] ≤ byobView.[[ByteLength]].
        VERIFY(chunk_view.byte_length() <= byob_view->byte_length());

        // NOTE: These asserts ensure that the caller does not write outside the requested range in the current BYOB request view.

        // 3. Perform ? ReadableByteStreamControllerRespond(stream.[[controller]], chunk.[[ByteLength]]).
        return readable_byte_stream_controller_respond(readable_byte_controller, chunk_view.byte_length());
    }

    // 5. Otherwise, perform ? ReadableByteStreamControllerEnqueue(stream.[[controller]], chunk).
    return readable_byte_stream_controller_enqueue(readable_byte_controller, chunk_view);
}

// https://streams.spec.whatwg.org/#readablestream-close
ExceptionOr<void> ReadableStream::close()
{
    VERIFY(m_controller.has_value());

    // 1. If stream.[[controller]] implements ReadableByteStreamController,
    if (auto* controller = m_controller->get_pointer<GC::Ref<ReadableByteStreamController>>()) {
        // 1. Perform ! ReadableByteStreamControllerClose(stream.[[controller]]).
        // NOTE: Closing fails when the first pending pull-into holds a partial element; the controller is errored and
        //       the TypeError is passed on to the caller.
        TRY(readable_byte_stream_controller_close(**controller));

        // 2. If stream.[[controller]].[[pendingPullIntos]] is not empty, perform ! ReadableByteStreamControllerRespond(stream.[[controller]], 0).
        if (!(*controller)->pending_pull_intos().is_empty())
            TRY(readable_byte_stream_controller_respond(**controller, 0));
        return {};
    }

    // 2. Otherwise, perform ! ReadableStreamDefaultControllerClose(stream.[[controller]]).
    readable_stream_default_controller_close(*m_controller->get<GC::Ref<ReadableStreamDefaultController>>());
    return {};
}

// https://streams.spec.whatwg.org/#readablestream-error
void ReadableStream::error(Value error)
{
    VERIFY(m_controller.has_value());

    m_controller->visit(
        // 1. If stream.[[controller]] implements ReadableByteStreamController, then perform
        //    ! ReadableByteStreamControllerError(stream.[[controller]], e).
        [&](GC::Ref<ReadableByteStreamController> controller) {
            readable_byte_stream_controller_error(controller, error);
        },

        // 2. Otherwise, perform ! ReadableStreamDefaultControllerError(stream.[[controller]], e).
        [&](GC::Ref<ReadableStreamDefaultController> controller) {
            readable_stream_default_controller_error(controller, error);
        });
}

// https://streams.spec.whatwg.org/#readablestream-current-byob-request-view
GC::Ptr<ArrayBufferView> ReadableStream::current_byob_request_view()
{
    // 1. Assert: stream.[[controller]] implements ReadableByteStreamController.
    VERIFY(has_byte_controller());

    // 2. Let byobRequest be ! ReadableByteStreamControllerGetBYOBRequest(stream.[[controller]]).
    auto byob_request = readable_byte_stream_controller_get_byob_request(m_controller->get<GC::Ref<ReadableByteStreamController>>());

    // 3. If byobRequest is null, then return null.
    if (!byob_request)
        return {};

    // 4. Return byobRequest.[[view]].
    return byob_request->view();
}

// https://streams.spec.whatwg.org/#readablestream-get-a-reader
ExceptionOr<GC::Ref<ReadableStreamDefaultReader>> ReadableStream::get_a_reader()
{
    // To get a reader for a ReadableStream stream, return ? AcquireReadableStreamDefaultReader(stream). The result will be a ReadableStreamDefaultReader.
    return acquire_readable_stream_default_reader(*this);
}

bool ReadableStream::has_byte_controller() const
{
    if (!m_controller.has_value())
        return false;
    return m_controller->has<GC::Ref<ReadableByteStreamController>>();
}

void ReadableStream::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    if (m_controller.has_value())
        m_controller->visit([&](auto const& controller) { visitor.visit(controller); });
    m_stored_error.visit_edges(visitor);
    if (m_reader.has_value())
        m_reader->visit([&](auto const& reader) { visitor.visit(reader); });
}

StringView readable_stream_state_name(ReadableStream::State state)
{
    switch (state) {
    case ReadableStream::State::Readable:
        return "readable"sv;
    case ReadableStream::State::Closed:
        return "closed"sv;
    case ReadableStream::State::Errored:
        return "errored"sv;
    }
    VERIFY_NOT_REACHED();
}

}
