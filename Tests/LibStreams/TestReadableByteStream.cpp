/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "TestHeap.h"
#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Promise.h>
#include <LibStreams/ReadableByteStreamController.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamBYOBReader.h>
#include <LibStreams/ReadableStreamBYOBRequest.h>
#include <LibStreams/ReadableStreamDefaultReader.h>
#include <LibStreams/Realm.h>
#include <LibTest/TestCase.h>

using namespace Streams;

static GC::Ref<ArrayBufferView> create_view(Realm& realm, ArrayBufferViewType type, size_t length)
{
    auto buffer = MUST(ArrayBuffer::create(realm, length * element_size_of(type)));
    return MUST(ArrayBufferView::create(realm, type, buffer));
}

static GC::Ref<ReadableStreamBYOBReader> byob_reader_for(ReadableStream& stream)
{
    return MUST(stream.get_reader({ .mode = ReadableStreamReaderMode::Byob })).get<GC::Ref<ReadableStreamBYOBReader>>();
}

// Writes the bytes into the current BYOB request and responds with their length.
static ExceptionOr<void> respond_with_bytes(ReadableByteStreamController& controller, StringView bytes)
{
    auto request = controller.byob_request();
    VERIFY(request);

    auto view = request->view();
    VERIFY(view && view->byte_length() >= bytes.length());

    bytes.bytes().copy_to(view->viewed_array_buffer().bytes().slice(view->byte_offset(), bytes.length()));
    return request->respond(bytes.length());
}

struct ByteSource {
    GC::Ref<ReadableStream> stream;
    GC::Ref<ReadableByteStreamController> controller;
};

static ByteSource create_byte_stream(Realm& realm, Optional<u64> auto_allocate_chunk_size = {})
{
    GC::Ptr<ReadableByteStreamController> controller;

    UnderlyingSource source {
        .start = GC::create_function(realm.heap(), [&controller](ReadableStreamController stream_controller) -> ExceptionOr<Value> {
            controller = stream_controller.get<GC::Ref<ReadableByteStreamController>>();
            return js_undefined();
        }),
        .type = ReadableStreamType::Bytes,
        .auto_allocate_chunk_size = auto_allocate_chunk_size,
    };

    auto stream = MUST(ReadableStream::construct_impl(realm, source));
    realm.perform_a_microtask_checkpoint();
    return { stream, *controller };
}

TEST_CASE(construct_a_byte_stream)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    EXPECT(stream->has_byte_controller());
    EXPECT_EQ(controller->desired_size(), 0.0);
    EXPECT(!controller->byob_request());

    auto reader = byob_reader_for(stream);
    EXPECT(stream->locked());
    EXPECT_EQ(reader->stream().ptr(), stream.ptr());
}

TEST_CASE(byte_stream_rejects_a_size_strategy)
{
    Realm realm { test_gc_heap() };

    QueuingStrategy strategy {
        .size = GC::create_function(realm.heap(), [](Value const&) -> ExceptionOr<double> { return 1.0; }),
    };
    auto stream = ReadableStream::construct_impl(realm, UnderlyingSource { .type = ReadableStreamType::Bytes }, strategy);
    EXPECT(stream.is_exception());
    EXPECT(stream.exception().value().is_error_of_type(SimpleExceptionType::RangeError));
}

TEST_CASE(byte_stream_auto_allocate_chunk_size_limits)
{
    Settings settings;
    settings.set_maximum_auto_allocate_chunk_size(1024);
    Realm realm { test_gc_heap(), settings };

    auto zero = ReadableStream::construct_impl(realm, UnderlyingSource { .type = ReadableStreamType::Bytes, .auto_allocate_chunk_size = 0 });
    EXPECT(zero.is_exception());
    EXPECT(zero.exception().value().is_error_of_type(SimpleExceptionType::TypeError));

    auto too_large = ReadableStream::construct_impl(realm, UnderlyingSource { .type = ReadableStreamType::Bytes, .auto_allocate_chunk_size = 4096 });
    EXPECT(too_large.is_exception());
    EXPECT(too_large.exception().value().is_error_of_type(SimpleExceptionType::RangeError));

    EXPECT(!ReadableStream::construct_impl(realm, UnderlyingSource { .type = ReadableStreamType::Bytes, .auto_allocate_chunk_size = 1024 }).is_exception());
}

TEST_CASE(byte_streams_can_be_disabled)
{
    Settings settings;
    settings.set_byte_streams_enabled(false);
    Realm realm { test_gc_heap(), settings };

    auto stream = ReadableStream::construct_impl(realm, UnderlyingSource { .type = ReadableStreamType::Bytes });
    EXPECT(stream.is_exception());
    EXPECT(stream.exception().value().is_error_of_type(SimpleExceptionType::TypeError));

    // Default streams are unaffected.
    EXPECT(!ReadableStream::construct_impl(realm).is_exception());
}

TEST_CASE(default_reader_receives_enqueued_bytes)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto chunk = make_uint8_array(realm, "bytes"sv);
    MUST(controller->enqueue(chunk.as_array_buffer_view()));

    // The enqueued buffer has been transferred into the queue.
    EXPECT(chunk.as_array_buffer_view().viewed_array_buffer().is_detached());
    EXPECT_EQ(controller->queue_total_size(), 5.0);

    auto reader = MUST(stream->get_a_reader());
    auto read = reader->read();
    EXPECT(read->is_fulfilled());
    EXPECT(!read->result().done);
    EXPECT_EQ(read->result().value.as_array_buffer_view().type(), ArrayBufferViewType::Uint8Array);
    EXPECT_EQ(chunk_as_string_view(read->result().value), "bytes"sv);
}

TEST_CASE(enqueue_rejects_empty_chunks)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto result = controller->enqueue(create_view(realm, ArrayBufferViewType::Uint8Array, 0));
    EXPECT(result.is_exception());
    EXPECT(result.exception().value().is_error_of_type(SimpleExceptionType::TypeError));
    EXPECT(stream->is_readable());
}

TEST_CASE(byob_read_from_the_queue)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto chunk = make_uint8_array(realm, "hello world"sv);
    MUST(controller->enqueue(chunk.as_array_buffer_view()));

    auto reader = byob_reader_for(stream);
    auto view = create_view(realm, ArrayBufferViewType::Uint8Array, 5);
    auto read = reader->read(view);

    EXPECT(read->is_fulfilled());
    EXPECT_EQ(chunk_as_string_view(read->result().value), "hello"sv);
    EXPECT(view->viewed_array_buffer().is_detached());
    EXPECT_EQ(controller->queue_total_size(), 6.0);

    auto rest = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 16));
    EXPECT(rest->is_fulfilled());
    EXPECT_EQ(chunk_as_string_view(rest->result().value), " world"sv);
}

TEST_CASE(byob_read_is_answered_through_the_byob_request)
{
    Realm realm { test_gc_heap() };

    int pulls = 0;
    UnderlyingSource source {
        .pull = GC::create_function(realm.heap(), [&](ReadableStreamController controller) -> ExceptionOr<Value> {
            ++pulls;
            TRY(respond_with_bytes(controller.get<GC::Ref<ReadableByteStreamController>>(), "pulled"sv));
            return js_undefined();
        }),
        .type = ReadableStreamType::Bytes,
    };

    auto stream = MUST(ReadableStream::construct_impl(realm, source));
    auto reader = byob_reader_for(stream);
    realm.perform_a_microtask_checkpoint();
    EXPECT_EQ(pulls, 0);

    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 16));
    realm.perform_a_microtask_checkpoint();

    EXPECT_EQ(pulls, 1);
    EXPECT(read->is_fulfilled());
    EXPECT_EQ(read->result().value.as_array_buffer_view().byte_length(), 6u);
    EXPECT_EQ(chunk_as_string_view(read->result().value), "pulled"sv);
}

TEST_CASE(byob_read_waits_for_the_minimum_fill)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 6), { .min = 4 });

    MUST(controller->enqueue(make_uint8_array(realm, "ab"sv).as_array_buffer_view()));
    EXPECT(read->is_pending());

    MUST(controller->enqueue(make_uint8_array(realm, "cdef"sv).as_array_buffer_view()));
    EXPECT(read->is_fulfilled());
    EXPECT_EQ(chunk_as_string_view(read->result().value), "abcdef"sv);
}

TEST_CASE(byob_read_keeps_the_view_type)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    MUST(controller->enqueue(make_uint8_array(realm, "12345"sv).as_array_buffer_view()));

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint16Array, 4));

    // Only whole elements are handed out; the odd byte stays queued.
    EXPECT(read->is_fulfilled());
    auto& result = read->result().value.as_array_buffer_view();
    EXPECT_EQ(result.type(), ArrayBufferViewType::Uint16Array);
    EXPECT_EQ(result.length(), 2u);
    EXPECT_EQ(chunk_as_string_view(read->result().value), "1234"sv);
    EXPECT_EQ(controller->queue_total_size(), 1.0);
}

TEST_CASE(byob_read_argument_checks)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);
    auto reader = byob_reader_for(stream);

    auto empty_view = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 0));
    EXPECT(empty_view->is_rejected());
    EXPECT(empty_view->reason().is_error_of_type(SimpleExceptionType::TypeError));

    auto zero_min = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 4), { .min = 0 });
    EXPECT(zero_min->is_rejected());
    EXPECT(zero_min->reason().is_error_of_type(SimpleExceptionType::TypeError));

    auto min_too_large = reader->read(create_view(realm, ArrayBufferViewType::Uint16Array, 4), { .min = 5 });
    EXPECT(min_too_large->is_rejected());
    EXPECT(min_too_large->reason().is_error_of_type(SimpleExceptionType::RangeError));

    auto detached = create_view(realm, ArrayBufferViewType::Uint8Array, 4);
    detached->viewed_array_buffer().detach();
    auto detached_read = reader->read(detached);
    EXPECT(detached_read->is_rejected());
    EXPECT(detached_read->reason().is_error_of_type(SimpleExceptionType::TypeError));

    reader->release_lock();
    auto released = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 4));
    EXPECT(released->is_rejected());
    EXPECT(released->reason().is_error_of_type(SimpleExceptionType::TypeError));
}

TEST_CASE(close_resolves_a_pending_byob_read_with_an_empty_view)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 8));
    EXPECT(read->is_pending());

    MUST(stream->close());
    EXPECT(stream->is_closed());
    EXPECT(read->is_fulfilled());
    EXPECT(read->result().done);
    EXPECT_EQ(read->result().value.as_array_buffer_view().byte_length(), 0u);
}

TEST_CASE(close_with_a_partial_element_errors_the_stream)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint16Array, 2));

    MUST(controller->enqueue(make_uint8_array(realm, "x"sv).as_array_buffer_view()));
    EXPECT(read->is_pending());

    auto close = controller->close();
    EXPECT(close.is_exception());
    EXPECT(close.exception().value().is_error_of_type(SimpleExceptionType::TypeError));
    EXPECT(stream->is_errored());
    EXPECT(read->is_rejected());
}

TEST_CASE(reading_less_than_an_element_from_a_closing_stream_fails)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    MUST(controller->enqueue(make_uint8_array(realm, "x"sv).as_array_buffer_view()));
    MUST(controller->close());
    EXPECT(controller->close_requested());
    EXPECT(stream->is_readable());

    // The single queued byte cannot fill a whole Uint16Array element.
    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint16Array, 1));

    EXPECT(read->is_rejected());
    EXPECT(read->reason().is_error_of_type(SimpleExceptionType::TypeError));
    EXPECT_EQ(read->reason().as_error().message, "Cannot read from a stream that is closing"sv);
    EXPECT(stream->is_errored());
}

TEST_CASE(closing_after_a_partial_respond_fails)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint16Array, 1));

    // Half of the single element is filled, so the read stays pending.
    MUST(respond_with_bytes(controller, "x"sv));
    EXPECT(read->is_pending());
    EXPECT_EQ(controller->pending_pull_intos().first().bytes_filled, 1u);

    auto close = stream->close();
    EXPECT(close.is_exception());
    EXPECT(close.exception().value().is_error_of_type(SimpleExceptionType::TypeError));
    EXPECT(stream->is_errored());
    EXPECT(read->is_rejected());
    EXPECT(read->reason().is_error_of_type(SimpleExceptionType::TypeError));
}

TEST_CASE(respond_checks)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 4));

    auto request = controller->byob_request();
    EXPECT(request);
    EXPECT_EQ(request->view()->byte_length(), 4u);

    auto zero = request->respond(0);
    EXPECT(zero.is_exception());
    EXPECT(zero.exception().value().is_error_of_type(SimpleExceptionType::TypeError));

    auto overrun = request->respond(5);
    EXPECT(overrun.is_exception());
    EXPECT(overrun.exception().value().is_error_of_type(SimpleExceptionType::RangeError));

    MUST(respond_with_bytes(controller, "abcd"sv));
    EXPECT(read->is_fulfilled());

    // The answered request has been invalidated.
    EXPECT(!request->view());
    auto after_invalidation = request->respond(1);
    EXPECT(after_invalidation.is_exception());
    EXPECT(after_invalidation.exception().value().is_error_of_type(SimpleExceptionType::TypeError));
    EXPECT(!controller->byob_request());
}

TEST_CASE(respond_with_new_view)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 8));

    auto request = controller->byob_request();
    auto original = request->view();

    // Move the destination bytes to a buffer of the same size and answer with a view on it.
    auto transferred = MUST(transfer_array_buffer(realm, original->viewed_array_buffer()));
    "new"sv.bytes().copy_to(transferred->bytes());
    auto answer = MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, transferred, 0, 3));

    MUST(request->respond_with_new_view(answer));
    EXPECT(read->is_fulfilled());
    EXPECT_EQ(chunk_as_string_view(read->result().value), "new"sv);
}

TEST_CASE(auto_allocation_serves_default_readers)
{
    Realm realm { test_gc_heap() };

    GC::Ptr<ReadableStreamBYOBRequest> seen_request;
    UnderlyingSource source {
        .pull = GC::create_function(realm.heap(), [&](ReadableStreamController controller) -> ExceptionOr<Value> {
            auto& byte_controller = *controller.get<GC::Ref<ReadableByteStreamController>>();
            seen_request = byte_controller.byob_request();
            TRY(respond_with_bytes(byte_controller, "xyz"sv));
            return js_undefined();
        }),
        .type = ReadableStreamType::Bytes,
        .auto_allocate_chunk_size = 8,
    };

    auto stream = MUST(ReadableStream::construct_impl(realm, source));
    auto reader = MUST(stream->get_a_reader());
    realm.perform_a_microtask_checkpoint();

    auto read = reader->read();
    realm.perform_a_microtask_checkpoint();

    EXPECT(seen_request);
    EXPECT(read->is_fulfilled());
    EXPECT_EQ(read->result().value.as_array_buffer_view().type(), ArrayBufferViewType::Uint8Array);
    EXPECT_EQ(chunk_as_string_view(read->result().value), "xyz"sv);
}

TEST_CASE(releasing_a_byob_reader_rejects_pending_reads)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_byte_stream(realm);

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 4));
    EXPECT(read->is_pending());

    reader->release_lock();
    EXPECT(read->is_rejected());
    EXPECT(read->reason().is_error_of_type(SimpleExceptionType::TypeError));
    EXPECT(!stream->locked());

    // The pending pull-into is kept for the next reader.
    EXPECT_EQ(controller->pending_pull_intos().size_slow(), 1u);
}

TEST_CASE(cancel_a_byte_stream_with_a_pending_byob_read)
{
    Realm realm { test_gc_heap() };

    Optional<Value> cancel_reason;
    UnderlyingSource source {
        .cancel = GC::create_function(realm.heap(), [&](Value const& reason) -> ExceptionOr<Value> {
            cancel_reason = reason;
            return js_undefined();
        }),
        .type = ReadableStreamType::Bytes,
    };

    auto stream = MUST(ReadableStream::construct_impl(realm, source));
    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 4));

    auto cancel = reader->cancel("stop"_string);
    realm.perform_a_microtask_checkpoint();

    EXPECT(cancel->is_fulfilled());
    EXPECT(read->is_fulfilled());
    EXPECT(read->result().done);
    EXPECT(read->result().value.is_undefined());
    EXPECT(cancel_reason.has_value());
    EXPECT_EQ(*cancel_reason, Value { "stop"_string });
}

TEST_CASE(native_byte_stream)
{
    Realm realm { test_gc_heap() };

    auto stream = ReadableStream::create(realm);
    auto pull = GC::create_function(realm.heap(), [&]() -> GC::Ref<Promise<Value>> {
        if (auto view = stream->current_byob_request_view()) {
            "native"sv.bytes().copy_to(view->viewed_array_buffer().bytes().slice(view->byte_offset()));
            MUST(stream->enqueue(MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, view->viewed_array_buffer(), view->byte_offset(), 6))));
        }
        return create_resolved_promise(realm, js_undefined());
    });
    stream->set_up_with_byte_reading_support(pull);

    auto reader = byob_reader_for(stream);
    auto read = reader->read(create_view(realm, ArrayBufferViewType::Uint8Array, 10));
    realm.perform_a_microtask_checkpoint();

    EXPECT(read->is_fulfilled());
    EXPECT_EQ(chunk_as_string_view(read->result().value), "native"sv);
}
