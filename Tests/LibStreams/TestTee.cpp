/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "TestHeap.h"
#include <AK/Vector.h>
#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Promise.h>
#include <LibStreams/ReadableByteStreamController.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamBYOBReader.h>
#include <LibStreams/ReadableStreamDefaultController.h>
#include <LibStreams/ReadableStreamBYOBRequest.h>
#include <LibStreams/ReadableStreamDefaultReader.h>
#include <LibStreams/ReadableStreamOperations.h>
#include <LibStreams/Realm.h>
#include <LibTest/TestCase.h>

using namespace Streams;

struct TeeSource {
    GC::Ref<ReadableStream> stream;
    ReadableStreamController controller;
};

static TeeSource create_source(Realm& realm, Optional<ReadableStreamType> type = {}, GC::Ptr<UnderlyingSourceCancelCallback> cancel = {})
{
    Optional<ReadableStreamController> controller;

    UnderlyingSource source {
        .start = GC::create_function(realm.heap(), [&controller](ReadableStreamController stream_controller) -> ExceptionOr<Value> {
            controller = stream_controller;
            return js_undefined();
        }),
        .cancel = cancel,
        .type = type,
    };

    auto stream = MUST(ReadableStream::construct_impl(realm, source));
    realm.perform_a_microtask_checkpoint();
    return { stream, controller.release_value() };
}

// Reads string chunks until the stream is done, running microtasks between reads.
static Vector<String> read_all_strings(Realm& realm, ReadableStream& stream)
{
    auto reader = MUST(stream.get_a_reader());
    Vector<String> chunks;

    for (;;) {
        auto read = reader->read();
        realm.perform_a_microtask_checkpoint();

        VERIFY(read->is_fulfilled());
        if (read->result().done)
            break;
        chunks.append(read->result().value.as_string());
    }
    return chunks;
}

TEST_CASE(both_branches_see_every_chunk)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_source(realm);

    auto& default_controller = *controller.get<GC::Ref<ReadableStreamDefaultController>>();
    MUST(default_controller.enqueue("one"_string));
    MUST(default_controller.enqueue("two"_string));
    MUST(default_controller.close());

    auto branches = MUST(stream->tee());
    EXPECT(stream->locked());
    EXPECT(!branches[0]->has_byte_controller());
    EXPECT(!branches[1]->has_byte_controller());

    auto first = read_all_strings(realm, branches[0]);
    auto second = read_all_strings(realm, branches[1]);

    EXPECT_EQ(first, (Vector<String> { "one"_string, "two"_string }));
    EXPECT_EQ(second, (Vector<String> { "one"_string, "two"_string }));
    EXPECT(branches[0]->is_closed());
    EXPECT(branches[1]->is_closed());
}

TEST_CASE(a_slow_branch_does_not_hold_back_the_other)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_source(realm);
    auto& default_controller = *controller.get<GC::Ref<ReadableStreamDefaultController>>();

    auto branches = MUST(stream->tee());
    auto fast_reader = MUST(branches[0]->get_a_reader());

    for (auto chunk : { "a"_string, "b"_string, "c"_string }) {
        MUST(default_controller.enqueue(chunk));
        auto read = fast_reader->read();
        realm.perform_a_microtask_checkpoint();
        EXPECT(read->is_fulfilled());
        EXPECT_EQ(read->result().value, Value { chunk });
    }

    // The unread branch has queued everything the fast branch consumed.
    auto& slow_controller = *branches[1]->controller()->get<GC::Ref<ReadableStreamDefaultController>>();
    EXPECT_EQ(slow_controller.queue_total_size(), 3.0);
}

TEST_CASE(tee_a_locked_stream)
{
    Realm realm { test_gc_heap() };

    auto stream = MUST(ReadableStream::construct_impl(realm));
    auto reader = MUST(stream->get_a_reader());

    auto branches = stream->tee();
    EXPECT(branches.is_exception());
    EXPECT(branches.exception().value().is_error_of_type(SimpleExceptionType::TypeError));
}

TEST_CASE(cancelling_both_branches_cancels_the_source)
{
    Realm realm { test_gc_heap() };

    Optional<Value> cancel_reason;
    auto cancel = GC::create_function(realm.heap(), [&](Value const& reason) -> ExceptionOr<Value> {
        cancel_reason = reason;
        return js_undefined();
    });
    auto [stream, controller] = create_source(realm, {}, cancel);

    auto branches = MUST(stream->tee());

    auto first_cancel = branches[0]->cancel("first"_string);
    realm.perform_a_microtask_checkpoint();
    EXPECT(first_cancel->is_pending());
    EXPECT(!cancel_reason.has_value());

    auto second_cancel = branches[1]->cancel("second"_string);
    realm.perform_a_microtask_checkpoint();

    EXPECT(first_cancel->is_fulfilled());
    EXPECT(second_cancel->is_fulfilled());
    EXPECT(cancel_reason.has_value());
    EXPECT(cancel_reason->is_array());

    auto& reasons = cancel_reason->as_array();
    EXPECT_EQ(reasons.size(), 2u);
    EXPECT_EQ(reasons.at(0), Value { "first"_string });
    EXPECT_EQ(reasons.at(1), Value { "second"_string });
}

TEST_CASE(a_source_error_errors_both_branches)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_source(realm);

    auto branches = MUST(stream->tee());
    auto reader = MUST(branches[1]->get_a_reader());
    auto read = reader->read();
    realm.perform_a_microtask_checkpoint();
    EXPECT(read->is_pending());

    controller.get<GC::Ref<ReadableStreamDefaultController>>()->error("broken"_string);
    realm.perform_a_microtask_checkpoint();

    for (auto& branch : branches) {
        EXPECT(branch->is_errored());
        EXPECT_EQ(branch->stored_error(), Value { "broken"_string });
    }
    EXPECT(read->is_rejected());
    EXPECT_EQ(read->reason(), Value { "broken"_string });
}

TEST_CASE(byte_stream_tee_clones_chunks_for_the_second_branch)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_source(realm, ReadableStreamType::Bytes);
    auto& byte_controller = *controller.get<GC::Ref<ReadableByteStreamController>>();

    auto branches = MUST(stream->tee());
    EXPECT(branches[0]->has_byte_controller());
    EXPECT(branches[1]->has_byte_controller());
    realm.perform_a_microtask_checkpoint();

    MUST(byte_controller.enqueue(make_uint8_array(realm, "bytes"sv).as_array_buffer_view()));

    auto first_reader = MUST(branches[0]->get_a_reader());
    auto first_read = first_reader->read();
    realm.perform_a_microtask_checkpoint();

    EXPECT(first_read->is_fulfilled());
    EXPECT_EQ(chunk_as_string_view(first_read->result().value), "bytes"sv);

    auto second_reader = MUST(branches[1]->get_reader({ .mode = ReadableStreamReaderMode::Byob })).get<GC::Ref<ReadableStreamBYOBReader>>();
    auto buffer = MUST(ArrayBuffer::create(realm, 3));
    auto second_read = second_reader->read(MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, buffer)));
    realm.perform_a_microtask_checkpoint();

    EXPECT(second_read->is_fulfilled());
    EXPECT_EQ(chunk_as_string_view(second_read->result().value), "byt"sv);

    auto& first_chunk = first_read->result().value.as_array_buffer_view();
    auto& second_chunk = second_read->result().value.as_array_buffer_view();
    EXPECT_NE(&first_chunk.viewed_array_buffer(), &second_chunk.viewed_array_buffer());
}

TEST_CASE(byte_stream_tee_closes_both_branches)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_source(realm, ReadableStreamType::Bytes);

    auto branches = MUST(stream->tee());
    realm.perform_a_microtask_checkpoint();

    auto reader = MUST(branches[0]->get_a_reader());
    auto read = reader->read();
    realm.perform_a_microtask_checkpoint();
    EXPECT(read->is_pending());

    MUST(controller.get<GC::Ref<ReadableByteStreamController>>()->close());
    realm.perform_a_microtask_checkpoint();

    EXPECT(read->is_fulfilled());
    EXPECT(read->result().done);
    EXPECT(branches[0]->is_closed());
    EXPECT(branches[1]->is_closed());
}

TEST_CASE(cloning_tee_gives_the_second_branch_its_own_copy)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_source(realm);

    auto branches = MUST(readable_stream_tee(realm, stream, true));
    auto chunk = make_uint8_array(realm, "shared"sv);
    MUST(controller.get<GC::Ref<ReadableStreamDefaultController>>()->enqueue(chunk));
    realm.perform_a_microtask_checkpoint();

    auto first_reader = MUST(branches[0]->get_a_reader());
    auto second_reader = MUST(branches[1]->get_a_reader());
    auto first_read = first_reader->read();
    auto second_read = second_reader->read();
    realm.perform_a_microtask_checkpoint();

    EXPECT(first_read->is_fulfilled());
    EXPECT(second_read->is_fulfilled());

    auto& first_chunk = first_read->result().value.as_array_buffer_view();
    auto& second_chunk = second_read->result().value.as_array_buffer_view();
    EXPECT_EQ(&first_chunk, &chunk.as_array_buffer_view());
    EXPECT_NE(&first_chunk.viewed_array_buffer(), &second_chunk.viewed_array_buffer());
    EXPECT_EQ(second_chunk.type(), ArrayBufferViewType::Uint8Array);
    EXPECT_EQ(chunk_as_string_view(second_read->result().value), "shared"sv);
}

TEST_CASE(a_chunk_that_cannot_be_cloned_errors_both_branches)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_source(realm);

    auto branches = MUST(readable_stream_tee(realm, stream, true));
    auto chunk = make_uint8_array(realm, "gone"sv);
    chunk.as_array_buffer_view().viewed_array_buffer().detach();
    MUST(controller.get<GC::Ref<ReadableStreamDefaultController>>()->enqueue(chunk));
    realm.perform_a_microtask_checkpoint();

    for (auto& branch : branches) {
        EXPECT(branch->is_errored());
        EXPECT(branch->stored_error().is_error_of_type(SimpleExceptionType::TypeError));
    }
    EXPECT(stream->is_closed());
}

// Issues a BYOB read on one branch of a byte stream tee and has the source fill it through its own BYOB request.
static void expect_byob_read_is_forwarded_to_the_source(size_t byob_branch_index)
{
    Realm realm { test_gc_heap() };

    Optional<size_t> requested_length;
    UnderlyingSource source {
        .pull = GC::create_function(realm.heap(), [&requested_length](ReadableStreamController controller) -> ExceptionOr<Value> {
            auto request = controller.get<GC::Ref<ReadableByteStreamController>>()->byob_request();
            if (!request)
                return js_undefined();

            auto view = request->view();
            requested_length = view->byte_length();
            "forwarded"sv.bytes().copy_to(view->viewed_array_buffer().bytes().slice(view->byte_offset()));
            TRY(request->respond(9));
            return js_undefined();
        }),
        .type = ReadableStreamType::Bytes,
    };
    auto stream = MUST(ReadableStream::construct_impl(realm, source));

    auto branches = MUST(stream->tee());
    realm.perform_a_microtask_checkpoint();

    auto& byob_branch = branches[byob_branch_index];
    auto& other_branch = branches[1 - byob_branch_index];

    auto reader = MUST(byob_branch->get_reader({ .mode = ReadableStreamReaderMode::Byob })).get<GC::Ref<ReadableStreamBYOBReader>>();
    auto buffer = MUST(ArrayBuffer::create(realm, 16));
    auto read = reader->read(MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, buffer)));
    realm.perform_a_microtask_checkpoint();

    EXPECT(requested_length.has_value());
    EXPECT_EQ(*requested_length, 16u);
    EXPECT(buffer->is_detached());

    EXPECT(read->is_fulfilled());
    EXPECT(!read->result().done);
    EXPECT_EQ(chunk_as_string_view(read->result().value), "forwarded"sv);
    auto& byob_chunk = read->result().value.as_array_buffer_view();
    EXPECT_EQ(byob_chunk.byte_offset(), 0u);
    EXPECT_EQ(byob_chunk.viewed_array_buffer().byte_length(), 16u);

    auto other_reader = MUST(other_branch->get_a_reader());
    auto other_read = other_reader->read();
    realm.perform_a_microtask_checkpoint();

    EXPECT(other_read->is_fulfilled());
    EXPECT_EQ(chunk_as_string_view(other_read->result().value), "forwarded"sv);
    EXPECT_NE(&other_read->result().value.as_array_buffer_view().viewed_array_buffer(), &byob_chunk.viewed_array_buffer());
}

TEST_CASE(byte_stream_tee_forwards_byob_reads_from_the_first_branch)
{
    expect_byob_read_is_forwarded_to_the_source(0);
}

TEST_CASE(byte_stream_tee_forwards_byob_reads_from_the_second_branch)
{
    expect_byob_read_is_forwarded_to_the_source(1);
}

TEST_CASE(byte_stream_tee_forwards_source_errors_after_switching_readers)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_source(realm, ReadableStreamType::Bytes);

    auto branches = MUST(stream->tee());
    realm.perform_a_microtask_checkpoint();

    // The BYOB read switches the tee over to a BYOB reader on the source, which then waits for data.
    auto reader = MUST(branches[0]->get_reader({ .mode = ReadableStreamReaderMode::Byob })).get<GC::Ref<ReadableStreamBYOBReader>>();
    auto buffer = MUST(ArrayBuffer::create(realm, 4));
    auto read = reader->read(MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, buffer)));
    realm.perform_a_microtask_checkpoint();
    EXPECT(read->is_pending());

    controller.get<GC::Ref<ReadableByteStreamController>>()->error("broken"_string);
    realm.perform_a_microtask_checkpoint();

    for (auto& branch : branches) {
        EXPECT(branch->is_errored());
        EXPECT_EQ(branch->stored_error(), Value { "broken"_string });
    }
    EXPECT(read->is_rejected());
    EXPECT_EQ(read->reason(), Value { "broken"_string });
}
