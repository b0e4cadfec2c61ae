/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "TestHeap.h"
#include <LibStreams/Promise.h>
#include <LibStreams/QueuingStrategy.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamDefaultController.h>
#include <LibStreams/ReadableStreamDefaultReader.h>
#include <LibStreams/ReadableStreamOperations.h>
#include <LibStreams/Realm.h>
#include <LibTest/TestCase.h>

using namespace Streams;

struct ControlledStream {
    GC::Ref<ReadableStream> stream;
    GC::Ref<ReadableStreamDefaultController> controller;
};

static ControlledStream create_controlled_stream(Realm& realm, QueuingStrategy const& strategy = {})
{
    GC::Ptr<ReadableStreamDefaultController> controller;

    UnderlyingSource source {
        .start = GC::create_function(realm.heap(), [&controller](ReadableStreamController stream_controller) -> ExceptionOr<Value> {
            controller = stream_controller.get<GC::Ref<ReadableStreamDefaultController>>();
            return js_undefined();
        }),
    };

    auto stream = MUST(ReadableStream::construct_impl(realm, source, strategy));
    realm.perform_a_microtask_checkpoint();
    return { stream, *controller };
}

TEST_CASE(desired_size_tracks_the_queue)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_controlled_stream(realm, { .high_water_mark = 4 });

    EXPECT_EQ(controller->desired_size(), 4.0);

    MUST(controller->enqueue(1));
    MUST(controller->enqueue(2));
    EXPECT_EQ(controller->desired_size(), 2.0);

    for (int i = 3; i <= 6; ++i)
        MUST(controller->enqueue(i));
    EXPECT_EQ(controller->desired_size(), -2.0);
    EXPECT(readable_stream_default_controller_has_backpressure(controller));

    auto reader = MUST(stream->get_a_reader());
    (void)reader->read();
    EXPECT_EQ(controller->desired_size(), -1.0);
}

TEST_CASE(desired_size_after_close_and_error)
{
    Realm realm { test_gc_heap() };

    auto closed = create_controlled_stream(realm);
    MUST(closed.controller->close());
    EXPECT(closed.stream->is_closed());
    EXPECT_EQ(closed.controller->desired_size(), 0.0);

    auto errored = create_controlled_stream(realm);
    errored.controller->error("failed"_string);
    EXPECT(errored.stream->is_errored());
    EXPECT(!errored.controller->desired_size().has_value());
}

TEST_CASE(close_with_queued_chunks_waits_for_them_to_drain)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_controlled_stream(realm);

    MUST(controller->enqueue("last"_string));
    MUST(controller->close());
    EXPECT(controller->close_requested());
    EXPECT(stream->is_readable());

    auto reader = MUST(stream->get_a_reader());
    auto read = reader->read();
    EXPECT(read->is_fulfilled());
    EXPECT_EQ(read->result().value, Value { "last"_string });
    EXPECT(stream->is_closed());
}

TEST_CASE(close_or_enqueue_after_close_throws)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_controlled_stream(realm);

    MUST(controller->enqueue(1));
    MUST(controller->close());

    auto second_close = controller->close();
    EXPECT(second_close.is_exception());
    EXPECT(second_close.exception().value().is_error_of_type(SimpleExceptionType::TypeError));

    auto enqueue = controller->enqueue(2);
    EXPECT(enqueue.is_exception());
    EXPECT(enqueue.exception().value().is_error_of_type(SimpleExceptionType::TypeError));
}

TEST_CASE(enqueue_after_error_throws)
{
    Realm realm { test_gc_heap() };
    auto [stream, controller] = create_controlled_stream(realm);

    controller->error("failed"_string);

    auto enqueue = controller->enqueue(1);
    EXPECT(enqueue.is_exception());
    EXPECT(enqueue.exception().value().is_error_of_type(SimpleExceptionType::TypeError));

    // A second error is ignored and the first one is kept.
    controller->error("ignored"_string);
    EXPECT_EQ(stream->stored_error(), Value { "failed"_string });
}

TEST_CASE(throwing_size_algorithm_errors_the_stream)
{
    Realm realm { test_gc_heap() };

    QueuingStrategy strategy {
        .high_water_mark = 10,
        .size = GC::create_function(realm.heap(), [](Value const& chunk) -> ExceptionOr<double> {
            if (chunk.is_string())
                return SimpleException { SimpleExceptionType::TypeError, "strings have no size"sv };
            return chunk.as_double();
        }),
    };
    auto [stream, controller] = create_controlled_stream(realm, strategy);

    MUST(controller->enqueue(3));
    EXPECT_EQ(controller->desired_size(), 7.0);

    auto result = controller->enqueue("text"_string);
    EXPECT(result.is_exception());
    EXPECT_EQ(result.exception().value().as_error().message, "strings have no size"sv);
    EXPECT(stream->is_errored());
    EXPECT(controller->queue().is_empty());
}

TEST_CASE(invalid_chunk_size_errors_the_stream)
{
    Realm realm { test_gc_heap() };

    QueuingStrategy strategy {
        .size = GC::create_function(realm.heap(), [](Value const& chunk) -> ExceptionOr<double> {
            return chunk.as_double();
        }),
    };
    auto [stream, controller] = create_controlled_stream(realm, strategy);

    auto result = controller->enqueue(-1);
    EXPECT(result.is_exception());
    EXPECT(result.exception().value().is_error_of_type(SimpleExceptionType::RangeError));
    EXPECT(stream->is_errored());
}

TEST_CASE(count_strategy_as_stream_strategy)
{
    Realm realm { test_gc_heap() };

    auto count = CountQueuingStrategy::construct_impl(realm, { .high_water_mark = 2 });
    auto [stream, controller] = create_controlled_stream(realm, count->as_queuing_strategy());

    EXPECT_EQ(controller->strategy_hwm(), 2.0);
    MUST(controller->enqueue("one"_string));
    EXPECT_EQ(controller->desired_size(), 1.0);
}

TEST_CASE(pull_calls_are_not_reentrant)
{
    Realm realm { test_gc_heap() };

    int pulls = 0;
    GC::Ptr<Promise<Value>> pending_pull;
    UnderlyingSource source {
        .pull = GC::create_function(realm.heap(), [&](ReadableStreamController) -> ExceptionOr<Value> {
            ++pulls;
            pending_pull = create_promise(realm);
            return Value { GC::Ref { *pending_pull } };
        }),
    };

    auto stream = MUST(ReadableStream::construct_impl(realm, source, { .high_water_mark = 0 }));
    auto& controller = *stream->controller()->get<GC::Ref<ReadableStreamDefaultController>>();
    auto reader = MUST(stream->get_a_reader());
    realm.perform_a_microtask_checkpoint();

    (void)reader->read();
    (void)reader->read();
    realm.perform_a_microtask_checkpoint();

    EXPECT_EQ(pulls, 1);
    EXPECT(controller.pulling());
    EXPECT(controller.pull_again());

    // Finishing the first pull starts the one that was asked for while it ran.
    resolve_promise(*pending_pull);
    realm.perform_a_microtask_checkpoint();
    EXPECT_EQ(pulls, 2);
}
