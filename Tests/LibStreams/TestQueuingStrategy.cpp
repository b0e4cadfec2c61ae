/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "TestHeap.h"
#include <AK/Math.h>
#include <LibStreams/QueueOperations.h>
#include <LibStreams/QueuingStrategy.h>
#include <LibStreams/Realm.h>
#include <LibTest/TestCase.h>

using namespace Streams;

namespace {

class TestQueue {
public:
    SinglyLinkedList<ValueWithSize>& queue() { return m_queue; }

    double queue_total_size() const { return m_queue_total_size; }
    void set_queue_total_size(double size) { m_queue_total_size = size; }

private:
    SinglyLinkedList<ValueWithSize> m_queue;
    double m_queue_total_size { 0 };
};

}

TEST_CASE(high_water_mark_defaults)
{
    EXPECT_EQ(MUST(extract_high_water_mark({}, 1)), 1.0);
    EXPECT_EQ(MUST(extract_high_water_mark({}, 0)), 0.0);
    EXPECT_EQ(MUST(extract_high_water_mark({ .high_water_mark = 16 }, 1)), 16.0);
    EXPECT_EQ(MUST(extract_high_water_mark({ .high_water_mark = AK::Infinity<double> }, 1)), AK::Infinity<double>);
}

TEST_CASE(invalid_high_water_marks)
{
    auto negative = extract_high_water_mark({ .high_water_mark = -1 }, 1);
    EXPECT(negative.is_exception());
    EXPECT(negative.exception().value().is_error_of_type(SimpleExceptionType::RangeError));

    auto not_a_number = extract_high_water_mark({ .high_water_mark = AK::NaN<double> }, 1);
    EXPECT(not_a_number.is_exception());
    EXPECT(not_a_number.exception().value().is_error_of_type(SimpleExceptionType::RangeError));
}

TEST_CASE(default_size_algorithm_counts_chunks)
{
    Realm realm { test_gc_heap() };

    auto size = extract_size_algorithm(realm, {});
    EXPECT_EQ(MUST(size->function()("chunk"_string)), 1.0);
    EXPECT_EQ(MUST(size->function()(make_uint8_array(realm, "four"sv))), 1.0);
}

TEST_CASE(count_queuing_strategy)
{
    Realm realm { test_gc_heap() };

    auto strategy = CountQueuingStrategy::construct_impl(realm, { .high_water_mark = 3 });
    EXPECT_EQ(strategy->high_water_mark(), 3.0);
    EXPECT_EQ(MUST(strategy->size()->function()(make_uint8_array(realm, "ignored"sv))), 1.0);

    auto as_strategy = strategy->as_queuing_strategy();
    EXPECT_EQ(as_strategy.high_water_mark, 3.0);
    EXPECT_EQ(as_strategy.size.ptr(), strategy->size().ptr());
}

TEST_CASE(byte_length_queuing_strategy)
{
    Realm realm { test_gc_heap() };

    auto strategy = ByteLengthQueuingStrategy::construct_impl(realm, { .high_water_mark = 1024 });
    EXPECT_EQ(strategy->high_water_mark(), 1024.0);
    EXPECT_EQ(MUST(strategy->size()->function()(make_uint8_array(realm, "twelve bytes"sv))), 12.0);

    auto not_a_buffer = strategy->size()->function()(7);
    EXPECT(not_a_buffer.is_exception());
    EXPECT(not_a_buffer.exception().value().is_error_of_type(SimpleExceptionType::TypeError));
}

TEST_CASE(queue_with_sizes)
{
    TestQueue queue;

    MUST(enqueue_value_with_size(queue, "a"_string, 2));
    MUST(enqueue_value_with_size(queue, "b"_string, 0.5));
    EXPECT_EQ(queue.queue_total_size(), 2.5);
    EXPECT_EQ(peek_queue_value(queue), Value { "a"_string });

    EXPECT_EQ(dequeue_value(queue), Value { "a"_string });
    EXPECT_EQ(queue.queue_total_size(), 0.5);

    reset_queue(queue);
    EXPECT(queue.queue().is_empty());
    EXPECT_EQ(queue.queue_total_size(), 0.0);
}

TEST_CASE(queue_rejects_invalid_sizes)
{
    TestQueue queue;

    for (auto size : { -1.0, AK::NaN<double>, AK::Infinity<double> }) {
        auto result = enqueue_value_with_size(queue, js_undefined(), size);
        EXPECT(result.is_exception());
        EXPECT(result.exception().value().is_error_of_type(SimpleExceptionType::RangeError));
    }

    EXPECT(queue.queue().is_empty());
}

TEST_CASE(queue_total_size_never_goes_negative)
{
    TestQueue queue;

    MUST(enqueue_value_with_size(queue, 1, 0.1));
    queue.set_queue_total_size(0.05);

    (void)dequeue_value(queue);
    EXPECT_EQ(queue.queue_total_size(), 0.0);
}
