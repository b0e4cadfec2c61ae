/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "TestHeap.h"
#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Realm.h>
#include <LibTest/TestCase.h>

using namespace Streams;

static bool is_exception_of_type(auto const& result, SimpleExceptionType type)
{
    return result.is_exception() && result.exception().value().is_error_of_type(type);
}

TEST_CASE(create_zeroed_buffer)
{
    Realm realm { test_gc_heap() };

    auto buffer = MUST(ArrayBuffer::create(realm, 16));
    EXPECT_EQ(buffer->byte_length(), 16u);
    EXPECT(!buffer->is_detached());

    for (auto byte : buffer->bytes())
        EXPECT_EQ(byte, 0);
}

TEST_CASE(view_element_sizes)
{
    EXPECT_EQ(element_size_of(ArrayBufferViewType::Int8Array), 1u);
    EXPECT_EQ(element_size_of(ArrayBufferViewType::Uint8ClampedArray), 1u);
    EXPECT_EQ(element_size_of(ArrayBufferViewType::Uint16Array), 2u);
    EXPECT_EQ(element_size_of(ArrayBufferViewType::Int32Array), 4u);
    EXPECT_EQ(element_size_of(ArrayBufferViewType::Float32Array), 4u);
    EXPECT_EQ(element_size_of(ArrayBufferViewType::Float64Array), 8u);
    EXPECT_EQ(element_size_of(ArrayBufferViewType::DataView), 1u);
    EXPECT_EQ(array_buffer_view_type_name(ArrayBufferViewType::Uint32Array), "Uint32Array"sv);
}

TEST_CASE(view_range_checks)
{
    Realm realm { test_gc_heap() };
    auto buffer = MUST(ArrayBuffer::create(realm, 8));

    EXPECT(is_exception_of_type(ArrayBufferView::create(realm, ArrayBufferViewType::Uint16Array, buffer, 1, 1), SimpleExceptionType::RangeError));
    EXPECT(is_exception_of_type(ArrayBufferView::create(realm, ArrayBufferViewType::Uint16Array, buffer, 0, 5), SimpleExceptionType::RangeError));
    EXPECT(is_exception_of_type(ArrayBufferView::create(realm, ArrayBufferViewType::Float64Array, buffer, 8, 1), SimpleExceptionType::RangeError));

    auto view = MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint16Array, buffer, 2, 3));
    EXPECT_EQ(view->byte_offset(), 2u);
    EXPECT_EQ(view->length(), 3u);
    EXPECT_EQ(view->byte_length(), 6u);
    EXPECT_EQ(&view->viewed_array_buffer(), buffer.ptr());

    auto odd_buffer = MUST(ArrayBuffer::create(realm, 7));
    EXPECT(is_exception_of_type(ArrayBufferView::create(realm, ArrayBufferViewType::Int32Array, odd_buffer), SimpleExceptionType::RangeError));
}

TEST_CASE(transfer_detaches_the_source)
{
    Realm realm { test_gc_heap() };

    auto chunk = make_uint8_array(realm, "abc"sv);
    auto& view = chunk.as_array_buffer_view();
    auto& buffer = view.viewed_array_buffer();

    auto transferred = MUST(transfer_array_buffer(realm, buffer));
    EXPECT_EQ(StringView { transferred->bytes() }, "abc"sv);

    EXPECT(buffer.is_detached());
    EXPECT_EQ(buffer.byte_length(), 0u);
    EXPECT_EQ(view.byte_length(), 0u);
    EXPECT_EQ(view.length(), 0u);
    EXPECT(!can_transfer_array_buffer(buffer));
    EXPECT(can_transfer_array_buffer(transferred));

    EXPECT(is_exception_of_type(transfer_array_buffer(realm, buffer), SimpleExceptionType::TypeError));
    EXPECT(is_exception_of_type(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, buffer, 0, 0), SimpleExceptionType::TypeError));
}

TEST_CASE(clone_copies_only_the_viewed_range)
{
    Realm realm { test_gc_heap() };

    auto source = make_uint8_array(realm, "streams"sv);
    auto window = MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, source.as_array_buffer_view().viewed_array_buffer(), 1, 4));

    auto clone = MUST(clone_as_uint8_array(realm, window));
    EXPECT_EQ(clone->byte_offset(), 0u);
    EXPECT_EQ(clone->byte_length(), 4u);
    EXPECT_EQ(StringView { clone->bytes() }, "trea"sv);
    EXPECT_NE(&clone->viewed_array_buffer(), &window->viewed_array_buffer());

    // Writing to the clone leaves the source alone.
    clone->viewed_array_buffer().bytes()[0] = 'T';
    EXPECT_EQ(chunk_as_string_view(source), "streams"sv);
}

TEST_CASE(copy_data_block_bytes_between_buffers)
{
    Realm realm { test_gc_heap() };

    auto source = ArrayBuffer::create(realm, MUST(ByteBuffer::copy("0123456789"sv.bytes())));
    auto destination = MUST(ArrayBuffer::create(realm, 6));
    destination->bytes().fill('.');

    copy_data_block_bytes(destination, 1, source, 3, 4);
    EXPECT_EQ(StringView { destination->bytes() }, ".3456."sv);
}

TEST_CASE(value_byte_length)
{
    Realm realm { test_gc_heap() };

    auto chunk = make_uint8_array(realm, "hello"sv);
    EXPECT_EQ(chunk.byte_length(), 5u);
    EXPECT_EQ(Value { chunk.as_array_buffer_view().viewed_array_buffer() }.byte_length(), 5u);
    EXPECT(!Value { 1.5 }.byte_length().has_value());
    EXPECT(!js_undefined().byte_length().has_value());
}
