/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "TestHeap.h"
#include <AK/ByteBuffer.h>
#include <AK/MemoryStream.h>
#include <LibStreams/ReadableByteStreamController.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/Realm.h>
#include <LibStreams/Settings.h>
#include <LibStreams/StreamCopy.h>
#include <LibTest/TestCase.h>

using namespace Streams;

static constexpr auto contents = "The quick brown fox jumps over the lazy dog"sv;

static Settings settings_with_chunk_size(size_t chunk_size)
{
    Settings settings;
    settings.set_chunk_size(chunk_size);
    return settings;
}

static ByteBuffer copy_through_stream(Realm& realm, StringView input_bytes, bool use_byob_reader, CopyStatistics& statistics)
{
    FixedMemoryStream input { input_bytes.bytes() };
    AllocatingMemoryStream output;

    auto stream = MUST(create_readable_byte_stream_from(realm, input));
    statistics = MUST(copy_readable_byte_stream(realm, stream, output, use_byob_reader));
    EXPECT(stream->is_closed());

    return MUST(output.read_until_eof());
}

TEST_CASE(copy_with_a_default_reader)
{
    Realm realm { test_gc_heap(), settings_with_chunk_size(8) };

    CopyStatistics statistics;
    auto output = copy_through_stream(realm, contents, false, statistics);

    EXPECT_EQ(StringView { output }, contents);
    EXPECT_EQ(statistics.bytes, contents.length());
    EXPECT_EQ(statistics.chunks, 6u);
}

TEST_CASE(copy_with_a_byob_reader)
{
    Realm realm { test_gc_heap(), settings_with_chunk_size(8) };

    CopyStatistics statistics;
    auto output = copy_through_stream(realm, contents, true, statistics);

    EXPECT_EQ(StringView { output }, contents);
    EXPECT_EQ(statistics.bytes, contents.length());
    EXPECT_EQ(statistics.chunks, 6u);
}

TEST_CASE(copy_a_chunk_larger_than_the_input)
{
    Realm realm { test_gc_heap() };

    CopyStatistics statistics;
    auto output = copy_through_stream(realm, contents, true, statistics);

    EXPECT_EQ(StringView { output }, contents);
    EXPECT_EQ(statistics.chunks, 1u);
}

TEST_CASE(copy_empty_input)
{
    for (auto use_byob_reader : { false, true }) {
        Realm realm { test_gc_heap() };

        CopyStatistics statistics;
        auto output = copy_through_stream(realm, ""sv, use_byob_reader, statistics);

        EXPECT(output.is_empty());
        EXPECT_EQ(statistics.bytes, 0u);
        EXPECT_EQ(statistics.chunks, 0u);
    }
}

TEST_CASE(high_water_mark_reads_ahead)
{
    Realm realm { test_gc_heap(), settings_with_chunk_size(4) };

    FixedMemoryStream input { "0123456789"sv.bytes() };
    AllocatingMemoryStream output;

    auto stream = MUST(create_readable_byte_stream_from(realm, input, 8));
    realm.perform_a_microtask_checkpoint();

    // Two chunks are read before any reader exists.
    auto& controller = *stream->controller()->get<GC::Ref<ReadableByteStreamController>>();
    EXPECT_EQ(controller.queue_total_size(), 8.0);
    EXPECT_EQ(input.remaining(), 2u);

    auto statistics = MUST(copy_readable_byte_stream(realm, stream, output, false));
    EXPECT_EQ(StringView { MUST(output.read_until_eof()) }, "0123456789"sv);
    EXPECT_EQ(statistics.bytes, 10u);
    EXPECT_EQ(statistics.chunks, 3u);
}

TEST_CASE(copy_a_locked_stream)
{
    Realm realm { test_gc_heap() };

    FixedMemoryStream input { contents.bytes() };
    AllocatingMemoryStream output;

    auto stream = MUST(create_readable_byte_stream_from(realm, input));
    auto reader = MUST(stream->get_a_reader());

    EXPECT(copy_readable_byte_stream(realm, stream, output, false).is_error());
    EXPECT(copy_readable_byte_stream(realm, stream, output, true).is_error());
    EXPECT_EQ(input.remaining(), contents.length());
}
