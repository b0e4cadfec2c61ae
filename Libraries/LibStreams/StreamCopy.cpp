/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/String.h>
#include <LibStreams/ActivityLog.h>
#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Promise.h>
#include <LibStreams/ReadableByteStreamController.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamBYOBReader.h>
#include <LibStreams/ReadableStreamBYOBRequest.h>
#include <LibStreams/ReadableStreamDefaultReader.h>
#include <LibStreams/Realm.h>
#include <LibStreams/StreamCopy.h>

namespace Streams {

static SimpleException input_error(Error const& error)
{
    return SimpleException { SimpleExceptionType::TypeError, MUST(String::formatted("{}", error)) };
}

ExceptionOr<GC::Ref<ReadableStream>> create_readable_byte_stream_from(Realm& realm, AK::Stream& input, double high_water_mark)
{
    auto pull = GC::create_function(realm.heap(), [&realm, &input](ReadableStreamController controller) -> ExceptionOr<Value> {
        auto& byte_controller = *controller.get<GC::Ref<ReadableByteStreamController>>();

        // Pulls made to fill the queue up to the high water mark have no reader waiting, so they read into a new chunk.
        auto request = byte_controller.byob_request();
        if (!request) {
            auto chunk = TRY(ArrayBuffer::create(realm, realm.settings().chunk_size()));
            auto bytes_read = input.read_some(chunk->bytes());
            if (bytes_read.is_error())
                return input_error(bytes_read.error());

            if (bytes_read.value().is_empty()) {
                TRY(byte_controller.close());
                return js_undefined();
            }

            TRY(byte_controller.enqueue(TRY(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, chunk, 0, bytes_read.value().size()))));
            return js_undefined();
        }

        auto view = request->view();

        auto destination = view->viewed_array_buffer().bytes().slice(view->byte_offset(), view->byte_length());
        auto bytes_read = input.read_some(destination);
        if (bytes_read.is_error())
            return input_error(bytes_read.error());

        if (bytes_read.value().is_empty()) {
            TRY(byte_controller.close());
            TRY(request->respond(0));
            return js_undefined();
        }

        TRY(request->respond(bytes_read.value().size()));
        return js_undefined();
    });

    UnderlyingSource source {
        .pull = pull,
        .type = ReadableStreamType::Bytes,
        .auto_allocate_chunk_size = realm.settings().chunk_size(),
    };
    return ReadableStream::construct_impl(realm, source, { .high_water_mark = high_water_mark });
}

static ErrorOr<void> settle_read(Realm& realm, ReadableStream& stream, GC::Ref<Promise<ReadResult>> read)
{
    realm.perform_a_microtask_checkpoint();

    if (read->is_rejected()) {
        dbgln("Reading from stream {:p} failed: {}", &stream, read->reason());
        return Error::from_string_literal("Reading from the stream failed");
    }
    if (read->is_pending())
        return Error::from_string_literal("The stream stopped producing data");
    return {};
}

ErrorOr<CopyStatistics> copy_readable_byte_stream(Realm& realm, ReadableStream& stream, AK::Stream& output, bool use_byob_reader)
{
    CopyStatistics statistics;

    auto write_chunk = [&](Value const& chunk) -> ErrorOr<void> {
        auto bytes = chunk.as_array_buffer_view().bytes();
        TRY(output.write_until_depleted(bytes));
        ++statistics.chunks;
        statistics.bytes += bytes.size();
        return {};
    };

    if (use_byob_reader) {
        auto reader = stream.get_reader({ .mode = ReadableStreamReaderMode::Byob });
        if (reader.is_exception())
            return Error::from_string_literal("Cannot get a BYOB reader for the stream");
        auto byob_reader = reader.release_value().get<GC::Ref<ReadableStreamBYOBReader>>();

        for (;;) {
            auto buffer = ArrayBuffer::create(realm, realm.settings().chunk_size());
            if (buffer.is_exception())
                return Error::from_errno(ENOMEM);
            auto view = MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, buffer.value()));

            auto read = byob_reader->read(view);
            TRY(settle_read(realm, stream, read));
            if (read->result().done)
                break;
            TRY(write_chunk(read->result().value));
        }
    } else {
        auto reader = stream.get_a_reader();
        if (reader.is_exception())
            return Error::from_string_literal("Cannot get a reader for the stream");
        auto default_reader = reader.release_value();

        for (;;) {
            auto read = default_reader->read();
            TRY(settle_read(realm, stream, read));
            if (read->result().done)
                break;
            TRY(write_chunk(read->result().value));
        }
    }

    log_stream_activity(realm, "Copied {} bytes in {} chunks from stream {:p}", statistics.bytes, statistics.chunks, &stream);
    return statistics;
}

}
