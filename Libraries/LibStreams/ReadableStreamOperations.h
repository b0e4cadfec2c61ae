/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Optional.h>
#include <AK/Vector.h>
#include <LibStreams/Algorithms.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>
#include <LibStreams/ReadableByteStreamController.h>
#include <LibStreams/ReadableStream.h>

namespace Streams {

// Working with readable streams
// https://streams.spec.whatwg.org/#rs-abstract-ops-used-by-other-specs
ExceptionOr<GC::Ref<ReadableStreamDefaultReader>> acquire_readable_stream_default_reader(ReadableStream&);
ExceptionOr<GC::Ref<ReadableStreamBYOBReader>> acquire_readable_stream_byob_reader(ReadableStream&);
ExceptionOr<GC::Ref<ReadableStream>> create_readable_stream(Realm&, GC::Ref<StartAlgorithm>, GC::Ref<PullAlgorithm>, GC::Ref<CancelAlgorithm>, Optional<double> high_water_mark = {}, GC::Ptr<SizeAlgorithm> size_algorithm = {});
ExceptionOr<GC::Ref<ReadableStream>> create_readable_byte_stream(Realm&, GC::Ref<StartAlgorithm>, GC::Ref<PullAlgorithm>, GC::Ref<CancelAlgorithm>);
void initialize_readable_stream(ReadableStream&);
bool is_readable_stream_locked(ReadableStream const&);
ExceptionOr<ReadableStreamPair> readable_stream_tee(Realm&, ReadableStream&, bool clone_for_branch2);
ExceptionOr<ReadableStreamPair> readable_stream_default_tee(Realm&, ReadableStream&, bool clone_for_branch2);
ExceptionOr<ReadableStreamPair> readable_byte_stream_tee(Realm&, ReadableStream&);

// Interfacing with controllers
// https://streams.spec.whatwg.org/#rs-abstract-ops-used-by-controllers
void readable_stream_add_read_into_request(ReadableStream&, GC::Ref<ReadIntoRequest>);
void readable_stream_add_read_request(ReadableStream&, GC::Ref<ReadRequest>);
GC::Ref<Promise<Value>> readable_stream_cancel(ReadableStream&, Value reason);
void readable_stream_close(ReadableStream&);
void readable_stream_error(ReadableStream&, Value error);
void readable_stream_fulfill_read_into_request(ReadableStream&, Value chunk, bool done);
void readable_stream_fulfill_read_request(ReadableStream&, Value chunk, bool done);
size_t readable_stream_get_num_read_into_requests(ReadableStream const&);
size_t readable_stream_get_num_read_requests(ReadableStream const&);
bool readable_stream_has_byob_reader(ReadableStream const&);
bool readable_stream_has_default_reader(ReadableStream const&);

// Readers
// https://streams.spec.whatwg.org/#rs-reader-abstract-ops
GC::Ref<Promise<Value>> readable_stream_reader_generic_cancel(ReadableStreamGenericReaderMixin&, Value reason);
void readable_stream_reader_generic_initialize(ReadableStreamReader, ReadableStream&);
void readable_stream_reader_generic_release(ReadableStreamGenericReaderMixin&);
void readable_stream_byob_reader_error_read_into_requests(ReadableStreamBYOBReader&, Value error);
void readable_stream_byob_reader_read(ReadableStreamBYOBReader&, ArrayBufferView&, u64 min, ReadIntoRequest&);
void readable_stream_byob_reader_release(ReadableStreamBYOBReader&);
void readable_stream_default_reader_error_read_requests(ReadableStreamDefaultReader&, Value error);
void readable_stream_default_reader_read(ReadableStreamDefaultReader&, ReadRequest&);
void readable_stream_default_reader_release(ReadableStreamDefaultReader&);
ExceptionOr<void> set_up_readable_stream_byob_reader(ReadableStreamBYOBReader&, ReadableStream&);
ExceptionOr<void> set_up_readable_stream_default_reader(ReadableStreamDefaultReader&, ReadableStream&);

// Default controllers
// https://streams.spec.whatwg.org/#rs-default-controller-abstract-ops
void readable_stream_default_controller_call_pull_if_needed(ReadableStreamDefaultController&);
bool readable_stream_default_controller_should_call_pull(ReadableStreamDefaultController&);
void readable_stream_default_controller_clear_algorithms(ReadableStreamDefaultController&);
void readable_stream_default_controller_close(ReadableStreamDefaultController&);
ExceptionOr<void> readable_stream_default_controller_enqueue(ReadableStreamDefaultController&, Value chunk);
void readable_stream_default_controller_error(ReadableStreamDefaultController&, Value error);
Optional<double> readable_stream_default_controller_get_desired_size(ReadableStreamDefaultController&);
bool readable_stream_default_controller_has_backpressure(ReadableStreamDefaultController&);
bool readable_stream_default_controller_can_close_or_enqueue(ReadableStreamDefaultController&);
ExceptionOr<void> set_up_readable_stream_default_controller(ReadableStream&, ReadableStreamDefaultController&, GC::Ref<StartAlgorithm>, GC::Ref<PullAlgorithm>, GC::Ref<CancelAlgorithm>, double high_water_mark, GC::Ref<SizeAlgorithm>);
ExceptionOr<void> set_up_readable_stream_default_controller_from_underlying_source(ReadableStream&, UnderlyingSource const&, double high_water_mark, GC::Ref<SizeAlgorithm>);

// Byte stream controllers
// https://streams.spec.whatwg.org/#rbs-controller-abstract-ops
void readable_byte_stream_controller_call_pull_if_needed(ReadableByteStreamController&);
void readable_byte_stream_controller_clear_algorithms(ReadableByteStreamController&);
void readable_byte_stream_controller_clear_pending_pull_intos(ReadableByteStreamController&);
ExceptionOr<void> readable_byte_stream_controller_close(ReadableByteStreamController&);
void readable_byte_stream_controller_commit_pull_into_descriptor(ReadableStream&, PullIntoDescriptor const&);
GC::Ref<ArrayBufferView> readable_byte_stream_controller_convert_pull_into_descriptor(Realm&, PullIntoDescriptor const&);
ExceptionOr<void> readable_byte_stream_controller_enqueue(ReadableByteStreamController&, ArrayBufferView& chunk);
void readable_byte_stream_controller_enqueue_chunk_to_queue(ReadableByteStreamController&, GC::Ref<ArrayBuffer>, u64 byte_offset, u64 byte_length);
ExceptionOr<void> readable_byte_stream_controller_enqueue_cloned_chunk_to_queue(ReadableByteStreamController&, ArrayBuffer&, u64 byte_offset, u64 byte_length);
ExceptionOr<void> readable_byte_stream_controller_enqueue_detached_pull_into_queue(ReadableByteStreamController&, PullIntoDescriptor&);
void readable_byte_stream_controller_error(ReadableByteStreamController&, Value error);
void readable_byte_stream_controller_fill_head_pull_into_descriptor(ReadableByteStreamController const&, u64 size, PullIntoDescriptor&);
bool readable_byte_stream_controller_fill_pull_into_descriptor_from_queue(ReadableByteStreamController&, PullIntoDescriptor&);
void readable_byte_stream_controller_fill_read_request_from_queue(ReadableByteStreamController&, GC::Ref<ReadRequest>);
GC::Ptr<ReadableStreamBYOBRequest> readable_byte_stream_controller_get_byob_request(ReadableByteStreamController&);
Optional<double> readable_byte_stream_controller_get_desired_size(ReadableByteStreamController const&);
void readable_byte_stream_controller_handle_queue_drain(ReadableByteStreamController&);
void readable_byte_stream_controller_invalidate_byob_request(ReadableByteStreamController&);
Vector<PullIntoDescriptor> readable_byte_stream_controller_process_pull_into_descriptors_using_queue(ReadableByteStreamController&);
void readable_byte_stream_controller_process_read_requests_using_queue(ReadableByteStreamController&);
void readable_byte_stream_controller_pull_into(ReadableByteStreamController&, ArrayBufferView&, u64 min, ReadIntoRequest&);
ExceptionOr<void> readable_byte_stream_controller_respond(ReadableByteStreamController&, u64 bytes_written);
void readable_byte_stream_controller_respond_in_closed_state(ReadableByteStreamController&, PullIntoDescriptor&);
ExceptionOr<void> readable_byte_stream_controller_respond_in_readable_state(ReadableByteStreamController&, u64 bytes_written, PullIntoDescriptor&);
ExceptionOr<void> readable_byte_stream_controller_respond_internal(ReadableByteStreamController&, u64 bytes_written);
ExceptionOr<void> readable_byte_stream_controller_respond_with_new_view(ReadableByteStreamController&, ArrayBufferView&);
PullIntoDescriptor readable_byte_stream_controller_shift_pending_pull_into(ReadableByteStreamController&);
bool readable_byte_stream_controller_should_call_pull(ReadableByteStreamController const&);
ExceptionOr<void> set_up_readable_byte_stream_controller(ReadableStream&, ReadableByteStreamController&, GC::Ref<StartAlgorithm>, GC::Ref<PullAlgorithm>, GC::Ref<CancelAlgorithm>, double high_water_mark, Optional<u64> auto_allocate_chunk_size);
ExceptionOr<void> set_up_readable_byte_stream_controller_from_underlying_source(ReadableStream&, UnderlyingSource const&, double high_water_mark);

// Structured cloning of chunks, for tee() with cloneForBranch2
ExceptionOr<Value> structured_clone(Realm&, Value const&);

}
