/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Array.h>
#include <AK/Optional.h>
#include <LibGC/CellAllocator.h>
#include <LibStreams/Algorithms.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>
#include <LibStreams/QueuingStrategy.h>
#include <LibStreams/UnderlyingSource.h>

namespace Streams {

// https://streams.spec.whatwg.org/#enumdef-readablestreamreadermode
enum class ReadableStreamReaderMode {
    Byob,
};

// https://streams.spec.whatwg.org/#dictdef-readablestreamgetreaderoptions
struct ReadableStreamGetReaderOptions {
    Optional<ReadableStreamReaderMode> mode;
};

using ReadableStreamPair = AK::Array<GC::Ref<ReadableStream>, 2>;

// https://streams.spec.whatwg.org/#readablestream
class ReadableStream final : public GC::Cell {
    GC_CELL(ReadableStream, GC::Cell);
    GC_DECLARE_ALLOCATOR(ReadableStream);

public:
    enum class State {
        Readable,
        Closed,
        Errored,
    };

    static ExceptionOr<GC::Ref<ReadableStream>> construct_impl(Realm&, Optional<UnderlyingSource> const& underlying_source = {}, QueuingStrategy const& strategy = {});

    // A stream that still has to be set up, for use by set_up() and the abstract operations that create streams.
    static GC::Ref<ReadableStream> create(Realm&);

    virtual ~ReadableStream() override;

    bool locked() const;
    GC::Ref<Promise<Value>> cancel(Value reason = js_undefined());
    ExceptionOr<ReadableStreamReader> get_reader(ReadableStreamGetReaderOptions const& = {});
    ExceptionOr<ReadableStreamPair> tee();

    // Operations for code that creates and drives a stream from native code.
    // https://streams.spec.whatwg.org/#other-specs-rs
    void set_up(GC::Ref<PullAlgorithm>, GC::Ptr<CancelAlgorithm> = {}, double high_water_mark = 1, GC::Ptr<SizeAlgorithm> = {});
    void set_up_with_byte_reading_support(GC::Ptr<PullAlgorithm> = {}, GC::Ptr<CancelAlgorithm> = {}, double high_water_mark = 0);
    ExceptionOr<void> enqueue(Value chunk);
    ExceptionOr<void> close();
    void error(Value error);
    GC::Ptr<ArrayBufferView> current_byob_request_view();
    ExceptionOr<GC::Ref<ReadableStreamDefaultReader>> get_a_reader();

    Optional<ReadableStreamController>& controller() { return m_controller; }
    void set_controller(Optional<ReadableStreamController> value) { m_controller = move(value); }

    Value const& stored_error() const { return m_stored_error; }
    void set_stored_error(Value value) { m_stored_error = move(value); }

    Optional<ReadableStreamReader> const& reader() const { return m_reader; }
    void set_reader(Optional<ReadableStreamReader> value) { m_reader = move(value); }

    bool is_disturbed() const { return m_disturbed; }
    void set_disturbed(bool value) { m_disturbed = value; }

    bool is_readable() const { return m_state == State::Readable; }
    bool is_closed() const { return m_state == State::Closed; }
    bool is_errored() const { return m_state == State::Errored; }
    bool is_locked() const { return locked(); }

    State state() const { return m_state; }
    void set_state(State value) { m_state = value; }

    // Whether the stream's controller is a ReadableByteStreamController.
    bool has_byte_controller() const;

    Realm& realm() const { return m_realm; }

private:
    explicit ReadableStream(Realm&);

    virtual void visit_edges(Cell::Visitor&) override;

    Realm& m_realm;

    // https://streams.spec.whatwg.org/#readablestream-controller
    // A ReadableStreamDefaultController or ReadableByteStreamController created with the ability to control the state and queue of this stream
    Optional<ReadableStreamController> m_controller;

    // https://streams.spec.whatwg.org/#readablestream-disturbed
    // A boolean flag set to true when the stream has been read from or canceled
    bool m_disturbed { false };

    // https://streams.spec.whatwg.org/#readablestream-reader
    // A ReadableStreamDefaultReader or ReadableStreamBYOBReader instance, if the stream is locked to a reader, or undefined if it is not
    Optional<ReadableStreamReader> m_reader;

    // https://streams.spec.whatwg.org/#readablestream-state
    // A string containing the stream’s current state, used internally; one of "readable", "closed", or "errored"
    State m_state { State::Readable };

    // https://streams.spec.whatwg.org/#readablestream-storederror
    // A value indicating how the stream failed, to be given as a failure reason or exception when trying to operate on an errored stream
    Value m_stored_error;
};

StringView readable_stream_state_name(ReadableStream::State);

}
