/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibGC/CellAllocator.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>

namespace Streams {

// https://streams.spec.whatwg.org/#readablestreambyobrequest
class ReadableStreamBYOBRequest final : public GC::Cell {
    GC_CELL(ReadableStreamBYOBRequest, GC::Cell);
    GC_DECLARE_ALLOCATOR(ReadableStreamBYOBRequest);

public:
    virtual ~ReadableStreamBYOBRequest() override = default;

    GC::Ptr<ArrayBufferView> view();

    void set_controller(GC::Ptr<ReadableByteStreamController> value) { m_controller = value; }
    void set_view(GC::Ptr<ArrayBufferView> value) { m_view = value; }

    ExceptionOr<void> respond(u64 bytes_written);
    ExceptionOr<void> respond_with_new_view(GC::Ref<ArrayBufferView>);

private:
    ReadableStreamBYOBRequest() = default;

    virtual void visit_edges(Cell::Visitor&) override;

    // https://streams.spec.whatwg.org/#readablestreambyobrequest-controller
    // The parent ReadableByteStreamController instance
    GC::Ptr<ReadableByteStreamController> m_controller;

    // https://streams.spec.whatwg.org/#readablestreambyobrequest-view
    // A typed array representing the destination region to which the controller can write generated data, or null after the BYOB request has been invalidated.
    GC::Ptr<ArrayBufferView> m_view;
};

}
