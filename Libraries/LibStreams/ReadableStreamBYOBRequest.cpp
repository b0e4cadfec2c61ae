/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/ReadableByteStreamController.h>
#include <LibStreams/ReadableStreamBYOBRequest.h>
#include <LibStreams/ReadableStreamOperations.h>

namespace Streams {

GC_DEFINE_ALLOCATOR(ReadableStreamBYOBRequest);

// https://streams.spec.whatwg.org/#rs-byob-request-view
GC::Ptr<ArrayBufferView> ReadableStreamBYOBRequest::view()
{
    // 1. Return this.[[view]].
    return m_view;
}

void ReadableStreamBYOBRequest::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    visitor.visit(m_controller);
    visitor.visit(m_view);
}

// https://streams.spec.whatwg.org/#rs-byob-request-respond
ExceptionOr<void> ReadableStreamBYOBRequest::respond(u64 bytes_written)
{
    // 1. If this.[[controller]] is undefined, throw a TypeError exception.
    if (!m_controller)
        return SimpleException { SimpleExceptionType::TypeError, "Controller is undefined"sv };

    // 2. If ! IsDetachedBuffer(this.[[view]].[[ArrayBuffer]]) is true, throw a TypeError exception.
    if (m_view->viewed_array_buffer().is_detached())
        return SimpleException { SimpleExceptionType::TypeError, "Unable to respond with a detached ArrayBuffer"sv };

    // 3. Assert: this.[[view]].[[ByteLength]] > 0.
    VERIFY(m_view->byte_length() > 0);

    // 4. Assert: this.[[view]].[[ViewedArrayBuffer]].[[ByteLength]] > 0.
    VERIFY(m_view->viewed_array_buffer().byte_length() > 0);

    // 5. Perform ? ReadableByteStreamControllerRespond(this.[[controller]], bytesWritten).
    return readable_byte_stream_controller_respond(*m_controller, bytes_written);
}

// https://streams.spec.whatwg.org/#rs-byob-request-respond-with-new-view
ExceptionOr<void> ReadableStreamBYOBRequest::respond_with_new_view(GC::Ref<ArrayBufferView> view)
{
    // 1. If this.[[controller]] is undefined, throw a TypeError exception.
    if (!m_controller)
        return SimpleException { SimpleExceptionType::TypeError, "Controller is undefined"sv };

    // 2. If ! IsDetachedBuffer(view.[[ViewedArrayBuffer]]) is true, throw a TypeError exception.
    if (view->viewed_array_buffer().is_detached())
        return SimpleException { SimpleExceptionType::TypeError, "Unable to respond with a detached ArrayBuffer"sv };

    // 3. Return ? ReadableByteStreamControllerRespondWithNewView(this.[[controller]], view).
    return readable_byte_stream_controller_respond_with_new_view(*m_controller, view);
}

}
