/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamGenericReader.h>
#include <LibStreams/ReadableStreamOperations.h>

namespace Streams {

ReadableStreamGenericReaderMixin::ReadableStreamGenericReaderMixin(Realm& realm)
    : m_realm(realm)
{
}

// https://streams.spec.whatwg.org/#generic-reader-closed
GC::Ref<Promise<Value>> ReadableStreamGenericReaderMixin::closed()
{
    // 1. Return this.[[closedPromise]].
    return *m_closed_promise;
}

// https://streams.spec.whatwg.org/#generic-reader-cancel
GC::Ref<Promise<Value>> ReadableStreamGenericReaderMixin::cancel(Value reason)
{
    // 1. If this.[[stream]] is undefined, return a promise rejected with a TypeError exception.
    if (!m_stream) {
        auto exception = SimpleException { SimpleExceptionType::TypeError, "No stream present to cancel"sv };
        return create_rejected_promise(m_realm, exception);
    }

    // 2. Return ! ReadableStreamReaderGenericCancel(this, reason).
    return readable_stream_reader_generic_cancel(*this, move(reason));
}

void ReadableStreamGenericReaderMixin::visit_edges(GC::Cell::Visitor& visitor)
{
    // NOTE: Don't call the base visit_edges method here, as this is a mixin.
    visitor.visit(m_closed_promise);
    visitor.visit(m_stream);
}

}
