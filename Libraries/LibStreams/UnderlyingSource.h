/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Optional.h>
#include <AK/Types.h>
#include <LibGC/Function.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>

namespace Streams {

enum class ReadableStreamType {
    Bytes,
};

// Underlying source callbacks may throw, and pull and cancel may return a promise to signal completion.
using UnderlyingSourceStartCallback = GC::Function<ExceptionOr<Value>(ReadableStreamController)>;
using UnderlyingSourcePullCallback = GC::Function<ExceptionOr<Value>(ReadableStreamController)>;
using UnderlyingSourceCancelCallback = GC::Function<ExceptionOr<Value>(Value const& reason)>;

// https://streams.spec.whatwg.org/#dictdef-underlyingsource
struct UnderlyingSource {
    GC::Ptr<UnderlyingSourceStartCallback> start;
    GC::Ptr<UnderlyingSourcePullCallback> pull;
    GC::Ptr<UnderlyingSourceCancelCallback> cancel;
    Optional<ReadableStreamType> type;
    Optional<u64> auto_allocate_chunk_size;
};

}
