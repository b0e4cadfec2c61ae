/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Error.h>
#include <AK/Stream.h>
#include <LibGC/Ptr.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>

namespace Streams {

struct CopyStatistics {
    size_t chunks { 0 };
    size_t bytes { 0 };
};

// A byte stream whose pulls read from the input into the current BYOB request, or into a new chunk of the
// realm's chunk size when no reader is waiting. The input must outlive the stream.
ExceptionOr<GC::Ref<ReadableStream>> create_readable_byte_stream_from(Realm&, AK::Stream& input, double high_water_mark = 0);

// Drains a byte stream into the output. Each read runs the realm's microtasks until it settles.
ErrorOr<CopyStatistics> copy_readable_byte_stream(Realm&, ReadableStream&, AK::Stream& output, bool use_byob_reader);

}
