/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Format.h>
#include <LibStreams/Debug.h>
#include <LibStreams/Realm.h>

namespace Streams {

// Stream lifecycle tracing, enabled at build time with STREAMS_DEBUG or at runtime with the logStreamActivity setting.
template<typename... Parameters>
void log_stream_activity(Realm const& realm, CheckedFormatString<Parameters...>&& fmtstr, Parameters const&... parameters)
{
    if (STREAMS_DEBUG || realm.settings().log_stream_activity())
        dbgln(move(fmtstr), parameters...);
}

}
