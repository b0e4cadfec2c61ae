/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibGC/Function.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>

namespace Streams {

using SizeAlgorithm = GC::Function<ExceptionOr<double>(Value const& chunk)>;
using StartAlgorithm = GC::Function<ExceptionOr<Value>()>;
using PullAlgorithm = GC::Function<GC::Ref<Promise<Value>>()>;
using CancelAlgorithm = GC::Function<GC::Ref<Promise<Value>>(Value const& reason)>;

}
