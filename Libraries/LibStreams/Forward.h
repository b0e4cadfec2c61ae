/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Variant.h>
#include <LibGC/Forward.h>
#include <LibGC/Ptr.h>

namespace Streams {

class Array;
class ArrayBuffer;
class ArrayBufferView;
class ByteLengthQueuingStrategy;
class CountQueuingStrategy;
class Exception;
class ReadableByteStreamController;
class ReadableStream;
class ReadableStreamBYOBReader;
class ReadableStreamBYOBRequest;
class ReadableStreamDefaultController;
class ReadableStreamDefaultReader;
class ReadableStreamGenericReaderMixin;
class ReadIntoRequest;
class ReadRequest;
class Realm;
class Settings;
class Value;

template<typename T>
class Promise;

template<typename ValueType>
class ExceptionOr;

struct PullIntoDescriptor;
struct QueuingStrategy;
struct ReadableStreamBYOBReaderReadOptions;
struct ReadableStreamGetReaderOptions;
struct ReadResult;
struct SimpleException;
struct UnderlyingSource;
struct ValueWithSize;

enum class ReadableStreamReaderMode;
enum class ReadableStreamType;
enum class SimpleExceptionType;

using ReadableStreamController = Variant<GC::Ref<ReadableStreamDefaultController>, GC::Ref<ReadableByteStreamController>>;
using ReadableStreamReader = Variant<GC::Ref<ReadableStreamDefaultReader>, GC::Ref<ReadableStreamBYOBReader>>;

}
