/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/String.h>
#include <AK/StringView.h>

namespace Streams {

#define ENUMERATE_SIMPLE_EXCEPTION_TYPES(E) \
    E(TypeError)                            \
    E(RangeError)

enum class SimpleExceptionType {
#define __ENUMERATE(ErrorType) ErrorType,
    ENUMERATE_SIMPLE_EXCEPTION_TYPES(__ENUMERATE)
#undef __ENUMERATE
};

StringView simple_exception_type_name(SimpleExceptionType);

struct SimpleException {
    SimpleExceptionType type;
    String message;

    SimpleException(SimpleExceptionType type, String message)
        : type(type)
        , message(move(message))
    {
    }

    SimpleException(SimpleExceptionType type, StringView message)
        : type(type)
        , message(MUST(String::from_utf8(message)))
    {
    }

    bool operator==(SimpleException const&) const = default;
};

}
