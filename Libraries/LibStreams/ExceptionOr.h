/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Variant.h>
#include <LibStreams/SimpleException.h>
#include <LibStreams/Value.h>

namespace Streams {

// A thrown value. Errors raised by the engine itself are SimpleExceptions, but underlying sources and size
// algorithms may throw any Value.
class Exception {
public:
    Exception(Value value)
        : m_value(move(value))
    {
    }

    Exception(SimpleException exception)
        : m_value(move(exception))
    {
    }

    Value const& value() const { return m_value; }

private:
    Value m_value;
};

inline Exception throw_completion(Value value)
{
    return Exception { move(value) };
}

template<typename ValueType>
class [[nodiscard]] ExceptionOr {
public:
    ExceptionOr()
    requires(IsSame<ValueType, Empty>)
        : m_result_or_exception(Empty {})
    {
    }

    ExceptionOr(ValueType const& result)
        : m_result_or_exception(result)
    {
    }

    ExceptionOr(ValueType&& result)
        : m_result_or_exception(move(result))
    {
    }

    // Allows implicit construction of ExceptionOr<T> from a type U if T(U) is a supported constructor.
    // Most commonly: Value from GC::Ref<T>, or GC::Ref<T> from T&.
    template<typename WrappedValueType>
    ExceptionOr(WrappedValueType result)
    requires(!IsSame<RemoveCVReference<WrappedValueType>, Exception> && !IsSame<RemoveCVReference<WrappedValueType>, SimpleException> && requires { ValueType { move(result) }; })
        : m_result_or_exception(ValueType { move(result) })
    {
    }

    ExceptionOr(Exception exception)
        : m_result_or_exception(move(exception))
    {
    }

    ExceptionOr(SimpleException exception)
        : m_result_or_exception(Exception { move(exception) })
    {
    }

    ExceptionOr(ExceptionOr&& other) = default;
    ExceptionOr(ExceptionOr const& other) = default;
    ~ExceptionOr() = default;

    ValueType& value()
    requires(!IsSame<ValueType, Empty>)
    {
        return m_result_or_exception.template get<ValueType>();
    }

    ValueType release_value()
    {
        return move(m_result_or_exception.template get<ValueType>());
    }

    Exception const& exception() const
    {
        return m_result_or_exception.template get<Exception>();
    }

    bool is_exception() const
    {
        return m_result_or_exception.template has<Exception>();
    }

    // These are for compatibility with the TRY() macro in AK.
    [[nodiscard]] bool is_error() const { return is_exception(); }
    Exception release_error() { return move(m_result_or_exception.template get<Exception>()); }

private:
    Variant<ValueType, Exception> m_result_or_exception;
};

template<>
class [[nodiscard]] ExceptionOr<void> : public ExceptionOr<Empty> {
public:
    using ExceptionOr<Empty>::ExceptionOr;
};

}

template<>
struct AK::Formatter<Streams::Exception> : AK::Formatter<Streams::Value> {
    ErrorOr<void> format(FormatBuilder& builder, Streams::Exception const& exception)
    {
        return Formatter<Streams::Value>::format(builder, exception.value());
    }
};
