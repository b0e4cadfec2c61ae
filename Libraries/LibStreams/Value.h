/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Format.h>
#include <AK/Optional.h>
#include <AK/String.h>
#include <AK/Variant.h>
#include <AK/Vector.h>
#include <LibGC/Cell.h>
#include <LibGC/CellAllocator.h>
#include <LibGC/Ptr.h>
#include <LibStreams/Forward.h>
#include <LibStreams/SimpleException.h>

namespace Streams {

// The chunk and reason type carried through streams: undefined, a boolean, a number, a string, an error, an
// ArrayBuffer, an ArrayBufferView, a promise or an array of values.
class Value {
public:
    Value() = default;

    Value(bool value)
        : m_value(value)
    {
    }

    Value(i32 value)
        : m_value(static_cast<double>(value))
    {
    }

    Value(double value)
        : m_value(value)
    {
    }

    Value(String value)
        : m_value(move(value))
    {
    }

    Value(SimpleException error)
        : m_value(move(error))
    {
    }

    Value(GC::Ref<ArrayBuffer> buffer)
        : m_value(buffer)
    {
    }

    Value(GC::Ref<ArrayBufferView> view)
        : m_value(view)
    {
    }

    Value(GC::Ref<Promise<Value>> promise)
        : m_value(promise)
    {
    }

    Value(GC::Ref<Array> array)
        : m_value(array)
    {
    }

    bool is_undefined() const { return m_value.has<Empty>(); }
    bool is_boolean() const { return m_value.has<bool>(); }
    bool is_number() const { return m_value.has<double>(); }
    bool is_string() const { return m_value.has<String>(); }
    bool is_error() const { return m_value.has<SimpleException>(); }
    bool is_array_buffer() const { return m_value.has<GC::Ref<ArrayBuffer>>(); }
    bool is_array_buffer_view() const { return m_value.has<GC::Ref<ArrayBufferView>>(); }
    bool is_promise() const { return m_value.has<GC::Ref<Promise<Value>>>(); }
    bool is_array() const { return m_value.has<GC::Ref<Array>>(); }

    bool as_bool() const { return m_value.get<bool>(); }
    double as_double() const { return m_value.get<double>(); }
    String const& as_string() const { return m_value.get<String>(); }
    SimpleException const& as_error() const { return m_value.get<SimpleException>(); }
    ArrayBuffer& as_array_buffer() const { return m_value.get<GC::Ref<ArrayBuffer>>(); }
    ArrayBufferView& as_array_buffer_view() const { return m_value.get<GC::Ref<ArrayBufferView>>(); }
    Promise<Value>& as_promise() const { return m_value.get<GC::Ref<Promise<Value>>>(); }
    Array& as_array() const { return m_value.get<GC::Ref<Array>>(); }

    // Byte length of an ArrayBuffer or ArrayBufferView chunk, empty for every other kind of value.
    Optional<size_t> byte_length() const;

    // Whether this is an error of the given type, regardless of its message.
    bool is_error_of_type(SimpleExceptionType) const;

    // Values compare by identity for buffers, views and promises, and by content otherwise.
    bool operator==(Value const&) const;

    ErrorOr<String> to_string() const;

    void visit_edges(GC::Cell::Visitor&) const;

private:
    Variant<Empty, bool, double, String, SimpleException, GC::Ref<ArrayBuffer>, GC::Ref<ArrayBufferView>, GC::Ref<Promise<Value>>, GC::Ref<Array>> m_value;
};

inline Value js_undefined()
{
    return {};
}

class Array final : public GC::Cell {
    GC_CELL(Array, GC::Cell);
    GC_DECLARE_ALLOCATOR(Array);

public:
    // https://tc39.es/ecma262/#sec-createarrayfromlist
    static GC::Ref<Array> create_from(Realm&, Vector<Value>);

    virtual ~Array() override = default;

    Vector<Value> const& elements() const { return m_elements; }
    size_t size() const { return m_elements.size(); }
    Value const& at(size_t index) const { return m_elements.at(index); }

private:
    explicit Array(Vector<Value>);

    virtual void visit_edges(Cell::Visitor&) override;

    Vector<Value> m_elements;
};

}

template<>
struct AK::Formatter<Streams::Value> : AK::Formatter<FormatString> {
    ErrorOr<void> format(FormatBuilder& builder, Streams::Value const& value)
    {
        return Formatter<FormatString>::format(builder, "{}"sv, TRY(value.to_string()));
    }
};
