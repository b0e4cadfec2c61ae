/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/StringBuilder.h>
#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Promise.h>
#include <LibStreams/Realm.h>
#include <LibStreams/Value.h>

namespace Streams {

StringView simple_exception_type_name(SimpleExceptionType type)
{
    switch (type) {
#define __ENUMERATE(ErrorType)           \
    case SimpleExceptionType::ErrorType: \
        return #ErrorType##sv;
        ENUMERATE_SIMPLE_EXCEPTION_TYPES(__ENUMERATE)
#undef __ENUMERATE
    }
    VERIFY_NOT_REACHED();
}

Optional<size_t> Value::byte_length() const
{
    if (is_array_buffer())
        return as_array_buffer().byte_length();
    if (is_array_buffer_view())
        return as_array_buffer_view().byte_length();
    return {};
}

bool Value::is_error_of_type(SimpleExceptionType type) const
{
    return is_error() && as_error().type == type;
}

bool Value::operator==(Value const& other) const
{
    if (m_value.index() != other.m_value.index())
        return false;

    return m_value.visit(
        [](Empty) { return true; },
        [&](bool value) { return value == other.as_bool(); },
        [&](double value) { return value == other.as_double(); },
        [&](String const& value) { return value == other.as_string(); },
        [&](SimpleException const& value) { return value == other.as_error(); },
        [&](GC::Ref<ArrayBuffer> const& value) { return value.ptr() == &other.as_array_buffer(); },
        [&](GC::Ref<ArrayBufferView> const& value) { return value.ptr() == &other.as_array_buffer_view(); },
        [&](GC::Ref<Promise<Value>> const& value) { return value.ptr() == &other.as_promise(); },
        [&](GC::Ref<Array> const& value) { return value.ptr() == &other.as_array(); });
}

ErrorOr<String> Value::to_string() const
{
    return m_value.visit(
        [](Empty) -> ErrorOr<String> { return "undefined"_string; },
        [](bool value) -> ErrorOr<String> { return value ? "true"_string : "false"_string; },
        [](double value) -> ErrorOr<String> { return String::formatted("{}", value); },
        [](String const& value) -> ErrorOr<String> { return value; },
        [](SimpleException const& value) -> ErrorOr<String> {
            return String::formatted("{}: {}", simple_exception_type_name(value.type), value.message);
        },
        [](GC::Ref<ArrayBuffer> const& value) -> ErrorOr<String> {
            if (value->is_detached())
                return "[object ArrayBuffer (detached)]"_string;
            return String::formatted("[object ArrayBuffer ({} bytes)]", value->byte_length());
        },
        [](GC::Ref<ArrayBufferView> const& value) -> ErrorOr<String> {
            return String::formatted("[object {} ({} bytes)]", array_buffer_view_type_name(value->type()), value->byte_length());
        },
        [](GC::Ref<Promise<Value>> const&) -> ErrorOr<String> { return "[object Promise]"_string; },
        [](GC::Ref<Array> const& value) -> ErrorOr<String> {
            StringBuilder builder;
            builder.append('[');
            for (size_t i = 0; i < value->size(); ++i) {
                if (i != 0)
                    builder.append(", "sv);
                builder.append(TRY(value->at(i).to_string()));
            }
            builder.append(']');
            return builder.to_string();
        });
}

void Value::visit_edges(GC::Cell::Visitor& visitor) const
{
    m_value.visit(
        [&](GC::Ref<ArrayBuffer> const& value) { visitor.visit(value); },
        [&](GC::Ref<ArrayBufferView> const& value) { visitor.visit(value); },
        [&](GC::Ref<Promise<Value>> const& value) { visitor.visit(value); },
        [&](GC::Ref<Array> const& value) { visitor.visit(value); },
        [](auto const&) {});
}

GC_DEFINE_ALLOCATOR(Array);

GC::Ref<Array> Array::create_from(Realm& realm, Vector<Value> elements)
{
    return realm.create<Array>(move(elements));
}

Array::Array(Vector<Value> elements)
    : m_elements(move(elements))
{
}

void Array::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    for (auto const& element : m_elements)
        element.visit_edges(visitor);
}

}
