/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/Checked.h>
#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Realm.h>

namespace Streams {

GC_DEFINE_ALLOCATOR(ArrayBuffer);
GC_DEFINE_ALLOCATOR(ArrayBufferView);

ExceptionOr<GC::Ref<ArrayBuffer>> ArrayBuffer::create(Realm& realm, size_t byte_length)
{
    auto buffer = ByteBuffer::create_zeroed(byte_length);
    if (buffer.is_error())
        return SimpleException { SimpleExceptionType::RangeError, MUST(String::formatted("Unable to allocate an ArrayBuffer of {} bytes", byte_length)) };

    return realm.create<ArrayBuffer>(buffer.release_value());
}

GC::Ref<ArrayBuffer> ArrayBuffer::create(Realm& realm, ByteBuffer buffer)
{
    return realm.create<ArrayBuffer>(move(buffer));
}

ArrayBuffer::ArrayBuffer(ByteBuffer buffer)
    : m_buffer(move(buffer))
{
}

void ArrayBuffer::detach()
{
    m_buffer.clear();
    m_detached = true;
}

size_t element_size_of(ArrayBufferViewType type)
{
    switch (type) {
#define __ENUMERATE(ViewType, element_size) \
    case ArrayBufferViewType::ViewType:     \
        return element_size;
        ENUMERATE_ARRAY_BUFFER_VIEW_TYPES(__ENUMERATE)
#undef __ENUMERATE
    }
    VERIFY_NOT_REACHED();
}

StringView array_buffer_view_type_name(ArrayBufferViewType type)
{
    switch (type) {
#define __ENUMERATE(ViewType, element_size) \
    case ArrayBufferViewType::ViewType:     \
        return #ViewType##sv;
        ENUMERATE_ARRAY_BUFFER_VIEW_TYPES(__ENUMERATE)
#undef __ENUMERATE
    }
    VERIFY_NOT_REACHED();
}

ExceptionOr<GC::Ref<ArrayBufferView>> ArrayBufferView::create(Realm& realm, ArrayBufferViewType type, ArrayBuffer& buffer, size_t byte_offset, size_t length)
{
    if (buffer.is_detached())
        return SimpleException { SimpleExceptionType::TypeError, "Cannot create a view on a detached ArrayBuffer"sv };

    auto element_size = element_size_of(type);
    if (byte_offset % element_size != 0)
        return SimpleException { SimpleExceptionType::RangeError, MUST(String::formatted("Start offset of {} should be a multiple of {}", array_buffer_view_type_name(type), element_size)) };

    Checked<size_t> end = length;
    end *= element_size;
    end += byte_offset;
    if (end.has_overflow() || end.value() > buffer.byte_length())
        return SimpleException { SimpleExceptionType::RangeError, "View range exceeds the length of its ArrayBuffer"sv };

    return realm.create<ArrayBufferView>(type, buffer, byte_offset, length);
}

ExceptionOr<GC::Ref<ArrayBufferView>> ArrayBufferView::create(Realm& realm, ArrayBufferViewType type, ArrayBuffer& buffer)
{
    auto element_size = element_size_of(type);
    if (buffer.byte_length() % element_size != 0)
        return SimpleException { SimpleExceptionType::RangeError, MUST(String::formatted("Byte length of {} should be a multiple of {}", array_buffer_view_type_name(type), element_size)) };

    return create(realm, type, buffer, 0, buffer.byte_length() / element_size);
}

ExceptionOr<GC::Ref<ArrayBufferView>> ArrayBufferView::create_uint8_array(Realm& realm, ReadonlyBytes bytes)
{
    auto data = ByteBuffer::copy(bytes);
    if (data.is_error())
        return SimpleException { SimpleExceptionType::RangeError, "Unable to allocate a Uint8Array"sv };

    auto buffer = ArrayBuffer::create(realm, data.release_value());
    return create(realm, ArrayBufferViewType::Uint8Array, buffer, 0, bytes.size());
}

ArrayBufferView::ArrayBufferView(ArrayBufferViewType type, GC::Ref<ArrayBuffer> buffer, size_t byte_offset, size_t length)
    : m_type(type)
    , m_buffer(buffer)
    , m_byte_offset(byte_offset)
    , m_length(length)
{
}

void ArrayBufferView::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    visitor.visit(m_buffer);
}

ReadonlyBytes ArrayBufferView::bytes() const
{
    if (m_buffer->is_detached())
        return {};
    return m_buffer->bytes().slice(m_byte_offset, byte_length());
}

// https://tc39.es/ecma262/#sec-transferarraybuffer
ExceptionOr<GC::Ref<ArrayBuffer>> transfer_array_buffer(Realm& realm, ArrayBuffer& buffer)
{
    // 1. If IsDetachedBuffer(arrayBuffer) is true, throw a TypeError exception.
    if (buffer.is_detached())
        return SimpleException { SimpleExceptionType::TypeError, "Cannot transfer a detached ArrayBuffer"sv };

    // 2. Let newBuffer be a new ArrayBuffer that takes over arrayBuffer's data block.
    auto new_buffer = ArrayBuffer::create(realm, move(buffer.buffer()));

    // 3. Perform DetachArrayBuffer(arrayBuffer).
    buffer.detach();

    // 4. Return newBuffer.
    return new_buffer;
}

// https://streams.spec.whatwg.org/#can-transfer-array-buffer
bool can_transfer_array_buffer(ArrayBuffer const& buffer)
{
    // 1. Assert: O is an Object.
    // 2. Assert: O has an [[ArrayBufferData]] internal slot.

    // 3. If ! IsDetachedBuffer(O) is true, return false.
    if (buffer.is_detached())
        return false;

    // 4. If SameValue(O.[[ArrayBufferDetachKey]], undefined) is false, return false.
    // 5. Return true.
    return true;
}

// https://streams.spec.whatwg.org/#abstract-opdef-cloneasuint8array
ExceptionOr<GC::Ref<ArrayBufferView>> clone_as_uint8_array(Realm& realm, ArrayBufferView const& view)
{
    // 1. Assert: O is an Object.
    // 2. Assert: O has an [[ViewedArrayBuffer]] internal slot.
    // 3. Assert: ! IsDetachedBuffer(O.[[ViewedArrayBuffer]]) is false.
    VERIFY(!view.viewed_array_buffer().is_detached());

    // 4. Let buffer be ? CloneArrayBuffer(O.[[ViewedArrayBuffer]], O.[[ByteOffset]], O.[[ByteLength]], %ArrayBuffer%).
    auto buffer = TRY(clone_as_array_buffer(realm, view.viewed_array_buffer(), view.byte_offset(), view.byte_length()));

    // 5. Let array be ! Construct(%Uint8Array%, « buffer »).
    // 6. Return array.
    return MUST(ArrayBufferView::create(realm, ArrayBufferViewType::Uint8Array, buffer));
}

// https://streams.spec.whatwg.org/#abstract-opdef-cloneasarraybuffer
ExceptionOr<GC::Ref<ArrayBuffer>> clone_as_array_buffer(Realm& realm, ArrayBuffer const& buffer, size_t offset, size_t length)
{
    VERIFY(offset + length <= buffer.byte_length());

    auto clone = ByteBuffer::copy(buffer.bytes().slice(offset, length));
    if (clone.is_error())
        return SimpleException { SimpleExceptionType::RangeError, "Unable to clone ArrayBuffer"sv };

    return ArrayBuffer::create(realm, clone.release_value());
}

// https://tc39.es/ecma262/#sec-copydatablockbytes
void copy_data_block_bytes(ArrayBuffer& destination, size_t destination_index, ArrayBuffer const& source, size_t source_index, size_t count)
{
    // 1. Assert: fromBlock and toBlock are distinct values.
    VERIFY(&destination != &source);

    // 2-6. Copy count bytes from fromBlock starting at fromIndex into toBlock starting at toIndex.
    VERIFY(source_index + count <= source.byte_length());
    VERIFY(destination_index + count <= destination.byte_length());
    source.bytes().slice(source_index, count).copy_to(destination.bytes().slice(destination_index, count));
}

}
