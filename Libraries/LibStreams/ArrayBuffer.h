/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/ByteBuffer.h>
#include <LibGC/Cell.h>
#include <LibGC/CellAllocator.h>
#include <LibStreams/ExceptionOr.h>
#include <LibStreams/Forward.h>

namespace Streams {

// A block of bytes that can be transferred away, leaving the original detached.
class ArrayBuffer final : public GC::Cell {
    GC_CELL(ArrayBuffer, GC::Cell);
    GC_DECLARE_ALLOCATOR(ArrayBuffer);

public:
    static ExceptionOr<GC::Ref<ArrayBuffer>> create(Realm&, size_t byte_length);
    static GC::Ref<ArrayBuffer> create(Realm&, ByteBuffer);

    virtual ~ArrayBuffer() override = default;

    size_t byte_length() const { return m_detached ? 0 : m_buffer.size(); }

    ByteBuffer& buffer() { return m_buffer; }
    ByteBuffer const& buffer() const { return m_buffer; }

    Bytes bytes() { return m_buffer.bytes(); }
    ReadonlyBytes bytes() const { return m_buffer.bytes(); }

    bool is_detached() const { return m_detached; }
    void detach();

private:
    explicit ArrayBuffer(ByteBuffer);

    ByteBuffer m_buffer;
    bool m_detached { false };
};

#define ENUMERATE_ARRAY_BUFFER_VIEW_TYPES(E) \
    E(Int8Array, 1)                          \
    E(Uint8Array, 1)                         \
    E(Uint8ClampedArray, 1)                  \
    E(Int16Array, 2)                         \
    E(Uint16Array, 2)                        \
    E(Int32Array, 4)                         \
    E(Uint32Array, 4)                        \
    E(Float32Array, 4)                       \
    E(Float64Array, 8)                       \
    E(DataView, 1)

enum class ArrayBufferViewType {
#define __ENUMERATE(ViewType, element_size) ViewType,
    ENUMERATE_ARRAY_BUFFER_VIEW_TYPES(__ENUMERATE)
#undef __ENUMERATE
};

size_t element_size_of(ArrayBufferViewType);
StringView array_buffer_view_type_name(ArrayBufferViewType);

// A typed window (offset, length, element type) onto an ArrayBuffer.
class ArrayBufferView final : public GC::Cell {
    GC_CELL(ArrayBufferView, GC::Cell);
    GC_DECLARE_ALLOCATOR(ArrayBufferView);

public:
    // Length is in elements, not bytes, except for DataView whose elements are bytes.
    static ExceptionOr<GC::Ref<ArrayBufferView>> create(Realm&, ArrayBufferViewType, ArrayBuffer&, size_t byte_offset, size_t length);
    static ExceptionOr<GC::Ref<ArrayBufferView>> create(Realm&, ArrayBufferViewType, ArrayBuffer&);
    static ExceptionOr<GC::Ref<ArrayBufferView>> create_uint8_array(Realm&, ReadonlyBytes);

    virtual ~ArrayBufferView() override = default;

    ArrayBufferViewType type() const { return m_type; }
    size_t element_size() const { return element_size_of(m_type); }

    ArrayBuffer& viewed_array_buffer() { return m_buffer; }
    ArrayBuffer const& viewed_array_buffer() const { return m_buffer; }

    size_t byte_offset() const { return m_buffer->is_detached() ? 0 : m_byte_offset; }
    size_t byte_length() const { return m_buffer->is_detached() ? 0 : m_length * element_size(); }
    size_t length() const { return m_buffer->is_detached() ? 0 : m_length; }

    ReadonlyBytes bytes() const;

private:
    ArrayBufferView(ArrayBufferViewType, GC::Ref<ArrayBuffer>, size_t byte_offset, size_t length);

    virtual void visit_edges(Cell::Visitor&) override;

    ArrayBufferViewType m_type;
    GC::Ref<ArrayBuffer> m_buffer;
    size_t m_byte_offset { 0 };
    size_t m_length { 0 };
};

// https://tc39.es/ecma262/#sec-transferarraybuffer, without the resize support.
ExceptionOr<GC::Ref<ArrayBuffer>> transfer_array_buffer(Realm&, ArrayBuffer&);

// https://streams.spec.whatwg.org/#can-transfer-array-buffer
bool can_transfer_array_buffer(ArrayBuffer const&);

// https://streams.spec.whatwg.org/#abstract-opdef-cloneasuint8array
ExceptionOr<GC::Ref<ArrayBufferView>> clone_as_uint8_array(Realm&, ArrayBufferView const&);

// https://streams.spec.whatwg.org/#abstract-opdef-cloneasarraybuffer
ExceptionOr<GC::Ref<ArrayBuffer>> clone_as_array_buffer(Realm&, ArrayBuffer const&, size_t offset, size_t length);

// https://tc39.es/ecma262/#sec-copydatablockbytes
void copy_data_block_bytes(ArrayBuffer& destination, size_t destination_index, ArrayBuffer const& source, size_t source_index, size_t count);

}
