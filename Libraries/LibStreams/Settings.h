/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/ByteString.h>
#include <AK/JsonValue.h>
#include <AK/Types.h>

namespace Streams {

class Settings {
public:
    static constexpr size_t default_maximum_auto_allocate_chunk_size = 16 * MiB;
    static constexpr size_t default_chunk_size = 64 * KiB;

    // Reads the settings file at the given path. A missing file yields the defaults; an unreadable or malformed
    // file is reported with warnln() and also yields the defaults.
    static Settings create(ByteString settings_path);

    static ErrorOr<Settings> parse(StringView json);
    static Settings parse_json(JsonObject const&);

    Settings() = default;

    JsonValue serialize_json() const;
    ErrorOr<void> save(StringView settings_path) const;

    void restore_defaults();

    bool byte_streams_enabled() const { return m_byte_streams_enabled; }
    void set_byte_streams_enabled(bool enabled) { m_byte_streams_enabled = enabled; }

    size_t maximum_auto_allocate_chunk_size() const { return m_maximum_auto_allocate_chunk_size; }
    void set_maximum_auto_allocate_chunk_size(size_t);

    size_t chunk_size() const { return m_chunk_size; }
    void set_chunk_size(size_t);

    bool log_stream_activity() const { return m_log_stream_activity; }
    void set_log_stream_activity(bool enabled) { m_log_stream_activity = enabled; }

    ByteString const& settings_path() const { return m_settings_path; }

private:
    explicit Settings(ByteString settings_path);

    ByteString m_settings_path;

    bool m_byte_streams_enabled { true };
    size_t m_maximum_auto_allocate_chunk_size { default_maximum_auto_allocate_chunk_size };
    size_t m_chunk_size { default_chunk_size };
    bool m_log_stream_activity { false };
};

}
