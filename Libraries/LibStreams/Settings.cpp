/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/JsonObject.h>
#include <AK/JsonValue.h>
#include <AK/LexicalPath.h>
#include <LibCore/Directory.h>
#include <LibCore/File.h>
#include <LibStreams/Settings.h>

namespace Streams {

static constexpr auto byte_streams_enabled_key = "byteStreamsEnabled"sv;
static constexpr auto maximum_auto_allocate_chunk_size_key = "maximumAutoAllocateChunkSize"sv;
static constexpr auto chunk_size_key = "defaultChunkSize"sv;
static constexpr auto log_stream_activity_key = "logStreamActivity"sv;

static ErrorOr<JsonObject> read_settings_file(StringView settings_path)
{
    auto settings_file = Core::File::open(settings_path, Core::File::OpenMode::Read);
    if (settings_file.is_error()) {
        if (settings_file.error().is_errno() && settings_file.error().code() == ENOENT)
            return JsonObject {};
        return settings_file.release_error();
    }

    auto settings_contents = TRY(settings_file.value()->read_until_eof());
    auto settings_json = TRY(JsonValue::from_string(settings_contents));

    if (!settings_json.is_object())
        return Error::from_string_literal("Expected stream settings to be a JSON object");
    return move(settings_json.as_object());
}

Settings Settings::create(ByteString settings_path)
{
    auto settings_json = read_settings_file(settings_path);
    if (settings_json.is_error()) {
        warnln("Unable to read stream settings from {}: {}", settings_path, settings_json.error());
        return Settings { move(settings_path) };
    }

    auto settings = parse_json(settings_json.value());
    settings.m_settings_path = move(settings_path);
    return settings;
}

ErrorOr<Settings> Settings::parse(StringView json)
{
    auto settings_json = TRY(JsonValue::from_string(json));
    if (!settings_json.is_object())
        return Error::from_string_literal("Expected stream settings to be a JSON object");
    return parse_json(settings_json.as_object());
}

Settings Settings::parse_json(JsonObject const& settings_json)
{
    Settings settings;

    if (auto enabled = settings_json.get_bool(byte_streams_enabled_key); enabled.has_value())
        settings.m_byte_streams_enabled = *enabled;

    // Zero is not a usable size for either value, so it is treated the same as an absent key.
    if (auto size = settings_json.get_u64(maximum_auto_allocate_chunk_size_key); size.has_value() && *size > 0)
        settings.m_maximum_auto_allocate_chunk_size = static_cast<size_t>(*size);

    if (auto size = settings_json.get_u64(chunk_size_key); size.has_value() && *size > 0)
        settings.m_chunk_size = static_cast<size_t>(*size);

    if (auto enabled = settings_json.get_bool(log_stream_activity_key); enabled.has_value())
        settings.m_log_stream_activity = *enabled;

    return settings;
}

Settings::Settings(ByteString settings_path)
    : m_settings_path(move(settings_path))
{
}

JsonValue Settings::serialize_json() const
{
    JsonObject settings;
    settings.set(byte_streams_enabled_key, m_byte_streams_enabled);
    settings.set(maximum_auto_allocate_chunk_size_key, static_cast<u64>(m_maximum_auto_allocate_chunk_size));
    settings.set(chunk_size_key, static_cast<u64>(m_chunk_size));
    settings.set(log_stream_activity_key, m_log_stream_activity);
    return settings;
}

ErrorOr<void> Settings::save(StringView settings_path) const
{
    auto settings_directory = LexicalPath { settings_path }.parent();
    TRY(Core::Directory::create(settings_directory, Core::Directory::CreateDirectories::Yes));

    auto settings_file = TRY(Core::File::open(settings_path, Core::File::OpenMode::Write));
    TRY(settings_file->write_until_depleted(serialize_json().serialized()));

    return {};
}

void Settings::restore_defaults()
{
    m_byte_streams_enabled = true;
    m_maximum_auto_allocate_chunk_size = default_maximum_auto_allocate_chunk_size;
    m_chunk_size = default_chunk_size;
    m_log_stream_activity = false;
}

void Settings::set_maximum_auto_allocate_chunk_size(size_t size)
{
    VERIFY(size > 0);
    m_maximum_auto_allocate_chunk_size = size;
}

void Settings::set_chunk_size(size_t size)
{
    VERIFY(size > 0);
    m_chunk_size = size;
}

}
