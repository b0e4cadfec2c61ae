/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/ByteString.h>
#include <AK/JsonObject.h>
#include <LibCore/System.h>
#include <LibStreams/Settings.h>
#include <LibTest/TestCase.h>

using namespace Streams;

static void expect_defaults(Settings const& settings)
{
    EXPECT(settings.byte_streams_enabled());
    EXPECT_EQ(settings.maximum_auto_allocate_chunk_size(), Settings::default_maximum_auto_allocate_chunk_size);
    EXPECT_EQ(settings.chunk_size(), Settings::default_chunk_size);
    EXPECT(!settings.log_stream_activity());
}

TEST_CASE(defaults)
{
    Settings settings;
    expect_defaults(settings);
    EXPECT_EQ(Settings::default_maximum_auto_allocate_chunk_size, 16 * MiB);
    EXPECT_EQ(Settings::default_chunk_size, 64 * KiB);
}

TEST_CASE(parse_settings)
{
    auto settings = MUST(Settings::parse(R"({
        "byteStreamsEnabled": false,
        "maximumAutoAllocateChunkSize": 4096,
        "defaultChunkSize": 512,
        "logStreamActivity": true
    })"sv));

    EXPECT(!settings.byte_streams_enabled());
    EXPECT_EQ(settings.maximum_auto_allocate_chunk_size(), 4096u);
    EXPECT_EQ(settings.chunk_size(), 512u);
    EXPECT(settings.log_stream_activity());
}

TEST_CASE(unusable_values_keep_their_defaults)
{
    auto settings = MUST(Settings::parse(R"({
        "byteStreamsEnabled": "no",
        "maximumAutoAllocateChunkSize": 0,
        "defaultChunkSize": "large",
        "unknownKey": 1
    })"sv));
    expect_defaults(settings);

    expect_defaults(MUST(Settings::parse("{}"sv)));
}

TEST_CASE(malformed_settings)
{
    EXPECT(Settings::parse("{ \"byteStreamsEnabled\": "sv).is_error());
    EXPECT(Settings::parse("[1, 2, 3]"sv).is_error());
}

TEST_CASE(serialized_settings_parse_back)
{
    Settings settings;
    settings.set_byte_streams_enabled(false);
    settings.set_chunk_size(1024);

    auto json = settings.serialize_json();
    EXPECT(json.is_object());
    EXPECT_EQ(json.as_object().get_bool("byteStreamsEnabled"sv), false);
    EXPECT_EQ(json.as_object().get_u64("defaultChunkSize"sv), 1024u);

    auto parsed = Settings::parse_json(json.as_object());
    EXPECT(!parsed.byte_streams_enabled());
    EXPECT_EQ(parsed.chunk_size(), 1024u);
    EXPECT_EQ(parsed.maximum_auto_allocate_chunk_size(), Settings::default_maximum_auto_allocate_chunk_size);
}

TEST_CASE(save_and_create)
{
    auto directory = ByteString::formatted("/tmp/libstreams-settings-{}", Core::System::getpid());
    auto path = ByteString::formatted("{}/settings.json", directory);

    Settings settings;
    settings.set_maximum_auto_allocate_chunk_size(2048);
    settings.set_log_stream_activity(true);
    MUST(settings.save(path));

    auto loaded = Settings::create(path);
    EXPECT_EQ(loaded.settings_path(), path);
    EXPECT_EQ(loaded.maximum_auto_allocate_chunk_size(), 2048u);
    EXPECT(loaded.log_stream_activity());
    EXPECT(loaded.byte_streams_enabled());

    MUST(Core::System::unlink(path));
    MUST(Core::System::rmdir(directory));
}

TEST_CASE(missing_settings_file)
{
    auto path = ByteString::formatted("/tmp/libstreams-missing-{}/settings.json", Core::System::getpid());

    auto settings = Settings::create(path);
    EXPECT_EQ(settings.settings_path(), path);
    expect_defaults(settings);
}

TEST_CASE(restore_defaults)
{
    auto settings = MUST(Settings::parse(R"({ "byteStreamsEnabled": false, "defaultChunkSize": 8 })"sv));
    EXPECT_EQ(settings.chunk_size(), 8u);

    settings.restore_defaults();
    expect_defaults(settings);
}
