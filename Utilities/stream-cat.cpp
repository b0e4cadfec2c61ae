/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibCore/ArgsParser.h>
#include <LibCore/File.h>
#include <LibGC/Heap.h>
#include <LibMain/Main.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/Realm.h>
#include <LibStreams/StreamCopy.h>

ErrorOr<int> ladybird_main(Main::Arguments arguments)
{
    StringView settings_path;
    size_t chunk_size = 0;
    double high_water_mark = 0;
    bool use_byob_reader = false;
    bool verbose = false;
    Vector<StringView> paths;

    Core::ArgsParser args_parser;
    args_parser.set_general_help("Copy files to standard output through a readable byte stream.");
    args_parser.add_option(settings_path, "Path to a stream settings file", "settings", 's', "path");
    args_parser.add_option(chunk_size, "Bytes to read per pull (default: from settings)", "chunk-size", 'c', "bytes");
    args_parser.add_option(high_water_mark, "Bytes to buffer ahead of the reader (default: 0)", "high-water-mark", 'w', "bytes");
    args_parser.add_option(use_byob_reader, "Read into caller-supplied buffers", "byob", 'b');
    args_parser.add_option(verbose, "Report chunk and byte counts on standard error", "verbose", 'v');
    args_parser.add_positional_argument(paths, "Files to copy, or - for standard input", "files", Core::ArgsParser::Required::No);
    args_parser.parse(arguments);

    if (paths.is_empty())
        paths.append("-"sv);

    auto settings = settings_path.is_empty() ? Streams::Settings {} : Streams::Settings::create(settings_path);
    if (chunk_size != 0)
        settings.set_chunk_size(chunk_size);

    GC::Heap heap(nullptr, [](auto&) {});
    Streams::Realm realm { heap, move(settings) };

    auto output = TRY(Core::File::standard_output());

    for (auto path : paths) {
        auto file = TRY(Core::File::open_file_or_standard_stream(path, Core::File::OpenMode::Read));

        auto stream = Streams::create_readable_byte_stream_from(realm, *file, high_water_mark);
        if (stream.is_exception()) {
            warnln("stream-cat: {}: {}", path, stream.exception().value());
            return 1;
        }

        auto statistics = TRY(Streams::copy_readable_byte_stream(realm, stream.value(), *output, use_byob_reader));

        if (verbose)
            warnln("stream-cat: {}: {} bytes in {} chunks", path, statistics.bytes, statistics.chunks);
    }

    return 0;
}
