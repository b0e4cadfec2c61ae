/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibStreams/ActivityLog.h>
#include <LibStreams/ArrayBuffer.h>
#include <LibStreams/Promise.h>
#include <LibStreams/ReadableByteStreamController.h>
#include <LibStreams/ReadableStream.h>
#include <LibStreams/ReadableStreamBYOBReader.h>
#include <LibStreams/ReadableStreamBYOBRequest.h>
#include <LibStreams/ReadableStreamDefaultController.h>
#include <LibStreams/ReadableStreamDefaultReader.h>
#include <LibStreams/ReadableStreamOperations.h>

namespace Streams {

static ReadableStreamDefaultController& default_controller_of(ReadableStream& stream)
{
    return stream.controller()->get<GC::Ref<ReadableStreamDefaultController>>();
}

static ReadableByteStreamController& byte_controller_of(ReadableStream& stream)
{
    return stream.controller()->get<GC::Ref<ReadableByteStreamController>>();
}

// The state shared by the algorithms of both branches of a default tee.
class ReadableStreamTeeParams final : public GC::Cell {
    GC_CELL(ReadableStreamTeeParams, GC::Cell);
    GC_DECLARE_ALLOCATOR(ReadableStreamTeeParams);

public:
    bool reading { false };
    bool read_again { false };
    bool canceled1 { false };
    bool canceled2 { false };
    Value reason1;
    Value reason2;
    GC::Ptr<ReadableStream> branch1;
    GC::Ptr<ReadableStream> branch2;
    GC::Ptr<PullAlgorithm> pull_algorithm;

private:
    ReadableStreamTeeParams() = default;

    virtual void visit_edges(Visitor& visitor) override
    {
        Base::visit_edges(visitor);
        reason1.visit_edges(visitor);
        reason2.visit_edges(visitor);
        visitor.visit(branch1);
        visitor.visit(branch2);
        visitor.visit(pull_algorithm);
    }
};

GC_DEFINE_ALLOCATOR(ReadableStreamTeeParams);

// https://streams.spec.whatwg.org/#ref-for-read-request③
class ReadableStreamTeeReadRequest final : public ReadRequest {
    GC_CELL(ReadableStreamTeeReadRequest, ReadRequest);
    GC_DECLARE_ALLOCATOR(ReadableStreamTeeReadRequest);

public:
    ReadableStreamTeeReadRequest(
        Realm& realm,
        GC::Ref<ReadableStream> stream,
        GC::Ref<ReadableStreamTeeParams> params,
        GC::Ref<Promise<Value>> cancel_promise,
        bool clone_for_branch2)
        : m_realm(realm)
        , m_stream(stream)
        , m_params(params)
        , m_cancel_promise(cancel_promise)
        , m_clone_for_branch2(clone_for_branch2)
    {
    }

    // https://streams.spec.whatwg.org/#ref-for-read-request-chunk-steps③
    virtual void on_chunk(Value chunk) override
    {
        // 1. Queue a microtask to perform the following steps:
        m_realm.queue_microtask(GC::create_function(m_realm.heap(), [this, chunk = move(chunk)]() {
            // 1. Set readAgain to false.
            m_params->read_again = false;

            // 2. Let chunk1 and chunk2 be chunk.
            auto chunk1 = chunk;
            auto chunk2 = chunk;

            // 3. If canceled2 is false and cloneForBranch2 is true,
            if (!m_params->canceled2 && m_clone_for_branch2) {
                // 1. Let cloneResult be StructuredClone(chunk2).
                auto clone_result = structured_clone(m_realm, chunk2);

                // 2. If cloneResult is an abrupt completion,
                if (clone_result.is_exception()) {
                    auto error = clone_result.exception().value();

                    // 1. Perform ! ReadableStreamDefaultControllerError(branch1.[[controller]], cloneResult.[[Value]]).
                    readable_stream_default_controller_error(default_controller_of(*m_params->branch1), error);

                    // 2. Perform ! ReadableStreamDefaultControllerError(branch2.[[controller]], cloneResult.[[Value]]).
                    readable_stream_default_controller_error(default_controller_of(*m_params->branch2), error);

                    // 3. Resolve cancelPromise with ! ReadableStreamCancel(stream, cloneResult.[[Value]]).
                    resolve_promise(m_cancel_promise, readable_stream_cancel(m_stream, error));

                    // 4. Return.
                    return;
                }

                // 3. Otherwise, set chunk2 to cloneResult.[[Value]].
                chunk2 = clone_result.release_value();
            }

            // 4. If canceled1 is false, perform ! ReadableStreamDefaultControllerEnqueue(branch1.[[controller]], chunk1).
            if (!m_params->canceled1)
                MUST(readable_stream_default_controller_enqueue(default_controller_of(*m_params->branch1), chunk1));

            // 5. If canceled2 is false, perform ! ReadableStreamDefaultControllerEnqueue(branch2.[[controller]], chunk2).
            if (!m_params->canceled2)
                MUST(readable_stream_default_controller_enqueue(default_controller_of(*m_params->branch2), chunk2));

            // 6. Set reading to false.
            m_params->reading = false;

            // 7. If readAgain is true, perform pullAlgorithm.
            if (m_params->read_again)
                m_params->pull_algorithm->function()();
        }));

        // NOTE: The microtask delay here is necessary because it takes at least a microtask to detect errors, when we
        //       use reader.[[closedPromise]] below. We want errors in stream to error both branches immediately, so we
        //       cannot let successful synchronously-available reads happen ahead of asynchronously-available errors.
    }

    // https://streams.spec.whatwg.org/#ref-for-read-request-close-steps②
    virtual void on_close() override
    {
        // 1. Set reading to false.
        m_params->reading = false;

        // 2. If canceled1 is false, perform ! ReadableStreamDefaultControllerClose(branch1.[[controller]]).
        if (!m_params->canceled1)
            readable_stream_default_controller_close(default_controller_of(*m_params->branch1));

        // 3. If canceled2 is false, perform ! ReadableStreamDefaultControllerClose(branch2.[[controller]]).
        if (!m_params->canceled2)
            readable_stream_default_controller_close(default_controller_of(*m_params->branch2));

        // 4. If canceled1 is false or canceled2 is false, resolve cancelPromise with undefined.
        if (!m_params->canceled1 || !m_params->canceled2)
            resolve_promise(m_cancel_promise, js_undefined());
    }

    // https://streams.spec.whatwg.org/#ref-for-read-request-error-steps③
    virtual void on_error(Value) override
    {
        // 1. Set reading to false.
        m_params->reading = false;
    }

private:
    virtual void visit_edges(Visitor& visitor) override
    {
        Base::visit_edges(visitor);
        visitor.visit(m_stream);
        visitor.visit(m_params);
        visitor.visit(m_cancel_promise);
    }

    Realm& m_realm;
    GC::Ref<ReadableStream> m_stream;
    GC::Ref<ReadableStreamTeeParams> m_params;
    GC::Ref<Promise<Value>> m_cancel_promise;
    bool m_clone_for_branch2 { false };
};

GC_DEFINE_ALLOCATOR(ReadableStreamTeeReadRequest);

// https://streams.spec.whatwg.org/#abstract-opdef-readablestreamdefaulttee
ExceptionOr<ReadableStreamPair> readable_stream_default_tee(Realm& realm, ReadableStream& stream, bool clone_for_branch2)
{
    // 1. Assert: stream implements ReadableStream.
    // 2. Assert: cloneForBranch2 is a boolean.

    // 3. Let reader be ? AcquireReadableStreamDefaultReader(stream).
    auto reader = TRY(acquire_readable_stream_default_reader(stream));

    log_stream_activity(realm, "ReadableStream {:p}: teeing with a default reader, clone for branch 2: {}", &stream, clone_for_branch2);

    // 4. Let reading be false.
    // 5. Let readAgain be false.
    // 6. Let canceled1 be false.
    // 7. Let canceled2 be false.
    // 8. Let reason1 be undefined.
    // 9. Let reason2 be undefined.
    // 10. Let branch1 be undefined.
    // 11. Let branch2 be undefined.
    auto params = realm.create<ReadableStreamTeeParams>();

    // 12. Let cancelPromise be a new promise.
    auto cancel_promise = create_promise(realm);

    // 13. Let pullAlgorithm be the following steps:
    auto pull_algorithm = GC::create_function(realm.heap(), [&realm, stream = GC::Ref { stream }, reader, params, cancel_promise, clone_for_branch2]() {
        // 1. If reading is true,
        if (params->reading) {
            // 1. Set readAgain to true.
            params->read_again = true;

            // 2. Return a promise resolved with undefined.
            return create_resolved_promise(realm, js_undefined());
        }

        // 2. Set reading to true.
        params->reading = true;

        // 3. Let readRequest be a read request with the following items:
        auto read_request = realm.create<ReadableStreamTeeReadRequest>(realm, stream, params, cancel_promise, clone_for_branch2);

        // 4. Perform ! ReadableStreamDefaultReaderRead(reader, readRequest).
        readable_stream_default_reader_read(reader, read_request);

        // 5. Return a promise resolved with undefined.
        return create_resolved_promise(realm, js_undefined());
    });

    params->pull_algorithm = pull_algorithm;

    // 14. Let cancel1Algorithm be the following steps, taking a reason argument:
    auto cancel1_algorithm = GC::create_function(realm.heap(), [&realm, stream = GC::Ref { stream }, params, cancel_promise](Value const& reason) {
        // 1. Set canceled1 to true.
        params->canceled1 = true;

        // 2. Set reason1 to reason.
        params->reason1 = reason;

        // 3. If canceled2 is true,
        if (params->canceled2) {
            // 1. Let compositeReason be ! CreateArrayFromList(« reason1, reason2 »).
            auto composite_reason = Array::create_from(realm, { params->reason1, params->reason2 });

            // 2. Let cancelResult be ! ReadableStreamCancel(stream, compositeReason).
            auto cancel_result = readable_stream_cancel(stream, composite_reason);

            // 3. Resolve cancelPromise with cancelResult.
            resolve_promise(cancel_promise, cancel_result);
        }

        // 4. Return cancelPromise.
        return cancel_promise;
    });

    // 15. Let cancel2Algorithm be the following steps, taking a reason argument:
    auto cancel2_algorithm = GC::create_function(realm.heap(), [&realm, stream = GC::Ref { stream }, params, cancel_promise](Value const& reason) {
        // 1. Set canceled2 to true.
        params->canceled2 = true;

        // 2. Set reason2 to reason.
        params->reason2 = reason;

        // 3. If canceled1 is true,
        if (params->canceled1) {
            // 1. Let compositeReason be ! CreateArrayFromList(« reason1, reason2 »).
            auto composite_reason = Array::create_from(realm, { params->reason1, params->reason2 });

            // 2. Let cancelResult be ! ReadableStreamCancel(stream, compositeReason).
            auto cancel_result = readable_stream_cancel(stream, composite_reason);

            // 3. Resolve cancelPromise with cancelResult.
            resolve_promise(cancel_promise, cancel_result);
        }

        // 4. Return cancelPromise.
        return cancel_promise;
    });

    // 16. Let startAlgorithm be an algorithm that returns undefined.
    auto start_algorithm = GC::create_function(realm.heap(), []() -> ExceptionOr<Value> {
        return js_undefined();
    });

    // 17. Set branch1 to ! CreateReadableStream(startAlgorithm, pullAlgorithm, cancel1Algorithm).
    params->branch1 = MUST(create_readable_stream(realm, start_algorithm, pull_algorithm, cancel1_algorithm));

    // 18. Set branch2 to ! CreateReadableStream(startAlgorithm, pullAlgorithm, cancel2Algorithm).
    params->branch2 = MUST(create_readable_stream(realm, start_algorithm, pull_algorithm, cancel2_algorithm));

    // 19. Upon rejection of reader.[[closedPromise]] with reason r,
    upon_rejection(*reader->closed_promise(), GC::create_function(realm.heap(), [params, cancel_promise](Value const& reason) {
        // 1. Perform ! ReadableStreamDefaultControllerError(branch1.[[controller]], r).
        readable_stream_default_controller_error(default_controller_of(*params->branch1), reason);

        // 2. Perform ! ReadableStreamDefaultControllerError(branch2.[[controller]], r).
        readable_stream_default_controller_error(default_controller_of(*params->branch2), reason);

        // 3. If canceled1 is false or canceled2 is false, resolve cancelPromise with undefined.
        if (!params->canceled1 || !params->canceled2)
            resolve_promise(cancel_promise, js_undefined());
    }));

    // 20. Return « branch1, branch2 ».
    return ReadableStreamPair { *params->branch1, *params->branch2 };
}

// The state shared by the algorithms of both branches of a byte stream tee.
class ReadableByteStreamTeeParams final : public GC::Cell {
    GC_CELL(ReadableByteStreamTeeParams, GC::Cell);
    GC_DECLARE_ALLOCATOR(ReadableByteStreamTeeParams);

public:
    explicit ReadableByteStreamTeeParams(ReadableStreamReader reader)
        : reader(move(reader))
    {
    }

    bool reading { false };
    bool read_again_for_branch1 { false };
    bool read_again_for_branch2 { false };
    bool canceled1 { false };
    bool canceled2 { false };
    Value reason1;
    Value reason2;
    GC::Ptr<ReadableStream> branch1;
    GC::Ptr<ReadableStream> branch2;
    GC::Ptr<PullAlgorithm> pull1_algorithm;
    GC::Ptr<PullAlgorithm> pull2_algorithm;
    ReadableStreamReader reader;

private:
    virtual void visit_edges(Visitor& visitor) override
    {
        Base::visit_edges(visitor);
        reason1.visit_edges(visitor);
        reason2.visit_edges(visitor);
        visitor.visit(branch1);
        visitor.visit(branch2);
        visitor.visit(pull1_algorithm);
        visitor.visit(pull2_algorithm);
        reader.visit([&](auto const& underlying_reader) { visitor.visit(underlying_reader); });
    }
};

GC_DEFINE_ALLOCATOR(ReadableByteStreamTeeParams);

static ReadableStreamGenericReaderMixin& generic_reader(ReadableStreamReader const& reader)
{
    return reader.visit([](auto const& reader) -> ReadableStreamGenericReaderMixin& { return *reader; });
}

// https://streams.spec.whatwg.org/#ref-for-read-request④
class ReadableByteStreamTeeDefaultReadRequest final : public ReadRequest {
    GC_CELL(ReadableByteStreamTeeDefaultReadRequest, ReadRequest);
    GC_DECLARE_ALLOCATOR(ReadableByteStreamTeeDefaultReadRequest);

public:
    ReadableByteStreamTeeDefaultReadRequest(
        Realm& realm,
        GC::Ref<ReadableStream> stream,
        GC::Ref<ReadableByteStreamTeeParams> params,
        GC::Ref<Promise<Value>> cancel_promise)
        : m_realm(realm)
        , m_stream(stream)
        , m_params(params)
        , m_cancel_promise(cancel_promise)
    {
    }

    // https://streams.spec.whatwg.org/#ref-for-read-request-chunk-steps④
    virtual void on_chunk(Value chunk) override
    {
        // 1. Queue a microtask to perform the following steps:
        m_realm.queue_microtask(GC::create_function(m_realm.heap(), [this, chunk = move(chunk)]() {
            auto& controller1 = byte_controller_of(*m_params->branch1);
            auto& controller2 = byte_controller_of(*m_params->branch2);

            // 1. Set readAgainForBranch1 to false.
            m_params->read_again_for_branch1 = false;

            // 2. Set readAgainForBranch2 to false.
            m_params->read_again_for_branch2 = false;

            // 3. Let chunk1 and chunk2 be chunk.
            GC::Ref<ArrayBufferView> chunk1 = chunk.as_array_buffer_view();
            GC::Ref<ArrayBufferView> chunk2 = chunk1;

            // 4. If canceled1 is false and canceled2 is false,
            if (!m_params->canceled1 && !m_params->canceled2) {
                // 1. Let cloneResult be CloneAsUint8Array(chunk).
                auto clone_result = clone_as_uint8_array(m_realm, chunk1);

                // 2. If cloneResult is an abrupt completion,
                if (clone_result.is_exception()) {
                    auto error = clone_result.exception().value();

                    // 1. Perform ! ReadableByteStreamControllerError(branch1.[[controller]], cloneResult.[[Value]]).
                    readable_byte_stream_controller_error(controller1, error);

                    // 2. Perform ! ReadableByteStreamControllerError(branch2.[[controller]], cloneResult.[[Value]]).
                    readable_byte_stream_controller_error(controller2, error);

                    // 3. Resolve cancelPromise with ! ReadableStreamCancel(stream, cloneResult.[[Value]]).
                    resolve_promise(m_cancel_promise, readable_stream_cancel(m_stream, error));

                    // 4. Return.
                    return;
                }

                // 3. Otherwise, set chunk2 to cloneResult.[[Value]].
                chunk2 = clone_result.release_value();
            }

            // 5. If canceled1 is false, perform ! ReadableByteStreamControllerEnqueue(branch1.[[controller]], chunk1).
            if (!m_params->canceled1)
                MUST(readable_byte_stream_controller_enqueue(controller1, chunk1));

            // 6. If canceled2 is false, perform ! ReadableByteStreamControllerEnqueue(branch2.[[controller]], chunk2).
            if (!m_params->canceled2)
                MUST(readable_byte_stream_controller_enqueue(controller2, chunk2));

            // 7. Set reading to false.
            m_params->reading = false;

            // 8. If readAgainForBranch1 is true, perform pull1Algorithm.
            if (m_params->read_again_for_branch1) {
                m_params->pull1_algorithm->function()();
            }
            // 9. Otherwise, if readAgainForBranch2 is true, perform pull2Algorithm.
            else if (m_params->read_again_for_branch2) {
                m_params->pull2_algorithm->function()();
            }
        }));

        // NOTE: The microtask delay here is necessary because it takes at least a microtask to detect errors, when we
        //       use reader.[[closedPromise]] below. We want errors in stream to error both branches immediately, so we
        //       cannot let successful synchronously-available reads happen ahead of asynchronously-available errors.
    }

    // https://streams.spec.whatwg.org/#ref-for-read-request-close-steps③
    virtual void on_close() override
    {
        auto& controller1 = byte_controller_of(*m_params->branch1);
        auto& controller2 = byte_controller_of(*m_params->branch2);

        // 1. Set reading to false.
        m_params->reading = false;

        // 2. If canceled1 is false, perform ! ReadableByteStreamControllerClose(branch1.[[controller]]).
        if (!m_params->canceled1)
            MUST(readable_byte_stream_controller_close(controller1));

        // 3. If canceled2 is false, perform ! ReadableByteStreamControllerClose(branch2.[[controller]]).
        if (!m_params->canceled2)
            MUST(readable_byte_stream_controller_close(controller2));

        // 4. If branch1.[[controller]].[[pendingPullIntos]] is not empty, perform ! ReadableByteStreamControllerRespond(branch1.[[controller]], 0).
        if (!controller1.pending_pull_intos().is_empty())
            MUST(readable_byte_stream_controller_respond(controller1, 0));

        // 5. If branch2.[[controller]].[[pendingPullIntos]] is not empty, perform ! ReadableByteStreamControllerRespond(branch2.[[controller]], 0).
        if (!controller2.pending_pull_intos().is_empty())
            MUST(readable_byte_stream_controller_respond(controller2, 0));

        // 6. If canceled1 is false or canceled2 is false, resolve cancelPromise with undefined.
        if (!m_params->canceled1 || !m_params->canceled2)
            resolve_promise(m_cancel_promise, js_undefined());
    }

    // https://streams.spec.whatwg.org/#ref-for-read-request-error-steps④
    virtual void on_error(Value) override
    {
        // 1. Set reading to false.
        m_params->reading = false;
    }

private:
    virtual void visit_edges(Visitor& visitor) override
    {
        Base::visit_edges(visitor);
        visitor.visit(m_stream);
        visitor.visit(m_params);
        visitor.visit(m_cancel_promise);
    }

    Realm& m_realm;
    GC::Ref<ReadableStream> m_stream;
    GC::Ref<ReadableByteStreamTeeParams> m_params;
    GC::Ref<Promise<Value>> m_cancel_promise;
};

GC_DEFINE_ALLOCATOR(ReadableByteStreamTeeDefaultReadRequest);

// https://streams.spec.whatwg.org/#ref-for-read-into-request②
class ReadableByteStreamTeeBYOBReadRequest final : public ReadIntoRequest {
    GC_CELL(ReadableByteStreamTeeBYOBReadRequest, ReadIntoRequest);
    GC_DECLARE_ALLOCATOR(ReadableByteStreamTeeBYOBReadRequest);

public:
    ReadableByteStreamTeeBYOBReadRequest(
        Realm& realm,
        GC::Ref<ReadableStream> stream,
        GC::Ref<ReadableByteStreamTeeParams> params,
        GC::Ref<Promise<Value>> cancel_promise,
        GC::Ref<ReadableStream> byob_branch,
        GC::Ref<ReadableStream> other_branch,
        bool for_branch2)
        : m_realm(realm)
        , m_stream(stream)
        , m_params(params)
        , m_cancel_promise(cancel_promise)
        , m_byob_branch(byob_branch)
        , m_other_branch(other_branch)
        , m_for_branch2(for_branch2)
    {
    }

    // https://streams.spec.whatwg.org/#ref-for-read-into-request-chunk-steps①
    virtual void on_chunk(Value chunk) override
    {
        // 1. Queue a microtask to perform the following steps:
        m_realm.queue_microtask(GC::create_function(m_realm.heap(), [this, chunk = move(chunk)]() {
            auto& byob_controller = byte_controller_of(m_byob_branch);
            auto& other_controller = byte_controller_of(m_other_branch);
            auto& chunk_view = chunk.as_array_buffer_view();

            // 1. Set readAgainForBranch1 to false.
            m_params->read_again_for_branch1 = false;

            // 2. Set readAgainForBranch2 to false.
            m_params->read_again_for_branch2 = false;

            // 3. Let byobCanceled be canceled2 if forBranch2 is true, and canceled1 otherwise.
            auto byob_canceled = m_for_branch2 ? m_params->canceled2 : m_params->canceled1;

            // 4. Let otherCanceled be canceled2 if forBranch2 is false, and canceled1 otherwise.
            auto other_canceled = !m_for_branch2 ? m_params->canceled2 : m_params->canceled1;

            // 5. If otherCanceled is false,
            if (!other_canceled) {
                // 1. Let cloneResult be CloneAsUint8Array(chunk).
                auto clone_result = clone_as_uint8_array(m_realm, chunk_view);

                // 2. If cloneResult is an abrupt completion,
                if (clone_result.is_exception()) {
                    auto error = clone_result.exception().value();

                    // 1. Perform ! ReadableByteStreamControllerError(byobBranch.[[controller]], cloneResult.[[Value]]).
                    readable_byte_stream_controller_error(byob_controller, error);

                    // 2. Perform ! ReadableByteStreamControllerError(otherBranch.[[controller]], cloneResult.[[Value]]).
                    readable_byte_stream_controller_error(other_controller, error);

                    // 3. Resolve cancelPromise with ! ReadableStreamCancel(stream, cloneResult.[[Value]]).
                    resolve_promise(m_cancel_promise, readable_stream_cancel(m_stream, error));

                    // 4. Return.
                    return;
                }

                // 3. Otherwise, let clonedChunk be cloneResult.[[Value]].
                auto cloned_chunk = clone_result.release_value();

                // 4. If byobCanceled is false, perform ! ReadableByteStreamControllerRespondWithNewView(byobBranch.[[controller]], chunk).
                if (!byob_canceled)
                    MUST(readable_byte_stream_controller_respond_with_new_view(byob_controller, chunk_view));

                // 5. Perform ! ReadableByteStreamControllerEnqueue(otherBranch.[[controller]], clonedChunk).
                MUST(readable_byte_stream_controller_enqueue(other_controller, cloned_chunk));
            }
            // 6. Otherwise, if byobCanceled is false, perform ! ReadableByteStreamControllerRespondWithNewView(byobBranch.[[controller]], chunk).
            else if (!byob_canceled) {
                MUST(readable_byte_stream_controller_respond_with_new_view(byob_controller, chunk_view));
            }

            // 7. Set reading to false.
            m_params->reading = false;

            // 8. If readAgainForBranch1 is true, perform pull1Algorithm.
            if (m_params->read_again_for_branch1) {
                m_params->pull1_algorithm->function()();
            }
            // 9. Otherwise, if readAgainForBranch2 is true, perform pull2Algorithm.
            else if (m_params->read_again_for_branch2) {
                m_params->pull2_algorithm->function()();
            }
        }));

        // NOTE: The microtask delay here is necessary because it takes at least a microtask to detect errors, when we
        //       use reader.[[closedPromise]] below. We want errors in stream to error both branches immediately, so we
        //       cannot let successful synchronously-available reads happen ahead of asynchronously-available errors.
    }

    // https://streams.spec.whatwg.org/#ref-for-read-into-request-close-steps②
    virtual void on_close(Value chunk) override
    {
        auto& byob_controller = byte_controller_of(m_byob_branch);
        auto& other_controller = byte_controller_of(m_other_branch);

        // 1. Set reading to false.
        m_params->reading = false;

        // 2. Let byobCanceled be canceled2 if forBranch2 is true, and canceled1 otherwise.
        auto byob_canceled = m_for_branch2 ? m_params->canceled2 : m_params->canceled1;

        // 3. Let otherCanceled be canceled2 if forBranch2 is false, and canceled1 otherwise.
        auto other_canceled = !m_for_branch2 ? m_params->canceled2 : m_params->canceled1;

        // 4. If byobCanceled is false, perform ! ReadableByteStreamControllerClose(byobBranch.[[controller]]).
        if (!byob_canceled)
            MUST(readable_byte_stream_controller_close(byob_controller));

        // 5. If otherCanceled is false, perform ! ReadableByteStreamControllerClose(otherBranch.[[controller]]).
        if (!other_canceled)
            MUST(readable_byte_stream_controller_close(other_controller));

        // 6. If chunk is not undefined,
        if (!chunk.is_undefined()) {
            auto& chunk_view = chunk.as_array_buffer_view();

            // 1. Assert: chunk.[[ByteLength]] is 0.
            VERIFY(chunk_view.byte_length() == 0);

            // 2. If byobCanceled is false, perform ! ReadableByteStreamControllerRespondWithNewView(byobBranch.[[controller]], chunk).
            if (!byob_canceled)
                MUST(readable_byte_stream_controller_respond_with_new_view(byob_controller, chunk_view));

            // 3. If otherCanceled is false and otherBranch.[[controller]].[[pendingPullIntos]] is not empty,
            //    perform ! ReadableByteStreamControllerRespond(otherBranch.[[controller]], 0).
            if (!other_canceled && !other_controller.pending_pull_intos().is_empty())
                MUST(readable_byte_stream_controller_respond(other_controller, 0));
        }

        // 7. If byobCanceled is false or otherCanceled is false, resolve cancelPromise with undefined.
        if (!byob_canceled || !other_canceled)
            resolve_promise(m_cancel_promise, js_undefined());
    }

    // https://streams.spec.whatwg.org/#ref-for-read-into-request-error-steps①
    virtual void on_error(Value) override
    {
        // 1. Set reading to false.
        m_params->reading = false;
    }

private:
    virtual void visit_edges(Visitor& visitor) override
    {
        Base::visit_edges(visitor);
        visitor.visit(m_stream);
        visitor.visit(m_params);
        visitor.visit(m_cancel_promise);
        visitor.visit(m_byob_branch);
        visitor.visit(m_other_branch);
    }

    Realm& m_realm;
    GC::Ref<ReadableStream> m_stream;
    GC::Ref<ReadableByteStreamTeeParams> m_params;
    GC::Ref<Promise<Value>> m_cancel_promise;
    GC::Ref<ReadableStream> m_byob_branch;
    GC::Ref<ReadableStream> m_other_branch;
    bool m_for_branch2 { false };
};

GC_DEFINE_ALLOCATOR(ReadableByteStreamTeeBYOBReadRequest);

// https://streams.spec.whatwg.org/#abstract-opdef-readablebytestreamtee
ExceptionOr<ReadableStreamPair> readable_byte_stream_tee(Realm& realm, ReadableStream& stream)
{
    // 1. Assert: stream implements ReadableStream.
    // 2. Assert: stream.[[controller]] implements ReadableByteStreamController.
    VERIFY(stream.has_byte_controller());

    // 3. Let reader be ? AcquireReadableStreamDefaultReader(stream).
    auto reader = TRY(acquire_readable_stream_default_reader(stream));

    log_stream_activity(realm, "ReadableStream {:p}: teeing a byte stream", &stream);

    // 4. Let reading be false.
    // 5. Let readAgainForBranch1 be false.
    // 6. Let readAgainForBranch2 be false.
    // 7. Let canceled1 be false.
    // 8. Let canceled2 be false.
    // 9. Let reason1 be undefined.
    // 10. Let reason2 be undefined.
    // 11. Let branch1 be undefined.
    // 12. Let branch2 be undefined.
    auto params = realm.create<ReadableByteStreamTeeParams>(ReadableStreamReader { reader });

    // 13. Let cancelPromise be a new promise.
    auto cancel_promise = create_promise(realm);

    // 14. Let forwardReaderError be the following steps, taking a thisReader argument:
    auto forward_reader_error = [&realm, params, cancel_promise](ReadableStreamReader const& this_reader) {
        // 1. Upon rejection of thisReader.[[closedPromise]] with reason r,
        upon_rejection(*generic_reader(this_reader).closed_promise(), GC::create_function(realm.heap(), [params, cancel_promise, this_reader](Value const& reason) {
            // 1. If thisReader is not reader, return.
            if (&generic_reader(params->reader) != &generic_reader(this_reader))
                return;

            // 2. Perform ! ReadableByteStreamControllerError(branch1.[[controller]], r).
            readable_byte_stream_controller_error(byte_controller_of(*params->branch1), reason);

            // 3. Perform ! ReadableByteStreamControllerError(branch2.[[controller]], r).
            readable_byte_stream_controller_error(byte_controller_of(*params->branch2), reason);

            // 4. If canceled1 is false or canceled2 is false, resolve cancelPromise with undefined.
            if (!params->canceled1 || !params->canceled2)
                resolve_promise(cancel_promise, js_undefined());
        }));
    };

    // 15. Let pullWithDefaultReader be the following steps:
    auto pull_with_default_reader = [&realm, stream = GC::Ref { stream }, params, cancel_promise, forward_reader_error]() {
        // 1. If reader implements ReadableStreamBYOBReader,
        if (auto const* byob_reader = params->reader.get_pointer<GC::Ref<ReadableStreamBYOBReader>>()) {
            // 1. Assert: reader.[[readIntoRequests]] is empty.
            VERIFY((*byob_reader)->read_into_requests().is_empty());

            // 2. Perform ! ReadableStreamBYOBReaderRelease(reader).
            readable_stream_byob_reader_release(*byob_reader);

            // 3. Set reader to ! AcquireReadableStreamDefaultReader(stream).
            params->reader = ReadableStreamReader { MUST(acquire_readable_stream_default_reader(stream)) };

            // 4. Perform forwardReaderError, given reader.
            forward_reader_error(params->reader);
        }

        // 2. Let readRequest be a read request with the following items:
        auto read_request = realm.create<ReadableByteStreamTeeDefaultReadRequest>(realm, stream, params, cancel_promise);

        // 3. Perform ! ReadableStreamDefaultReaderRead(reader, readRequest).
        readable_stream_default_reader_read(params->reader.get<GC::Ref<ReadableStreamDefaultReader>>(), read_request);
    };

    // 16. Let pullWithBYOBReader be the following steps, given view and forBranch2:
    auto pull_with_byob_reader = [&realm, stream = GC::Ref { stream }, params, cancel_promise, forward_reader_error](GC::Ref<ArrayBufferView> view, bool for_branch2) {
        // 1. If reader implements ReadableStreamDefaultReader,
        if (auto const* default_reader = params->reader.get_pointer<GC::Ref<ReadableStreamDefaultReader>>()) {
            // 1. Assert: reader.[[readRequests]] is empty.
            VERIFY((*default_reader)->read_requests().is_empty());

            // 2. Perform ! ReadableStreamDefaultReaderRelease(reader).
            readable_stream_default_reader_release(*default_reader);

            // 3. Set reader to ! AcquireReadableStreamBYOBReader(stream).
            params->reader = ReadableStreamReader { MUST(acquire_readable_stream_byob_reader(stream)) };

            // 4. Perform forwardReaderError, given reader.
            forward_reader_error(params->reader);
        }

        // 2. Let byobBranch be branch2 if forBranch2 is true, and branch1 otherwise.
        auto byob_branch = for_branch2 ? params->branch2 : params->branch1;

        // 3. Let otherBranch be branch2 if forBranch2 is false, and branch1 otherwise.
        auto other_branch = !for_branch2 ? params->branch2 : params->branch1;

        // 4. Let readIntoRequest be a read-into request with the following items:
        auto read_into_request = realm.create<ReadableByteStreamTeeBYOBReadRequest>(realm, stream, params, cancel_promise, *byob_branch, *other_branch, for_branch2);

        // 5. Perform ! ReadableStreamBYOBReaderRead(reader, view, 1, readIntoRequest).
        readable_stream_byob_reader_read(params->reader.get<GC::Ref<ReadableStreamBYOBReader>>(), view, 1, read_into_request);
    };

    // 17. Let pull1Algorithm be the following steps:
    auto pull1_algorithm = GC::create_function(realm.heap(), [&realm, params, pull_with_default_reader, pull_with_byob_reader]() {
        // 1. If reading is true,
        if (params->reading) {
            // 1. Set readAgainForBranch1 to true.
            params->read_again_for_branch1 = true;

            // 2. Return a promise resolved with undefined.
            return create_resolved_promise(realm, js_undefined());
        }

        // 2. Set reading to true.
        params->reading = true;

        // 3. Let byobRequest be ! ReadableByteStreamControllerGetBYOBRequest(branch1.[[controller]]).
        auto byob_request = readable_byte_stream_controller_get_byob_request(byte_controller_of(*params->branch1));

        // 4. If byobRequest is null, perform pullWithDefaultReader.
        if (!byob_request) {
            pull_with_default_reader();
        }
        // 5. Otherwise, perform pullWithBYOBReader, given byobRequest.[[view]] and false.
        else {
            pull_with_byob_reader(*byob_request->view(), false);
        }

        // 6. Return a promise resolved with undefined.
        return create_resolved_promise(realm, js_undefined());
    });

    // 18. Let pull2Algorithm be the following steps:
    auto pull2_algorithm = GC::create_function(realm.heap(), [&realm, params, pull_with_default_reader, pull_with_byob_reader]() {
        // 1. If reading is true,
        if (params->reading) {
            // 1. Set readAgainForBranch2 to true.
            params->read_again_for_branch2 = true;

            // 2. Return a promise resolved with undefined.
            return create_resolved_promise(realm, js_undefined());
        }

        // 2. Set reading to true.
        params->reading = true;

        // 3. Let byobRequest be ! ReadableByteStreamControllerGetBYOBRequest(branch2.[[controller]]).
        auto byob_request = readable_byte_stream_controller_get_byob_request(byte_controller_of(*params->branch2));

        // 4. If byobRequest is null, perform pullWithDefaultReader.
        if (!byob_request) {
            pull_with_default_reader();
        }
        // 5. Otherwise, perform pullWithBYOBReader, given byobRequest.[[view]] and true.
        else {
            pull_with_byob_reader(*byob_request->view(), true);
        }

        // 6. Return a promise resolved with undefined.
        return create_resolved_promise(realm, js_undefined());
    });

    params->pull1_algorithm = pull1_algorithm;
    params->pull2_algorithm = pull2_algorithm;

    // 19. Let cancel1Algorithm be the following steps, taking a reason argument:
    auto cancel1_algorithm = GC::create_function(realm.heap(), [&realm, stream = GC::Ref { stream }, params, cancel_promise](Value const& reason) {
        // 1. Set canceled1 to true.
        params->canceled1 = true;

        // 2. Set reason1 to reason.
        params->reason1 = reason;

        // 3. If canceled2 is true,
        if (params->canceled2) {
            // 1. Let compositeReason be ! CreateArrayFromList(« reason1, reason2 »).
            auto composite_reason = Array::create_from(realm, { params->reason1, params->reason2 });

            // 2. Let cancelResult be ! ReadableStreamCancel(stream, compositeReason).
            auto cancel_result = readable_stream_cancel(stream, composite_reason);

            // 3. Resolve cancelPromise with cancelResult.
            resolve_promise(cancel_promise, cancel_result);
        }

        // 4. Return cancelPromise.
        return cancel_promise;
    });

    // 20. Let cancel2Algorithm be the following steps, taking a reason argument:
    auto cancel2_algorithm = GC::create_function(realm.heap(), [&realm, stream = GC::Ref { stream }, params, cancel_promise](Value const& reason) {
        // 1. Set canceled2 to true.
        params->canceled2 = true;

        // 2. Set reason2 to reason.
        params->reason2 = reason;

        // 3. If canceled1 is true,
        if (params->canceled1) {
            // 1. Let compositeReason be ! CreateArrayFromList(« reason1, reason2 »).
            auto composite_reason = Array::create_from(realm, { params->reason1, params->reason2 });

            // 2. Let cancelResult be ! ReadableStreamCancel(stream, compositeReason).
            auto cancel_result = readable_stream_cancel(stream, composite_reason);

            // 3. Resolve cancelPromise with cancelResult.
            resolve_promise(cancel_promise, cancel_result);
        }

        // 4. Return cancelPromise.
        return cancel_promise;
    });

    // 21. Let startAlgorithm be an algorithm that returns undefined.
    auto start_algorithm = GC::create_function(realm.heap(), []() -> ExceptionOr<Value> {
        return js_undefined();
    });

    // 22. Set branch1 to ! CreateReadableByteStream(startAlgorithm, pull1Algorithm, cancel1Algorithm).
    params->branch1 = MUST(create_readable_byte_stream(realm, start_algorithm, pull1_algorithm, cancel1_algorithm));

    // 23. Set branch2 to ! CreateReadableByteStream(startAlgorithm, pull2Algorithm, cancel2Algorithm).
    params->branch2 = MUST(create_readable_byte_stream(realm, start_algorithm, pull2_algorithm, cancel2_algorithm));

    // 24. Perform forwardReaderError, given reader.
    forward_reader_error(params->reader);

    // 25. Return « branch1, branch2 ».
    return ReadableStreamPair { *params->branch1, *params->branch2 };
}

}
