/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "TestHeap.h"
#include <AK/Vector.h>
#include <LibStreams/Promise.h>
#include <LibStreams/Realm.h>
#include <LibTest/TestCase.h>

using namespace Streams;

TEST_CASE(reactions_run_from_the_microtask_queue)
{
    Realm realm { test_gc_heap() };

    auto promise = create_promise(realm);
    Optional<Value> fulfilled_with;

    upon_fulfillment(*promise, GC::create_function(realm.heap(), [&](Value const& value) {
        fulfilled_with = value;
    }));

    resolve_promise(*promise, 42);
    EXPECT(promise->is_fulfilled());
    EXPECT(!fulfilled_with.has_value());
    EXPECT(realm.has_pending_microtasks());

    realm.perform_a_microtask_checkpoint();
    EXPECT(fulfilled_with.has_value());
    EXPECT_EQ(*fulfilled_with, Value { 42 });
    EXPECT(!realm.has_pending_microtasks());
}

TEST_CASE(reactions_added_after_settling_still_run)
{
    Realm realm { test_gc_heap() };

    auto promise = create_rejected_promise(realm, SimpleException { SimpleExceptionType::TypeError, "nope"sv });
    Optional<Value> rejected_with;

    upon_rejection(*promise, GC::create_function(realm.heap(), [&](Value const& reason) {
        rejected_with = reason;
    }));

    realm.perform_a_microtask_checkpoint();
    EXPECT(rejected_with.has_value());
    EXPECT(rejected_with->is_error_of_type(SimpleExceptionType::TypeError));
    EXPECT_EQ(rejected_with->as_error().message, "nope"sv);
}

TEST_CASE(settling_twice_is_ignored)
{
    Realm realm { test_gc_heap() };

    auto promise = create_promise(realm);
    resolve_promise(*promise, "first"_string);
    reject_promise(*promise, "second"_string);
    resolve_promise(*promise, "third"_string);

    EXPECT(promise->is_fulfilled());
    EXPECT_EQ(promise->result(), Value { "first"_string });
}

TEST_CASE(reactions_run_in_registration_order)
{
    Realm realm { test_gc_heap() };

    auto promise = create_promise(realm);
    Vector<int> order;

    for (int i = 0; i < 3; ++i) {
        react_to_promise(*promise,
            GC::create_function(realm.heap(), [&order, i](Value const&) { order.append(i); }),
            GC::create_function(realm.heap(), [&order](Value const&) { order.append(-1); }));
    }

    resolve_promise(*promise);
    realm.perform_a_microtask_checkpoint();

    EXPECT_EQ(order, (Vector<int> { 0, 1, 2 }));
}

TEST_CASE(microtasks_queued_while_draining_run_in_the_same_checkpoint)
{
    Realm realm { test_gc_heap() };

    auto first = create_resolved_promise(realm, 1);
    auto second = create_promise(realm);
    bool second_reaction_ran = false;

    upon_fulfillment(*first, GC::create_function(realm.heap(), [&](Value const&) {
        resolve_promise(*second, 2);
    }));
    upon_fulfillment(*second, GC::create_function(realm.heap(), [&](Value const& value) {
        second_reaction_ran = value == Value { 2 };
    }));

    realm.perform_a_microtask_checkpoint();
    EXPECT(second_reaction_ran);
}

TEST_CASE(resolving_with_a_promise_adopts_its_state)
{
    Realm realm { test_gc_heap() };

    auto inner = create_promise(realm);
    auto outer = create_promise(realm);

    resolve_promise(*outer, Value { inner });
    realm.perform_a_microtask_checkpoint();
    EXPECT(outer->is_pending());

    reject_promise(*inner, "inner failed"_string);
    realm.perform_a_microtask_checkpoint();
    EXPECT(outer->is_rejected());
    EXPECT_EQ(outer->reason(), Value { "inner failed"_string });
}

TEST_CASE(resolving_a_promise_with_itself_rejects)
{
    Realm realm { test_gc_heap() };

    auto promise = create_promise(realm);
    resolve_promise(*promise, Value { promise });

    EXPECT(promise->is_rejected());
    EXPECT(promise->reason().is_error_of_type(SimpleExceptionType::TypeError));
}

TEST_CASE(promise_resolved_with_a_promise_is_that_promise)
{
    Realm realm { test_gc_heap() };

    auto promise = create_promise(realm);
    auto resolved = create_resolved_promise(realm, Value { promise });
    EXPECT_EQ(resolved.ptr(), promise.ptr());
}

TEST_CASE(mark_as_handled)
{
    Realm realm { test_gc_heap() };

    auto promise = create_rejected_promise(realm, js_undefined());
    EXPECT(!promise->is_handled());

    mark_promise_as_handled(*promise);
    EXPECT(promise->is_handled());
}
