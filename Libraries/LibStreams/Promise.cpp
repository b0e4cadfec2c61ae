/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibStreams/Promise.h>

namespace Streams {

// https://webidl.spec.whatwg.org/#a-promise-resolved-with
GC::Ref<Promise<Value>> create_resolved_promise(Realm& realm, Value value)
{
    // A promise resolved with a promise is that promise.
    if (value.is_promise())
        return value.as_promise();

    auto promise = create_promise(realm);
    promise->fulfill(move(value));
    return promise;
}

// https://webidl.spec.whatwg.org/#a-promise-rejected-with
GC::Ref<Promise<Value>> create_rejected_promise(Realm& realm, Value reason)
{
    auto promise = create_promise(realm);
    promise->reject(move(reason));
    return promise;
}

// https://webidl.spec.whatwg.org/#resolve
void resolve_promise(Promise<Value>& promise, Value value)
{
    if (value.is_promise()) {
        auto& source = value.as_promise();
        if (&source == &promise) {
            promise.reject(SimpleException { SimpleExceptionType::TypeError, "Cannot resolve a promise with itself"sv });
            return;
        }

        resolve_promise_with_promise(promise, source);
        return;
    }

    promise.fulfill(move(value));
}

// https://webidl.spec.whatwg.org/#reject
void reject_promise(Promise<Value>& promise, Value reason)
{
    promise.reject(move(reason));
}

void resolve_promise_with_promise(Promise<Value>& target, Promise<Value>& source)
{
    auto& heap = target.realm().heap();

    source.add_reaction(
        GC::create_function(heap, [target = GC::Ref { target }](Value const& value) {
            resolve_promise(*target, value);
        }),
        GC::create_function(heap, [target = GC::Ref { target }](Value const& reason) {
            target->reject(reason);
        }));
}

}
