/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Optional.h>
#include <AK/Vector.h>
#include <LibGC/Cell.h>
#include <LibGC/Function.h>
#include <LibStreams/Realm.h>
#include <LibStreams/Value.h>

namespace Streams {

inline void visit_promise_result(GC::Cell::Visitor& visitor, Value const& value)
{
    value.visit_edges(visitor);
}

// A settle-once result of type T or a rejection reason. Reactions always run from the realm's microtask queue,
// never synchronously from resolve() or reject().
template<typename T>
class Promise final : public GC::Cell {
    GC_CELL(Promise, GC::Cell);

public:
    enum class State {
        Pending,
        Fulfilled,
        Rejected,
    };

    using FulfillmentSteps = GC::Function<void(T const&)>;
    using RejectionSteps = GC::Function<void(Value const&)>;

    static GC::Ref<Promise> create(Realm& realm)
    {
        return realm.create<Promise>(realm);
    }

    virtual ~Promise() override = default;

    State state() const { return m_state; }
    bool is_pending() const { return m_state == State::Pending; }
    bool is_fulfilled() const { return m_state == State::Fulfilled; }
    bool is_rejected() const { return m_state == State::Rejected; }

    T const& result() const
    {
        VERIFY(m_state == State::Fulfilled);
        return *m_result;
    }

    Value const& reason() const
    {
        VERIFY(m_state == State::Rejected);
        return m_reason;
    }

    bool is_handled() const { return m_is_handled; }
    void set_is_handled() { m_is_handled = true; }

    void fulfill(T value)
    {
        if (m_state != State::Pending)
            return;

        m_result = move(value);
        m_state = State::Fulfilled;
        trigger_reactions();
    }

    void reject(Value reason)
    {
        if (m_state != State::Pending)
            return;

        m_reason = move(reason);
        m_state = State::Rejected;
        trigger_reactions();
    }

    void add_reaction(GC::Ptr<FulfillmentSteps> on_fulfilled, GC::Ptr<RejectionSteps> on_rejected)
    {
        m_reactions.append({ on_fulfilled, on_rejected });
        if (m_state != State::Pending)
            trigger_reactions();
    }

    Realm& realm() const { return m_realm; }

private:
    explicit Promise(Realm& realm)
        : m_realm(realm)
    {
    }

    virtual void visit_edges(Cell::Visitor& visitor) override
    {
        Base::visit_edges(visitor);
        if (m_result.has_value())
            visit_promise_result(visitor, *m_result);
        m_reason.visit_edges(visitor);
        for (auto& reaction : m_reactions) {
            visitor.visit(reaction.on_fulfilled);
            visitor.visit(reaction.on_rejected);
        }
    }

    void trigger_reactions()
    {
        auto reactions = move(m_reactions);

        for (auto& reaction : reactions) {
            m_realm.queue_microtask(GC::create_function(m_realm.heap(), [promise = GC::Ref { *this }, reaction]() {
                if (promise->m_state == State::Fulfilled) {
                    if (reaction.on_fulfilled)
                        reaction.on_fulfilled->function()(*promise->m_result);
                } else {
                    if (reaction.on_rejected)
                        reaction.on_rejected->function()(promise->m_reason);
                }
            }));
        }
    }

    struct Reaction {
        GC::Ptr<FulfillmentSteps> on_fulfilled;
        GC::Ptr<RejectionSteps> on_rejected;
    };

    Realm& m_realm;
    State m_state { State::Pending };
    Optional<T> m_result;
    Value m_reason;
    Vector<Reaction> m_reactions;
    bool m_is_handled { false };
};

// https://webidl.spec.whatwg.org/#a-new-promise
inline GC::Ref<Promise<Value>> create_promise(Realm& realm)
{
    return Promise<Value>::create(realm);
}

// https://webidl.spec.whatwg.org/#a-promise-resolved-with
GC::Ref<Promise<Value>> create_resolved_promise(Realm&, Value);

// https://webidl.spec.whatwg.org/#a-promise-rejected-with
GC::Ref<Promise<Value>> create_rejected_promise(Realm&, Value);

// https://webidl.spec.whatwg.org/#resolve
void resolve_promise(Promise<Value>&, Value = js_undefined());

// https://webidl.spec.whatwg.org/#reject
void reject_promise(Promise<Value>&, Value);

// https://webidl.spec.whatwg.org/#mark-a-promise-as-handled
template<typename T>
void mark_promise_as_handled(Promise<T>& promise)
{
    promise.set_is_handled();
}

// https://webidl.spec.whatwg.org/#dfn-perform-steps-once-promise-is-settled
template<typename T>
void react_to_promise(Promise<T>& promise, GC::Ptr<typename Promise<T>::FulfillmentSteps> on_fulfilled, GC::Ptr<typename Promise<T>::RejectionSteps> on_rejected)
{
    promise.add_reaction(on_fulfilled, on_rejected);
}

// https://webidl.spec.whatwg.org/#upon-fulfillment
template<typename T>
void upon_fulfillment(Promise<T>& promise, GC::Ref<typename Promise<T>::FulfillmentSteps> steps)
{
    promise.add_reaction(steps, nullptr);
}

// https://webidl.spec.whatwg.org/#upon-rejection
template<typename T>
void upon_rejection(Promise<T>& promise, GC::Ref<typename Promise<T>::RejectionSteps> steps)
{
    promise.add_reaction(nullptr, steps);
}

// Chains a promise to another: once source settles, target settles the same way.
void resolve_promise_with_promise(Promise<Value>& target, Promise<Value>& source);

}
