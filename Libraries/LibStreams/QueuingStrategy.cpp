/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <AK/Math.h>
#include <LibStreams/QueuingStrategy.h>
#include <LibStreams/Realm.h>

namespace Streams {

GC_DEFINE_ALLOCATOR(CountQueuingStrategy);
GC_DEFINE_ALLOCATOR(ByteLengthQueuingStrategy);

// https://streams.spec.whatwg.org/#cqs-constructor
GC::Ref<CountQueuingStrategy> CountQueuingStrategy::construct_impl(Realm& realm, QueuingStrategyInit const& init)
{
    // The new CountQueuingStrategy(init) constructor steps are:
    // 1. Set this.[[highWaterMark]] to init["highWaterMark"].
    auto strategy = realm.create<CountQueuingStrategy>(init.high_water_mark);

    // https://streams.spec.whatwg.org/#count-queuing-strategy-size-function
    // 1. Let steps be the following steps:
    //     1. Return 1.
    strategy->m_size = GC::create_function(realm.heap(), [](Value const&) -> ExceptionOr<double> {
        return 1.0;
    });

    return strategy;
}

CountQueuingStrategy::CountQueuingStrategy(double high_water_mark)
    : m_high_water_mark(high_water_mark)
{
}

CountQueuingStrategy::~CountQueuingStrategy() = default;

void CountQueuingStrategy::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    visitor.visit(m_size);
}

// https://streams.spec.whatwg.org/#blqs-constructor
GC::Ref<ByteLengthQueuingStrategy> ByteLengthQueuingStrategy::construct_impl(Realm& realm, QueuingStrategyInit const& init)
{
    // The new ByteLengthQueuingStrategy(init) constructor steps are:
    // 1. Set this.[[highWaterMark]] to init["highWaterMark"].
    auto strategy = realm.create<ByteLengthQueuingStrategy>(init.high_water_mark);

    // https://streams.spec.whatwg.org/#byte-length-queuing-strategy-size-function
    // 1. Let steps be the following steps, given chunk:
    //     1. Return ? GetV(chunk, "byteLength").
    strategy->m_size = GC::create_function(realm.heap(), [](Value const& chunk) -> ExceptionOr<double> {
        auto byte_length = chunk.byte_length();
        if (!byte_length.has_value())
            return SimpleException { SimpleExceptionType::TypeError, "Chunk does not have a byte length"sv };
        return static_cast<double>(*byte_length);
    });

    return strategy;
}

ByteLengthQueuingStrategy::ByteLengthQueuingStrategy(double high_water_mark)
    : m_high_water_mark(high_water_mark)
{
}

ByteLengthQueuingStrategy::~ByteLengthQueuingStrategy() = default;

void ByteLengthQueuingStrategy::visit_edges(Cell::Visitor& visitor)
{
    Base::visit_edges(visitor);
    visitor.visit(m_size);
}

// https://streams.spec.whatwg.org/#validate-and-normalize-high-water-mark
ExceptionOr<double> extract_high_water_mark(QueuingStrategy const& strategy, double default_hwm)
{
    // 1. If strategy["highWaterMark"] does not exist, return defaultHWM.
    if (!strategy.high_water_mark.has_value())
        return default_hwm;

    // 2. Let highWaterMark be strategy["highWaterMark"].
    auto high_water_mark = strategy.high_water_mark.value();

    // 3. If highWaterMark is NaN or highWaterMark < 0, throw a RangeError exception.
    if (isnan(high_water_mark) || high_water_mark < 0)
        return SimpleException { SimpleExceptionType::RangeError, "Invalid value for high water mark"sv };

    // 4. Return highWaterMark.
    return high_water_mark;
}

// https://streams.spec.whatwg.org/#make-size-algorithm-from-size-function
GC::Ref<SizeAlgorithm> extract_size_algorithm(Realm& realm, QueuingStrategy const& strategy)
{
    // 1. If strategy["size"] does not exist, return an algorithm that returns 1.
    if (!strategy.size)
        return GC::create_function(realm.heap(), [](Value const&) -> ExceptionOr<double> { return 1.0; });

    // 2. Return an algorithm that performs the following steps, taking a chunk argument:
    //     1. Return the result of invoking strategy["size"] with argument list « chunk ».
    return *strategy.size;
}

}
