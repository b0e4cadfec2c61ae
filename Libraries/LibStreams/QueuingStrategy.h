/*
 * Copyright (c) 2026, the LibStreams developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <AK/Optional.h>
#include <LibGC/CellAllocator.h>
#include <LibStreams/Algorithms.h>
#include <LibStreams/Forward.h>

namespace Streams {

// https://streams.spec.whatwg.org/#dictdef-queuingstrategy
struct QueuingStrategy {
    Optional<double> high_water_mark;
    GC::Ptr<SizeAlgorithm> size;
};

// https://streams.spec.whatwg.org/#dictdef-queuingstrategyinit
struct QueuingStrategyInit {
    double high_water_mark { 0 };
};

// https://streams.spec.whatwg.org/#countqueuingstrategy
class CountQueuingStrategy final : public GC::Cell {
    GC_CELL(CountQueuingStrategy, GC::Cell);
    GC_DECLARE_ALLOCATOR(CountQueuingStrategy);

public:
    static GC::Ref<CountQueuingStrategy> construct_impl(Realm&, QueuingStrategyInit const&);

    virtual ~CountQueuingStrategy() override;

    // https://streams.spec.whatwg.org/#cqs-high-water-mark
    double high_water_mark() const
    {
        // The highWaterMark getter steps are to return this.[[highWaterMark]].
        return m_high_water_mark;
    }

    GC::Ref<SizeAlgorithm> size() const { return *m_size; }

    QueuingStrategy as_queuing_strategy() const { return { m_high_water_mark, m_size }; }

private:
    explicit CountQueuingStrategy(double high_water_mark);

    virtual void visit_edges(Cell::Visitor&) override;

    // https://streams.spec.whatwg.org/#countqueuingstrategy-highwatermark
    double m_high_water_mark { 0 };

    GC::Ptr<SizeAlgorithm> m_size;
};

// https://streams.spec.whatwg.org/#bytelengthqueuingstrategy
class ByteLengthQueuingStrategy final : public GC::Cell {
    GC_CELL(ByteLengthQueuingStrategy, GC::Cell);
    GC_DECLARE_ALLOCATOR(ByteLengthQueuingStrategy);

public:
    static GC::Ref<ByteLengthQueuingStrategy> construct_impl(Realm&, QueuingStrategyInit const&);

    virtual ~ByteLengthQueuingStrategy() override;

    // https://streams.spec.whatwg.org/#blqs-high-water-mark
    double high_water_mark() const
    {
        // The highWaterMark getter steps are to return this.[[highWaterMark]].
        return m_high_water_mark;
    }

    GC::Ref<SizeAlgorithm> size() const { return *m_size; }

    QueuingStrategy as_queuing_strategy() const { return { m_high_water_mark, m_size }; }

private:
    explicit ByteLengthQueuingStrategy(double high_water_mark);

    virtual void visit_edges(Cell::Visitor&) override;

    // https://streams.spec.whatwg.org/#bytelengthqueuingstrategy-highwatermark
    double m_high_water_mark { 0 };

    GC::Ptr<SizeAlgorithm> m_size;
};

// https://streams.spec.whatwg.org/#validate-and-normalize-high-water-mark
ExceptionOr<double> extract_high_water_mark(QueuingStrategy const&, double default_hwm);

// https://streams.spec.whatwg.org/#make-size-algorithm-from-size-function
GC::Ref<SizeAlgorithm> extract_size_algorithm(Realm&, QueuingStrategy const&);

}
