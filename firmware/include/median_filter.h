/**
 * Pullcell - Median Filter Stage
 * Sliding-window median over raw ADC counts (rejects single-sample spikes)
 */

#ifndef MEDIAN_FILTER_H
#define MEDIAN_FILTER_H

#include <stdint.h>
#include "config.h"

class MedianFilter {
public:
    static const uint8_t MIN_SIZE = 3;
    static const uint8_t MAX_SIZE = MEDIAN_WINDOW_MAX;

    // size must be odd and within MIN_SIZE..MAX_SIZE. Anything else is
    // clamped into range and rounded up to the next odd size.
    explicit MedianFilter(uint8_t size = MEDIAN_WINDOW_SIZE);

    // Push one raw sample. Returns true and writes the median of the last
    // size() samples once the window is full, false while still filling.
    bool push(int32_t raw, int32_t& filtered);

    // Most recent median. False until the window has filled once.
    bool latest(int32_t& filtered) const;

    bool primed() const { return m_primed; }
    uint8_t size() const { return m_size; }

    // Empty the window (next output after size() more samples)
    void reset();

private:
    int32_t m_window[MAX_SIZE];
    uint8_t m_size;
    uint8_t m_head;
    uint8_t m_count;
    bool m_primed;
    int32_t m_latest;
};

#endif // MEDIAN_FILTER_H
