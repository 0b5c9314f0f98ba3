/**
 * Pullcell - Weight Pipeline
 * Drains raw ADC samples from the sampler channel, filters, converts,
 * applies tare and hands streaming weights to the protocol engine
 */

#ifndef WEIGHT_H
#define WEIGHT_H

#include <stdint.h>
#include "calibration.h"
#include "median_filter.h"
#include "protocol.h"
#include "ring_buffer.h"
#include "config.h"

// One conversion from the load cell ADC
struct RawSample {
    int32_t count;          // Signed 24-bit ADC count
    uint32_t timestamp_us;  // platformMicros() when the conversion was read
};

// Sampler (producer, pushOverwrite) -> pipeline (consumer, pop)
typedef RingBuffer<RawSample, SAMPLE_CHANNEL_CAPACITY> SampleChannel;

class WeightPipeline {
public:
    WeightPipeline(SampleChannel& channel, MedianFilter& filter,
                   CalibrationEngine& calibration, ProtocolEngine& protocol);

    // Process up to max_samples queued samples in arrival order.
    // Returns the number of raw samples consumed.
    uint32_t poll(uint32_t max_samples = PIPELINE_MAX_SAMPLES_PER_POLL);

    // Last tared weight (NaN while uncalibrated or before the filter primes)
    float lastWeight() const { return m_last_weight; }
    int32_t lastFiltered() const { return m_last_filtered; }
    uint32_t samplesProcessed() const { return m_samples; }

private:
    SampleChannel& m_channel;
    MedianFilter& m_filter;
    CalibrationEngine& m_calibration;
    ProtocolEngine& m_protocol;

    float m_last_weight;
    int32_t m_last_filtered;
    uint32_t m_samples;
};

#endif // WEIGHT_H
