/**
 * Pullcell - Weight Pipeline
 * Implementation
 */

#include "weight.h"
#include <math.h>

WeightPipeline::WeightPipeline(SampleChannel& channel, MedianFilter& filter,
                               CalibrationEngine& calibration, ProtocolEngine& protocol)
    : m_channel(channel),
      m_filter(filter),
      m_calibration(calibration),
      m_protocol(protocol),
      m_last_weight(NAN),
      m_last_filtered(0),
      m_samples(0) {
}

uint32_t WeightPipeline::poll(uint32_t max_samples) {
    uint32_t consumed = 0;
    RawSample sample;

    while (consumed < max_samples && m_channel.pop(sample)) {
        consumed++;
        m_samples++;

        int32_t filtered;
        if (!m_filter.push(sample.count, filtered)) {
            continue;   // Window still filling
        }
        m_last_filtered = filtered;

        float weight = m_calibration.applyTare(m_calibration.convert(filtered));
        m_last_weight = weight;

        DEBUG_PRINTF(g_debug_weight, "Weight: raw=%ld filtered=%ld weight=%.3f kg\n",
                     (long)sample.count, (long)filtered, weight);

        if (m_protocol.isStreaming()) {
            m_protocol.publishWeight(weight, sample.timestamp_us);
        }
    }

    return consumed;
}
