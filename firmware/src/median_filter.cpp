/**
 * Pullcell - Median Filter Stage
 * Implementation
 */

#include "median_filter.h"

const uint8_t MedianFilter::MIN_SIZE;
const uint8_t MedianFilter::MAX_SIZE;

static uint8_t normalizeSize(uint8_t size) {
    if (size < MedianFilter::MIN_SIZE) {
        return MedianFilter::MIN_SIZE;
    }
    if (size > MedianFilter::MAX_SIZE) {
        size = MedianFilter::MAX_SIZE;
    }
    if ((size & 1) == 0) {
        // MAX_SIZE is odd, so an even size is always below it
        size++;
    }
    return size;
}

MedianFilter::MedianFilter(uint8_t size)
    : m_size(normalizeSize(size)), m_head(0), m_count(0), m_primed(false), m_latest(0) {
    if (m_size != size) {
        DEBUG_PRINTF(g_debug_weight, "MedianFilter: window %u adjusted to %u\n", (unsigned)size, (unsigned)m_size);
    }
}

bool MedianFilter::push(int32_t raw, int32_t& filtered) {
    m_window[m_head] = raw;
    m_head = (m_head + 1) % m_size;
    if (m_count < m_size) {
        m_count++;
    }
    if (m_count < m_size) {
        return false;
    }

    // Insertion sort on a copy; the window is at most MAX_SIZE entries
    int32_t sorted[MAX_SIZE];
    for (uint8_t i = 0; i < m_size; i++) {
        int32_t value = m_window[i];
        int8_t j = (int8_t)i - 1;
        while (j >= 0 && sorted[j] > value) {
            sorted[j + 1] = sorted[j];
            j--;
        }
        sorted[j + 1] = value;
    }

    m_latest = sorted[m_size / 2];
    m_primed = true;
    filtered = m_latest;
    return true;
}

bool MedianFilter::latest(int32_t& filtered) const {
    if (!m_primed) {
        return false;
    }
    filtered = m_latest;
    return true;
}

void MedianFilter::reset() {
    m_head = 0;
    m_count = 0;
    m_primed = false;
    m_latest = 0;
}
