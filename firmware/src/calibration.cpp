/**
 * Pullcell - Calibration Engine
 * Implementation
 */

#include "calibration.h"
#include "platform.h"
#include <math.h>

const char* calibrationStatusName(CalStatus status) {
    switch (status) {
        case CAL_OK: return "OK";
        case CAL_ERR_NO_SAMPLE: return "NoSample";
        case CAL_ERR_INSUFFICIENT_POINTS: return "NoPoints";
        case CAL_ERR_DEGENERATE: return "Degenerate";
        case CAL_ERR_STORAGE_FAULT: return "StorageFault";
        case CAL_ERR_BUSY: return "Busy";
        default: return "Unknown";
    }
}

// ==================== Session ====================

const uint8_t CalibrationSession::CAPACITY;

void CalibrationSession::add(const CalibrationPoint& point) {
    m_points[m_next] = point;
    m_next = (m_next + 1) % CAPACITY;
    if (m_count < CAPACITY) {
        m_count++;
    }
}

void CalibrationSession::clear() {
    m_next = 0;
    m_count = 0;
}

const CalibrationPoint& CalibrationSession::at(uint8_t index) const {
    // Oldest entry sits at m_next once the ring is full, at 0 before that
    uint8_t start = (m_count < CAPACITY) ? 0 : m_next;
    return m_points[(start + index) % CAPACITY];
}

// ==================== Mapping ====================

CalStatus calibrationComputeMapping(const CalibrationPoint& a, const CalibrationPoint& b,
                                    CalibrationMapping& mapping) {
    if (a.raw == b.raw || a.reference_kg == b.reference_kg) {
        return CAL_ERR_DEGENERATE;
    }

    // The point nearest 0 kg anchors the offset
    const CalibrationPoint& low = (fabsf(a.reference_kg) <= fabsf(b.reference_kg)) ? a : b;
    const CalibrationPoint& high = (&low == &a) ? b : a;

    // Difference in 64-bit: raw counts are 24-bit signed but the span may not fit a float exactly
    double raw_span = (double)((int64_t)high.raw - (int64_t)low.raw);
    double gradient = ((double)high.reference_kg - (double)low.reference_kg) / raw_span;

    CalibrationMapping candidate;
    candidate.zero_raw = low.raw;
    candidate.gradient = gradient;
    if (!calibrationMappingIsValid(candidate)) {
        return CAL_ERR_DEGENERATE;
    }

    mapping = candidate;
    return CAL_OK;
}

// ==================== Engine ====================

CalibrationEngine::CalibrationEngine(const MedianFilter& filter, CalibrationStore& store)
    : m_filter(filter),
      m_store(store),
      m_calibrated(false),
      m_store_busy(false),
      m_tare_offset(0.0f),
      m_tare_warmup(0),
      m_tare_remaining(0),
      m_tare_total(0),
      m_tare_sum(0.0) {
    m_mapping.zero_raw = 0;
    m_mapping.gradient = 0.0;
}

bool CalibrationEngine::begin() {
    CalibrationMapping loaded;
    bool found = m_store.load(loaded);

    {
        CriticalGuard guard;
        if (found) {
            m_mapping = loaded;
        }
        m_calibrated = found;
    }

    if (found) {
        DEBUG_PRINTF(g_debug_calibration, "Calibration: loaded zero_raw=%ld gradient=%.9g\n",
                     (long)loaded.zero_raw, loaded.gradient);
    } else {
        logPrintf("Calibration: no stored calibration - device is uncalibrated\n");
    }
    return found;
}

CalStatus CalibrationEngine::addPoint(float reference_kg) {
    int32_t raw;
    if (!m_filter.latest(raw)) {
        DEBUG_PRINTLN(g_debug_calibration, "Calibration: add point rejected - no filtered sample yet");
        return CAL_ERR_NO_SAMPLE;
    }

    CalibrationPoint point;
    point.raw = raw;
    point.reference_kg = reference_kg;
    m_session.add(point);

    DEBUG_PRINTF(g_debug_calibration, "Calibration: point %u raw=%ld ref=%.3f kg\n",
                 (unsigned)m_session.count(), (long)raw, reference_kg);
    return CAL_OK;
}

CalStatus CalibrationEngine::save() {
    if (m_store_busy) {
        logPrintf("Calibration: save rejected - store busy\n");
        return CAL_ERR_BUSY;
    }
    if (m_session.count() < CalibrationSession::CAPACITY) {
        DEBUG_PRINTF(g_debug_calibration, "Calibration: save rejected - %u point(s)\n",
                     (unsigned)m_session.count());
        return CAL_ERR_INSUFFICIENT_POINTS;
    }

    CalibrationMapping mapping;
    CalStatus status = calibrationComputeMapping(m_session.at(0), m_session.at(1), mapping);
    if (status != CAL_OK) {
        logPrintf("Calibration: save rejected - degenerate points (raw %ld/%ld, ref %.3f/%.3f)\n",
                  (long)m_session.at(0).raw, (long)m_session.at(1).raw,
                  m_session.at(0).reference_kg, m_session.at(1).reference_kg);
        return status;
    }

    m_store_busy = true;
    StoreStatus stored = m_store.commit(mapping);
    m_store_busy = false;

    if (stored != STORE_OK) {
        logPrintf("Calibration: ERROR - commit failed (%s), keeping previous mapping\n",
                  storeStatusName(stored));
        return CAL_ERR_STORAGE_FAULT;
    }

    {
        CriticalGuard guard;
        m_mapping = mapping;
        m_calibrated = true;
    }

    logPrintf("Calibration: saved zero_raw=%ld gradient=%.9g kg/count\n",
              (long)mapping.zero_raw, mapping.gradient);
    return CAL_OK;
}

CalStatus CalibrationEngine::reset() {
    if (m_store_busy) {
        logPrintf("Calibration: reset rejected - store busy\n");
        return CAL_ERR_BUSY;
    }

    m_store_busy = true;
    StoreStatus stored = m_store.clear();
    m_store_busy = false;

    {
        CriticalGuard guard;
        m_calibrated = false;
        m_mapping.zero_raw = 0;
        m_mapping.gradient = 0.0;
    }
    m_session.clear();
    clearTare();

    if (stored != STORE_OK) {
        logPrintf("Calibration: ERROR - erase failed (%s)\n", storeStatusName(stored));
        return CAL_ERR_STORAGE_FAULT;
    }
    logPrintf("Calibration: reset - device is uncalibrated\n");
    return CAL_OK;
}

float CalibrationEngine::convert(int32_t filtered_raw) const {
    CalibrationMapping mapping;
    bool calibrated;
    {
        CriticalGuard guard;
        mapping = m_mapping;
        calibrated = m_calibrated;
    }

    if (!calibrated) {
        return NAN;
    }
    return (float)(mapping.gradient * ((double)filtered_raw - (double)mapping.zero_raw));
}

bool CalibrationEngine::isCalibrated() const {
    CriticalGuard guard;
    return m_calibrated;
}

bool CalibrationEngine::getMapping(CalibrationMapping& mapping) const {
    CriticalGuard guard;
    if (!m_calibrated) {
        return false;
    }
    mapping = m_mapping;
    return true;
}

// ==================== Tare ====================

bool CalibrationEngine::beginTare(uint16_t warmup_samples, uint16_t average_samples) {
    if (!isCalibrated()) {
        DEBUG_PRINTLN(g_debug_calibration, "Calibration: tare rejected - uncalibrated");
        return false;
    }

    m_tare_warmup = warmup_samples;
    m_tare_total = average_samples > 0 ? average_samples : 1;
    m_tare_remaining = m_tare_total;
    m_tare_sum = 0.0;
    DEBUG_PRINTF(g_debug_calibration, "Calibration: tare started (%u warmup, %u averaged)\n",
                 (unsigned)m_tare_warmup, (unsigned)m_tare_total);
    return true;
}

float CalibrationEngine::applyTare(float weight_kg) {
    if (isnan(weight_kg)) {
        return weight_kg;
    }

    if (m_tare_remaining > 0) {
        if (m_tare_warmup > 0) {
            m_tare_warmup--;
        } else {
            m_tare_sum += weight_kg;
            m_tare_remaining--;
            if (m_tare_remaining == 0) {
                m_tare_offset = (float)(m_tare_sum / m_tare_total);
                DEBUG_PRINTF(g_debug_calibration, "Calibration: tare offset %.4f kg\n", m_tare_offset);
            }
        }
    }

    return weight_kg - m_tare_offset;
}

void CalibrationEngine::clearTare() {
    m_tare_offset = 0.0f;
    m_tare_warmup = 0;
    m_tare_remaining = 0;
    m_tare_total = 0;
    m_tare_sum = 0.0;
}
