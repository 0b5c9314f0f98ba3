/**
 * Pullcell - Calibration Engine
 * Two-point linear calibration from filtered ADC counts to kilograms,
 * plus a session tare offset
 */

#ifndef CALIBRATION_H
#define CALIBRATION_H

#include <stdint.h>
#include "calibration_store.h"
#include "median_filter.h"
#include "config.h"

// Calibration operation result. Values are stable: the protocol reports
// failures as 0x10 + CalStatus.
enum CalStatus {
    CAL_OK = 0,
    CAL_ERR_NO_SAMPLE = 1,              // Filter has not produced a reading yet
    CAL_ERR_INSUFFICIENT_POINTS = 2,    // Save with fewer than two points
    CAL_ERR_DEGENERATE = 3,             // Points share a raw count or a reference weight
    CAL_ERR_STORAGE_FAULT = 4,          // Flash commit failed, previous mapping kept
    CAL_ERR_BUSY = 5,                   // Commit or erase already in progress
};

const char* calibrationStatusName(CalStatus status);

// One captured point: filtered raw count observed while reference_kg was on the cell
struct CalibrationPoint {
    int32_t raw;
    float reference_kg;
};

// Pending points, oldest evicted when a third is added
class CalibrationSession {
public:
    static const uint8_t CAPACITY = 2;

    CalibrationSession() : m_next(0), m_count(0) {}

    void add(const CalibrationPoint& point);
    void clear();
    uint8_t count() const { return m_count; }

    // index 0 is the oldest point
    const CalibrationPoint& at(uint8_t index) const;

private:
    CalibrationPoint m_points[CAPACITY];
    uint8_t m_next;
    uint8_t m_count;
};

// Fit weight = gradient * (raw - zero_raw) through two points.
// zero_raw is the raw count of the point whose reference is closer to 0 kg.
// Returns CAL_ERR_DEGENERATE if the points share a raw count or reference,
// or the gradient is not a finite non-zero number.
CalStatus calibrationComputeMapping(const CalibrationPoint& a, const CalibrationPoint& b,
                                    CalibrationMapping& mapping);

class CalibrationEngine {
public:
    CalibrationEngine(const MedianFilter& filter, CalibrationStore& store);

    // Load the persisted mapping. Returns false (uncalibrated) if none is stored.
    bool begin();

    // Capture the filter's latest output against a known reference weight
    CalStatus addPoint(float reference_kg);

    // Fit the two most recent points and commit the mapping to flash.
    // The active mapping only changes once the commit has succeeded.
    CalStatus save();

    // Erase the stored mapping and return to uncalibrated
    CalStatus reset();

    // Calibrated kilograms (tare not applied). NaN while uncalibrated.
    float convert(int32_t filtered_raw) const;

    bool isCalibrated() const;
    bool getMapping(CalibrationMapping& mapping) const;
    const CalibrationSession& session() const { return m_session; }

    // ==================== Tare ====================
    // Tare is a session offset applied after conversion; it is not persisted.

    // Start averaging. Returns false while uncalibrated.
    bool beginTare(uint16_t warmup_samples = TARE_WARMUP_SAMPLES,
                   uint16_t average_samples = TARE_SAMPLES);

    // Feed one converted weight; returns the weight with the current offset removed.
    // While a tare is running the weight also feeds the average.
    float applyTare(float weight_kg);

    bool isTaring() const { return m_tare_remaining > 0; }
    float tareOffset() const { return m_tare_offset; }
    void clearTare();

private:
    const MedianFilter& m_filter;
    CalibrationStore& m_store;
    CalibrationSession m_session;

    CalibrationMapping m_mapping;   // Guarded by CriticalGuard
    bool m_calibrated;
    bool m_store_busy;                  // Commit or erase running

    float m_tare_offset;
    uint16_t m_tare_warmup;
    uint16_t m_tare_remaining;
    uint16_t m_tare_total;
    double m_tare_sum;
};

#endif // CALIBRATION_H
