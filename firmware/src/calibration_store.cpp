/**
 * Pullcell - Calibration Store
 * Implementation
 */

#include "calibration_store.h"
#include "config.h"
#include <math.h>
#include <stddef.h>
#include <string.h>

#define CAL_RECORD_CRC_SPAN     offsetof(CalibrationRecord, crc)
#define CAL_RECORD_BODY_SPAN    offsetof(CalibrationRecord, commit)

bool calibrationMappingIsValid(const CalibrationMapping& mapping) {
    return isfinite(mapping.gradient) && mapping.gradient != 0.0;
}

const char* storeStatusName(StoreStatus status) {
    switch (status) {
        case STORE_OK: return "OK";
        case STORE_ERR_FAULT: return "FAULT";
        case STORE_ERR_NO_MEDIUM: return "NO_MEDIUM";
        case STORE_ERR_INVALID: return "INVALID";
        default: return "UNKNOWN";
    }
}

uint32_t calibrationCrc32c(const uint8_t* data, size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < length; i++) {
        crc ^= data[i];
        for (uint8_t bit = 0; bit < 8; bit++) {
            crc = (crc & 1) ? (crc >> 1) ^ 0x82F63B78 : crc >> 1;
        }
    }
    return crc ^ 0xFFFFFFFF;
}

CalibrationStore::CalibrationStore(FlashRegion& flash)
    : m_flash(flash), m_scanned(false), m_active_slot(-1), m_generation(0) {
}

uint32_t CalibrationStore::slotOffset(uint8_t slot) const {
    return (uint32_t)slot * m_flash.sectorSize();
}

bool CalibrationStore::recordIsValid(const CalibrationRecord& record) const {
    if (record.magic != CAL_RECORD_MAGIC ||
        record.version != CAL_RECORD_VERSION ||
        record.length != sizeof(CalibrationRecord) ||
        record.commit != CAL_RECORD_COMMITTED) {
        return false;
    }

    uint32_t crc = calibrationCrc32c((const uint8_t*)&record, CAL_RECORD_CRC_SPAN);
    if (crc != record.crc) {
        return false;
    }

    CalibrationMapping mapping;
    mapping.zero_raw = record.zero_raw;
    mapping.gradient = record.gradient;
    return calibrationMappingIsValid(mapping);
}

bool CalibrationStore::readSlot(uint8_t slot, CalibrationRecord& record) {
    if (!m_flash.read(slotOffset(slot), &record, sizeof(record))) {
        DEBUG_PRINTF(g_debug_storage, "CalStore: read failed (slot %u)\n", (unsigned)slot);
        return false;
    }
    return recordIsValid(record);
}

void CalibrationStore::scan() {
    m_scanned = true;
    m_active_slot = -1;

    if (m_flash.sectorCount() < CAL_FLASH_SLOT_COUNT) {
        logPrintf("CalStore: ERROR - flash region has %u sectors, need %u\n",
                  (unsigned)m_flash.sectorCount(), (unsigned)CAL_FLASH_SLOT_COUNT);
        return;
    }

    for (uint8_t slot = 0; slot < CAL_FLASH_SLOT_COUNT; slot++) {
        CalibrationRecord record;
        if (!readSlot(slot, record)) {
            DEBUG_PRINTF(g_debug_storage, "CalStore: slot %u empty or invalid\n", (unsigned)slot);
            continue;
        }
        DEBUG_PRINTF(g_debug_storage, "CalStore: slot %u valid, generation %lu\n",
                     (unsigned)slot, (unsigned long)record.generation);
        if (m_active_slot < 0 || record.generation > m_generation) {
            m_active_slot = slot;
            m_generation = record.generation;
        }
    }
}

bool CalibrationStore::load(CalibrationMapping& mapping) {
    scan();
    if (m_active_slot < 0) {
        return false;
    }

    CalibrationRecord record;
    if (!readSlot((uint8_t)m_active_slot, record)) {
        m_active_slot = -1;
        return false;
    }

    mapping.zero_raw = record.zero_raw;
    mapping.gradient = record.gradient;
    DEBUG_PRINTF(g_debug_storage, "CalStore: loaded generation %lu from slot %d\n",
                 (unsigned long)record.generation, m_active_slot);
    return true;
}

StoreStatus CalibrationStore::commit(const CalibrationMapping& mapping) {
    if (!calibrationMappingIsValid(mapping)) {
        return STORE_ERR_INVALID;
    }
    if (!m_scanned) {
        scan();
    }
    if (m_flash.sectorCount() < CAL_FLASH_SLOT_COUNT) {
        return STORE_ERR_NO_MEDIUM;
    }

    CalibrationRecord record;
    memset(&record, 0, sizeof(record));
    record.magic = CAL_RECORD_MAGIC;
    record.version = CAL_RECORD_VERSION;
    record.length = sizeof(CalibrationRecord);
    record.generation = m_generation + 1;
    record.zero_raw = mapping.zero_raw;
    record.gradient = mapping.gradient;
    record.crc = calibrationCrc32c((const uint8_t*)&record, CAL_RECORD_CRC_SPAN);
    record.commit = CAL_RECORD_COMMITTED;

    uint8_t target = (m_active_slot == 0) ? 1 : 0;
    uint32_t offset = slotOffset(target);

    DEBUG_PRINTF(g_debug_storage, "CalStore: committing generation %lu to slot %u\n",
                 (unsigned long)record.generation, (unsigned)target);

    if (!m_flash.erase(offset, m_flash.sectorSize())) {
        logPrintf("CalStore: ERROR - erase failed (slot %u)\n", (unsigned)target);
        return STORE_ERR_FAULT;
    }

    // Body and CRC first, then verify before programming the commit word
    if (!m_flash.write(offset, &record, CAL_RECORD_BODY_SPAN)) {
        logPrintf("CalStore: ERROR - write failed (slot %u)\n", (unsigned)target);
        return STORE_ERR_FAULT;
    }

    CalibrationRecord readback;
    if (!m_flash.read(offset, &readback, sizeof(readback)) ||
        memcmp(&readback, &record, CAL_RECORD_BODY_SPAN) != 0) {
        logPrintf("CalStore: ERROR - verify failed (slot %u)\n", (unsigned)target);
        return STORE_ERR_FAULT;
    }

    uint32_t commit_word = CAL_RECORD_COMMITTED;
    if (!m_flash.write(offset + CAL_RECORD_BODY_SPAN, &commit_word, sizeof(commit_word))) {
        logPrintf("CalStore: ERROR - commit word write failed (slot %u)\n", (unsigned)target);
        return STORE_ERR_FAULT;
    }

    if (!readSlot(target, readback) || readback.generation != record.generation) {
        logPrintf("CalStore: ERROR - committed record unreadable (slot %u)\n", (unsigned)target);
        return STORE_ERR_FAULT;
    }

    m_active_slot = (int8_t)target;
    m_generation = record.generation;
    DEBUG_PRINTF(g_debug_storage, "CalStore: generation %lu active\n", (unsigned long)m_generation);
    return STORE_OK;
}

StoreStatus CalibrationStore::clear() {
    if (m_flash.sectorCount() < CAL_FLASH_SLOT_COUNT) {
        return STORE_ERR_NO_MEDIUM;
    }

    StoreStatus status = STORE_OK;
    for (uint8_t slot = 0; slot < CAL_FLASH_SLOT_COUNT; slot++) {
        if (!m_flash.erase(slotOffset(slot), m_flash.sectorSize())) {
            logPrintf("CalStore: ERROR - erase failed (slot %u)\n", (unsigned)slot);
            status = STORE_ERR_FAULT;
        }
    }

    // Rescan rather than assume: a failed erase may have left a record behind
    scan();
    DEBUG_PRINTF(g_debug_storage, "CalStore: cleared (%s)\n", storeStatusName(status));
    return status;
}

int8_t CalibrationStore::activeSlot() {
    if (!m_scanned) {
        scan();
    }
    return m_active_slot;
}

uint32_t CalibrationStore::generation() {
    if (!m_scanned) {
        scan();
    }
    return m_generation;
}
