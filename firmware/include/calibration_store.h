/**
 * Pullcell - Calibration Store
 * Crash-consistent persistence of the active calibration mapping.
 *
 * The flash region is split into two sector-sized slots. A commit always
 * erases and writes the slot that is NOT holding the current record, and
 * the record's commit word is programmed last. A power cut at any point
 * leaves either the previous record or the new one readable, never a mix.
 */

#ifndef CALIBRATION_STORE_H
#define CALIBRATION_STORE_H

#include <stddef.h>
#include <stdint.h>

// Active linear mapping: weight = gradient * (raw - zero_raw)
struct CalibrationMapping {
    int32_t zero_raw;   // Raw count that reads as 0 kg
    double gradient;    // kg per raw count (finite, non-zero)
};

// True if the mapping can convert readings (finite, non-zero gradient)
bool calibrationMappingIsValid(const CalibrationMapping& mapping);

// Erase-then-write flash medium (esp_partition on the device, RAM in tests)
class FlashRegion {
public:
    virtual ~FlashRegion() {}

    virtual uint32_t sectorSize() const = 0;
    virtual uint32_t sectorCount() const = 0;

    // All offsets are relative to the start of the region
    virtual bool read(uint32_t offset, void* data, size_t length) = 0;
    virtual bool erase(uint32_t offset, size_t length) = 0;   // Sector aligned
    virtual bool write(uint32_t offset, const void* data, size_t length) = 0;
};

#define CAL_RECORD_MAGIC        0x4C414350  // "PCAL" little-endian
#define CAL_RECORD_VERSION      1
#define CAL_RECORD_COMMITTED    0x600DCA1B  // Commit word, programmed last

// On-flash record (32 bytes, little-endian)
struct __attribute__((packed)) CalibrationRecord {
    uint32_t magic;
    uint16_t version;
    uint16_t length;        // sizeof(CalibrationRecord)
    uint32_t generation;    // Increments on every commit, highest valid wins
    int32_t  zero_raw;
    double   gradient;
    uint32_t crc;           // CRC-32C over all preceding fields
    uint32_t commit;        // CAL_RECORD_COMMITTED once fully written
};

static_assert(sizeof(CalibrationRecord) == 32, "CalibrationRecord must be 32 bytes");

enum StoreStatus {
    STORE_OK,
    STORE_ERR_FAULT,        // Erase/write/verify failed, previous record still active
    STORE_ERR_NO_MEDIUM,    // Region too small for two slots
    STORE_ERR_INVALID,      // Mapping gradient not finite and non-zero, nothing written
};

const char* storeStatusName(StoreStatus status);

// CRC-32C (Castagnoli, reflected 0x82F63B78, init/xorout 0xFFFFFFFF)
uint32_t calibrationCrc32c(const uint8_t* data, size_t length);

class CalibrationStore {
public:
    explicit CalibrationStore(FlashRegion& flash);

    // Read the newest valid record. Returns false if neither slot holds one.
    bool load(CalibrationMapping& mapping);

    // Durably replace the stored mapping. On failure the previously stored
    // mapping (if any) is still what load() returns.
    StoreStatus commit(const CalibrationMapping& mapping);

    // Erase both slots (factory reset)
    StoreStatus clear();

    // Slot holding the newest valid record, -1 if none
    int8_t activeSlot();
    uint32_t generation();

private:
    void scan();
    bool readSlot(uint8_t slot, CalibrationRecord& record);
    bool recordIsValid(const CalibrationRecord& record) const;
    uint32_t slotOffset(uint8_t slot) const;

    FlashRegion& m_flash;
    bool m_scanned;
    int8_t m_active_slot;
    uint32_t m_generation;
};

#endif // CALIBRATION_STORE_H
