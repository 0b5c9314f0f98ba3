/**
 * Pullcell - Flash Partition
 * FlashRegion backed by a raw esp_partition (see partitions.csv)
 */

#ifndef FLASH_PARTITION_H
#define FLASH_PARTITION_H

#include "calibration_store.h"
#include "esp_partition.h"

class PartitionFlash : public FlashRegion {
public:
    PartitionFlash();

    // Find the data partition by label. Returns false if it is missing.
    bool begin(const char* label);

    uint32_t sectorSize() const;
    uint32_t sectorCount() const;

    bool read(uint32_t offset, void* data, size_t length);
    bool erase(uint32_t offset, size_t length);
    bool write(uint32_t offset, const void* data, size_t length);

private:
    const esp_partition_t* m_partition;
};

#endif // FLASH_PARTITION_H
