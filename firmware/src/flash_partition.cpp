/**
 * Pullcell - Flash Partition
 * Implementation
 */

#include "flash_partition.h"
#include "config.h"

PartitionFlash::PartitionFlash() : m_partition(nullptr) {
}

bool PartitionFlash::begin(const char* label) {
    m_partition = esp_partition_find_first(ESP_PARTITION_TYPE_DATA,
                                           ESP_PARTITION_SUBTYPE_ANY, label);
    if (m_partition == nullptr) {
        logPrintf("Flash: ERROR - partition '%s' not found\n", label);
        return false;
    }

    DEBUG_PRINTF(g_debug_storage, "Flash: partition '%s' at 0x%06lx, %lu bytes\n",
                 label, (unsigned long)m_partition->address, (unsigned long)m_partition->size);
    return true;
}

uint32_t PartitionFlash::sectorSize() const {
    return CAL_FLASH_SECTOR_SIZE;
}

uint32_t PartitionFlash::sectorCount() const {
    if (m_partition == nullptr) {
        return 0;
    }
    return m_partition->size / CAL_FLASH_SECTOR_SIZE;
}

bool PartitionFlash::read(uint32_t offset, void* data, size_t length) {
    if (m_partition == nullptr) {
        return false;
    }
    esp_err_t err = esp_partition_read(m_partition, offset, data, length);
    if (err != ESP_OK) {
        logPrintf("Flash: read @0x%lx failed: %s\n", (unsigned long)offset, esp_err_to_name(err));
        return false;
    }
    return true;
}

bool PartitionFlash::erase(uint32_t offset, size_t length) {
    if (m_partition == nullptr) {
        return false;
    }
    esp_err_t err = esp_partition_erase_range(m_partition, offset, length);
    if (err != ESP_OK) {
        logPrintf("Flash: erase @0x%lx failed: %s\n", (unsigned long)offset, esp_err_to_name(err));
        return false;
    }
    return true;
}

bool PartitionFlash::write(uint32_t offset, const void* data, size_t length) {
    if (m_partition == nullptr) {
        return false;
    }
    esp_err_t err = esp_partition_write(m_partition, offset, data, length);
    if (err != ESP_OK) {
        logPrintf("Flash: write @0x%lx failed: %s\n", (unsigned long)offset, esp_err_to_name(err));
        return false;
    }
    return true;
}
