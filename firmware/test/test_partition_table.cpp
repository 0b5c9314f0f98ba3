// test_partition_table.cpp
// The flashed partition table must give the calibration store its region.

#include <gtest/gtest.h>

#include <stdint.h>
#include <stdlib.h>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "config.h"

struct PartitionEntry {
    std::string name;
    std::string type;
    std::string subtype;
    unsigned long offset;
    unsigned long size;
};

static std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

static std::vector<PartitionEntry> loadPartitions(const char* path) {
    std::vector<PartitionEntry> entries;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        std::vector<std::string> fields;
        std::stringstream row(line);
        std::string field;
        while (std::getline(row, field, ',')) {
            fields.push_back(trim(field));
        }
        if (fields.size() < 5) {
            continue;
        }
        PartitionEntry entry;
        entry.name = fields[0];
        entry.type = fields[1];
        entry.subtype = fields[2];
        entry.offset = strtoul(fields[3].c_str(), nullptr, 0);
        entry.size = strtoul(fields[4].c_str(), nullptr, 0);
        entries.push_back(entry);
    }
    return entries;
}

class PartitionTableTest : public ::testing::Test {
protected:
    PartitionTableTest() : entries(loadPartitions(PULLCELL_PARTITION_TABLE_PATH)) {}

    const PartitionEntry* find(const std::string& name) const {
        for (size_t i = 0; i < entries.size(); i++) {
            if (entries[i].name == name) {
                return &entries[i];
            }
        }
        return nullptr;
    }

    std::vector<PartitionEntry> entries;
};

TEST_F(PartitionTableTest, HasCalibrationDataPartition) {
    ASSERT_FALSE(entries.empty()) << PULLCELL_PARTITION_TABLE_PATH;
    const PartitionEntry* calib = find(CAL_PARTITION_LABEL);
    ASSERT_NE(nullptr, calib);
    EXPECT_EQ("data", calib->type);
}

TEST_F(PartitionTableTest, CalibrationPartitionHoldsBothSlots) {
    const PartitionEntry* calib = find(CAL_PARTITION_LABEL);
    ASSERT_NE(nullptr, calib);
    EXPECT_GE(calib->size, (unsigned long)(CAL_FLASH_SLOT_COUNT * CAL_FLASH_SECTOR_SIZE));
    EXPECT_EQ(0u, calib->offset % CAL_FLASH_SECTOR_SIZE);
    EXPECT_EQ(0u, calib->size % CAL_FLASH_SECTOR_SIZE);
}

TEST_F(PartitionTableTest, PartitionsDoNotOverlap) {
    for (size_t i = 0; i < entries.size(); i++) {
        for (size_t j = i + 1; j < entries.size(); j++) {
            bool disjoint = entries[i].offset + entries[i].size <= entries[j].offset ||
                            entries[j].offset + entries[j].size <= entries[i].offset;
            EXPECT_TRUE(disjoint) << entries[i].name << " overlaps " << entries[j].name;
        }
    }
}

TEST_F(PartitionTableTest, KeepsNvsForSettings) {
    const PartitionEntry* nvs = find("nvs");
    ASSERT_NE(nullptr, nvs);
    EXPECT_EQ("data", nvs->type);
    EXPECT_EQ("nvs", nvs->subtype);
}
