#pragma once

#include <cstddef>
#include <cstdint>

// CRC-32 (IEEE 802.3, reflected 0xEDB88320), as used by ZIP archives.
uint32_t crc32_update(uint32_t crc, const void* data, size_t length);
uint32_t crc32_compute(const void* data, size_t length);
