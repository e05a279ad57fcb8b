#include "recording/Crc32.h"

uint32_t crc32_update(uint32_t crc, const void* data, size_t length) {
  const uint8_t* p = static_cast<const uint8_t*>(data);
  crc ^= 0xFFFFFFFFu;
  while (length--) {
    crc ^= (uint32_t)(*p++);
    for (unsigned i = 0; i < 8; ++i) {
      if (crc & 1)
        crc = (crc >> 1) ^ 0xEDB88320u;
      else
        crc >>= 1;
    }
  }
  return crc ^ 0xFFFFFFFFu;
}

uint32_t crc32_compute(const void* data, size_t length) {
  return crc32_update(0u, data, length);
}
