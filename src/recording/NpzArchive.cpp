#include "recording/NpzArchive.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "recording/Crc32.h"

/*
===============================================================================
  NpzArchive.cpp
===============================================================================

  ZIP layout written (all little-endian):

    [local file header][name][data]   x N
    [central directory entry][name]   x N
    [end of central directory]

  .npy 1.0 layout:

    "\x93NUMPY" 0x01 0x00 <u16 header_len> <header text padded to 64, '\n'>
    <raw data>
===============================================================================
*/

/*=============================================================================
  SMALL HELPERS
=============================================================================*/

static constexpr uint32_t ZIP_LOCAL_SIG   = 0x04034b50u;
static constexpr uint32_t ZIP_CENTRAL_SIG = 0x02014b50u;
static constexpr uint32_t ZIP_END_SIG     = 0x06054b50u;
static constexpr uint16_t ZIP_VERSION     = 20;
static constexpr uint16_t ZIP_METHOD_STORED = 0;
static constexpr uint16_t ZIP_DOS_DATE_1980 = (0 << 9) | (1 << 5) | 1;
static constexpr size_t   ZIP_LOCAL_HEADER_BYTES   = 30;
static constexpr size_t   ZIP_CENTRAL_HEADER_BYTES = 46;
static constexpr size_t   ZIP_END_BYTES            = 22;

static const char NPY_MAGIC[] = "\x93NUMPY";
static constexpr size_t NPY_MAGIC_BYTES = 6;
static constexpr size_t NPY_ALIGN = 64;

static void put16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back((uint8_t)(v & 0xFF));
  out.push_back((uint8_t)((v >> 8) & 0xFF));
}

static void put32(std::vector<uint8_t>& out, uint32_t v) {
  for (int i = 0; i < 4; i++) out.push_back((uint8_t)((v >> (8 * i)) & 0xFF));
}

static uint16_t get16(const uint8_t* p) {
  return (uint16_t)(p[0] | (p[1] << 8));
}

static uint32_t get32(const uint8_t* p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

// Finds the quoted value following key in a numpy header dict
static bool headerString(const std::string& header, const char* key, std::string& out) {
  const size_t k = header.find(key);
  if (k == std::string::npos) return false;
  size_t q1 = header.find_first_of("'\"", k + strlen(key));
  if (q1 == std::string::npos) return false;
  const char quote = header[q1];
  const size_t q2 = header.find(quote, q1 + 1);
  if (q2 == std::string::npos) return false;
  out = header.substr(q1 + 1, q2 - q1 - 1);
  return true;
}

static bool headerShape(const std::string& header, std::vector<uint64_t>& shape) {
  shape.clear();
  const size_t k = header.find("'shape'");
  if (k == std::string::npos) return false;
  const size_t open = header.find('(', k);
  const size_t close = header.find(')', open == std::string::npos ? k : open);
  if (open == std::string::npos || close == std::string::npos) return false;

  const std::string body = header.substr(open + 1, close - open - 1);
  const char* p = body.c_str();
  while (*p) {
    while (*p == ' ' || *p == ',') p++;
    if (!*p) break;
    char* end = nullptr;
    const unsigned long long v = strtoull(p, &end, 10);
    if (end == p) return false;
    shape.push_back((uint64_t)v);
    p = end;
    while (*p == 'L') p++;  // py2-era "3L"
  }
  return true;
}


/*=============================================================================
  NpyArray
=============================================================================*/

uint64_t NpyArray::rowElements() const {
  uint64_t n = 1;
  for (size_t i = 1; i < shape.size(); i++) n *= shape[i];
  return n;
}


namespace npz {

/*=============================================================================
  DTYPES
=============================================================================*/

size_t dtypeSize(NpyDtype dtype) {
  switch (dtype) {
    case NpyDtype::FLOAT32: return 4;
    case NpyDtype::INT64:   return 8;
    case NpyDtype::BOOL:    return 1;
    case NpyDtype::UNKNOWN: break;
  }
  return 0;
}

const char* dtypeDescr(NpyDtype dtype) {
  switch (dtype) {
    case NpyDtype::FLOAT32: return "<f4";
    case NpyDtype::INT64:   return "<i8";
    case NpyDtype::BOOL:    return "|b1";
    case NpyDtype::UNKNOWN: break;
  }
  return "";
}

const char* dtypeName(NpyDtype dtype) {
  switch (dtype) {
    case NpyDtype::FLOAT32: return "float32";
    case NpyDtype::INT64:   return "int64";
    case NpyDtype::BOOL:    return "bool";
    case NpyDtype::UNKNOWN: break;
  }
  return "unknown";
}

NpyDtype dtypeFromDescr(const std::string& descr) {
  if (descr == "<f4") return NpyDtype::FLOAT32;
  if (descr == "<i8") return NpyDtype::INT64;
  if (descr == "|b1" || descr == "?") return NpyDtype::BOOL;
  return NpyDtype::UNKNOWN;
}


/*=============================================================================
  .npy
=============================================================================*/

std::vector<uint8_t> encodeNpy(const NpyArray& array) {
  std::string header = "{'descr': '";
  header += dtypeDescr(array.dtype);
  header += "', 'fortran_order': False, 'shape': (";
  for (size_t i = 0; i < array.shape.size(); i++) {
    char num[32];
    snprintf(num, sizeof(num), "%llu", (unsigned long long)array.shape[i]);
    header += num;
    if (array.shape.size() == 1 || i + 1 < array.shape.size()) header += ",";
    if (i + 1 < array.shape.size()) header += " ";
  }
  header += "), }";

  // magic(6) + version(2) + len(2) + header + '\n' must be a multiple of 64
  const size_t preamble = NPY_MAGIC_BYTES + 2 + 2;
  size_t total = preamble + header.size() + 1;
  const size_t pad = (NPY_ALIGN - (total % NPY_ALIGN)) % NPY_ALIGN;
  header.append(pad, ' ');
  header += '\n';

  std::vector<uint8_t> out;
  out.reserve(preamble + header.size() + array.data.size());
  out.insert(out.end(), NPY_MAGIC, NPY_MAGIC + NPY_MAGIC_BYTES);
  out.push_back(1);
  out.push_back(0);
  put16(out, (uint16_t)header.size());
  out.insert(out.end(), header.begin(), header.end());
  out.insert(out.end(), array.data.begin(), array.data.end());
  return out;
}

bool decodeNpy(const uint8_t* bytes, size_t len, NpyArray& out, std::string& error) {
  if (len < NPY_MAGIC_BYTES + 4 || memcmp(bytes, NPY_MAGIC, NPY_MAGIC_BYTES) != 0) {
    error = "not a .npy image";
    return false;
  }

  const uint8_t major = bytes[NPY_MAGIC_BYTES];
  size_t header_len = 0;
  size_t header_start = 0;
  if (major == 1) {
    header_len = get16(bytes + NPY_MAGIC_BYTES + 2);
    header_start = NPY_MAGIC_BYTES + 4;
  } else if (major == 2 || major == 3) {
    if (len < NPY_MAGIC_BYTES + 6) {
      error = "truncated .npy header";
      return false;
    }
    header_len = get32(bytes + NPY_MAGIC_BYTES + 2);
    header_start = NPY_MAGIC_BYTES + 6;
  } else {
    error = "unsupported .npy version";
    return false;
  }

  if (header_start + header_len > len) {
    error = "truncated .npy header";
    return false;
  }

  const std::string header((const char*)bytes + header_start, header_len);

  std::string descr;
  if (!headerString(header, "'descr'", descr)) {
    error = "missing descr";
    return false;
  }
  out.dtype = dtypeFromDescr(descr);
  if (out.dtype == NpyDtype::UNKNOWN) {
    error = "unsupported dtype " + descr;
    return false;
  }

  if (header.find("'fortran_order': True") != std::string::npos) {
    error = "fortran order arrays are not supported";
    return false;
  }

  if (!headerShape(header, out.shape)) {
    error = "missing shape";
    return false;
  }

  uint64_t elements = 1;
  for (uint64_t d : out.shape) elements *= d;
  const uint64_t payload = elements * dtypeSize(out.dtype);
  const size_t data_start = header_start + header_len;
  if (data_start + payload > len) {
    error = "truncated .npy data";
    return false;
  }

  out.data.assign(bytes + data_start, bytes + data_start + payload);
  return true;
}


/*=============================================================================
  .npz (ZIP, stored)
=============================================================================*/

std::vector<uint8_t> encodeArchive(const std::vector<NpyArray>& arrays) {
  struct Entry {
    std::string name;
    uint32_t crc;
    uint32_t size;
    uint32_t offset;
  };

  std::vector<uint8_t> out;
  std::vector<Entry> entries;

  for (const NpyArray& a : arrays) {
    const std::vector<uint8_t> body = encodeNpy(a);

    Entry e;
    e.name = a.name + ".npy";
    e.crc = crc32_compute(body.data(), body.size());
    e.size = (uint32_t)body.size();
    e.offset = (uint32_t)out.size();

    put32(out, ZIP_LOCAL_SIG);
    put16(out, ZIP_VERSION);
    put16(out, 0);                 // flags
    put16(out, ZIP_METHOD_STORED);
    put16(out, 0);                 // mod time
    put16(out, ZIP_DOS_DATE_1980);
    put32(out, e.crc);
    put32(out, e.size);            // compressed
    put32(out, e.size);            // uncompressed
    put16(out, (uint16_t)e.name.size());
    put16(out, 0);                 // extra
    out.insert(out.end(), e.name.begin(), e.name.end());
    out.insert(out.end(), body.begin(), body.end());

    entries.push_back(e);
  }

  const uint32_t cd_offset = (uint32_t)out.size();
  for (const Entry& e : entries) {
    put32(out, ZIP_CENTRAL_SIG);
    put16(out, ZIP_VERSION);       // made by
    put16(out, ZIP_VERSION);       // needed
    put16(out, 0);
    put16(out, ZIP_METHOD_STORED);
    put16(out, 0);
    put16(out, ZIP_DOS_DATE_1980);
    put32(out, e.crc);
    put32(out, e.size);
    put32(out, e.size);
    put16(out, (uint16_t)e.name.size());
    put16(out, 0);                 // extra
    put16(out, 0);                 // comment
    put16(out, 0);                 // disk
    put16(out, 0);                 // internal attr
    put32(out, 0);                 // external attr
    put32(out, e.offset);
    out.insert(out.end(), e.name.begin(), e.name.end());
  }
  const uint32_t cd_size = (uint32_t)out.size() - cd_offset;

  put32(out, ZIP_END_SIG);
  put16(out, 0);
  put16(out, 0);
  put16(out, (uint16_t)entries.size());
  put16(out, (uint16_t)entries.size());
  put32(out, cd_size);
  put32(out, cd_offset);
  put16(out, 0);                   // comment
  return out;
}

bool decodeArchive(const std::vector<uint8_t>& image, std::vector<NpyArray>& out, std::string& error) {
  out.clear();
  const size_t n = image.size();
  if (n < ZIP_END_BYTES) {
    error = "archive too small";
    return false;
  }

  // End record sits in the last 22 + comment (<= 65535) bytes
  size_t end_pos = n;
  const size_t scan_floor = (n > ZIP_END_BYTES + 0xFFFF) ? n - ZIP_END_BYTES - 0xFFFF : 0;
  for (size_t p = n - ZIP_END_BYTES + 1; p-- > scan_floor;) {
    if (get32(&image[p]) == ZIP_END_SIG) {
      end_pos = p;
      break;
    }
  }
  if (end_pos == n) {
    error = "end of central directory not found";
    return false;
  }

  const uint8_t* end = &image[end_pos];
  const uint16_t count = get16(end + 10);
  const uint32_t cd_size = get32(end + 12);
  const uint32_t cd_offset = get32(end + 16);
  if (cd_offset == 0xFFFFFFFFu || count == 0xFFFF) {
    error = "ZIP64 archives are not supported";
    return false;
  }
  if ((uint64_t)cd_offset + cd_size > end_pos) {
    error = "central directory out of range";
    return false;
  }

  size_t pos = cd_offset;
  for (uint16_t i = 0; i < count; i++) {
    if (pos + ZIP_CENTRAL_HEADER_BYTES > n || get32(&image[pos]) != ZIP_CENTRAL_SIG) {
      error = "bad central directory entry";
      return false;
    }
    const uint8_t* cd = &image[pos];
    const uint16_t method = get16(cd + 10);
    const uint32_t crc = get32(cd + 16);
    const uint32_t csize = get32(cd + 20);
    const uint32_t usize = get32(cd + 24);
    const uint16_t name_len = get16(cd + 28);
    const uint16_t extra_len = get16(cd + 30);
    const uint16_t comment_len = get16(cd + 32);
    const uint32_t local_offset = get32(cd + 42);

    if (pos + ZIP_CENTRAL_HEADER_BYTES + name_len > n) {
      error = "bad central directory name";
      return false;
    }
    std::string name((const char*)cd + ZIP_CENTRAL_HEADER_BYTES, name_len);
    pos += ZIP_CENTRAL_HEADER_BYTES + name_len + extra_len + comment_len;

    if (method != ZIP_METHOD_STORED) {
      error = "compressed entry " + name + " (only stored archives are supported)";
      return false;
    }
    if (csize == 0xFFFFFFFFu || usize == 0xFFFFFFFFu || local_offset == 0xFFFFFFFFu) {
      error = "ZIP64 entry " + name + " is not supported";
      return false;
    }
    if (csize != usize) {
      error = "size mismatch in stored entry " + name;
      return false;
    }

    if ((uint64_t)local_offset + ZIP_LOCAL_HEADER_BYTES > n ||
        get32(&image[local_offset]) != ZIP_LOCAL_SIG) {
      error = "bad local header for " + name;
      return false;
    }
    const uint8_t* lh = &image[local_offset];
    const size_t data_start = (size_t)local_offset + ZIP_LOCAL_HEADER_BYTES +
                              get16(lh + 26) + get16(lh + 28);
    if ((uint64_t)data_start + csize > n) {
      error = "truncated entry " + name;
      return false;
    }

    const uint8_t* body = &image[data_start];
    if (crc32_compute(body, csize) != crc) {
      error = "CRC mismatch in " + name;
      return false;
    }

    NpyArray a;
    if (!decodeNpy(body, csize, a, error)) {
      error = name + ": " + error;
      return false;
    }
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".npy") == 0) {
      name.resize(name.size() - 4);
    }
    a.name = name;
    out.push_back(a);
  }
  return true;
}

}  // namespace npz
