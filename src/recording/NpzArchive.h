#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/*
===============================================================================
  NpzArchive.h
===============================================================================

  PURPOSE
  -------
  Reads and writes NumPy .npz archives: a ZIP file of .npy arrays.

  Writer:
    - stored entries only (no compression), CRC-32 per entry
    - .npy format 1.0, C order, little-endian dtypes
    - loadable with numpy.load(path)

  Reader:
    - accepts what the writer produces and numpy.savez output
    - rejects compressed entries and ZIP64 archives

  Array payloads are raw little-endian bytes. Row helpers live in
  DatasetStore, which knows the columns.
===============================================================================
*/

enum class NpyDtype : uint8_t {
  UNKNOWN = 0,
  FLOAT32,   // '<f4'
  INT64,     // '<i8'
  BOOL,      // '|b1'
};

struct NpyArray {
  std::string name;              // without ".npy"
  NpyDtype dtype = NpyDtype::UNKNOWN;
  std::vector<uint64_t> shape;   // shape[0] = rows
  std::vector<uint8_t> data;

  uint64_t rows() const { return shape.empty() ? 0 : shape[0]; }

  // Elements per row (product of shape[1:])
  uint64_t rowElements() const;
};

namespace npz {

size_t dtypeSize(NpyDtype dtype);
const char* dtypeDescr(NpyDtype dtype);
NpyDtype dtypeFromDescr(const std::string& descr);

// Numpy-style dtype name for metadata ("float32", "int64", "bool")
const char* dtypeName(NpyDtype dtype);

// Full .npy file image (magic + header + data)
std::vector<uint8_t> encodeNpy(const NpyArray& array);

// Parses a .npy image. On success fills dtype/shape/data (not name).
bool decodeNpy(const uint8_t* bytes, size_t len, NpyArray& out, std::string& error);

// Whole-archive image, entries "<name>.npy" in the given order
std::vector<uint8_t> encodeArchive(const std::vector<NpyArray>& arrays);

bool decodeArchive(const std::vector<uint8_t>& image, std::vector<NpyArray>& out, std::string& error);

}  // namespace npz
