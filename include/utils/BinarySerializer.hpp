/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary serialization over shared stream pointers.
 * Used for the tile store and district snapshots. Arithmetic and enum values
 * are stored little-endian whatever the host byte order; other trivially
 * copyable types are copied byte for byte.
 */
namespace CityScale::BinarySerial {

template <typename T> constexpr bool needsByteSwap() {
  return std::endian::native == std::endian::big && sizeof(T) > 1 &&
         (std::is_arithmetic_v<T> || std::is_enum_v<T>);
}

// Converts between host order and little-endian; its own inverse
template <typename T> T toLittleEndian(T value) {
  if constexpr (needsByteSwap<T>()) {
    auto bytes = std::bit_cast<std::array<unsigned char, sizeof(T)>>(value);
    std::reverse(bytes.begin(), bytes.end());
    return std::bit_cast<T>(bytes);
  } else {
    return value;
  }
}

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream)
      : m_stream(std::move(stream)) {
    if (!m_stream || !m_stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  static std::unique_ptr<Writer> createFileWriter(const std::string &filename) {
    auto stream = std::make_shared<std::ofstream>(
        filename, std::ios::binary | std::ios::trunc);
    if (!stream->is_open()) {
      SERIAL_ERROR("Failed to create writer for file: " + filename);
      return nullptr;
    }
    SERIAL_DEBUG("Created binary writer for file: " + filename);
    return std::make_unique<Writer>(stream);
  }

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    const T stored = toLittleEndian(value);
    m_stream->write(reinterpret_cast<const char *>(&stored), sizeof(T));
    return m_stream->good();
  }

  // Fixed-length block with no size prefix; the reader must know the count
  template <typename T> bool writeArray(const T *data, size_t count) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    if constexpr (needsByteSwap<T>()) {
      for (size_t i = 0; i < count; ++i) {
        if (!write(data[i])) {
          return false;
        }
      }
    } else if (count > 0) {
      m_stream->write(reinterpret_cast<const char *>(data),
                      static_cast<std::streamsize>(sizeof(T) * count));
    }
    return m_stream->good();
  }

  bool writeString(const std::string &str) {
    uint32_t length = static_cast<uint32_t>(str.length());
    if (!write(length)) {
      return false;
    }
    return writeArray(str.data(), length);
  }

  template <typename T> bool writeVector(const std::vector<T> &vec) {
    uint32_t size = static_cast<uint32_t>(vec.size());
    if (!write(size)) {
      return false;
    }
    return writeArray(vec.data(), vec.size());
  }

  bool good() const { return m_stream && m_stream->good(); }

  void flush() {
    if (m_stream) {
      m_stream->flush();
    }
  }
};

class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

  static constexpr uint32_t MAX_STRING_BYTES = 1024 * 1024;
  static constexpr uint32_t MAX_VECTOR_ELEMENTS = 16 * 1024 * 1024;

public:
  explicit Reader(std::shared_ptr<std::istream> stream)
      : m_stream(std::move(stream)) {
    if (!m_stream || !m_stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  static std::unique_ptr<Reader> createFileReader(const std::string &filename) {
    auto stream = std::make_shared<std::ifstream>(filename, std::ios::binary);
    if (!stream->is_open()) {
      SERIAL_ERROR("Failed to create reader for file: " + filename);
      return nullptr;
    }
    SERIAL_DEBUG("Created binary reader for file: " + filename);
    return std::make_unique<Reader>(stream);
  }

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    value = toLittleEndian(value);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(sizeof(T));
  }

  template <typename T> bool readArray(T *data, size_t count) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    if (count == 0) {
      return true;
    }
    const auto bytes = static_cast<std::streamsize>(sizeof(T) * count);
    m_stream->read(reinterpret_cast<char *>(data), bytes);
    if constexpr (needsByteSwap<T>()) {
      for (size_t i = 0; i < count; ++i) {
        data[i] = toLittleEndian(data[i]);
      }
    }
    return m_stream->good() && m_stream->gcount() == bytes;
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }
    if (length > MAX_STRING_BYTES) {
      SERIAL_ERROR("String length too large: " + std::to_string(length) +
                   " bytes");
      return false;
    }
    str.resize(length);
    return readArray(str.data(), length);
  }

  template <typename T> bool readVector(std::vector<T> &vec) {
    uint32_t size = 0;
    if (!read(size)) {
      return false;
    }
    if (size > MAX_VECTOR_ELEMENTS) {
      SERIAL_ERROR("Vector size too large: " + std::to_string(size) +
                   " elements");
      return false;
    }
    vec.resize(size);
    return readArray(vec.data(), size);
  }

  // True when every byte of the stream has been consumed
  bool atEnd() {
    return m_stream->peek() == std::char_traits<char>::eof();
  }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace CityScale::BinarySerial

#endif // BINARY_SERIALIZER_HPP
