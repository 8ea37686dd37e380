#ifndef HASHVOTE_SERIALIZE_HPP
#define HASHVOTE_SERIALIZE_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace hv {

namespace detail {

template <typename T> static constexpr bool is_pointer_v = std::is_pointer_v<T>;

// Encode an unsigned integer as big endian bytes (network byte order)
template <typename U> inline void putBigEndian(U value, char *bytes) {
  static_assert(std::is_unsigned_v<U>, "putBigEndian requires unsigned type");
  for (size_t i = 0; i < sizeof(U); ++i) {
    bytes[sizeof(U) - 1 - i] = static_cast<char>(value & 0xFF);
    value = static_cast<U>(value >> 8);
  }
}

template <typename U> inline U getBigEndian(const char *bytes) {
  static_assert(std::is_unsigned_v<U>, "getBigEndian requires unsigned type");
  U value = 0;
  for (size_t i = 0; i < sizeof(U); ++i) {
    value = static_cast<U>((value << 8) | static_cast<uint8_t>(bytes[i]));
  }
  return value;
}

} // namespace detail

/**
 * OutputArchive for serialization (writing)
 * Supports the & operator pattern used by custom structs
 *
 * Usage:
 *   std::ostringstream oss;
 *   OutputArchive ar(oss);
 *   ar & myValue;
 *   std::string data = oss.str();
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  void write(bool value) { write(static_cast<uint8_t>(value ? 1 : 0)); }

  void write(uint8_t value) {
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  void write(uint16_t value) { writeUnsigned(value); }
  void write(uint32_t value) { writeUnsigned(value); }
  void write(uint64_t value) { writeUnsigned(value); }
  void write(int32_t value) { writeUnsigned(static_cast<uint32_t>(value)); }
  void write(int64_t value) { writeUnsigned(static_cast<uint64_t>(value)); }

  void write(const std::string &value) {
    write(static_cast<uint64_t>(value.size()));
    if (!value.empty()) {
      os_.write(value.data(), static_cast<std::streamsize>(value.size()));
    }
  }

  template <typename T> void write(const std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    write(static_cast<uint64_t>(value.size()));
    for (const auto &item : value) {
      (*this) & item;
    }
  }

  OutputArchive &operator&(bool value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint8_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint16_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint32_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint64_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(int32_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(int64_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(const std::string &value) {
    write(value);
    return *this;
  }

  template <typename T> OutputArchive &operator&(const std::vector<T> &value) {
    write(value);
    return *this;
  }

  // Custom types expose `template <typename Archive> void serialize(Archive&)`.
  // serialize() is non-const but only reads members when writing.
  template <typename T>
  auto operator&(const T &value)
      -> decltype(std::declval<T &>().template serialize<OutputArchive>(
                      std::declval<OutputArchive &>()),
                  *this) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    const_cast<T &>(value).template serialize<OutputArchive>(*this);
    return *this;
  }

  bool failed() const { return !os_.good(); }

private:
  template <typename U> void writeUnsigned(U value) {
    char bytes[sizeof(U)];
    detail::putBigEndian(value, bytes);
    os_.write(bytes, sizeof(U));
  }

  std::ostream &os_;
};

/**
 * InputArchive for deserialization (reading)
 * Supports the & operator pattern used by custom structs
 *
 * Usage:
 *   std::istringstream iss(data);
 *   InputArchive ar(iss);
 *   ar & myValue;
 *   if (ar.failed()) { handle error }
 */
class InputArchive {
public:
  // Upper bound for a single string or container length read from input
  static constexpr uint64_t MAX_LENGTH = 64ULL * 1024 * 1024;

  explicit InputArchive(std::istream &is) : is_(is) {}

  bool read(bool &value) {
    uint8_t byte = 0;
    if (!read(byte)) {
      return false;
    }
    value = (byte != 0);
    return true;
  }

  bool read(uint8_t &value) {
    if (!is_.read(reinterpret_cast<char *>(&value), sizeof(value))) {
      failed_ = true;
      return false;
    }
    return true;
  }

  bool read(uint16_t &value) { return readUnsigned(value); }
  bool read(uint32_t &value) { return readUnsigned(value); }
  bool read(uint64_t &value) { return readUnsigned(value); }

  bool read(int32_t &value) {
    uint32_t uvalue = 0;
    if (!readUnsigned(uvalue)) {
      return false;
    }
    value = static_cast<int32_t>(uvalue);
    return true;
  }

  bool read(int64_t &value) {
    uint64_t uvalue = 0;
    if (!readUnsigned(uvalue)) {
      return false;
    }
    value = static_cast<int64_t>(uvalue);
    return true;
  }

  bool read(std::string &value) {
    uint64_t size = 0;
    if (!read(size)) {
      return false;
    }
    if (size > MAX_LENGTH) {
      failed_ = true;
      return false;
    }
    value.resize(size);
    if (size > 0 && !is_.read(&value[0], static_cast<std::streamsize>(size))) {
      failed_ = true;
      return false;
    }
    return true;
  }

  template <typename T> bool read(std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    uint64_t size = 0;
    if (!read(size)) {
      return false;
    }
    if (size > MAX_LENGTH) {
      failed_ = true;
      return false;
    }
    value.clear();
    for (uint64_t i = 0; i < size; ++i) {
      T item;
      (*this) & item;
      if (failed_) {
        return false;
      }
      value.push_back(std::move(item));
    }
    return true;
  }

  InputArchive &operator&(bool &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(uint8_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(uint16_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(uint32_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(uint64_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(int32_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(int64_t &value) {
    read(value);
    return *this;
  }

  InputArchive &operator&(std::string &value) {
    read(value);
    return *this;
  }

  template <typename T> InputArchive &operator&(std::vector<T> &value) {
    read(value);
    return *this;
  }

  template <typename T>
  auto operator&(T &value)
      -> decltype(value.template serialize<InputArchive>(*this), *this) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    if (!failed_) {
      value.template serialize<InputArchive>(*this);
    }
    return *this;
  }

  bool failed() const { return failed_; }

private:
  template <typename U> bool readUnsigned(U &value) {
    char bytes[sizeof(U)];
    if (!is_.read(bytes, sizeof(U))) {
      failed_ = true;
      return false;
    }
    value = detail::getBigEndian<U>(bytes);
    return true;
  }

  std::istream &is_;
  bool failed_{ false };
};

} // namespace hv

#endif // HASHVOTE_SERIALIZE_HPP
