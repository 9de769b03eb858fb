#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace moltrace::util {

// Fixed-width little-endian encoding into an in-memory byte string.
// Output is identical on every host, so it can serve as an identity key.
class ByteWriter {
public:
  explicit ByteWriter(std::string& out) : out_(out) {}

  void write_u32(std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out_.push_back(static_cast<char>((v >> (8 * i)) & 0xffu));
  }

  // Checked narrowing for counts and indices.
  void write_size32(std::size_t v) {
    if (v > std::numeric_limits<std::uint32_t>::max()) {
      throw std::runtime_error("ByteWriter: value does not fit in 32 bits");
    }
    write_u32(static_cast<std::uint32_t>(v));
  }

private:
  std::string& out_;
};

class ByteReader {
public:
  explicit ByteReader(std::string_view in) : in_(in) {}

  bool at_end() const { return pos_ == in_.size(); }
  std::size_t remaining() const { return in_.size() - pos_; }

  std::uint32_t read_u32() {
    need_(4);
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
      v |= static_cast<std::uint32_t>(static_cast<unsigned char>(in_[pos_ + static_cast<std::size_t>(i)])) << (8 * i);
    }
    pos_ += 4;
    return v;
  }

private:
  std::string_view in_;
  std::size_t pos_ = 0;

  void need_(std::size_t n) const {
    if (in_.size() - pos_ < n) throw std::runtime_error("ByteReader: truncated buffer");
  }
};

class BinaryWriter {
public:
  explicit BinaryWriter(std::ostream& os) : os_(os) {
    if (!os_) throw std::runtime_error("BinaryWriter: stream is not writable");
  }

  void write_bytes(const void* data, std::size_t n) {
    os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
    if (!os_) throw std::runtime_error("BinaryWriter: write failed");
  }

  template <typename T>
  void write_pod(const T& v) {
    static_assert(std::is_trivially_copyable_v<T>, "write_pod requires trivially copyable type");
    write_bytes(&v, sizeof(T));
  }

  void write_u32(std::uint32_t v) { write_pod(v); }
  void write_u64(std::uint64_t v) { write_pod(v); }

  // Length-prefixed bytes (u64 length).
  void write_blob(std::string_view s) {
    write_u64(static_cast<std::uint64_t>(s.size()));
    if (!s.empty()) write_bytes(s.data(), s.size());
  }

  void write_string(std::string_view s) {
    if (s.size() > std::numeric_limits<std::uint32_t>::max()) {
      throw std::runtime_error("BinaryWriter: string too large");
    }
    write_u32(static_cast<std::uint32_t>(s.size()));
    if (!s.empty()) write_bytes(s.data(), s.size());
  }

  template <typename T>
  void write_vec_pod(const std::vector<T>& v) {
    static_assert(std::is_trivially_copyable_v<T>, "write_vec_pod requires trivially copyable type");
    write_u64(static_cast<std::uint64_t>(v.size()));
    if (!v.empty()) write_bytes(v.data(), sizeof(T) * v.size());
  }

private:
  std::ostream& os_;
};

class BinaryReader {
public:
  explicit BinaryReader(std::istream& is) : is_(is) {
    if (!is_) throw std::runtime_error("BinaryReader: stream is not readable");
  }

  void read_bytes(void* data, std::size_t n) {
    is_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(n));
    if (!is_) throw std::runtime_error("BinaryReader: read failed (truncated/corrupt file?)");
  }

  template <typename T>
  void read_pod(T& v) {
    static_assert(std::is_trivially_copyable_v<T>, "read_pod requires trivially copyable type");
    read_bytes(&v, sizeof(T));
  }

  std::uint32_t read_u32() { std::uint32_t v{}; read_pod(v); return v; }
  std::uint64_t read_u64() { std::uint64_t v{}; read_pod(v); return v; }

  std::string read_blob() {
    const std::uint64_t n = read_u64();
    if (n > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
      throw std::runtime_error("BinaryReader: blob size overflow");
    }
    std::string s;
    s.resize(static_cast<std::size_t>(n));
    if (n > 0) read_bytes(s.data(), static_cast<std::size_t>(n));
    return s;
  }

  std::string read_string() {
    const std::uint32_t n = read_u32();
    std::string s;
    s.resize(n);
    if (n > 0) read_bytes(s.data(), n);
    return s;
  }

  template <typename T>
  void read_vec_pod(std::vector<T>& v) {
    static_assert(std::is_trivially_copyable_v<T>, "read_vec_pod requires trivially copyable type");
    const std::uint64_t n = read_u64();
    if (n > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max() / sizeof(T))) {
      throw std::runtime_error("BinaryReader: vector size overflow");
    }
    v.resize(static_cast<std::size_t>(n));
    if (n > 0) read_bytes(v.data(), sizeof(T) * static_cast<std::size_t>(n));
  }

private:
  std::istream& is_;
};

inline void require_magic(std::istream& is, std::string_view magic) {
  std::string got;
  got.resize(magic.size());
  is.read(got.data(), static_cast<std::streamsize>(magic.size()));
  if (!is) throw std::runtime_error("BinaryReader: missing magic (truncated/corrupt file?)");
  if (std::string_view(got) != magic) {
    throw std::runtime_error("BinaryReader: magic mismatch (not a moltrace timeline file, or wrong version)");
  }
}

inline void write_magic(std::ostream& os, std::string_view magic) {
  os.write(magic.data(), static_cast<std::streamsize>(magic.size()));
  if (!os) throw std::runtime_error("BinaryWriter: failed to write magic");
}

} // namespace moltrace::util
