#pragma once

// pxjson encoding detection: identifies the Unicode encoding of a JSON byte
// buffer (BOM first, RFC 8259 appendix B heuristic otherwise) and decodes it
// lazily into scalars.

#include <pxjson/chars.hpp>
#include <pxjson/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pxjson {

enum class encoding { utf8, utf16be, utf16le, utf32be, utf32le };

inline const char* encoding_name(encoding enc) noexcept {
  switch (enc) {
    case encoding::utf8: return "UTF-8";
    case encoding::utf16be: return "UTF-16BE";
    case encoding::utf16le: return "UTF-16LE";
    case encoding::utf32be: return "UTF-32BE";
    case encoding::utf32le: return "UTF-32LE";
  }
  return "unknown";
}

struct encoding_result {
  encoding enc{encoding::utf8};
  std::size_t bom_size{0};
  error err;
};

namespace detail {

inline std::uint8_t byte_at(std::string_view s, std::size_t i) noexcept {
  return static_cast<std::uint8_t>(s[i]);
}

} // namespace detail

inline encoding_result detect_encoding(std::string_view bytes) noexcept {
  using detail::byte_at;
  encoding_result r;
  const std::size_t n = bytes.size();

  // BOMs. UTF-32LE must be tested before UTF-16LE since it shares the prefix.
  if (n >= 4 && byte_at(bytes, 0) == 0x00 && byte_at(bytes, 1) == 0x00 && byte_at(bytes, 2) == 0xFE &&
      byte_at(bytes, 3) == 0xFF) {
    r.enc = encoding::utf32be;
    r.bom_size = 4;
    return r;
  }
  if (n >= 4 && byte_at(bytes, 0) == 0xFF && byte_at(bytes, 1) == 0xFE && byte_at(bytes, 2) == 0x00 &&
      byte_at(bytes, 3) == 0x00) {
    r.enc = encoding::utf32le;
    r.bom_size = 4;
    return r;
  }
  if (n >= 3 && byte_at(bytes, 0) == 0xEF && byte_at(bytes, 1) == 0xBB && byte_at(bytes, 2) == 0xBF) {
    r.enc = encoding::utf8;
    r.bom_size = 3;
    return r;
  }
  if (n == 3 && byte_at(bytes, 0) == 0x00 && byte_at(bytes, 1) == 0x00 && byte_at(bytes, 2) == 0xFE) {
    // A cut-off UTF-32BE BOM; no reading of these bytes is meaningful.
    r.err.code = error_code::invalid_encoding;
    return r;
  }
  if (n >= 2 && byte_at(bytes, 0) == 0xFE && byte_at(bytes, 1) == 0xFF) {
    r.enc = encoding::utf16be;
    r.bom_size = 2;
    return r;
  }
  if (n >= 2 && byte_at(bytes, 0) == 0xFF && byte_at(bytes, 1) == 0xFE) {
    r.enc = encoding::utf16le;
    r.bom_size = 2;
    return r;
  }

  // No BOM: the first character of JSON text is ASCII, so the zero bytes
  // among the first four disclose the code unit width and byte order.
  if (n >= 4) {
    const bool z0 = byte_at(bytes, 0) == 0;
    const bool z1 = byte_at(bytes, 1) == 0;
    const bool z2 = byte_at(bytes, 2) == 0;
    const bool z3 = byte_at(bytes, 3) == 0;
    if (z0 && z1 && z2 && !z3) r.enc = encoding::utf32be;
    else if (!z0 && z1 && z2 && z3) r.enc = encoding::utf32le;
    else if (z0 && !z1) r.enc = encoding::utf16be;
    else if (!z0 && z1) r.enc = encoding::utf16le;
    return r;
  }
  if (n >= 2) {
    const bool z0 = byte_at(bytes, 0) == 0;
    const bool z1 = byte_at(bytes, 1) == 0;
    if (z0 && !z1) r.enc = encoding::utf16be;
    else if (!z0 && z1) r.enc = encoding::utf16le;
  }
  return r;
}

// Pull-based decoder from encoded bytes to Unicode scalars. Ill-formed input
// never stops decoding: each maximal ill-formed subsequence yields U+FFFD.
class scalar_reader {
public:
  scalar_reader() = default;

  // `bytes` must not include the BOM and must outlive the reader.
  scalar_reader(std::string_view bytes, encoding enc) noexcept : bytes_(bytes), enc_(enc) {}

  encoding source_encoding() const noexcept { return enc_; }

  bool next(char32_t& cp) noexcept {
    if (pos_ >= bytes_.size()) return false;
    switch (enc_) {
      case encoding::utf8: cp = next_utf8(); break;
      case encoding::utf16be: cp = next_utf16(true); break;
      case encoding::utf16le: cp = next_utf16(false); break;
      case encoding::utf32be: cp = next_utf32(true); break;
      case encoding::utf32le: cp = next_utf32(false); break;
    }
    return true;
  }

private:
  char32_t next_utf8() noexcept {
    const std::uint8_t b0 = detail::byte_at(bytes_, pos_++);
    if (b0 < 0x80) return b0;

    std::size_t need = 0;
    std::uint32_t cp = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
      need = 1;
      cp = b0 & 0x1Fu;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
      need = 2;
      cp = b0 & 0x0Fu;
      if (b0 == 0xE0) lo = 0xA0;       // overlong
      else if (b0 == 0xED) hi = 0x9F;  // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
      need = 3;
      cp = b0 & 0x07u;
      if (b0 == 0xF0) lo = 0x90;       // overlong
      else if (b0 == 0xF4) hi = 0x8F;  // above U+10FFFF
    } else {
      return detail::replacement_character;
    }

    for (std::size_t k = 0; k < need; ++k) {
      if (pos_ >= bytes_.size()) return detail::replacement_character;
      const std::uint8_t b = detail::byte_at(bytes_, pos_);
      if (b < lo || b > hi) return detail::replacement_character;
      lo = 0x80;
      hi = 0xBF;
      cp = (cp << 6) | (b & 0x3Fu);
      ++pos_;
    }
    return static_cast<char32_t>(cp);
  }

  bool read_unit16(bool big_endian, std::uint32_t& cu) noexcept {
    if (bytes_.size() - pos_ < 2) {
      pos_ = bytes_.size();
      return false;
    }
    const std::uint32_t a = detail::byte_at(bytes_, pos_);
    const std::uint32_t b = detail::byte_at(bytes_, pos_ + 1);
    cu = big_endian ? ((a << 8) | b) : ((b << 8) | a);
    pos_ += 2;
    return true;
  }

  char32_t next_utf16(bool big_endian) noexcept {
    std::uint32_t lead = 0;
    if (!read_unit16(big_endian, lead)) return detail::replacement_character;
    if (detail::is_trail_surrogate(lead)) return detail::replacement_character;
    if (!detail::is_lead_surrogate(lead)) return static_cast<char32_t>(lead);

    const std::size_t save = pos_;
    std::uint32_t trail = 0;
    if (bytes_.size() - pos_ < 2 || !read_unit16(big_endian, trail)) return detail::replacement_character;
    if (!detail::is_trail_surrogate(trail)) {
      pos_ = save;
      return detail::replacement_character;
    }
    return static_cast<char32_t>(0x10000u + ((lead - 0xD800u) << 10) + (trail - 0xDC00u));
  }

  char32_t next_utf32(bool big_endian) noexcept {
    if (bytes_.size() - pos_ < 4) {
      pos_ = bytes_.size();
      return detail::replacement_character;
    }
    std::uint32_t cp = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const std::uint32_t b = detail::byte_at(bytes_, pos_ + (big_endian ? k : 3 - k));
      cp = (cp << 8) | b;
    }
    pos_ += 4;
    if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) return detail::replacement_character;
    return static_cast<char32_t>(cp);
  }

  std::string_view bytes_;
  std::size_t pos_{0};
  encoding enc_{encoding::utf8};
};

// Detects the encoding of `bytes` and returns a reader positioned after the BOM.
inline scalar_reader make_scalar_reader(std::string_view bytes, const encoding_result& detected) noexcept {
  return scalar_reader(bytes.substr(detected.bom_size), detected.enc);
}

} // namespace pxjson
