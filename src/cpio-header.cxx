#include <boost-iostreams-cpio/cpio-header.hxx>
#include <boost-iostreams-cpio/detail/byte-projection.hxx>
#include <algorithm>
#include <bit>

namespace boost_iostreams_cpio {
namespace {

/**
 * @brief Stamp a text magic into the leading field of an ASCII header.
 *
 * @param field The six-byte magic field.
 * @param magic One of odc_magic, newc_magic or crc_magic.
 */
void stamp_text_magic(char (&field)[6], std::string_view magic) {
  std::copy(magic.begin(), magic.end(), field);
}

NewcHeader make_newc_impl(std::string_view magic) {
  NewcHeader header{};
  stamp_text_magic(header.magic, magic);
  return header;
}

} // unnamed namespace

/**
 * @brief Build a blank old binary header.
 *
 * All words are zero except the magic, whose bytes are taken in memory order
 * so the first two wire bytes are always 0xC7 0x71.
 */
OldHeader OldHeader::make() {
  OldHeader header{};
  header.magic = std::bit_cast<std::uint16_t>(old_magic);
  return header;
}

// Old headers hold 16-bit words, so both size and alignment are checked.
std::span<const std::uint8_t, old_header_len> OldHeader::as_bytes() const {
  return detail::project_aligned<old_header_len, alignof(std::uint16_t)>(
      *this);
}

/**
 * @brief Build a blank odc header: "070707" followed by 70 zero bytes.
 */
OdcHeader OdcHeader::make() {
  OdcHeader header{};
  stamp_text_magic(header.magic, odc_magic);
  return header;
}

std::span<const std::uint8_t, odc_header_len> OdcHeader::as_bytes() const {
  return detail::project_dense<odc_header_len>(*this);
}

NewcHeader NewcHeader::make() { return make_newc_impl(newc_magic); }

NewcHeader NewcHeader::make_crc() { return make_newc_impl(crc_magic); }

std::span<const std::uint8_t, newc_header_len> NewcHeader::as_bytes() const {
  return detail::project_dense<newc_header_len>(*this);
}
} // namespace boost_iostreams_cpio
