/**
 * @file cpio-header.hxx
 * @brief Fixed-size CPIO entry headers (old binary, odc, newc and newc-crc)
 * and their projection to wire bytes.
 */

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace boost_iostreams_cpio {
/// Wire length of an old binary header.
inline constexpr std::size_t old_header_len = 26;
/// Wire length of a portable ASCII (odc) header.
inline constexpr std::size_t odc_header_len = 76;
/// Wire length of a newc or newc-crc header.
inline constexpr std::size_t newc_header_len = 110;

/// Magic of the old binary format, in memory order.
inline constexpr std::array<std::uint8_t, 2> old_magic{0xC7, 0x71};
inline constexpr std::string_view odc_magic = "070707";
inline constexpr std::string_view newc_magic = "070701";
inline constexpr std::string_view crc_magic = "070702";

/**
 * @struct OldHeader
 * @brief Old binary CPIO header: thirteen native-endian 16-bit words.
 *
 * 32-bit quantities (mtime, filesize) are stored as two words, most
 * significant word first. The struct is not packed: sixteen-bit fields leave
 * no gaps, which the static_asserts below pin down.
 */
struct OldHeader {
  std::uint16_t magic;       /**< @brief 0xC7 0x71 in memory order. */
  std::uint16_t dev;         /**< @brief Device containing the entry. */
  std::uint16_t ino;         /**< @brief Inode number. */
  std::uint16_t mode;        /**< @brief File type and permission bits. */
  std::uint16_t uid;         /**< @brief Owner user ID. */
  std::uint16_t gid;         /**< @brief Owner group ID. */
  std::uint16_t nlink;       /**< @brief Number of links to the entry. */
  std::uint16_t rdev;        /**< @brief Device number of a special file. */
  std::uint16_t mtime[2];    /**< @brief Modification time. */
  std::uint16_t namesize;    /**< @brief Pathname length including NUL. */
  std::uint16_t filesize[2]; /**< @brief Size of the entry's data. */

  static constexpr std::size_t wire_length = old_header_len;

  /**
   * @brief Create a zeroed header carrying the old binary magic.
   */
  static OldHeader make();

  /**
   * @brief View the header as its 26 wire bytes.
   */
  std::span<const std::uint8_t, old_header_len> as_bytes() const;
};

/**
 * @struct OdcHeader
 * @brief Portable ASCII (POSIX.1 odc) header; numbers are zero-padded octal
 * text.
 */
struct __attribute__((packed)) OdcHeader {
  char magic[6];     /**< @brief "070707". */
  char dev[6];       /**< @brief Device containing the entry. */
  char ino[6];       /**< @brief Inode number. */
  char mode[6];      /**< @brief File type and permission bits. */
  char uid[6];       /**< @brief Owner user ID. */
  char gid[6];       /**< @brief Owner group ID. */
  char nlink[6];     /**< @brief Number of links to the entry. */
  char rdev[6];      /**< @brief Device number of a special file. */
  char mtime[11];    /**< @brief Modification time. */
  char namesize[6];  /**< @brief Pathname length including NUL. */
  char filesize[11]; /**< @brief Size of the entry's data. */

  static constexpr std::size_t wire_length = odc_header_len;

  /**
   * @brief Create a zeroed header carrying the odc magic.
   */
  static OdcHeader make();

  /**
   * @brief View the header as its 76 wire bytes.
   */
  std::span<const std::uint8_t, odc_header_len> as_bytes() const;
};

// newc and newc-crc share this layout; crc only changes the magic and gives
// meaning to the check field.
struct __attribute__((packed)) NewcHeader {
  char magic[6];     /**< @brief "070701" or "070702". */
  char ino[8];       /**< @brief Inode number. */
  char mode[8];      /**< @brief File type and permission bits. */
  char uid[8];       /**< @brief Owner user ID. */
  char gid[8];       /**< @brief Owner group ID. */
  char nlink[8];     /**< @brief Number of links to the entry. */
  char mtime[8];     /**< @brief Modification time. */
  char filesize[8];  /**< @brief Size of the entry's data. */
  char devmajor[8];  /**< @brief Major number of the containing device. */
  char devminor[8];  /**< @brief Minor number of the containing device. */
  char rdevmajor[8]; /**< @brief Major number of a special file. */
  char rdevminor[8]; /**< @brief Minor number of a special file. */
  char namesize[8];  /**< @brief Pathname length including NUL. */
  char check[8];     /**< @brief Data checksum (crc variant only). */

  static constexpr std::size_t wire_length = newc_header_len;

  /**
   * @brief Create a zeroed header carrying the newc magic "070701".
   */
  static NewcHeader make();

  /**
   * @brief Create a zeroed header carrying the newc-crc magic "070702".
   */
  static NewcHeader make_crc();

  /**
   * @brief View the header as its 110 wire bytes.
   */
  std::span<const std::uint8_t, newc_header_len> as_bytes() const;
};

/**
 * @brief Capability shared by every header variant: blank construction and
 * projection to a fixed number of wire bytes.
 */
template <typename T>
concept CpioHeader = std::copyable<T> && requires(const T &header) {
  { T::make() } -> std::same_as<T>;
  { header.as_bytes() }
      -> std::same_as<std::span<const std::uint8_t, T::wire_length>>;
};

static_assert(std::is_standard_layout_v<OldHeader> &&
                  std::is_trivially_copyable_v<OldHeader>,
              "OldHeader must be a plain record");
static_assert(sizeof(OldHeader) == old_header_len,
              "OldHeader must be 26 bytes");
static_assert(alignof(OldHeader) == alignof(std::uint16_t),
              "OldHeader must keep 16-bit alignment");
static_assert(offsetof(OldHeader, dev) == 2 && offsetof(OldHeader, ino) == 4 &&
                  offsetof(OldHeader, mode) == 6 &&
                  offsetof(OldHeader, uid) == 8 &&
                  offsetof(OldHeader, gid) == 10 &&
                  offsetof(OldHeader, nlink) == 12 &&
                  offsetof(OldHeader, rdev) == 14 &&
                  offsetof(OldHeader, mtime) == 16 &&
                  offsetof(OldHeader, namesize) == 20 &&
                  offsetof(OldHeader, filesize) == 22,
              "OldHeader field offsets do not match the old binary format");

static_assert(std::is_standard_layout_v<OdcHeader> &&
                  std::is_trivially_copyable_v<OdcHeader>,
              "OdcHeader must be a plain record");
static_assert(sizeof(OdcHeader) == odc_header_len,
              "OdcHeader must be 76 bytes");
static_assert(offsetof(OdcHeader, dev) == 6 &&
                  offsetof(OdcHeader, ino) == 12 &&
                  offsetof(OdcHeader, mode) == 18 &&
                  offsetof(OdcHeader, uid) == 24 &&
                  offsetof(OdcHeader, gid) == 30 &&
                  offsetof(OdcHeader, nlink) == 36 &&
                  offsetof(OdcHeader, rdev) == 42 &&
                  offsetof(OdcHeader, mtime) == 48 &&
                  offsetof(OdcHeader, namesize) == 59 &&
                  offsetof(OdcHeader, filesize) == 65,
              "OdcHeader field offsets do not match the odc format");

static_assert(std::is_standard_layout_v<NewcHeader> &&
                  std::is_trivially_copyable_v<NewcHeader>,
              "NewcHeader must be a plain record");
static_assert(sizeof(NewcHeader) == newc_header_len,
              "NewcHeader must be 110 bytes");
static_assert(offsetof(NewcHeader, ino) == 6 &&
                  offsetof(NewcHeader, mode) == 14 &&
                  offsetof(NewcHeader, uid) == 22 &&
                  offsetof(NewcHeader, gid) == 30 &&
                  offsetof(NewcHeader, nlink) == 38 &&
                  offsetof(NewcHeader, mtime) == 46 &&
                  offsetof(NewcHeader, filesize) == 54 &&
                  offsetof(NewcHeader, devmajor) == 62 &&
                  offsetof(NewcHeader, devminor) == 70 &&
                  offsetof(NewcHeader, rdevmajor) == 78 &&
                  offsetof(NewcHeader, rdevminor) == 86 &&
                  offsetof(NewcHeader, namesize) == 94 &&
                  offsetof(NewcHeader, check) == 102,
              "NewcHeader field offsets do not match the newc format");

static_assert(CpioHeader<OldHeader> && CpioHeader<OdcHeader> &&
              CpioHeader<NewcHeader>);
} // namespace boost_iostreams_cpio
