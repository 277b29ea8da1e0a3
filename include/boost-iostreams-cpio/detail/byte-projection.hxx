#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace boost_iostreams_cpio::detail {
/**
 * @brief Report a header whose in-memory layout disagrees with its wire shape
 * and terminate the process.
 *
 * A record whose size or alignment differs from the declared wire contract
 * would produce archives with a foreign byte layout, so there is no way to
 * continue. The function writes one diagnostic line to standard error and
 * aborts.
 *
 * @param what Name of the failed check ("size", "alignment", ...).
 * @param expected Value required by the wire contract.
 * @param actual Value observed on the record.
 */
[[noreturn]] void layout_violation(const char *what, std::size_t expected,
                                   std::size_t actual);

/**
 * @brief View a record holding multi-byte binary integers as its N wire bytes.
 *
 * Checks that the record occupies exactly N bytes, that its type alignment is
 * the one the caller relies on and that the record itself sits on such a
 * boundary. Any mismatch goes through layout_violation().
 *
 * @tparam N Wire length of the record in bytes.
 * @tparam Alignment Natural alignment of the record's integer fields.
 * @param record Record to project; the view is valid while it lives.
 * @return std::span<const std::uint8_t, N> Read-only view of the record.
 */
template <std::size_t N, std::size_t Alignment, typename Record>
std::span<const std::uint8_t, N> project_aligned(const Record &record) {
  if (sizeof(record) != N)
    layout_violation("size", N, sizeof(record));
  if (alignof(Record) != Alignment)
    layout_violation("alignment", Alignment, alignof(Record));

  auto address = reinterpret_cast<std::uintptr_t>(&record);
  if (address % Alignment != 0)
    layout_violation("address alignment", Alignment, address % Alignment);

  return std::span<const std::uint8_t, N>(
      reinterpret_cast<const std::uint8_t *>(&record), N);
}

/**
 * @brief View a byte-dense record (only char arrays) as its N wire bytes.
 *
 * Single-byte fields carry no alignment requirement, so only the size is
 * checked.
 */
template <std::size_t N, typename Record>
std::span<const std::uint8_t, N> project_dense(const Record &record) {
  if (sizeof(record) != N)
    layout_violation("size", N, sizeof(record));

  return std::span<const std::uint8_t, N>(
      reinterpret_cast<const std::uint8_t *>(&record), N);
}
} // namespace boost_iostreams_cpio::detail
