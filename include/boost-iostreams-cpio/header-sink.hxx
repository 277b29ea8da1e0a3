/**
 * @file header-sink.hxx
 * @brief Writes CPIO headers verbatim to any Boost.Iostreams sink.
 */

#pragma once

#include <boost-iostreams-cpio/cpio-header.hxx>
#include <boost/iostreams/operations.hpp>
#include <boost/throw_exception.hpp>

#include <ios>

namespace boost_iostreams_cpio {
/**
 * @brief Write the wire image of a header to a Boost.Iostreams sink.
 *
 * Only the header bytes are written. The pathname, the entry data and any
 * padding that follow it in an archive are left to the caller.
 *
 * @code{.cpp}
 * #include <boost/iostreams/device/file.hpp>
 * #include <boost/iostreams/filtering_stream.hpp>
 * #include <boost-iostreams-cpio/header-sink.hxx>
 *
 * namespace io = boost::iostreams;
 * namespace cpio = boost_iostreams_cpio;
 *
 * int main() {
 *   io::filtering_ostream out;
 *   out.push(io::file_sink("a.cpio", std::ios::binary));
 *
 *   auto header = cpio::NewcHeader::make();
 *   // fill header.mode, header.namesize, header.filesize ...
 *   cpio::write_header(out, header);
 *   // then write the pathname and the file contents
 * }
 * @endcode
 *
 * @tparam Sink Boost.Iostreams Sink, filtering stream or std::ostream.
 * @tparam Header Any CpioHeader variant.
 * @param sink Destination of the header bytes.
 * @param header Header to write.
 * @return std::streamsize Number of bytes written (Header::wire_length).
 * @throws std::ios_base::failure when the sink accepts fewer bytes.
 */
template <typename Sink, CpioHeader Header>
std::streamsize write_header(Sink &sink, const Header &header) {
  auto bytes = header.as_bytes();
  auto const expected = static_cast<std::streamsize>(bytes.size());

  auto written = boost::iostreams::write(
      sink, reinterpret_cast<const char *>(bytes.data()), expected);
  if (written != expected)
    boost::throw_exception(
        std::ios_base::failure("cpio header: short write to sink"));
  return written;
}
} // namespace boost_iostreams_cpio
