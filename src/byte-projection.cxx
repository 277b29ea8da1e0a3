#include <boost-iostreams-cpio/detail/byte-projection.hxx>
#include <cstdlib>
#include <iostream>

namespace boost_iostreams_cpio::detail {
/**
 * @brief Print the failed layout check and abort.
 *
 * Uses std::cerr directly and flushes it before aborting so the message is
 * not lost with the process.
 */
void layout_violation(const char *what, std::size_t expected,
                      std::size_t actual) {
  std::cerr << "boost-iostreams-cpio: layout violation: " << what
            << " expected " << expected << ", got " << actual << std::endl;
  std::abort();
}
} // namespace boost_iostreams_cpio::detail
