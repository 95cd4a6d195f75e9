/* ----------------------------------------------------------------------- *//**
 *
 * @file connector.cpp
 *
 * @brief Definitions of the stdio port's global output streams
 *
 *//* ----------------------------------------------------------------------- */

// We do not write #include "connector.hpp" here because we want to rely on
// the search paths, which might point to a port-specific connector.hpp
#include <connector/connector.hpp>

namespace disclib {

namespace connector {

namespace stdio {

#ifndef NDEBUG
namespace {

// No need to export these names to other translation units.
OutputStreamBuffer<hal::kInfo> gOutStreamBuffer;
OutputStreamBuffer<hal::kWarning> gErrStreamBuffer;

}

/**
 * @brief Informational output stream
 */
std::ostream libout(&gOutStreamBuffer);

/**
 * @brief Warning and non-fatal error output stream
 */
std::ostream liberr(&gErrStreamBuffer);
#endif

/**
 * @brief Emit a warning, also in release builds
 *
 * Each call formats into its own buffer, so concurrent callers do not share
 * any state.
 */
void
warning(const std::string& inMsg) {
    OutputStreamBuffer<hal::kWarning> buffer;
    std::ostream out(&buffer);
    out << inMsg << std::endl;
}

} // namespace stdio

} // namespace connector

} // namespace disclib
