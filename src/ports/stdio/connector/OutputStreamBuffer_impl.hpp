/* ----------------------------------------------------------------------- *//**
 *
 * @file OutputStreamBuffer_impl.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_STDIO_OUTPUTSTREAMBUFFER_IMPL_HPP
#define DISCLIB_STDIO_OUTPUTSTREAMBUFFER_IMPL_HPP

#include <iostream>

namespace disclib {

namespace connector {

namespace stdio {

namespace {

inline
const char*
messagePrefix(int inLevel) {
    switch (inLevel) {
        case hal::kInfo:    return "INFO: ";
        case hal::kWarning: return "WARNING: ";
        default:            return "";
    }
}

} // anonymous namespace

/**
 * @brief Write one line, prefixed with the message level
 *
 * The last line of a flushed message may lack its newline, which is added
 * here.
 */
template <int MessageLevel>
inline
void
OutputStreamBuffer<MessageLevel>::output(const std::string& inLine) const {
    std::cerr << messagePrefix(MessageLevel) << inLine;
    if (inLine[inLine.size() - 1] != '\n')
        std::cerr << '\n';
    std::cerr.flush();
}

} // namespace stdio

} // namespace connector

} // namespace disclib

#endif // defined(DISCLIB_STDIO_OUTPUTSTREAMBUFFER_IMPL_HPP)
