/* ----------------------------------------------------------------------- *//**
 *
 * @file OutputStreamBuffer_proto.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_STDIO_OUTPUTSTREAMBUFFER_PROTO_HPP
#define DISCLIB_STDIO_OUTPUTSTREAMBUFFER_PROTO_HPP

namespace disclib {

namespace connector {

namespace stdio {

/**
 * @brief Stream buffer that writes each line to the standard error stream,
 *        tagged with the message level
 */
template <int MessageLevel>
class OutputStreamBuffer
  : public hal::OutputStreamBufferBase<OutputStreamBuffer<MessageLevel> > {

public:
    void output(const std::string& inLine) const;
};

} // namespace stdio

} // namespace connector

} // namespace disclib

#endif // defined(DISCLIB_STDIO_OUTPUTSTREAMBUFFER_PROTO_HPP)
