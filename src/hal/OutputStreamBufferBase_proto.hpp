/* ----------------------------------------------------------------------- *//**
 *
 * @file OutputStreamBufferBase_proto.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_OUTPUTSTREAMBUFFERBASE_PROTO_HPP
#define DISCLIB_HAL_OUTPUTSTREAMBUFFERBASE_PROTO_HPP

namespace disclib {

namespace hal {

/**
 * @brief Line-buffered base class for the output stream buffers of a port
 *
 * Characters are collected until a newline arrives. Each complete line,
 * including its newline, is passed to <tt>Derived::output()</tt>. A flush
 * (e.g., std::flush or std::endl) passes on any incomplete line.
 *
 * Use this class by passing the pointer of an instance to the ostream
 * constructor:
 * @code
 * MyOutputStreamBuffer buffer;
 * std::ostream out(&buffer);
 * @endcode
 */
template <class Derived>
class OutputStreamBufferBase : public std::streambuf {
public:
    typedef std::streambuf::int_type int_type;
    typedef std::streambuf::traits_type traits_type;

    OutputStreamBufferBase() { }

protected:
    int_type overflow(int_type c = traits_type::eof());
    std::streamsize xsputn(const char* inStr, std::streamsize inCount);
    int sync();

private:
    OutputStreamBufferBase(const OutputStreamBufferBase&);
    OutputStreamBufferBase& operator=(const OutputStreamBufferBase&);

    void emitLine();

    std::string mLine;
};

} // namespace hal

} // namespace disclib

#endif // defined(DISCLIB_HAL_OUTPUTSTREAMBUFFERBASE_PROTO_HPP)
