/* ----------------------------------------------------------------------- *//**
 *
 * @file OutputStreamBufferBase_impl.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_OUTPUTSTREAMBUFFERBASE_IMPL_HPP
#define DISCLIB_HAL_OUTPUTSTREAMBUFFERBASE_IMPL_HPP

#include <algorithm>

namespace disclib {

namespace hal {

template <class Derived>
inline
void
OutputStreamBufferBase<Derived>::emitLine() {
    if (mLine.empty())
        return;

    static_cast<const Derived*>(this)->output(mLine);
    mLine.clear();
}

/**
 * @brief Receive a single character
 *
 * There is no put area, so the stream hands over every character that does
 * not arrive through xsputn().
 */
template <class Derived>
inline
typename OutputStreamBufferBase<Derived>::int_type
OutputStreamBufferBase<Derived>::overflow(int_type c) {
    if (traits_type::eq_int_type(c, traits_type::eof()))
        return traits_type::not_eof(c);

    mLine.push_back(traits_type::to_char_type(c));
    if (traits_type::to_char_type(c) == '\n')
        emitLine();
    return c;
}

template <class Derived>
inline
std::streamsize
OutputStreamBufferBase<Derived>::xsputn(const char* inStr,
    std::streamsize inCount) {

    const char* end = inStr + inCount;
    while (inStr != end) {
        const char* newline = std::find(inStr, end, '\n');
        if (newline == end) {
            mLine.append(inStr, end);
            break;
        }
        mLine.append(inStr, newline + 1);
        emitLine();
        inStr = newline + 1;
    }
    return inCount;
}

/**
 * @brief Pass on an incomplete line
 */
template <class Derived>
inline
int
OutputStreamBufferBase<Derived>::sync() {
    emitLine();
    return 0;
}

} // namespace hal

} // namespace disclib

#endif // defined(DISCLIB_HAL_OUTPUTSTREAMBUFFERBASE_IMPL_HPP)
