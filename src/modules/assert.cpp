/* ----------------------------------------------------------------------- *//**
 *
 * @file assert.cpp
 *
 * @brief Handlers for failed Boost assertions
 *
 * Boost.Math checks its internal invariants with BOOST_ASSERT. Every target is
 * compiled with BOOST_ENABLE_ASSERT_HANDLER, so a failed assertion inside a
 * distribution function ends up here and is turned into an exception instead
 * of terminating the host application.
 *
 *//* ----------------------------------------------------------------------- */

#include <modules/common.hpp>

#include <boost/assert.hpp>

namespace disclib {

namespace modules {

namespace {

void
throwFailedAssertion(const char* inExpr, const char* inMsg,
    const char* inFunction, const char* inFile, long inLine) {

    std::string msg = (boost::format("Failed assertion: %1% in %2% (%3%:%4%)")
        % inExpr % inFunction % inFile % inLine).str();
    if (inMsg)
        msg = std::string(inMsg) + "\n" + msg;

    throw std::runtime_error(msg);
}

} // anonymous namespace

} // namespace modules

} // namespace disclib

namespace boost {

void
assertion_failed_msg(const char* inExpr, const char* inMsg,
    const char* inFunction, const char* inFile, long inLine) {

    disclib::modules::throwFailedAssertion(inExpr, inMsg, inFunction, inFile,
        inLine);
}

void
assertion_failed(const char* inExpr, const char* inFunction,
    const char* inFile, long inLine) {

    disclib::modules::throwFailedAssertion(inExpr, 0, inFunction, inFile,
        inLine);
}

} // namespace boost
