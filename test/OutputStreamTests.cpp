#include <connector/connector.hpp>
#include <modules/modules.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

using namespace testing;

using disclib::connector::stdio::OutputStreamBuffer;

//-------------------------------------------------------------------------

namespace {

class CollectingStreamBuffer
  : public disclib::hal::OutputStreamBufferBase<CollectingStreamBuffer> {

public:
    void output(const std::string& inLine) const {
        messages.push_back(inLine);
    }

    mutable std::vector<std::string> messages;
};

/**
 * @brief Captures everything written to std::cerr during its lifetime
 */
class CerrCapture {
public:
    CerrCapture() : mDefault(std::cerr.rdbuf(mCaptured.rdbuf())) { }
    ~CerrCapture() { std::cerr.rdbuf(mDefault); }

    std::string str() const { return mCaptured.str(); }

private:
    std::stringstream mCaptured;
    std::streambuf* mDefault;
};

}

//-------------------------------------------------------------------------

TEST(OutputStreamBufferTest, MessagesAreEmittedOnFlush)
{
    CollectingStreamBuffer buffer;
    std::ostream out(&buffer);

    out << "p = " << 0.5;
    EXPECT_THAT(buffer.messages, IsEmpty());

    out << std::endl;
    out << "second" << std::flush;

    EXPECT_THAT(buffer.messages, ElementsAre("p = 0.5\n", "second"));
}

TEST(OutputStreamBufferTest, EachLineIsEmittedSeparately)
{
    CollectingStreamBuffer buffer;
    std::ostream out(&buffer);

    out << "n = 10\np = 0.3\nk = ";
    EXPECT_THAT(buffer.messages, ElementsAre("n = 10\n", "p = 0.3\n"));

    out << 4 << '\n';
    EXPECT_THAT(buffer.messages, ElementsAre("n = 10\n", "p = 0.3\n",
        "k = 4\n"));
}

TEST(OutputStreamBufferTest, EmptyFlushEmitsNothing)
{
    CollectingStreamBuffer buffer;
    std::ostream out(&buffer);

    out << std::flush;
    out << "done" << std::endl << std::flush;

    EXPECT_THAT(buffer.messages, ElementsAre("done\n"));
}

TEST(OutputStreamBufferTest, LongMessagesAreKeptWhole)
{
    CollectingStreamBuffer buffer;
    std::ostream out(&buffer);
    const std::string message(40000, 'x');

    out << message << std::flush;

    ASSERT_THAT(buffer.messages, SizeIs(1));
    EXPECT_EQ(message, buffer.messages[0]);
    EXPECT_TRUE(out.good());
}

//-------------------------------------------------------------------------

TEST(StdioOutputTest, WarningIsPrefixed)
{
    CerrCapture capture;

    disclib::warning("k was rounded");

    EXPECT_EQ("WARNING: k was rounded\n", capture.str());
}

TEST(StdioOutputTest, EveryLineOfAWarningIsPrefixed)
{
    CerrCapture capture;

    disclib::warning("first line\nsecond line");

    EXPECT_EQ("WARNING: first line\nWARNING: second line\n", capture.str());
}

TEST(StdioOutputTest, EmptyFlushWritesNothing)
{
    CerrCapture capture;
    OutputStreamBuffer<disclib::hal::kInfo> buffer;
    std::ostream out(&buffer);

    out << std::flush;

    EXPECT_EQ("", capture.str());
}

TEST(StdioOutputTest, MissingNewlineIsAppended)
{
    CerrCapture capture;
    OutputStreamBuffer<disclib::hal::kInfo> buffer;
    std::ostream out(&buffer);

    out << "first" << std::flush;
    out << "second\n" << std::flush;

    EXPECT_EQ("INFO: first\nINFO: second\n", capture.str());
}

#ifndef NDEBUG
TEST(StdioOutputTest, DebugStreams)
{
    CerrCapture capture;

    disclib::libout << "evaluating" << std::endl;
    disclib::liberr << "suspicious" << std::endl;

    EXPECT_EQ("INFO: evaluating\nWARNING: suspicious\n", capture.str());
}
#endif

TEST(StdioOutputTest, GeometricQuantileWarning)
{
    CerrCapture capture;

    disclib::modules::prob::quantile_geometric(0.25, 1.);

    EXPECT_THAT(capture.str(), StartsWith("WARNING: "));
    EXPECT_THAT(capture.str(), HasSubstr("p = 0.25"));
}

//-------------------------------------------------------------------------
