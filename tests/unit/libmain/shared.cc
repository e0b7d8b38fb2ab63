#include "baseimg/libimage/globals.hh"
#include "baseimg/libmain/shared.hh"
#include "baseimg/libutil/exit.hh"
#include "baseimg/libutil/logging.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using testing::ElementsAre;

namespace baseimg {

class ParseCmdLineTest : public ::testing::Test
{
    Verbosity savedVerbosity = verbosity;

protected:
    Strings rest;

    void parse(const Strings & args)
    {
        parseCmdLine(args, [&](Strings::iterator & arg, const Strings::iterator & end) {
            if (*arg == "--path") {
                rest.push_back(*arg);
                rest.push_back(getArg(*arg, arg, end));
                return true;
            }
            return false;
        });
    }

    void TearDown() override
    {
        verbosity = savedVerbosity;
        globalConfig.resetOverridden();
        settings.output.setDefault("base.tar.xz");
        settings.compressionThreads.setDefault(0);
    }
};

TEST_F(ParseCmdLineTest, verbosityFlags)
{
    verbosity = lvlInfo;

    parse({"-v", "--verbose"});
    ASSERT_EQ(verbosity, lvlChatty);

    parse({"--quiet"});
    ASSERT_EQ(verbosity, lvlTalkative);

    parse({"-vvvvvvvvvv"});
    ASSERT_EQ(verbosity, lvlVomit);

    parse({"--debug"});
    ASSERT_EQ(verbosity, lvlDebug);
}

TEST_F(ParseCmdLineTest, optionSetsSetting)
{
    parse({"--option", "output", "/tmp/other.tar.xz", "--option", "compression-threads", "3"});

    ASSERT_EQ(settings.output.get(), "/tmp/other.tar.xz");
    ASSERT_EQ(settings.compressionThreads.get(), 3u);
    ASSERT_TRUE(settings.output.overridden);
}

TEST_F(ParseCmdLineTest, optionWithBadValue)
{
    ASSERT_THROW(parse({"--option", "compression-threads", "many"}), UsageError);
}

TEST_F(ParseCmdLineTest, optionNeedsNameAndValue)
{
    ASSERT_THROW(parse({"--option"}), UsageError);
    ASSERT_THROW(parse({"--option", "output"}), UsageError);
}

TEST_F(ParseCmdLineTest, passesOtherArguments)
{
    parse({"-v", "--path", "/srv/nix"});

    ASSERT_THAT(rest, ElementsAre("--path", "/srv/nix"));
}

TEST_F(ParseCmdLineTest, missingFlagArgument)
{
    ASSERT_THROW(parse({"--path"}), UsageError);
}

TEST_F(ParseCmdLineTest, unknownFlag)
{
    try {
        parse({"--frobnicate"});
        FAIL() << "parseCmdLine should have thrown";
    } catch (UsageError & e) {
        ASSERT_THAT(e.msg(), testing::HasSubstr("unrecognised flag"));
    }
}

TEST_F(ParseCmdLineTest, unexpectedArgument)
{
    try {
        parse({"image"});
        FAIL() << "parseCmdLine should have thrown";
    } catch (UsageError & e) {
        ASSERT_THAT(e.msg(), testing::HasSubstr("unexpected argument"));
    }
}

/* ----------------------------------------------------------------------------
 * handleExceptions
 * --------------------------------------------------------------------------*/

TEST(handleExceptions, success)
{
    ASSERT_EQ(handleExceptions("base-img", []() {}), 0);
}

TEST(handleExceptions, exitStatus)
{
    ASSERT_EQ(handleExceptions("base-img", []() { throw Exit(3); }), 3);
    ASSERT_EQ(handleExceptions("base-img", []() { throw Exit(); }), 0);
}

TEST(handleExceptions, usageError)
{
    ASSERT_EQ(handleExceptions("base-img", []() { throw UsageError("no"); }), 1);
}

TEST(handleExceptions, errorStatus)
{
    ASSERT_EQ(handleExceptions("base-img", []() { throw Error("failed"); }), 1);
    ASSERT_EQ(handleExceptions("base-img", []() { throw Error(7, "failed"); }), 7);
}

TEST(handleExceptions, otherExceptionsPropagate)
{
    ASSERT_THROW(handleExceptions("base-img", []() { throw std::runtime_error("x"); }), std::runtime_error);
}

}
