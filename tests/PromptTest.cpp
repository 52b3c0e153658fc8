#include "Core/Forward/Prompt.hpp"

#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

TEST(PromptTest, ParseActionIgnoresCaseAndWhitespace)
{
    EXPECT_EQ(Prompt::ParseAction("add"), Action::Add);
    EXPECT_EQ(Prompt::ParseAction(" DELETE "), Action::Delete);
    EXPECT_EQ(Prompt::ParseAction("List"), Action::List);
    EXPECT_EQ(Prompt::ParseAction("sync\r"), Action::Sync);
}

TEST(PromptTest, UnknownModeIsRejected)
{
    EXPECT_THROW(Prompt::ParseAction("remove"), UnknownModeError);
    EXPECT_THROW(Prompt::ParseAction(""), UnknownModeError);
}

TEST(PromptTest, AsksForModeAndPorts)
{
    std::istringstream in("add\n8000-8010\n");
    std::ostringstream out;

    const Request r = Prompt::ReadRequest(in, out, std::nullopt, std::nullopt);
    EXPECT_EQ(r.action, Action::Add);
    EXPECT_EQ(r.port_spec, "8000-8010");
    EXPECT_NE(out.str().find("Mode"), std::string::npos);
}

TEST(PromptTest, ListAndSyncDoNotAskForPorts)
{
    std::istringstream in("sync\n");
    std::ostringstream out;

    const Request r = Prompt::ReadRequest(in, out, std::nullopt, std::nullopt);
    EXPECT_EQ(r.action, Action::Sync);
    EXPECT_TRUE(r.port_spec.empty());
}

TEST(PromptTest, PresetArgumentsSkipQuestions)
{
    std::istringstream in;
    std::ostringstream out;

    const Request r = Prompt::ReadRequest(in, out, std::string("delete"), std::string("all"));
    EXPECT_EQ(r.action, Action::Delete);
    EXPECT_EQ(r.port_spec, "all");
    EXPECT_TRUE(out.str().empty());
}

TEST(PromptTest, PresetModeStillAsksForPorts)
{
    std::istringstream in("  22 \n");
    std::ostringstream out;

    const Request r = Prompt::ReadRequest(in, out, std::string("add"), std::nullopt);
    EXPECT_EQ(r.port_spec, "22");
}

TEST(PromptTest, ClosedInputThrows)
{
    std::istringstream in("add\n");
    std::ostringstream out;
    EXPECT_THROW(Prompt::ReadRequest(in, out, std::nullopt, std::nullopt), std::runtime_error);
}
