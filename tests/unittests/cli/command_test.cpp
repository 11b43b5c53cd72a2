#include "cli/command.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace filewarden {
namespace cli {
namespace tests {

TEST(CommandTest, ParseKnownCommands)
{
    EXPECT_EQ(parse_command("list"), Command::LIST);
    EXPECT_EQ(parse_command("bulk_ext"), Command::BULK_EXT);
    EXPECT_EQ(parse_command("  Copy  "), Command::COPY);
    EXPECT_EQ(parse_command("EXIT"), Command::EXIT);
}

TEST(CommandTest, ParseUnknownCommands)
{
    EXPECT_FALSE(parse_command("").has_value());
    EXPECT_FALSE(parse_command("ls").has_value());
    EXPECT_FALSE(parse_command("list now").has_value());
}

TEST(CommandTest, NamesRoundTripThroughParser)
{
    for (const auto &[command, description] : command_descriptions()) {
        EXPECT_FALSE(description.empty());
        EXPECT_EQ(parse_command(command_name(command)), command);
    }
    EXPECT_EQ(command_descriptions().size(), 14u);
}

TEST(CommandTest, Affirmative)
{
    EXPECT_TRUE(is_affirmative("y"));
    EXPECT_TRUE(is_affirmative(" YES "));
    EXPECT_FALSE(is_affirmative("n"));
    EXPECT_FALSE(is_affirmative(""));
    EXPECT_FALSE(is_affirmative("yep"));
}

TEST(CommandTest, SplitList)
{
    EXPECT_EQ(split_list(".txt, .doc ,,md"),
              (std::vector<std::string>{".txt", ".doc", "md"}));
    EXPECT_TRUE(split_list("").empty());
    EXPECT_TRUE(split_list(" , ").empty());
}

} // namespace tests
} // namespace cli
} // namespace filewarden
