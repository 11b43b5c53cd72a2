#include "cli/colors.hpp"
#include "cli/interface.hpp"
#include "cli/interrupt.hpp"
#include "cli/shell.hpp"
#include "common/file_operations.hpp"

#include <algorithm>
#include <deque>
#include "test_helpers.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
namespace filewarden {
namespace cli {
namespace tests {

using ::filewarden::tests::read_text_file;

using namespace filewarden::common;

// Mock implementation of TUI for testing
class MockTUI : public ITUI {
  public:
    // Queue lines to be returned by read_line, in order
    void queue_input(const std::vector<std::string> &lines)
    {
        m_input.insert(m_input.end(), lines.begin(), lines.end());
    }

    std::optional<std::string> read_line(const std::string &prompt) override
    {
        m_prompts.push_back(prompt);
        if (m_input.empty()) {
            return std::nullopt;
        }
        std::string line = m_input.front();
        m_input.pop_front();

        // Simulate Ctrl+C arriving while this line's command runs
        if (++m_lines_read == m_interrupt_after) {
            interrupt::set();
        }
        return line;
    }

    void interrupt_after(int lines)
    {
        m_interrupt_after = lines;
    }

    void display_result(bool success, const std::string &result) override
    {
        m_results.emplace_back(success, result);
    }

    void display_banner() override
    {
        m_banner_count++;
    }

    void display_help() override
    {
        m_help_count++;
    }

    const std::vector<std::pair<bool, std::string>> &results() const
    {
        return m_results;
    }

    const std::vector<std::string> &prompts() const
    {
        return m_prompts;
    }

    bool has_result(bool success, const std::string &text) const
    {
        for (const auto &[ok, result] : m_results) {
            if (ok == success && result == text) {
                return true;
            }
        }
        return false;
    }

    int banner_count() const
    {
        return m_banner_count;
    }

    int help_count() const
    {
        return m_help_count;
    }

  private:
    std::deque<std::string> m_input;
    std::vector<std::string> m_prompts;
    std::vector<std::pair<bool, std::string>> m_results;
    int m_banner_count = 0;
    int m_help_count = 0;
    int m_lines_read = 0;
    int m_interrupt_after = -1;
};

class ShellTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
        test_dir = fs::temp_directory_path() /
                   (std::string("filewarden_shell_") +
                    ::testing::UnitTest::GetInstance()
                        ->current_test_info()
                        ->name());
        std::error_code ec;
        fs::remove_all(test_dir, ec);
        fs::create_directory(test_dir);
        test_dir = fs::weakly_canonical(test_dir);

        interrupt::clear();

        auto tui = std::make_unique<MockTUI>();
        mock_tui = tui.get();
        shell.set_tui(std::move(tui));
    }

    void TearDown() override
    {
        interrupt::clear();
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::string path_of(const std::string &relative)
    {
        return (test_dir / relative).string();
    }

    fs::path test_dir;
    Shell shell;
    MockTUI *mock_tui = nullptr; // Owned by shell
};

TEST_F(ShellTest, ExitCommand)
{
    mock_tui->queue_input({"exit", "help"});
    shell.run();

    EXPECT_TRUE(shell.is_exit_requested());
    EXPECT_EQ(mock_tui->banner_count(), 1);
    EXPECT_TRUE(mock_tui->has_result(true, "Goodbye!"));
    EXPECT_EQ(mock_tui->help_count(), 0);
}

TEST_F(ShellTest, EndOfInputStopsLoop)
{
    shell.run();

    EXPECT_TRUE(shell.is_exit_requested());
    EXPECT_TRUE(mock_tui->results().empty());
    ASSERT_EQ(mock_tui->prompts().size(), 1u);
    EXPECT_EQ(mock_tui->prompts()[0], "\n> ");
}

TEST_F(ShellTest, InterruptAtPrompt)
{
    interrupt::set();
    shell.run();

    EXPECT_TRUE(shell.is_exit_requested());
    EXPECT_TRUE(mock_tui->has_result(false, "Operation cancelled by user."));
}

TEST_F(ShellTest, PendingInterruptStopsBeforeReading)
{
    interrupt::set();
    mock_tui->queue_input({"help", "help", "help"});
    shell.run();

    EXPECT_TRUE(shell.is_exit_requested());
    EXPECT_EQ(mock_tui->help_count(), 0);
    EXPECT_TRUE(mock_tui->prompts().empty());
    EXPECT_EQ(mock_tui->results(),
              (std::vector<std::pair<bool, std::string>>{
                  {false, "Operation cancelled by user."}}));
}

TEST_F(ShellTest, InterruptDuringCommandEndsSession)
{
    mock_tui->interrupt_after(1);
    mock_tui->queue_input({"help", "help", "help"});
    shell.run();

    EXPECT_TRUE(shell.is_exit_requested());
    EXPECT_EQ(mock_tui->help_count(), 1);
    EXPECT_EQ(mock_tui->prompts().size(), 1u);
    EXPECT_TRUE(mock_tui->has_result(false, "Operation cancelled by user."));
}

TEST_F(ShellTest, InterruptBetweenPromptsAbandonsCommand)
{
    ASSERT_EQ(write_file(test_dir / "keep.txt", "x"),
              FileOperationResult::SUCCESS);

    // Interrupted after the file name, before the confirmation
    mock_tui->interrupt_after(2);
    mock_tui->queue_input({"delete", path_of("keep.txt"), "y", "exit"});
    shell.run();

    EXPECT_TRUE(shell.is_exit_requested());
    EXPECT_TRUE(fs::exists(test_dir / "keep.txt"));
    EXPECT_FALSE(mock_tui->has_result(true, "Goodbye!"));
    EXPECT_TRUE(mock_tui->has_result(false, "Operation cancelled by user."));
}

TEST_F(ShellTest, InvalidAndBlankCommands)
{
    mock_tui->queue_input({"", "   ", "frobnicate", "HELP", "exit"});
    shell.run();

    ASSERT_FALSE(mock_tui->results().empty());
    EXPECT_EQ(mock_tui->results()[0],
              std::make_pair(false,
                             std::string("Invalid command. Type 'help' for "
                                         "available commands.")));
    EXPECT_EQ(mock_tui->help_count(), 1);
}

TEST_F(ShellTest, EndOfInputInsideCommand)
{
    mock_tui->queue_input({"copy", path_of("a.txt")});
    shell.run();

    EXPECT_TRUE(shell.is_exit_requested());
    EXPECT_TRUE(mock_tui->results().empty());
    EXPECT_EQ(mock_tui->prompts().back(), "Destination: ");
}

TEST_F(ShellTest, CreateAndListFiles)
{
    mock_tui->queue_input({"create",
                           path_of("notes.txt"),
                           "  hello  ",
                           "list",
                           test_dir.string(),
                           "n",
                           "exit"});
    shell.run();

    EXPECT_TRUE(mock_tui->has_result(true, "File created successfully."));
    EXPECT_TRUE(mock_tui->has_result(
        true, "FILE - " + path_of("notes.txt") + " (5 bytes)"));

    EXPECT_EQ(read_text_file(test_dir / "notes.txt"), "hello");
}

TEST_F(ShellTest, DeleteNeedsConfirmation)
{
    ASSERT_EQ(write_file(test_dir / "keep.txt", "x"),
              FileOperationResult::SUCCESS);

    mock_tui->queue_input({"delete", path_of("keep.txt"), "n",
                           "delete", path_of("keep.txt"), "y",
                           "exit"});
    shell.run();

    EXPECT_TRUE(mock_tui->has_result(true, "Operation cancelled."));
    EXPECT_TRUE(mock_tui->has_result(true, "File deleted successfully."));
    EXPECT_FALSE(fs::exists(test_dir / "keep.txt"));

    const auto &prompts = mock_tui->prompts();
    EXPECT_NE(std::find(prompts.begin(),
                        prompts.end(),
                        "Are you sure you want to delete " +
                            path_of("keep.txt") + "? (y/n): "),
              prompts.end());
}

TEST_F(ShellTest, FailuresAreReportedAndLoopContinues)
{
    mock_tui->queue_input({"delete", path_of("ghost.txt"), "y",
                           "mkdir", path_of("made"), "y",
                           "exit"});
    shell.run();

    EXPECT_TRUE(mock_tui->has_result(
        false, "Error: Path '" + path_of("ghost.txt") + "' does not exist"));
    EXPECT_TRUE(mock_tui->has_result(true, "Directory created successfully."));
    EXPECT_TRUE(fs::is_directory(test_dir / "made"));
    EXPECT_EQ(shell.manager().stats().failed_operations, 1u);
}

TEST_F(ShellTest, BulkExtensionReport)
{
    ASSERT_EQ(write_file(test_dir / "a.txt", ""), FileOperationResult::SUCCESS);
    ASSERT_EQ(write_file(test_dir / "b.TXT", ""), FileOperationResult::SUCCESS);
    ASSERT_EQ(write_file(test_dir / "c.doc", ""), FileOperationResult::SUCCESS);

    mock_tui->queue_input({"bulk_ext",
                           test_dir.string(),
                           ".txt, .log",
                           ".md",
                           "n",
                           "exit"});
    shell.run();

    EXPECT_TRUE(mock_tui->has_result(true, "Operation completed:"));
    EXPECT_TRUE(mock_tui->has_result(true, "Files processed: 2"));
    EXPECT_TRUE(mock_tui->has_result(true, "Successful changes: 2"));
    EXPECT_TRUE(mock_tui->has_result(true, "Failed changes: 0"));
    EXPECT_TRUE(fs::exists(test_dir / "a.md"));
    EXPECT_TRUE(fs::exists(test_dir / "b.md"));
    EXPECT_TRUE(fs::exists(test_dir / "c.doc"));
}

TEST_F(ShellTest, RenameAndExtension)
{
    ASSERT_EQ(write_file(test_dir / "draft.txt", "d"),
              FileOperationResult::SUCCESS);

    mock_tui->queue_input({"rename", path_of("draft.txt"), "final.txt",
                           "ext", path_of("final.txt"), ".md",
                           "exit"});
    shell.run();

    EXPECT_TRUE(mock_tui->has_result(true, "File renamed successfully."));
    EXPECT_TRUE(mock_tui->has_result(true, "Extension changed successfully."));
    EXPECT_TRUE(fs::exists(test_dir / "final.md"));
}

TEST_F(ShellTest, CopyAndMove)
{
    ASSERT_EQ(write_file(test_dir / "src.txt", "s"),
              FileOperationResult::SUCCESS);
    fs::create_directory(test_dir / "out");

    mock_tui->queue_input({"copy", path_of("src.txt"), path_of("copy.txt"), "n",
                           "move", path_of("copy.txt"), path_of("out"), "n",
                           "exit"});
    shell.run();

    EXPECT_TRUE(mock_tui->has_result(true, "File copied successfully."));
    EXPECT_TRUE(mock_tui->has_result(true, "File moved successfully."));
    EXPECT_TRUE(fs::exists(test_dir / "src.txt"));
    EXPECT_TRUE(fs::exists(test_dir / "out" / "copy.txt"));
    EXPECT_FALSE(fs::exists(test_dir / "copy.txt"));
}

TEST_F(ShellTest, SizeReport)
{
    ASSERT_EQ(write_file(test_dir / "blob.bin", std::string(2048, 'z')),
              FileOperationResult::SUCCESS);

    mock_tui->queue_input({"size", test_dir.string(), "y", "exit"});
    shell.run();

    EXPECT_TRUE(mock_tui->has_result(true, "Size of " + test_dir.string() + ":"));
    EXPECT_TRUE(mock_tui->has_result(true, "Bytes: 2,048"));
    EXPECT_TRUE(mock_tui->has_result(true, "KB: 2.00"));
}

TEST_F(ShellTest, RemoveAndCleanDirectories)
{
    fs::create_directories(test_dir / "full" / "inner");
    fs::create_directories(test_dir / "bin" / "junk");
    ASSERT_EQ(write_file(test_dir / "bin" / "trash.txt", "t"),
              FileOperationResult::SUCCESS);

    mock_tui->queue_input({"rmdir", path_of("full"), "n", "y",
                           "rmdir", path_of("full"), "y", "y",
                           "clean", path_of("bin"), "y",
                           "exit"});
    shell.run();

    EXPECT_TRUE(mock_tui->has_result(
        false, "Error: Directory " + path_of("full") + " is not empty"));
    EXPECT_TRUE(mock_tui->has_result(true, "Directory deleted successfully."));
    EXPECT_TRUE(mock_tui->has_result(true, "Directory cleaned successfully."));
    EXPECT_FALSE(fs::exists(test_dir / "full"));
    EXPECT_TRUE(fs::is_empty(test_dir / "bin"));
}

TEST(TUITest, ReadLineAndEndOfInput)
{
    colors::set_enabled(false);
    std::istringstream input("first\n");
    std::ostringstream output;
    TUI tui(input, output);

    EXPECT_EQ(tui.read_line("> "), "first");
    EXPECT_FALSE(tui.read_line("> ").has_value());
    EXPECT_EQ(output.str().rfind("> ", 0), 0u);
    colors::set_enabled(true);
}

TEST(TUITest, BannerAndHelp)
{
    colors::set_enabled(false);
    std::istringstream input;
    std::ostringstream output;
    TUI tui(input, output);

    tui.display_banner();
    tui.display_help();
    tui.display_result(false, "Error: boom");

    const std::string text = output.str();
    EXPECT_NE(text.find("FILE SYSTEM MANAGER"), std::string::npos);
    EXPECT_NE(text.find("Type 'help' for available commands"),
              std::string::npos);
    EXPECT_NE(text.find("bulk_ext"), std::string::npos);
    EXPECT_NE(text.find("Clean directory contents"), std::string::npos);
    EXPECT_NE(text.find("Error: boom\n"), std::string::npos);
    colors::set_enabled(true);
}

} // namespace tests
} // namespace cli
} // namespace filewarden
