#include <gtest/gtest.h>
#include "dutree_core.h"
#include "dutree_report.h"

#include <sstream>

namespace {

Entry scenario_tree() {
    return DirectoryEntry("A", {
        FileEntry("A/f1", 100),
        FileEntry("A/f2", 50),
        DirectoryEntry("A/B", {FileEntry("A/B/f3", 10)}),
    });
}

std::vector<std::string> report_lines(const Entry& root, const Config& config) {
    std::ostringstream out;
    print_report(root, config, out);

    std::vector<std::string> lines;
    std::istringstream in(out.str());
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

class ReportTest : public ::testing::Test {
protected:
    Config config;
};

TEST_F(ReportTest, ScenarioTreeInPreOrder) {
    auto lines = report_lines(scenario_tree(), config);

    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "FOLDER      160 B [100.00%] A");
    EXPECT_EQ(lines[1], "FOLDER       10 B [6.25%] -> A/B");
    EXPECT_EQ(lines[2], "FILE         10 B [100.00%] ->-> A/B/f3");
    EXPECT_EQ(lines[3], "FILE        100 B [62.50%] -> A/f1");
    EXPECT_EQ(lines[4], "FILE         50 B [31.25%] -> A/f2");
}

TEST_F(ReportTest, EmptyDirectoryPrintsOnlyItself) {
    auto lines = report_lines(DirectoryEntry("empty", {}), config);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "FOLDER        0 B [0.00%] empty");
}

TEST_F(ReportTest, ChildrenOfEmptyParentShowZeroPercent) {
    Entry root = DirectoryEntry("r", {
        FileEntry("r/a", 0),
        DirectoryEntry("r/d", {}),
    });
    auto lines = report_lines(root, config);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "FOLDER        0 B [0.00%] -> r/d");
    EXPECT_EQ(lines[2], "FILE          0 B [0.00%] -> r/a");
}

TEST_F(ReportTest, UsesConfiguredSizeFormat) {
    config.format = "metric";
    Entry file = FileEntry("big", 2500000);

    EXPECT_EQ(format_report_line(file, file.size(), 0, config),
              "FILE      2.50 MB [100.00%] big");
}

TEST_F(ReportTest, LongPathsAreShortened) {
    std::string long_path = "/" + std::string(60, 'x') + "/leaf";
    Entry file = FileEntry(long_path, 1);
    std::string line = format_report_line(file, 2, 1, config);

    EXPECT_NE(line.find("[50.00%] -> "), std::string::npos);
    EXPECT_NE(line.find("..."), std::string::npos);
    EXPECT_EQ(line.substr(line.size() - 5), "/leaf");
}

TEST_F(ReportTest, ColorsWrapOnlyTheDirectoryLabel) {
    Entry dir = DirectoryEntry("d", {});
    Entry file = FileEntry("f", 1);

    EXPECT_EQ(format_report_line(dir, 0, 0, config, true).rfind(BLUE + BOLD + "FOLDER" + RESET, 0), 0u);
    EXPECT_EQ(format_report_line(file, 1, 0, config, true).rfind("FILE  ", 0), 0u);
}

TEST_F(ReportTest, PercentagesStayWithinBounds) {
    Entry root = DirectoryEntry("r", {
        FileEntry("r/a", 3),
        FileEntry("r/b", 1),
        DirectoryEntry("r/c", {FileEntry("r/c/x", 7), FileEntry("r/c/y", 0)}),
    });

    for (const auto& line : report_lines(root, config)) {
        auto open = line.find('[');
        auto close = line.find("%]");
        ASSERT_NE(open, std::string::npos);
        ASSERT_NE(close, std::string::npos);
        double percent = std::stod(line.substr(open + 1, close - open - 1));
        EXPECT_GE(percent, 0.0);
        EXPECT_LE(percent, 100.0);
    }
}
