#include <doctest/doctest.h>

#include <tabshell/core/TimeUtils.hpp>
#include <tabshell/web/TranscriptExport.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace TS;
using namespace TS::Serve;

namespace {

auto entry(std::chrono::system_clock::time_point when, std::string tab, std::string command, std::string output)
    -> Shell::TranscriptEntry {
    return Shell::TranscriptEntry{.timestamp = when,
                                  .tab_id    = std::move(tab),
                                  .command   = std::move(command),
                                  .output    = std::move(output)};
}

} // namespace

TEST_SUITE("web.export") {
TEST_CASE("Export formats") {
    CHECK(parse_export_format("") == ExportFormat::Text);
    CHECK(parse_export_format("txt") == ExportFormat::Text);
    CHECK(parse_export_format("md") == ExportFormat::Markdown);
    CHECK_FALSE(parse_export_format("pdf").has_value());
    CHECK_FALSE(parse_export_format("TXT").has_value());

    CHECK(export_filename(ExportFormat::Text) == "terminal_history.txt");
    CHECK(export_filename(ExportFormat::Markdown) == "terminal_history.md");
    CHECK(export_content_type(ExportFormat::Text).starts_with("text/plain"));
    CHECK(export_content_type(ExportFormat::Markdown).starts_with("text/markdown"));
}

TEST_CASE("Plain text transcript") {
    auto const now     = std::chrono::system_clock::now();
    auto const later   = now + std::chrono::seconds{3};
    auto const entries = std::vector<Shell::TranscriptEntry>{
        entry(now, "t1", "ls", "a.txt\nb.txt"),
        entry(later, "t2", "touch c", ""),
    };

    auto const expected = "[" + format_local_time(now) + "] [t1] $ ls\n"
                        + "  a.txt\n"
                        + "  b.txt\n"
                        + "\n"
                        + "[" + format_local_time(later) + "] [t2] $ touch c";
    CHECK(render_transcript(entries, ExportFormat::Text) == expected);
    CHECK(render_transcript({}, ExportFormat::Text).empty());
}

TEST_CASE("Markdown transcript") {
    auto const now     = std::chrono::system_clock::now();
    auto const entries = std::vector<Shell::TranscriptEntry>{
        entry(now, "t1", "pwd", "/work"),
        entry(now, "t1", "cd docs", ""),
    };

    auto const rendered = render_transcript(entries, ExportFormat::Markdown);
    CHECK(rendered.starts_with("# Terminal Command History\n\n## " + format_local_time(now, "%Y-%m-%d") + "\n\n"));
    CHECK(rendered.find("### " + format_local_time(now) + " (Tab: t1)") != std::string::npos);
    CHECK(rendered.find("```bash\n$ pwd\n```\n\n**Output:**\n\n```\n/work\n```\n\n") != std::string::npos);
    CHECK(rendered.find("```bash\n$ cd docs\n```\n\n###") == std::string::npos);
    CHECK(rendered.ends_with("```bash\n$ cd docs\n```\n\n"));

    // One date heading for entries on the same day.
    std::size_t headings = 0;
    for (auto pos = rendered.find("\n## "); pos != std::string::npos; pos = rendered.find("\n## ", pos + 1)) {
        ++headings;
    }
    CHECK(headings == 1);
    CHECK(render_transcript({}, ExportFormat::Markdown) == "# Terminal Command History\n\n");
}
}
