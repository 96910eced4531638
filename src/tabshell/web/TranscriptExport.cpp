#include <tabshell/web/TranscriptExport.hpp>

#include <tabshell/core/TimeUtils.hpp>

#include <sstream>

namespace TS::Serve {

namespace {

auto render_text(std::vector<Shell::TranscriptEntry> const& entries) -> std::string {
    std::vector<std::string> lines;
    for (auto const& entry : entries) {
        lines.push_back("[" + format_local_time(entry.timestamp) + "] [" + entry.tab_id + "] $ " + entry.command);
        if (entry.output.empty()) {
            continue;
        }
        std::istringstream output{entry.output};
        std::string        line;
        while (std::getline(output, line)) {
            lines.push_back("  " + line);
        }
        lines.emplace_back();
    }

    std::string rendered;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) {
            rendered.push_back('\n');
        }
        rendered.append(lines[i]);
    }
    return rendered;
}

auto render_markdown(std::vector<Shell::TranscriptEntry> const& entries) -> std::string {
    std::ostringstream out;
    out << "# Terminal Command History\n\n";

    std::string current_date;
    for (auto const& entry : entries) {
        auto const date = format_local_time(entry.timestamp, "%Y-%m-%d");
        if (date != current_date) {
            current_date = date;
            out << "## " << date << "\n\n";
        }
        out << "### " << format_local_time(entry.timestamp) << " (Tab: " << entry.tab_id << ")\n\n";
        out << "```bash\n$ " << entry.command << "\n```\n\n";
        if (!entry.output.empty()) {
            out << "**Output:**\n\n```\n" << entry.output << "\n```\n\n";
        }
    }
    return out.str();
}

} // namespace

auto parse_export_format(std::string_view value) -> std::optional<ExportFormat> {
    if (value.empty() || value == "txt") {
        return ExportFormat::Text;
    }
    if (value == "md") {
        return ExportFormat::Markdown;
    }
    return std::nullopt;
}

auto export_content_type(ExportFormat format) -> std::string_view {
    return format == ExportFormat::Markdown ? "text/markdown; charset=utf-8" : "text/plain; charset=utf-8";
}

auto export_filename(ExportFormat format) -> std::string {
    return format == ExportFormat::Markdown ? "terminal_history.md" : "terminal_history.txt";
}

auto render_transcript(std::vector<Shell::TranscriptEntry> const& entries, ExportFormat format) -> std::string {
    return format == ExportFormat::Markdown ? render_markdown(entries) : render_text(entries);
}

} // namespace TS::Serve
