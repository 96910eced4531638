#pragma once

#include <tabshell/shell/SessionStore.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Serve {

enum class ExportFormat {
    Text,
    Markdown,
};

// "txt" (also the default for an empty value) and "md"; anything else is rejected.
auto parse_export_format(std::string_view value) -> std::optional<ExportFormat>;

auto export_content_type(ExportFormat format) -> std::string_view;
auto export_filename(ExportFormat format) -> std::string;

// Timestamps are rendered in local time, entries in the order given.
auto render_transcript(std::vector<Shell::TranscriptEntry> const& entries, ExportFormat format) -> std::string;

} // namespace TS::Serve
