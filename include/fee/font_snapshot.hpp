// Textual font snapshots: one `glyph NAME key=value...` line per glyph.
#pragma once
#include "fee/font.hpp"
#include <string>
#include <string_view>

namespace fee {

// Throws syntax_error with the failing location for malformed text.
MemoryFont load_font_snapshot(std::string_view text, const std::string& source = "");
MemoryFont load_font_snapshot_file(const std::string& path);

} // namespace fee
