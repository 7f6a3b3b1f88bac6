#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <json/json.h>

#include "core/types.hpp"

namespace blastbridge {

enum class OutputFormat { kTab, kJson, kText };

// Parse an output format string ("tab", "json", "text").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg);

// One line per hit (primary alignment), '#' header lines first.
// Simulated results carry a "# SIMULATED RESULTS" comment.
void write_result_tab(std::ostream& out, const SearchResult& result);

Json::Value result_to_json(const SearchResult& result);
void write_result_json(std::ostream& out, const SearchResult& result);

// Human-readable report: summary table, then every alignment in
// 60-column blocks.
void write_result_text(std::ostream& out, const SearchResult& result);

void write_result(std::ostream& out, const SearchResult& result, OutputFormat fmt);

Json::Value database_to_json(const DatabaseRecord& rec);

// Database catalog as a table (tab, text) or a JSON array.
void write_database_list(std::ostream& out, const std::vector<DatabaseRecord>& records,
                         OutputFormat fmt);

} // namespace blastbridge
