#include "io/result_writer.hpp"

#include <algorithm>
#include <cstdio>

#include "parse/hit_sort.hpp"

namespace blastbridge {

static const size_t kAlignmentBlock = 60;

static std::string fmt_evalue(double e) {
    char buf[32];
    if (e == 0.0) return "0.0";
    std::snprintf(buf, sizeof(buf), e < 1e-3 ? "%.2e" : "%.3g", e);
    return buf;
}

static std::string fmt_fixed(double v, int digits) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
    return buf;
}

bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg) {
    if (str == "tab") {
        out = OutputFormat::kTab;
    } else if (str == "json") {
        out = OutputFormat::kJson;
    } else if (str == "text") {
        out = OutputFormat::kText;
    } else {
        error_msg = "Error: unknown output format '" + str + "' (tab, json, text)";
        return false;
    }
    return true;
}

void write_result_tab(std::ostream& out, const SearchResult& result) {
    if (!result.is_real_results) {
        out << "# SIMULATED RESULTS: " << result.error_message << '\n';
    }
    out << "# search_id\t" << result.search_id << '\n';
    out << "# program\t" << program_name(result.parameters.program)
        << "\tdatabase\t" << result.statistics.database
        << "\tsource\t" << result_source_name(result.source) << '\n';
    out << "# accession\tdescription\torganism\tevalue\tbitscore\tscore\tpident\tnident\t"
           "length\tmismatch\tgaps\tqstart\tqend\tsstart\tsend\tslen\tqcov\thsps\n";
    for (const auto& h : result.hits) {
        out << h.accession << '\t'
            << h.description << '\t'
            << h.organism << '\t'
            << fmt_evalue(h.evalue) << '\t'
            << fmt_fixed(h.bit_score, 1) << '\t'
            << fmt_fixed(h.raw_score, 0) << '\t'
            << fmt_fixed(h.identity_percent, 2) << '\t'
            << h.identity_count << '\t'
            << h.alignment_length << '\t'
            << h.mismatch_count << '\t'
            << h.gap_count << '\t'
            << h.query_range.from << '\t'
            << h.query_range.to << '\t'
            << h.hit_range.from << '\t'
            << h.hit_range.to << '\t'
            << h.subject_length << '\t'
            << fmt_fixed(h.coverage_percent, 1) << '\t'
            << (h.hsps.size() + 1) << '\n';
    }
}

static Json::Value range_to_json(const Range& r) {
    Json::Value v;
    v["from"] = r.from;
    v["to"] = r.to;
    return v;
}

static Json::Value alignment_to_json(const Alignment& a) {
    Json::Value v;
    v["query"] = a.query;
    v["subject"] = a.subject;
    v["matchLine"] = a.match_line;
    return v;
}

static Json::Value hsp_to_json(const Hsp& h) {
    Json::Value v;
    v["bitScore"] = h.bit_score;
    v["rawScore"] = h.raw_score;
    v["evalue"] = h.evalue;
    v["identityCount"] = h.identity_count;
    v["alignmentLength"] = h.alignment_length;
    v["gapCount"] = h.gap_count;
    v["mismatchCount"] = h.mismatch_count;
    v["queryRange"] = range_to_json(h.query_range);
    v["hitRange"] = range_to_json(h.hit_range);
    v["alignment"] = alignment_to_json(h.alignment);
    return v;
}

static Json::Value hit_to_json(const Hit& h) {
    Json::Value v;
    v["accession"] = h.accession;
    v["description"] = h.description;
    if (!h.organism.empty()) v["organism"] = h.organism;
    v["subjectLength"] = h.subject_length;
    v["evalue"] = h.evalue;
    v["bitScore"] = h.bit_score;
    v["rawScore"] = h.raw_score;
    v["identityPercent"] = h.identity_percent;
    v["identityCount"] = h.identity_count;
    v["coveragePercent"] = h.coverage_percent;
    v["alignmentLength"] = h.alignment_length;
    v["gapCount"] = h.gap_count;
    v["mismatchCount"] = h.mismatch_count;
    v["queryRange"] = range_to_json(h.query_range);
    v["hitRange"] = range_to_json(h.hit_range);
    v["alignment"] = alignment_to_json(h.alignment);
    Json::Value hsps(Json::arrayValue);
    for (const auto& s : h.hsps) hsps.append(hsp_to_json(s));
    v["hsps"] = std::move(hsps);
    return v;
}

Json::Value result_to_json(const SearchResult& result) {
    Json::Value root;
    root["searchId"] = result.search_id;

    Json::Value qi;
    qi["preview"] = result.query_info.preview;
    qi["length"] = result.query_info.length;
    qi["type"] = sequence_type_name(result.query_info.type);
    root["queryInfo"] = std::move(qi);

    const SearchRequest& req = result.parameters;
    Json::Value params;
    params["blastType"] = program_name(req.program);
    params["service"] = service_name(req.service);
    params["database"] = req.database;
    params["evalueThreshold"] = req.evalue;
    params["maxTargets"] = req.max_targets;
    if (req.word_size > 0) params["wordSize"] = req.word_size;
    if (!req.matrix.empty()) params["matrix"] = req.matrix;
    if (req.gap_open > 0) params["gapOpen"] = req.gap_open;
    if (req.gap_extend > 0) params["gapExtend"] = req.gap_extend;
    params["lowComplexityFilter"] = req.low_complexity;
    root["parameters"] = std::move(params);

    Json::Value hits(Json::arrayValue);
    for (const auto& h : result.hits) hits.append(hit_to_json(h));
    root["hits"] = std::move(hits);

    const Statistics& st = result.statistics;
    Json::Value stats;
    stats["database"] = st.database;
    stats["dbSequences"] = static_cast<Json::UInt64>(st.db_sequences);
    stats["dbLetters"] = static_cast<Json::UInt64>(st.db_letters);
    stats["searchTimeSec"] = st.search_time_sec;
    stats["effectiveSearchSpace"] = st.effective_search_space;
    stats["kappa"] = st.kappa;
    stats["lambda"] = st.lambda;
    stats["entropy"] = st.entropy;
    root["statistics"] = std::move(stats);

    root["source"] = result_source_name(result.source);
    root["isRealResults"] = result.is_real_results;
    if (!result.error_message.empty()) root["errorMessage"] = result.error_message;
    if (!result.request_id.empty()) root["requestId"] = result.request_id;
    root["rawOutput"] = result.raw_output;
    return root;
}

void write_result_json(std::ostream& out, const SearchResult& result) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    out << Json::writeString(writer, result_to_json(result)) << '\n';
}

// Position after consuming the residues of a row segment.
static uint32_t advance(uint32_t pos, const std::string& seg, bool reverse) {
    uint32_t n = 0;
    for (char c : seg) {
        if (c != '-') n++;
    }
    if (n == 0) return pos;
    return reverse ? pos - n : pos + n;
}

static void write_alignment_blocks(std::ostream& out, const Alignment& a,
                                   const Range& q, const Range& s) {
    if (a.query.empty() || a.subject.empty()) {
        out << "  (alignment not available)\n";
        return;
    }
    bool s_reverse = s.from > s.to;
    uint32_t qpos = q.from;
    uint32_t spos = s.from;
    size_t len = std::min(a.query.size(), a.subject.size());
    for (size_t off = 0; off < len; off += kAlignmentBlock) {
        size_t n = std::min(kAlignmentBlock, len - off);
        std::string qseg = a.query.substr(off, n);
        std::string sseg = a.subject.substr(off, n);
        std::string mseg = off < a.match_line.size() ? a.match_line.substr(off, n) : "";

        uint32_t qend = advance(qpos, qseg, false);
        uint32_t send = advance(spos, sseg, s_reverse);
        char line[64];
        std::snprintf(line, sizeof(line), "Query  %-8u ", qpos);
        out << line << qseg << "  " << (qend > qpos ? qend - 1 : qpos) << '\n';
        out << std::string(15, ' ') << mseg << '\n';
        std::snprintf(line, sizeof(line), "Sbjct  %-8u ", spos);
        uint32_t slast = spos;
        if (send != spos) slast = s_reverse ? send + 1 : send - 1;
        out << line << sseg << "  " << slast << "\n\n";
        qpos = qend;
        spos = send;
    }
}

void write_result_text(std::ostream& out, const SearchResult& result) {
    const SearchRequest& req = result.parameters;
    if (!result.is_real_results) {
        out << "*** SIMULATED RESULTS ***\n"
            << "The search could not be completed; the hits below are synthetic.\n"
            << "Reason: " << result.error_message << "\n\n";
    }

    out << program_name(req.program) << " search " << result.search_id
        << " (" << result_source_name(result.source) << ")\n";
    if (!result.request_id.empty()) out << "Request ID: " << result.request_id << '\n';
    out << "Query: " << result.query_info.preview << '\n'
        << "Length: " << result.query_info.length
        << "  Type: " << sequence_type_name(result.query_info.type) << '\n'
        << "Database: " << result.statistics.database;
    if (result.statistics.db_sequences > 0) {
        out << " (" << result.statistics.db_sequences << " sequences, "
            << result.statistics.db_letters << " letters)";
    }
    out << "\nSearch time: " << fmt_fixed(result.statistics.search_time_sec, 1) << " s\n";
    // Distinct organisms, the values -organism can filter on
    std::vector<std::string> organisms = unique_organisms(result.hits);
    if (!organisms.empty()) {
        out << "Organisms (" << organisms.size() << "):";
        for (size_t i = 0; i < organisms.size(); i++) {
            out << (i == 0 ? " " : "; ") << organisms[i];
        }
        out << '\n';
    }
    out << '\n';

    if (result.hits.empty()) {
        out << "No hits found.\n";
        return;
    }

    out << "Sequences producing significant alignments:\n\n";
    for (const auto& h : result.hits) {
        std::string desc = h.accession + " " + h.description;
        if (desc.size() > 60) desc = desc.substr(0, 57) + "...";
        char line[160];
        std::snprintf(line, sizeof(line), "%-60s %8s %10s %6s%%\n", desc.c_str(),
                      fmt_fixed(h.bit_score, 1).c_str(), fmt_evalue(h.evalue).c_str(),
                      fmt_fixed(h.identity_percent, 1).c_str());
        out << line;
    }
    out << '\n';

    for (const auto& h : result.hits) {
        out << '>' << h.accession << ' ' << h.description << '\n'
            << "Length=" << h.subject_length << "\n\n";
        out << " Score = " << fmt_fixed(h.bit_score, 1) << " bits ("
            << fmt_fixed(h.raw_score, 0) << "),  Expect = " << fmt_evalue(h.evalue) << '\n'
            << " Identities = " << h.identity_count << '/' << h.alignment_length
            << " (" << fmt_fixed(h.identity_percent, 0) << "%),  Gaps = "
            << h.gap_count << '/' << h.alignment_length << "\n\n";
        write_alignment_blocks(out, h.alignment, h.query_range, h.hit_range);
        for (const auto& s : h.hsps) {
            out << " Score = " << fmt_fixed(s.bit_score, 1) << " bits,  Expect = "
                << fmt_evalue(s.evalue) << ",  Identities = " << s.identity_count << '/'
                << s.alignment_length << "\n\n";
            write_alignment_blocks(out, s.alignment, s.query_range, s.hit_range);
        }
    }

    const Statistics& st = result.statistics;
    if (st.lambda > 0.0 || st.kappa > 0.0) {
        out << "Lambda  " << st.lambda << "  K  " << st.kappa
            << "  H  " << st.entropy << '\n';
    }
}

void write_result(std::ostream& out, const SearchResult& result, OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::kTab:
            write_result_tab(out, result);
            break;
        case OutputFormat::kJson:
            write_result_json(out, result);
            break;
        case OutputFormat::kText:
            write_result_text(out, result);
            break;
    }
}

Json::Value database_to_json(const DatabaseRecord& rec) {
    Json::Value v;
    v["id"] = rec.id;
    v["name"] = rec.name;
    v["molType"] = mol_type_name(rec.mol_type);
    v["status"] = db_status_name(rec.status);
    v["path"] = rec.db_path;
    v["sequenceCount"] = static_cast<Json::UInt64>(rec.sequence_count);
    v["letterCount"] = static_cast<Json::UInt64>(rec.letter_count);
    if (!rec.source_file.empty()) v["sourceFile"] = rec.source_file;
    if (!rec.last_validated.empty()) v["lastValidated"] = rec.last_validated;
    v["discovered"] = rec.discovered;
    return v;
}

void write_database_list(std::ostream& out, const std::vector<DatabaseRecord>& records,
                         OutputFormat fmt) {
    if (fmt == OutputFormat::kJson) {
        Json::Value arr(Json::arrayValue);
        for (const auto& r : records) arr.append(database_to_json(r));
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        out << Json::writeString(writer, arr) << '\n';
        return;
    }
    out << "# id\tname\tmol_type\tstatus\tsequences\tletters\tpath\n";
    for (const auto& r : records) {
        out << r.id << '\t'
            << r.name << '\t'
            << mol_type_name(r.mol_type) << '\t'
            << db_status_name(r.status) << '\t'
            << r.sequence_count << '\t'
            << r.letter_count << '\t'
            << r.db_path << '\n';
    }
}

} // namespace blastbridge
