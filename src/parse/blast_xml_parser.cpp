#include "parse/blast_xml_parser.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include "parse/hit_sort.hpp"
#include "parse/match_line.hpp"

namespace blastbridge {

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

bool is_element(const xmlNode* n, const char* name) {
    return n && n->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(n->name), name) == 0;
}

const xmlNode* child(const xmlNode* parent, const char* name) {
    if (!parent) return nullptr;
    for (const xmlNode* c = parent->children; c; c = c->next) {
        if (is_element(c, name)) return c;
    }
    return nullptr;
}

std::vector<const xmlNode*> children(const xmlNode* parent, const char* name) {
    std::vector<const xmlNode*> out;
    if (!parent) return out;
    for (const xmlNode* c = parent->children; c; c = c->next) {
        if (is_element(c, name)) out.push_back(c);
    }
    return out;
}

// Depth-first search for the first element with this name.
const xmlNode* find_descendant(const xmlNode* node, const char* name) {
    for (const xmlNode* c = node ? node->children : nullptr; c; c = c->next) {
        if (c->type != XML_ELEMENT_NODE) continue;
        if (is_element(c, name)) return c;
        if (const xmlNode* d = find_descendant(c, name)) return d;
    }
    return nullptr;
}

std::string text_of(const xmlNode* n) {
    if (!n) return {};
    xmlChar* content = xmlNodeGetContent(n);
    if (!content) return {};
    std::string s(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return s;
}

std::string child_text(const xmlNode* parent, const char* name) {
    return text_of(child(parent, name));
}

// Malformed or absent numbers read as 0.
double child_double(const xmlNode* parent, const char* name) {
    std::string s = child_text(parent, name);
    if (s.empty()) return 0.0;
    return std::strtod(s.c_str(), nullptr);
}

uint32_t child_u32(const xmlNode* parent, const char* name) {
    std::string s = child_text(parent, name);
    if (s.empty()) return 0;
    return static_cast<uint32_t>(std::strtoul(s.c_str(), nullptr, 10));
}

uint64_t child_u64(const xmlNode* parent, const char* name) {
    std::string s = child_text(parent, name);
    if (s.empty()) return 0;
    return static_cast<uint64_t>(std::strtoull(s.c_str(), nullptr, 10));
}

Hsp read_hsp(const xmlNode* node, bool protein) {
    Hsp h;
    h.bit_score = child_double(node, "Hsp_bit-score");
    h.raw_score = child_double(node, "Hsp_score");
    h.evalue = child_double(node, "Hsp_evalue");
    h.identity_count = child_u32(node, "Hsp_identity");
    h.gap_count = child_u32(node, "Hsp_gaps");
    h.alignment_length = child_u32(node, "Hsp_align-len");

    uint32_t qf = child_u32(node, "Hsp_query-from");
    uint32_t qt = child_u32(node, "Hsp_query-to");
    h.query_range.from = std::min(qf, qt);
    h.query_range.to = std::max(qf, qt);
    h.hit_range.from = child_u32(node, "Hsp_hit-from");
    h.hit_range.to = child_u32(node, "Hsp_hit-to");

    h.alignment.query = child_text(node, "Hsp_qseq");
    h.alignment.subject = child_text(node, "Hsp_hseq");
    if (!h.alignment.query.empty() && !h.alignment.subject.empty()) {
        h.alignment.match_line =
            compute_match_line(h.alignment.query, h.alignment.subject, protein);
        if (h.alignment_length == 0) {
            h.alignment_length = static_cast<uint32_t>(
                std::min(h.alignment.query.size(), h.alignment.subject.size()));
        }
    }

    h.identity_count = std::min(h.identity_count, h.alignment_length);
    uint32_t used = h.identity_count + h.gap_count;
    h.mismatch_count = h.alignment_length > used ? h.alignment_length - used : 0;
    return h;
}

// First title of a defline that may join several with '>'.
std::string first_title(const std::string& def) {
    auto gt = def.find('>');
    std::string s = gt == std::string::npos ? def : def.substr(0, gt);
    while (!s.empty() && s.back() == ' ') s.pop_back();
    return s;
}

} // namespace

bool parse_blast_xml(const std::string& body, uint32_t query_length, bool protein,
                     std::vector<Hit>& hits, Statistics& stats, SearchError& err) {
    hits.clear();
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        err.set(ErrorCode::kParse, "empty XML report");
        return false;
    }

    XmlDocPtr doc(xmlReadMemory(body.data(), static_cast<int>(body.size()),
                                "blast.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR |
                                XML_PARSE_NOWARNING | XML_PARSE_NOBLANKS));
    if (!doc) {
        err.set(ErrorCode::kParse, "BLAST report is not well-formed XML");
        return false;
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!is_element(root, "BlastOutput")) {
        err.set(ErrorCode::kParse, std::string("unexpected XML root element: ") +
                (root ? reinterpret_cast<const char*>(root->name) : "(none)"));
        return false;
    }

    std::string db = child_text(root, "BlastOutput_db");
    if (!db.empty()) stats.database = db;

    const xmlNode* iteration = find_descendant(root, "Iteration");
    if (!iteration) return true;

    if (const xmlNode* st = find_descendant(iteration, "Statistics")) {
        stats.db_sequences = child_u64(st, "Statistics_db-num");
        stats.db_letters = child_u64(st, "Statistics_db-len");
        stats.effective_search_space = child_double(st, "Statistics_eff-space");
        stats.kappa = child_double(st, "Statistics_kappa");
        stats.lambda = child_double(st, "Statistics_lambda");
        stats.entropy = child_double(st, "Statistics_entropy");
    }

    uint32_t qlen = query_length;
    if (qlen == 0) qlen = child_u32(iteration, "Iteration_query-len");

    for (const xmlNode* hn : children(child(iteration, "Iteration_hits"), "Hit")) {
        std::vector<const xmlNode*> hsp_nodes = children(child(hn, "Hit_hsps"), "Hsp");
        if (hsp_nodes.empty()) continue;

        Hit hit;
        hit.accession = child_text(hn, "Hit_accession");
        if (hit.accession.empty()) hit.accession = child_text(hn, "Hit_id");
        hit.description = first_title(child_text(hn, "Hit_def"));
        if (hit.description.empty()) hit.description = hit.accession;
        hit.organism = extract_organism(hit.description);
        hit.subject_length = child_u32(hn, "Hit_len");

        Hsp primary = read_hsp(hsp_nodes[0], protein);
        hit.evalue = primary.evalue;
        hit.bit_score = primary.bit_score;
        hit.raw_score = primary.raw_score;
        hit.identity_count = primary.identity_count;
        hit.alignment_length = primary.alignment_length;
        hit.gap_count = primary.gap_count;
        hit.mismatch_count = primary.mismatch_count;
        hit.query_range = primary.query_range;
        hit.hit_range = primary.hit_range;
        hit.alignment = primary.alignment;
        hit.identity_percent = hit.alignment_length > 0
            ? 100.0 * hit.identity_count / hit.alignment_length : 0.0;
        hit.coverage_percent = qlen > 0
            ? std::min(100.0, 100.0 * hit.alignment_length / qlen) : 0.0;

        for (size_t i = 1; i < hsp_nodes.size(); i++) {
            hit.hsps.push_back(read_hsp(hsp_nodes[i], protein));
        }
        hits.push_back(std::move(hit));
    }

    sort_hits(hits);
    return true;
}

} // namespace blastbridge
