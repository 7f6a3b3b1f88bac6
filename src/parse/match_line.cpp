#include "parse/match_line.hpp"

#include <algorithm>
#include <cctype>

namespace blastbridge {

// Similarity class per letter, 0 = none.
static int similarity_class(char c) {
    switch (c) {
    case 'A': case 'G':           return 1;
    case 'I': case 'L': case 'V': return 2;
    case 'F': case 'W': case 'Y': return 3;
    case 'K': case 'R':           return 4;
    case 'D': case 'E':           return 5;
    case 'Q': case 'N':           return 6;
    case 'S': case 'T':           return 7;
    case 'C': case 'M':           return 8;
    default:                      return 0;
    }
}

static char upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

bool is_similar_residue(char a, char b) {
    int ca = similarity_class(upper(a));
    return ca != 0 && ca == similarity_class(upper(b));
}

std::string compute_match_line(const std::string& query, const std::string& subject,
                               bool protein) {
    size_t n = std::min(query.size(), subject.size());
    std::string line(n, ' ');
    for (size_t i = 0; i < n; i++) {
        char q = upper(query[i]);
        char s = upper(subject[i]);
        if (q == '-' || s == '-') continue;
        if (q == s) {
            line[i] = '|';
        } else if (protein && is_similar_residue(q, s)) {
            line[i] = '+';
        }
    }
    return line;
}

AlignmentCounts count_alignment(const std::string& query, const std::string& subject) {
    AlignmentCounts c;
    size_t n = std::min(query.size(), subject.size());
    c.length = static_cast<uint32_t>(n);
    for (size_t i = 0; i < n; i++) {
        char q = upper(query[i]);
        char s = upper(subject[i]);
        if (q == '-' || s == '-') {
            c.gaps++;
        } else if (q == s) {
            c.identities++;
        } else {
            c.mismatches++;
        }
    }
    return c;
}

} // namespace blastbridge
