#include "sync/glob.hpp"

namespace ms::sync {

static constexpr auto npos = std::string_view::npos;

// Index of the ']' closing the class opened at p[open], or npos if unterminated.
static size_t classEnd(const std::string_view p, const size_t open) {
    size_t j = open + 1;
    if (j < p.size() && (p[j] == '!' || p[j] == '^')) ++j;
    if (j < p.size() && p[j] == ']') ++j;
    while (j < p.size() && p[j] != ']') ++j;
    return j < p.size() ? j : npos;
}

static bool classMatches(std::string_view body, const char c) {
    bool negate = false;
    if (!body.empty() && (body[0] == '!' || body[0] == '^')) {
        negate = true;
        body.remove_prefix(1);
    }

    bool hit = false;
    for (size_t i = 0; i < body.size(); ++i) {
        if (i + 2 < body.size() && body[i + 1] == '-') {
            if (body[i] <= c && c <= body[i + 2]) hit = true;
            i += 2;
            continue;
        }
        if (body[i] == c) hit = true;
    }
    return hit != negate;
}

bool globMatch(const std::string_view p, const std::string_view t) {
    size_t pi = 0, ti = 0;

    while (pi < p.size()) {
        const char c = p[pi];

        if (c == '*') {
            size_t next = pi + 1;
            while (next < p.size() && p[next] == '*') ++next;
            const bool crossesSlash = next - pi >= 2;

            if (next == p.size()) return crossesSlash || t.substr(ti).find('/') == npos;

            for (size_t k = ti; k <= t.size(); ++k) {
                if (globMatch(p.substr(next), t.substr(k))) return true;
                if (k < t.size() && t[k] == '/' && !crossesSlash) break;
            }
            return false;
        }

        if (ti >= t.size()) return false;

        if (c == '?') {
            if (t[ti] == '/') return false;
            ++pi; ++ti;
            continue;
        }

        if (c == '[') {
            if (const auto close = classEnd(p, pi); close != npos) {
                if (t[ti] == '/' || !classMatches(p.substr(pi + 1, close - pi - 1), t[ti])) return false;
                pi = close + 1; ++ti;
                continue;
            }
        }

        if (c == '\\' && pi + 1 < p.size()) {
            if (p[pi + 1] != t[ti]) return false;
            pi += 2; ++ti;
            continue;
        }

        if (c != t[ti]) return false;
        ++pi; ++ti;
    }

    return ti == t.size();
}

}
