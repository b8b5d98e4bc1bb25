#include <arbiter/scoring.h>

#include <vector>
#include <algorithm>

#include "utils.h"

namespace {

struct GlobToken {
  enum Kind { LITERAL, ANY_CHAR, STAR, GLOBSTAR, CLASS } kind;
  char ch = 0;
  std::string set; // CLASS: members, ranges as "a-z"
  bool negated = false;

  bool Matches(char c) const {
    switch (kind) {
      case LITERAL: return c == ch;
      case ANY_CHAR: return c != '/';
      case CLASS: {
        bool found = false;
        for (size_t i = 0; i < set.size() && !found; i++) {
          if (i + 2 < set.size() && set[i + 1] == '-') {
            found = set[i] <= c && c <= set[i + 2];
            i += 2;
          } else {
            found = set[i] == c;
          }
        }
        return found != negated;
      }
      default: return false;
    }
  }
};

std::vector<GlobToken> Tokenize(const std::string& pat) {
  std::vector<GlobToken> ret;
  for (size_t i = 0; i < pat.size();) {
    char c = pat[i];
    if (c == '*') {
      if (i + 1 < pat.size() && pat[i + 1] == '*') {
        // ** matches any path including /
        ret.push_back({GlobToken::GLOBSTAR});
        i += 2;
        if (i < pat.size() && pat[i] == '/') i++;
      } else {
        ret.push_back({GlobToken::STAR});
        i++;
      }
    } else if (c == '?') {
      ret.push_back({GlobToken::ANY_CHAR});
      i++;
    } else if (c == '[' && pat.find(']', i + 1) != std::string::npos) {
      size_t end = pat.find(']', i + 1);
      GlobToken tok{GlobToken::CLASS};
      tok.set = pat.substr(i + 1, end - i - 1);
      if (!tok.set.empty() && (tok.set[0] == '!' || tok.set[0] == '^')) {
        tok.negated = true;
        tok.set.erase(0, 1);
      }
      ret.push_back(std::move(tok));
      i = end + 1;
    } else {
      GlobToken tok{GlobToken::LITERAL};
      tok.ch = c;
      ret.push_back(tok);
      i++;
    }
  }
  return ret;
}

} // namespace

bool GlobMatch(const std::string& path, const std::string& pattern, GlobOptions options) {
  std::string p = path, pat = pattern;
  if (options.nocase) {
    p = Lowercase(p);
    pat = Lowercase(pat);
  }
  if (options.match_base && pat.find('/') == std::string::npos) {
    if (size_t pos = p.rfind('/'); pos != std::string::npos) p = p.substr(pos + 1);
  }
  // reach[j]: the tokens so far can consume exactly p[0, j)
  const size_t n = p.size();
  std::vector<char> reach(n + 1, 0), next(n + 1);
  reach[0] = 1;
  for (auto& tok : Tokenize(pat)) {
    std::fill(next.begin(), next.end(), 0);
    bool any = false;
    if (tok.kind == GlobToken::STAR || tok.kind == GlobToken::GLOBSTAR) {
      for (size_t j = 0; j <= n; j++) {
        next[j] = reach[j] || (j > 0 && next[j - 1] &&
                               (tok.kind == GlobToken::GLOBSTAR || p[j - 1] != '/'));
        any |= next[j];
      }
    } else {
      for (size_t j = 0; j < n; j++) {
        if (reach[j] && tok.Matches(p[j])) next[j + 1] = any = true;
      }
    }
    if (!any) return false;
    reach.swap(next);
  }
  return reach[n];
}
