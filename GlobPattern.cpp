#include "GlobPattern.hpp"

#include <algorithm>

#include "errors.hpp"

GlobPattern::GlobPattern(std::string pattern) : m_pattern(std::move(pattern)) {
  compile();
}

void GlobPattern::compile() {
  const std::string& p = m_pattern;
  std::size_t i = 0;
  while (i < p.size()) {
    const char c = p[i];
    if (c == '?') {
      m_tokens.push_back({TokenType::ANY_CHAR});
      ++i;
    } else if (c == '*') {
      std::size_t run = 0;
      while (i + run < p.size() && p[i + run] == '*') ++run;
      if (run > 2) {
        throw PatternSyntaxError(
            p, i + 2, "wildcards are either regular '*' or recursive '**'");
      }
      if (run == 2) {
        const bool starts_component = i == 0 || p[i - 1] == '/';
        const bool ends_component = i + 2 == p.size() || p[i + 2] == '/';
        if (!starts_component || !ends_component) {
          throw PatternSyntaxError(
              p, i, "recursive wildcards must form a single path component");
        }
        // "**/" also matches zero directories.
        if (i + 2 < p.size()) ++run;
      }
      if (m_tokens.empty() || m_tokens.back().type != TokenType::ANY_SEQUENCE) {
        m_tokens.push_back({TokenType::ANY_SEQUENCE});
      }
      i += run;
    } else if (c == '[') {
      Token token{TokenType::CHAR_CLASS};
      std::size_t j = i + 1;
      if (j < p.size() && p[j] == '!') {
        token.negated = true;
        ++j;
      }
      bool closed = false;
      bool first = true;
      while (j < p.size()) {
        if (p[j] == ']' && !first) {
          closed = true;
          break;
        }
        first = false;
        if (j + 2 < p.size() && p[j + 1] == '-' && p[j + 2] != ']') {
          token.ranges.emplace_back(p[j], p[j + 2]);
          j += 3;
        } else {
          token.ranges.emplace_back(p[j], p[j]);
          ++j;
        }
      }
      if (!closed) {
        throw PatternSyntaxError(p, i, "unterminated character class");
      }
      m_tokens.push_back(std::move(token));
      i = j + 1;
    } else {
      m_tokens.push_back({TokenType::LITERAL, c});
      ++i;
    }
  }
}

bool GlobPattern::class_contains(const Token& token, char c) {
  const bool in_class =
      std::any_of(token.ranges.begin(), token.ranges.end(),
                  [c](const auto& r) { return r.first <= c && c <= r.second; });
  return in_class != token.negated;
}

bool GlobPattern::matches(std::string_view name) const {
  // Greedy scan that backtracks to the most recent '*' on mismatch.
  constexpr std::size_t npos = std::string_view::npos;
  std::size_t t = 0;
  std::size_t n = 0;
  std::size_t star_t = npos;
  std::size_t star_n = 0;

  while (n < name.size()) {
    if (t < m_tokens.size()) {
      const Token& token = m_tokens[t];
      if (token.type == TokenType::ANY_SEQUENCE) {
        star_t = t++;
        star_n = n;
        continue;
      }
      bool consumed = false;
      switch (token.type) {
        case TokenType::LITERAL:
          consumed = token.literal == name[n];
          break;
        case TokenType::ANY_CHAR:
          consumed = true;
          break;
        case TokenType::CHAR_CLASS:
          consumed = class_contains(token, name[n]);
          break;
        case TokenType::ANY_SEQUENCE:
          break;
      }
      if (consumed) {
        ++t;
        ++n;
        continue;
      }
    }
    if (star_t == npos) return false;
    t = star_t + 1;
    n = ++star_n;
  }

  while (t < m_tokens.size() && m_tokens[t].type == TokenType::ANY_SEQUENCE) {
    ++t;
  }
  return t == m_tokens.size();
}

PatternSet::PatternSet(const std::vector<std::string>& patterns) {
  for (const auto& pattern : patterns) {
    add(std::make_unique<GlobPattern>(pattern));
  }
}

void PatternSet::add(std::unique_ptr<Matcher> matcher) {
  m_matchers.push_back(std::move(matcher));
}

bool PatternSet::any_match(std::string_view name) const {
  return std::any_of(
      m_matchers.begin(), m_matchers.end(),
      [name](const auto& matcher) { return matcher->matches(name); });
}
