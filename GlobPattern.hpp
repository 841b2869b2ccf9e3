#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Anything that can accept or reject a file's basename.
class Matcher {
 public:
  virtual ~Matcher() = default;
  virtual bool matches(std::string_view name) const = 0;
};

// Shell-style glob: '?', '*', '**' as a whole component, and bracket
// classes ("[abc]", "[a-z]", "[!0-9]"). Case-sensitive, and a leading dot is
// not special, so hidden files need an explicit ".*".
class GlobPattern : public Matcher {
 public:
  // Throws PatternSyntaxError on malformed input.
  explicit GlobPattern(std::string pattern);

  bool matches(std::string_view name) const override;
  const std::string& pattern() const { return m_pattern; }

 private:
  enum class TokenType { LITERAL, ANY_CHAR, ANY_SEQUENCE, CHAR_CLASS };
  struct Token {
    TokenType type;
    char literal = '\0';
    bool negated = false;
    std::vector<std::pair<char, char>> ranges;
  };

  void compile();
  static bool class_contains(const Token& token, char c);

  std::string m_pattern;
  std::vector<Token> m_tokens;
};

class PatternSet {
 public:
  PatternSet() = default;
  // Compiles every pattern as a glob; throws PatternSyntaxError.
  explicit PatternSet(const std::vector<std::string>& patterns);

  void add(std::unique_ptr<Matcher> matcher);
  bool any_match(std::string_view name) const;
  bool empty() const { return m_matchers.empty(); }

 private:
  std::vector<std::unique_ptr<Matcher>> m_matchers;
};
