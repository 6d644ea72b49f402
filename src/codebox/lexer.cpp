#include "lexer.h"

#include <cctype>
#include <cstring>

namespace {

// longest first
const char* const kOperators[] = {
  "**=", "//=", ">>=", "<<=", "...",
  "!=", "->", ":=", "**", "//", "<<", ">>", "<=", ">=", "==",
  "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=",
  "+", "-", "*", "/", "%", "@", "&", "|", "^", "~", "<", ">",
  "(", ")", "[", "]", "{", "}", ",", ":", ".", ";", "=",
};

const char* const kStringPrefixes[] = {"r", "u", "b", "f", "br", "rb", "fr", "rf"};

inline bool IsIdentStart(char c) {
  return std::isalpha((unsigned char)c) || c == '_';
}
inline bool IsIdentChar(char c) {
  return std::isalnum((unsigned char)c) || c == '_';
}

inline std::string Lower(std::string str) {
  for (auto& c : str) c = std::tolower((unsigned char)c);
  return str;
}

class Lexer {
 public:
  Lexer(const std::string& src, int line_offset, bool expression) :
      src_(src), pos_(0), line_(1 + line_offset), expression_(expression), indents_{0} {}

  std::vector<Token> Run() {
    bool line_start = !expression_;
    while (pos_ < src_.size()) {
      if (line_start) {
        line_start = false;
        if (!Indentation()) continue;
      }
      char c = src_[pos_];
      if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
        pos_++;
      } else if (c == '\n') {
        if (closers_.empty() && !expression_ && LineHasTokens()) Push(TokenType::NEWLINE, "");
        pos_++;
        line_++;
        line_start = !expression_ && closers_.empty();
      } else if (c == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n') pos_++;
      } else if (c == '\\') {
        size_t nxt = pos_ + 1;
        if (nxt < src_.size() && src_[nxt] == '\r') nxt++;
        if (nxt >= src_.size() || src_[nxt] != '\n') {
          throw ParseError(line_, "unexpected character after line continuation character");
        }
        pos_ = nxt + 1;
        line_++;
      } else if (IsIdentStart(c)) {
        size_t start = pos_;
        while (pos_ < src_.size() && IsIdentChar(src_[pos_])) pos_++;
        std::string word = src_.substr(start, pos_ - start);
        if (pos_ < src_.size() && (src_[pos_] == '\'' || src_[pos_] == '"') && IsStringPrefix(word)) {
          String(Lower(word));
        } else {
          if (pos_ < src_.size() && (unsigned char)src_[pos_] >= 0x80) NonAscii();
          Push(TokenType::NAME, std::move(word));
        }
      } else if ((unsigned char)c >= 0x80) {
        NonAscii();
      } else if (std::isdigit((unsigned char)c) ||
                 (c == '.' && pos_ + 1 < src_.size() && std::isdigit((unsigned char)src_[pos_ + 1]))) {
        Number();
      } else if (c == '\'' || c == '"') {
        String("");
      } else {
        Operator();
      }
    }
    if (!closers_.empty()) {
      throw ParseError(open_lines_.back(), std::string("'") + OpenerOf(closers_.back()) + "' was never closed");
    }
    if (!expression_) {
      if (LineHasTokens()) Push(TokenType::NEWLINE, "");
      while (indents_.size() > 1) {
        indents_.pop_back();
        Push(TokenType::DEDENT, "");
      }
    }
    Push(TokenType::END, "");
    return std::move(tokens_);
  }

 private:
  const std::string& src_;
  size_t pos_;
  int line_;
  bool expression_;
  std::vector<int> indents_;
  std::vector<char> closers_;
  std::vector<int> open_lines_;
  std::vector<Token> tokens_;

  void Push(TokenType type, std::string text, std::string prefix = "", int line = -1) {
    tokens_.push_back({type, std::move(text), std::move(prefix), line < 0 ? line_ : line});
  }

  bool LineHasTokens() const {
    if (tokens_.empty()) return false;
    TokenType type = tokens_.back().type;
    return type != TokenType::NEWLINE && type != TokenType::INDENT && type != TokenType::DEDENT;
  }

  // returns false if the line is blank or a comment (no indentation change)
  bool Indentation() {
    int col = 0;
    size_t p = pos_;
    for (; p < src_.size(); p++) {
      if (src_[p] == ' ') {
        col++;
      } else if (src_[p] == '\t') {
        col = (col / 8 + 1) * 8;
      } else if (src_[p] == '\f') {
        col = 0;
      } else {
        break;
      }
    }
    pos_ = p;
    if (p >= src_.size() || src_[p] == '\n' || src_[p] == '\r' || src_[p] == '#') return false;
    if (col > indents_.back()) {
      indents_.push_back(col);
      Push(TokenType::INDENT, "");
    } else {
      while (col < indents_.back()) {
        indents_.pop_back();
        Push(TokenType::DEDENT, "");
      }
      if (col != indents_.back()) {
        throw ParseError(line_, "unindent does not match any outer indentation level");
      }
    }
    return true;
  }

  [[noreturn]] void NonAscii() {
    throw ParseError(line_, "non-ASCII character outside a string literal");
  }

  static bool IsStringPrefix(const std::string& word) {
    std::string lower = Lower(word);
    for (const char* prefix : kStringPrefixes) {
      if (lower == prefix) return true;
    }
    return false;
  }

  static char OpenerOf(char closer) {
    switch (closer) {
      case ')': return '(';
      case ']': return '[';
      default: return '{';
    }
  }

  void Number() {
    size_t start = pos_;
    size_t n = src_.size();
    if (src_[pos_] == '0' && pos_ + 1 < n && std::strchr("xXoObB", src_[pos_ + 1])) {
      pos_ += 2;
      while (pos_ < n && IsIdentChar(src_[pos_])) pos_++;
    } else {
      while (pos_ < n) {
        char c = src_[pos_];
        if (std::isdigit((unsigned char)c) || c == '_' || c == '.') {
          pos_++;
        } else if (c == 'e' || c == 'E') {
          pos_++;
          if (pos_ < n && (src_[pos_] == '+' || src_[pos_] == '-')) pos_++;
        } else if (c == 'j' || c == 'J') {
          pos_++;
          break;
        } else {
          break;
        }
      }
    }
    Push(TokenType::NUMBER, src_.substr(start, pos_ - start));
  }

  // pos_ points at the opening quote
  void String(std::string prefix) {
    char quote = src_[pos_];
    const std::string triple(3, quote);
    bool is_triple = src_.compare(pos_, 3, triple) == 0;
    size_t qlen = is_triple ? 3 : 1;
    int start_line = line_;
    pos_ += qlen;
    size_t body_start = pos_;
    while (true) {
      if (pos_ >= src_.size()) throw ParseError(start_line, "unterminated string literal");
      char c = src_[pos_];
      if (c == '\\') {
        // an escaped quote never terminates, even in raw strings
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') line_++;
        pos_ += 2;
        continue;
      }
      if (c == '\n') {
        if (!is_triple) throw ParseError(start_line, "unterminated string literal");
        line_++;
        pos_++;
        continue;
      }
      if (c == quote && (!is_triple || src_.compare(pos_, 3, triple) == 0)) break;
      pos_++;
    }
    std::string body = src_.substr(body_start, pos_ - body_start);
    pos_ += qlen;
    Push(TokenType::STRING, std::move(body), std::move(prefix), start_line);
  }

  void Operator() {
    for (const char* op : kOperators) {
      size_t len = std::strlen(op);
      if (src_.compare(pos_, len, op) != 0) continue;
      if (len == 1) Bracket(op[0]);
      pos_ += len;
      Push(TokenType::OP, op);
      return;
    }
    throw ParseError(line_, std::string("invalid character '") + src_[pos_] + "'");
  }

  void Bracket(char c) {
    switch (c) {
      case '(': closers_.push_back(')'); open_lines_.push_back(line_); break;
      case '[': closers_.push_back(']'); open_lines_.push_back(line_); break;
      case '{': closers_.push_back('}'); open_lines_.push_back(line_); break;
      case ')': [[fallthrough]];
      case ']': [[fallthrough]];
      case '}': {
        if (closers_.empty()) throw ParseError(line_, std::string("unmatched '") + c + "'");
        if (closers_.back() != c) {
          throw ParseError(line_, std::string("closing parenthesis '") + c +
                                  "' does not match opening parenthesis '" + OpenerOf(closers_.back()) + "'");
        }
        closers_.pop_back();
        open_lines_.pop_back();
        break;
      }
      default: break;
    }
  }
};

const char* kTokenTypeNames[] = {
#define X(name) #name,
  ENUM_TOKEN_TYPE_
#undef X
};

} // namespace

std::vector<Token> Tokenize(const std::string& source, int line_offset, bool expression) {
  return Lexer(source, line_offset, expression).Run();
}

const char* TokenTypeName(TokenType type) {
  return kTokenTypeNames[(int)type];
}
