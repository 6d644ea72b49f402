#ifndef CODEBOX_LEXER_H_
#define CODEBOX_LEXER_H_

#include <string>
#include <vector>
#include <stdexcept>

#define ENUM_TOKEN_TYPE_ \
  X(NAME) \
  X(NUMBER) \
  X(STRING) \
  X(OP) \
  X(NEWLINE) \
  X(INDENT) \
  X(DEDENT) \
  X(END)
enum class TokenType {
#define X(name) name,
  ENUM_TOKEN_TYPE_
#undef X
};

struct Token {
  TokenType type;
  std::string text;   // NAME/NUMBER/OP: the token; STRING: the body between the quotes
  std::string prefix; // STRING only: lowercased prefix letters (r, b, u, f)
  int line;
};

class ParseError : public std::runtime_error {
 public:
  int line;
  ParseError(int line, const std::string& msg) : std::runtime_error(msg), line(line) {}
};

// line_offset is added to every line number.
// In expression mode (f-string fields) the source behaves as if enclosed in
// brackets: no NEWLINE/INDENT/DEDENT tokens are produced.
std::vector<Token> Tokenize(const std::string& source, int line_offset = 0, bool expression = false);

const char* TokenTypeName(TokenType);

#endif  // CODEBOX_LEXER_H_
