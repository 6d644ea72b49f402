#ifndef CODEBOX_PARSER_H_
#define CODEBOX_PARSER_H_

#include "ast.h"
#include "lexer.h"

// Parse a Python 3 module. Throws ParseError on anything it does not understand.
NodePtr Parse(const std::string& source);

#endif  // CODEBOX_PARSER_H_
