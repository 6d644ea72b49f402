#include "parser.h"

#include <cctype>
#include <cstring>
#include <algorithm>
#include <unordered_set>

namespace {

const std::unordered_set<std::string> kKeywords = {
  "False", "None", "True", "and", "as", "assert", "async", "await", "break",
  "class", "continue", "def", "del", "elif", "else", "except", "finally", "for",
  "from", "global", "if", "import", "in", "is", "lambda", "nonlocal", "not", "or",
  "pass", "raise", "return", "try", "while", "with", "yield",
};

const std::unordered_set<std::string> kAugAssignOps = {
  "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**=",
};

void ParseFStringBody(const std::string& body, int line, Node& out);
std::string DecodeEscapes(const std::string& body, bool bytes);

class Parser {
 public:
  explicit Parser(std::vector<Token>&& tokens) : toks_(std::move(tokens)), pos_(0) {}

  NodePtr ParseModule() {
    auto mod = MakeNode(NodeKind::MODULE, 1);
    while (Peek().type != TokenType::END) {
      if (Peek().type == TokenType::NEWLINE) {
        Next();
        continue;
      }
      ParseStatement(*mod);
    }
    return mod;
  }

  // body of an f-string replacement field
  NodePtr ParseFieldExpression() {
    NodePtr ret;
    if (IsKeyword("yield")) {
      ret = ParseYield();
    } else {
      ret = ParseTestListStarExpr();
    }
    if (Peek().type != TokenType::END) Fail("f-string: invalid expression");
    return ret;
  }

 private:
  std::vector<Token> toks_;
  size_t pos_;

  const Token& Peek(size_t k = 0) const {
    return toks_[std::min(pos_ + k, toks_.size() - 1)];
  }
  const Token& Next() {
    const Token& ret = toks_[pos_];
    if (pos_ + 1 < toks_.size()) pos_++;
    return ret;
  }
  bool IsOp(const char* op, size_t k = 0) const {
    const Token& t = Peek(k);
    return t.type == TokenType::OP && t.text == op;
  }
  bool IsKeyword(const char* kw, size_t k = 0) const {
    const Token& t = Peek(k);
    return t.type == TokenType::NAME && t.text == kw;
  }
  bool IsName(size_t k = 0) const {
    const Token& t = Peek(k);
    return t.type == TokenType::NAME && !kKeywords.count(t.text);
  }
  bool AcceptOp(const char* op) {
    if (!IsOp(op)) return false;
    Next();
    return true;
  }
  bool AcceptKeyword(const char* kw) {
    if (!IsKeyword(kw)) return false;
    Next();
    return true;
  }
  void ExpectOp(const char* op) {
    if (!AcceptOp(op)) Fail(std::string("expected '") + op + "'");
  }
  void ExpectKeyword(const char* kw) {
    if (!AcceptKeyword(kw)) Fail(std::string("expected '") + kw + "'");
  }
  std::string ExpectName() {
    if (!IsName()) Fail("expected a name");
    return Next().text;
  }
  [[noreturn]] void Fail(const std::string& msg) const {
    throw ParseError(Peek().line, msg);
  }
  [[noreturn]] void Fail(const std::string& msg, int line) const {
    throw ParseError(line, msg);
  }

  bool StartsExpression() const {
    const Token& t = Peek();
    switch (t.type) {
      case TokenType::NUMBER: [[fallthrough]];
      case TokenType::STRING: return true;
      case TokenType::NAME: {
        if (!kKeywords.count(t.text)) return true;
        static const std::unordered_set<std::string> kExprKeywords = {
          "None", "True", "False", "not", "lambda", "await",
        };
        return kExprKeywords.count(t.text);
      }
      case TokenType::OP: {
        static const std::unordered_set<std::string> kExprOps = {
          "(", "[", "{", "-", "+", "~", "*", "...",
        };
        return kExprOps.count(t.text);
      }
      default: return false;
    }
  }

  /// statements
  void ParseStatement(Node& block) {
    const Token& t = Peek();
    if (t.type == TokenType::INDENT) Fail("unexpected indent");
    if (t.type == TokenType::OP && t.text == "@") {
      block.Add(ParseDecorated());
      return;
    }
    if (t.type == TokenType::NAME) {
      if (t.text == "if") return (void)block.Add(ParseIf());
      if (t.text == "while") return (void)block.Add(ParseWhile());
      if (t.text == "for") return (void)block.Add(ParseFor());
      if (t.text == "try") return (void)block.Add(ParseTry());
      if (t.text == "with") return (void)block.Add(ParseWith());
      if (t.text == "def") return (void)block.Add(ParseFunctionDef(nullptr));
      if (t.text == "class") return (void)block.Add(ParseClassDef(nullptr));
      if (t.text == "async" && Peek(1).type == TokenType::NAME) {
        const std::string& nxt = Peek(1).text;
        if (nxt == "def" || nxt == "for" || nxt == "with") {
          Next();
          NodePtr node;
          if (nxt == "def") {
            node = ParseFunctionDef(nullptr);
          } else if (nxt == "for") {
            node = ParseFor();
          } else {
            node = ParseWith();
          }
          node->is_async = true;
          block.Add(std::move(node));
          return;
        }
      }
    }
    ParseSimpleStatements(block);
  }

  NodePtr ParseBlock(const char* label = "") {
    ExpectOp(":");
    auto block = MakeNode(NodeKind::BLOCK, Peek().line, label);
    if (Peek().type == TokenType::NEWLINE) {
      Next();
      if (Peek().type != TokenType::INDENT) Fail("expected an indented block");
      Next();
      while (Peek().type != TokenType::DEDENT && Peek().type != TokenType::END) {
        if (Peek().type == TokenType::NEWLINE) {
          Next();
          continue;
        }
        ParseStatement(*block);
      }
      if (Peek().type == TokenType::DEDENT) Next();
    } else {
      ParseSimpleStatements(*block);
    }
    return block;
  }

  void ParseSimpleStatements(Node& block) {
    while (true) {
      block.Add(ParseSmallStatement());
      if (!AcceptOp(";")) break;
      if (Peek().type == TokenType::NEWLINE) break;
    }
    if (Peek().type != TokenType::NEWLINE) Fail("invalid syntax");
    Next();
  }

  NodePtr ParseSmallStatement() {
    int line = Peek().line;
    if (AcceptKeyword("pass")) return MakeNode(NodeKind::PASS, line);
    if (AcceptKeyword("break")) return MakeNode(NodeKind::BREAK, line);
    if (AcceptKeyword("continue")) return MakeNode(NodeKind::CONTINUE, line);
    if (AcceptKeyword("return")) {
      auto node = MakeNode(NodeKind::RETURN, line);
      if (StartsExpression()) node->Add(ParseTestListStarExpr());
      return node;
    }
    if (AcceptKeyword("raise")) {
      auto node = MakeNode(NodeKind::RAISE, line);
      if (StartsExpression()) {
        node->Add(ParseTest());
        if (AcceptKeyword("from")) node->Add(ParseTest());
      }
      return node;
    }
    if (IsKeyword("global") || IsKeyword("nonlocal")) {
      auto node = MakeNode(Next().text == "global" ? NodeKind::GLOBAL : NodeKind::NONLOCAL, line);
      do {
        int name_line = Peek().line;
        node->Add(MakeNode(NodeKind::IDENTIFIER, name_line, ExpectName()));
      } while (AcceptOp(","));
      return node;
    }
    if (AcceptKeyword("del")) {
      auto node = MakeNode(NodeKind::DELETE, line);
      do {
        NodePtr target = ParseExprOrStar();
        if (!SetContext(*target, NameContext::DEL)) Fail("cannot delete expression", target->line);
        node->Add(std::move(target));
      } while (AcceptOp(",") && StartsExpression());
      return node;
    }
    if (AcceptKeyword("assert")) {
      auto node = MakeNode(NodeKind::ASSERT, line);
      node->Add(ParseTest());
      if (AcceptOp(",")) node->Add(ParseTest());
      return node;
    }
    if (IsKeyword("import")) return ParseImport();
    if (IsKeyword("from")) return ParseImportFrom();
    return ParseExprStatement();
  }

  NodePtr ParseImport() {
    auto node = MakeNode(NodeKind::IMPORT, Next().line);
    do {
      node->Add(ParseAlias(true));
    } while (AcceptOp(","));
    return node;
  }

  NodePtr ParseImportFrom() {
    int line = Next().line;
    std::string module;
    while (IsOp(".") || IsOp("...")) module += Next().text;
    if (IsName()) module += ParseDottedName();
    if (module.empty()) Fail("invalid syntax");
    ExpectKeyword("import");
    auto node = MakeNode(NodeKind::IMPORT_FROM, line, module);
    if (IsOp("*")) {
      node->Add(MakeNode(NodeKind::ALIAS, Next().line, "*"));
      return node;
    }
    bool paren = AcceptOp("(");
    do {
      if (paren && IsOp(")")) break;
      node->Add(ParseAlias(false));
    } while (AcceptOp(","));
    if (paren) ExpectOp(")");
    return node;
  }

  std::string ParseDottedName() {
    std::string ret = ExpectName();
    while (AcceptOp(".")) ret += "." + ExpectName();
    return ret;
  }

  NodePtr ParseAlias(bool dotted) {
    int line = Peek().line;
    auto node = MakeNode(NodeKind::ALIAS, line, dotted ? ParseDottedName() : ExpectName());
    if (AcceptKeyword("as")) {
      int as_line = Peek().line;
      node->Add(MakeNode(NodeKind::IDENTIFIER, as_line, ExpectName()));
    }
    return node;
  }

  NodePtr ParseExprStatement() {
    int line = Peek().line;
    NodePtr first = ParseYieldOrTestListStar();
    if (IsOp(":")) {
      Next();
      if (first->kind != NodeKind::NAME && first->kind != NodeKind::ATTRIBUTE &&
          first->kind != NodeKind::SUBSCRIPT) {
        Fail("illegal target for annotation", first->line);
      }
      SetContext(*first, NameContext::STORE);
      auto node = MakeNode(NodeKind::ANN_ASSIGN, line);
      node->Add(std::move(first));
      auto ann = MakeNode(NodeKind::ANNOTATION, Peek().line);
      ann->Add(ParseTest());
      node->Add(std::move(ann));
      if (AcceptOp("=")) node->Add(ParseYieldOrTestListStar());
      return node;
    }
    if (Peek().type == TokenType::OP && kAugAssignOps.count(Peek().text)) {
      std::string op = Next().text;
      if (first->kind != NodeKind::NAME && first->kind != NodeKind::ATTRIBUTE &&
          first->kind != NodeKind::SUBSCRIPT) {
        Fail("illegal expression for augmented assignment", first->line);
      }
      SetContext(*first, NameContext::STORE);
      auto node = MakeNode(NodeKind::AUG_ASSIGN, line, op);
      node->Add(std::move(first));
      node->Add(ParseYieldOrTestListStar());
      return node;
    }
    if (IsOp("=")) {
      auto node = MakeNode(NodeKind::ASSIGN, line);
      std::vector<NodePtr> parts;
      parts.push_back(std::move(first));
      while (AcceptOp("=")) parts.push_back(ParseYieldOrTestListStar());
      for (size_t i = 0; i + 1 < parts.size(); i++) {
        if (!SetContext(*parts[i], NameContext::STORE)) {
          Fail("cannot assign to expression", parts[i]->line);
        }
      }
      for (auto& i : parts) node->Add(std::move(i));
      return node;
    }
    auto node = MakeNode(NodeKind::EXPR_STMT, line);
    node->Add(std::move(first));
    return node;
  }

  NodePtr ParseIf() {
    auto node = MakeNode(NodeKind::IF, Next().line);
    node->Add(ParseNamedExprTest());
    node->Add(ParseBlock());
    if (IsKeyword("elif")) {
      auto orelse = MakeNode(NodeKind::BLOCK, Peek().line, "else");
      orelse->Add(ParseIf()); // "elif" is consumed the same way as "if"
      node->Add(std::move(orelse));
    } else if (AcceptKeyword("else")) {
      node->Add(ParseBlock("else"));
    }
    return node;
  }

  NodePtr ParseWhile() {
    auto node = MakeNode(NodeKind::WHILE, Next().line);
    node->Add(ParseNamedExprTest());
    node->Add(ParseBlock());
    if (AcceptKeyword("else")) node->Add(ParseBlock("else"));
    return node;
  }

  NodePtr ParseFor() {
    auto node = MakeNode(NodeKind::FOR, Next().line);
    NodePtr target = ParseExprList();
    if (!SetContext(*target, NameContext::STORE)) Fail("cannot assign to expression", target->line);
    node->Add(std::move(target));
    ExpectKeyword("in");
    node->Add(ParseTestListStarExpr());
    node->Add(ParseBlock());
    if (AcceptKeyword("else")) node->Add(ParseBlock("else"));
    return node;
  }

  NodePtr ParseTry() {
    auto node = MakeNode(NodeKind::TRY, Next().line);
    node->Add(ParseBlock());
    bool has_handler = false;
    while (IsKeyword("except")) {
      int line = Next().line;
      if (IsOp("*")) Fail("except* is not supported");
      auto handler = MakeNode(NodeKind::HANDLER, line);
      if (!IsOp(":")) {
        handler->Add(ParseTest());
        if (AcceptKeyword("as")) handler->text = ExpectName();
      }
      handler->Add(ParseBlock());
      node->Add(std::move(handler));
      has_handler = true;
    }
    if (has_handler && AcceptKeyword("else")) node->Add(ParseBlock("else"));
    if (AcceptKeyword("finally")) {
      node->Add(ParseBlock("finally"));
    } else if (!has_handler) {
      Fail("expected 'except' or 'finally' block");
    }
    return node;
  }

  NodePtr ParseWith() {
    auto node = MakeNode(NodeKind::WITH, Next().line);
    do {
      auto item = MakeNode(NodeKind::WITH_ITEM, Peek().line);
      item->Add(ParseTest());
      if (AcceptKeyword("as")) {
        NodePtr target = ParseExprOrStar();
        if (!SetContext(*target, NameContext::STORE)) Fail("cannot assign to expression", target->line);
        item->Add(std::move(target));
      }
      node->Add(std::move(item));
    } while (AcceptOp(","));
    node->Add(ParseBlock());
    return node;
  }

  NodePtr ParseDecorated() {
    auto decorators = MakeNode(NodeKind::DECORATORS, Peek().line);
    while (AcceptOp("@")) {
      decorators->Add(ParseNamedExprTest());
      if (Peek().type != TokenType::NEWLINE) Fail("invalid syntax");
      Next();
    }
    if (IsKeyword("def")) return ParseFunctionDef(std::move(decorators));
    if (IsKeyword("class")) return ParseClassDef(std::move(decorators));
    if (IsKeyword("async") && IsKeyword("def", 1)) {
      Next();
      NodePtr node = ParseFunctionDef(std::move(decorators));
      node->is_async = true;
      return node;
    }
    Fail("invalid syntax");
  }

  NodePtr ParseFunctionDef(NodePtr decorators) {
    int line = Next().line;
    auto node = MakeNode(NodeKind::FUNCTION_DEF, line, ExpectName());
    if (decorators) node->Add(std::move(decorators));
    ExpectOp("(");
    node->Add(ParseParameters(")", true));
    ExpectOp(")");
    if (IsOp("->")) {
      auto returns = MakeNode(NodeKind::RETURNS, Next().line);
      returns->Add(ParseTest());
      node->Add(std::move(returns));
    }
    node->Add(ParseBlock());
    return node;
  }

  NodePtr ParseClassDef(NodePtr decorators) {
    int line = Next().line;
    auto node = MakeNode(NodeKind::CLASS_DEF, line, ExpectName());
    if (decorators) node->Add(std::move(decorators));
    if (AcceptOp("(")) {
      ParseArguments(*node);
      ExpectOp(")");
    }
    node->Add(ParseBlock());
    return node;
  }

  NodePtr ParseParameters(const char* close, bool annotations) {
    auto args = MakeNode(NodeKind::ARGUMENTS, Peek().line);
    bool seen_default = false, seen_star = false;
    while (!IsOp(close)) {
      if (AcceptOp("/")) {
        // positional-only marker
      } else if (AcceptOp("**")) {
        args->Add(ParseParam(annotations, false));
        if (!IsOp(close) && !(IsOp(",") && IsOp(close, 1))) Fail("arguments cannot follow var-keyword argument");
      } else if (AcceptOp("*")) {
        if (seen_star) Fail("* argument may appear only once");
        seen_star = true;
        if (IsName()) args->Add(ParseParam(annotations, false));
      } else {
        auto param = ParseParam(annotations, true);
        if (param->Find(NodeKind::DEFAULT)) {
          seen_default = true;
        } else if (seen_default && !seen_star) {
          Fail("non-default argument follows default argument", param->line);
        }
        args->Add(std::move(param));
      }
      if (!AcceptOp(",")) break;
    }
    return args;
  }

  NodePtr ParseParam(bool annotations, bool allow_default) {
    int line = Peek().line;
    auto param = MakeNode(NodeKind::PARAM, line, ExpectName());
    if (annotations && IsOp(":")) {
      auto ann = MakeNode(NodeKind::ANNOTATION, Next().line);
      ann->Add(ParseTest());
      param->Add(std::move(ann));
    }
    if (allow_default && IsOp("=")) {
      auto def = MakeNode(NodeKind::DEFAULT, Next().line);
      def->Add(ParseTest());
      param->Add(std::move(def));
    }
    return param;
  }

  /// expressions
  NodePtr ParseYield() {
    int line = Next().line;
    if (AcceptKeyword("from")) {
      auto node = MakeNode(NodeKind::YIELD_FROM, line);
      node->Add(ParseTest());
      return node;
    }
    auto node = MakeNode(NodeKind::YIELD, line);
    if (StartsExpression()) node->Add(ParseTestListStarExpr());
    return node;
  }

  NodePtr ParseYieldOrTestListStar() {
    if (IsKeyword("yield")) return ParseYield();
    return ParseTestListStarExpr();
  }

  // a, *b, c  (a tuple if there is a comma)
  NodePtr ParseTestListStarExpr() {
    int line = Peek().line;
    NodePtr first = ParseTestOrStar();
    if (!IsOp(",")) return first;
    auto tuple = MakeNode(NodeKind::TUPLE, line);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
      if (!StartsExpression()) break;
      tuple->Add(ParseTestOrStar());
    }
    return tuple;
  }

  // for-loop targets and del targets
  NodePtr ParseExprList() {
    int line = Peek().line;
    NodePtr first = ParseExprOrStar();
    if (!IsOp(",")) return first;
    auto tuple = MakeNode(NodeKind::TUPLE, line);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
      if (!StartsExpression()) break;
      tuple->Add(ParseExprOrStar());
    }
    return tuple;
  }

  NodePtr ParseStar(bool test) {
    auto node = MakeNode(NodeKind::STARRED, Next().line);
    node->Add(test ? ParseTest() : ParseBitOr());
    return node;
  }
  NodePtr ParseTestOrStar() {
    if (IsOp("*")) return ParseStar(false);
    return ParseTest();
  }
  NodePtr ParseExprOrStar() {
    if (IsOp("*")) return ParseStar(false);
    return ParseBitOr();
  }
  NodePtr ParseNamedOrStar() {
    if (IsOp("*")) return ParseStar(false);
    return ParseNamedExprTest();
  }

  NodePtr ParseNamedExprTest() {
    if (IsName() && IsOp(":=", 1)) {
      int line = Peek().line;
      auto target = MakeNode(NodeKind::NAME, line, Next().text);
      target->ctx = NameContext::STORE;
      Next();
      auto node = MakeNode(NodeKind::NAMED_EXPR, line);
      node->Add(std::move(target));
      node->Add(ParseTest());
      return node;
    }
    NodePtr ret = ParseTest();
    if (IsOp(":=")) Fail("cannot use assignment expressions with this target");
    return ret;
  }

  NodePtr ParseTest() {
    if (IsKeyword("lambda")) return ParseLambda();
    int line = Peek().line;
    NodePtr body = ParseOr();
    if (!IsKeyword("if")) return body;
    // a conditional expression needs "else"; otherwise the "if" belongs to a comprehension
    Next();
    auto node = MakeNode(NodeKind::IF_EXP, line);
    NodePtr test = ParseOr();
    ExpectKeyword("else");
    node->Add(std::move(body));
    node->Add(std::move(test));
    node->Add(ParseTest());
    return node;
  }

  NodePtr ParseLambda() {
    auto node = MakeNode(NodeKind::LAMBDA, Next().line);
    node->Add(ParseParameters(":", false));
    ExpectOp(":");
    node->Add(ParseTest());
    return node;
  }

  NodePtr ParseBoolOp(const char* op, NodePtr (Parser::*sub)()) {
    int line = Peek().line;
    NodePtr first = (this->*sub)();
    if (!IsKeyword(op)) return first;
    auto node = MakeNode(NodeKind::BOOLOP, line, op);
    node->Add(std::move(first));
    while (AcceptKeyword(op)) node->Add((this->*sub)());
    return node;
  }
  NodePtr ParseOr() { return ParseBoolOp("or", &Parser::ParseAnd); }
  NodePtr ParseAnd() { return ParseBoolOp("and", &Parser::ParseNot); }

  NodePtr ParseNot() {
    if (IsKeyword("not")) {
      auto node = MakeNode(NodeKind::UNARYOP, Next().line, "not");
      node->Add(ParseNot());
      return node;
    }
    return ParseComparison();
  }

  // returns the operator text, or "" if the next tokens are not a comparison operator
  std::string AcceptCompareOp() {
    static const std::unordered_set<std::string> kOps = {"<", ">", "==", ">=", "<=", "!="};
    const Token& t = Peek();
    if (t.type == TokenType::OP && kOps.count(t.text)) return Next().text;
    if (AcceptKeyword("in")) return "in";
    if (IsKeyword("not") && IsKeyword("in", 1)) {
      Next();
      Next();
      return "not in";
    }
    if (AcceptKeyword("is")) return AcceptKeyword("not") ? "is not" : "is";
    return "";
  }

  NodePtr ParseComparison() {
    int line = Peek().line;
    NodePtr first = ParseBitOr();
    std::string op = AcceptCompareOp();
    if (op.empty()) return first;
    auto node = MakeNode(NodeKind::COMPARE, line);
    node->Add(std::move(first));
    std::string ops;
    do {
      if (!ops.empty()) ops += ',';
      ops += op;
      node->Add(ParseBitOr());
    } while (!(op = AcceptCompareOp()).empty());
    node->text = ops;
    return node;
  }

  NodePtr ParseBinary(std::initializer_list<const char*> ops, NodePtr (Parser::*sub)()) {
    int line = Peek().line;
    NodePtr left = (this->*sub)();
    while (true) {
      const char* matched = nullptr;
      for (const char* op : ops) {
        if (IsOp(op)) {
          matched = op;
          break;
        }
      }
      if (!matched) return left;
      Next();
      auto node = MakeNode(NodeKind::BINOP, line, matched);
      node->Add(std::move(left));
      node->Add((this->*sub)());
      left = std::move(node);
    }
  }
  NodePtr ParseBitOr() { return ParseBinary({"|"}, &Parser::ParseBitXor); }
  NodePtr ParseBitXor() { return ParseBinary({"^"}, &Parser::ParseBitAnd); }
  NodePtr ParseBitAnd() { return ParseBinary({"&"}, &Parser::ParseShift); }
  NodePtr ParseShift() { return ParseBinary({"<<", ">>"}, &Parser::ParseArith); }
  NodePtr ParseArith() { return ParseBinary({"+", "-"}, &Parser::ParseTerm); }
  NodePtr ParseTerm() { return ParseBinary({"*", "/", "//", "%", "@"}, &Parser::ParseFactor); }

  NodePtr ParseFactor() {
    if (IsOp("+") || IsOp("-") || IsOp("~")) {
      const Token& t = Next();
      auto node = MakeNode(NodeKind::UNARYOP, t.line, t.text);
      node->Add(ParseFactor());
      return node;
    }
    return ParsePower();
  }

  NodePtr ParsePower() {
    int line = Peek().line;
    NodePtr base;
    if (IsKeyword("await")) {
      base = MakeNode(NodeKind::AWAIT, Next().line);
      base->Add(ParsePrimary());
    } else {
      base = ParsePrimary();
    }
    if (!AcceptOp("**")) return base;
    auto node = MakeNode(NodeKind::BINOP, line, "**");
    node->Add(std::move(base));
    node->Add(ParseFactor());
    return node;
  }

  NodePtr ParsePrimary() {
    NodePtr node = ParseAtom();
    while (true) {
      int line = Peek().line;
      if (AcceptOp(".")) {
        auto attr = MakeNode(NodeKind::ATTRIBUTE, line);
        if (Peek().type != TokenType::NAME) Fail("expected an attribute name");
        attr->text = Next().text;
        attr->Add(std::move(node));
        node = std::move(attr);
      } else if (AcceptOp("(")) {
        auto call = MakeNode(NodeKind::CALL, node->line);
        call->Add(std::move(node));
        ParseArguments(*call);
        ExpectOp(")");
        node = std::move(call);
      } else if (AcceptOp("[")) {
        auto sub = MakeNode(NodeKind::SUBSCRIPT, node->line);
        sub->Add(std::move(node));
        sub->Add(ParseSubscriptList());
        ExpectOp("]");
        node = std::move(sub);
      } else {
        return node;
      }
    }
  }

  void ParseArguments(Node& call) {
    while (!IsOp(")")) {
      int line = Peek().line;
      if (IsOp("*")) {
        call.Add(ParseStar(true));
      } else if (AcceptOp("**")) {
        auto kw = MakeNode(NodeKind::KEYWORD, line);
        kw->Add(ParseTest());
        call.Add(std::move(kw));
      } else if (IsName() && IsOp("=", 1)) {
        auto kw = MakeNode(NodeKind::KEYWORD, line, Next().text);
        Next();
        kw->Add(ParseTest());
        call.Add(std::move(kw));
      } else {
        NodePtr arg = ParseNamedExprTest();
        if (IsComprehensionStart()) {
          auto gen = MakeNode(NodeKind::GENERATOR_EXP, line);
          gen->Add(std::move(arg));
          ParseComprehensions(*gen);
          arg = std::move(gen);
        }
        call.Add(std::move(arg));
      }
      if (!AcceptOp(",")) break;
    }
  }

  NodePtr ParseSubscriptList() {
    int line = Peek().line;
    NodePtr first = ParseSubscript();
    if (!IsOp(",")) return first;
    auto tuple = MakeNode(NodeKind::TUPLE, line);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp("]")) break;
      tuple->Add(ParseSubscript());
    }
    return tuple;
  }

  NodePtr ParseSubscript() {
    int line = Peek().line;
    NodePtr lower;
    if (!IsOp(":")) {
      lower = ParseNamedOrStar();
      if (!IsOp(":")) return lower;
    }
    auto slice = MakeNode(NodeKind::SLICE, line);
    if (lower) slice->Add(std::move(lower));
    ExpectOp(":");
    if (!IsOp(":") && !IsOp("]") && !IsOp(",")) slice->Add(ParseTest());
    if (AcceptOp(":")) {
      if (!IsOp("]") && !IsOp(",")) slice->Add(ParseTest());
    }
    return slice;
  }

  bool IsComprehensionStart() const {
    return IsKeyword("for") || (IsKeyword("async") && IsKeyword("for", 1));
  }

  void ParseComprehensions(Node& parent) {
    while (IsComprehensionStart()) {
      auto comp = MakeNode(NodeKind::COMPREHENSION, Peek().line);
      if (AcceptKeyword("async")) comp->is_async = true;
      ExpectKeyword("for");
      NodePtr target = ParseExprList();
      if (!SetContext(*target, NameContext::STORE)) Fail("cannot assign to expression", target->line);
      comp->Add(std::move(target));
      ExpectKeyword("in");
      comp->Add(ParseOr());
      while (AcceptKeyword("if")) comp->Add(ParseOr());
      parent.Add(std::move(comp));
    }
  }

  NodePtr ParseAtom() {
    const Token& t = Peek();
    int line = t.line;
    switch (t.type) {
      case TokenType::NUMBER: return MakeNode(NodeKind::CONSTANT, line, Next().text);
      case TokenType::STRING: return ParseStrings();
      case TokenType::NAME: {
        if (t.text == "None" || t.text == "True" || t.text == "False") {
          return MakeNode(NodeKind::CONSTANT, line, Next().text);
        }
        if (!IsName()) Fail("invalid syntax");
        return MakeNode(NodeKind::NAME, line, Next().text);
      }
      case TokenType::OP: {
        if (AcceptOp("...")) return MakeNode(NodeKind::CONSTANT, line, "...");
        if (AcceptOp("(")) return ParseParenthesized(line);
        if (AcceptOp("[")) return ParseListDisplay(line);
        if (AcceptOp("{")) return ParseBraceDisplay(line);
        Fail("invalid syntax");
      }
      case TokenType::INDENT: Fail("unexpected indent");
      default: Fail("invalid syntax");
    }
  }

  NodePtr ParseParenthesized(int line) {
    if (AcceptOp(")")) return MakeNode(NodeKind::TUPLE, line);
    if (IsKeyword("yield")) {
      NodePtr ret = ParseYield();
      ExpectOp(")");
      return ret;
    }
    NodePtr first = ParseNamedOrStar();
    if (IsComprehensionStart()) {
      auto gen = MakeNode(NodeKind::GENERATOR_EXP, line);
      gen->Add(std::move(first));
      ParseComprehensions(*gen);
      ExpectOp(")");
      return gen;
    }
    if (AcceptOp(")")) return first;
    auto tuple = MakeNode(NodeKind::TUPLE, line);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp(")")) break;
      tuple->Add(ParseNamedOrStar());
    }
    ExpectOp(")");
    return tuple;
  }

  NodePtr ParseListDisplay(int line) {
    if (AcceptOp("]")) return MakeNode(NodeKind::LIST, line);
    NodePtr first = ParseNamedOrStar();
    if (IsComprehensionStart()) {
      auto comp = MakeNode(NodeKind::LIST_COMP, line);
      comp->Add(std::move(first));
      ParseComprehensions(*comp);
      ExpectOp("]");
      return comp;
    }
    auto list = MakeNode(NodeKind::LIST, line);
    list->Add(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp("]")) break;
      list->Add(ParseNamedOrStar());
    }
    ExpectOp("]");
    return list;
  }

  NodePtr ParseDictItem(Node& dict) {
    if (IsOp("**")) {
      auto star = MakeNode(NodeKind::STARRED, Next().line, "**");
      star->Add(ParseBitOr());
      return star;
    }
    NodePtr key = ParseTest();
    ExpectOp(":");
    dict.Add(std::move(key));
    return ParseTest();
  }

  NodePtr ParseBraceDisplay(int line) {
    if (AcceptOp("}")) return MakeNode(NodeKind::DICT, line);
    if (IsOp("**")) {
      auto dict = MakeNode(NodeKind::DICT, line);
      do {
        if (IsOp("}")) break;
        dict->Add(ParseDictItem(*dict));
      } while (AcceptOp(","));
      ExpectOp("}");
      return dict;
    }
    NodePtr first = ParseNamedOrStar();
    if (AcceptOp(":")) {
      NodePtr value = ParseTest();
      if (IsComprehensionStart()) {
        auto comp = MakeNode(NodeKind::DICT_COMP, line);
        comp->Add(std::move(first));
        comp->Add(std::move(value));
        ParseComprehensions(*comp);
        ExpectOp("}");
        return comp;
      }
      auto dict = MakeNode(NodeKind::DICT, line);
      dict->Add(std::move(first));
      dict->Add(std::move(value));
      while (AcceptOp(",")) {
        if (IsOp("}")) break;
        dict->Add(ParseDictItem(*dict));
      }
      ExpectOp("}");
      return dict;
    }
    if (IsComprehensionStart()) {
      auto comp = MakeNode(NodeKind::SET_COMP, line);
      comp->Add(std::move(first));
      ParseComprehensions(*comp);
      ExpectOp("}");
      return comp;
    }
    auto set = MakeNode(NodeKind::SET, line);
    set->Add(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp("}")) break;
      set->Add(ParseNamedOrStar());
    }
    ExpectOp("}");
    return set;
  }

  NodePtr ParseStrings() {
    int line = Peek().line;
    bool is_f = false, has_bytes = false, has_text = false;
    std::string text;
    std::vector<Token> parts;
    while (Peek().type == TokenType::STRING) {
      const Token& t = Next();
      bool bytes = t.prefix.find('b') != std::string::npos;
      (bytes ? has_bytes : has_text) = true;
      if (t.prefix.find('f') != std::string::npos) is_f = true;
      bool raw = t.prefix.find('r') != std::string::npos;
      // f-string bodies stay raw for ParseFStringBody
      text += raw || is_f ? t.text : DecodeEscapes(t.text, bytes);
      parts.push_back(t);
    }
    if (has_bytes && has_text) Fail("cannot mix bytes and nonbytes literals", line);
    if (!is_f) return MakeNode(NodeKind::STRING, line, text);
    auto node = MakeNode(NodeKind::FSTRING, line, text);
    for (auto& i : parts) {
      if (i.prefix.find('f') != std::string::npos) ParseFStringBody(i.text, i.line, *node);
    }
    return node;
  }
};

int CountLines(const std::string& str, size_t from, size_t to) {
  return std::count(str.begin() + from, str.begin() + to, '\n');
}

// start points just after the opening '{'; returns the index after the closing '}'
size_t ParseFStringField(const std::string& body, size_t start, int line, Node& out) {
  size_t n = body.size(), i = start, expr_end = std::string::npos;
  int depth = 0;
  char quote = 0;
  for (; i < n; i++) {
    char c = body[i];
    if (quote) {
      if (c == '\\') {
        i++;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '(' || c == '[' || c == '{') {
      depth++;
    } else if (c == ')' || c == ']' || c == '}') {
      if (depth == 0) break;
      depth--;
    } else if (depth == 0 && c == '!' && (i + 1 >= n || body[i + 1] != '=')) {
      break;
    } else if (depth == 0 && c == ':') {
      break;
    } else if (depth == 0 && c == '=' && i + 1 < n &&
               (body[i + 1] == '}' || body[i + 1] == '!' || body[i + 1] == ':') &&
               i > start && !std::strchr("=!<>", body[i - 1])) {
      // self-documenting "{expr=}"
      expr_end = i;
      continue;
    }
  }
  if (i >= n) throw ParseError(line + CountLines(body, start, n), "f-string: expecting '}'");
  if (expr_end == std::string::npos) expr_end = i;
  std::string expr = body.substr(start, expr_end - start);
  if (expr.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw ParseError(line, "f-string: empty expression not allowed");
  }
  out.Add(Parser(Tokenize(expr, line - 1, true)).ParseFieldExpression());
  if (body[i] == '!') {
    if (i + 1 >= n || !std::strchr("rsa", body[i + 1])) {
      throw ParseError(line, "f-string: invalid conversion character");
    }
    i += 2;
  }
  if (i < n && body[i] == ':') {
    size_t spec_start = ++i;
    int spec_depth = 0;
    for (; i < n; i++) {
      if (body[i] == '{') {
        spec_depth++;
      } else if (body[i] == '}') {
        if (spec_depth == 0) break;
        spec_depth--;
      }
    }
    if (i >= n) throw ParseError(line, "f-string: expecting '}'");
    ParseFStringBody(body.substr(spec_start, i - spec_start), line + CountLines(body, start, spec_start), out);
  }
  if (i >= n || body[i] != '}') throw ParseError(line, "f-string: expecting '}'");
  return i + 1;
}

void ParseFStringBody(const std::string& body, int line, Node& out) {
  size_t i = 0, n = body.size();
  while (i < n) {
    char c = body[i];
    if (c == '\n') {
      line++;
      i++;
    } else if (c == '{') {
      if (i + 1 < n && body[i + 1] == '{') {
        i += 2;
        continue;
      }
      size_t end = ParseFStringField(body, i + 1, line, out);
      line += CountLines(body, i, end);
      i = end;
    } else if (c == '}') {
      if (i + 1 < n && body[i + 1] == '}') {
        i += 2;
        continue;
      }
      throw ParseError(line, "f-string: single '}' is not allowed");
    } else {
      i++;
    }
  }
}

void AppendUtf8(std::string& out, unsigned long cp) {
  if (cp < 0x80) {
    out += (char)cp;
  } else if (cp < 0x800) {
    out += (char)(0xc0 | cp >> 6);
    out += (char)(0x80 | (cp & 0x3f));
  } else if (cp < 0x10000) {
    out += (char)(0xe0 | cp >> 12);
    out += (char)(0x80 | (cp >> 6 & 0x3f));
    out += (char)(0x80 | (cp & 0x3f));
  } else {
    out += (char)(0xf0 | cp >> 18);
    out += (char)(0x80 | (cp >> 12 & 0x3f));
    out += (char)(0x80 | (cp >> 6 & 0x3f));
    out += (char)(0x80 | (cp & 0x3f));
  }
}

// backslash escapes of a non-raw literal; \N{...} and unknown escapes are kept verbatim
std::string DecodeEscapes(const std::string& body, bool bytes) {
  std::string ret;
  size_t n = body.size();
  for (size_t i = 0; i < n; i++) {
    if (body[i] != '\\' || i + 1 == n) {
      ret += body[i];
      continue;
    }
    static const char kEscapes[] = "\\'\"abfnrtv";
    static const char kDecoded[] = "\\'\"\a\b\f\n\r\t\v";
    char c = body[i + 1];
    const char* simple = c ? std::strchr(kEscapes, c) : nullptr;
    if (c == '\n') {
      i++;
    } else if (simple) {
      ret += kDecoded[simple - kEscapes];
      i++;
    } else if (c >= '0' && c <= '7') {
      unsigned long cp = 0;
      size_t j = i + 1;
      for (; j < n && j < i + 4 && body[j] >= '0' && body[j] <= '7'; j++) cp = cp * 8 + (body[j] - '0');
      if (bytes) {
        ret += (char)(cp & 0xff);
      } else {
        AppendUtf8(ret, cp);
      }
      i = j - 1;
    } else if (c == 'x' || (!bytes && (c == 'u' || c == 'U'))) {
      size_t len = c == 'x' ? 2 : c == 'u' ? 4 : 8;
      if (i + 2 + len > n ||
          !std::all_of(body.begin() + i + 2, body.begin() + i + 2 + len, [](char h) {
            return std::isxdigit((unsigned char)h);
          })) {
        ret += body[i];
        continue;
      }
      unsigned long cp = std::stoul(body.substr(i + 2, len), nullptr, 16);
      if (bytes) {
        ret += (char)cp;
      } else if (cp > 0x10ffff) {
        ret += body[i];
        continue;
      } else {
        AppendUtf8(ret, cp);
      }
      i += 1 + len;
    } else {
      ret += body[i];
    }
  }
  return ret;
}

} // namespace

NodePtr Parse(const std::string& source) {
  return Parser(Tokenize(source)).ParseModule();
}
