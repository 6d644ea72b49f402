#ifndef CODEBOX_AST_H_
#define CODEBOX_AST_H_

#include <memory>
#include <string>
#include <vector>

// Child layout per kind (optional children are omitted, never null):
//   MODULE, BLOCK: statements; BLOCK.text is "", "else" or "finally"
//   ASSIGN: targets..., value          AUG_ASSIGN(text=op): target, value
//   ANN_ASSIGN: target, ANNOTATION, value?
//   IF, WHILE: test, BLOCK, BLOCK(else)?   FOR: target, iter, BLOCK, BLOCK(else)?
//   TRY: BLOCK, HANDLER..., BLOCK(else)?, BLOCK(finally)?
//   HANDLER(text=bound name or ""): type?, BLOCK
//   WITH: WITH_ITEM..., BLOCK          WITH_ITEM: context, target?
//   FUNCTION_DEF(text=name): DECORATORS?, ARGUMENTS, RETURNS?, BLOCK
//   CLASS_DEF(text=name): DECORATORS?, bases and KEYWORDs..., BLOCK
//   ARGUMENTS: PARAM...                PARAM(text=name): ANNOTATION?, DEFAULT?
//   IMPORT: ALIAS...  IMPORT_FROM(text=module): ALIAS...  ALIAS(text=name): IDENTIFIER(asname)?
//   GLOBAL, NONLOCAL: IDENTIFIER...
//   LAMBDA: ARGUMENTS, body            CALL: func, args (exprs, STARRED, KEYWORD)...
//   KEYWORD(text=name, "" for **): value
//   ATTRIBUTE(text=attr): value        SUBSCRIPT: value, index
//   STRING(text=concatenated bodies)   FSTRING: embedded expressions...
//   *_COMP, GENERATOR_EXP: element(s), COMPREHENSION...
//   COMPREHENSION: target, iter, conditions...
//   NAMED_EXPR: NAME(store), value
#define ENUM_NODE_KIND_ \
  X(MODULE) \
  X(BLOCK) \
  X(EXPR_STMT) \
  X(ASSIGN) \
  X(AUG_ASSIGN) \
  X(ANN_ASSIGN) \
  X(DELETE) \
  X(PASS) \
  X(BREAK) \
  X(CONTINUE) \
  X(RETURN) \
  X(RAISE) \
  X(GLOBAL) \
  X(NONLOCAL) \
  X(ASSERT) \
  X(IMPORT) \
  X(IMPORT_FROM) \
  X(ALIAS) \
  X(IF) \
  X(WHILE) \
  X(FOR) \
  X(TRY) \
  X(HANDLER) \
  X(WITH) \
  X(WITH_ITEM) \
  X(FUNCTION_DEF) \
  X(CLASS_DEF) \
  X(DECORATORS) \
  X(ARGUMENTS) \
  X(PARAM) \
  X(ANNOTATION) \
  X(DEFAULT) \
  X(RETURNS) \
  X(IDENTIFIER) \
  X(NAME) \
  X(CONSTANT) \
  X(STRING) \
  X(FSTRING) \
  X(ATTRIBUTE) \
  X(SUBSCRIPT) \
  X(SLICE) \
  X(CALL) \
  X(KEYWORD) \
  X(STARRED) \
  X(BINOP) \
  X(UNARYOP) \
  X(BOOLOP) \
  X(COMPARE) \
  X(IF_EXP) \
  X(NAMED_EXPR) \
  X(LAMBDA) \
  X(TUPLE) \
  X(LIST) \
  X(SET) \
  X(DICT) \
  X(LIST_COMP) \
  X(SET_COMP) \
  X(DICT_COMP) \
  X(GENERATOR_EXP) \
  X(COMPREHENSION) \
  X(YIELD) \
  X(YIELD_FROM) \
  X(AWAIT)
enum class NodeKind {
#define X(name) name,
  ENUM_NODE_KIND_
#undef X
};

enum class NameContext {
  LOAD,
  STORE,
  DEL,
};

struct Node;
using NodePtr = std::unique_ptr<Node>;

struct Node {
  NodeKind kind;
  int line;
  std::string text;
  NameContext ctx;
  bool is_async;
  std::vector<NodePtr> children;

  Node(NodeKind kind, int line, std::string text = "") :
      kind(kind), line(line), text(std::move(text)), ctx(NameContext::LOAD), is_async(false) {}

  Node* Add(NodePtr child) {
    children.push_back(std::move(child));
    return children.back().get();
  }
  // first child of the given kind, or nullptr
  const Node* Find(NodeKind) const;
};

inline NodePtr MakeNode(NodeKind kind, int line, std::string text = "") {
  return std::make_unique<Node>(kind, line, std::move(text));
}

const char* NodeKindName(NodeKind);

// Sets ctx on a target expression and all nested tuple/list/starred elements.
// Returns false if the expression cannot be assigned to.
bool SetContext(Node&, NameContext);

class NodeVisitor {
 public:
  virtual ~NodeVisitor() = default;
  virtual void Visit(const Node& node) { GenericVisit(node); }
  void GenericVisit(const Node& node) {
    for (auto& i : node.children) Visit(*i);
  }
};

// S-expression dump, for tests and debug logging
std::string DumpTree(const Node&);

#endif  // CODEBOX_AST_H_
