#include <functional>
#include <gtest/gtest.h>

#include "codebox/parser.h"

namespace {

void CollectNames(const Node& node, std::vector<std::pair<std::string, int>>& out) {
  if (node.kind == NodeKind::NAME) out.emplace_back(node.text, node.line);
  for (auto& i : node.children) CollectNames(*i, out);
}

std::vector<std::pair<std::string, int>> Names(const std::string& source) {
  std::vector<std::pair<std::string, int>> ret;
  CollectNames(*Parse(source), ret);
  return ret;
}

const Node* FindKind(const Node& node, NodeKind kind) {
  if (node.kind == kind) return &node;
  for (auto& i : node.children) {
    if (auto ret = FindKind(*i, kind)) return ret;
  }
  return nullptr;
}

int ErrorLine(const std::string& source) {
  try {
    Parse(source);
  } catch (const ParseError& err) {
    return err.line;
  }
  return 0;
}

struct DumpParam {
  std::string name;
  std::string source;
  std::string tree;
};

std::string ParamName(const ::testing::TestParamInfo<DumpParam>& info) {
  return info.param.name;
}

} // namespace

class ParserDump : public testing::TestWithParam<DumpParam> {};
TEST_P(ParserDump, Tree) {
  auto& param = GetParam();
  EXPECT_EQ(DumpTree(*Parse(param.source)), param.tree);
}
INSTANTIATE_TEST_SUITE_P(Expressions, ParserDump,
    testing::Values(
      (DumpParam){"chained_assign", "x = y = 1",
                  "(MODULE (ASSIGN (NAME x :store) (NAME y :store) (CONSTANT 1)))"},
      (DumpParam){"call", "a.b(c, k=1)",
                  "(MODULE (EXPR_STMT (CALL (ATTRIBUTE b (NAME a)) (NAME c) (KEYWORD k (CONSTANT 1)))))"},
      (DumpParam){"compare_chain", "1 < x <= 2",
                  "(MODULE (EXPR_STMT (COMPARE <,<= (CONSTANT 1) (NAME x) (CONSTANT 2))))"},
      (DumpParam){"power_binds_tighter", "-a ** 2",
                  "(MODULE (EXPR_STMT (UNARYOP - (BINOP ** (NAME a) (CONSTANT 2)))))"},
      (DumpParam){"precedence", "a + b * c",
                  "(MODULE (EXPR_STMT (BINOP + (NAME a) (BINOP * (NAME b) (NAME c)))))"},
      (DumpParam){"aug_assign", "n += 1",
                  "(MODULE (AUG_ASSIGN += (NAME n :store) (CONSTANT 1)))"}
    ),
    ParamName);

TEST(Parser, LineNumbers) {
  auto names = Names("a = 1\n\nif a:\n    b = (a +\n         c)\n");
  std::vector<std::pair<std::string, int>> expect = {{"a", 1}, {"a", 3}, {"b", 4}, {"a", 4}, {"c", 5}};
  EXPECT_EQ(names, expect);
}

TEST(Parser, FStringExpressions) {
  auto names = Names("s = f'{a + b!r:>{width}} {{literal}}'");
  std::vector<std::pair<std::string, int>> expect = {{"s", 1}, {"a", 1}, {"b", 1}, {"width", 1}};
  EXPECT_EQ(names, expect);

  auto nested = Names("x = 1\ny = f'''\n{z}''' + f\"{d['k']}\"");
  std::vector<std::pair<std::string, int>> expect2 = {{"x", 1}, {"y", 2}, {"z", 3}, {"d", 2}};
  EXPECT_EQ(nested, expect2);

  auto self_doc = Names("f'{value=}'");
  ASSERT_EQ(self_doc.size(), 1u);
  EXPECT_EQ(self_doc[0].first, "value");
}

TEST(Parser, FStringErrors) {
  EXPECT_THROW(Parse("f'{}'"), ParseError);
  EXPECT_THROW(Parse("f'{a'"), ParseError);
  EXPECT_THROW(Parse("f'a}'"), ParseError);
  EXPECT_THROW(Parse("f'{a!x}'"), ParseError);
  EXPECT_NO_THROW(Parse("f'{a!r}' f'{{}}'"));
}

TEST(Parser, StringEscapesDecoded) {
  auto Text = [](const std::string& source) {
    auto mod = Parse(source);
    const Node* str = FindKind(*mod, NodeKind::STRING);
    return str ? str->text : std::string("(none)");
  };
  EXPECT_EQ(Text(R"(s = '{0\x2e__class__}')"), "{0.__class__}");
  EXPECT_EQ(Text(R"(s = '\u002e\U0000005b\056')"), ".[.");
  EXPECT_EQ(Text(R"(s = 'a\tb\\n\'')"), "a\tb\\n'");
  EXPECT_EQ(Text(R"(s = '\u00e9')"), "\xc3\xa9");
  EXPECT_EQ(Text(R"(s = '\N{FULL STOP}\q')"), R"(\N{FULL STOP}\q)");
  EXPECT_EQ(Text(R"(s = r'\x2e')"), R"(\x2e)");
  EXPECT_EQ(Text(R"(s = b'\x2e\u002e')"), R"(.\u002e)");
  EXPECT_EQ(Text("s = 'a\\\nb'"), "ab");
  EXPECT_EQ(Text(R"(s = '\x2' '\x2e')"), R"(\x2.)");
}

TEST(Parser, StoreContexts) {
  auto mod = Parse("for i, (j, *k) in x:\n    pass\n");
  const Node* loop = FindKind(*mod, NodeKind::FOR);
  ASSERT_NE(loop, nullptr);
  std::vector<std::pair<std::string, int>> names;
  CollectNames(*loop->children[0], names);
  ASSERT_EQ(names.size(), 3u);
  std::function<void(const Node&)> check = [&](const Node& node) {
    if (node.kind == NodeKind::NAME) EXPECT_EQ(node.ctx, NameContext::STORE) << node.text;
    for (auto& i : node.children) check(*i);
  };
  check(*loop->children[0]);
  EXPECT_EQ(loop->children[1]->ctx, NameContext::LOAD);
}

TEST(Parser, AsyncIsMarked) {
  auto mod = Parse("async def f():\n    await g()\n");
  const Node* def = FindKind(*mod, NodeKind::FUNCTION_DEF);
  ASSERT_NE(def, nullptr);
  EXPECT_TRUE(def->is_async);
  EXPECT_NE(FindKind(*mod, NodeKind::AWAIT), nullptr);
}

TEST(Parser, Imports) {
  auto mod = Parse("import os.path as p, sys\nfrom ..pkg import (a as b, c,)\n");
  ASSERT_EQ(mod->children.size(), 2u);
  const Node& imp = *mod->children[0];
  EXPECT_EQ(imp.kind, NodeKind::IMPORT);
  ASSERT_EQ(imp.children.size(), 2u);
  EXPECT_EQ(imp.children[0]->text, "os.path");
  ASSERT_NE(imp.children[0]->Find(NodeKind::IDENTIFIER), nullptr);
  EXPECT_EQ(imp.children[0]->Find(NodeKind::IDENTIFIER)->text, "p");
  const Node& from = *mod->children[1];
  EXPECT_EQ(from.kind, NodeKind::IMPORT_FROM);
  EXPECT_EQ(from.text, "..pkg");
  EXPECT_EQ(from.children.size(), 2u);
}

TEST(Parser, AnalysisProgram) {
  const char* source = R"(
total: int = 0
rows = [r for r in data if r["x"] > 0]
lookup = {k: v for k, v in pairs}
uniq = {x for x in rows}

@decorate(1)
def summarize(frame, /, scale=1.0, *args, key=None, **kwargs) -> dict:
    """docstring"""
    global total
    result = {}
    for name, group in frame.groupby("key"):
        if (n := len(group)) > 10:
            result[name] = n * scale
        elif n == 0:
            continue
        else:
            break
    else:
        pass
    while False:
        pass
    return result

class Stats(Base, metaclass=Meta):
    count = 0
    def add(self, value):
        self.count += 1
        return self

try:
    value = values[1:-1, ::2]
except (KeyError, IndexError) as err:
    raise ValueError("bad") from err
except Exception:
    value = None
else:
    value = value or 0
finally:
    del tmp

with manager() as m, other():
    pass

def gen():
    x = yield
    yield from range(3)

def outer():
    count = 0
    def inner():
        nonlocal count
        count += 1
    return inner

square = lambda x, *rest, **kw: x * x if x else -x
assert total >= 0, "negative"
print(*rows, sep="", **opts)
matrix @ other
a, *b = 1, 2, 3
x = not a and b or c is not None and d not in e
t = (1,)
empty = ()
s = {1, 2}
n = ~1 << 2 | 3 ^ 4 & 5 >> 1
)";
  EXPECT_NO_THROW(Parse(source));
}

TEST(Parser, Errors) {
  EXPECT_THROW(Parse("x = = 1"), ParseError);
  EXPECT_THROW(Parse("def f(:\n    pass\n"), ParseError);
  EXPECT_THROW(Parse("1 = x"), ParseError);
  EXPECT_THROW(Parse("(a, b) += 1"), ParseError);
  EXPECT_THROW(Parse("if x\n    pass\n"), ParseError);
  EXPECT_THROW(Parse("if x:\npass\n"), ParseError);
  EXPECT_THROW(Parse("  x = 1\n"), ParseError);
  EXPECT_THROW(Parse("b'a' 'b'"), ParseError);
  EXPECT_EQ(ErrorLine("a = 1\nb = 2 +\n"), 2);
  EXPECT_EQ(ErrorLine("a = 1\n\n\nc = )\n"), 4);
}
