#include <gtest/gtest.h>
#include <codebox/utils.h>
#include <codebox/validator.h>

#include "utils.h"

namespace {

struct RejectParam {
  std::string name;
  std::string source;
  ViolationRule rule;
  int line;
};

std::string ParamName(const ::testing::TestParamInfo<RejectParam>& info) {
  return info.param.name;
}

struct AcceptParam {
  std::string name;
  std::string source;
};

std::string AcceptName(const ::testing::TestParamInfo<AcceptParam>& info) {
  return info.param.name;
}

std::string Describe(const ValidationVerdict& verdict) {
  std::string ret;
  for (auto& i : verdict.violations) {
    ret += std::to_string(i.line) + " [" + ViolationRuleName(i.rule) + "] " + i.message + "\n";
  }
  return ret;
}

} // namespace

class ValidatorReject : public testing::TestWithParam<RejectParam> {};
TEST_P(ValidatorReject, Rule) {
  auto& param = GetParam();
  ValidationVerdict verdict = Validate(param.source);
  EXPECT_FALSE(verdict.accepted);
  EXPECT_TRUE(HasViolation(verdict, param.rule, param.line)) << Describe(verdict);
}
INSTANTIATE_TEST_SUITE_P(Rules, ValidatorReject,
    testing::Values(
      (RejectParam){"import", "x = 1\nimport os", ViolationRule::IMPORT, 2},
      (RejectParam){"import_from", "from numpy import load", ViolationRule::IMPORT, 1},
      (RejectParam){"eval", "x = eval('1')", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"getattr", "f = getattr(print, 'x')", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"private_attribute", "t = ().__class__.__bases__", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"single_underscore", "n = pd._libs", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"dunder_name", "x = __builtins__", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"dunder_function", "def __init__():\n    pass", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"frame", "def g():\n    yield 1\nf = g().gi_frame", ViolationRule::DYNAMIC_EVAL, 3},
      (RejectParam){"query", "q = pd.DataFrame().query('a > 1')", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"format_traversal", "s = '{0.real}'.format(1)", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"format_hex_escape", "x = '{0\\x2e__class__}'.format(print)", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"format_unicode_escape", "x = '{0\\u002e__class__}'.format(print)",
                    ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"format_named_escape", "x = '{0\\N{FULL STOP}__class__}'.format(print)",
                    ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"format_index_escape", "x = '{0\\x5b0]}'.format([1])", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"format_octal_escape", "x = '{0\\056real}'.format(1)", ViolationRule::DYNAMIC_EVAL, 1},
      (RejectParam){"format_on_variable", "t = '{}'\ns = t.format(1)", ViolationRule::DYNAMIC_EVAL, 2},
      (RejectParam){"open", "f = open('x')", ViolationRule::FILESYSTEM_PROCESS, 1},
      (RejectParam){"sys", "v = sys", ViolationRule::FILESYSTEM_PROCESS, 1},
      (RejectParam){"read_csv", "df = pd.read_csv('x.csv')", ViolationRule::FILESYSTEM_PROCESS, 1},
      (RejectParam){"tofile", "a = np.array([1])\na.tofile('x')", ViolationRule::FILESYSTEM_PROCESS, 2},
      (RejectParam){"writer_with_path", "df = pd.DataFrame()\ndf.to_csv('out.csv')",
                    ViolationRule::FILESYSTEM_PROCESS, 2},
      (RejectParam){"writer_with_path_keyword", "df = pd.DataFrame()\ndf.to_json(path_or_buf='o.json')",
                    ViolationRule::FILESYSTEM_PROCESS, 2},
      (RejectParam){"writer_reference", "w = pd.DataFrame().to_csv", ViolationRule::FILESYSTEM_PROCESS, 1},
      (RejectParam){"agg_writer", "df = pd.DataFrame()\ndf.agg('to_pickle', '/workdir/x')",
                    ViolationRule::UNSAFE_DESERIALIZATION, 2},
      (RejectParam){"apply_eval", "df = pd.DataFrame()\ndf.apply('eval', expr='a + 1')", ViolationRule::DYNAMIC_EVAL, 2},
      (RejectParam){"transform_query", "df = pd.DataFrame()\ndf.transform('query', 'a > 0')",
                    ViolationRule::DYNAMIC_EVAL, 2},
      (RejectParam){"agg_list_writer", "df = pd.DataFrame()\ndf.groupby('a').agg(['sum', 'to_csv'])",
                    ViolationRule::FILESYSTEM_PROCESS, 2},
      (RejectParam){"agg_dict_private", "df = pd.DataFrame()\ndf.agg({'a': '__reduce__'})",
                    ViolationRule::DYNAMIC_EVAL, 2},
      (RejectParam){"agg_named_tuple", "df = pd.DataFrame()\ndf.groupby('a').agg(x=('b', 'to_json'))",
                    ViolationRule::FILESYSTEM_PROCESS, 2},
      (RejectParam){"agg_computed_name", "df = pd.DataFrame()\ndf.agg('to_' + 'pickle', 'p')",
                    ViolationRule::DYNAMIC_EVAL, 2},
      (RejectParam){"agg_escaped_name", "df = pd.DataFrame()\ndf.agg('to\\x5fpickle', 'p')",
                    ViolationRule::UNSAFE_DESERIALIZATION, 2},
      (RejectParam){"ndarray_dump", "a = np.zeros(3)\na.dump('/workdir/p')", ViolationRule::UNSAFE_DESERIALIZATION, 2},
      (RejectParam){"pickle", "p = pickle", ViolationRule::UNSAFE_DESERIALIZATION, 1},
      (RejectParam){"np_load", "a = np.load('x.npy')", ViolationRule::UNSAFE_DESERIALIZATION, 1},
      (RejectParam){"read_pickle", "d = pd.read_pickle('x')", ViolationRule::UNSAFE_DESERIALIZATION, 1},
      (RejectParam){"unknown_name", "print(undefined_name)", ViolationRule::UNKNOWN_NAME, 1},
      (RejectParam){"restricted_member", "m = np.fft.fft([1])", ViolationRule::RESTRICTED_MEMBER, 1},
      (RejectParam){"restricted_nested", "m = np.linalg.cholesky([[1]])", ViolationRule::RESTRICTED_MEMBER, 1},
      (RejectParam){"restricted_sql", "d = pd.read_sql('q', None)", ViolationRule::RESTRICTED_MEMBER, 1},
      (RejectParam){"async_def", "async def f():\n    pass", ViolationRule::UNSUPPORTED, 1},
      (RejectParam){"await", "def f():\n    return 1\n\nx = [await f()]", ViolationRule::UNSUPPORTED, 4},
      (RejectParam){"class_scope", "class A:\n    y = 1\n    def m(self):\n        return y",
                    ViolationRule::UNKNOWN_NAME, 4},
      (RejectParam){"comprehension_scope", "vals = [i for i in range(3)]\nprint(i)",
                    ViolationRule::UNKNOWN_NAME, 2},
      (RejectParam){"fstring_field", "s = f'{open(1)}'", ViolationRule::FILESYSTEM_PROCESS, 1}
    ),
    ParamName);

class ValidatorAccept : public testing::TestWithParam<AcceptParam> {};
TEST_P(ValidatorAccept, Accepted) {
  ValidationVerdict verdict = Validate(GetParam().source);
  EXPECT_TRUE(verdict.accepted) << Describe(verdict);
  EXPECT_TRUE(verdict.violations.empty());
}
INSTANTIATE_TEST_SUITE_P(Programs, ValidatorAccept,
    testing::Values(
      (AcceptParam){"analysis", R"(df = pd.DataFrame({"a": [1, 2, 3]})
total = int(df["a"].sum())
norm = np.linalg.norm(np.array([3, 4]))
print(f"total={total} norm={norm:.2f}")
counts = Counter(x % 2 for x in range(10))
total
)"},
      (AcceptParam){"functions_and_classes", R"(def f(a, b=2):
    c = a + b
    return [c * i for i in range(3)]

class K:
    x = 1
    def m(self):
        return self.x

g = lambda v: v + 1
if (n := 5) > 3:
    print(n)
result = f(1), K().m(), g(2)
)"},
      (AcceptParam){"special_methods", R"(class P:
    def __init__(self, v):
        self.v = v
    def __repr__(self):
        return "P(%d)" % self.v
p = P(1)
)"},
      (AcceptParam){"pathless_writer", "df = pd.DataFrame()\ntext = df.to_csv(index=False)\n"},
      (AcceptParam){"literal_format", "s = '{} {name:>4}'.format(1, name=2)"},
      (AcceptParam){"escaped_format", "s = '{0}\\t{1!r}\\x41 {{x.y}}'.format(1, 2)"},
      (AcceptParam){"agg_by_name", R"(df = pd.DataFrame({"a": [1, 2], "b": [3, 4]})
s = df.groupby("a").agg(["sum", "mean"])
t = df.agg({"b": "max"})
u = df["b"].map({3: "x", 4: "y"}).apply(len)
)"},
      (AcceptParam){"helpers", R"(try:
    data = fetch_data("in.csv")
except ArtifactIOError as err:
    data = None
    print(err)
upload_result("out.json", {"rows": 0})
)"},
      (AcceptParam){"main_guard", "if __name__ == \"__main__\":\n    print(context.get(\"k\"))\n"},
      (AcceptParam){"walrus_in_comprehension", "vals = [y := v for v in range(2)]\nprint(y)\n"},
      (AcceptParam){"global", "def f():\n    global counter\n    counter = 1\nf()\nprint(counter)\n"},
      (AcceptParam){"closure", R"(def outer():
    count = 0
    def inner():
        nonlocal count
        count += 1
        return count
    return inner
outer()()
)"},
      (AcceptParam){"library_handles", R"(m = math.sqrt(2) + statistics.mean([1, 2])
d = datetime.timedelta(days=1)
r = re.sub(r"\s+", " ", "a  b")
j = json.dumps(collections.Counter("aab"))
p = list(itertools.permutations([1, 2]))
rng = np.random.default_rng(0)
s = scipy_stats.norm
)"},
      (AcceptParam){"attribute_on_bound_name", "np = None\nx = np.anything\n"}
    ),
    AcceptName);

TEST(Validator, SyntaxError) {
  ValidationVerdict verdict = Validate("x = 1\n\n\ny = (\n");
  EXPECT_FALSE(verdict.accepted);
  ASSERT_TRUE(verdict.IsSyntaxError());
  EXPECT_EQ(verdict.violations[0].line, 4);
}

TEST(Validator, NonAsciiIdentifierIsSyntaxError) {
  ValidationVerdict verdict = Validate("\xef\xbd\x85val('1')");
  EXPECT_FALSE(verdict.accepted);
  EXPECT_TRUE(verdict.IsSyntaxError());
}

TEST(Validator, ImportDoesNotCascade) {
  ValidationVerdict verdict = Validate("import numpy as numeric\nx = numeric.zeros(3)\n");
  std::vector<std::string> expect = {"import"};
  EXPECT_EQ(RuleNames(verdict), expect);
}

TEST(Validator, OrderAndDedupe) {
  ValidationVerdict verdict = Validate("x = eval('1') + eval('2')\nimport os\nopen(exec)\n");
  std::vector<std::string> expect = {"dynamic-eval", "import", "dynamic-eval", "filesystem-process"};
  EXPECT_EQ(RuleNames(verdict), expect) << Describe(verdict);
  std::vector<int> lines;
  for (auto& i : verdict.violations) lines.push_back(i.line);
  EXPECT_EQ(lines, (std::vector<int>{1, 2, 3, 3}));
}

TEST(Validator, EveryViolationReported) {
  ValidationVerdict verdict = Validate("a = undefined1\nb = undefined2\nc = os\n");
  EXPECT_EQ(verdict.violations.size(), 3u);
}

TEST(Validator, Deterministic) {
  const std::string source = "import os\nprint(eval('1'))\n";
  ValidationVerdict first = Validate(source), second = Validate(source);
  EXPECT_EQ(RuleNames(first), RuleNames(second));
  ASSERT_EQ(first.violations.size(), second.violations.size());
  for (size_t i = 0; i < first.violations.size(); i++) {
    EXPECT_EQ(first.violations[i].line, second.violations[i].line);
    EXPECT_EQ(first.violations[i].message, second.violations[i].message);
  }
}

TEST(Validator, EmptySource) {
  EXPECT_TRUE(Validate("").accepted);
  EXPECT_TRUE(Validate("# nothing\n\n").accepted);
}
