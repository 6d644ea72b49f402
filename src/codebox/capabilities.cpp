#include <codebox/namespace.h>

#include <unordered_map>

const char kCapabilityVersion[] = "2026.10";
const char kInputLocatorKey[] = "input_locator";
const char kOutputLocatorKey[] = "output_locator";

namespace {

using K = CapabilityKind;

std::vector<Capability> MakeTable() {
  std::vector<Capability> ret;
  auto Builtin = [&](std::initializer_list<const char*> names) {
    for (const char* name : names) ret.push_back({name, K::BUILTIN, "builtins:" + std::string(name), {}, false});
  };
  auto Library = [&](const char* name, const char* module, std::vector<std::string>&& members,
                     bool optional = false) {
    ret.push_back({name, K::LIBRARY, module, std::move(members), optional});
  };
  auto Constructor = [&](const char* name, const char* target) {
    ret.push_back({name, K::CONSTRUCTOR, target, {}, false});
  };

  // numeric
  Builtin({"abs", "bin", "bool", "complex", "divmod", "float", "hex", "int", "oct", "pow", "round"});
  // iteration
  Builtin({"all", "any", "enumerate", "filter", "iter", "len", "map", "max", "min", "next",
           "range", "reversed", "sorted", "sum", "zip"});
  // type constructors and checks
  Builtin({"bytes", "dict", "frozenset", "list", "object", "set", "slice", "str", "tuple",
           "callable", "isinstance", "issubclass", "type"});
  Builtin({"ascii", "chr", "format", "hash", "id", "ord", "repr", "print"});
  Builtin({"Exception", "BaseException", "ValueError", "TypeError", "KeyError", "IndexError",
           "AttributeError", "RuntimeError", "ZeroDivisionError", "StopIteration",
           "FileNotFoundError", "ImportError", "ModuleNotFoundError", "NameError",
           "OverflowError", "RecursionError", "NotImplementedError", "AssertionError",
           "ArithmeticError", "LookupError", "UnicodeError"});

  Library("np", "numpy", {
    "array", "asarray", "arange", "linspace", "logspace", "zeros", "ones", "empty", "full",
    "zeros_like", "ones_like", "full_like", "eye", "identity", "meshgrid",
    "concatenate", "stack", "vstack", "hstack", "column_stack", "split", "array_split",
    "reshape", "ravel", "transpose", "squeeze", "expand_dims", "tile", "repeat", "roll", "flip",
    "where", "select", "clip", "unique", "sort", "argsort", "argmax", "argmin", "searchsorted",
    "nonzero", "argwhere", "count_nonzero", "isin",
    "sum", "prod", "mean", "average", "median", "std", "var", "min", "max", "ptp",
    "percentile", "quantile", "cumsum", "cumprod", "diff", "gradient",
    "nansum", "nanmean", "nanmedian", "nanstd", "nanvar", "nanmin", "nanmax", "nanpercentile",
    "abs", "absolute", "sqrt", "square", "exp", "log", "log10", "log2", "log1p", "expm1",
    "power", "round", "around", "floor", "ceil", "trunc", "sign", "mod", "fmod",
    "sin", "cos", "tan", "arcsin", "arccos", "arctan", "arctan2", "sinh", "cosh", "tanh",
    "deg2rad", "rad2deg", "hypot",
    "maximum", "minimum", "isnan", "isinf", "isfinite", "isclose", "allclose", "array_equal",
    "all", "any", "logical_and", "logical_or", "logical_not", "logical_xor",
    "dot", "matmul", "outer", "inner", "cross", "corrcoef", "cov", "correlate", "convolve",
    "histogram", "histogram2d", "bincount", "digitize", "interp", "polyfit", "polyval",
    "nan", "inf", "pi", "e", "newaxis", "ndarray", "dtype",
    "int8", "int16", "int32", "int64", "uint8", "uint16", "uint32", "uint64",
    "float16", "float32", "float64", "bool_", "str_", "object_", "datetime64", "timedelta64",
    "linalg.norm", "linalg.inv", "linalg.pinv", "linalg.det", "linalg.eig", "linalg.eigh",
    "linalg.solve", "linalg.lstsq", "linalg.svd", "linalg.matrix_rank", "linalg.qr",
    "random.default_rng", "random.seed", "random.rand", "random.randn", "random.randint",
    "random.random", "random.normal", "random.uniform", "random.choice", "random.shuffle",
    "random.permutation", "random.binomial", "random.poisson", "random.exponential",
  });
  Library("pd", "pandas", {
    "DataFrame", "Series", "Index", "MultiIndex", "RangeIndex", "DatetimeIndex", "IntervalIndex",
    "Categorical", "CategoricalDtype", "Timestamp", "Timedelta", "Period", "Interval",
    "DateOffset", "NaT", "NA", "Grouper", "NamedAgg",
    "concat", "merge", "merge_asof", "merge_ordered", "pivot", "pivot_table", "crosstab",
    "melt", "wide_to_long", "cut", "qcut", "get_dummies", "factorize", "unique",
    "to_datetime", "to_numeric", "to_timedelta", "date_range", "period_range",
    "timedelta_range", "interval_range", "bdate_range", "infer_freq",
    "isna", "isnull", "notna", "notnull",
    "api.types.is_numeric_dtype", "api.types.is_string_dtype", "api.types.is_bool_dtype",
    "api.types.is_datetime64_any_dtype",
    "api.types.is_integer_dtype", "api.types.is_float_dtype", "api.types.is_object_dtype",
  });
  Library("math", "math", {
    "ceil", "floor", "trunc", "sqrt", "isqrt", "exp", "expm1", "log", "log10", "log2", "log1p",
    "pow", "fabs", "fsum", "prod", "fmod", "modf", "frexp", "ldexp", "copysign", "remainder",
    "isclose", "isfinite", "isinf", "isnan", "factorial", "comb", "perm", "gcd", "lcm",
    "sin", "cos", "tan", "asin", "acos", "atan", "atan2", "sinh", "cosh", "tanh",
    "asinh", "acosh", "atanh", "hypot", "dist", "degrees", "radians",
    "erf", "erfc", "gamma", "lgamma", "pi", "e", "tau", "inf", "nan",
  });
  Library("statistics", "statistics", {
    "mean", "fmean", "geometric_mean", "harmonic_mean", "median", "median_low", "median_high",
    "median_grouped", "mode", "multimode", "quantiles", "stdev", "pstdev", "variance",
    "pvariance", "correlation", "covariance", "linear_regression", "NormalDist",
    "StatisticsError",
  });
  Library("json", "json", {"dumps", "loads", "JSONDecodeError"});
  Library("re", "re", {
    "match", "search", "fullmatch", "findall", "finditer", "sub", "subn", "split", "escape",
    "compile", "error", "IGNORECASE", "I", "MULTILINE", "M", "DOTALL", "S", "VERBOSE", "X",
    "ASCII", "A",
  });
  Library("datetime", "datetime", {
    "datetime", "date", "time", "timedelta", "timezone", "MINYEAR", "MAXYEAR",
  });
  Library("collections", "collections", {
    "Counter", "defaultdict", "OrderedDict", "deque", "namedtuple", "ChainMap",
  });
  Library("itertools", "itertools", {
    "accumulate", "chain", "combinations", "combinations_with_replacement", "compress",
    "count", "cycle", "dropwhile", "filterfalse", "groupby", "islice", "pairwise",
    "permutations", "product", "repeat", "starmap", "takewhile", "tee", "zip_longest",
  });
  Library("functools", "functools", {
    "reduce", "partial", "lru_cache", "cache", "cmp_to_key", "total_ordering", "wraps",
  });
  Library("random", "random", {
    "random", "randint", "randrange", "choice", "choices", "sample", "shuffle", "uniform",
    "gauss", "normalvariate", "expovariate", "betavariate", "triangular", "seed", "Random",
  });
  Library("string", "string", {
    "ascii_letters", "ascii_lowercase", "ascii_uppercase", "digits", "hexdigits",
    "octdigits", "punctuation", "whitespace", "printable", "capwords",
  });
  Library("copy", "copy", {"copy", "deepcopy"});
  Library("scipy_stats", "scipy.stats", {
    "ttest_ind", "ttest_rel", "ttest_1samp", "pearsonr", "spearmanr", "kendalltau",
    "chi2_contingency", "chisquare", "mannwhitneyu", "wilcoxon", "kruskal", "f_oneway",
    "shapiro", "normaltest", "ks_2samp", "kstest", "linregress", "zscore", "describe",
    "sem", "iqr", "skew", "kurtosis", "mode", "percentileofscore", "entropy",
    "norm", "t", "chi2", "f", "binom", "poisson", "expon", "uniform",
  }, true);

  Constructor("Counter", "collections:Counter");
  Constructor("defaultdict", "collections:defaultdict");
  Constructor("OrderedDict", "collections:OrderedDict");
  Constructor("deque", "collections:deque");
  Constructor("date", "datetime:date");
  Constructor("timedelta", "datetime:timedelta");
  Constructor("Decimal", "decimal:Decimal");
  Constructor("StringIO", "io:StringIO");
  Constructor("BytesIO", "io:BytesIO");
  Constructor("deepcopy", "copy:deepcopy");

  for (const char* name : {"fetch_data", "fetch_json", "fetch_bytes", "upload_result",
                           "upload_bytes", "ArtifactIOError"}) {
    ret.push_back({name, K::HELPER, "", {}, false});
  }
  ret.push_back({"context", K::VALUE, "", {}, false});
  ret.push_back({"__name__", K::VALUE, "", {}, false});
  return ret;
}

} // namespace

const std::vector<Capability>& Capabilities() {
  static const std::vector<Capability> table = MakeTable();
  return table;
}

const Capability* FindCapability(const std::string& name) {
  static const std::unordered_map<std::string, const Capability*> index = []() {
    std::unordered_map<std::string, const Capability*> ret;
    for (auto& i : Capabilities()) ret[i.name] = &i;
    return ret;
  }();
  auto it = index.find(name);
  return it == index.end() ? nullptr : it->second;
}

const std::unordered_set<std::string>& AllowedNames() {
  static const std::unordered_set<std::string> names = []() {
    std::unordered_set<std::string> ret;
    for (auto& i : Capabilities()) ret.insert(i.name);
    return ret;
  }();
  return names;
}
