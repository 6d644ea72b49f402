#include "prelude.h"

const char kSubmissionFilename[] = "<submission>";

const char kPreludeSource[] = R"PY(
import base64
import builtins
import importlib
import io
import json
import os
import signal
import sys
import types

signal.signal(signal.SIGTERM, lambda signum, frame: os._exit(143))

FILENAME = "<submission>"
MAX_MESSAGE = 2000

_req_fd, _rep_fd = (int(x) for x in os.environ.get("CODEBOX_CHANNEL", "3,4").split(","))
_req = os.fdopen(_req_fd, "w", encoding="utf-8")
_rep = os.fdopen(_rep_fd, "r", encoding="utf-8")


def _send(msg):
    _req.write(json.dumps(msg) + "\n")
    _req.flush()


def _finish(msg, code):
    msg["op"] = "finish"
    try:
        _send(msg)
    except (OSError, ValueError):
        pass
    os._exit(code)


class ArtifactIOError(Exception):
    pass


def _call(msg):
    try:
        _send(msg)
        line = _rep.readline()
    except (OSError, ValueError):
        raise ArtifactIOError("artifact channel unavailable") from None
    if not line:
        raise ArtifactIOError("artifact channel closed")
    reply = json.loads(line)
    if not reply.get("ok"):
        raise ArtifactIOError(reply.get("error") or "artifact request failed")
    return reply


def fetch_bytes(path):
    reply = _call({"op": "fetch", "path": str(path)})
    return base64.b64decode(reply["content"])


def fetch_json(path):
    return json.loads(fetch_bytes(path).decode("utf-8"))


def fetch_data(path, **options):
    import pandas
    return pandas.read_csv(io.BytesIO(fetch_bytes(path)), **options)


def _upload(path, kind, content_type, content):
    reply = _call({
        "op": "upload",
        "path": str(path),
        "kind": kind,
        "content_type": content_type,
        "content": base64.b64encode(content).decode("ascii"),
    })
    return {"kind": kind, "name": str(path), "locator": reply.get("locator", "")}


def upload_bytes(path, data, content_type="application/octet-stream"):
    return _upload(path, "bytes", str(content_type), bytes(data))


def upload_result(path, obj, format=None):
    fmt = (format or os.path.splitext(str(path))[1].lstrip(".")).lower()
    pandas = sys.modules.get("pandas")
    if pandas is not None and isinstance(obj, (pandas.DataFrame, pandas.Series)):
        if fmt == "json":
            orient = "records" if isinstance(obj, pandas.DataFrame) else "index"
            return _upload(path, "dataframe", "application/json",
                           obj.to_json(orient=orient, date_format="iso").encode("utf-8"))
        return _upload(path, "dataframe", "text/csv",
                       obj.to_csv(index=isinstance(obj, pandas.Series)).encode("utf-8"))
    if isinstance(obj, (dict, list)):
        return _upload(path, "json", "application/json",
                       json.dumps(obj, default=str, ensure_ascii=False).encode("utf-8"))
    if isinstance(obj, str):
        return _upload(path, "text", "text/plain; charset=utf-8", obj.encode("utf-8"))
    if isinstance(obj, (bytes, bytearray)):
        return _upload(path, "bytes", "application/octet-stream", bytes(obj))
    raise TypeError("upload_result cannot serialize " + type(obj).__name__)


HELPERS = {
    "fetch_data": fetch_data,
    "fetch_json": fetch_json,
    "fetch_bytes": fetch_bytes,
    "upload_result": upload_result,
    "upload_bytes": upload_bytes,
    "ArtifactIOError": ArtifactIOError,
}


class Handle(types.SimpleNamespace):
    __slots__ = ()

    def __setattr__(self, name, value):
        raise AttributeError("library handles are read-only")

    def __delattr__(self, name):
        raise AttributeError("library handles are read-only")


class Unavailable:
    __slots__ = ("_module",)

    def __init__(self, module):
        object.__setattr__(self, "_module", module)

    def __getattr__(self, name):
        raise ModuleNotFoundError(self._module + " is not installed")

    def __setattr__(self, name, value):
        raise AttributeError("library handles are read-only")

    def __repr__(self):
        return "<unavailable " + self._module + ">"


def make_handle(module, members):
    tree = {}
    for member in members:
        parts = member.split(".")
        node = tree
        for part in parts[:-1]:
            node = node.setdefault(part, {})
        node.setdefault(parts[-1], None)

    missing = []

    def build(obj, node, prefix):
        attrs = {}
        for name, sub in node.items():
            try:
                value = getattr(obj, name)
            except AttributeError:
                missing.append(prefix + name)
                continue
            attrs[name] = value if sub is None else build(value, sub, prefix + name + ".")
        return Handle(**attrs)

    handle = build(module, tree, module.__name__ + ".")
    if missing:
        raise RuntimeError("installed libraries lack enumerated members: %s" % ", ".join(sorted(missing)))
    return handle


def resolve(target):
    module, _, attr = target.partition(":")
    obj = importlib.import_module(module)
    return getattr(obj, attr) if attr else obj


def build_namespace(manifest):
    safe_builtins = {"__build_class__": builtins.__build_class__}
    ns = {"__builtins__": safe_builtins}
    for cap in manifest["bindings"]:
        name, kind, target = cap["name"], cap["kind"], cap["target"]
        if kind == "builtin":
            safe_builtins[name] = resolve(target)
        elif kind == "library":
            try:
                module = importlib.import_module(target)
            except ImportError:
                if not cap["optional"]:
                    raise
                ns[name] = Unavailable(target)
                continue
            ns[name] = make_handle(module, cap["members"])
        elif kind == "constructor":
            ns[name] = resolve(target)
        elif kind == "helper":
            ns[name] = HELPERS[name]
        elif kind == "value":
            if name == "context":
                ns[name] = types.MappingProxyType(dict(manifest["context"]))
            elif name == "__name__":
                ns[name] = "__main__"
    bound = (set(ns) - {"__builtins__"}) | (set(safe_builtins) - {"__build_class__"})
    expected = {cap["name"] for cap in manifest["bindings"]}
    if bound != expected:
        missing = sorted(expected - bound)
        extra = sorted(bound - expected)
        raise RuntimeError("namespace does not match manifest: missing %s, unexpected %s"
                           % (missing, extra))
    return ns


def summarize(value):
    if value is None:
        return ""
    try:
        pandas = sys.modules.get("pandas")
        numpy = sys.modules.get("numpy")
        if pandas is not None and isinstance(value, pandas.DataFrame):
            return "DataFrame(%d rows, %d columns):\n%s" % (
                len(value), len(value.columns), value.head(10).to_string())
        if pandas is not None and isinstance(value, pandas.Series):
            return "Series(%d items):\n%s" % (len(value), value.head(10).to_string())
        if numpy is not None and isinstance(value, numpy.ndarray):
            return "ndarray(shape=%s):\n%s" % (value.shape, str(value)[:1000])
        return repr(value)[:5000]
    except Exception:
        return str(type(value))


def user_line(exc):
    line = exc.lineno if isinstance(exc, SyntaxError) and exc.filename == FILENAME else None
    tb = exc.__traceback__
    while tb is not None:
        if tb.tb_frame.f_code.co_filename == FILENAME:
            line = tb.tb_lineno
        tb = tb.tb_next
    return line


def main():
    with open(sys.argv[1], encoding="utf-8") as f:
        manifest = json.load(f)
    with open(sys.argv[2], encoding="utf-8") as f:
        source = f.read()
    try:
        ns = build_namespace(manifest)
    except Exception as exc:
        _finish({"status": "setup", "message": "%s: %s" % (type(exc).__name__, exc)}, 2)

    import ast
    try:
        tree = ast.parse(source, filename=FILENAME)
        trailing = None
        if tree.body and isinstance(tree.body[-1], ast.Expr):
            trailing = compile(ast.Expression(tree.body.pop().value), FILENAME, "eval")
        body = compile(tree, FILENAME, "exec")
        del tree, source
        exec(body, ns)
        value = eval(trailing, ns) if trailing is not None else None
    except MemoryError:
        ns = None
        _finish({"status": "memory"}, 1)
    except BaseException as exc:
        _finish({
            "status": "error",
            "type": type(exc).__name__,
            "message": str(exc)[:MAX_MESSAGE],
            "line": user_line(exc),
        }, 1)
    sys.stdout.flush()
    _finish({"status": "ok", "summary": summarize(value)}, 0)


main()
)PY";
