#include "exec/code_wrapper.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace runbox::exec {

namespace {

// JSON string literal, valid in both Python and JavaScript source.
// Non-ASCII text stays raw UTF-8 so characters outside the BMP are
// not split into surrogate escapes.
std::string quoted_literal(const std::string& value) {
    return json(value).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

uint64_t CodeWrapper::cpu_seconds_for(const ResourceLimits& limits) {
    uint64_t seconds = (limits.timeout_ms + 999) / 1000;
    return seconds == 0 ? 1 : seconds;
}

std::string CodeWrapper::heredoc_delimiter(const std::string& payload) {
    std::string delimiter = "RUNBOX_STDIN_EOF";

    auto occurs_as_line = [&payload](const std::string& candidate) {
        std::istringstream stream(payload);
        std::string line;
        while (std::getline(stream, line)) {
            if (line == candidate) return true;
        }
        return false;
    };

    while (occurs_as_line(delimiter)) {
        delimiter += "_X";
    }
    return delimiter;
}

std::string CodeWrapper::wrap(const std::string& code,
                              Language language,
                              const std::optional<std::string>& stdin_data,
                              const ResourceLimits& limits) const {
    const std::string input = stdin_data.value_or("");

    switch (language) {
        case Language::PYTHON:     return wrap_python(code, input, limits);
        case Language::JAVASCRIPT: return wrap_javascript(code, input, limits);
        case Language::SHELL:      return wrap_shell(code, input, limits);
        default:                   return code;
    }
}

// ============================================================================
// Python
// ============================================================================

std::string CodeWrapper::wrap_python(const std::string& code, const std::string& stdin_data,
                                     const ResourceLimits& limits) const {
    const uint64_t address_space = limits.memory_mb * 1024 * 1024;

    // Everything runs inside _rb_prepare, which also unbinds itself, so
    // no helper name is reachable from the snippet. The snippet gets
    // fresh globals and a restricted copy of builtins; the real builtins
    // module stays intact for the import machinery.
    std::ostringstream out;
    out << "def _rb_prepare():\n"
        << "    del globals()['_rb_prepare']\n"
        << "    import builtins, io, sys\n"
        << "    try:\n"
        << "        import resource\n"
        << "        for limit, value in (\n"
        << "            (resource.RLIMIT_CPU, " << cpu_seconds_for(limits) << "),\n"
        << "            (resource.RLIMIT_AS, " << address_space << "),\n"
        << "            (resource.RLIMIT_FSIZE, " << ceilings_.max_file_bytes << "),\n"
        << "            (resource.RLIMIT_NOFILE, " << ceilings_.max_open_files << "),\n"
        << "            (resource.RLIMIT_NPROC, 0),\n"
        << "        ):\n"
        << "            try:\n"
        << "                resource.setrlimit(limit, (value, value))\n"
        << "            except (ValueError, OSError):\n"
        << "                pass\n"
        << "    except ImportError:\n"
        << "        pass\n"
        << "\n"
        << "    sys.stdin = io.StringIO(" << quoted_literal(stdin_data) << ")\n"
        << "\n"
        << "    blocked = frozenset(('subprocess', '_posixsubprocess', 'socket', '_socket',\n"
        << "                         'ctypes', '_ctypes', 'pty', 'multiprocessing',\n"
        << "                         'builtins', 'importlib'))\n"
        << "    real_import = builtins.__import__\n"
        << "\n"
        << "    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):\n"
        << "        if level == 0 and name.split('.')[0] in blocked:\n"
        << "            raise ImportError(\"import of '%s' is blocked in this sandbox\" % name)\n"
        << "        return real_import(name, globals, locals, fromlist, level)\n"
        << "\n"
        << "    restricted = dict(builtins.__dict__)\n"
        << "    for name in ('eval', 'exec', 'compile', 'open', 'breakpoint'):\n"
        << "        restricted.pop(name, None)\n"
        << "    restricted['__import__'] = guarded_import\n"
        << "\n"
        << "    source = " << quoted_literal(code) << "\n"
        << "    return compile(source, '<snippet>', 'exec'), {'__name__': '__main__', '__builtins__': restricted}\n"
        << "\n"
        << "exec(*_rb_prepare())\n";
    return out.str();
}

// ============================================================================
// JavaScript
// ============================================================================

std::string CodeWrapper::wrap_javascript(const std::string& code, const std::string& stdin_data,
                                         const ResourceLimits& limits) const {
    // Node exposes no rlimit API; timers are clamped and reaped instead
    std::ostringstream out;
    out << "const __rb_setTimeout = globalThis.setTimeout;\n"
        << "const __rb_setInterval = globalThis.setInterval;\n"
        << "const __rb_timeouts = [];\n"
        << "const __rb_intervals = [];\n"
        << "\n"
        << "globalThis.setTimeout = (fn, ms, ...args) => {\n"
        << "  if (!(ms <= " << ceilings_.js_max_timeout_ms << ")) ms = "
        << ceilings_.js_max_timeout_ms << ";\n"
        << "  const id = __rb_setTimeout(fn, ms, ...args);\n"
        << "  __rb_timeouts.push(id);\n"
        << "  return id;\n"
        << "};\n"
        << "\n"
        << "globalThis.setInterval = (fn, ms, ...args) => {\n"
        << "  if (!(ms >= " << ceilings_.js_min_interval_ms << ")) ms = "
        << ceilings_.js_min_interval_ms << ";\n"
        << "  const id = __rb_setInterval(fn, ms, ...args);\n"
        << "  __rb_intervals.push(id);\n"
        << "  return id;\n"
        << "};\n"
        << "\n"
        << "const __rb_stdinLines = " << quoted_literal(stdin_data) << ".split('\\n');\n"
        << "let __rb_stdinIndex = 0;\n"
        << "globalThis.readline = () =>\n"
        << "  __rb_stdinIndex < __rb_stdinLines.length ? __rb_stdinLines[__rb_stdinIndex++] : null;\n"
        << "\n"
        << "delete globalThis.require;\n"
        << "delete globalThis.process;\n"
        << "delete globalThis.Buffer;\n"
        << "\n"
        << "const __rb_reaper = __rb_setTimeout(() => {\n"
        << "  __rb_timeouts.forEach((id) => clearTimeout(id));\n"
        << "  __rb_intervals.forEach((id) => clearInterval(id));\n"
        << "}, " << limits.timeout_ms << ");\n"
        << "if (__rb_reaper && typeof __rb_reaper.unref === 'function') __rb_reaper.unref();\n"
        << "\n"
        << "(function (require, process, module, exports, Buffer, __filename, __dirname) {\n"
        << "// --- user code ---\n"
        << code << "\n"
        << "}).call(undefined);\n";
    return out.str();
}

// ============================================================================
// Shell
// ============================================================================

std::string CodeWrapper::wrap_shell(const std::string& code, const std::string& stdin_data,
                                    const ResourceLimits& limits) const {
    // bash ulimit -v and -f count in 1024-byte blocks
    const uint64_t address_space_kb = limits.memory_mb * 1024;
    const uint64_t file_blocks = ceilings_.max_file_bytes / 1024;

    std::string body = stdin_data;
    if (!body.empty() && body.back() != '\n') {
        body.push_back('\n');
    }
    const std::string delimiter = heredoc_delimiter(body);

    std::ostringstream out;
    out << "#!/bin/bash\n"
        << "ulimit -t " << cpu_seconds_for(limits) << " 2>/dev/null || true\n"
        << "ulimit -v " << address_space_kb << " 2>/dev/null || true\n"
        << "ulimit -f " << file_blocks << " 2>/dev/null || true\n"
        << "ulimit -n " << ceilings_.max_open_files << " 2>/dev/null || true\n"
        << "ulimit -u 0 2>/dev/null || true\n"
        << "set -e\n"
        << "set -o pipefail\n"
        << "\n"
        << "export PATH=/usr/bin:/bin\n"
        << "unset BASH_ENV ENV CDPATH\n"
        << "\n"
        << "{\n"
        << "# --- user code ---\n"
        << code << "\n"
        << "} <<'" << delimiter << "'\n"
        << body
        << delimiter << "\n";
    return out.str();
}

} // namespace runbox::exec
