#include "providers/simulated_provider.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <vector>

namespace runbox::providers {

using exec::Language;

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ============================================================================
// Arithmetic
// ============================================================================

struct Number {
    bool is_int = true;
    int64_t i = 0;
    double d = 0.0;

    double real() const { return is_int ? static_cast<double>(i) : d; }

    static Number of_int(int64_t v) { Number n; n.is_int = true; n.i = v; return n; }
    static Number of_real(double v) { Number n; n.is_int = false; n.d = v; return n; }
};

// Recursive descent over + - * / // % ** and parentheses. Python
// divides into floats and floors with //, shell is integer-only,
// JavaScript falls back to doubles on overflow.
class ArithmeticParser {
public:
    ArithmeticParser(const std::string& text, Language language)
        : text_(text), language_(language) {}

    std::optional<Number> parse() {
        auto value = parse_sum();
        skip_space();
        if (!value || pos_ != text_.size()) return std::nullopt;
        return value;
    }

private:
    static constexpr int MAX_DEPTH = 64;

    struct DepthGuard {
        int& depth;
        explicit DepthGuard(int& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
    };

    const std::string& text_;
    Language language_;
    size_t pos_ = 0;
    int depth_ = 0;

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    bool peek(const char* token) {
        skip_space();
        return text_.compare(pos_, std::strlen(token), token) == 0;
    }

    bool accept(const char* token) {
        if (!peek(token)) return false;
        pos_ += std::strlen(token);
        return true;
    }

    std::optional<Number> parse_sum() {
        auto left = parse_product();
        while (left) {
            if (accept("+")) {
                auto right = parse_product();
                if (!right) return std::nullopt;
                left = apply(*left, "+", *right);
            } else if (accept("-")) {
                auto right = parse_product();
                if (!right) return std::nullopt;
                left = apply(*left, "-", *right);
            } else {
                break;
            }
        }
        return left;
    }

    std::optional<Number> parse_product() {
        auto left = parse_unary();
        while (left) {
            const char* op = nullptr;
            if (language_ == Language::PYTHON && accept("//")) op = "//";
            else if (!peek("**") && accept("*")) op = "*";
            else if (accept("/")) op = "/";
            else if (accept("%")) op = "%";
            else break;

            auto right = parse_unary();
            if (!right) return std::nullopt;
            left = apply(*left, op, *right);
        }
        return left;
    }

    std::optional<Number> parse_unary() {
        DepthGuard guard(depth_);
        if (depth_ > MAX_DEPTH) return std::nullopt;

        if (accept("-")) {
            auto value = parse_unary();
            if (!value) return std::nullopt;
            return negate(*value);
        }
        if (accept("+")) {
            return parse_unary();
        }
        return parse_power();
    }

    std::optional<Number> parse_power() {
        auto base = parse_primary();
        if (!base) return std::nullopt;
        if (accept("**")) {
            auto exponent = parse_unary();
            if (!exponent) return std::nullopt;
            return apply(*base, "**", *exponent);
        }
        return base;
    }

    std::optional<Number> parse_primary() {
        if (accept("(")) {
            DepthGuard guard(depth_);
            if (depth_ > MAX_DEPTH) return std::nullopt;
            auto value = parse_sum();
            if (!value || !accept(")")) return std::nullopt;
            return value;
        }
        return parse_number();
    }

    std::optional<Number> parse_number() {
        skip_space();
        const size_t start = pos_;
        const size_t n = text_.size();
        auto digit_at = [&](size_t p) { return p < n && std::isdigit(static_cast<unsigned char>(text_[p])); };

        size_t int_digits = 0;
        while (digit_at(pos_)) { ++pos_; ++int_digits; }

        bool real = false;
        if (language_ != Language::SHELL && pos_ < n && text_[pos_] == '.') {
            size_t frac_start = ++pos_;
            while (digit_at(pos_)) ++pos_;
            if (int_digits == 0 && pos_ == frac_start) {
                pos_ = start;
                return std::nullopt;
            }
            real = true;
        } else if (int_digits == 0) {
            return std::nullopt;
        }

        if (language_ != Language::SHELL && pos_ < n && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            size_t save = pos_++;
            if (pos_ < n && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            if (!digit_at(pos_)) {
                pos_ = save;
            } else {
                while (digit_at(pos_)) ++pos_;
                real = true;
            }
        }

        if (pos_ < n && is_ident_char(text_[pos_])) return std::nullopt;

        const std::string token = text_.substr(start, pos_ - start);
        if (real) {
            return Number::of_real(std::strtod(token.c_str(), nullptr));
        }

        errno = 0;
        long long value = std::strtoll(token.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            if (language_ == Language::JAVASCRIPT) return Number::of_real(std::strtod(token.c_str(), nullptr));
            return std::nullopt;
        }
        return Number::of_int(static_cast<int64_t>(value));
    }

    std::optional<Number> negate(const Number& value) const {
        if (!value.is_int) return Number::of_real(-value.d);
        if (value.i == std::numeric_limits<int64_t>::min()) {
            if (language_ == Language::JAVASCRIPT) return Number::of_real(-value.real());
            return std::nullopt;
        }
        return Number::of_int(-value.i);
    }

    std::optional<Number> apply(const Number& a, const std::string& op, const Number& b) const {
        const bool ints = a.is_int && b.is_int;
        const bool js = language_ == Language::JAVASCRIPT;
        const double x = a.real();
        const double y = b.real();

        if (language_ == Language::SHELL && !ints) return std::nullopt;

        if (op == "+" || op == "-" || op == "*") {
            if (ints) {
                int64_t out = 0;
                bool overflow = op == "+" ? __builtin_add_overflow(a.i, b.i, &out)
                              : op == "-" ? __builtin_sub_overflow(a.i, b.i, &out)
                              : __builtin_mul_overflow(a.i, b.i, &out);
                if (!overflow) return Number::of_int(out);
                if (!js) return std::nullopt;
            }
            return Number::of_real(op == "+" ? x + y : op == "-" ? x - y : x * y);
        }

        if (op == "/") {
            if (language_ == Language::SHELL) {
                if (b.i == 0 || (b.i == -1 && a.i == std::numeric_limits<int64_t>::min())) return std::nullopt;
                return Number::of_int(a.i / b.i);
            }
            if (js) {
                if (ints && b.i != 0 && b.i != -1 && a.i % b.i == 0) return Number::of_int(a.i / b.i);
                return Number::of_real(x / y);
            }
            if (y == 0.0) return std::nullopt;
            return Number::of_real(x / y);
        }

        if (op == "//") {
            if (y == 0.0) return std::nullopt;
            if (ints) {
                if (b.i == -1 && a.i == std::numeric_limits<int64_t>::min()) return std::nullopt;
                int64_t q = a.i / b.i;
                if (a.i % b.i != 0 && ((a.i < 0) != (b.i < 0))) --q;
                return Number::of_int(q);
            }
            return Number::of_real(std::floor(x / y));
        }

        if (op == "%") {
            if (y == 0.0) {
                if (js) return Number::of_real(std::nan(""));
                return std::nullopt;
            }
            if (ints) {
                int64_t r = b.i == -1 ? 0 : a.i % b.i;
                if (language_ == Language::PYTHON && r != 0 && ((r < 0) != (b.i < 0))) r += b.i;
                return Number::of_int(r);
            }
            double r = std::fmod(x, y);
            if (language_ == Language::PYTHON && r != 0.0 && ((r < 0) != (y < 0))) r += y;
            return Number::of_real(r);
        }

        if (op == "**") {
            if (ints && b.i >= 0) {
                int64_t result = 1;
                int64_t base = a.i;
                int64_t exponent = b.i;
                bool overflow = false;
                while (exponent > 0 && !overflow) {
                    if (exponent & 1) overflow = __builtin_mul_overflow(result, base, &result);
                    exponent >>= 1;
                    if (exponent > 0 && !overflow) overflow = __builtin_mul_overflow(base, base, &base);
                }
                if (!overflow) return Number::of_int(result);
                if (!js) return std::nullopt;
                return Number::of_real(std::pow(x, y));
            }
            if (language_ == Language::SHELL) return std::nullopt;
            if (language_ == Language::PYTHON) {
                if (x == 0.0 && y < 0) return std::nullopt;
                if (x < 0 && y != std::floor(y)) return std::nullopt;
            }
            return Number::of_real(std::pow(x, y));
        }

        return std::nullopt;
    }
};

std::string format_number(const Number& value, Language language) {
    if (value.is_int) return std::to_string(value.i);

    const double d = value.d;
    if (language == Language::JAVASCRIPT) {
        if (std::isnan(d)) return "NaN";
        if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
        if (d == std::floor(d) && std::fabs(d) < 1e21) return fmt::format("{:.0f}", d);
        return fmt::format("{}", d);
    }

    // Python float repr always shows a fractional part
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    std::string text = fmt::format("{}", d);
    if (text.find_first_of(".e") == std::string::npos) text += ".0";
    return text;
}

// ============================================================================
// Source scanning
// ============================================================================

// Index one past the string literal opening at `start`
size_t skip_string(const std::string& code, size_t start, Language language) {
    const size_t n = code.size();
    const char quote = code[start];

    if (language == Language::PYTHON && code.compare(start, 3, std::string(3, quote)) == 0) {
        size_t end = code.find(std::string(3, quote), start + 3);
        return end == std::string::npos ? n : end + 3;
    }

    const bool multiline = quote == '`';
    size_t i = start + 1;
    while (i < n) {
        char c = code[i];
        if (c == '\\') { i += 2; continue; }
        if (c == quote) return i + 1;
        if (c == '\n' && !multiline) return i;
        ++i;
    }
    return n;
}

bool opens_string(char c, Language language) {
    return c == '"' || c == '\'' || (c == '`' && language == Language::JAVASCRIPT);
}

// Index of the ')' matching the '(' at `open`, or npos
size_t matching_paren(const std::string& code, size_t open, Language language) {
    int depth = 0;
    size_t i = open;
    while (i < code.size()) {
        char c = code[i];
        if (opens_string(c, language)) {
            i = skip_string(code, i, language);
            continue;
        }
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) return i;
        }
        ++i;
    }
    return std::string::npos;
}

// Argument text of every call to `callee` outside strings and comments
std::vector<std::string> find_calls(const std::string& code, const std::string& callee, Language language) {
    std::vector<std::string> calls;
    const size_t n = code.size();
    size_t i = 0;

    while (i < n) {
        const char c = code[i];

        if (language == Language::PYTHON && c == '#') {
            size_t eol = code.find('\n', i);
            i = eol == std::string::npos ? n : eol;
            continue;
        }
        if (language == Language::JAVASCRIPT && c == '/' && i + 1 < n && code[i + 1] == '/') {
            size_t eol = code.find('\n', i);
            i = eol == std::string::npos ? n : eol;
            continue;
        }
        if (language == Language::JAVASCRIPT && c == '/' && i + 1 < n && code[i + 1] == '*') {
            size_t close = code.find("*/", i + 2);
            i = close == std::string::npos ? n : close + 2;
            continue;
        }
        if (opens_string(c, language)) {
            i = skip_string(code, i, language);
            continue;
        }

        if (code.compare(i, callee.size(), callee) == 0 &&
            (i == 0 || (!is_ident_char(code[i - 1]) && code[i - 1] != '.'))) {
            size_t j = i + callee.size();
            while (j < n && (code[j] == ' ' || code[j] == '\t')) ++j;
            if (j < n && code[j] == '(') {
                size_t close = matching_paren(code, j, language);
                if (close == std::string::npos) break;
                calls.push_back(code.substr(j + 1, close - j - 1));
                i = close + 1;
                continue;
            }
        }
        ++i;
    }
    return calls;
}

std::vector<std::string> split_arguments(const std::string& args, Language language) {
    std::vector<std::string> parts;
    int depth = 0;
    size_t start = 0;
    size_t i = 0;

    while (i < args.size()) {
        char c = args[i];
        if (opens_string(c, language)) {
            i = skip_string(args, i, language);
            continue;
        }
        if (c == '(' || c == '[' || c == '{') ++depth;
        else if (c == ')' || c == ']' || c == '}') --depth;
        else if (c == ',' && depth == 0) {
            parts.push_back(args.substr(start, i - start));
            start = i + 1;
        }
        ++i;
    }
    parts.push_back(args.substr(start));
    return parts;
}

std::string unescape(const std::string& body) {
    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] != '\\' || i + 1 == body.size()) {
            out.push_back(body[i]);
            continue;
        }
        char next = body[++i];
        switch (next) {
            case 'n':  out.push_back('\n'); break;
            case 't':  out.push_back('\t'); break;
            case 'r':  out.push_back('\r'); break;
            case '\\': out.push_back('\\'); break;
            case '\'': out.push_back('\''); break;
            case '"':  out.push_back('"'); break;
            case '`':  out.push_back('`'); break;
            default:
                out.push_back('\\');
                out.push_back(next);
        }
    }
    return out;
}

// Value of an argument that is exactly one string literal
std::optional<std::string> string_literal(const std::string& arg, Language language) {
    size_t p = 0;
    bool raw = false;

    if (language == Language::PYTHON) {
        while (p < arg.size() && p < 2 && std::strchr("rRfFuU", arg[p]) && arg[p] != '\0') {
            if (arg[p] == 'r' || arg[p] == 'R') raw = true;
            ++p;
        }
    }
    if (p >= arg.size() || !opens_string(arg[p], language)) return std::nullopt;
    if (skip_string(arg, p, language) != arg.size()) return std::nullopt;

    const char quote = arg[p];
    size_t width = (language == Language::PYTHON && arg.compare(p, 3, std::string(3, quote)) == 0) ? 3 : 1;
    if (arg.size() < p + 2 * width) return std::nullopt;

    std::string body = arg.substr(p + width, arg.size() - p - 2 * width);
    return raw ? body : unescape(body);
}

std::string render_argument(const std::string& arg, Language language) {
    if (auto text = string_literal(arg, language)) return *text;
    if (auto value = SimulatedProvider::evaluate(arg, language)) return *value;
    return arg;
}

// name=value with a plain identifier name
bool keyword_argument(const std::string& arg, std::string& name, std::string& value) {
    size_t i = 0;
    while (i < arg.size() && (std::isalnum(static_cast<unsigned char>(arg[i])) || arg[i] == '_')) ++i;
    if (i == 0) return false;
    size_t eq = i;
    while (eq < arg.size() && arg[eq] == ' ') ++eq;
    if (eq >= arg.size() || arg[eq] != '=' || (eq + 1 < arg.size() && arg[eq + 1] == '=')) return false;
    name = arg.substr(0, i);
    value = trim(arg.substr(eq + 1));
    return true;
}

std::string simulate_python(const std::string& code) {
    std::string out;
    for (const auto& call : find_calls(code, "print", Language::PYTHON)) {
        std::string sep = " ";
        std::string end = "\n";
        std::vector<std::string> parts;

        for (const auto& raw_arg : split_arguments(call, Language::PYTHON)) {
            std::string arg = trim(raw_arg);
            if (arg.empty()) continue;

            std::string name, value;
            if (keyword_argument(arg, name, value)) {
                if (name == "sep") sep = string_literal(value, Language::PYTHON).value_or(sep);
                else if (name == "end") end = string_literal(value, Language::PYTHON).value_or(end);
                continue;
            }
            parts.push_back(render_argument(arg, Language::PYTHON));
        }

        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        out += end;
    }
    return out;
}

std::string simulate_javascript(const std::string& code) {
    std::string out;
    for (const auto& call : find_calls(code, "console.log", Language::JAVASCRIPT)) {
        std::string line;
        bool first = true;
        for (const auto& raw_arg : split_arguments(call, Language::JAVASCRIPT)) {
            std::string arg = trim(raw_arg);
            if (arg.empty()) continue;
            if (!first) line += " ";
            line += render_argument(arg, Language::JAVASCRIPT);
            first = false;
        }
        out += line + "\n";
    }
    return out;
}

// ============================================================================
// Shell
// ============================================================================

struct ShellCommand {
    std::string text;
    bool piped = false;
};

std::vector<ShellCommand> split_commands(const std::string& code) {
    std::vector<ShellCommand> commands;
    std::string current;
    char quote = 0;
    int depth = 0;
    bool word_start = true;

    auto flush = [&](bool piped) {
        commands.push_back({current, piped});
        current.clear();
        word_start = true;
    };

    for (size_t i = 0; i < code.size(); ++i) {
        char c = code[i];

        if (quote) {
            current.push_back(c);
            if (c == '\\' && quote == '"' && i + 1 < code.size()) {
                current.push_back(code[++i]);
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            current.push_back(c);
            word_start = false;
            continue;
        }
        if (c == '#' && word_start) {
            while (i + 1 < code.size() && code[i + 1] != '\n') ++i;
            continue;
        }
        if (c == '(') ++depth;
        else if (c == ')' && depth > 0) --depth;

        if (depth == 0) {
            if (c == '\n' || c == ';') { flush(false); continue; }
            if ((c == '&' || c == '|') && i + 1 < code.size() && code[i + 1] == c) {
                flush(false);
                ++i;
                continue;
            }
            if (c == '|') { flush(true); continue; }
        }

        current.push_back(c);
        word_start = std::isspace(static_cast<unsigned char>(c)) != 0;
    }
    flush(false);
    return commands;
}

// Expand $((expr)) starting at `i`; advances `i` past the expansion
bool expand_arithmetic(const std::string& text, size_t& i, std::string& out) {
    if (text.compare(i, 3, "$((") != 0) return false;

    size_t j = i + 3;
    int depth = 0;
    while (j < text.size()) {
        if (text[j] == '(') ++depth;
        else if (text[j] == ')') {
            if (depth == 0) break;
            --depth;
        }
        ++j;
    }
    if (j + 1 >= text.size() || text[j + 1] != ')') return false;

    const std::string expr = text.substr(i + 3, j - i - 3);
    auto value = SimulatedProvider::evaluate(expr, Language::SHELL);
    out += value ? *value : text.substr(i, j + 2 - i);
    i = j + 2;
    return true;
}

// Words of an echo argument list; nullopt when output is redirected
std::optional<std::vector<std::string>> shell_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    size_t i = 0;

    while (i < text.size()) {
        char c = text[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) words.push_back(current);
            current.clear();
            in_word = false;
            ++i;
            continue;
        }
        if (c == '>' || c == '<' || c == '&') return std::nullopt;

        in_word = true;
        if (c == '\'') {
            size_t close = text.find('\'', i + 1);
            if (close == std::string::npos) close = text.size();
            current += text.substr(i + 1, close - i - 1);
            i = close + 1;
        } else if (c == '"') {
            ++i;
            while (i < text.size() && text[i] != '"') {
                if (text[i] == '\\' && i + 1 < text.size() && std::strchr("\"\\$`", text[i + 1])) {
                    current.push_back(text[i + 1]);
                    i += 2;
                } else if (!expand_arithmetic(text, i, current)) {
                    current.push_back(text[i++]);
                }
            }
            ++i;
        } else if (c == '\\' && i + 1 < text.size()) {
            current.push_back(text[i + 1]);
            i += 2;
        } else if (!expand_arithmetic(text, i, current)) {
            current.push_back(c);
            ++i;
        }
    }
    if (in_word) words.push_back(current);
    return words;
}

bool is_echo_flag(const std::string& word) {
    return word.size() > 1 && word[0] == '-' &&
           word.find_first_not_of("neE", 1) == std::string::npos;
}

std::string simulate_shell(const std::string& code) {
    std::string out;
    for (const auto& command : split_commands(code)) {
        if (command.piped) continue;

        std::string text = trim(command.text);
        if (text.compare(0, 4, "echo") != 0) continue;
        if (text.size() > 4 && !std::isspace(static_cast<unsigned char>(text[4]))) continue;

        auto words = shell_words(text.substr(4));
        if (!words) continue;

        bool newline = true;
        size_t first = 0;
        while (first < words->size() && is_echo_flag((*words)[first])) {
            if ((*words)[first].find('n') != std::string::npos) newline = false;
            ++first;
        }

        for (size_t i = first; i < words->size(); ++i) {
            if (i > first) out += " ";
            out += (*words)[i];
        }
        if (newline) out += "\n";
    }
    return out;
}

} // namespace

// ============================================================================
// SimulatedProvider Implementation
// ============================================================================

std::optional<std::string> SimulatedProvider::evaluate(const std::string& expr, Language language) {
    std::string text = trim(expr);
    if (text.empty()) return std::nullopt;

    auto value = ArithmeticParser(text, language).parse();
    if (!value) return std::nullopt;
    return format_number(*value, language);
}

std::string SimulatedProvider::simulate(const std::string& code, Language language) {
    std::string out;
    switch (language) {
        case Language::PYTHON:     out = simulate_python(code); break;
        case Language::JAVASCRIPT: out = simulate_javascript(code); break;
        case Language::SHELL:      out = simulate_shell(code); break;
    }

    if (out.empty()) {
        out = "[Simulated execution - no sandbox configured]\n";
        out += fmt::format("Language: {}\n", exec::language_to_string(language));
        out += fmt::format("Code length: {} chars\n", code.size());
    }
    return out;
}

ProviderResponse SimulatedProvider::execute(const ExecutionTask& task) {
    spdlog::warn("[simulated] Serving {} snippet ({} bytes) from simulation",
                 exec::language_to_string(task.language), task.code.size());

    RawExecution raw;
    try {
        raw.stdout_data = simulate(task.code, task.language);
    } catch (const std::exception& e) {
        spdlog::error("[simulated] Simulation failed: {}", e.what());
        return ProviderResponse::fail(FailureKind::PERMANENT, std::string("simulation failed: ") + e.what());
    }

    raw.exit_status = 0;
    raw.warnings.push_back(WARNING);
    return ProviderResponse::ok(std::move(raw));
}

} // namespace runbox::providers
