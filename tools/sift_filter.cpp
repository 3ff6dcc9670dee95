#include "sift/expression.hpp"
#include "sift/json_value.hpp"
#include "sift/text/parser.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// sift_filter <jsonlfilter|csvfilter|jsontest> -e <expr> [file ...]
//   jsonlfilter  print JSON Lines records matching the expression
//   csvfilter    print CSV rows matching the expression (header kept once)
//   jsontest     exit 0 when every JSON document matches, 1 otherwise
// Fatal errors exit with 2.

namespace {

constexpr int kExitNoMatch = 1;
constexpr int kExitFatal = 2;

struct Args {
    std::string command;
    std::string expr;
    std::vector<std::string> files;
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cerr << "sift filter tool\n"
              << "Usage: sift_filter <command> -e <expression> [file ...]\n"
              << "Commands:\n"
              << "  jsonlfilter  print JSON Lines records matching the expression\n"
              << "  csvfilter    print CSV rows matching the expression\n"
              << "  jsontest     exit with status 1 if a JSON document does not match\n"
              << "Options:\n"
              << "  -e <expr>, --expr=<expr>  expression to apply\n"
              << "  -h, --help                show this help\n"
              << "Input is read from standard input when no files are given.\n";
}

static int fatal(std::string_view what, const sift::core::error& e) {
    std::cerr << "sift_filter: " << what << ": " << e.message
              << " [" << sift::core::to_string(e.code) << ", " << e.component << "]\n";
    return kExitFatal;
}

static int fatal(std::string_view what) {
    std::cerr << "sift_filter: " << what << "\n";
    return kExitFatal;
}

// ---- CSV ----

// One record; quoted fields may span lines. Returns false at end of input.
static bool read_csv_record(std::istream& in, std::vector<std::string>& out) {
    out.clear();
    std::string line;
    if (!std::getline(in, line)) return false;
    std::string field;
    bool quoted = false;
    for (;;) {
        for (std::size_t i = 0; i < line.size(); ++i) {
            const char c = line[i];
            if (quoted) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') { field += '"'; ++i; }
                    else quoted = false;
                } else {
                    field += c;
                }
            } else if (c == '"' && field.empty()) {
                quoted = true;
            } else if (c == ',') {
                out.push_back(std::move(field));
                field.clear();
            } else if (c != '\r' || i + 1 != line.size()) {
                field += c;
            }
        }
        if (!quoted) break;
        field += '\n';
        if (!std::getline(in, line)) break;
    }
    out.push_back(std::move(field));
    return true;
}

static void write_csv_record(std::ostream& os, const std::vector<std::string>& rec) {
    for (std::size_t i = 0; i < rec.size(); ++i) {
        if (i) os << ',';
        const auto& f = rec[i];
        if (f.find_first_of(",\"\r\n") == std::string::npos && (f.empty() || f.front() != ' ')) {
            os << f;
            continue;
        }
        os << '"';
        for (char c : f) {
            if (c == '"') os << '"';
            os << c;
        }
        os << '"';
    }
    os << '\n';
}

static std::optional<sift::core::error> csv_filter(std::istream& in, const sift::query& q, bool& write_header) {
    std::vector<std::string> headers;
    if (!read_csv_record(in, headers)) return std::nullopt;
    if (write_header) {
        write_csv_record(std::cout, headers);
        write_header = false;
    }
    std::vector<std::string> rec;
    sift::Value::map_t row;
    while (read_csv_record(in, rec)) {
        row.clear();
        for (std::size_t i = 0; i < headers.size() && i < rec.size(); ++i) row[headers[i]] = rec[i];
        auto m = q.evaluate(row);
        if (!m) return m.error();
        if (*m) write_csv_record(std::cout, rec);
    }
    return std::nullopt;
}

// ---- JSON ----

static std::optional<sift::core::error> jsonl_filter(std::istream& in, const sift::query& q) {
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        auto doc = sift::json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            return sift::core::error{sift::core::error_code::serialization_error,
                                     "invalid JSON on line " + std::to_string(lineno), "tools.jsonlfilter"};
        }
        const sift::Value rec = sift::from_json_value(doc);
        auto m = q.evaluate(rec);
        if (!m) return m.error();
        if (*m) std::cout << doc.dump() << '\n';
    }
    return std::nullopt;
}

static std::expected<bool, sift::core::error> json_test(std::istream& in, const sift::query& q) {
    auto doc = sift::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return sift::core::fail(sift::core::error_code::serialization_error, "invalid JSON document",
                                "tools.jsontest");
    }
    const sift::Value rec = sift::from_json_value(doc);
    return q.evaluate(rec);
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (a == "-e") {
            if (i + 1 >= argc) { print_usage(); return fatal("-e requires an expression"); }
            args.expr = argv[++i];
        }
        else if (auto v = eat(a, "--expr=")) args.expr = *v;
        else if (args.command.empty()) args.command = a;
        else args.files.push_back(a);
    }

    if (args.command != "jsonlfilter" && args.command != "csvfilter" && args.command != "jsontest") {
        print_usage();
        return fatal(args.command.empty() ? "missing command" : "unknown command " + args.command);
    }
    if (args.expr.empty()) return fatal("-e expression required");

    auto q = sift::text::parse(args.expr);
    if (!q) return fatal("parse expression", q.error());

    bool write_header = true;
    bool all_matched = true;
    auto run = [&](std::istream& in) -> std::optional<sift::core::error> {
        if (args.command == "jsonlfilter") return jsonl_filter(in, *q);
        if (args.command == "csvfilter") return csv_filter(in, *q, write_header);
        auto ok = json_test(in, *q);
        if (!ok) return ok.error();
        if (!*ok) all_matched = false;
        return std::nullopt;
    };

    if (args.files.empty()) {
        if (auto err = run(std::cin)) return fatal("<stdin>", *err);
    } else {
        for (const auto& f : args.files) {
            std::ifstream in(f);
            if (!in) return fatal("cannot open " + f);
            if (auto err = run(in)) return fatal(f, *err);
            if (!all_matched) break;
        }
    }
    return all_matched ? 0 : kExitNoMatch;
}
