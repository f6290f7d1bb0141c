// parser_backtracking: a recursive-descent parser over a token stream
//
// The tokenizer reads from a std::istream and cannot rewind. Recording it
// lets the parser try one grammar alternative, and on failure backtrack to
// a mark and try the next, without re-reading the input.
//
//   statement := "let" IDENT ":" IDENT "=" NUMBER ";"
//              | "let" IDENT "=" NUMBER ";"
//              | IDENT "(" ")" ";"
//
// Build: cmake --build build
// Run:   ./build/examples/parser_backtracking

#include <backtrack-cpp/backtrack.hpp>

#include <cctype>
#include <cstdio>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace bt = backtrack_cpp;

namespace {

auto tokenizer(std::istream& in, int& reads) -> bt::Source<std::string> {
    return [&in, &reads]() -> std::optional<std::string> {
        auto c = char{};
        while (in.get(c) && std::isspace(static_cast<unsigned char>(c))) {}
        if (!in) return std::nullopt;
        ++reads;

        auto token = std::string{c};
        if (std::isalnum(static_cast<unsigned char>(c))) {
            while (std::isalnum(static_cast<unsigned char>(in.peek()))) {
                token.push_back(static_cast<char>(in.get()));
            }
        }
        return token;
    };
}

auto is_ident(const std::optional<std::string>& t) -> bool {
    return t && !t->empty() && std::isalpha(static_cast<unsigned char>(t->front())) && *t != "let";
}

auto is_number(const std::optional<std::string>& t) -> bool {
    return t && !t->empty() && std::isdigit(static_cast<unsigned char>(t->front()));
}

class Parser {
public:
    explicit Parser(bt::CopyingCursor<std::string> tokens)
        : tokens_{std::move(tokens)} {}

    auto statement() -> std::optional<std::string> {
        if (auto s = attempt(&Parser::typed_let)) return s;
        if (auto s = attempt(&Parser::plain_let)) return s;
        if (auto s = attempt(&Parser::call)) return s;
        return std::nullopt;
    }

    auto at_end() -> bool {
        auto m = tokens_.get_ref_point();
        auto done = !tokens_.next();
        tokens_.backtrack(m);
        return done;
    }

private:
    using Rule = std::optional<std::string> (Parser::*)();

    // Run a rule; on failure rewind to where it started.
    auto attempt(Rule rule) -> std::optional<std::string> {
        auto start = tokens_.get_ref_point();
        if (auto result = (this->*rule)()) return result;
        tokens_.backtrack(start);
        return std::nullopt;
    }

    auto expect(const char* text) -> bool { return tokens_.next() == text; }

    auto typed_let() -> std::optional<std::string> {
        if (!expect("let")) return std::nullopt;
        auto name = tokens_.next();
        if (!is_ident(name) || !expect(":")) return std::nullopt;
        auto type = tokens_.next();
        if (!is_ident(type) || !expect("=")) return std::nullopt;
        auto value = tokens_.next();
        if (!is_number(value) || !expect(";")) return std::nullopt;
        return "declare " + *name + " : " + *type + " = " + *value;
    }

    auto plain_let() -> std::optional<std::string> {
        if (!expect("let")) return std::nullopt;
        auto name = tokens_.next();
        if (!is_ident(name) || !expect("=")) return std::nullopt;
        auto value = tokens_.next();
        if (!is_number(value) || !expect(";")) return std::nullopt;
        return "declare " + *name + " = " + *value;
    }

    auto call() -> std::optional<std::string> {
        auto name = tokens_.next();
        if (!is_ident(name) || !expect("(") || !expect(")") || !expect(";")) return std::nullopt;
        return "call " + *name;
    }

    bt::CopyingCursor<std::string> tokens_;
};

}  // namespace

int main() {
    auto input = std::istringstream{"let x = 1; let y : int = 2; run(); let = ;"};
    auto reads = 0;
    auto rec = bt::Recorder<std::string>{tokenizer(input, reads)};
    auto parser = Parser{rec.copying()};

    while (!parser.at_end()) {
        auto s = parser.statement();
        if (!s) {
            std::printf("syntax error\n");
            break;
        }
        std::printf("%s\n", s->c_str());
    }

    std::printf("tokens recorded: %zu, tokenizer reads: %d\n", rec.size(), reads);
    return 0;
}
