#include "srctools/keyvalues.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace srctools::keyvalues {

namespace {

enum class TokenType { String, Open, Close, Condition, End };

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    int line = 0;
};

class Lexer {
public:
    explicit Lexer(std::string_view src) : src_(src) {}

    Token next() {
        if (peeked_) {
            Token t = std::move(*peeked_);
            peeked_.reset();
            return t;
        }
        return scan();
    }

    const Token& peek() {
        if (!peeked_) peeked_ = scan();
        return *peeked_;
    }

private:
    Token scan() {
        skip_space_and_comments();
        Token t;
        t.line = line_;
        if (pos_ >= src_.size()) return t;

        char c = src_[pos_];
        if (c == '{') {
            ++pos_;
            t.type = TokenType::Open;
            return t;
        }
        if (c == '}') {
            ++pos_;
            t.type = TokenType::Close;
            return t;
        }
        if (c == '"') {
            ++pos_;
            auto end = src_.find('"', pos_);
            if (end == std::string_view::npos)
                throw std::runtime_error(
                    std::format("keyvalues: line {}: unterminated quoted string", t.line));
            t.text = std::string(src_.substr(pos_, end - pos_));
            line_ += static_cast<int>(std::count(t.text.begin(), t.text.end(), '\n'));
            pos_ = end + 1;
            t.type = TokenType::String;
            return t;
        }
        if (c == '[') {
            auto end = src_.find(']', pos_);
            if (end == std::string_view::npos)
                throw std::runtime_error(
                    std::format("keyvalues: line {}: unterminated conditional", t.line));
            t.text = std::string(src_.substr(pos_, end - pos_ + 1));
            pos_ = end + 1;
            t.type = TokenType::Condition;
            return t;
        }

        size_t start = pos_;
        while (pos_ < src_.size()) {
            char b = src_[pos_];
            if (std::isspace(static_cast<unsigned char>(b)) || b == '{' || b == '}' || b == '"')
                break;
            ++pos_;
        }
        t.text = std::string(src_.substr(start, pos_ - start));
        t.type = TokenType::String;
        return t;
    }

    void skip_space_and_comments() {
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\n') {
                ++line_;
                ++pos_;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '/' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '/') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
            } else {
                break;
            }
        }
    }

    std::string_view src_;
    size_t pos_ = 0;
    int line_ = 1;
    std::optional<Token> peeked_;
};

void parse_block(Lexer& lex, Block& out, bool top_level) {
    for (;;) {
        Token key = lex.next();
        switch (key.type) {
            case TokenType::End:
                if (top_level) return;
                throw std::runtime_error(
                    std::format("keyvalues: line {}: unexpected end of input, missing '}}'", key.line));
            case TokenType::Close:
                if (!top_level) return;
                throw std::runtime_error(std::format("keyvalues: line {}: unexpected '}}'", key.line));
            case TokenType::Open:
                throw std::runtime_error(std::format("keyvalues: line {}: block without a key", key.line));
            case TokenType::Condition:
                continue;
            case TokenType::String:
                break;
        }

        Pair pair;
        pair.key = std::move(key.text);

        Token value = lex.next();
        if (value.type == TokenType::Condition) {
            pair.condition = std::move(value.text);
            value = lex.next();
        }

        if (value.type == TokenType::Open) {
            auto child = std::make_unique<Block>();
            parse_block(lex, *child, false);
            pair.value = BlockOwned{std::move(child)};
        } else if (value.type == TokenType::String) {
            pair.value = std::move(value.text);
            if (lex.peek().type == TokenType::Condition) pair.condition = lex.next().text;
        } else {
            throw std::runtime_error(
                std::format("keyvalues: line {}: key \"{}\" has no value", value.line, pair.key));
        }

        out.pairs.push_back(std::move(pair));
    }
}

} // namespace

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

Document parse_bytes(std::string_view data) {
    if (data.starts_with("\xef\xbb\xbf")) data.remove_prefix(3);
    Lexer lex(data);
    Document doc;
    parse_block(lex, doc.root, true);
    return doc;
}

Document parse_text(std::istream& r) {
    std::ostringstream buf;
    buf << r.rdbuf();
    return parse_bytes(buf.str());
}

Document parse(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("keyvalues: cannot open " + path.string());
    return parse_text(f);
}

bool condition_applies(std::string_view condition) {
    if (condition.starts_with("[")) condition.remove_prefix(1);
    if (condition.ends_with("]")) condition.remove_suffix(1);

    bool negate = false;
    if (condition.starts_with("!")) {
        negate = true;
        condition.remove_prefix(1);
    }

    bool value = true;
    static constexpr std::string_view false_terms[] = {
        "$x360", "$ps3", "$gameconsole", "$osx", "$xbox"};
    for (auto term : false_terms) {
        if (iequals(condition, term)) {
            value = false;
            break;
        }
    }
    return negate ? !value : value;
}

const Pair* find(const Block& block, std::string_view key) {
    for (const auto& p : block.pairs) {
        if (iequals(p.key, key)) return &p;
    }
    return nullptr;
}

const std::string* as_string(const Pair& pair) {
    return std::get_if<std::string>(&pair.value);
}

const Block* as_block(const Pair& pair) {
    auto* owned = std::get_if<BlockOwned>(&pair.value);
    return owned ? owned->block.get() : nullptr;
}

std::string get_string(const Block& block, std::string_view key) {
    auto* p = find(block, key);
    if (!p) return "";
    if (auto* s = as_string(*p)) return *s;
    return "";
}

const Block* get_block(const Block& block, std::string_view key) {
    for (const auto& p : block.pairs) {
        if (!iequals(p.key, key)) continue;
        if (auto* b = as_block(p)) return b;
    }
    return nullptr;
}

} // namespace srctools::keyvalues
