#include <xdot_loaders/annotated_layout.hpp>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace xdot_loaders {

namespace {

struct Token {
    enum class Type { Id, Punct, EdgeOp, End };
    Type type = Type::End;
    std::string text;
    bool quoted = false; // quoted or HTML string; never a keyword
    int line = 1;
};

class DotSyntaxError : public std::runtime_error {
public:
    DotSyntaxError(int line, const std::string& what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what)
    {
    }
};

bool is_id_start(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_id_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

std::string lower(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

class Lexer {
public:
    explicit Lexer(std::string_view text) : text_(text) {}

    Token next() {
        skip_space_and_comments();
        Token tok;
        tok.line = line_;
        if (pos_ >= text_.size()) return tok;

        const char c = text_[pos_];
        if (c == '"') {
            tok.type = Token::Type::Id;
            tok.quoted = true;
            tok.text = read_quoted();
            // "a" + "b" concatenation
            for (;;) {
                const std::size_t save_pos = pos_;
                const int save_line = line_;
                skip_space_and_comments();
                if (pos_ < text_.size() && text_[pos_] == '+') {
                    ++pos_;
                    skip_space_and_comments();
                    if (pos_ < text_.size() && text_[pos_] == '"') {
                        tok.text += read_quoted();
                        continue;
                    }
                    throw DotSyntaxError(line_, "expected string after '+'");
                }
                pos_ = save_pos;
                line_ = save_line;
                break;
            }
            return tok;
        }
        if (c == '<') {
            tok.type = Token::Type::Id;
            tok.quoted = true;
            tok.text = read_html();
            return tok;
        }
        if (c == '-' && pos_ + 1 < text_.size() && (text_[pos_ + 1] == '>' || text_[pos_ + 1] == '-')) {
            tok.type = Token::Type::EdgeOp;
            tok.text = std::string(text_.substr(pos_, 2));
            pos_ += 2;
            return tok;
        }
        if (c == '-' || c == '.' || std::isdigit(static_cast<unsigned char>(c))) {
            tok.type = Token::Type::Id;
            tok.text = read_numeral();
            return tok;
        }
        if (is_id_start(c)) {
            std::size_t end = pos_;
            while (end < text_.size() && is_id_char(text_[end]))
                ++end;
            tok.type = Token::Type::Id;
            tok.text = std::string(text_.substr(pos_, end - pos_));
            pos_ = end;
            return tok;
        }
        if (std::string_view("{}[];,=:").find(c) != std::string_view::npos) {
            tok.type = Token::Type::Punct;
            tok.text = std::string(1, c);
            ++pos_;
            return tok;
        }
        throw DotSyntaxError(line_, std::string("unexpected character '") + c + "'");
    }

private:
    void skip_space_and_comments() {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '\n') {
                ++line_;
                ++pos_;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '/' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '/') {
                skip_line();
            } else if (c == '/' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '*') {
                const std::size_t end = text_.find("*/", pos_ + 2);
                if (end == std::string_view::npos) throw DotSyntaxError(line_, "unterminated comment");
                for (std::size_t i = pos_; i < end; ++i)
                    if (text_[i] == '\n') ++line_;
                pos_ = end + 2;
            } else if (c == '#' && at_line_start()) {
                skip_line();
            } else {
                break;
            }
        }
    }

    bool at_line_start() const {
        std::size_t i = pos_;
        while (i > 0) {
            const char p = text_[i - 1];
            if (p == '\n') return true;
            if (!std::isspace(static_cast<unsigned char>(p))) return false;
            --i;
        }
        return true;
    }

    void skip_line() {
        while (pos_ < text_.size() && text_[pos_] != '\n')
            ++pos_;
    }

    // Escapes other than line continuations are kept for the consumer.
    std::string read_quoted() {
        const int start_line = line_;
        ++pos_;
        std::string out;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '"') {
                ++pos_;
                return out;
            }
            if (c == '\\' && pos_ + 1 < text_.size()) {
                const char n = text_[pos_ + 1];
                if (n == '\n') {
                    ++line_;
                    pos_ += 2;
                    continue;
                }
                if (n == '\r' && pos_ + 2 < text_.size() && text_[pos_ + 2] == '\n') {
                    ++line_;
                    pos_ += 3;
                    continue;
                }
                out.push_back(c);
                out.push_back(n);
                pos_ += 2;
                continue;
            }
            if (c == '\n') ++line_;
            out.push_back(c);
            ++pos_;
        }
        throw DotSyntaxError(start_line, "unterminated string");
    }

    std::string read_html() {
        const int start_line = line_;
        int depth = 0;
        const std::size_t start = pos_;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '<') ++depth;
            else if (c == '>') --depth;
            else if (c == '\n') ++line_;
            ++pos_;
            if (depth == 0) return std::string(text_.substr(start + 1, pos_ - start - 2));
        }
        throw DotSyntaxError(start_line, "unterminated HTML string");
    }

    std::string read_numeral() {
        std::size_t end = pos_;
        if (text_[end] == '-') ++end;
        bool digits = false;
        while (end < text_.size() && std::isdigit(static_cast<unsigned char>(text_[end]))) {
            ++end;
            digits = true;
        }
        if (end < text_.size() && text_[end] == '.') {
            ++end;
            while (end < text_.size() && std::isdigit(static_cast<unsigned char>(text_[end]))) {
                ++end;
                digits = true;
            }
        }
        if (!digits) throw DotSyntaxError(line_, "malformed number");
        std::string out(text_.substr(pos_, end - pos_));
        pos_ = end;
        return out;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
    int line_ = 1;
};

struct Scope {
    Attributes node_defaults;
    Attributes edge_defaults;
};

class Reader {
public:
    explicit Reader(std::string_view text) : lexer_(text) { advance(); }

    AnnotatedLayout read() {
        if (is_keyword("strict")) {
            layout_.strict = true;
            advance();
        }
        if (is_keyword("digraph")) {
            layout_.directed = true;
        } else if (is_keyword("graph")) {
            layout_.directed = false;
        } else {
            fail("expected 'graph' or 'digraph'");
        }
        advance();
        if (tok_.type == Token::Type::Id) {
            layout_.name = tok_.text;
            advance();
        }
        expect_punct("{");
        Scope root;
        std::vector<std::string> members;
        stmt_list(root, true, members);
        expect_punct("}");
        if (tok_.type != Token::Type::End) fail("trailing content after graph");
        return std::move(layout_);
    }

private:
    void advance() { tok_ = lexer_.next(); }

    [[noreturn]] void fail(const std::string& what) const {
        throw DotSyntaxError(tok_.line, what + (tok_.text.empty() ? "" : ", got '" + tok_.text + "'"));
    }

    bool is_punct(const char* p) const {
        return tok_.type == Token::Type::Punct && tok_.text == p;
    }

    bool is_keyword(const char* kw) const {
        return tok_.type == Token::Type::Id && !tok_.quoted && lower(tok_.text) == kw;
    }

    void expect_punct(const char* p) {
        if (!is_punct(p)) fail(std::string("expected '") + p + "'");
        advance();
    }

    std::string expect_id() {
        if (tok_.type != Token::Type::Id) fail("expected identifier");
        std::string id = tok_.text;
        advance();
        return id;
    }

    void stmt_list(Scope& scope, bool root, std::vector<std::string>& members) {
        while (tok_.type != Token::Type::End && !is_punct("}")) {
            stmt(scope, root, members);
            if (is_punct(";")) advance();
        }
    }

    void stmt(Scope& scope, bool root, std::vector<std::string>& members) {
        if (is_keyword("graph") || is_keyword("node") || is_keyword("edge")) {
            const std::string kind = lower(tok_.text);
            advance();
            Attributes attrs;
            attr_list(attrs);
            if (kind == "graph") {
                if (root) merge(layout_.graph_attrs, attrs);
            } else if (kind == "node") {
                merge(scope.node_defaults, attrs);
            } else {
                merge(scope.edge_defaults, attrs);
            }
            return;
        }

        std::vector<std::string> operand;
        if (is_keyword("subgraph") || is_punct("{")) {
            operand = subgraph(scope);
        } else {
            const std::string id = expect_id();
            if (is_punct("=")) {
                advance();
                const std::string value = expect_id();
                if (root) layout_.graph_attrs[id] = value;
                return;
            }
            skip_port();
            if (tok_.type != Token::Type::EdgeOp) {
                Attributes attrs;
                if (is_punct("[")) attr_list(attrs);
                declare_node(scope, id, attrs);
                members.push_back(id);
                return;
            }
            declare_node(scope, id, {});
            operand.push_back(id);
        }
        members.insert(members.end(), operand.begin(), operand.end());

        if (tok_.type != Token::Type::EdgeOp) {
            // Plain subgraph statement.
            return;
        }

        std::vector<std::vector<std::string>> chain{operand};
        while (tok_.type == Token::Type::EdgeOp) {
            advance();
            std::vector<std::string> next;
            if (is_keyword("subgraph") || is_punct("{")) {
                next = subgraph(scope);
            } else {
                const std::string id = expect_id();
                skip_port();
                declare_node(scope, id, {});
                next.push_back(id);
            }
            members.insert(members.end(), next.begin(), next.end());
            chain.push_back(std::move(next));
        }

        Attributes attrs = scope.edge_defaults;
        if (is_punct("[")) attr_list(attrs);
        for (std::size_t i = 0; i + 1 < chain.size(); ++i) {
            for (const auto& tail : chain[i]) {
                for (const auto& head : chain[i + 1])
                    layout_.edges.push_back(LayoutEdge{tail, head, attrs});
            }
        }
    }

    std::vector<std::string> subgraph(const Scope& parent) {
        if (is_keyword("subgraph")) {
            advance();
            if (tok_.type == Token::Type::Id) advance();
        }
        expect_punct("{");
        Scope scope = parent;
        std::vector<std::string> members;
        stmt_list(scope, false, members);
        expect_punct("}");
        return members;
    }

    void skip_port() {
        while (is_punct(":")) {
            advance();
            expect_id();
        }
    }

    void attr_list(Attributes& out) {
        if (!is_punct("[")) fail("expected '['");
        while (is_punct("[")) {
            advance();
            while (!is_punct("]")) {
                const std::string key = expect_id();
                std::string value = "true";
                if (is_punct("=")) {
                    advance();
                    value = expect_id();
                }
                out[key] = value;
                if (is_punct(",") || is_punct(";")) advance();
            }
            advance();
        }
    }

    void declare_node(const Scope& scope, const std::string& name, const Attributes& attrs) {
        auto it = node_index_.find(name);
        if (it == node_index_.end()) {
            LayoutNode node;
            node.name = name;
            node.attrs = scope.node_defaults;
            merge(node.attrs, attrs);
            node_index_.emplace(name, layout_.nodes.size());
            layout_.nodes.push_back(std::move(node));
        } else {
            merge(layout_.nodes[it->second].attrs, attrs);
        }
    }

    static void merge(Attributes& into, const Attributes& from) {
        for (const auto& [key, value] : from)
            into[key] = value;
    }

    Lexer lexer_;
    Token tok_;
    AnnotatedLayout layout_;
    std::unordered_map<std::string, std::size_t> node_index_;
};

} // namespace

std::optional<std::string> find_attr(const Attributes& attrs, const std::string& key) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return std::nullopt;
    return it->second;
}

std::variant<AnnotatedLayout, LoadError> parse_annotated_layout(std::string_view text) {
    try {
        Reader reader(text);
        return reader.read();
    } catch (const DotSyntaxError& e) {
        return LoadError{LoadError::Kind::Syntax, e.what()};
    }
}

} // namespace xdot_loaders
