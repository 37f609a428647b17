#include "schedexpr/lexer.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace schedexpr {

static bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static ParseError lex_error(const std::string& what, std::size_t offset) {
    return ParseError(what + " (at offset " + std::to_string(offset) + ")");
}

const char* describe(TokKind k) {
    switch (k) {
        case TokKind::Name:      return "name";
        case TokKind::Integer:   return "number";
        case TokKind::Union:     return "'|'";
        case TokKind::Intersect: return "'&'";
        case TokKind::Not:       return "'!'";
        case TokKind::Open:      return "'('";
        case TokKind::Close:     return "')'";
        case TokKind::Comma:     return "','";
        case TokKind::Define:    return "'='";
        case TokKind::End:       return "end of input";
        case TokKind::Call:      return "call";
    }
    return "token";
}

Token Lexer::next() {
    if (ahead_) {
        Token t = std::move(*ahead_);
        ahead_.reset();
        return t;
    }
    return scan();
}

const Token& Lexer::peek() {
    if (!ahead_) ahead_ = scan();
    return *ahead_;
}

Token Lexer::scan() {
    while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;

    const std::size_t start = pos_;
    if (pos_ >= src_.size()) return Token{TokKind::End, {}, 0, 0, start};

    TokKind punct = TokKind::End;
    switch (src_[pos_]) {
        case '|': punct = TokKind::Union; break;
        case '&': punct = TokKind::Intersect; break;
        case '!': punct = TokKind::Not; break;
        case '(': punct = TokKind::Open; break;
        case ')': punct = TokKind::Close; break;
        case ',': punct = TokKind::Comma; break;
        case '=': punct = TokKind::Define; break;
        default: break;
    }
    if (punct != TokKind::End) {
        ++pos_;
        return Token{punct, {}, 0, 0, start};
    }

    const char c = src_[pos_];
    if (c == '`') return scan_quoted(start);
    if (is_name_start(c)) return scan_name(start);
    if (std::isdigit(static_cast<unsigned char>(c))) return scan_integer(start);

    throw lex_error(std::string("Unexpected character '") + c + "'", start);
}

// `pricing window`: anything up to the closing backtick, no escapes.
Token Lexer::scan_quoted(std::size_t start) {
    const std::size_t end = src_.find('`', start + 1);
    if (end == std::string_view::npos) throw lex_error("Unterminated backtick name", start);
    if (end == start + 1) throw lex_error("Empty backtick name", start);
    pos_ = end + 1;
    return Token{TokKind::Name, std::string(src_.substr(start + 1, end - start - 1)), 0, 0, start};
}

Token Lexer::scan_name(std::size_t start) {
    while (pos_ < src_.size() && is_name_char(src_[pos_])) ++pos_;
    return Token{TokKind::Name, std::string(src_.substr(start, pos_ - start)), 0, 0, start};
}

Token Lexer::scan_integer(std::size_t start) {
    while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
    if (pos_ < src_.size() && is_name_char(src_[pos_])) throw lex_error("Invalid number", start);

    const std::string digits(src_.substr(start, pos_ - start));
    errno = 0;
    const long v = std::strtol(digits.c_str(), nullptr, 10);
    if (errno == ERANGE) throw lex_error("Number out of range: " + digits, start);
    return Token{TokKind::Integer, {}, v, 0, start};
}

} // namespace schedexpr
