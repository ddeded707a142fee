#include "Lexer.h"

#include <cctype>

Lexer::Lexer(std::string_view source)
    : source_(source) {}

char Lexer::peek(std::size_t offset) const {
    const std::size_t at = pos_ + offset;
    return at < source_.size() ? source_[at] : '\0';
}

Token Lexer::next() {
    skipWhitespace();

    if (pos_ >= source_.size()) {
        return {TokenType::Eof, "", line_, column_};
    }

    const int startLine = line_;
    const int startCol = column_;
    const char c = peek();

    switch (c) {
    case ';':
        advance();
        return {TokenType::Semicolon, ";", startLine, startCol};
    case '=':
        advance();
        return {TokenType::Assign, "=", startLine, startCol};
    case '"':
        return readStringLiteral(startLine, startCol);
    default:
        break;
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        return readNumber(startLine, startCol);
    }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return readIdentifier(startLine, startCol);
    }

    advance();
    return {TokenType::Unknown, std::string(1, c), startLine, startCol};
}

void Lexer::advance() {
    if (pos_ >= source_.size()) {
        return;
    }
    if (source_[pos_] == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    pos_++;
}

bool Lexer::skipComment() {
    // Однострочные: // и #
    if (peek() == '#' || (peek() == '/' && peek(1) == '/')) {
        while (pos_ < source_.size() && peek() != '\n') {
            advance();
        }
        return true;
    }

    // Блочный комментарий; незакрытый тянется до конца файла
    if (peek() == '/' && peek(1) == '*') {
        advance();
        advance();
        while (pos_ < source_.size() && !(peek() == '*' && peek(1) == '/')) {
            advance();
        }
        advance();
        advance();
        return true;
    }
    return false;
}

void Lexer::skipWhitespace() {
    while (pos_ < source_.size()) {
        if (std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        } else if (!skipComment()) {
            break;
        }
    }
}

Token Lexer::readStringLiteral(int startLine, int startCol) {
    advance();  // открывающая кавычка
    std::string value;

    while (pos_ < source_.size()) {
        const char c = peek();
        if (c == '"') {
            advance();
            return {TokenType::StringLiteral, value, startLine, startCol};
        }
        if (c == '\n') {
            break;
        }
        if (c == '\\' && (peek(1) == '"' || peek(1) == '\\')) {
            advance();
            value.push_back(peek());
            advance();
            continue;
        }
        value.push_back(c);
        advance();
    }

    // Незакрытая строка
    return {TokenType::Unknown, value, startLine, startCol};
}

Token Lexer::readIdentifier(int startLine, int startCol) {
    std::string value;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
        value.push_back(peek());
        advance();
    }

    if (value == "true" || value == "false") {
        return {TokenType::Boolean, value, startLine, startCol};
    }
    return {TokenType::Identifier, value, startLine, startCol};
}

Token Lexer::readNumber(int startLine, int startCol) {
    std::string value;
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        value.push_back(peek());
        advance();
    }
    return {TokenType::Number, value, startLine, startCol};
}
