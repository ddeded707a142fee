#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/** @brief Типы токенов файла настроек */
enum class TokenType {
    Eof,            // Конец файла
    Identifier,     // Идентификатор (font, max_steps)
    StringLiteral,  // Строковый литерал ("casos_encriptar.txt")
    Number,         // Целое неотрицательное число (100000)
    Boolean,        // true / false
    Semicolon,      // Точка с запятой ;
    Assign,         // Присваивание =
    Unknown         // Неизвестный токен
};

/** @brief Представление лексемы */
struct Token {
    TokenType type{TokenType::Eof};
    std::string value;
    int line{1};
    int column{1};
};

/**
 * @brief Лексический анализатор файла настроек
 *
 * Пропускает комментарии "//", "#" и блочные. В строковых литералах
 * допускаются экранированные \" и \\.
 */
class Lexer {
public:
    explicit Lexer(std::string_view source);

    Token next();

private:
    void advance();
    void skipWhitespace();
    bool skipComment();
    char peek(std::size_t offset = 0) const;
    Token readStringLiteral(int startLine, int startCol);
    Token readIdentifier(int startLine, int startCol);
    Token readNumber(int startLine, int startCol);

    std::string_view source_;
    std::size_t pos_{0};
    int line_{1};
    int column_{1};
};
