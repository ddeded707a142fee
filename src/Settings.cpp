#include "Settings.h"

#include <charconv>
#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_map>

#include "Lexer.h"

enum class ValueKind { String, Number, Boolean };

struct SettingField {
    ValueKind kind;
    std::function<void(AppSettings&, const Token&, std::uint64_t)> apply;
};

static const char* kindName(ValueKind kind) {
    switch (kind) {
    case ValueKind::String: return "строка";
    case ValueKind::Number: return "число";
    case ValueKind::Boolean: return "true/false";
    }
    return "значение";
}

static bool toUint64(const std::string& text, std::uint64_t& value) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && ptr == text.data() + text.size();
}

static const std::unordered_map<std::string, SettingField>& settingFields() {
    static const std::unordered_map<std::string, SettingField> fields = {
        {"font", {ValueKind::String, [](AppSettings& s, const Token& t, std::uint64_t) { s.fontPath = t.value; }}},
        {"encrypt_cases", {ValueKind::String, [](AppSettings& s, const Token& t, std::uint64_t) { s.encryptCasesFile = t.value; }}},
        {"decrypt_cases", {ValueKind::String, [](AppSettings& s, const Token& t, std::uint64_t) { s.decryptCasesFile = t.value; }}},
        {"encrypt_result", {ValueKind::String, [](AppSettings& s, const Token& t, std::uint64_t) { s.encryptResultFile = t.value; }}},
        {"decrypt_result", {ValueKind::String, [](AppSettings& s, const Token& t, std::uint64_t) { s.decryptResultFile = t.value; }}},
        {"manual_result", {ValueKind::String, [](AppSettings& s, const Token& t, std::uint64_t) { s.manualResultFile = t.value; }}},
        {"description", {ValueKind::String, [](AppSettings& s, const Token& t, std::uint64_t) { s.descriptionFile = t.value; }}},
        {"max_steps", {ValueKind::Number, [](AppSettings& s, const Token&, std::uint64_t n) { s.maxSteps = n; }}},
        {"steps_per_frame", {ValueKind::Number, [](AppSettings& s, const Token&, std::uint64_t n) { s.stepsPerFrame = n; }}},
        {"fullscreen", {ValueKind::Boolean, [](AppSettings& s, const Token& t, std::uint64_t) { s.fullscreen = (t.value == "true"); }}},
    };
    return fields;
}

static TokenType expectedToken(ValueKind kind) {
    switch (kind) {
    case ValueKind::String: return TokenType::StringLiteral;
    case ValueKind::Number: return TokenType::Number;
    case ValueKind::Boolean: return TokenType::Boolean;
    }
    return TokenType::Unknown;
}

bool parseSettings(std::string_view source, AppSettings& settings, std::vector<Diagnostic>& out) {
    bool ok = true;

    Lexer lexer(source);
    Token token = lexer.next();

    auto error = [&](const Token& at, const std::string& msg) {
        ok = false;
        out.push_back({DiagnosticLevel::Error, at.line, at.column, msg});
    };

    // Восстановление после ошибки: пропустить всё до ';' включительно
    auto skipStatement = [&]() {
        while (token.type != TokenType::Eof && token.type != TokenType::Semicolon) {
            token = lexer.next();
        }
        if (token.type == TokenType::Semicolon) {
            token = lexer.next();
        }
    };

    const auto& fields = settingFields();

    while (token.type != TokenType::Eof) {
        if (token.type != TokenType::Identifier) {
            error(token, "Ожидалось имя параметра");
            skipStatement();
            continue;
        }

        const Token nameToken = token;
        const auto field = fields.find(nameToken.value);
        if (field == fields.end()) {
            error(nameToken, "Неизвестный параметр '" + nameToken.value + "'");
            skipStatement();
            continue;
        }

        token = lexer.next();
        if (token.type != TokenType::Assign) {
            error(token, "Ожидался '=' после '" + nameToken.value + "'");
            skipStatement();
            continue;
        }

        token = lexer.next();
        const Token valueToken = token;
        if (valueToken.type != expectedToken(field->second.kind)) {
            error(valueToken, "Параметр '" + nameToken.value + "': ожидалось " + kindName(field->second.kind));
            skipStatement();
            continue;
        }

        std::uint64_t number = 0;
        if (field->second.kind == ValueKind::Number) {
            if (!toUint64(valueToken.value, number)) {
                error(valueToken, "Параметр '" + nameToken.value + "': слишком большое число");
                skipStatement();
                continue;
            }
            if (number == 0) {
                error(valueToken, "Параметр '" + nameToken.value + "' должен быть больше нуля");
                skipStatement();
                continue;
            }
        }

        token = lexer.next();
        if (token.type != TokenType::Semicolon) {
            error(token, "Ожидался ';'");
            skipStatement();
            continue;
        }

        field->second.apply(settings, valueToken, number);
        token = lexer.next();
    }

    return ok;
}

bool loadSettings(const std::string& path, AppSettings& settings, std::vector<Diagnostic>& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return true;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parseSettings(ss.str(), settings, out);
}
