#include "CaseFile.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "CaesarCipher.h"

std::string trimCopy(std::string_view str) {
    std::size_t begin = 0;
    std::size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }
    return std::string(str.substr(begin, end - begin));
}

std::optional<CipherCase> parseCase(std::string_view line, int lineNo,
                                    std::vector<Diagnostic>& out) {
    // Разделяет только первый '#', остальные остаются в сообщении
    const auto sep = line.find(kCaseSeparator);
    if (sep == std::string_view::npos) {
        out.push_back({DiagnosticLevel::Error, lineNo, 0,
                       "Неверный формат: требуется разделитель '#' (КЛЮЧ#СООБЩЕНИЕ)"});
        return std::nullopt;
    }

    CipherCase result;
    result.keyText = std::string(line.substr(0, sep));
    result.message = std::string(line.substr(sep + 1));

    const auto shift = parseKey(result.keyText);
    if (!shift) {
        out.push_back({DiagnosticLevel::Error, lineNo, 1,
                       "Некорректный ключ '" + result.keyText + "': ожидается число или одна буква"});
        return std::nullopt;
    }
    result.shift = *shift;
    return result;
}

std::vector<std::string> loadTestCases(const std::string& path, std::vector<Diagnostic>& out) {
    std::vector<std::string> cases;

    std::ifstream file(path);
    if (!file.is_open()) {
        out.push_back({DiagnosticLevel::Error, 0, 0, "Файл не найден: '" + path + "'"});
        return cases;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string trimmed = trimCopy(line);
        if (!trimmed.empty()) {
            cases.push_back(std::move(trimmed));
        }
    }
    return cases;
}

bool saveResult(const std::string& path, const std::string& content, std::vector<Diagnostic>& out) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        out.push_back({DiagnosticLevel::Error, 0, 0, "Не удалось открыть файл для записи: '" + path + "'"});
        return false;
    }
    file << content;
    if (!file) {
        out.push_back({DiagnosticLevel::Error, 0, 0, "Ошибка записи в файл: '" + path + "'"});
        return false;
    }
    return true;
}

std::vector<std::string> sampleEncryptCases() {
    return {
        "3#ROMA NO FUE CONSTRUIDA EN UN DIA",
        "1#HOLA MUNDO",
        "5#PYTHON ES GENIAL",
        "D#CESAR FUE UN EMPERADOR",
        "13#ESTE ES UN MENSAJE SECRETO",
        "7#LA TEORIA DE LA COMPUTACION ES FASCINANTE",
        "B#MAQUINA DE TURING",
        "10#ALGORITMOS Y ESTRUCTURAS DE DATOS",
        "A#PROYECTO DE TEORIA DE LA COMPUTACION",
        "Z#CIFRADO CESAR ES SIMPLE PERO INTERESANTE",
    };
}

std::vector<std::string> generateDecryptCases(const std::vector<std::string>& encryptCases,
                                              std::vector<Diagnostic>& out) {
    std::vector<std::string> result;
    result.reserve(encryptCases.size());

    int lineNo = 0;
    for (const auto& line : encryptCases) {
        lineNo++;
        const auto parsed = parseCase(line, lineNo, out);
        if (!parsed) {
            continue;
        }
        // Ключ сохраняется в исходной записи
        result.push_back(parsed->keyText + kCaseSeparator + caesarEncrypt(parsed->message, parsed->shift));
    }
    return result;
}

static std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); i++) {
        out += lines[i];
        if (i + 1 < lines.size()) {
            out += '\n';
        }
    }
    return out;
}

bool createSampleFiles(const std::string& encryptPath, const std::string& decryptPath,
                       std::vector<Diagnostic>& out) {
    std::error_code ec;
    if (!std::filesystem::exists(encryptPath, ec)) {
        if (!saveResult(encryptPath, joinLines(sampleEncryptCases()), out)) {
            return false;
        }
        out.push_back({DiagnosticLevel::Info, 0, 0, "Создан файл '" + encryptPath + "'"});
    }

    const auto encryptCases = loadTestCases(encryptPath, out);
    const auto decryptCases = generateDecryptCases(encryptCases, out);
    if (!saveResult(decryptPath, joinLines(decryptCases), out)) {
        return false;
    }
    out.push_back({DiagnosticLevel::Info, 0, 0, "Обновлён файл '" + decryptPath + "'"});
    return true;
}

std::string formatResultReport(const ResultReport& report) {
    std::ostringstream ss;
    ss << "Operation: " << report.operation << "\n"
       << "Input: " << report.input << "\n"
       << "Key: " << report.shift << "\n"
       << "Original: " << report.original << "\n"
       << "Result: " << report.result << "\n"
       << "Steps: " << report.steps << "\n"
       << "Halt: " << report.haltReason << "\n";
    return ss.str();
}
