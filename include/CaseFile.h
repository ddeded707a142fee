#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Diagnostics.h"

/** @brief Разделитель ключа и сообщения в строке примера ("3#HOLA MUNDO") */
inline constexpr char kCaseSeparator = '#';

/** @brief Разобранная строка примера */
struct CipherCase {
    std::string keyText;  // Ключ как записан в файле ("D", "13")
    int shift{0};
    std::string message;
};

/**
 * @brief Разобрать строку вида КЛЮЧ#СООБЩЕНИЕ
 * @param line Строка примера
 * @param lineNo Номер строки для диагностики (0 - без номера)
 * @param out Диагностика при ошибке формата или ключа
 */
std::optional<CipherCase> parseCase(std::string_view line, int lineNo,
                                    std::vector<Diagnostic>& out);

/** @brief Загрузить непустые строки из файла примеров (пробелы по краям обрезаются) */
std::vector<std::string> loadTestCases(const std::string& path, std::vector<Diagnostic>& out);

/** @brief Записать текст в файл результата */
bool saveResult(const std::string& path, const std::string& content, std::vector<Diagnostic>& out);

/** @brief Встроенные примеры шифрования */
std::vector<std::string> sampleEncryptCases();

/** @brief Примеры дешифрования, соответствующие примерам шифрования */
std::vector<std::string> generateDecryptCases(const std::vector<std::string>& encryptCases,
                                              std::vector<Diagnostic>& out);

/**
 * @brief Создать файлы примеров
 *
 * Файл шифрования создаётся только если его нет; файл дешифрования
 * всегда пересобирается из содержимого файла шифрования.
 */
bool createSampleFiles(const std::string& encryptPath, const std::string& decryptPath,
                       std::vector<Diagnostic>& out);

/** @brief Содержимое файла результата */
struct ResultReport {
    std::string operation;   // "Encryption" / "Decryption"
    std::string input;       // Исходная строка КЛЮЧ#СООБЩЕНИЕ
    int shift{0};
    std::string original;
    std::string result;
    std::uint64_t steps{0};
    std::string haltReason;
};

/** @brief Сформировать текст файла результата */
std::string formatResultReport(const ResultReport& report);

/** @brief Удалить пробельные символы по краям строки */
std::string trimCopy(std::string_view str);
