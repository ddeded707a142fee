#pragma once

#include <iosfwd>
#include <string>
#include <vector>

/** @brief Уровень диагностического сообщения */
enum class DiagnosticLevel { Error, Warning, Info };

/** @brief Диагностическое сообщение (файлы примеров, настройки, шифр) */
struct Diagnostic {
    DiagnosticLevel level{DiagnosticLevel::Error};
    int line{0};
    int column{0};
    std::string message;
};

/** @brief Есть ли среди сообщений ошибки */
bool hasErrors(const std::vector<Diagnostic>& diagnostics);

/**
 * @brief Вывести диагностику в поток
 * @param out Поток вывода (обычно std::cout)
 * @param source Имя источника (файл), печатается перед сообщением
 */
void printDiagnostics(std::ostream& out, const std::string& source,
                      const std::vector<Diagnostic>& diagnostics);
