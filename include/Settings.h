#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "Diagnostics.h"
#include "TuringMachine.h"

/** @brief Настройки приложения (значения по умолчанию переопределяются settings.txt) */
struct AppSettings {
    std::string fontPath{"/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf"};

    // Файлы примеров и результатов
    std::string encryptCasesFile{"casos_encriptar.txt"};
    std::string decryptCasesFile{"casos_decriptar.txt"};
    std::string encryptResultFile{"resultado_encriptacion.txt"};
    std::string decryptResultFile{"resultado_decriptacion.txt"};
    std::string manualResultFile{"resultado_manual.txt"};
    std::string descriptionFile{"maquina_turing_especificacion.txt"};

    std::uint64_t maxSteps{kDefaultMaxSteps};  // Лимит шагов одного прогона
    std::uint64_t stepsPerFrame{1};            // Шагов за кадр в режиме Run
    bool fullscreen{true};
};

/** @brief Имя файла настроек в рабочем каталоге */
inline constexpr const char* kSettingsFile = "settings.txt";

/**
 * @brief Разобрать текст настроек вида `name = value;`
 *
 * Неизвестные ключи и ошибки синтаксиса дают диагностику; соответствующее
 * значение остаётся по умолчанию, разбор продолжается со следующего ';'.
 * @return false если были ошибки
 */
bool parseSettings(std::string_view source, AppSettings& settings, std::vector<Diagnostic>& out);

/** @brief Загрузить настройки из файла (отсутствие файла - не ошибка) */
bool loadSettings(const std::string& path, AppSettings& settings, std::vector<Diagnostic>& out);
