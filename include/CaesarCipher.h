#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Diagnostics.h"
#include "TuringMachine.h"

/** @brief Алфавит шифра: только 26 заглавных латинских букв (остальные байты не меняются) */
inline constexpr std::string_view kCipherAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
inline constexpr int kCipherAlphabetSize = 26;

/** @brief Состояния машины шифрования */
inline const StateId kStateScan = "q_scan";
inline const StateId kStateAccept = "q_accept";

/**
 * @brief Разобрать ключ шифра
 *
 * Число из цифр - сдвиг как есть ("13" -> 13), одна буква - её номер
 * в алфавите без учёта регистра ("A" -> 1, "Z" -> 26).
 * @return Сдвиг или nullopt для некорректного ключа
 */
std::optional<int> parseKey(std::string_view keyText);

/** @brief Привести сдвиг к диапазону [0, 26) */
int normalizeShift(int shift);

/** @brief Сдвинуть букву алфавита; прочие символы не меняются */
char shiftLetter(char c, int shift);

/** @brief Шифрование: E(x) = (x + k) mod 26, пробелы и прочие символы без изменений */
std::string caesarEncrypt(std::string_view message, int shift);

/** @brief Дешифрование: D(x) = (x - k) mod 26 */
std::string caesarDecrypt(std::string_view message, int shift);

/**
 * @brief Построить машину Тьюринга, выполняющую сдвиг Цезаря
 *
 * Машина проходит ленту слева направо в состоянии q_scan, заменяя каждую
 * букву сдвинутой, и переходит в q_accept на первом пустом символе.
 * Для дешифрования используется сдвиг 26 - k.
 */
MachineSpec buildCaesarMachine(int shift);

/** @brief Проверить, что все байты сообщения входят во входной алфавит машины */
bool checkCipherInput(std::string_view message, const MachineSpec& spec,
                      std::vector<Diagnostic>& out);

/** @brief Результат прогона шифра на машине Тьюринга */
struct CipherResult {
    bool ok{false};
    std::string text;
    std::uint64_t steps{0};
    HaltReason haltReason{HaltReason::Running};
    std::vector<Diagnostic> diagnostics;
};

/** @brief Выполнить сдвиг на машине Тьюринга */
CipherResult runCaesarMachine(std::string_view message, int shift,
                              std::uint64_t maxSteps = kDefaultMaxSteps);
