#pragma once

#include <string>

#include "TuringMachine.h"

/** @brief Отображаемое имя символа ленты (пробел как <sp>, непечатные байты как 0xNN) */
std::string displaySymbol(Symbol symbol);

/** @brief Переход в виде "q_scan, D, R" */
std::string formatTransition(const Transition& transition);

/**
 * @brief Текстовое описание машины Тьюринга
 *
 * Состояния, алфавиты и переходы перечисляются в отсортированном порядке,
 * поэтому вывод для одной и той же машины всегда одинаков.
 */
std::string describeMachine(const MachineSpec& spec, const std::string& title);

/** @brief Описание машины шифра Цезаря со сдвигом k и формулами шифра */
std::string describeCaesarMachine(int shift);
