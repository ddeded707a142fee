#pragma once

#include <string>

/** @brief Идентификатор состояния машины Тьюринга (q0, q_scan, ...) */
using StateId = std::string;

/** @brief Символ алфавита ленты машины Тьюринга */
using Symbol = char;

/** @brief Пустой символ ленты */
inline constexpr Symbol kBlank = '_';

/** @brief Направление движения головки */
enum class Move { Left, Right };

/** @brief Буквенное обозначение направления (L/R) */
inline char moveLetter(Move move) {
    return move == Move::Left ? 'L' : 'R';
}
