#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

#include "Types.h"

/** @brief Одно правило перехода машины Тьюринга */
struct Transition {
    StateId nextState;
    Symbol writeSymbol{kBlank};
    Move move{Move::Right};
};

/** @brief Правило вместе с ключом (для перечисления таблицы) */
struct TransitionRule {
    StateId state;
    Symbol symbol{kBlank};
    Transition transition;
};

/**
 * @brief Таблица переходов (программа) машины Тьюринга
 *
 * Таблица не обязана быть полной: отсутствие правила для пары
 * (состояние, символ) означает остановку машины.
 */
class TransitionTable {
public:
    /** @brief Добавить правило перехода (false, если пара уже занята) */
    bool add(const StateId& state, Symbol symbol, const Transition& transition);

    /** @brief Проверить наличие перехода */
    bool has(const StateId& state, Symbol symbol) const;

    /** @brief Получить переход (nullptr если не найден) */
    const Transition* get(const StateId& state, Symbol symbol) const;

    /** @brief Все состояния, упомянутые в таблице (по возрастанию) */
    std::vector<StateId> states() const;

    /** @brief Все символы, упомянутые в таблице (по возрастанию) */
    std::vector<Symbol> alphabet() const;

    /** @brief Все правила в порядке (состояние, символ) */
    std::vector<TransitionRule> rules() const;

    std::size_t size() const { return transitions_.size(); }
    bool empty() const { return transitions_.empty(); }

private:
    struct Key {
        StateId state;
        Symbol symbol;
        bool operator==(const Key& other) const {
            return state == other.state && symbol == other.symbol;
        }
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            const std::size_t hs = std::hash<StateId>{}(key.state);
            const std::size_t hsym = std::hash<Symbol>{}(key.symbol);
            return hs ^ (hsym << 1);
        }
    };

    std::unordered_map<Key, Transition, KeyHash> transitions_;
};
