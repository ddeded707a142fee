#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <set>
#include <string>
#include <string_view>

#include "TransitionTable.h"
#include "Types.h"

/**
 * @brief Лента машины Тьюринга, бесконечная в обе стороны
 *
 * Физически хранится конечная последовательность символов, которая
 * дополняется пустыми символами по мере необходимости: справа при чтении
 * за концом, слева при сдвиге головки за нулевую позицию. Позиция головки
 * всегда остаётся в пределах [0, size()).
 */
class Tape {
public:
    explicit Tape(Symbol blank = kBlank);

    /** @brief Записать входную строку и один пустой символ, головка в 0 */
    void load(std::string_view input);

    /** @brief Прочитать символ под головкой (с дополнением справа) */
    Symbol read();

    /** @brief Записать символ в текущую позицию */
    void write(Symbol value);

    /** @brief Переместить головку */
    void move(Move move);

    /** @brief Содержимое ленты без завершающих пустых символов */
    std::string content() const;

    /** @brief Символ в ячейке (пустой за пределами ленты) */
    Symbol get(long long index) const;

    std::size_t head() const { return head_; }
    std::size_t size() const { return cells_.size(); }

private:
    void padToHead();

    Symbol blank_;
    std::deque<Symbol> cells_;
    std::size_t head_{0};
};

/** @brief Описание машины Тьюринга (неизменно после создания машины) */
struct MachineSpec {
    std::set<StateId> states;
    std::set<Symbol> inputAlphabet;
    std::set<Symbol> tapeAlphabet;
    StateId initialState;
    std::set<StateId> acceptStates;
    TransitionTable transitions;
};

/** @brief Причина остановки машины */
enum class HaltReason {
    Running,       ///< Машина ещё не остановилась
    Accepted,      ///< Достигнуто допускающее состояние
    NoTransition,  ///< Нет перехода для текущей пары (state, symbol)
    MaxSteps       ///< Исчерпан лимит шагов вне допускающего состояния
};

/** @brief Текстовое имя причины остановки */
const char* haltReasonName(HaltReason reason);

/** @brief Лимит шагов run() по умолчанию */
inline constexpr std::uint64_t kDefaultMaxSteps = 100000;

/**
 * @brief Детерминированная одноленточная машина Тьюринга
 *
 * Описание задаётся один раз в конструкторе; loadTape() сбрасывает ленту,
 * головку и состояние, так что одну машину можно прогонять на многих входах.
 */
class TuringMachine {
public:
    explicit TuringMachine(MachineSpec spec);

    /** @brief Загрузить вход на ленту и сбросить машину */
    void loadTape(std::string_view input);

    /**
     * @brief Выполнить один шаг
     * @return true если переход выполнен, false если машина остановилась
     */
    bool step();

    /**
     * @brief Выполнять шаги до остановки или до исчерпания лимита
     * @param maxSteps Максимальное число переходов за этот вызов
     * @return Содержимое ленты в момент остановки
     */
    std::string run(std::uint64_t maxSteps = kDefaultMaxSteps);

    /** @brief Содержимое ленты без завершающих пустых символов */
    std::string getTapeContent() const;

    const MachineSpec& spec() const { return spec_; }
    const Tape& tape() const { return tape_; }
    const StateId& state() const { return state_; }
    std::size_t head() const { return tape_.head(); }

    /** @brief Число переходов с момента последнего loadTape() */
    std::uint64_t steps() const { return steps_; }

    HaltReason haltReason() const { return haltReason_; }
    bool isHalted() const { return haltReason_ != HaltReason::Running; }

    /** @brief Текущее состояние допускающее (проверка без шага) */
    bool inAcceptState() const { return spec_.acceptStates.count(state_) != 0; }

private:
    MachineSpec spec_;
    Tape tape_;
    StateId state_;
    std::uint64_t steps_{0};
    HaltReason haltReason_{HaltReason::Running};
};
