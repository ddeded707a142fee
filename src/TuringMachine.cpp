#include "TuringMachine.h"

#include <utility>

// Лента

Tape::Tape(Symbol blank) : blank_(blank) {}

void Tape::load(std::string_view input) {
    cells_.assign(input.begin(), input.end());
    cells_.push_back(blank_);
    head_ = 0;
}

void Tape::padToHead() {
    while (head_ >= cells_.size()) {
        cells_.push_back(blank_);
    }
}

Symbol Tape::read() {
    padToHead();
    return cells_[head_];
}

void Tape::write(Symbol value) {
    padToHead();
    cells_[head_] = value;
}

void Tape::move(Move move) {
    switch (move) {
    case Move::Left:
        // Выход за левый край: дописываем пустую ячейку спереди, головка остаётся в 0
        if (head_ == 0) {
            cells_.push_front(blank_);
        } else {
            head_--;
        }
        break;
    case Move::Right:
        head_++;
        padToHead();
        break;
    }
}

std::string Tape::content() const {
    std::string out(cells_.begin(), cells_.end());
    const auto last = out.find_last_not_of(blank_);
    if (last == std::string::npos) {
        return {};
    }
    out.erase(last + 1);
    return out;
}

Symbol Tape::get(long long index) const {
    if (index < 0 || static_cast<std::size_t>(index) >= cells_.size()) {
        return blank_;
    }
    return cells_[static_cast<std::size_t>(index)];
}

// Машина Тьюринга

const char* haltReasonName(HaltReason reason) {
    switch (reason) {
    case HaltReason::Running: return "running";
    case HaltReason::Accepted: return "accepted";
    case HaltReason::NoTransition: return "no transition";
    case HaltReason::MaxSteps: return "step limit";
    }
    return "unknown";
}

TuringMachine::TuringMachine(MachineSpec spec)
    : spec_(std::move(spec)), state_(spec_.initialState) {}

void TuringMachine::loadTape(std::string_view input) {
    tape_.load(input);
    state_ = spec_.initialState;
    steps_ = 0;
    haltReason_ = HaltReason::Running;
}

bool TuringMachine::step() {
    // Остановленную машину возобновляет только loadTape()
    if (isHalted()) {
        return false;
    }

    // Допускающее состояние проверяется до чтения ленты
    if (inAcceptState()) {
        haltReason_ = HaltReason::Accepted;
        return false;
    }

    const Symbol current = tape_.read();
    const Transition* transition = spec_.transitions.get(state_, current);
    if (!transition) {
        haltReason_ = HaltReason::NoTransition;
        return false;
    }

    // Применить переход
    tape_.write(transition->writeSymbol);
    state_ = transition->nextState;
    tape_.move(transition->move);
    steps_++;
    return true;
}

std::string TuringMachine::run(std::uint64_t maxSteps) {
    std::uint64_t performed = 0;
    while (performed < maxSteps && step()) {
        performed++;
    }

    // Лимит исчерпан: машина, уже дошедшая до допускающего состояния, допускает
    if (!isHalted()) {
        haltReason_ = inAcceptState() ? HaltReason::Accepted : HaltReason::MaxSteps;
    }
    return getTapeContent();
}

std::string TuringMachine::getTapeContent() const {
    return tape_.content();
}
