#include "TransitionTable.h"

#include <algorithm>
#include <set>

bool TransitionTable::add(const StateId& state, Symbol symbol, const Transition& transition) {
    // Детерминированность: только один переход на пару (состояние, символ).
    return transitions_.emplace(Key{state, symbol}, transition).second;
}

bool TransitionTable::has(const StateId& state, Symbol symbol) const {
    return transitions_.find(Key{state, symbol}) != transitions_.end();
}

const Transition* TransitionTable::get(const StateId& state, Symbol symbol) const {
    auto it = transitions_.find(Key{state, symbol});
    if (it == transitions_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<StateId> TransitionTable::states() const {
    std::set<StateId> s;
    for (const auto& kv : transitions_) {
        s.insert(kv.first.state);
        s.insert(kv.second.nextState);
    }
    return {s.begin(), s.end()};
}

std::vector<Symbol> TransitionTable::alphabet() const {
    std::set<Symbol> a;
    for (const auto& kv : transitions_) {
        a.insert(kv.first.symbol);
        a.insert(kv.second.writeSymbol);
    }
    return {a.begin(), a.end()};
}

std::vector<TransitionRule> TransitionTable::rules() const {
    std::vector<TransitionRule> out;
    out.reserve(transitions_.size());
    for (const auto& kv : transitions_) {
        out.push_back({kv.first.state, kv.first.symbol, kv.second});
    }

    // unordered_map не гарантирует порядок - сортируем для воспроизводимого вывода
    std::sort(out.begin(), out.end(), [](const TransitionRule& a, const TransitionRule& b) {
        if (a.state != b.state) {
            return a.state < b.state;
        }
        return a.symbol < b.symbol;
    });
    return out;
}
