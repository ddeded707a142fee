#include "MachineDocument.h"

#include <cctype>
#include <iomanip>
#include <sstream>

#include "CaesarCipher.h"

std::string displaySymbol(Symbol symbol) {
    if (symbol == ' ') {
        return "<sp>";
    }
    const auto code = static_cast<unsigned char>(symbol);
    if (std::isprint(code)) {
        return std::string(1, symbol);
    }
    // Управляющие байты и байты UTF-8 - шестнадцатеричным кодом
    std::ostringstream ss;
    ss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<int>(code);
    return ss.str();
}

std::string formatTransition(const Transition& transition) {
    return transition.nextState + ", " + displaySymbol(transition.writeSymbol) + ", " +
           moveLetter(transition.move);
}

static std::string joinSymbols(const std::set<Symbol>& symbols) {
    std::string out;
    for (const Symbol sym : symbols) {
        if (!out.empty()) {
            out += ' ';
        }
        out += displaySymbol(sym);
    }
    return out;
}

std::string describeMachine(const MachineSpec& spec, const std::string& title) {
    std::ostringstream ss;

    ss << title << "\n";
    ss << std::string(title.size(), '=') << "\n\n";
    ss << "Type: deterministic single-tape Turing machine\n\n";

    // Состояния (std::set - уже отсортированы)
    ss << "States (" << spec.states.size() << "):\n";
    for (const auto& state : spec.states) {
        ss << "  " << state;
        if (state == spec.initialState) {
            ss << "  [initial]";
        }
        if (spec.acceptStates.count(state)) {
            ss << "  [accept]";
        }
        ss << "\n";
    }
    ss << "\n";

    ss << "Initial state: " << spec.initialState << "\n";
    ss << "Accept states:";
    for (const auto& state : spec.acceptStates) {
        ss << " " << state;
    }
    ss << "\n";
    ss << "Blank symbol: " << kBlank << "\n\n";

    ss << "Input alphabet (" << spec.inputAlphabet.size() << "): " << joinSymbols(spec.inputAlphabet) << "\n";
    ss << "Tape alphabet (" << spec.tapeAlphabet.size() << "): " << joinSymbols(spec.tapeAlphabet) << "\n\n";

    const auto rules = spec.transitions.rules();
    ss << "Transitions (" << rules.size() << "):\n";
    ss << "  format: (state, read) -> (next, write, move)\n";
    for (const auto& rule : rules) {
        ss << "  (" << rule.state << ", " << displaySymbol(rule.symbol) << ") -> ("
           << formatTransition(rule.transition) << ")\n";
    }
    return ss.str();
}

std::string describeCaesarMachine(int shift) {
    const int k = normalizeShift(shift);
    std::ostringstream ss;
    ss << describeMachine(buildCaesarMachine(k), "Turing machine for Caesar cipher (k = " + std::to_string(k) + ")");
    ss << "\n";
    ss << "Cipher:\n";
    ss << "  encryption: E(x) = (x + k) mod 26\n";
    ss << "  decryption: D(x) = (x - k) mod 26, run as E with k' = 26 - k\n";
    ss << "  alphabet size: 26 (A-Z); spaces and other symbols are copied unchanged\n";
    return ss.str();
}
