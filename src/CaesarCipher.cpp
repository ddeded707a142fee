#include "CaesarCipher.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <utility>

static std::string describeSymbol(char c) {
    std::ostringstream ss;
    if (std::isprint(static_cast<unsigned char>(c))) {
        ss << '\'' << c << '\'';
    } else {
        ss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
           << static_cast<int>(static_cast<unsigned char>(c));
    }
    return ss.str();
}

std::optional<int> parseKey(std::string_view keyText) {
    if (keyText.empty()) {
        return std::nullopt;
    }

    const bool allDigits = std::all_of(keyText.begin(), keyText.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (allDigits) {
        int value = 0;
        const auto [ptr, ec] = std::from_chars(keyText.data(), keyText.data() + keyText.size(), value);
        if (ec != std::errc() || ptr != keyText.data() + keyText.size()) {
            return std::nullopt;  // переполнение int
        }
        return value;
    }

    // Буквенный ключ: A=1 ... Z=26
    if (keyText.size() == 1 && std::isalpha(static_cast<unsigned char>(keyText[0]))) {
        const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(keyText[0])));
        const auto pos = kCipherAlphabet.find(upper);
        if (pos != std::string_view::npos) {
            return static_cast<int>(pos) + 1;
        }
    }
    return std::nullopt;
}

int normalizeShift(int shift) {
    return ((shift % kCipherAlphabetSize) + kCipherAlphabetSize) % kCipherAlphabetSize;
}

char shiftLetter(char c, int shift) {
    const auto pos = kCipherAlphabet.find(c);
    if (pos == std::string_view::npos) {
        return c;
    }
    const int newPos = normalizeShift(static_cast<int>(pos) + normalizeShift(shift));
    return kCipherAlphabet[static_cast<std::size_t>(newPos)];
}

std::string caesarEncrypt(std::string_view message, int shift) {
    std::string result;
    result.reserve(message.size());
    for (const char c : message) {
        result.push_back(shiftLetter(c, shift));
    }
    return result;
}

std::string caesarDecrypt(std::string_view message, int shift) {
    return caesarEncrypt(message, -normalizeShift(shift));
}

MachineSpec buildCaesarMachine(int shift) {
    MachineSpec spec;
    spec.states = {kStateScan, kStateAccept};
    spec.initialState = kStateScan;
    spec.acceptStates = {kStateAccept};

    // Входной алфавит - все байты, кроме 0 и пустого символа; байты UTF-8 переписываются как есть
    for (int code = 0x01; code <= 0xFF; code++) {
        const char c = static_cast<char>(code);
        if (c != kBlank) {
            spec.inputAlphabet.insert(c);
        }
    }
    spec.tapeAlphabet = spec.inputAlphabet;
    spec.tapeAlphabet.insert(kBlank);

    // q_scan: буквы сдвигаются, остальные символы переписываются как есть
    for (const char sym : spec.inputAlphabet) {
        spec.transitions.add(kStateScan, sym, {kStateScan, shiftLetter(sym, shift), Move::Right});
    }
    // Конец сообщения
    spec.transitions.add(kStateScan, kBlank, {kStateAccept, kBlank, Move::Right});
    return spec;
}

bool checkCipherInput(std::string_view message, const MachineSpec& spec,
                      std::vector<Diagnostic>& out) {
    for (std::size_t i = 0; i < message.size(); i++) {
        const char c = message[i];
        if (spec.inputAlphabet.count(c)) {
            continue;
        }
        out.push_back({DiagnosticLevel::Error, 0, static_cast<int>(i) + 1,
                       "Символ " + describeSymbol(c) + " не входит во входной алфавит машины"});
        return false;
    }
    return true;
}

CipherResult runCaesarMachine(std::string_view message, int shift, std::uint64_t maxSteps) {
    CipherResult result;

    MachineSpec spec = buildCaesarMachine(shift);
    if (!checkCipherInput(message, spec, result.diagnostics)) {
        return result;
    }

    TuringMachine tm(std::move(spec));
    tm.loadTape(message);
    result.text = tm.run(maxSteps);
    result.steps = tm.steps();
    result.haltReason = tm.haltReason();
    result.ok = (result.haltReason == HaltReason::Accepted);
    if (!result.ok) {
        result.diagnostics.push_back({DiagnosticLevel::Error, 0, 0,
                                      std::string("Машина остановилась без допуска: ") +
                                          haltReasonName(result.haltReason)});
    }
    return result;
}
