#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "CaesarCipher.h"
#include "CaseFile.h"

namespace {

TEST(CaesarKeyTest, NumericKeys) {
  EXPECT_EQ(parseKey("3").value_or(-1), 3);
  EXPECT_EQ(parseKey("13").value_or(-1), 13);
  EXPECT_EQ(parseKey("0").value_or(-1), 0);
  EXPECT_EQ(parseKey("27").value_or(-1), 27);
}

TEST(CaesarKeyTest, LetterKeysAreOneBased) {
  EXPECT_EQ(parseKey("A").value_or(-1), 1);
  EXPECT_EQ(parseKey("B").value_or(-1), 2);
  EXPECT_EQ(parseKey("D").value_or(-1), 4);
  EXPECT_EQ(parseKey("Z").value_or(-1), 26);
  EXPECT_EQ(parseKey("d").value_or(-1), 4);
}

TEST(CaesarKeyTest, InvalidKeys) {
  EXPECT_FALSE(parseKey("").has_value());
  EXPECT_FALSE(parseKey("AB").has_value());
  EXPECT_FALSE(parseKey("-3").has_value());
  EXPECT_FALSE(parseKey("3A").has_value());
  EXPECT_FALSE(parseKey(" 3").has_value());
  EXPECT_FALSE(parseKey("99999999999999999999").has_value());
}

TEST(CaesarCipherTest, NormalizeShift) {
  EXPECT_EQ(normalizeShift(0), 0);
  EXPECT_EQ(normalizeShift(26), 0);
  EXPECT_EQ(normalizeShift(29), 3);
  EXPECT_EQ(normalizeShift(-1), 25);
}

TEST(CaesarCipherTest, EncryptShiftsOnlyUppercaseLetters) {
  EXPECT_EQ(caesarEncrypt("HOLA", 3), "KROD");
  EXPECT_EQ(caesarEncrypt("XYZ", 3), "ABC");
  EXPECT_EQ(caesarEncrypt("HOLA MUNDO", 1), "IPMB NVOEP");
  EXPECT_EQ(caesarEncrypt("A-1 b!", 1), "B-1 b!");
  EXPECT_EQ(caesarEncrypt("", 5), "");
}

TEST(CaesarCipherTest, DecryptInvertsEncrypt) {
  EXPECT_EQ(caesarDecrypt("KROD", 3), "HOLA");
  EXPECT_EQ(caesarDecrypt("ABC", 3), "XYZ");
  for (int k = 0; k < 30; k++) {
    EXPECT_EQ(caesarDecrypt(caesarEncrypt("CESAR FUE UN EMPERADOR", k), k), "CESAR FUE UN EMPERADOR");
  }
}

TEST(CaesarMachineTest, StructureOfGeneratedMachine) {
  const MachineSpec spec = buildCaesarMachine(3);
  EXPECT_EQ(spec.initialState, kStateScan);
  EXPECT_EQ(spec.states, (std::set<StateId>{kStateAccept, kStateScan}));
  EXPECT_EQ(spec.acceptStates, (std::set<StateId>{kStateAccept}));

  // Байты 0x01-0xFF без '_' плюс переход по пустому символу
  EXPECT_EQ(spec.inputAlphabet.size(), 254u);
  EXPECT_EQ(spec.tapeAlphabet.size(), 255u);
  EXPECT_EQ(spec.inputAlphabet.count(kBlank), 0u);
  EXPECT_EQ(spec.inputAlphabet.count('\0'), 0u);
  EXPECT_EQ(spec.transitions.size(), 255u);

  const Transition* onA = spec.transitions.get(kStateScan, 'A');
  ASSERT_NE(onA, nullptr);
  EXPECT_EQ(onA->nextState, kStateScan);
  EXPECT_EQ(onA->writeSymbol, 'D');
  EXPECT_EQ(onA->move, Move::Right);

  const Transition* onBlank = spec.transitions.get(kStateScan, kBlank);
  ASSERT_NE(onBlank, nullptr);
  EXPECT_EQ(onBlank->nextState, kStateAccept);
  EXPECT_EQ(onBlank->writeSymbol, kBlank);
}

TEST(CaesarMachineTest, RunProducesShiftedText) {
  const CipherResult result = runCaesarMachine("HOLA", 3);
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.text, "KROD");
  EXPECT_EQ(result.haltReason, HaltReason::Accepted);
  // Один шаг на символ и один на завершающий пустой символ
  EXPECT_EQ(result.steps, 5u);
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(CaesarMachineTest, EmptyMessageAcceptsAfterOneStep) {
  const CipherResult result = runCaesarMachine("", 7);
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.text, "");
  EXPECT_EQ(result.steps, 1u);
}

TEST(CaesarMachineTest, MachineMatchesArithmeticOnSampleCases) {
  std::vector<Diagnostic> diags;
  for (const auto& line : sampleEncryptCases()) {
    const auto parsed = parseCase(line, 0, diags);
    ASSERT_TRUE(parsed.has_value()) << line;

    const CipherResult enc = runCaesarMachine(parsed->message, parsed->shift);
    ASSERT_TRUE(enc.ok) << line;
    EXPECT_EQ(enc.text, caesarEncrypt(parsed->message, parsed->shift)) << line;
    EXPECT_EQ(enc.steps, parsed->message.size() + 1) << line;

    // Дешифрование - та же машина со сдвигом 26 - k
    const CipherResult dec = runCaesarMachine(enc.text, kCipherAlphabetSize - normalizeShift(parsed->shift));
    ASSERT_TRUE(dec.ok) << line;
    EXPECT_EQ(dec.text, parsed->message) << line;
  }
  EXPECT_TRUE(diags.empty());
}

TEST(CaesarMachineTest, TrailingSpacesAreKept) {
  const CipherResult result = runCaesarMachine("AB  ", 1);
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.text, "BC  ");
}

TEST(CaesarMachineTest, Utf8TextPassesThroughUnchanged) {
  const std::string message = "ACCI\xC3\x93N";  // ACCIÓN
  const CipherResult enc = runCaesarMachine(message, 3);
  ASSERT_TRUE(enc.ok);
  EXPECT_EQ(enc.text, "DFFL\xC3\x93Q");
  EXPECT_EQ(enc.text, caesarEncrypt(message, 3));
  EXPECT_EQ(enc.steps, message.size() + 1);

  const CipherResult dec = runCaesarMachine(enc.text, kCipherAlphabetSize - 3);
  ASSERT_TRUE(dec.ok);
  EXPECT_EQ(dec.text, message);
}

TEST(CaesarMachineTest, ControlBytesPassThroughUnchanged) {
  const CipherResult result = runCaesarMachine("AB\tC", 1);
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.text, "BC\tD");
}

TEST(CaesarMachineTest, RejectsNulByte) {
  const CipherResult result = runCaesarMachine(std::string("AB\0C", 4), 1);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.steps, 0u);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics[0].column, 3);
  EXPECT_NE(result.diagnostics[0].message.find("0x00"), std::string::npos);
}

TEST(CaesarMachineTest, BlankSymbolIsNotAcceptedAsInput) {
  std::vector<Diagnostic> diags;
  EXPECT_FALSE(checkCipherInput("SNAKE_CASE", buildCaesarMachine(1), diags));
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags[0].column, 6);
}

TEST(CaesarMachineTest, ExactStepBudgetIsEnough) {
  // n символов + завершающий пустой символ
  const CipherResult result = runCaesarMachine("HOLA", 3, 5);
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.text, "KROD");
  EXPECT_EQ(result.steps, 5u);
  EXPECT_EQ(result.haltReason, HaltReason::Accepted);
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(CaesarMachineTest, StepLimitReportsFailure) {
  const CipherResult result = runCaesarMachine("HOLA MUNDO", 1, 4);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.haltReason, HaltReason::MaxSteps);
  EXPECT_EQ(result.steps, 4u);
  EXPECT_EQ(result.text, "IPMB MUNDO");
  EXPECT_FALSE(result.diagnostics.empty());
}

}  // namespace
