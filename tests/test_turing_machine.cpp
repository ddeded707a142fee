#include <gtest/gtest.h>

#include <utility>

#include "TuringMachine.h"

namespace {

MachineSpec MakeSpec(const StateId& initial) {
  MachineSpec spec;
  spec.states = {initial};
  spec.inputAlphabet = {'A', 'B', 'X', 'Y', 'Z'};
  spec.tapeAlphabet = spec.inputAlphabet;
  spec.tapeAlphabet.insert(kBlank);
  spec.initialState = initial;
  return spec;
}

// Машина без переходов останавливается сразу
TEST(TuringMachineTest, EmptyTableHaltsImmediately) {
  TuringMachine tm(MakeSpec("q0"));
  tm.loadTape("AB");

  EXPECT_EQ(tm.run(), "AB");
  EXPECT_EQ(tm.steps(), 0u);
  EXPECT_EQ(tm.haltReason(), HaltReason::NoTransition);
  EXPECT_EQ(tm.state(), "q0");
}

TEST(TuringMachineTest, InitialAcceptStateHaltsWithoutTransitions) {
  MachineSpec spec = MakeSpec("q0");
  spec.acceptStates = {"q0"};
  // Переход есть, но допускающее состояние проверяется раньше
  spec.transitions.add("q0", 'X', {"q0", 'A', Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("XYZ");

  EXPECT_EQ(tm.run(), "XYZ");
  EXPECT_EQ(tm.steps(), 0u);
  EXPECT_EQ(tm.haltReason(), HaltReason::Accepted);
}

TEST(TuringMachineTest, RightScanStopsAtTrailingBlank) {
  MachineSpec spec = MakeSpec("q0");
  spec.transitions.add("q0", 'A', {"q0", 'A', Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("AAA");

  EXPECT_EQ(tm.run(), "AAA");
  EXPECT_EQ(tm.steps(), 3u);
  EXPECT_EQ(tm.head(), 3u);
  EXPECT_EQ(tm.haltReason(), HaltReason::NoTransition);
  EXPECT_EQ(tm.getTapeContent(), "AAA");
}

TEST(TuringMachineTest, LeftMovesGrowTapeWithoutLosingInput) {
  MachineSpec spec = MakeSpec("q0");
  spec.transitions.add("q0", kBlank, {"q0", kBlank, Move::Left});

  TuringMachine tm(std::move(spec));
  tm.loadTape("");

  const std::size_t k = 5;
  for (std::size_t i = 0; i < k; i++) {
    ASSERT_TRUE(tm.step());
    EXPECT_EQ(tm.head(), 0u);
  }
  EXPECT_EQ(tm.steps(), k);
  EXPECT_EQ(tm.tape().size(), k + 1);
  EXPECT_EQ(tm.getTapeContent(), "");
}

TEST(TuringMachineTest, LeftGrowthKeepsExistingSymbols) {
  MachineSpec spec = MakeSpec("q0");
  spec.transitions.add("q0", 'A', {"q1", 'A', Move::Left});

  TuringMachine tm(std::move(spec));
  tm.loadTape("AB");

  EXPECT_TRUE(tm.step());
  EXPECT_FALSE(tm.step());
  EXPECT_EQ(tm.haltReason(), HaltReason::NoTransition);
  EXPECT_EQ(tm.getTapeContent(), "_AB");
}

TEST(TuringMachineTest, RunRespectsStepLimit) {
  MachineSpec spec = MakeSpec("q0");
  spec.transitions.add("q0", kBlank, {"q0", kBlank, Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("");

  EXPECT_EQ(tm.run(50), "");
  EXPECT_EQ(tm.steps(), 50u);
  EXPECT_EQ(tm.haltReason(), HaltReason::MaxSteps);
  EXPECT_TRUE(tm.isHalted());
  EXPECT_LT(tm.head(), tm.tape().size());
}

TEST(TuringMachineTest, RunWithZeroLimitPerformsNoSteps) {
  MachineSpec spec = MakeSpec("q0");
  spec.transitions.add("q0", 'A', {"q0", 'B', Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("AA");

  EXPECT_EQ(tm.run(0), "AA");
  EXPECT_EQ(tm.steps(), 0u);
  EXPECT_EQ(tm.haltReason(), HaltReason::MaxSteps);
}

// Лимит равен числу шагов до допускающего состояния
TEST(TuringMachineTest, BudgetEndingInAcceptStateIsAccepted) {
  MachineSpec spec = MakeSpec("q0");
  spec.states.insert("qA");
  spec.acceptStates = {"qA"};
  spec.transitions.add("q0", 'A', {"q0", 'B', Move::Right});
  spec.transitions.add("q0", kBlank, {"qA", kBlank, Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("AA");

  EXPECT_EQ(tm.run(3), "BB");
  EXPECT_EQ(tm.steps(), 3u);
  EXPECT_EQ(tm.state(), "qA");
  EXPECT_TRUE(tm.inAcceptState());
  EXPECT_EQ(tm.haltReason(), HaltReason::Accepted);
}

TEST(TuringMachineTest, BudgetEndingOneStepShortIsStepLimit) {
  MachineSpec spec = MakeSpec("q0");
  spec.states.insert("qA");
  spec.acceptStates = {"qA"};
  spec.transitions.add("q0", 'A', {"q0", 'B', Move::Right});
  spec.transitions.add("q0", kBlank, {"qA", kBlank, Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("AA");

  EXPECT_EQ(tm.run(2), "BB");
  EXPECT_EQ(tm.steps(), 2u);
  EXPECT_FALSE(tm.inAcceptState());
  EXPECT_EQ(tm.haltReason(), HaltReason::MaxSteps);
}

TEST(TuringMachineTest, HaltedMachineStaysHalted) {
  MachineSpec spec = MakeSpec("q0");
  spec.transitions.add("q0", 'A', {"q0", 'B', Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("A");

  EXPECT_TRUE(tm.step());
  EXPECT_FALSE(tm.step());
  const std::string content = tm.getTapeContent();
  const std::size_t head = tm.head();

  EXPECT_FALSE(tm.step());
  EXPECT_EQ(tm.run(), content);
  EXPECT_EQ(tm.head(), head);
  EXPECT_EQ(tm.steps(), 1u);
  EXPECT_EQ(tm.haltReason(), HaltReason::NoTransition);
}

TEST(TuringMachineTest, LoadTapeResetsStateAndCounters) {
  MachineSpec spec = MakeSpec("q0");
  spec.states.insert("q1");
  spec.transitions.add("q0", 'A', {"q1", 'B', Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("A");
  tm.run();
  EXPECT_EQ(tm.state(), "q1");
  EXPECT_EQ(tm.getTapeContent(), "B");

  tm.loadTape("AZ");
  EXPECT_EQ(tm.state(), "q0");
  EXPECT_EQ(tm.steps(), 0u);
  EXPECT_EQ(tm.head(), 0u);
  EXPECT_FALSE(tm.isHalted());
  EXPECT_EQ(tm.getTapeContent(), "AZ");
}

TEST(TuringMachineTest, RunsAreDeterministic) {
  MachineSpec spec = MakeSpec("q0");
  spec.states.insert("q1");
  spec.transitions.add("q0", 'A', {"q1", 'X', Move::Right});
  spec.transitions.add("q1", 'B', {"q0", 'Y', Move::Right});
  spec.transitions.add("q0", 'B', {"q0", 'Z', Move::Left});
  spec.transitions.add("q1", 'A', {"q1", 'A', Move::Left});

  TuringMachine first(spec);
  TuringMachine second(spec);
  first.loadTape("ABBABA");
  second.loadTape("ABBABA");

  EXPECT_EQ(first.run(), second.run());
  EXPECT_EQ(first.steps(), second.steps());
  EXPECT_EQ(first.head(), second.head());
  EXPECT_EQ(first.state(), second.state());
}

TEST(TuringMachineTest, HeadStaysInsideTapeAfterEveryStep) {
  MachineSpec spec = MakeSpec("q0");
  spec.states.insert("q1");
  spec.transitions.add("q0", 'A', {"q0", 'A', Move::Left});
  spec.transitions.add("q0", kBlank, {"q1", 'B', Move::Right});
  spec.transitions.add("q1", 'A', {"q1", 'A', Move::Right});
  spec.transitions.add("q1", 'B', {"q1", 'B', Move::Right});

  TuringMachine tm(std::move(spec));
  tm.loadTape("A");
  while (tm.step()) {
    EXPECT_LT(tm.head(), tm.tape().size());
  }
  EXPECT_EQ(tm.getTapeContent(), "BA");
  EXPECT_EQ(tm.haltReason(), HaltReason::NoTransition);
}

TEST(TuringMachineTest, HaltReasonNames) {
  EXPECT_STREQ(haltReasonName(HaltReason::Running), "running");
  EXPECT_STREQ(haltReasonName(HaltReason::Accepted), "accepted");
  EXPECT_STREQ(haltReasonName(HaltReason::NoTransition), "no transition");
  EXPECT_STREQ(haltReasonName(HaltReason::MaxSteps), "step limit");
}

TEST(TransitionTableTest, AddRejectsDuplicatePair) {
  TransitionTable table;
  EXPECT_TRUE(table.add("q0", 'A', {"q1", 'B', Move::Right}));
  EXPECT_FALSE(table.add("q0", 'A', {"q2", 'C', Move::Left}));
  EXPECT_EQ(table.size(), 1u);

  const Transition* tr = table.get("q0", 'A');
  ASSERT_NE(tr, nullptr);
  EXPECT_EQ(tr->nextState, "q1");
  EXPECT_EQ(tr->writeSymbol, 'B');
  EXPECT_EQ(tr->move, Move::Right);
}

TEST(TransitionTableTest, MissingPairReturnsNull) {
  TransitionTable table;
  table.add("q0", 'A', {"q0", 'A', Move::Right});
  EXPECT_TRUE(table.has("q0", 'A'));
  EXPECT_FALSE(table.has("q0", 'B'));
  EXPECT_EQ(table.get("q1", 'A'), nullptr);
}

TEST(TransitionTableTest, EnumerationIsSorted) {
  TransitionTable table;
  table.add("q_b", 'Z', {"q_a", 'Z', Move::Right});
  table.add("q_a", 'C', {"q_b", 'C', Move::Left});
  table.add("q_a", 'A', {"q_a", 'A', Move::Right});

  const auto rules = table.rules();
  ASSERT_EQ(rules.size(), 3u);
  EXPECT_EQ(rules[0].state, "q_a");
  EXPECT_EQ(rules[0].symbol, 'A');
  EXPECT_EQ(rules[1].symbol, 'C');
  EXPECT_EQ(rules[2].state, "q_b");

  EXPECT_EQ(table.states(), (std::vector<StateId>{"q_a", "q_b"}));
  EXPECT_EQ(table.alphabet(), (std::vector<Symbol>{'A', 'C', 'Z'}));
}

}  // namespace
