#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "Lexer.h"
#include "Settings.h"

namespace {

TEST(LexerTest, TokenizesAssignment) {
  Lexer lexer("max_steps = 500;");
  Token t = lexer.next();
  EXPECT_EQ(t.type, TokenType::Identifier);
  EXPECT_EQ(t.value, "max_steps");
  EXPECT_EQ(lexer.next().type, TokenType::Assign);
  t = lexer.next();
  EXPECT_EQ(t.type, TokenType::Number);
  EXPECT_EQ(t.value, "500");
  EXPECT_EQ(lexer.next().type, TokenType::Semicolon);
  EXPECT_EQ(lexer.next().type, TokenType::Eof);
}

TEST(LexerTest, SkipsCommentsAndTracksPositions) {
  Lexer lexer("# header\n// note\n/* block\n */ fullscreen");
  const Token t = lexer.next();
  EXPECT_EQ(t.type, TokenType::Identifier);
  EXPECT_EQ(t.value, "fullscreen");
  EXPECT_EQ(t.line, 4);
  EXPECT_EQ(t.column, 5);
}

TEST(LexerTest, StringEscapesAndBooleans) {
  Lexer lexer(R"("a \"b\" \\c" false)");
  Token t = lexer.next();
  EXPECT_EQ(t.type, TokenType::StringLiteral);
  EXPECT_EQ(t.value, R"(a "b" \c)");
  t = lexer.next();
  EXPECT_EQ(t.type, TokenType::Boolean);
  EXPECT_EQ(t.value, "false");
}

TEST(LexerTest, UnterminatedStringIsUnknown) {
  Lexer lexer("\"open\nx");
  EXPECT_EQ(lexer.next().type, TokenType::Unknown);
}

TEST(SettingsTest, DefaultsWhenEmpty) {
  AppSettings settings;
  std::vector<Diagnostic> diags;
  EXPECT_TRUE(parseSettings("", settings, diags));
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(settings.maxSteps, kDefaultMaxSteps);
  EXPECT_EQ(settings.encryptCasesFile, "casos_encriptar.txt");
  EXPECT_TRUE(settings.fullscreen);
}

TEST(SettingsTest, ParsesAllValueKinds) {
  AppSettings settings;
  std::vector<Diagnostic> diags;
  const char* source =
      "// workbench\n"
      "font = \"fonts/mono.ttf\";\n"
      "encrypt_cases = \"in/enc.txt\";\n"
      "decrypt_result = \"out/dec.txt\";\n"
      "max_steps = 2500;\n"
      "steps_per_frame = 8;\n"
      "fullscreen = false;\n";
  EXPECT_TRUE(parseSettings(source, settings, diags));
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(settings.fontPath, "fonts/mono.ttf");
  EXPECT_EQ(settings.encryptCasesFile, "in/enc.txt");
  EXPECT_EQ(settings.decryptResultFile, "out/dec.txt");
  EXPECT_EQ(settings.maxSteps, 2500u);
  EXPECT_EQ(settings.stepsPerFrame, 8u);
  EXPECT_FALSE(settings.fullscreen);
}

TEST(SettingsTest, UnknownKeyIsReportedAndParsingContinues) {
  AppSettings settings;
  std::vector<Diagnostic> diags;
  EXPECT_FALSE(parseSettings("speed = 3;\nmax_steps = 10;", settings, diags));
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags[0].line, 1);
  EXPECT_EQ(diags[0].column, 1);
  EXPECT_EQ(settings.maxSteps, 10u);
}

TEST(SettingsTest, WrongValueKindKeepsDefault) {
  AppSettings settings;
  std::vector<Diagnostic> diags;
  EXPECT_FALSE(parseSettings("max_steps = \"many\"; fullscreen = 1;", settings, diags));
  EXPECT_EQ(diags.size(), 2u);
  EXPECT_EQ(settings.maxSteps, kDefaultMaxSteps);
  EXPECT_TRUE(settings.fullscreen);
}

TEST(SettingsTest, ZeroAndOverflowAreRejected) {
  AppSettings settings;
  std::vector<Diagnostic> diags;
  EXPECT_FALSE(parseSettings("max_steps = 0;\nsteps_per_frame = 99999999999999999999999;", settings, diags));
  ASSERT_EQ(diags.size(), 2u);
  EXPECT_EQ(diags[1].line, 2);
  EXPECT_EQ(settings.maxSteps, kDefaultMaxSteps);
  EXPECT_EQ(settings.stepsPerFrame, 1u);
}

TEST(SettingsTest, MissingSemicolonIsReported) {
  AppSettings settings;
  std::vector<Diagnostic> diags;
  EXPECT_FALSE(parseSettings("max_steps = 5\nfullscreen = false;", settings, diags));
  EXPECT_FALSE(diags.empty());
  EXPECT_EQ(settings.maxSteps, kDefaultMaxSteps);
}

TEST(SettingsTest, MissingFileIsNotAnError) {
  AppSettings settings;
  std::vector<Diagnostic> diags;
  EXPECT_TRUE(loadSettings("/nonexistent/settings.txt", settings, diags));
  EXPECT_TRUE(diags.empty());
}

TEST(DiagnosticsTest, PrintsPositionWhenKnown) {
  std::ostringstream out;
  printDiagnostics(out, "settings.txt",
                   {{DiagnosticLevel::Error, 3, 7, "bad value"},
                    {DiagnosticLevel::Info, 0, 0, "created"}});
  EXPECT_EQ(out.str(),
            "Error: bad value at settings.txt:3, column 7\n"
            "Info: created (settings.txt)\n");
}

}  // namespace
