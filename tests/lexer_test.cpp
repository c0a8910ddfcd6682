#include <gtest/gtest.h>
#include <parsing/lexer.hpp>

using namespace nodebook::parsing;

namespace {

  enum : Symbol { blank = 1, word, number, arrow };

  auto automaton() -> DFA {
    auto b = AutomatonBuilder();
    b.pattern(blank, b.plus(b.chars({' '})));
    b.pattern(word, b.plus(b.range('a', 'z')));
    b.pattern(number, b.concat({b.plus(b.range('0', '9')), b.opt(b.concat({b.chars({'.'}), b.plus(b.range('0', '9'))}))}));
    b.pattern(arrow, b.word("->"));
    return b.makeDFA();
  }

}

TEST(Lexer, LongestMatchWins) {
  auto const dfa = automaton();
  auto stream = CharStream("12.5x");
  EXPECT_EQ(dfa.match(stream), Symbol{number});
  EXPECT_EQ(stream.position(), 4u);
}

TEST(Lexer, FailedMatchLeavesStreamUnchanged) {
  auto const dfa = automaton();
  auto stream = CharStream("?abc");
  EXPECT_FALSE(dfa.match(stream).has_value());
  EXPECT_EQ(stream.position(), 0u);
}

TEST(Lexer, PartialMatchFallsBackToLastAccept) {
  auto const dfa = automaton();
  // "3." is not a number, but "3" is.
  auto stream = CharStream("3.x");
  EXPECT_EQ(dfa.match(stream), Symbol{number});
  EXPECT_EQ(stream.position(), 1u);
}

TEST(Lexer, TokenizeGroupsUnrecognisedRuns) {
  auto const tokens = tokenize(automaton(), "ab -> ?!? 42");
  ASSERT_EQ(tokens.size(), 7u);
  EXPECT_EQ(tokens[0].id, Symbol{word});
  EXPECT_EQ(tokens[0].lexeme, "ab");
  EXPECT_EQ(tokens[2].id, Symbol{arrow});
  EXPECT_FALSE(tokens[4].id.has_value());
  EXPECT_EQ(tokens[4].lexeme, "?!?");
  EXPECT_EQ(tokens[4].begin, 6u);
  EXPECT_EQ(tokens[4].end, 9u);
  EXPECT_EQ(tokens[6].id, Symbol{number});
  EXPECT_EQ(tokens[6].lexeme, "42");
}

TEST(Lexer, MultibyteCharactersStayWhole) {
  auto const tokens = tokenize(automaton(), "caf\xC3\xA9");
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].lexeme, "caf");
  EXPECT_FALSE(tokens[1].id.has_value());
  EXPECT_EQ(tokens[1].lexeme, "\xC3\xA9");
}

TEST(Lexer, EmptyInput) {
  EXPECT_TRUE(tokenize(automaton(), "").empty());
}
