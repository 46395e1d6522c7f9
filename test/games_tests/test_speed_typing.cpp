#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "games/speed_typing.hpp"
#include "utils/fake_round_context.hpp"

using namespace mayhem;
using namespace mayhem::games;
using mayhem::test::FakeRoundContext;

TEST(CheckWordTest, IgnoresCaseAndSurroundingWhitespace) {
  EXPECT_TRUE(SpeedTyping::checkWord("Apple ", " apple"));
  EXPECT_TRUE(SpeedTyping::checkWord("ZEBRA", "zebra"));
  EXPECT_TRUE(SpeedTyping::checkWord("\tkite\n", "kite"));
}

TEST(CheckWordTest, RejectsDifferentWords) {
  EXPECT_FALSE(SpeedTyping::checkWord("apple", "appl"));
  EXPECT_FALSE(SpeedTyping::checkWord("apple", "apples"));
  EXPECT_FALSE(SpeedTyping::checkWord("apple", ""));
  EXPECT_FALSE(SpeedTyping::checkWord("ap ple", "apple"));
}

class SpeedTypingTest : public testing::Test {
 protected:
  SpeedTypingTest()
      : ctx_({"alice", "bob"}), game_(std::chrono::seconds(30), 50, 3) {}

  FakeRoundContext ctx_;
  SpeedTyping game_;
};

TEST_F(SpeedTypingTest, BeginBroadcastsGeneratedWordList) {
  game_.begin(ctx_);

  ASSERT_EQ(game_.words().size(), 50u);
  const auto& source = SpeedTyping::wordSource();
  for (const auto& word : game_.words()) {
    EXPECT_THAT(source, testing::Contains(word));
  }

  auto starts = ctx_.broadcastsOfType("GAME_2_START");
  ASSERT_EQ(starts.size(), 1u);
  EXPECT_EQ(starts[0]["payload"]["duration"], 30);
  EXPECT_EQ(starts[0]["payload"]["word_count"], 50);

  auto words = ctx_.broadcastsOfType("NEW_WORDS");
  ASSERT_EQ(words.size(), 1u);
  EXPECT_EQ(words[0]["payload"]["words"].get<std::vector<std::string>>(),
            game_.words());
}

TEST_F(SpeedTypingTest, CorrectWordAdvancesAndBroadcastsScores) {
  game_.setWords({"apple", "banana", "cherry"});
  game_.begin(ctx_);
  ctx_.clearMessages();

  game_.submit(ctx_, "alice",
               {{"current_word", "apple"}, {"typed_word", " APPLE"}});

  EXPECT_EQ(game_.progress("alice"), 1u);
  EXPECT_EQ(ctx_.score("alice"), 1);
  EXPECT_EQ(ctx_.lastSentTo("alice", "ANSWER_RESULT")["payload"]["correct"],
            true);

  auto updates = ctx_.broadcastsOfType("SCORE_UPDATE");
  ASSERT_EQ(updates.size(), 1u);
  const auto& board = updates[0]["payload"]["leaderboard"];
  ASSERT_EQ(board.size(), 2u);
  EXPECT_EQ(board[0]["player_id"], "alice");
  EXPECT_EQ(board[0]["score"], 1);
}

TEST_F(SpeedTypingTest, WrongWordDoesNotAdvance) {
  game_.setWords({"apple", "banana"});
  game_.begin(ctx_);
  ctx_.clearMessages();

  game_.submit(ctx_, "bob", {{"current_word", "apple"}, {"typed_word", "appl"}});

  EXPECT_EQ(game_.progress("bob"), 0u);
  EXPECT_EQ(ctx_.score("bob"), 0);
  EXPECT_EQ(ctx_.lastSentTo("bob", "ANSWER_RESULT")["payload"]["correct"],
            false);
  EXPECT_TRUE(ctx_.broadcastsOfType("SCORE_UPDATE").empty());
}

TEST_F(SpeedTypingTest, ClaimedWordMustMatchPlayerProgress) {
  game_.setWords({"apple", "banana"});
  game_.begin(ctx_);

  // 跳过第一个单词不计分
  game_.submit(ctx_, "bob",
               {{"current_word", "banana"}, {"typed_word", "banana"}});
  EXPECT_EQ(ctx_.score("bob"), 0);

  game_.submit(ctx_, "bob", {{"word", "apple"}, {"typed", "apple"}});
  game_.submit(ctx_, "bob", {{"word", "banana"}, {"typed", "banana"}});
  EXPECT_EQ(ctx_.score("bob"), 2);

  // 单词表已经打完
  game_.submit(ctx_, "bob", {{"word", "banana"}, {"typed", "banana"}});
  EXPECT_EQ(ctx_.score("bob"), 2);
}

TEST_F(SpeedTypingTest, MalformedSubmissionIsIgnored) {
  game_.setWords({"apple"});
  game_.begin(ctx_);
  ctx_.clearMessages();

  game_.submit(ctx_, "alice", {{"typed_word", "apple"}});
  EXPECT_TRUE(ctx_.sentTo("alice").empty());
}

TEST_F(SpeedTypingTest, RejoinResendsWordsAndProgress) {
  game_.setWords({"apple", "banana", "cherry"});
  game_.begin(ctx_);
  game_.submit(ctx_, "bob", {{"current_word", "apple"}, {"typed_word", "apple"}});
  ctx_.clearMessages();

  game_.rejoin(ctx_, "bob");

  EXPECT_EQ(ctx_.lastSentTo("bob", "GAME_2_START")["payload"]["word_count"], 3);
  auto words = ctx_.lastSentTo("bob", "NEW_WORDS");
  ASSERT_FALSE(words.is_null());
  EXPECT_THAT(words["payload"]["words"].get<std::vector<std::string>>(),
              testing::ElementsAre("apple", "banana", "cherry"));
  EXPECT_EQ(words["payload"]["progress"], 1);
  EXPECT_TRUE(ctx_.broadcasts().empty());
}
