#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "games/trivia_race.hpp"
#include "utils/fake_round_context.hpp"

using namespace mayhem;
using namespace mayhem::games;
using mayhem::test::FakeRoundContext;

namespace {

auto singleQuestionPool() -> std::vector<TriviaQuestion> {
  return {{"What is 101 in binary?", {"5", "3", "2", "6"}, 0}};
}

}  // namespace

class TriviaRaceTest : public testing::Test {
 protected:
  TriviaRaceTest()
      : ctx_({"alice", "bob", "carol", "dave", "erin"}),
        race_(std::chrono::seconds(90), 10, false, singleQuestionPool(), 1) {}

  void answerCorrectly(const PlayerHandle& player, int times) {
    for (int i = 0; i < times; ++i) {
      race_.submit(ctx_, player, {{"answer_index", 0}});
    }
  }

  FakeRoundContext ctx_;
  TriviaRace race_;
};

TEST_F(TriviaRaceTest, PositionSequenceIsClamped) {
  race_.begin(ctx_);

  std::vector<bool> inputs = {true, true, false};
  inputs.insert(inputs.end(), 8, true);

  std::vector<int> positions;
  for (bool correct : inputs) {
    race_.applyAnswer(ctx_, "alice", correct);
    positions.push_back(race_.position("alice"));
  }

  EXPECT_THAT(positions, testing::ElementsAre(1, 2, 1, 2, 3, 4, 5, 6, 7, 8, 9));
  EXPECT_EQ(race_.position("alice"), 9);
  EXPECT_FALSE(race_.isFinished("alice"));
}

TEST_F(TriviaRaceTest, PositionNeverGoesBelowZero) {
  race_.begin(ctx_);
  ctx_.clearMessages();

  race_.applyAnswer(ctx_, "bob", false);

  EXPECT_EQ(race_.position("bob"), 0);
  EXPECT_EQ(ctx_.lastSentTo("bob", "ANSWER_RESULT")["payload"]["new_pos"], 0);
  // 位置未变化时不广播移动
  EXPECT_TRUE(ctx_.broadcastsOfType("PLAYER_MOVED").empty());
}

TEST_F(TriviaRaceTest, ReachingFinishLineIsIdempotent) {
  race_.begin(ctx_);
  answerCorrectly("alice", 10);

  EXPECT_TRUE(race_.isFinished("alice"));
  EXPECT_EQ(race_.position("alice"), 10);
  EXPECT_EQ(ctx_.score("alice"), 50);

  ctx_.clearMessages();
  race_.applyAnswer(ctx_, "alice", false);
  answerCorrectly("alice", 3);

  EXPECT_EQ(race_.position("alice"), 10);
  EXPECT_EQ(ctx_.score("alice"), 50);
  EXPECT_TRUE(ctx_.sentTo("alice").empty());
  EXPECT_THAT(race_.finishers(), testing::ElementsAre("alice"));
}

TEST_F(TriviaRaceTest, FinishBonusesFollowArrivalOrder) {
  race_.begin(ctx_);
  for (const auto& player : {"carol", "alice", "erin", "bob", "dave"}) {
    answerCorrectly(player, 10);
  }

  EXPECT_EQ(ctx_.score("carol"), 50);
  EXPECT_EQ(ctx_.score("alice"), 30);
  EXPECT_EQ(ctx_.score("erin"), 15);
  EXPECT_EQ(ctx_.score("bob"), 5);
  EXPECT_EQ(ctx_.score("dave"), 5);

  auto finished = ctx_.lastSentTo("erin", "PLAYER_FINISHED");
  EXPECT_EQ(finished["payload"]["rank"], 3);
  EXPECT_EQ(finished["payload"]["bonus"], 15);
}

TEST_F(TriviaRaceTest, CompletesWhenAllActivePlayersFinish) {
  race_.begin(ctx_);
  for (const auto& player : {"alice", "bob", "carol", "dave"}) {
    answerCorrectly(player, 10);
  }
  EXPECT_FALSE(race_.isComplete(ctx_));

  answerCorrectly("erin", 10);
  EXPECT_TRUE(race_.isComplete(ctx_));
}

TEST_F(TriviaRaceTest, CurrentScoreIsPosition) {
  race_.begin(ctx_);
  answerCorrectly("dave", 4);
  EXPECT_EQ(race_.currentScore("dave"), 4);
  EXPECT_EQ(race_.currentScore("nobody"), 0);
}

TEST_F(TriviaRaceTest, MovesAreBroadcastAndTouchScores) {
  race_.begin(ctx_);
  ctx_.clearMessages();

  answerCorrectly("bob", 1);
  answerCorrectly("alice", 1);

  auto moves = ctx_.broadcastsOfType("PLAYER_MOVED");
  ASSERT_EQ(moves.size(), 2u);
  EXPECT_EQ(moves[0]["payload"]["player_id"], "bob");
  EXPECT_EQ(moves[0]["payload"]["new_pos"], 1);
  EXPECT_LT(ctx_.touchedAt("bob"), ctx_.touchedAt("alice"));
}

TEST_F(TriviaRaceTest, BeginSendsQuestionsWithoutAnswers) {
  TriviaRace race(std::chrono::seconds(90), 10, false);
  race.begin(ctx_);

  auto starts = ctx_.broadcastsOfType("GAME_3_START");
  ASSERT_EQ(starts.size(), 1u);
  const auto& payload = starts[0]["payload"];
  EXPECT_EQ(payload["duration"], 90);
  EXPECT_EQ(payload["total_steps"], 10);
  ASSERT_EQ(payload["questions"].size(), defaultTriviaPool().size());
  for (const auto& question : payload["questions"]) {
    EXPECT_EQ(question["options"].size(), 4u);
    EXPECT_FALSE(question.contains("answer_index"));
  }
}

TEST_F(TriviaRaceTest, ServerGradesAgainstPlayerCursor) {
  std::vector<TriviaQuestion> pool = {{"a?", {"x", "y"}, 1},
                                      {"b?", {"x", "y"}, 0}};
  TriviaRace race(std::chrono::seconds(90), 10, false, pool, 5);
  race.begin(ctx_);

  const auto first = race.questionIndex("alice");
  const int right = race.questions()[first].answer_index;
  race.submit(ctx_, "alice",
              {{"answer_index", right}, {"question_index", first}});
  EXPECT_EQ(race.position("alice"), 1);
  EXPECT_EQ(race.questionIndex("alice"), (first + 1) % 2);

  const auto second = race.questionIndex("alice");
  const int wrong = 1 - race.questions()[second].answer_index;
  race.submit(ctx_, "alice", {{"answer_index", wrong}});
  EXPECT_EQ(race.position("alice"), 0);
  // 回绕到题库开头
  EXPECT_EQ(race.questionIndex("alice"), first);
}

TEST_F(TriviaRaceTest, StaleQuestionIndexIsRejected) {
  std::vector<TriviaQuestion> pool = {{"a?", {"x", "y"}, 1},
                                      {"b?", {"x", "y"}, 0}};
  TriviaRace race(std::chrono::seconds(90), 10, false, pool, 5);
  race.begin(ctx_);
  ctx_.clearMessages();

  const auto stale = (race.questionIndex("bob") + 1) % 2;
  race.submit(ctx_, "bob", {{"answer_index", 0}, {"question_index", stale}});

  EXPECT_EQ(race.position("bob"), 0);
  auto error = ctx_.lastSentTo("bob", "ERROR");
  ASSERT_FALSE(error.is_null());
  EXPECT_EQ(error["msg"], "Stale question index");
}

TEST_F(TriviaRaceTest, ClientGradingOnlyWhenTrusted) {
  race_.begin(ctx_);
  race_.submit(ctx_, "alice", {{"is_correct", true}});
  EXPECT_EQ(race_.position("alice"), 0);

  TriviaRace trusted(std::chrono::seconds(90), 10, true, singleQuestionPool(),
                     1);
  trusted.begin(ctx_);
  trusted.submit(ctx_, "alice", {{"is_correct", true}});
  trusted.submit(ctx_, "alice", {{"is_correct", true}});
  EXPECT_EQ(trusted.position("alice"), 2);
}

TEST_F(TriviaRaceTest, RejoinResendsQuestionsAndLane) {
  race_.begin(ctx_);
  answerCorrectly("carol", 3);
  ctx_.clearMessages();

  race_.rejoin(ctx_, "carol");

  auto start = ctx_.lastSentTo("carol", "GAME_3_START");
  ASSERT_FALSE(start.is_null());
  const auto& payload = start["payload"];
  EXPECT_EQ(payload["total_steps"], 10);
  ASSERT_EQ(payload["questions"].size(), 1u);
  EXPECT_FALSE(payload["questions"][0].contains("answer_index"));
  EXPECT_EQ(payload["position"], 3);
  EXPECT_EQ(payload["question_index"], race_.questionIndex("carol"));
  EXPECT_EQ(payload["finished"], false);
  EXPECT_TRUE(ctx_.broadcasts().empty());
}
