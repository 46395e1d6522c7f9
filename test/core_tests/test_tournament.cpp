#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <set>
#include <thread>

#include "core/tournament.hpp"
#include "core_tests/lobby_fixture.hpp"
#include "games/trivia_race.hpp"
#include "storage/profile_store.hpp"

using namespace mayhem;
using namespace mayhem::core;
using namespace std::chrono_literals;

namespace {

auto fastConfig() -> TournamentConfig {
  TournamentConfig config;
  config.max_rounds = 3;
  config.preview_delay = 5ms;
  config.intermission_delay = 5ms;
  config.math_duration = 30ms;
  config.typing_duration = 30ms;
  config.race_duration = 30ms;
  config.allow_test_mode = true;
  return config;
}

// 只保留阶段事件
auto phaseEvents(const mayhem::test::RecordingSink& sink)
    -> std::vector<std::string> {
  static const std::set<std::string> kPhases = {
      "GAME_PREVIEW", "GAME_1_START", "GAME_2_START", "GAME_3_START",
      "ROUND_END",    "TOURNAMENT_WINNER"};
  std::vector<std::string> result;
  for (const auto& type : sink.types()) {
    if (kPhases.count(type) > 0) {
      result.push_back(type);
    }
  }
  return result;
}

}  // namespace

class TournamentTest : public mayhem::test::LobbyFixture {
 protected:
  auto makeTournament(const std::shared_ptr<Lobby>& lobby,
                      const TournamentConfig& config,
                      games::MinigameFactory factory)
      -> std::shared_ptr<Tournament> {
    auto tournament = std::make_shared<Tournament>(
        ioc_.get_executor(), lobby, config, std::move(factory), profiles_, 42);
    lobby->attachTournament(tournament);
    return tournament;
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<storage::InMemoryProfileStore> profiles_ =
      std::make_shared<storage::InMemoryProfileStore>();
};

TEST_F(TournamentTest, PhasesRunInOrderUntilWinner) {
  auto lobby = std::make_shared<Lobby>("PHASE1", "p0", 10);
  std::vector<Member> members;
  for (int i = 0; i < 4; ++i) {
    members.push_back(join(*lobby, "p" + std::to_string(i)));
  }
  auto config = fastConfig();
  auto tournament =
      makeTournament(lobby, config, games::makeMinigameFactory(config));

  ASSERT_TRUE(tournament->start("p0", true).has_value());
  ioc_.run_for(5s);

  // 4 -> 2 -> 1，第二局后即产生冠军
  auto events = phaseEvents(*members[0].sink);
  ASSERT_EQ(events.size(), 7u);
  EXPECT_EQ(events[0], "GAME_PREVIEW");
  EXPECT_THAT(events[1], testing::StartsWith("GAME_"));
  EXPECT_EQ(events[2], "ROUND_END");
  EXPECT_EQ(events[3], "GAME_PREVIEW");
  EXPECT_EQ(events[5], "ROUND_END");
  EXPECT_EQ(events[6], "TOURNAMENT_WINNER");

  auto previews = members[0].sink->ofType("GAME_PREVIEW");
  ASSERT_EQ(previews.size(), 2u);
  EXPECT_EQ(previews[0]["payload"]["round_number"], 1);
  EXPECT_EQ(previews[1]["payload"]["round_number"], 2);
  EXPECT_NE(previews[0]["payload"]["game_number"],
            previews[1]["payload"]["game_number"]);

  // 预告中选出的下一局与结算时宣布的一致
  auto round_end = members[0].sink->ofType("ROUND_END");
  EXPECT_EQ(round_end[0]["payload"]["next_game"],
            previews[1]["payload"]["game_number"]);

  EXPECT_EQ(lobby->phase(), TournamentPhase::Finished);
  EXPECT_EQ(lobby->activePlayers().size(), 1u);
  EXPECT_EQ(lobby->spectators().size(), 3u);
}

TEST_F(TournamentTest, DefaultRoundLimitIsThree) {
  const TournamentConfig defaults;
  EXPECT_EQ(defaults.max_rounds, 3);
}

TEST_F(TournamentTest, RoundLimitStopsTournamentBeforePopulationDoes) {
  auto lobby = std::make_shared<Lobby>("LIMIT1", "p0", 20);
  std::vector<Member> members;
  for (int i = 0; i < 10; ++i) {
    members.push_back(join(*lobby, "p" + std::to_string(i)));
  }
  auto config = fastConfig();
  auto tournament =
      makeTournament(lobby, config, games::makeMinigameFactory(config));

  ASSERT_TRUE(tournament->start("p0", true).has_value());
  ioc_.run_for(5s);

  // 10 -> 5 -> 3 -> 2：第三局后因轮数上限结束，而非只剩一人
  const auto& sink = *members[0].sink;
  EXPECT_EQ(sink.count("GAME_PREVIEW"), 3u);
  auto round_end = sink.ofType("ROUND_END");
  ASSERT_EQ(round_end.size(), 3u);
  EXPECT_EQ(round_end[0]["payload"]["advancing"].size(), 5u);
  EXPECT_EQ(round_end[1]["payload"]["advancing"].size(), 3u);
  EXPECT_EQ(round_end[2]["payload"]["advancing"].size(), 2u);
  EXPECT_TRUE(round_end[2]["payload"]["next_game"].is_null());
  EXPECT_EQ(sink.count("TOURNAMENT_WINNER"), 1u);

  EXPECT_EQ(lobby->phase(), TournamentPhase::Finished);
  EXPECT_EQ(lobby->activePlayers().size(), 2u);
}

TEST_F(TournamentTest, RoundEndsEarlyWhenRaceIsComplete) {
  auto lobby = std::make_shared<Lobby>("EARLY1", "host", 10);
  auto host = join(*lobby, "host");
  auto guest = join(*lobby, "guest");

  auto config = fastConfig();
  config.max_rounds = 1;
  auto tournament = makeTournament(
      lobby, config, [](GameNumber) -> std::unique_ptr<games::Minigame> {
        return std::make_unique<games::TriviaRace>(
            60s, 1, false,
            std::vector<games::TriviaQuestion>{{"2+2?", {"3", "4"}, 1}}, 1);
      });

  auto guard = boost::asio::make_work_guard(ioc_);
  std::thread io_thread([this] { ioc_.run(); });

  ASSERT_TRUE(tournament->start("host", true).has_value());
  ASSERT_TRUE(mayhem::test::waitFor(
      [&] { return host.sink->count("GAME_3_START") == 1; }));

  const nlohmann::json answer = {{"answer_index", 1}};
  EXPECT_TRUE(tournament
                  ->submitInput(host.player->id(),
                                protocol::EventType::SubmitRaceAnswer, answer)
                  .has_value());
  EXPECT_TRUE(tournament
                  ->submitInput(guest.player->id(),
                                protocol::EventType::SubmitRaceAnswer, answer)
                  .has_value());

  const bool finished = mayhem::test::waitFor(
      [&] { return host.sink->count("TOURNAMENT_WINNER") == 1; }, 2000ms);

  guard.reset();
  ioc_.stop();
  io_thread.join();

  ASSERT_TRUE(finished);
  auto winner = host.sink->last("TOURNAMENT_WINNER");
  // 同分时先到达终点者排名靠前
  EXPECT_EQ((*winner)["payload"]["winner"], "host");
}

TEST_F(TournamentTest, TestModeIsIgnoredUnlessAllowed) {
  auto lobby = std::make_shared<Lobby>("STRICT", "host", 10);
  join(*lobby, "host");
  join(*lobby, "guest");

  auto config = fastConfig();
  config.allow_test_mode = false;
  auto tournament =
      makeTournament(lobby, config, games::makeMinigameFactory(config));

  auto started = tournament->start("host", true);
  ASSERT_FALSE(started.has_value());
  EXPECT_EQ(started.error().code, LobbyErrorCode::NotAllReady);
  EXPECT_FALSE(lobby->inGame());
}

TEST_F(TournamentTest, NonHostCannotStart) {
  auto lobby = std::make_shared<Lobby>("HOSTED", "host", 10);
  join(*lobby, "host");
  join(*lobby, "guest");
  auto config = fastConfig();
  auto tournament =
      makeTournament(lobby, config, games::makeMinigameFactory(config));

  auto started = tournament->start("guest", true);
  ASSERT_FALSE(started.has_value());
  EXPECT_EQ(started.error().code, LobbyErrorCode::NotHost);
}

TEST_F(TournamentTest, StatisticsAreRecorded) {
  auto lobby = std::make_shared<Lobby>("STATS1", "p0", 10);
  std::vector<Member> members;
  for (int i = 0; i < 3; ++i) {
    members.push_back(join(*lobby, "p" + std::to_string(i)));
  }
  auto config = fastConfig();
  auto tournament =
      makeTournament(lobby, config, games::makeMinigameFactory(config));

  ASSERT_TRUE(tournament->start("p0", true).has_value());
  ioc_.run_for(5s);

  auto winner = members[0].sink->last("TOURNAMENT_WINNER");
  ASSERT_TRUE(winner.has_value());
  const std::string winner_name = (*winner)["payload"]["winner"];

  unsigned wins = 0;
  for (int i = 0; i < 3; ++i) {
    auto profile = profiles_->getProfile("p" + std::to_string(i));
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->total_games(), 1u);
    EXPECT_EQ(profile->wins() + profile->losses(), 1u);
    wins += profile->wins();
  }
  EXPECT_EQ(wins, 1u);
  EXPECT_EQ(profiles_->getProfile(winner_name)->wins(), 1u);
}

TEST_F(TournamentTest, DestroyedLobbyStopsTheSchedule) {
  auto lobby = std::make_shared<Lobby>("GONE01", "host", 10);
  auto host = join(*lobby, "host");
  auto config = fastConfig();
  auto tournament =
      makeTournament(lobby, config, games::makeMinigameFactory(config));

  ASSERT_TRUE(tournament->start("host", true).has_value());
  lobby.reset();

  EXPECT_NO_THROW(ioc_.run_for(200ms));
  EXPECT_EQ(host.sink->count("GAME_PREVIEW"), 0u);
}

TEST_F(TournamentTest, CancelStopsPendingRound) {
  auto lobby = std::make_shared<Lobby>("CANCEL", "host", 10);
  auto host = join(*lobby, "host");
  join(*lobby, "guest");
  auto config = fastConfig();
  config.preview_delay = 10s;
  auto tournament =
      makeTournament(lobby, config, games::makeMinigameFactory(config));

  ASSERT_TRUE(tournament->start("host", true).has_value());
  ioc_.run_for(50ms);
  EXPECT_EQ(host.sink->count("GAME_PREVIEW"), 1u);

  tournament->cancel();
  ioc_.run_for(200ms);
  EXPECT_TRUE(ioc_.stopped());
  EXPECT_EQ(host.sink->count("ROUND_END"), 0u);
}
