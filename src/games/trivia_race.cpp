#include "trivia_race.hpp"

#include <algorithm>
#include <utility>

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace mayhem::games {

auto defaultTriviaPool() -> std::vector<TriviaQuestion> {
  return {
      {"Which isn't a programming language?",
       {"Java", "Python", "HTML", "C++"},
       2},
      {"What does CPU stand for?",
       {"Central Processing Unit", "Central Process Unit",
        "Computer Personal Unit", "Central Processor Unit"},
       0},
      {"Which is used for styling?", {"HTML", "CSS", "Python", "Java"}, 1},
      {"Who created Python?",
       {"Elon Musk", "Bill Gates", "Mark Zuckerberg", "Guido van Rossum"},
       3},
      {"What is 101 in binary?", {"5", "3", "2", "6"}, 0},
      {"RAM stands for?",
       {"Read Access Memory", "Random Access Memory", "Run Access Memory",
        "Real Access Memory"},
       1},
      {"Which keyword defines a function in Python?",
       {"func", "function", "def", "define"},
       2},
      {"Smallest unit of data?", {"Bit", "Byte", "Kilobyte", "Megabyte"}, 0},
      {"Language for Android apps?", {"Swift", "Ruby", "Kotlin", "PHP"}, 2},
      {"Which is a database?", {"React", "Express", "Node", "PostgreSQL"}, 3},
  };
}

TriviaRace::TriviaRace(std::chrono::milliseconds duration, int finish_line,
                       bool trust_client_grading,
                       std::vector<TriviaQuestion> pool, std::uint32_t seed)
    : duration_(duration),
      finish_line_(finish_line),
      trust_client_grading_(trust_client_grading),
      pool_(std::move(pool)),
      rng_(seed) {}

auto TriviaRace::gameNumber() const -> GameNumber {
  return constants::kTriviaRaceGame;
}

auto TriviaRace::acceptsInput(protocol::EventType type) const -> bool {
  return type == protocol::EventType::SubmitRaceAnswer;
}

auto TriviaRace::position(const PlayerHandle& player) const -> int {
  auto it = lanes_.find(player);
  return it == lanes_.end() ? 0 : it->second.position;
}

auto TriviaRace::isFinished(const PlayerHandle& player) const -> bool {
  auto it = lanes_.find(player);
  return it != lanes_.end() && it->second.finished;
}

auto TriviaRace::questionIndex(const PlayerHandle& player) const
    -> std::size_t {
  auto it = lanes_.find(player);
  return it == lanes_.end() ? 0 : it->second.cursor;
}

auto TriviaRace::currentScore(const PlayerHandle& player) const
    -> std::optional<int> {
  return position(player);
}

auto TriviaRace::isComplete(const RoundContext& context) const -> bool {
  const auto active = context.activePlayers();
  return std::all_of(active.begin(), active.end(),
                     [this](const auto& player) { return isFinished(player); });
}

auto TriviaRace::finishBonus(std::size_t rank) const -> int {
  const auto& schedule = constants::kFinishBonusSchedule;
  const auto index = std::min(rank, schedule.size()) - 1;
  return schedule[index];
}

void TriviaRace::onBegin(RoundContext& context) {
  std::shuffle(pool_.begin(), pool_.end(), rng_);

  lanes_.clear();
  finishers_.clear();
  for (const auto& player : context.activePlayers()) {
    lanes_[player] = Lane{};
  }

  context.broadcast(
      protocol::encodeEvent(protocol::outbound::kGame3Start, startPayload()));
}

void TriviaRace::onRejoin(RoundContext& context, const PlayerHandle& player) {
  auto payload = startPayload();
  const auto it = lanes_.find(player);
  const Lane lane = it == lanes_.end() ? Lane{} : it->second;
  payload["position"] = lane.position;
  payload["question_index"] = lane.cursor;
  payload["finished"] = lane.finished;
  context.sendTo(player,
                 protocol::encodeEvent(protocol::outbound::kGame3Start, payload));
}

auto TriviaRace::startPayload() const -> nlohmann::json {
  auto questions = nlohmann::json::array();
  for (std::size_t i = 0; i < pool_.size(); ++i) {
    questions.push_back({{"index", i},
                         {"text", pool_[i].text},
                         {"options", pool_[i].options}});
  }
  return {{"duration", durationSeconds()},
          {"questions", questions},
          {"total_steps", finish_line_}};
}

void TriviaRace::onInput(RoundContext& context, const PlayerHandle& player,
                         const nlohmann::json& body) {
  if (isFinished(player)) {
    return;
  }

  if (trust_client_grading_) {
    if (auto claimed = protocol::readBool(body, "is_correct")) {
      applyAnswer(context, player, *claimed);
      return;
    }
  }

  auto answer = protocol::readInt(body, "answer_index");
  if (!answer || pool_.empty()) {
    LOG_DEBUG << "Ignoring malformed race answer from " << player;
    return;
  }

  auto& lane = lanes_[player];
  auto question_index = protocol::readInt(body, "question_index");
  if (question_index &&
      static_cast<std::size_t>(*question_index) != lane.cursor) {
    context.sendTo(player, protocol::encodeError("Stale question index"));
    return;
  }

  const bool correct = (*answer == pool_[lane.cursor].answer_index);
  lane.cursor = (lane.cursor + 1) % pool_.size();
  applyAnswer(context, player, correct);
}

void TriviaRace::applyAnswer(RoundContext& context, const PlayerHandle& player,
                             bool correct) {
  auto& lane = lanes_[player];
  if (lane.finished) {
    return;
  }

  const int previous = lane.position;
  lane.position =
      std::clamp(previous + (correct ? 1 : -1), 0, finish_line_);
  const bool moved = lane.position != previous;

  context.sendTo(player,
                 protocol::encodeEvent(protocol::outbound::kAnswerResult,
                                       {{"correct", correct},
                                        {"new_pos", lane.position}}));
  if (moved) {
    context.touch(player);
    context.broadcast(protocol::encodeEvent(
        protocol::outbound::kPlayerMoved,
        {{"player_id", player}, {"new_pos", lane.position}}));
  }

  if (lane.position >= finish_line_) {
    lane.finished = true;
    finishers_.push_back(player);
    const auto rank = finishers_.size();
    const int bonus = finishBonus(rank);
    context.addScore(player, bonus);
    context.sendTo(player, protocol::encodeEvent(
                               protocol::outbound::kPlayerFinished,
                               {{"rank", rank}, {"bonus", bonus}}));
    LOG_INFO << player << " finished the race in place " << rank;
  }
}

}  // namespace mayhem::games
