#include "speed_typing.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace mayhem::games {

namespace {

auto normalize(const std::string& word) -> std::string {
  auto begin = std::find_if_not(word.begin(), word.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto end = std::find_if_not(word.rbegin(), word.rend(), [](unsigned char c) {
               return std::isspace(c) != 0;
             }).base();
  if (begin >= end) {
    return {};
  }

  std::string result(begin, end);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

}  // namespace

SpeedTyping::SpeedTyping(std::chrono::milliseconds duration,
                         std::size_t word_count, std::uint32_t seed)
    : duration_(duration), word_count_(word_count), rng_(seed) {}

auto SpeedTyping::checkWord(const std::string& expected,
                            const std::string& typed) -> bool {
  return normalize(expected) == normalize(typed);
}

auto SpeedTyping::wordSource() -> const std::vector<std::string>& {
  static const std::vector<std::string> kWords = {
      "apple",  "banana",  "cherry",   "date",      "elderberry", "fig",
      "grape",  "house",   "island",   "jungle",    "kite",       "lemon",
      "mango",  "nest",    "ocean",    "piano",     "queen",      "river",
      "sun",    "tiger",   "umbrella", "violet",    "water",      "xylophone",
      "yellow", "zebra",   "cloud",    "dream",     "energy",     "flower",
      "garden", "happy",   "image",    "juice",     "king",       "lion",
      "mouse",  "night",   "orange",   "pencil",    "quiet",      "radio",
      "snake",  "tree",    "unicorn",  "vision",    "whale",      "xray"};
  return kWords;
}

auto SpeedTyping::progress(const PlayerHandle& player) const -> std::size_t {
  auto it = cursors_.find(player);
  return it == cursors_.end() ? 0 : it->second;
}

auto SpeedTyping::gameNumber() const -> GameNumber {
  return constants::kSpeedTypingGame;
}

auto SpeedTyping::acceptsInput(protocol::EventType type) const -> bool {
  return type == protocol::EventType::SubmitWord;
}

auto SpeedTyping::generateWords() -> std::vector<std::string> {
  const auto& source = wordSource();
  std::uniform_int_distribution<std::size_t> pick(0, source.size() - 1);

  std::vector<std::string> words;
  words.reserve(word_count_);
  for (std::size_t i = 0; i < word_count_; ++i) {
    words.push_back(source[pick(rng_)]);
  }
  return words;
}

void SpeedTyping::onBegin(RoundContext& context) {
  if (words_.empty()) {
    words_ = generateWords();
  }

  context.broadcast(protocol::encodeEvent(
      protocol::gameStartEventName(gameNumber()),
      {{"duration", durationSeconds()}, {"word_count", words_.size()}}));
  context.broadcast(protocol::encodeEvent(protocol::outbound::kNewWords,
                                          {{"words", words_}}));
}

void SpeedTyping::onRejoin(RoundContext& context, const PlayerHandle& player) {
  context.sendTo(player, protocol::encodeEvent(
                             protocol::gameStartEventName(gameNumber()),
                             {{"duration", durationSeconds()},
                              {"word_count", words_.size()}}));
  context.sendTo(player, protocol::encodeEvent(protocol::outbound::kNewWords,
                                               {{"words", words_},
                                                {"progress", progress(player)}}));
}

void SpeedTyping::onInput(RoundContext& context, const PlayerHandle& player,
                          const nlohmann::json& body) {
  auto current = protocol::readString(body, "current_word");
  if (!current) current = protocol::readString(body, "word");
  auto typed = protocol::readString(body, "typed_word");
  if (!typed) typed = protocol::readString(body, "typed");
  if (!current || !typed) {
    LOG_DEBUG << "Ignoring malformed word submission from " << player;
    return;
  }

  auto& cursor = cursors_[player];
  // 声称的当前单词必须与服务器记录的进度一致
  const bool on_track =
      cursor < words_.size() && checkWord(words_[cursor], *current);
  const bool correct = on_track && checkWord(*current, *typed);

  context.sendTo(player, protocol::encodeEvent(protocol::outbound::kAnswerResult,
                                               {{"correct", correct}}));
  if (!correct) {
    return;
  }

  ++cursor;
  context.addScore(player, 1);
  context.broadcast(protocol::encodeEvent(
      protocol::outbound::kScoreUpdate,
      {{"leaderboard", core::toJson(context.leaderboard())}}));
}

}  // namespace mayhem::games
