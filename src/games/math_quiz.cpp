#include "math_quiz.hpp"

#include <fmt/format.h>

#include <utility>

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace mayhem::games {

MathQuiz::MathQuiz(std::chrono::milliseconds duration, std::uint32_t seed)
    : duration_(duration), rng_(seed) {}

auto MathQuiz::makeQuestion(int num1, int num2, MathOperator op,
                            std::string id) -> MathQuestion {
  MathQuestion question;
  question.id = std::move(id);
  if (op == MathOperator::Plus) {
    question.answer = num1 + num2;
    question.text = fmt::format("{} + {}", num1, num2);
  } else {
    if (num1 < num2) {
      std::swap(num1, num2);
    }
    question.answer = num1 - num2;
    question.text = fmt::format("{} - {}", num1, num2);
  }
  return question;
}

auto MathQuiz::generateQuestion() -> MathQuestion {
  std::uniform_int_distribution<int> operand(constants::kMathOperandMin,
                                             constants::kMathOperandMax);
  std::bernoulli_distribution minus(0.5);
  std::uniform_int_distribution<std::uint32_t> id_bits;

  const int num1 = operand(rng_);
  const int num2 = operand(rng_);
  const auto op = minus(rng_) ? MathOperator::Minus : MathOperator::Plus;
  return makeQuestion(num1, num2, op, fmt::format("{:08x}", id_bits(rng_)));
}

auto MathQuiz::currentQuestion(const PlayerHandle& player) const
    -> std::optional<MathQuestion> {
  auto it = questions_.find(player);
  if (it == questions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MathQuiz::assignQuestion(const PlayerHandle& player,
                              MathQuestion question) {
  questions_[player] = std::move(question);
}

auto MathQuiz::gameNumber() const -> GameNumber {
  return constants::kMathQuizGame;
}

auto MathQuiz::acceptsInput(protocol::EventType type) const -> bool {
  return type == protocol::EventType::SubmitAnswer;
}

void MathQuiz::onBegin(RoundContext& context) {
  context.broadcast(protocol::encodeEvent(
      protocol::gameStartEventName(gameNumber()),
      {{"duration", durationSeconds()}}));

  for (const auto& player : context.activePlayers()) {
    issueQuestion(context, player);
  }
}

void MathQuiz::onInput(RoundContext& context, const PlayerHandle& player,
                       const nlohmann::json& body) {
  auto answer = protocol::readInt(body, "answer");
  if (!answer) {
    LOG_DEBUG << "Ignoring non-numeric answer from " << player;
    return;
  }

  auto it = questions_.find(player);
  if (it == questions_.end()) {
    LOG_DEBUG << "No question issued to " << player;
    return;
  }

  const bool correct = (*answer == it->second.answer);
  context.sendTo(player, protocol::encodeEvent(protocol::outbound::kAnswerResult,
                                               {{"correct", correct}}));
  if (correct) {
    context.addScore(player, 1);
    issueQuestion(context, player);
  }
}

void MathQuiz::onRejoin(RoundContext& context, const PlayerHandle& player) {
  context.sendTo(player, protocol::encodeEvent(
                             protocol::gameStartEventName(gameNumber()),
                             {{"duration", durationSeconds()}}));
  // 旧题目发往了已关闭的连接，换一道新题
  issueQuestion(context, player);
}

void MathQuiz::issueQuestion(RoundContext& context,
                             const PlayerHandle& player) {
  auto question = generateQuestion();
  context.sendTo(player,
                 protocol::encodeEvent(protocol::outbound::kNewQuestion,
                                       {{"id", question.id},
                                        {"text", question.text}}));
  questions_[player] = std::move(question);
}

}  // namespace mayhem::games
