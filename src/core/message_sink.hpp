#pragma once

#include <string>

namespace mayhem::core {

/**
 * @brief 出站消息通道
 *
 * 传输层与游戏逻辑之间的边界。WebSocket会话实现此接口；
 * send() 必须是非阻塞的，发送失败时可以抛出异常，由调用方记录并跳过。
 */
class MessageSink {
 public:
  virtual ~MessageSink() = default;

  virtual void send(const std::string& message) = 0;
};

}  // namespace mayhem::core
