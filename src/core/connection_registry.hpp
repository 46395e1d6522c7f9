#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"
#include "core/message_sink.hpp"
#include "core/player.hpp"

namespace mayhem::core {

/**
 * @brief 连接注册表
 *
 * 将连接ID映射到在线的Player。生命周期与传输连接一一对应：
 * 握手成功后注册，断开时注销（无论是否在大厅中）。
 * 不强制用户名唯一，唯一性由Lobby在加入时检查。
 * 此类是线程安全的。
 */
class ConnectionRegistry {
 public:
  ConnectionRegistry();
  ~ConnectionRegistry();

  // 禁止拷贝和赋值
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  auto operator=(const ConnectionRegistry&) -> ConnectionRegistry& = delete;

  /**
   * @brief 为一个已验证身份的连接分配新的连接ID并创建Player。
   *
   * @param sink 该连接的出站消息通道
   * @param username 身份提供者验证过的用户名
   * @return 绑定到此连接的新Player
   */
  auto registerConnection(const std::shared_ptr<MessageSink>& sink,
                          const Username& username) -> std::shared_ptr<Player>;

  /**
   * @brief 移除一个连接。幂等。
   *
   * @return 被移除的Player；不存在时返回nullptr
   */
  auto unregister(const ConnectionId& id) -> std::shared_ptr<Player>;

  /**
   * @brief 获取特定连接ID的玩家。
   *
   * @return 如果找到返回Player；否则返回nullptr。
   */
  auto getPlayer(const ConnectionId& id) const -> std::shared_ptr<Player>;

  auto getAllPlayers() const -> std::vector<std::shared_ptr<Player>>;

  auto getConnectionCount() const -> size_t;

 private:
  auto nextConnectionId() -> ConnectionId;

  std::unordered_map<ConnectionId, std::shared_ptr<Player>> players_;
  std::uint64_t next_sequence_ = 1;
  const std::uint32_t instance_salt_;

  mutable std::mutex mutex_;
};

}  // namespace mayhem::core
