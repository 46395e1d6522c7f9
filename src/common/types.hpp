#pragma once

/**
 * @file types.hpp
 * @brief 通用类型定义
 *
 * 这个文件包含项目中使用的通用类型别名，
 * 用于减少头文件间的依赖关系和编译时间。
 */

#include <cstdint>
#include <string>

namespace mayhem {
using Port = std::uint16_t;
using ThreadCount = int;

// 连接ID：每次握手分配，重连后不同
using ConnectionId = std::string;
// 用户名：由身份提供者验证，作为重连键
using Username = std::string;
using LobbyCode = std::string;
using GameNumber = int;
}  // namespace mayhem
