// 预编译头：标准库 + Drogon/Trantor/jsoncpp
// 项目头文件不放这里，避免改一个模块就重建 PCH
#pragma once

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

// ==================== C++ 标准库 ====================

// 领域模型：变体、可选值、容器
#include <string>
#include <string_view>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <unordered_map>
#include <bitset>
#include <tuple>
#include <optional>
#include <variant>

// 并发与协程
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <future>
#include <coroutine>
#include <concepts>

// 时间、数值、随机抖动
#include <chrono>
#include <ctime>
#include <cmath>
#include <random>
#include <charconv>

// IO（配置文件、日志目录、时间格式化）
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>

#include <algorithm>
#include <functional>
#include <memory>
#include <utility>
#include <type_traits>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>

// ==================== Drogon / Trantor ====================

#include <drogon/drogon.h>
#include <drogon/WebSocketController.h>
#include <drogon/orm/DbClient.h>
#include <drogon/orm/Field.h>
#include <drogon/utils/Utilities.h>
#include <drogon/utils/coroutine.h>

#include <trantor/net/EventLoop.h>
#include <trantor/net/TcpClient.h>
#include <trantor/net/InetAddress.h>
#include <trantor/utils/Logger.h>
#include <trantor/utils/AsyncFileLogger.h>

// ==================== jsoncpp ====================

#include <json/json.h>
