// 预编译头文件 (PCH)
// 仅包含稳定的标准库和第三方库头文件
// 不包含项目内部头文件（变化频繁会导致 PCH 频繁重建）
#pragma once

// ==================== C++ 标准库 ====================

// 容器
#include <string>
#include <vector>
#include <map>
#include <array>
#include <deque>

// 工具
#include <functional>
#include <optional>
#include <memory>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <future>

// IO / 格式化
#include <sstream>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <filesystem>

// 其他
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <cfloat>
#include <ctime>
#include <cerrno>
#include <algorithm>
#include <numeric>
#include <limits>
#include <bit>
#include <utility>
#include <cctype>
#include <exception>
#include <stdexcept>

// ==================== Trantor ====================

#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThread.h>
#include <trantor/net/TcpClient.h>
#include <trantor/net/InetAddress.h>
#include <trantor/net/Resolver.h>
#include <trantor/utils/AsyncFileLogger.h>
#include <trantor/utils/Logger.h>
#include <trantor/utils/MsgBuffer.h>

// ==================== 第三方库 ====================

#include <json/json.h>
