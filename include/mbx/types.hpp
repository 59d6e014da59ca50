#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <type_traits>

namespace mbx {

/// 等待策略：Block 依赖条件变量唤醒，Spin 轮询并每轮让出 CPU
enum class WaitStrategy { Block, Spin };

namespace config {
/// 整数形式超时的单位 (秒)
constexpr std::chrono::seconds TIMEOUT_UNIT{1};

/// Spin 策略在限时等待中两次检查之间的最长休眠
constexpr std::chrono::microseconds AWAIT_POLL_INTERVAL{50};

constexpr WaitStrategy DEFAULT_WAIT_STRATEGY = WaitStrategy::Block;
} // namespace config

/**
 * @brief [数据约束] 可装箱类型
 *
 * Box 内部以值语义保存负载，因此 T 必须可拷贝构造，且不能是引用或 cv 限定类型。
 */
template <typename T>
concept Boxable = std::is_copy_constructible_v<T> && std::is_object_v<T> &&
                  std::same_as<T, std::remove_cv_t<T>>;

/// 字符数组 (含字符串字面量)，装箱时转存为 std::string
template <typename T>
concept CharArray =
    std::is_array_v<std::remove_reference_t<T>> &&
    std::same_as<std::remove_cv_t<std::remove_extent_t<std::remove_reference_t<T>>>,
                 char>;

/**
 * @brief pack / send 可接受的实参
 *
 * 其余数组一律拒绝：退化成指针后，队列里保存的将是调用方栈帧的地址。
 */
template <typename T>
concept Packable =
    CharArray<T> || (!std::is_array_v<std::remove_reference_t<T>> &&
                     Boxable<std::decay_t<T>>);

/**
 * @brief 通道不变量被破坏
 *
 * 只在"检查到有数据、却取不到数据"这类不可能状态下抛出，说明存在第二个消费者
 * 或锁纪律被绕过。属于逻辑错误，调用方不应重试。
 */
class ChannelError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace mbx
