#pragma once

#include "Types.hpp"
#include <vector>

namespace corridor::core {

// 用圆形缓冲区的交集模拟宽度为 bufferWidth 的线状缓冲区时，
// 相邻圆心的间距（同时也是圆的半径）：bufferWidth / sin(60°)
[[nodiscard]] double bufferStepLength(double bufferWidth) noexcept;

// 沿 leg 每隔 stepLength 米取一个采样点，长度为 0 的线段被跳过
[[nodiscard]] QuerySection buildQuerySection(const Leg& leg, double stepLength);

// 保持输入顺序
[[nodiscard]] std::vector<QuerySection> buildQuerySections(const std::vector<Leg>& legs, double stepLength);

} // namespace corridor::core
