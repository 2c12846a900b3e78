#pragma once

namespace sessionwatch {

enum class IndicatorState {
    Normal,
    Warning
};

} // namespace sessionwatch
