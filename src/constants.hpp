#pragma once

#include <numbers>

static constexpr float pi = std::numbers::pi_v<float>;
static constexpr float sqrt2 = std::numbers::sqrt2_v<float>;
