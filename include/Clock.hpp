#pragma once
#include <cstdint>
#include <functional>

// Milliseconds since the Unix epoch. Injected so lockout timing can be tested.
using Clock = std::function<std::int64_t()>;

std::int64_t systemNowMs();
