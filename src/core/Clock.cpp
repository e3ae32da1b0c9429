#include "devauth/core/EngineConfig.hpp"

namespace devauth::core
{

std::int64_t systemNowMs() noexcept
{
    using Clock = std::chrono::system_clock;
    const auto sinceEpoch{ Clock::now().time_since_epoch() };
    return std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count();
}

} // namespace devauth::core
