// sysml/basic/cancellation.hpp - Generation-based cancellation
#pragma once

#include <atomic>
#include <cstdint>

namespace sysml
{

/**
 * Cooperative cancellation tied to a generation counter.
 *
 * A token captures the counter value when work starts; the work is
 * cancelled as soon as anyone advances the counter. A default-constructed
 * token is never cancelled.
 *
 * The counter must outlive every token that observes it.
 */
class CancellationToken
{
public:
  CancellationToken() = default;

  CancellationToken(const std::atomic<uint64_t> * generation, uint64_t captured) noexcept
  : generation_(generation), captured_(captured)
  {
  }

  [[nodiscard]] bool is_cancelled() const noexcept
  {
    return generation_ != nullptr && generation_->load(std::memory_order_acquire) != captured_;
  }

  [[nodiscard]] uint64_t captured_generation() const noexcept { return captured_; }

private:
  const std::atomic<uint64_t> * generation_ = nullptr;
  uint64_t captured_ = 0;
};

}  // namespace sysml
