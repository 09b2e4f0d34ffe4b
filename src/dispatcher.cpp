// -----------------------------------------------------------------------------
// dispatcher.cpp: Implementation of the chunk Dispatcher
//
// API & state diagram:
//   see include/meshsplit/dispatcher.hpp
//
// NOTE: This file focuses on *how* pacing and transport results are applied.
// External-facing API contracts live in the header.
// -----------------------------------------------------------------------------
#include "meshsplit/dispatcher.hpp"
#include "meshsplit/message_splitter.hpp"

namespace meshsplit {

Dispatcher::Dispatcher(transport::ITransport& link, const PacingPolicy& pacing)
: link_(link), pacing_(pacing) {}

// -----------------------------------------------------------------------------
// load(): Accept a new plan.
// POLICY:
//   - Refuse while Sending; a plan already on the air is never preempted.
//   - Done/Failed/Idle dispatchers accept a new plan.
//   - The first chunk is due on the very next tick.
// -----------------------------------------------------------------------------
bool Dispatcher::load(const ChunkPlan& plan) {
  if (state_ == DispatchState::Sending) return false;
  if (plan.count() == 0) return false;

  plan_        = plan;
  next_        = 0;
  has_due_     = false;
  next_due_ms_ = 0;
  state_       = DispatchState::Sending;
  return true;
}

void Dispatcher::reset() {
  plan_.clear();
  line_.clear();
  next_        = 0;
  has_due_     = false;
  next_due_ms_ = 0;
  state_       = DispatchState::Idle;
}

// -----------------------------------------------------------------------------
// tick(): Send the next chunk if due.
// PRE:   state_ == Sending, otherwise nothing happens.
// POLICY:
//   - At most one transport call per tick.
//   - Busy leaves next_ and next_due_ms_ unchanged.
//   - Error or render failure ends the dispatch in Failed.
// -----------------------------------------------------------------------------
void Dispatcher::tick(uint32_t now_ms) {
  if (state_ != DispatchState::Sending) return;

  link_.poll();

  if (has_due_ && !is_due(now_ms, next_due_ms_)) return;

  if (!render_chunk(plan_, next_, line_)) {
    state_ = DispatchState::Failed;        // chunk larger than TEXT_CAP
    return;
  }

  const transport::TxResult r =
      link_.send(reinterpret_cast<const uint8_t*>(line_.c_str()), line_.size());

  switch (r) {
    case transport::TxResult::Ok:
      ++next_;
      if (next_ >= plan_.count()) {
        state_ = DispatchState::Done;
        return;
      }
      next_due_ms_ = now_ms + delay_after(next_);
      has_due_     = true;
      return;

    case transport::TxResult::Busy:
      return;                              // same chunk, later tick

    case transport::TxResult::Error:
      state_ = DispatchState::Failed;
      return;
  }
}

uint32_t Dispatcher::delay_after(size_t sent_count) const {
  uint32_t delay = pacing_.split_delay_ms;
  if (pacing_.burst_every > 0 && sent_count % pacing_.burst_every == 0) {
    delay += pacing_.burst_pause_ms;
  }
  return delay;
}

// Wrap-safe: the difference is interpreted as signed 32-bit.
bool Dispatcher::is_due(uint32_t now_ms, uint32_t due_ms) {
  return static_cast<int32_t>(now_ms - due_ms) >= 0;
}

} // namespace meshsplit
