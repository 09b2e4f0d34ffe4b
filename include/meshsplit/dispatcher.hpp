/**
 * @file dispatcher.hpp
 * @brief Dispatcher: paces a resolved chunk plan onto a transport, one chunk per tick.
 *
 * @details
 * ## Field Brief
 * A mesh radio that receives six chunks back to back will drop some of them.
 * The Dispatcher spaces chunks out: a fixed delay after every chunk and a
 * longer breather after every `burst_every`-th one. It is a tick-driven state
 * machine like the rest of the node: no threads, no sleeps, no heap.
 *
 * ```
 *  load(plan) ──► Sending ──tick(now)──► due? ──► render_chunk(i) ──► link.send()
 *                    ▲                                                  │
 *                    │              Ok    → i++, next_due = now + delay │
 *                    └───────────── Busy  → same chunk on a later tick ◄┘
 *                                   Error → Failed (no retry)
 *                    last chunk Ok → Done
 * ```
 *
 * ## Failure Model
 * - **Busy:** the link is congested; the chunk is offered again next tick.
 *   This is flow control, not a retry.
 * - **Error:** the dispatch stops in `Failed`. Retrying, acknowledgements and
 *   partial-delivery recovery belong to the transport layer.
 * - **Render failure:** a chunk longer than TEXT_CAP cannot be staged; the
 *   dispatch fails before sending it.
 *
 * The plan is copied on load(), but its `source` text is not; keep the
 * message buffer alive until done() or failed().
 */
#ifndef MESHSPLIT_DISPATCHER_HPP
#define MESHSPLIT_DISPATCHER_HPP

#include <stdint.h>
#include "etl/string.h"
#include "meshsplit/marker_resolver.hpp"
#include "meshsplit/transport/transport_base.hpp"

namespace meshsplit {

/// @brief Spacing between consecutive chunks of one message.
struct PacingPolicy {
    uint32_t split_delay_ms = 2500; ///< Wait after every chunk
    uint8_t  burst_every    = 4;    ///< Extra pause after every n-th chunk (0 disables)
    uint32_t burst_pause_ms = 5000; ///< Length of the extra pause
};

enum class DispatchState : uint8_t {
    Idle    = 0, ///< Nothing loaded
    Sending = 1, ///< Chunks remain
    Done    = 2, ///< Every chunk accepted by the transport
    Failed  = 3  ///< Transport error or render failure
};

class Dispatcher {
public:
    /// Largest chunk the dispatcher can stage (matches the 255-byte in-system payload).
    static constexpr size_t TEXT_CAP = 255;

    explicit Dispatcher(transport::ITransport& link, const PacingPolicy& pacing = PacingPolicy{});

    /**
     * @brief Start dispatching a plan.
     * @retval false a dispatch is still Sending, or the plan is empty.
     */
    bool load(const ChunkPlan& plan);

    /**
     * @brief Send at most one chunk if it is due at `now_ms`.
     * @param now_ms Monotonic milliseconds; 32-bit wraparound is handled.
     */
    void tick(uint32_t now_ms);

    /// @brief Drop the current plan and return to Idle.
    void reset();

    DispatchState state() const { return state_; }
    bool done() const { return state_ == DispatchState::Done; }
    bool failed() const { return state_ == DispatchState::Failed; }

    /// @brief Chunks accepted by the transport so far.
    size_t sent() const { return next_; }

    /// @brief Chunks still to send.
    size_t pending() const { return plan_.count() - next_; }

    /// @brief Time the next chunk becomes due (meaningful while Sending).
    uint32_t next_due_ms() const { return next_due_ms_; }

    const PacingPolicy& pacing() const { return pacing_; }
    void set_pacing(const PacingPolicy& p) { pacing_ = p; }

private:
    /// Delay to apply after the chunk that brought sent() to `sent_count`.
    uint32_t delay_after(size_t sent_count) const;

    static bool is_due(uint32_t now_ms, uint32_t due_ms);

    transport::ITransport& link_;
    PacingPolicy           pacing_;
    ChunkPlan              plan_;
    etl::string<TEXT_CAP>  line_;
    DispatchState          state_{DispatchState::Idle};
    size_t                 next_{0};
    uint32_t               next_due_ms_{0};
    bool                   has_due_{false};
};

} // namespace meshsplit

#endif // MESHSPLIT_DISPATCHER_HPP
