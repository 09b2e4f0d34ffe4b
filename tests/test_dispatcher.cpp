#include <doctest/doctest.h>
#include <deque>
#include <string>
#include <vector>
#include "meshsplit/dispatcher.hpp"
#include "meshsplit/message_splitter.hpp"
using namespace meshsplit;

// Records every accepted chunk; replies from a scripted queue (Ok when empty).
class FakeTransport : public transport::ITransport {
public:
    std::vector<std::string>       sent;
    std::deque<transport::TxResult> script;
    int polls = 0;

    bool begin(const transport::Config&) override { return true; }
    void end() override {}
    void poll() override { ++polls; }
    transport::TxResult send(const uint8_t* data, std::size_t len) override {
        transport::TxResult r = transport::TxResult::Ok;
        if (!script.empty()) { r = script.front(); script.pop_front(); }
        if (r == transport::TxResult::Ok) sent.emplace_back(reinterpret_cast<const char*>(data), len);
        return r;
    }
    const char* name() const override { return "fake"; }
    std::size_t mtu() const override { return 255; }
};

static ChunkPlan three_chunks() {
    static const char* text = "hello mesh world";
    SplitLimits limits;
    limits.chunk_limit = 12;
    ChunkPlan plan;
    REQUIRE(split_message(text, 16, limits, plan) == SplitStatus::Ok);
    REQUIRE(plan.count() == 3);
    return plan;
}

static PacingPolicy fast_pacing() {
    PacingPolicy p;
    p.split_delay_ms = 100;
    p.burst_every    = 2;
    p.burst_pause_ms = 1000;
    return p;
}

TEST_CASE("Dispatcher: idle until loaded; empty plans are refused") {
    FakeTransport link;
    Dispatcher d(link);
    CHECK(d.state() == DispatchState::Idle);
    d.tick(0);
    CHECK(link.sent.empty());

    ChunkPlan empty;
    CHECK_FALSE(d.load(empty));
}

TEST_CASE("Dispatcher: one chunk per due tick with split delay and burst pause") {
    FakeTransport link;
    Dispatcher d(link, fast_pacing());
    REQUIRE(d.load(three_chunks()));

    d.tick(0);                       // first chunk goes immediately
    REQUIRE(link.sent.size() == 1);
    CHECK(link.sent[0] == "(1/3) hello ");
    CHECK(d.next_due_ms() == 100);

    d.tick(50);                      // not due
    CHECK(link.sent.size() == 1);

    d.tick(100);
    REQUIRE(link.sent.size() == 2);
    CHECK(link.sent[1] == "(2/3) mesh ");
    CHECK(d.next_due_ms() == 1200);  // 2nd chunk closes a burst

    d.tick(1199);
    CHECK(link.sent.size() == 2);

    d.tick(1200);
    REQUIRE(link.sent.size() == 3);
    CHECK(link.sent[2] == "(3/3) world");
    CHECK(d.done());
    CHECK(d.sent() == 3);
    CHECK(d.pending() == 0);
}

TEST_CASE("Dispatcher: a plan in flight is not replaced") {
    FakeTransport link;
    Dispatcher d(link, fast_pacing());
    REQUIRE(d.load(three_chunks()));
    d.tick(0);
    CHECK_FALSE(d.load(three_chunks()));
    CHECK(d.sent() == 1);
}

TEST_CASE("Dispatcher: Busy keeps the chunk for the next tick") {
    FakeTransport link;
    link.script = {transport::TxResult::Busy, transport::TxResult::Busy};
    Dispatcher d(link, fast_pacing());
    REQUIRE(d.load(three_chunks()));

    d.tick(0);
    d.tick(1);
    CHECK(link.sent.empty());
    CHECK(d.state() == DispatchState::Sending);

    d.tick(2);
    REQUIRE(link.sent.size() == 1);
    CHECK(link.sent[0] == "(1/3) hello ");
}

TEST_CASE("Dispatcher: Error stops the dispatch; a new plan may follow") {
    FakeTransport link;
    link.script = {transport::TxResult::Ok, transport::TxResult::Error};
    Dispatcher d(link, fast_pacing());
    REQUIRE(d.load(three_chunks()));

    d.tick(0);
    d.tick(100);
    CHECK(d.failed());
    CHECK(d.sent() == 1);

    d.tick(5000);                    // failed dispatch stays put
    CHECK(link.sent.size() == 1);

    CHECK(d.load(three_chunks()));
    CHECK(d.state() == DispatchState::Sending);
}

TEST_CASE("Dispatcher: due time survives 32-bit wraparound") {
    FakeTransport link;
    Dispatcher d(link, fast_pacing());
    REQUIRE(d.load(three_chunks()));

    d.tick(0xFFFFFFF0u);
    REQUIRE(link.sent.size() == 1);

    d.tick(0x00000010u);             // 32 ms later, delay is 100
    CHECK(link.sent.size() == 1);

    d.tick(0x00000054u);             // exactly 100 ms later
    CHECK(link.sent.size() == 2);
}

TEST_CASE("Dispatcher: burst_every 0 disables the pause; single chunk finishes at once") {
    FakeTransport link;
    PacingPolicy p = fast_pacing();
    p.burst_every = 0;
    Dispatcher d(link, p);
    REQUIRE(d.load(three_chunks()));
    d.tick(0);
    d.tick(100);
    CHECK(d.next_due_ms() == 200);

    d.reset();
    CHECK(d.state() == DispatchState::Idle);

    SplitLimits limits;
    ChunkPlan one;
    REQUIRE(split_message("ping", 4, limits, one) == SplitStatus::Ok);
    REQUIRE(d.load(one));
    d.tick(7);
    CHECK(d.done());
    CHECK(link.sent.back() == "ping");
}
