#pragma once

#include <chrono>
#include <cstdint>

namespace tkv {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Wall-clock source for key expiry and stream ID generation. Values are Unix
// time in milliseconds so that absolute expiry timestamps and stream IDs share
// one time base.

class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual int64_t now_ms() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────

class SystemClock final : public Clock {
public:
    [[nodiscard]] int64_t now_ms() const override {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() / set() calls.

class MockClock final : public Clock {
public:
    explicit MockClock(int64_t start_ms = 1'700'000'000'000) : now_(start_ms) {}

    [[nodiscard]] int64_t now_ms() const override {
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta.count();
    }

    void set(int64_t ms) {
        now_ = ms;
    }

private:
    int64_t now_;
};

} // namespace tkv
