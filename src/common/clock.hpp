#pragma once

#include <chrono>

namespace segedit {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Wall-clock time source for backup timestamps. Tests substitute MockClock
// so that consecutive writes land on distinct, predictable seconds.

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class MockClock final : public Clock {
public:
    MockClock() : now_(std::chrono::system_clock::now()) {}

    [[nodiscard]] time_point now() const override {
        return now_;
    }

    void advance(std::chrono::seconds delta) {
        now_ += delta;
    }

    void set(time_point tp) {
        now_ = tp;
    }

private:
    time_point now_;
};

} // namespace segedit
