#pragma once

struct pw_thread_loop;

namespace tunebox::audio {

// Process-wide PipeWire thread loop. Every stream call must happen with
// the loop locked; stream callbacks already run with it held.
class PipeWireContext {
public:
    PipeWireContext() = default;
    ~PipeWireContext();

    PipeWireContext(const PipeWireContext&) = delete;
    PipeWireContext& operator=(const PipeWireContext&) = delete;

    [[nodiscard]] bool init();
    struct pw_thread_loop* get_loop() const { return loop_; }

    void lock();
    void unlock();

private:
    struct pw_thread_loop* loop_ = nullptr;
};

// Scoped lock on the PipeWire thread loop.
class PipeWireLock {
public:
    explicit PipeWireLock(PipeWireContext& context) : context_(context) { context_.lock(); }
    ~PipeWireLock() { context_.unlock(); }

    PipeWireLock(const PipeWireLock&) = delete;
    PipeWireLock& operator=(const PipeWireLock&) = delete;

private:
    PipeWireContext& context_;
};

}  // namespace tunebox::audio
