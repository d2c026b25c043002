#include "audio/PipeWireContext.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>

namespace tunebox::audio {

PipeWireContext::~PipeWireContext() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    // pw_deinit() is left to process exit
}

bool PipeWireContext::init() {
    if (loop_) return true;

    pw_init(nullptr, nullptr);
    loop_ = pw_thread_loop_new("tunebox-audio", nullptr);
    if (!loop_) {
        util::Logger::error("PipeWireContext: Failed to create thread loop");
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        util::Logger::error("PipeWireContext: Failed to start thread loop");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    util::Logger::debug("PipeWireContext: Thread loop running");
    return true;
}

void PipeWireContext::lock() {
    if (loop_) pw_thread_loop_lock(loop_);
}

void PipeWireContext::unlock() {
    if (loop_) pw_thread_loop_unlock(loop_);
}

}  // namespace tunebox::audio
