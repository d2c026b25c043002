#pragma once

#include "ui/InputEvent.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifdef __linux__
#include <termios.h>
#endif

namespace tunebox::ui {

// Raw-mode terminal on stdin/stdout. Output is queued and written by a
// background thread so the UI loop never blocks on a slow tty.
class Terminal {
public:
    static Terminal& instance();

    void init();
    // Restores the saved termios and leaves the alternate screen. Safe to
    // call more than once.
    void shutdown();
    bool is_initialized() const;

    void clear_screen();
    // Replaces the whole screen with the given lines in one write.
    void draw_lines(const std::vector<std::string>& lines);
    void write_raw(const std::string& text);

    // Non-blocking; returns a None event when no key is pending.
    InputEvent read_input();
    // Waits up to timeout_ms for input before reading.
    InputEvent poll_input(int timeout_ms);

    // Set by SIGINT/SIGTERM
    bool quit_requested() const;

    int get_terminal_width() const;
    int get_terminal_height() const;

private:
    Terminal();
    ~Terminal();

    void writer_loop();
    bool read_byte(char& c);

    bool initialized_ = false;

    std::thread writer_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> write_queue_;
    std::atomic<bool> running_{false};

#ifdef __linux__
    ::termios original_termios_;
    int original_flags_ = 0;
#endif
};

}  // namespace tunebox::ui
