#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace tunebox::ui {

// Handlers only touch sig_atomic_t flags; the UI loop does the rest.
static volatile std::sig_atomic_t g_resize_pending = 0;
static volatile std::sig_atomic_t g_quit_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

static void quit_handler(int) {
    g_quit_pending = 1;
}

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::Terminal() {}
Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (initialized_) return;

#ifdef __linux__
    if (tcgetattr(STDIN_FILENO, &original_termios_) != 0) {
        util::Logger::warn(std::format("Terminal: tcgetattr failed: {}", std::strerror(errno)));
    }

    ::termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON | ISIG);  // ctrl+c arrives as a key
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);

    original_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, original_flags_ | O_NONBLOCK);

    std::signal(SIGWINCH, sigwinch_handler);
    std::signal(SIGINT, quit_handler);
    std::signal(SIGTERM, quit_handler);
#endif

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?1049h");  // alternate screen
    write_raw("\033[?25l");    // hide cursor
    initialized_ = true;
    util::Logger::debug("Terminal: Raw mode enabled");
}

void Terminal::shutdown() {
    if (!initialized_) return;

    write_raw("\033[0m\033[?25h");
    write_raw("\033[?1049l");

    running_ = false;
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

#ifdef __linux__
    fcntl(STDIN_FILENO, F_SETFL, original_flags_);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#endif
    initialized_ = false;
    util::Logger::debug("Terminal: Restored");
}

bool Terminal::is_initialized() const {
    return initialized_;
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });
            if (write_queue_.empty()) break;  // stopped and drained
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = ::write(STDOUT_FILENO, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0) {
                if (errno == EINTR) continue;
                // stdout may share O_NONBLOCK with stdin
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd = {STDOUT_FILENO, POLLOUT, 0};
                    poll(&pfd, 1, 100);
                    continue;
                }
                util::Logger::error("Terminal writer error: " + std::string(std::strerror(errno)));
                break;
            }
        }
    }
}

void Terminal::write_raw(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(text);
    }
    queue_cv_.notify_one();
}

void Terminal::clear_screen() {
    write_raw("\033[2J\033[H");
}

void Terminal::draw_lines(const std::vector<std::string>& lines) {
    std::string frame = "\033[H";
    for (size_t row = 0; row < lines.size(); ++row) {
        frame += std::format("\033[{};1H{}\033[0m\033[K", row + 1, lines[row]);
    }
    frame += "\033[J";
    write_raw(frame);
}

bool Terminal::read_byte(char& c) {
    ssize_t n;
    do {
        n = ::read(STDIN_FILENO, &c, 1);
    } while (n < 0 && errno == EINTR);
    return n == 1;
}

InputEvent Terminal::poll_input(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready < 0 && errno != EINTR) {
        util::Logger::warn(std::format("Terminal: poll failed: {}", std::strerror(errno)));
    }
    return read_input();
}

InputEvent Terminal::read_input() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return {InputEvent::Type::Resize, 0, "resize"};
    }

    char c;
    if (!read_byte(c)) {
        return {};
    }

    if (c == '\033') {
        char seq[2];
        if (read_byte(seq[0]) && seq[0] == '[' && read_byte(seq[1])) {
            switch (seq[1]) {
                case 'A': return {InputEvent::Type::KeyPress, 0, "up"};
                case 'B': return {InputEvent::Type::KeyPress, 0, "down"};
                case 'C': return {InputEvent::Type::KeyPress, 0, "right"};
                case 'D': return {InputEvent::Type::KeyPress, 0, "left"};
            }
        }
        return {InputEvent::Type::KeyPress, 27, "esc"};
    }

    switch (c) {
        case '\n':
        case '\r': return {InputEvent::Type::KeyPress, c, "enter"};
        case ' ': return {InputEvent::Type::KeyPress, c, "space"};
        case 0x03: return {InputEvent::Type::KeyPress, c, "ctrl+c"};
        case 0x7f:
        case 0x08: return {InputEvent::Type::KeyPress, c, "backspace"};
        default: break;
    }

    return {InputEvent::Type::KeyPress, c, std::string(1, c)};
}

bool Terminal::quit_requested() const {
    return g_quit_pending != 0;
}

int Terminal::get_terminal_width() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0) return 80;
    return w.ws_col;
}

int Terminal::get_terminal_height() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_row == 0) return 24;
    return w.ws_row;
}

}  // namespace tunebox::ui
