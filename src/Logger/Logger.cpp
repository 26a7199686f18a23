#include "Logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <unistd.h>


// Desc: logger loop to read from pipe and append to log file
// In: int pipe_read_fd, const std::string& log_path
// Out: void (returns once every write end is closed)
void logger_loop(int pipe_read_fd, const std::string& log_path) {
    char buf[1024];
    // [Main loop of logger thread]
    while (true) {
        ssize_t len = read(pipe_read_fd, buf, sizeof(buf) - 1);
        if (len == 0) break;
        if (len < 0) {
            if (errno == EINTR) continue;
            break;
        }
        buf[len] = '\0';
        FILE* f = fopen(log_path.c_str(), "a");
        if (f) {
            fwrite(buf, 1, len, f);
            fclose(f);
        }
    }
}


// Desc: format a timestamped line and push it to the log pipe
// In: int log_fd, const char* tag, const std::string& msg
// Out: void
void log_line(int log_fd, const char* tag, const std::string& msg) {
    std::time_t now = std::time(nullptr);
    char dt[64];
    ctime_r(&now, dt);
    dt[std::strlen(dt) - 1] = '\0'; // remove \n

    std::string line = "[" + std::string(dt) + "] [" + tag + "] " + msg + "\n";
    const int fd = log_fd >= 0 ? log_fd : STDERR_FILENO;
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
}


// Desc: create the log pipe and spawn the logger thread
// In: const std::string& log_path
// Out: bool (false if the pipe could not be created)
bool Logger::start(const std::string& log_path) {
    if (pipe_[1] >= 0) return true;
    if (pipe(pipe_) == -1) {
        perror("pipe");
        pipe_[0] = pipe_[1] = -1;
        return false;
    }
    const int read_fd = pipe_[0];
    thread_ = std::thread([read_fd, log_path]() { logger_loop(read_fd, log_path); });
    return true;
}


// Desc: close the write end, let the logger drain, then join
// In: (none)
// Out: void
void Logger::stop() {
    if (pipe_[1] >= 0) {
        ::close(pipe_[1]);
        pipe_[1] = -1;
    }
    if (thread_.joinable()) thread_.join();
    if (pipe_[0] >= 0) {
        ::close(pipe_[0]);
        pipe_[0] = -1;
    }
}

Logger::~Logger() {
    stop();
}
