#pragma once
#include <string>
#include <thread>

// Appends every line read from the pipe to log_path until the write end closes.
void logger_loop(int pipe_read_fd, const std::string& log_path);

// Writes "[time] [tag] msg" to the logger pipe, or to stderr when log_fd < 0.
void log_line(int log_fd, const char* tag, const std::string& msg);

class Logger {
public:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool start(const std::string& log_path);
    void stop();
    int fd() const { return pipe_[1]; }

private:
    int pipe_[2]{-1, -1};
    std::thread thread_;
};
