#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace tc
{

// Minimal logger shared by the whole process
class SimpleLogger {
public:
    enum class Level {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical
    };

    SimpleLogger();
    ~SimpleLogger();

    void setLevel(Level level) { currentLevel_ = level; }
    [[nodiscard]] Level level() const { return currentLevel_; }
    void addFile(const std::filesystem::path& path);

    // Prepended to every message, e.g. "rank 2/4"
    void setPrefix(const std::string& prefix);

    template<typename... Args>
    void trace(const std::string& fmt, Args&&... args) {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(const std::string& fmt, Args&&... args) {
        log(Level::Critical, fmt, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    void log(Level level, const std::string& fmt, Args&&... args) {
        if (level < currentLevel_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::string msg = formatMessage(fmt, std::forward<Args>(args)...);
        std::string prefix = levelPrefix(level);
        if (!prefix_.empty()) {
            prefix += "[" + prefix_ + "] ";
        }

        std::cerr << prefix << msg << std::endl;

        for (auto& file : files_) {
            if (file.is_open()) {
                file << prefix << msg << std::endl;
                file.flush();
            }
        }
    }

    template<typename T>
    std::string toString(T&& val) {
        std::ostringstream oss;
        oss << std::forward<T>(val);
        return oss.str();
    }

    template<typename T, typename... Args>
    std::string formatMessage(const std::string& fmt, T&& first, Args&&... rest) {
        std::string result = fmt;
        substitute(result, 0, std::forward<T>(first), std::forward<Args>(rest)...);
        return result;
    }

    // Placeholders are searched for after the text already inserted
    template<typename T, typename... Args>
    void substitute(std::string& result, size_t from, T&& first, Args&&... rest) {
        size_t pos = result.find("{}", from);
        if (pos == std::string::npos) return;
        std::string value = toString(std::forward<T>(first));
        result.replace(pos, 2, value);
        if constexpr (sizeof...(rest) > 0) {
            substitute(result, pos + value.size(), std::forward<Args>(rest)...);
        }
    }

    static std::string formatMessage(const std::string& fmt) {
        return fmt;
    }

    static std::string levelPrefix(Level level);

    Level currentLevel_ = Level::Info;
    std::mutex mutex_;
    std::vector<std::ofstream> files_;
    std::string prefix_;
};

void AddLogFile(const std::filesystem::path& path);
void SetLogLevel(const std::string& s);
std::shared_ptr<SimpleLogger> Logger();

}  // namespace tc
