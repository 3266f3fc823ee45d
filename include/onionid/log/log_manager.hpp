#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>

#include <onionid/log/logger.hpp>
#include <onionid/log/console.hpp>
#include <onionid/utils/singleton.hpp>
#include <onionid/utils/format.hpp>

namespace onionid::log
{

enum class Type
{
    Console
};

/// @brief Dispatches messages to the enabled sinks.
///
/// Messages above the current level are dropped before formatting.
///
class LogManager final : public utils::Singleton<LogManager>
{
public:
    LogManager();

    ~LogManager() noexcept;

    /// @brief Disables every sink.
    void finalize();

    void setLevel(Level level);

    Level getLevel() const;

    void enable(Type type);

    void disable(Type type);

    void write(Level level, std::string_view msg);

private:
    std::atomic<Level> maxLevel_;
    std::map<Type, std::shared_ptr<Logger>> loggers_;
    std::mutex mutex_;
};

template <typename... Args>
void print(Level level, std::string_view str, Args&&... args)
{
    auto& inst = LogManager::Instance();
    if (level <= inst.getLevel())
    {
        inst.write(level, utils::format(str, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void critical(std::string_view str, Args&&... args)
{
    print(Level::Critical, str, std::forward<Args>(args)...);
}

template <typename... Args>
void error(std::string_view str, Args&&... args)
{
    print(Level::Error, str, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::string_view str, Args&&... args)
{
    print(Level::Warning, str, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::string_view str, Args&&... args)
{
    print(Level::Info, str, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::string_view str, Args&&... args)
{
    print(Level::Debug, str, std::forward<Args>(args)...);
}

} // namespace onionid::log
