#include <onionid/log/log_manager.hpp>

namespace onionid::log
{

LogManager::LogManager()
    : maxLevel_{Level::Warning}
{
}

LogManager::~LogManager() noexcept
{
    finalize();
}

void LogManager::finalize()
{
    std::lock_guard<std::mutex> lock(mutex_);
    loggers_.clear();
}

void LogManager::setLevel(Level level)
{
    maxLevel_.store(level, std::memory_order_relaxed);
}

Level LogManager::getLevel() const
{
    return maxLevel_.load(std::memory_order_relaxed);
}

void LogManager::enable(Type type)
{
    std::shared_ptr<Logger> logger;
    switch (type)
    {
    case Type::Console:
        logger = std::make_shared<Console>();
        break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    loggers_.insert_or_assign(type, std::move(logger));
}

void LogManager::disable(Type type)
{
    std::lock_guard<std::mutex> lock(mutex_);
    loggers_.erase(type);
}

void LogManager::write(Level level, std::string_view msg)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : loggers_)
    {
        entry.second->write(level, msg);
    }
}

} // namespace onionid::log
