#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <onionid/log/console.hpp>
#include <onionid/log/color.hpp>

namespace
{

std::string currentTimeAndDate()
{
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "[%X %Y-%m-%d]");
    return ss.str();
}

void print(std::ostream& os, std::string_view color, std::string_view label, std::string_view msg)
{
    os << currentTimeAndDate() << "[" << color << label << onionid::log::resetColor << "] " << msg << std::endl;
}

} // namespace

namespace onionid::log
{

void Console::write(Level level, std::string_view msg)
{
    switch (level)
    {
    case Level::Emergency:
        print(std::cerr, bRed, "EMERG", msg);
        break;
    case Level::Alert:
        print(std::cerr, bRed, "ALERT", msg);
        break;
    case Level::Critical:
        print(std::cerr, bRed, "CRITL", msg);
        break;
    case Level::Error:
        print(std::cerr, bRed, "ERROR", msg);
        break;
    case Level::Warning:
        print(std::cout, bYellow, "WARNG", msg);
        break;
    case Level::Notice:
        print(std::cout, bWhite, "NOTIC", msg);
        break;
    case Level::Info:
        print(std::cout, bWhite, "INFOR", msg);
        break;
    case Level::Debug:
        print(std::cout, bCyan, "DEBUG", msg);
        break;
    }
}

} // namespace onionid::log
