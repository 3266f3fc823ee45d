#pragma once

namespace onionid::utils
{

/// @brief Process-wide instance of T, constructed on first use.
template <typename T>
class Singleton
{
public:
    static T& Instance()
    {
        static T instance;
        return instance;
    }

    Singleton(const Singleton& other) = delete;
    Singleton& operator=(const Singleton& other) = delete;

protected:
    Singleton() = default;
    ~Singleton() = default;
};

} // namespace onionid::utils
