#pragma once

#include <utility>

// sets a variable for the lifetime of the guard, restoring the previous value on every exit path
template<typename T>
class scoped_value final
{
  public:
    scoped_value(T& target, T value)
        : m_target {target}
        , m_saved {std::exchange(target, std::move(value))}
    {
    }

    ~scoped_value() { m_target = std::move(m_saved); }

    scoped_value(const scoped_value&) = delete;
    scoped_value(scoped_value&&) = delete;
    auto operator=(const scoped_value&) -> scoped_value& = delete;
    auto operator=(scoped_value&&) -> scoped_value& = delete;

  private:
    T& m_target;
    T m_saved;
};
