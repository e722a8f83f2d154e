#pragma once

#include <deque>
#include <string>

class EconomyLog {
public:
    static constexpr size_t kCapacity = 64;

    EconomyLog();

    void addEvent(int day, const std::string& event);
    void clearEvents();
    const std::deque<std::string>& getEvents() const { return m_events; }
    size_t totalRaised() const { return m_totalRaised; }
    void setEchoToStdout(bool echo);

private:
    std::deque<std::string> m_events; // oldest first, at most kCapacity
    size_t m_totalRaised;
    bool m_echo;
};
