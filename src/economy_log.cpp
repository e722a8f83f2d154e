#include "economy_log.h"

#include <iostream>
#include <utility>

EconomyLog::EconomyLog() : m_totalRaised(0), m_echo(false) {}

void EconomyLog::addEvent(int day, const std::string& event) {
    std::string line = "day " + std::to_string(day) + ": " + event;
    if (m_echo) {
        std::cout << "[econ] " << line << "\n";
    }
    m_events.push_back(std::move(line));
    ++m_totalRaised;
    if (m_events.size() > kCapacity) {
        m_events.pop_front();
    }
}

void EconomyLog::clearEvents() {
    m_events.clear();
}

void EconomyLog::setEchoToStdout(bool echo) {
    m_echo = echo;
}
