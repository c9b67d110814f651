#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>
#include <ctime>

namespace loan::adapters::secondary {

/**
 * @brief Текущая дата по локальному времени системы
 */
class SystemClock : public ports::output::IClock {
public:
    domain::Date today() const override {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm = {};
        localtime_r(&t, &tm);
        return domain::Date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    }
};

} // namespace loan::adapters::secondary
