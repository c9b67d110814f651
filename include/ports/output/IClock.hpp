#pragma once

#include "domain/Date.hpp"

namespace loan::ports::output {

/**
 * @brief Источник текущей даты
 *
 * Нужен для даты начала графика по умолчанию.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Date today() const = 0;
};

} // namespace loan::ports::output
