#pragma once

#include <string>
#include <cstdio>
#include <cstdlib>

namespace loan::domain {

/**
 * @brief Денежные суммы в графике платежей
 *
 * Суммы хранятся в double и округляются до копеек (центов) на каждом шаге.
 * Округление идёт по точному двоичному значению числа, ничьи - к чётному
 * (как printf("%.2f")), поэтому 0.125 -> 0.12, а 2.675 -> 2.67.
 */
class Money {
public:
    /**
     * @brief Округлить сумму до 2 знаков после запятой
     */
    static double roundCents(double value) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.2f", value);
        return std::strtod(buf, nullptr);
    }

    /**
     * @brief Строка ровно с 2 знаками после запятой ("106.62", "0.00")
     */
    static std::string format(double value) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.2f", value);
        return buf;
    }
};

} // namespace loan::domain
