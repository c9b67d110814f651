#pragma once

#include <string>
#include <optional>
#include <cstdio>
#include <cctype>

namespace loan::domain {

/**
 * @brief Календарная дата (григорианский календарь, без времени)
 *
 * Хранит год, месяц (1-12) и день (1-31). Используется для дат платежей
 * в графике погашения.
 */
class Date {
public:
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;

    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Високосный год: делится на 4, кроме веков, не делящихся на 400
     */
    static bool isLeapYear(int y) {
        return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
    }

    /**
     * @brief Количество дней в месяце с учётом високосного февраля
     */
    static int daysInMonth(int y, int m) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && isLeapYear(y)) {
            return 29;
        }
        return days[m - 1];
    }

    /**
     * @brief Разобрать дату в формате YYYY-MM-DD
     *
     * @return std::nullopt если строка не в формате ISO или дата не существует
     *         (например 2023-02-29)
     */
    static std::optional<Date> fromIsoString(const std::string& str) {
        if (str.size() != 10 || str[4] != '-' || str[7] != '-') {
            return std::nullopt;
        }
        for (size_t i = 0; i < str.size(); ++i) {
            if (i == 4 || i == 7) continue;
            if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
                return std::nullopt;
            }
        }

        int y = std::stoi(str.substr(0, 4));
        int m = std::stoi(str.substr(5, 2));
        int d = std::stoi(str.substr(8, 2));

        if (y < 1 || m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
            return std::nullopt;
        }
        return Date(y, m, d);
    }

    /**
     * @brief Сдвинуть дату на months месяцев
     *
     * Если такого дня в целевом месяце нет, берётся последний день месяца:
     * 31 января + 1 месяц = 28 (29) февраля, а не 3 марта.
     */
    Date plusMonths(int months) const {
        int index = month - 1 + months;
        int yearShift = index / 12;
        int newMonth = index % 12;
        if (newMonth < 0) {
            newMonth += 12;
            --yearShift;
        }

        Date result;
        result.year = year + yearShift;
        result.month = newMonth + 1;
        int lastDay = daysInMonth(result.year, result.month);
        result.day = day < lastDay ? day : lastDay;
        return result;
    }

    /**
     * @brief ISO 8601 представление (YYYY-MM-DD)
     */
    std::string toString() const {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }

    bool operator!=(const Date& other) const {
        return !(*this == other);
    }

    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

} // namespace loan::domain
