#pragma once

#include "ports/input/ILoanService.hpp"
#include "ports/input/IInterestService.hpp"
#include "ports/output/IClock.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <algorithm>

namespace loan::application {

/**
 * @brief Приведение сырых полей запроса к типизированным значениям
 *
 * Поля приходят из JSON или формы: значение может отсутствовать, быть null,
 * пустой строкой, строкой или числом. Отсутствующие и пустые значения
 * заменяются значениями по умолчанию, остальные должны разбираться,
 * иначе возвращается ошибка с именем поля. Исключения наружу не выходят.
 */
class InputNormalizer {
public:
    /**
     * @brief Поля для графика погашения
     *
     * principal, annual_rate (или rate), term_years (или time),
     * payments_per_year, start_date, include_schedule.
     */
    static ports::input::NormalizeResult normalizeLoan(
        const nlohmann::json& fields,
        const ports::output::IClock& clock)
    {
        ports::input::NormalizeResult result;

        auto principal = parseDecimal(lookup(fields, "principal"), 0.0);
        if (!principal) {
            result.error = domain::LoanError::invalidNumber("principal");
            return result;
        }

        auto annualRate = parseDecimal(lookup(fields, "annual_rate", "rate"), 0.0);
        if (!annualRate) {
            result.error = domain::LoanError::invalidNumber("annual_rate");
            return result;
        }

        auto termYears = parseDecimal(lookup(fields, "term_years", "time"), 0.0);
        if (!termYears) {
            result.error = domain::LoanError::invalidNumber("term_years");
            return result;
        }

        auto paymentsPerYear = parseInteger(lookup(fields, "payments_per_year"), 12);
        if (!paymentsPerYear) {
            result.error = domain::LoanError::invalidInteger("payments_per_year");
            return result;
        }

        auto startDate = parseDate(lookup(fields, "start_date"), clock);
        if (!startDate) {
            result.error = domain::LoanError::invalidDate();
            return result;
        }

        result.request.principal = *principal;
        result.request.annualRatePercent = *annualRate;
        result.request.termYears = *termYears;
        result.request.paymentsPerYear = *paymentsPerYear;
        result.request.startDate = *startDate;
        result.request.includeSchedule = parseFlag(lookup(fields, "include_schedule"), "true");
        result.success = true;
        return result;
    }

    /**
     * @brief Поля для простых процентов: principal, rate, time
     */
    static ports::input::SimpleInterestNormalizeResult normalizeSimpleInterest(
        const nlohmann::json& fields)
    {
        ports::input::SimpleInterestNormalizeResult result;

        auto principal = parseDecimal(lookup(fields, "principal"), 0.0);
        if (!principal) {
            result.error = domain::LoanError::invalidNumber("principal");
            return result;
        }

        auto rate = parseDecimal(lookup(fields, "rate"), 0.0);
        if (!rate) {
            result.error = domain::LoanError::invalidNumber("rate");
            return result;
        }

        auto time = parseDecimal(lookup(fields, "time"), 0.0);
        if (!time) {
            result.error = domain::LoanError::invalidNumber("time");
            return result;
        }

        result.request = domain::SimpleInterestRequest(*principal, *rate, *time);
        result.success = true;
        return result;
    }

    /**
     * @brief Найти значение поля
     *
     * Если основного ключа нет, используется alias (если задан).
     * @return nullptr если поле отсутствует
     */
    static const nlohmann::json* lookup(
        const nlohmann::json& fields,
        const std::string& key,
        const std::string& alias = "")
    {
        if (!fields.is_object()) {
            return nullptr;
        }
        auto it = fields.find(key);
        if (it != fields.end()) {
            return &(*it);
        }
        if (!alias.empty()) {
            it = fields.find(alias);
            if (it != fields.end()) {
                return &(*it);
            }
        }
        return nullptr;
    }

    /**
     * @brief Дробное число
     *
     * @return std::nullopt если значение задано, но не является конечным числом
     */
    static std::optional<double> parseDecimal(const nlohmann::json* value, double defaultValue) {
        if (value == nullptr || value->is_null()) {
            return defaultValue;
        }
        if (value->is_number()) {
            double number = value->get<double>();
            if (!std::isfinite(number)) return std::nullopt;
            return number;
        }
        if (!value->is_string()) {
            return std::nullopt;
        }

        std::string text = trim(value->get<std::string>());
        if (text.empty()) {
            return defaultValue;
        }
        // strtod понимает шестнадцатеричную запись, она не считается числом
        if (text.find_first_of("xX") != std::string::npos) {
            return std::nullopt;
        }

        const char* begin = text.c_str();
        char* end = nullptr;
        double number = std::strtod(begin, &end);
        if (end == begin || end != begin + text.size() || !std::isfinite(number)) {
            return std::nullopt;
        }
        return number;
    }

    /**
     * @brief Целое число
     *
     * Строка должна быть целым числом ("12", "+12", " 12 "), "12.5" - ошибка.
     * JSON число с дробной частью отбрасывает её (12.7 -> 12).
     */
    static std::optional<int> parseInteger(const nlohmann::json* value, int defaultValue) {
        if (value == nullptr || value->is_null()) {
            return defaultValue;
        }
        if (value->is_number_integer()) {
            if (value->is_number_unsigned()) {
                auto number = value->get<uint64_t>();
                if (number > static_cast<uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
                return static_cast<int>(number);
            }
            return toInt(value->get<int64_t>());
        }
        if (value->is_number_float()) {
            double truncated = std::trunc(value->get<double>());
            if (truncated < std::numeric_limits<int>::min() || truncated > std::numeric_limits<int>::max()) {
                return std::nullopt;
            }
            return static_cast<int>(truncated);
        }
        if (!value->is_string()) {
            return std::nullopt;
        }

        std::string text = trim(value->get<std::string>());
        if (text.empty()) {
            return defaultValue;
        }

        size_t digitsFrom = (text[0] == '+' || text[0] == '-') ? 1 : 0;
        if (digitsFrom == text.size()) {
            return std::nullopt;
        }
        for (size_t i = digitsFrom; i < text.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                return std::nullopt;
            }
        }

        errno = 0;
        long long number = std::strtoll(text.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            return std::nullopt;
        }
        return toInt(number);
    }

    /**
     * @brief Флаг: строковое значение без учёта регистра входит в {true, 1, yes}
     *
     * Отсутствующее значение заменяется на defaultValue, null - не флаг ("none").
     */
    static bool parseFlag(const nlohmann::json* value, const std::string& defaultValue) {
        std::string text;
        if (value == nullptr) {
            text = defaultValue;
        } else if (value->is_null()) {
            text = "none";
        } else if (value->is_string()) {
            text = value->get<std::string>();
        } else {
            text = value->dump();
        }

        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text == "true" || text == "1" || text == "yes";
    }

    /**
     * @brief Дата начала графика (YYYY-MM-DD)
     *
     * Пустое или отсутствующее значение - текущая дата из clock.
     * @return std::nullopt для некорректной строки или не строкового значения
     */
    static std::optional<domain::Date> parseDate(
        const nlohmann::json* value,
        const ports::output::IClock& clock)
    {
        if (value == nullptr || value->is_null()) {
            return clock.today();
        }
        if (!value->is_string()) {
            return std::nullopt;
        }

        const auto& text = value->get_ref<const std::string&>();
        if (text.empty()) {
            return clock.today();
        }
        return domain::Date::fromIsoString(text);
    }

private:
    static std::string trim(const std::string& str) {
        size_t start = 0;
        while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
            ++start;
        }
        size_t end = str.size();
        while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
            --end;
        }
        return str.substr(start, end - start);
    }

    static std::optional<int> toInt(long long number) {
        if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }
};

} // namespace loan::application
