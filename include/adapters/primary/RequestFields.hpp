#pragma once

#include <IRequest.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cctype>
#include <algorithm>

namespace loan::adapters::primary {

/**
 * @brief Сырые поля запроса из тела POST
 *
 * - application/json: тело должно быть JSON объектом
 * - application/x-www-form-urlencoded: поля формы как строки
 * - пустое тело или другой Content-Type: пустой объект (все значения по умолчанию)
 */
class RequestFields {
public:
    /**
     * @return std::nullopt если JSON запрос не содержит JSON объект
     */
    static std::optional<nlohmann::json> fromRequest(IRequest& req) {
        const std::string body = req.getBody();
        const std::string contentType = mediaType(req);

        if (contentType == "application/x-www-form-urlencoded") {
            return parseForm(body);
        }

        if (!isJson(contentType) || isBlank(body)) {
            return nlohmann::json::object();
        }

        auto fields = nlohmann::json::parse(body, nullptr, false);
        if (fields.is_discarded() || !fields.is_object()) {
            return std::nullopt;
        }
        return fields;
    }

    /**
     * @brief Разобрать "a=1&b=two+words" в JSON объект строк
     *
     * При повторе ключа остаётся первое значение.
     */
    static nlohmann::json parseForm(const std::string& body) {
        nlohmann::json fields = nlohmann::json::object();

        size_t pos = 0;
        while (pos <= body.size()) {
            size_t amp = body.find('&', pos);
            if (amp == std::string::npos) amp = body.size();

            std::string pair = body.substr(pos, amp - pos);
            if (!pair.empty()) {
                size_t eq = pair.find('=');
                std::string key = urlDecode(pair.substr(0, eq));
                std::string value = (eq == std::string::npos) ? "" : urlDecode(pair.substr(eq + 1));
                if (!fields.contains(key)) {
                    fields[key] = value;
                }
            }
            pos = amp + 1;
        }
        return fields;
    }

    static std::string urlDecode(const std::string& str) {
        std::string result;
        result.reserve(str.size());

        for (size_t i = 0; i < str.size(); ++i) {
            char c = str[i];
            if (c == '+') {
                result += ' ';
            } else if (c == '%' && i + 2 < str.size()
                       && std::isxdigit(static_cast<unsigned char>(str[i + 1]))
                       && std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
                result += static_cast<char>(std::stoi(str.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                result += c;
            }
        }
        return result;
    }

private:
    /**
     * @brief Content-Type без параметров, в нижнем регистре
     */
    static std::string mediaType(IRequest& req) {
        auto header = req.getHeader("Content-Type");
        if (!header) {
            return "";
        }

        std::string type = header->substr(0, header->find(';'));
        type.erase(std::remove_if(type.begin(), type.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   type.end());
        std::transform(type.begin(), type.end(), type.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return type;
    }

    // application/json и application/*+json
    static bool isJson(const std::string& type) {
        if (type == "application/json") return true;
        const std::string suffix = "+json";
        return type.rfind("application/", 0) == 0
            && type.size() > suffix.size()
            && type.compare(type.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static bool isBlank(const std::string& str) {
        for (char c : str) {
            if (!std::isspace(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }
};

} // namespace loan::adapters::primary
