// ==============================================================================
// validate.cpp - Валидаторы кандидатов
// ==============================================================================

#include "piiguard/validate.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace piiguard::validate {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_upper(char c) {
    return c >= 'A' && c <= 'Z';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// IBAN: длина BBAN после 4 символов префикса
constexpr std::size_t IBAN_MIN_BBAN = 11;
constexpr std::size_t IBAN_MAX_BBAN = 30;

// Диапазон годов для SSN last-4
constexpr int YEAR_MIN = 1900;
constexpr int YEAR_MAX = 2099;

}  // namespace

// ----------------------------------------------------------------------------
// Нормализация
// ----------------------------------------------------------------------------

std::string digits_only(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (is_digit(c)) {
            out.push_back(c);
        }
    }
    return out;
}

std::string trim(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && is_space(s[begin])) {
        ++begin;
    }
    while (end > begin && is_space(s[end - 1])) {
        --end;
    }
    return std::string(s.substr(begin, end - begin));
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

// ----------------------------------------------------------------------------
// Карты
// ----------------------------------------------------------------------------

bool luhn_check(std::string_view digits) {
    if (digits.empty()) {
        return false;
    }

    int sum = 0;
    bool should_double = false;

    // Справа налево, каждая вторая цифра удваивается
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (!is_digit(*it)) {
            return false;
        }
        int d = *it - '0';
        if (should_double) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        should_double = !should_double;
    }

    return sum % 10 == 0;
}

std::string context_window(std::string_view text, std::size_t start, std::size_t end,
                           std::size_t radius) {
    start = std::min(start, text.size());
    end = std::min(std::max(end, start), text.size());

    std::size_t from = start > radius ? start - radius : 0;
    std::size_t to = std::min(text.size(), end + radius);

    return to_lower(text.substr(from, to - from));
}

bool has_card_keyword(std::string_view window) {
    static const std::regex keyword_re(
        R"(\b(?:credit\s*card|debit\s*card|card\s*number|visa|mastercard|amex|american\s*express)\b)",
        std::regex::ECMAScript | std::regex::optimize);
    return std::regex_search(window.begin(), window.end(), keyword_re);
}

// ----------------------------------------------------------------------------
// IBAN
// ----------------------------------------------------------------------------

std::string normalize_iban(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (is_space(c)) {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

bool is_valid_iban(std::string_view iban) {
    // Форма: [A-Z]{2}\d{2}[A-Z0-9]{11,30}
    if (iban.size() < 4 + IBAN_MIN_BBAN || iban.size() > 4 + IBAN_MAX_BBAN) {
        return false;
    }
    if (!is_upper(iban[0]) || !is_upper(iban[1]) || !is_digit(iban[2]) || !is_digit(iban[3])) {
        return false;
    }
    for (std::size_t i = 4; i < iban.size(); ++i) {
        if (!is_upper(iban[i]) && !is_digit(iban[i])) {
            return false;
        }
    }

    // Первые 4 символа переносятся в конец, остаток считается посимвольно.
    // Буква A..Z даёт 10..35, каждая из двух десятичных цифр сворачивается отдельно.
    int mod = 0;
    auto fold = [&mod](int digit) { mod = (mod * 10 + digit) % 97; };

    for (std::size_t n = 0; n < iban.size(); ++n) {
        char c = iban[(n + 4) % iban.size()];
        if (is_digit(c)) {
            fold(c - '0');
        } else {
            int value = c - 'A' + 10;
            fold(value / 10);
            fold(value % 10);
        }
    }

    return mod == 1;
}

// ----------------------------------------------------------------------------
// SSN
// ----------------------------------------------------------------------------

bool is_digit_run(std::string_view s, std::size_t count) {
    return is_digit_run(s, count, count);
}

bool is_digit_run(std::string_view s, std::size_t min, std::size_t max) {
    if (s.size() < min || s.size() > max) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), is_digit);
}

bool is_excluded_year(std::string_view four_digits) {
    if (!is_digit_run(four_digits, 4)) {
        return false;
    }
    int value = 0;
    for (char c : four_digits) {
        value = value * 10 + (c - '0');
    }
    return value >= YEAR_MIN && value <= YEAR_MAX;
}

}  // namespace piiguard::validate
