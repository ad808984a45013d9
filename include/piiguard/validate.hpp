// ==============================================================================
// piiguard/validate.hpp - Валидаторы кандидатов
// ==============================================================================
//
// Назначение:
// - Luhn для номеров карт
// - ISO 7064 mod-97 для IBAN (поразрядно, без длинной арифметики)
// - Исключение годов для последних 4 цифр SSN
// - Контекстное окно и ключевые слова для карт
// - Нормализация (цифры, trim, lowercase)
//
// Все функции тотальны: любая строка -> результат, без исключений.
//
// ==============================================================================

#ifndef PIIGUARD_VALIDATE_HPP
#define PIIGUARD_VALIDATE_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace piiguard::validate {

// ----------------------------------------------------------------------------
// Нормализация
// ----------------------------------------------------------------------------

/// Оставить только ASCII-цифры
std::string digits_only(std::string_view s);

/// Убрать пробельные символы по краям
std::string trim(std::string_view s);

/// ASCII lowercase
std::string to_lower(std::string_view s);

// ----------------------------------------------------------------------------
// Карты
// ----------------------------------------------------------------------------

/// Контрольная сумма Luhn по строке из цифр.
/// Любой нецифровой символ или пустая строка -> false.
bool luhn_check(std::string_view digits);

/// Границы длины номера карты (в цифрах)
constexpr std::size_t CARD_MIN_DIGITS = 13;
constexpr std::size_t CARD_MAX_DIGITS = 19;

/// Радиус контекстного окна вокруг кандидата карты
constexpr std::size_t CARD_CONTEXT_RADIUS = 50;

/// Вырезать окно [start - radius, end + radius) из text, обрезанное по
/// границам строки, в нижнем регистре.
std::string context_window(std::string_view text, std::size_t start, std::size_t end,
                           std::size_t radius);

/// Есть ли в (уже lowercase) окне ключевое слово карты:
/// credit card, debit card, card number, visa, mastercard, amex, american express
bool has_card_keyword(std::string_view window);

// ----------------------------------------------------------------------------
// IBAN
// ----------------------------------------------------------------------------

/// Убрать пробельные символы и привести к верхнему регистру
std::string normalize_iban(std::string_view raw);

/// Проверить нормализованный IBAN: форма [A-Z]{2}\d{2}[A-Z0-9]{11,30}
/// и остаток mod 97 == 1 после перестановки первых 4 символов в конец.
bool is_valid_iban(std::string_view iban);

// ----------------------------------------------------------------------------
// SSN
// ----------------------------------------------------------------------------

/// Значение попадает в диапазон годов 1900..2099 (включительно).
/// Такие "последние 4 цифры" отбрасываются.
bool is_excluded_year(std::string_view four_digits);

/// Строка состоит ровно из count ASCII-цифр
bool is_digit_run(std::string_view s, std::size_t count);

/// Строка состоит из min..max ASCII-цифр
bool is_digit_run(std::string_view s, std::size_t min, std::size_t max);

}  // namespace piiguard::validate

#endif  // PIIGUARD_VALIDATE_HPP
