// ==============================================================================
// piiguard/scanner.hpp - Лексические сканеры
// ==============================================================================
//
// Назначение:
// - Поиск следующего непересекающегося совпадения с явного смещения
// - Левые границы (аналог lookbehind, которого нет в std::regex)
// - Шаблоны семейств: телефон, SSN, карты, IBAN, банковские реквизиты по
//   ключевым словам, префиксные идентификаторы
// - Явные сканеры email и табельных номеров (EMP-...)
//
// Состояние сканирования передаётся явно: find_next() принимает смещение и
// возвращает совпадение с его концом. Общего курсора нет, поэтому одни и те
// же скомпилированные шаблоны можно использовать из нескольких потоков.
//
// std::regex в libstdc++ рекурсивен: глубина стека растёт с длиной одной
// попытки сопоставления. Поэтому ни один шаблон не поглощает неограниченный
// отрезок текста: разделители ограничены MAX_SEPARATOR_RUN символами, а
// семейства, значение которых само может быть сколь угодно длинным (email,
// EMP-цепочки цифр), разбираются явными сканерами без std::regex.
//
// ==============================================================================

#ifndef PIIGUARD_SCANNER_HPP
#define PIIGUARD_SCANNER_HPP

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard::scan {

/// Наибольший отрезок разделителей ([-.\s], [ -], \s) внутри одного значения
constexpr std::size_t MAX_SEPARATOR_RUN = 128;

// ----------------------------------------------------------------------------
// LeftBoundary - ограничение на символ перед совпадением
// ----------------------------------------------------------------------------

enum class LeftBoundary {
    None,         // без ограничений (\b внутри шаблона)
    NotDigit,     // (?<!\d)
    NotAlnum      // (?<![A-Z0-9]) без учёта регистра
};

/// Выполняется ли ограничение для совпадения, начинающегося в start
bool left_boundary_ok(std::string_view text, std::size_t start, LeftBoundary boundary);

// ----------------------------------------------------------------------------
// ScanMatch
// ----------------------------------------------------------------------------

/// Одно совпадение шаблона
struct ScanMatch {
    std::size_t start = 0;   // смещение начала в исходном тексте
    std::size_t end = 0;     // смещение конца (exclusive)
    std::string text;        // полный текст совпадения
    std::string group;       // первая группа захвата (пусто, если её нет)
};

// ----------------------------------------------------------------------------
// Pattern - шаблоны семейств
// ----------------------------------------------------------------------------

enum class Pattern {
    Phone,
    Ssn,
    SsnLast4,
    CardCandidate,
    IbanCandidate,
    Routing,
    Account,
    SortCode,
    InsurancePolicy,
    MedicalRecordNumber
};

/// Скомпилированный шаблон и его левая граница
struct PatternEntry {
    const std::regex& regex;
    LeftBoundary boundary;
};

/// Получить шаблон семейства. Шаблоны компилируются один раз и не меняются.
PatternEntry pattern(Pattern p);

/// Имя шаблона для диагностики
const char* pattern_name(Pattern p);

// ----------------------------------------------------------------------------
// Поиск
// ----------------------------------------------------------------------------

/// Найти первое совпадение, начинающееся не раньше from.
///
/// Кандидат, нарушающий boundary, отбрасывается, и поиск продолжается с
/// позиции start + 1 (как движок с lookbehind).
/// Символ перед from виден для \b (match_prev_avail).
std::optional<ScanMatch> find_next(std::string_view text, const std::regex& re, std::size_t from,
                                   LeftBoundary boundary = LeftBoundary::None);

/// Все непересекающиеся совпадения слева направо
std::vector<ScanMatch> find_all(std::string_view text, const std::regex& re,
                                LeftBoundary boundary = LeftBoundary::None);

/// Все совпадения шаблона семейства
std::vector<ScanMatch> find_all(std::string_view text, Pattern p);

// ----------------------------------------------------------------------------
// Явные сканеры
// ----------------------------------------------------------------------------

/// Следующий email (\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b),
/// начинающийся не раньше from. Результат совпадает с поиском по этому
/// выражению с самым левым началом и жадными квантификаторами.
/// Работает за линейное время от длины отрезков вокруг '@'.
std::optional<ScanMatch> find_next_email(std::string_view text, std::size_t from);

/// Следующий табельный номер (\bEMP[-\s]*\d{2,4}(?:[-\s]*\d{2,6})+\b,
/// без учёта регистра), начинающийся не раньше from.
/// Цепочка групп цифр разбирается за один проход.
std::optional<ScanMatch> find_next_employee_id(std::string_view text, std::size_t from);

std::vector<ScanMatch> find_all_emails(std::string_view text);
std::vector<ScanMatch> find_all_employee_ids(std::string_view text);

}  // namespace piiguard::scan

#endif  // PIIGUARD_SCANNER_HPP
