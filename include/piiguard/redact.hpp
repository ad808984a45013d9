// ==============================================================================
// piiguard/redact.hpp - Редактирование текста по находкам
// ==============================================================================
//
// Назначение:
// - Баннер "CONFIDENTIAL DOCUMENT" в начале текста
// - Замена каждого вхождения найденного значения маркером его типа
// - Сводка: найдено по типам, заменено всего, журнал по значениям
//
// Потребитель движка: получает готовый список Match и меняет текст
// группами в фиксированном порядке типов.
//
// ==============================================================================

#ifndef PIIGUARD_REDACT_HPP
#define PIIGUARD_REDACT_HPP

#include <piiguard/match.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard::redact {

/// Баннер по умолчанию
constexpr const char* DEFAULT_BANNER = "CONFIDENTIAL DOCUMENT";

// ----------------------------------------------------------------------------
// Markers
// ----------------------------------------------------------------------------

/// Маркер замены для каждого типа
class Markers {
public:
    /// [REDACTED EMAIL], ..., INS-[REDACTED], EMP-[REDACTED], MRN-[REDACTED]
    static Markers defaults();

    const std::string& of(SensitiveType type) const;
    void set(SensitiveType type, std::string marker);

private:
    std::array<std::string, SENSITIVE_TYPE_COUNT> markers_;
};

// ----------------------------------------------------------------------------
// Options / Summary
// ----------------------------------------------------------------------------

struct Options {
    Markers markers = Markers::defaults();
    std::string banner = DEFAULT_BANNER;
    bool add_header = true;  // --no-header выключает
};

/// Результат замены одного значения
struct ValueRedaction {
    SensitiveType type = SensitiveType::Email;
    std::string value;
    std::size_t occurrences = 0;
};

struct Summary {
    bool header_updated = false;
    std::array<std::size_t, SENSITIVE_TYPE_COUNT> found{};
    std::size_t redactions_total = 0;
    std::vector<ValueRedaction> values;  // только значения с occurrences > 0

    /// "Found: 1 emails, 2 phones, ..."
    std::string found_line() const;
};

struct Result {
    std::string text;
    Summary summary;
};

// ----------------------------------------------------------------------------
// Операции
// ----------------------------------------------------------------------------

/// Добавить баннер + "\n" в начало, если текст (без ведущих пробелов)
/// ещё не начинается с него (без учёта регистра).
/// @return true если текст изменён
bool add_confidential_header(std::string& text, std::string_view banner);

/// Найти все непересекающиеся вхождения needle без учёта регистра (ASCII)
/// и заменить на replacement. @return число замен
std::size_t replace_all_icase(std::string& text, std::string_view needle,
                              std::string_view replacement);

/// Заменить значения из matches маркерами. Группы идут в порядке FAMILY_ORDER,
/// внутри группы - в порядке matches. Поиск идёт по уже изменённому тексту.
Summary apply(std::string& text, const std::vector<Match>& matches, const Markers& markers);

/// Полный цикл: баннер, detect(), замена
Result redact_text(std::string_view text, const Options& options = {});

/// "Redacted N occurrence(s) of: value"
std::string format_value_line(const ValueRedaction& r);

}  // namespace piiguard::redact

#endif  // PIIGUARD_REDACT_HPP
