// ==============================================================================
// piiguard/match.hpp - Типы находок
// ==============================================================================
//
// Назначение:
// - SensitiveType - закрытое перечисление семейств чувствительных данных
// - Match - типизированная находка (тип + поверхностная форма)
// - Фиксированный порядок семейств для вывода и редактирования
//
// ==============================================================================

#ifndef PIIGUARD_MATCH_HPP
#define PIIGUARD_MATCH_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace piiguard {

// ----------------------------------------------------------------------------
// SensitiveType
// ----------------------------------------------------------------------------

enum class SensitiveType {
    Email,
    Phone,
    Ssn,
    Card,
    Bank,
    InsurancePolicy,
    EmployeeId,
    MedicalRecordNumber
};

/// Количество семейств
constexpr std::size_t SENSITIVE_TYPE_COUNT = 8;

/// Семейства в порядке, в котором detect() их выдаёт
constexpr std::array<SensitiveType, SENSITIVE_TYPE_COUNT> FAMILY_ORDER = {
    SensitiveType::Email,           SensitiveType::Phone,      SensitiveType::Ssn,
    SensitiveType::Card,            SensitiveType::Bank,       SensitiveType::InsurancePolicy,
    SensitiveType::EmployeeId,      SensitiveType::MedicalRecordNumber};

/// Имя типа для вывода ("email", "insurancePolicy", ...)
const char* type_name(SensitiveType type);

/// Разобрать имя типа. Принимает только имена из type_name()
std::optional<SensitiveType> parse_type(std::string_view name);

/// Индекс типа в FAMILY_ORDER
std::size_t type_index(SensitiveType type);

// ----------------------------------------------------------------------------
// Match
// ----------------------------------------------------------------------------

/// Находка: тип + точный текст для редактирования.
/// Позиции не хранятся, потребитель ищет value в документе сам.
struct Match {
    SensitiveType type = SensitiveType::Email;
    std::string value;

    bool operator==(const Match& other) const {
        return type == other.type && value == other.value;
    }
    bool operator!=(const Match& other) const { return !(*this == other); }
};

}  // namespace piiguard

#endif  // PIIGUARD_MATCH_HPP
