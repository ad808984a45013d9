// ==============================================================================
// match.cpp - Типы находок
// ==============================================================================

#include "piiguard/match.hpp"

namespace piiguard {

const char* type_name(SensitiveType type) {
    switch (type) {
    case SensitiveType::Email:
        return "email";
    case SensitiveType::Phone:
        return "phone";
    case SensitiveType::Ssn:
        return "ssn";
    case SensitiveType::Card:
        return "card";
    case SensitiveType::Bank:
        return "bank";
    case SensitiveType::InsurancePolicy:
        return "insurancePolicy";
    case SensitiveType::EmployeeId:
        return "employeeId";
    case SensitiveType::MedicalRecordNumber:
        return "medicalRecordNumber";
    }
    return "unknown";
}

std::optional<SensitiveType> parse_type(std::string_view name) {
    for (SensitiveType type : FAMILY_ORDER) {
        if (name == type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

std::size_t type_index(SensitiveType type) {
    for (std::size_t i = 0; i < FAMILY_ORDER.size(); ++i) {
        if (FAMILY_ORDER[i] == type) {
            return i;
        }
    }
    return 0;
}

}  // namespace piiguard
