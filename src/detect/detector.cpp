// ==============================================================================
// detector.cpp - Детектор чувствительных данных
// ==============================================================================

#include "piiguard/detector.hpp"

#include "piiguard/validate.hpp"

namespace piiguard::detect {

namespace {

/// Кандидаты из первой группы захвата, прошедшие проверку длины.
/// Ключ - prefix + цифры, значение - группа как в тексте.
void collect_keyword_digits(std::string_view text, scan::Pattern p, const char* key_prefix,
                            std::size_t min_digits, std::size_t max_digits,
                            UniqueCollector& out) {
    for (const auto& m : scan::find_all(text, p)) {
        std::string raw = validate::trim(m.group);
        std::string digits = validate::digits_only(raw);

        // Повторная проверка формы: поисковый шаблон мог захватить лишнее
        if (!validate::is_digit_run(digits, min_digits, max_digits)) {
            continue;
        }
        if (p != scan::Pattern::SortCode && digits != raw) {
            continue;
        }

        out.add(std::string(key_prefix) + digits, std::move(raw));
    }
}

void append(std::vector<Match>& out, SensitiveType type, std::vector<std::string> values) {
    for (auto& v : values) {
        out.push_back(Match{type, std::move(v)});
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// UniqueCollector
// ----------------------------------------------------------------------------

bool UniqueCollector::add(std::string key, std::string value) {
    if (value.empty()) {
        return false;
    }
    if (!keys_.insert(std::move(key)).second) {
        return false;
    }
    values_.push_back(std::move(value));
    return true;
}

// ----------------------------------------------------------------------------
// Простые семейства
// ----------------------------------------------------------------------------

std::vector<std::string> find_unique(std::string_view text, scan::Pattern p) {
    return unique_by_text(scan::find_all(text, p));
}

std::vector<std::string> unique_by_text(const std::vector<scan::ScanMatch>& matches) {
    UniqueCollector unique;
    for (const auto& m : matches) {
        std::string raw = validate::trim(m.text);
        if (raw.empty()) {
            continue;
        }
        std::string key = validate::to_lower(raw);
        unique.add(std::move(key), std::move(raw));
    }
    return unique.take();
}

std::vector<std::string> find_emails(std::string_view text) {
    return unique_by_text(scan::find_all_emails(text));
}

std::vector<std::string> find_phones(std::string_view text) {
    return find_unique(text, scan::Pattern::Phone);
}

std::vector<std::string> find_ssns(std::string_view text) {
    return find_unique(text, scan::Pattern::Ssn);
}

std::vector<std::string> find_insurance_policies(std::string_view text) {
    return find_unique(text, scan::Pattern::InsurancePolicy);
}

std::vector<std::string> find_employee_ids(std::string_view text) {
    return unique_by_text(scan::find_all_employee_ids(text));
}

std::vector<std::string> find_medical_record_numbers(std::string_view text) {
    return find_unique(text, scan::Pattern::MedicalRecordNumber);
}

// ----------------------------------------------------------------------------
// SSN last-4
// ----------------------------------------------------------------------------

std::vector<std::string> find_ssn_last4(std::string_view text) {
    UniqueCollector unique;
    for (const auto& m : scan::find_all(text, scan::Pattern::SsnLast4)) {
        std::string last4 = validate::trim(m.group);
        if (!validate::is_digit_run(last4, 4)) {
            continue;
        }
        // Год рядом с "SSN" - скорее дата, чем фрагмент номера
        if (validate::is_excluded_year(last4)) {
            continue;
        }
        std::string key = last4;
        unique.add(std::move(key), std::move(last4));
    }
    return unique.take();
}

// ----------------------------------------------------------------------------
// Карты
// ----------------------------------------------------------------------------

std::vector<std::string> find_cards(std::string_view text) {
    UniqueCollector unique;
    for (const auto& m : scan::find_all(text, scan::Pattern::CardCandidate)) {
        std::string raw = validate::trim(m.text);
        std::string digits = validate::digits_only(raw);
        if (digits.size() < validate::CARD_MIN_DIGITS ||
            digits.size() > validate::CARD_MAX_DIGITS) {
            continue;
        }

        // Тестовые номера без валидного Luhn принимаются, если рядом есть
        // явная подпись ("credit card number: ...")
        if (!validate::luhn_check(digits)) {
            std::string window = validate::context_window(text, m.start, m.start + raw.size(),
                                                          validate::CARD_CONTEXT_RADIUS);
            if (!validate::has_card_keyword(window)) {
                continue;
            }
        }

        unique.add(std::move(digits), std::move(raw));
    }
    return unique.take();
}

// ----------------------------------------------------------------------------
// Банковские реквизиты
// ----------------------------------------------------------------------------

std::vector<std::string> find_bank_identifiers(std::string_view text) {
    UniqueCollector unique;

    // IBAN (mod 97)
    for (const auto& m : scan::find_all(text, scan::Pattern::IbanCandidate)) {
        std::string raw = validate::trim(m.text);
        std::string normalized = validate::normalize_iban(raw);
        if (!validate::is_valid_iban(normalized)) {
            continue;
        }
        unique.add(std::move(normalized), std::move(raw));
    }

    // Routing number (US), ровно 9 цифр
    collect_keyword_digits(text, scan::Pattern::Routing, "routing:", 9, 9, unique);

    // Account number, 6..17 цифр
    collect_keyword_digits(text, scan::Pattern::Account, "account:", 6, 17, unique);

    // Sort code (UK): 3 группы по 2 цифры, в тексте могут быть разделители
    collect_keyword_digits(text, scan::Pattern::SortCode, "sort:", 6, 6, unique);

    return unique.take();
}

// ----------------------------------------------------------------------------
// detect
// ----------------------------------------------------------------------------

std::vector<Match> detect(std::string_view text) {
    std::vector<Match> out;
    if (text.empty()) {
        return out;
    }

    append(out, SensitiveType::Email, find_emails(text));
    append(out, SensitiveType::Phone, find_phones(text));
    append(out, SensitiveType::Ssn, find_ssns(text));
    append(out, SensitiveType::Ssn, find_ssn_last4(text));
    append(out, SensitiveType::Card, find_cards(text));
    append(out, SensitiveType::Bank, find_bank_identifiers(text));
    append(out, SensitiveType::InsurancePolicy, find_insurance_policies(text));
    append(out, SensitiveType::EmployeeId, find_employee_ids(text));
    append(out, SensitiveType::MedicalRecordNumber, find_medical_record_numbers(text));

    return out;
}

std::array<std::size_t, SENSITIVE_TYPE_COUNT> count_by_type(const std::vector<Match>& matches) {
    std::array<std::size_t, SENSITIVE_TYPE_COUNT> counts{};
    for (const auto& m : matches) {
        ++counts[type_index(m.type)];
    }
    return counts;
}

std::vector<Match> filter_by_type(const std::vector<Match>& matches, SensitiveType type) {
    std::vector<Match> out;
    for (const auto& m : matches) {
        if (m.type == type) {
            out.push_back(m);
        }
    }
    return out;
}

}  // namespace piiguard::detect
