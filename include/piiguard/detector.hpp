// ==============================================================================
// piiguard/detector.hpp - Детектор чувствительных данных
// ==============================================================================
//
// Назначение:
// - UniqueCollector - дедупликация по ключу с сохранением порядка
// - Поиск по семействам (сканер + валидатор + ключ дедупликации)
// - detect() - единственная точка входа движка
//
// Порядок результата фиксирован:
//   email, phone, ssn (прямой, затем last-4), card,
//   bank (IBAN, routing, account, sort code),
//   insurancePolicy, employeeId, medicalRecordNumber
//
// Движок не хранит состояния между вызовами и не выполняет ввод-вывод.
//
// ==============================================================================

#ifndef PIIGUARD_DETECTOR_HPP
#define PIIGUARD_DETECTOR_HPP

#include <piiguard/match.hpp>
#include <piiguard/scanner.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace piiguard::detect {

// ----------------------------------------------------------------------------
// UniqueCollector
// ----------------------------------------------------------------------------

/// Упорядоченный набор значений, уникальных по ключу.
/// Сохраняется первое встреченное значение для каждого ключа.
class UniqueCollector {
public:
    /// Добавить value под ключом key. false, если ключ уже встречался.
    bool add(std::string key, std::string value);

    /// Значения в порядке первого появления
    const std::vector<std::string>& values() const { return values_; }

    std::vector<std::string> take() { return std::move(values_); }

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_set<std::string> keys_;
    std::vector<std::string> values_;
};

// ----------------------------------------------------------------------------
// Поиск по семействам
// ----------------------------------------------------------------------------

/// Простое семейство: совпадение целиком, ключ = lowercase(trim(text))
std::vector<std::string> find_unique(std::string_view text, scan::Pattern p);

/// То же для готового списка совпадений (email, EMP ищутся без regex)
std::vector<std::string> unique_by_text(const std::vector<scan::ScanMatch>& matches);

std::vector<std::string> find_emails(std::string_view text);
std::vector<std::string> find_phones(std::string_view text);

/// SSN в формате DDD-DD-DDDD
std::vector<std::string> find_ssns(std::string_view text);

/// Последние 4 цифры SSN после "social security number"/"ssn",
/// кроме значений 1900..2099
std::vector<std::string> find_ssn_last4(std::string_view text);

/// Номера карт: Luhn или ключевое слово в окне ±50 символов.
/// Ключ - только цифры, значение - первая встреченная запись.
std::vector<std::string> find_cards(std::string_view text);

/// Банковские реквизиты: IBAN (mod 97), routing, account, sort code.
/// Ключи разделены по подвидам ("routing:", "account:", "sort:").
std::vector<std::string> find_bank_identifiers(std::string_view text);

std::vector<std::string> find_insurance_policies(std::string_view text);
std::vector<std::string> find_employee_ids(std::string_view text);
std::vector<std::string> find_medical_record_numbers(std::string_view text);

// ----------------------------------------------------------------------------
// Точка входа
// ----------------------------------------------------------------------------

/// Найти все чувствительные данные в тексте.
/// Никогда не бросает исключений; отсутствие находок - пустой вектор.
std::vector<Match> detect(std::string_view text);

/// Количество находок каждого типа, индекс - type_index()
std::array<std::size_t, SENSITIVE_TYPE_COUNT> count_by_type(const std::vector<Match>& matches);

/// Находки одного типа в исходном порядке
std::vector<Match> filter_by_type(const std::vector<Match>& matches, SensitiveType type);

}  // namespace piiguard::detect

#endif  // PIIGUARD_DETECTOR_HPP
