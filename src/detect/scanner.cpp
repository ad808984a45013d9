// ==============================================================================
// scanner.cpp - Лексические сканеры
// ==============================================================================

#include "piiguard/scanner.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace piiguard::scan {

namespace {

constexpr auto ICASE = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
constexpr auto PLAIN = std::regex::ECMAScript | std::regex::optimize;

// Во всех шаблонах отрезки разделителей ограничены {0,128} (MAX_SEPARATOR_RUN)

// Телефон: +код страны (опц.), (212) или 212, затем 3 и 4 цифры.
// Разделители - любая смесь пробелов, точек и дефисов.
// Слева - не цифра (LeftBoundary::NotDigit), поэтому "(" попадает в совпадение.
const std::regex& phone_re() {
    static const std::regex re(R"((?:\+?\d{1,3}[-.\s]{0,128})?(?:\(\s{0,128}\d{3}\s{0,128}\)|\d{3})[-.\s]{0,128}\d{3}[-.\s]{0,128}\d{4}(?!\d))",
                               PLAIN);
    return re;
}

// SSN: DDD-DD-DDDD
const std::regex& ssn_re() {
    static const std::regex re(R"(\b\d{3}-\d{2}-\d{4}\b)", PLAIN);
    return re;
}

// "social security number ... 8234": до 80 нецифровых символов между
const std::regex& ssn_last4_re() {
    static const std::regex re(R"(\b(?:social security number|ssn)\b[^0-9]{0,80}(\d{4})\b)",
                               ICASE);
    return re;
}

// Кандидат карты: 13..19 цифр, между ними пробелы или дефисы
const std::regex& card_re() {
    static const std::regex re(R"((?:\d[ -]{0,128}?){13,19}(?!\d))", PLAIN);
    return re;
}

// Кандидат IBAN: "GB82 WEST 1234 5698 7654 32"
const std::regex& iban_re() {
    static const std::regex re(R"([A-Za-z]{2}\d{2}(?:[ ]?[A-Za-z0-9]){11,30}(?![A-Za-z0-9]))",
                               PLAIN);
    return re;
}

const std::regex& routing_re() {
    static const std::regex re(
        R"(\brouting(?:\s{0,128}number)?\s{0,128}[:-]?\s{0,128}(\d{9})\b)", ICASE);
    return re;
}

const std::regex& account_re() {
    static const std::regex re(
        R"(\b(?:account|acct)(?:\s{0,128}(?:number|no\.?|#))?\s{0,128}[:-]?\s{0,128}(\d{6,17})\b)",
        ICASE);
    return re;
}

const std::regex& sort_code_re() {
    static const std::regex re(
        R"(\bsort\s{0,128}code\s{0,128}[:-]?\s{0,128}(\d{2}[- ]?\d{2}[- ]?\d{2})\b)", ICASE);
    return re;
}

// Префиксные идентификаторы: "INS-44556677", "MRN- 998877"
const std::regex& insurance_re() {
    static const std::regex re(R"(\bINS[-\s]{0,128}\d{6,14}\b)", ICASE);
    return re;
}

const std::regex& mrn_re() {
    static const std::regex re(R"(\bMRN[-\s]{0,128}\d{4,14}\b)", ICASE);
    return re;
}

// ----------------------------------------------------------------------------
// Классы символов (ASCII, как \w, \s и [A-Za-z0-9] в шаблонах)
// ----------------------------------------------------------------------------

bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_word_char(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c) || c == '_';
}

bool is_space_char(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

// [A-Za-z0-9._%+-]
bool is_email_local_char(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c) || c == '.' || c == '_' || c == '%' ||
           c == '+' || c == '-';
}

// [A-Za-z0-9.-]
bool is_email_domain_char(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c) || c == '.' || c == '-';
}

// \b в позиции i; символ перед i виден всегда (как match_prev_avail)
bool word_boundary_at(std::string_view text, std::size_t i) {
    bool prev = i > 0 && is_word_char(text[i - 1]);
    bool cur = i < text.size() && is_word_char(text[i]);
    return prev != cur;
}

ScanMatch make_match(std::string_view text, std::size_t start, std::size_t end) {
    ScanMatch m;
    m.start = start;
    m.end = end;
    m.text = std::string(text.substr(start, end - start));
    return m;
}

template <typename NextFn>
std::vector<ScanMatch> collect_all(std::string_view text, NextFn next) {
    std::vector<ScanMatch> out;
    std::size_t pos = 0;
    while (auto m = next(text, pos)) {
        pos = m->end > m->start ? m->end : m->end + 1;
        out.push_back(std::move(*m));
    }
    return out;
}

// ----------------------------------------------------------------------------
// Email
// ----------------------------------------------------------------------------

// Конец "[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b" от begin или npos.
// [..]+ жадный, поэтому точка перед TLD ищется от правого края отрезка.
// TLD берёт все буквы подряд: короче он упирается в букву, и \b не выполняется.
std::size_t email_domain_end(std::string_view text, std::size_t begin) {
    std::size_t run_end = begin;
    while (run_end < text.size() && is_email_domain_char(text[run_end])) {
        ++run_end;
    }
    for (std::size_t dot = run_end; dot-- > begin + 1;) {
        if (text[dot] != '.') {
            continue;
        }
        std::size_t tld_end = dot + 1;
        while (tld_end < run_end && is_ascii_alpha(text[tld_end])) {
            ++tld_end;
        }
        if (tld_end - (dot + 1) < 2) {
            continue;
        }
        if (tld_end < text.size() && is_word_char(text[tld_end])) {
            continue;
        }
        return tld_end;
    }
    return std::string_view::npos;
}

// ----------------------------------------------------------------------------
// EMP
// ----------------------------------------------------------------------------

std::size_t skip_employee_separators(std::string_view text, std::size_t pos) {
    while (pos < text.size() && (text[pos] == '-' || is_space_char(text[pos]))) {
        ++pos;
    }
    return pos;
}

// Конец "[-\s]*\d{2,4}(?:[-\s]*\d{2,6})+\b" от pos или npos.
// Группы внутри одного отрезка цифр могут идти без разделителя, поэтому
// любой отрезок из 2+ цифр разбивается на группы. Цепочка обрывается на
// отрезке из одной цифры или на символе, не являющемся цифрой. Результат -
// самый дальний конец отрезка с \b после него (жадный + с возвратом).
std::size_t employee_id_end(std::string_view text, std::size_t pos) {
    std::size_t best = std::string_view::npos;
    bool first = true;
    pos = skip_employee_separators(text, pos);
    while (pos < text.size() && is_ascii_digit(text[pos])) {
        std::size_t run_end = pos;
        while (run_end < text.size() && is_ascii_digit(text[run_end])) {
            ++run_end;
        }
        if (run_end - pos < 2) {
            break;
        }
        // Первый отрезок сам по себе должен дать две группы: 2..4 + 2..6
        bool enough_groups = !first || run_end - pos >= 4;
        bool boundary = run_end == text.size() || !is_word_char(text[run_end]);
        if (enough_groups && boundary) {
            best = run_end;
        }
        first = false;
        pos = skip_employee_separators(text, run_end);
    }
    return best;
}

bool starts_with_icase(std::string_view text, std::size_t pos, std::string_view word) {
    if (text.size() - pos < word.size()) {
        return false;
    }
    for (std::size_t i = 0; i < word.size(); ++i) {
        char c = text[pos + i];
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (c != word[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// Границы
// ----------------------------------------------------------------------------

bool left_boundary_ok(std::string_view text, std::size_t start, LeftBoundary boundary) {
    if (boundary == LeftBoundary::None || start == 0 || start > text.size()) {
        return true;
    }
    auto prev = static_cast<unsigned char>(text[start - 1]);
    switch (boundary) {
    case LeftBoundary::NotDigit:
        return std::isdigit(prev) == 0;
    case LeftBoundary::NotAlnum:
        return std::isalnum(prev) == 0;
    case LeftBoundary::None:
        break;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Шаблоны
// ----------------------------------------------------------------------------

PatternEntry pattern(Pattern p) {
    switch (p) {
    case Pattern::Phone:
        return {phone_re(), LeftBoundary::NotDigit};
    case Pattern::Ssn:
        return {ssn_re(), LeftBoundary::None};
    case Pattern::SsnLast4:
        return {ssn_last4_re(), LeftBoundary::None};
    case Pattern::CardCandidate:
        return {card_re(), LeftBoundary::NotDigit};
    case Pattern::IbanCandidate:
        return {iban_re(), LeftBoundary::NotAlnum};
    case Pattern::Routing:
        return {routing_re(), LeftBoundary::None};
    case Pattern::Account:
        return {account_re(), LeftBoundary::None};
    case Pattern::SortCode:
        return {sort_code_re(), LeftBoundary::None};
    case Pattern::InsurancePolicy:
        return {insurance_re(), LeftBoundary::None};
    case Pattern::MedicalRecordNumber:
        return {mrn_re(), LeftBoundary::None};
    }
    return {ssn_re(), LeftBoundary::None};
}

const char* pattern_name(Pattern p) {
    switch (p) {
    case Pattern::Phone:
        return "phone";
    case Pattern::Ssn:
        return "ssn";
    case Pattern::SsnLast4:
        return "ssn-last4";
    case Pattern::CardCandidate:
        return "card-candidate";
    case Pattern::IbanCandidate:
        return "iban-candidate";
    case Pattern::Routing:
        return "routing";
    case Pattern::Account:
        return "account";
    case Pattern::SortCode:
        return "sort-code";
    case Pattern::InsurancePolicy:
        return "insurance-policy";
    case Pattern::MedicalRecordNumber:
        return "mrn";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// Поиск
// ----------------------------------------------------------------------------

std::optional<ScanMatch> find_next(std::string_view text, const std::regex& re, std::size_t from,
                                   LeftBoundary boundary) {
    const char* const base = text.data();
    const char* const last = text.data() + text.size();

    while (from <= text.size()) {
        auto flags = std::regex_constants::match_default;
        if (from > 0) {
            flags |= std::regex_constants::match_prev_avail;
        }

        std::cmatch m;
        if (!std::regex_search(base + from, last, m, re, flags)) {
            return std::nullopt;
        }

        std::size_t start = from + static_cast<std::size_t>(m.position(0));
        if (!left_boundary_ok(text, start, boundary)) {
            from = start + 1;
            continue;
        }

        ScanMatch out;
        out.start = start;
        out.end = start + static_cast<std::size_t>(m.length(0));
        out.text = m.str(0);
        if (m.size() > 1 && m[1].matched) {
            out.group = m.str(1);
        }
        return out;
    }
    return std::nullopt;
}

std::vector<ScanMatch> find_all(std::string_view text, const std::regex& re,
                                LeftBoundary boundary) {
    return collect_all(text, [&re, boundary](std::string_view t, std::size_t from) {
        return find_next(t, re, from, boundary);
    });
}

std::vector<ScanMatch> find_all(std::string_view text, Pattern p) {
    PatternEntry entry = pattern(p);
    return find_all(text, entry.regex, entry.boundary);
}

// ----------------------------------------------------------------------------
// Явные сканеры
// ----------------------------------------------------------------------------

std::optional<ScanMatch> find_next_email(std::string_view text, std::size_t from) {
    std::size_t pos = from;
    while (pos < text.size()) {
        std::size_t at = text.find('@', pos);
        if (at == std::string_view::npos) {
            return std::nullopt;
        }
        pos = at + 1;

        // Локальная часть не содержит '@', поэтому начало ищется только в
        // отрезке перед этим '@'; самое левое начало с \b
        std::size_t left = at;
        while (left > from && is_email_local_char(text[left - 1])) {
            --left;
        }
        std::size_t start = at;
        for (std::size_t i = left; i < at; ++i) {
            if (word_boundary_at(text, i)) {
                start = i;
                break;
            }
        }
        if (start == at) {
            continue;
        }

        std::size_t end = email_domain_end(text, at + 1);
        if (end == std::string_view::npos) {
            continue;
        }
        return make_match(text, start, end);
    }
    return std::nullopt;
}

std::optional<ScanMatch> find_next_employee_id(std::string_view text, std::size_t from) {
    for (std::size_t start = from; start < text.size(); ++start) {
        if (!starts_with_icase(text, start, "emp") || !word_boundary_at(text, start)) {
            continue;
        }
        std::size_t end = employee_id_end(text, start + 3);
        if (end != std::string_view::npos) {
            return make_match(text, start, end);
        }
    }
    return std::nullopt;
}

std::vector<ScanMatch> find_all_emails(std::string_view text) {
    return collect_all(text, find_next_email);
}

std::vector<ScanMatch> find_all_employee_ids(std::string_view text) {
    return collect_all(text, find_next_employee_id);
}

}  // namespace piiguard::scan
