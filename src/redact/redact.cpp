// ==============================================================================
// redact.cpp - Редактирование текста по находкам
// ==============================================================================

#include "piiguard/redact.hpp"

#include "piiguard/detector.hpp"

#include <cctype>

namespace piiguard::redact {

namespace {

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool equals_icase_at(std::string_view text, std::size_t pos, std::string_view needle) {
    if (pos + needle.size() > text.size()) {
        return false;
    }
    for (std::size_t i = 0; i < needle.size(); ++i) {
        if (lower(text[pos + i]) != lower(needle[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// Markers
// ----------------------------------------------------------------------------

Markers Markers::defaults() {
    Markers m;
    m.set(SensitiveType::Email, "[REDACTED EMAIL]");
    m.set(SensitiveType::Phone, "[REDACTED PHONE]");
    m.set(SensitiveType::Ssn, "[REDACTED SSN]");
    m.set(SensitiveType::Card, "[REDACTED CARD]");
    m.set(SensitiveType::Bank, "[REDACTED BANK]");
    m.set(SensitiveType::InsurancePolicy, "INS-[REDACTED]");
    m.set(SensitiveType::EmployeeId, "EMP-[REDACTED]");
    m.set(SensitiveType::MedicalRecordNumber, "MRN-[REDACTED]");
    return m;
}

const std::string& Markers::of(SensitiveType type) const {
    return markers_[type_index(type)];
}

void Markers::set(SensitiveType type, std::string marker) {
    markers_[type_index(type)] = std::move(marker);
}

// ----------------------------------------------------------------------------
// Summary
// ----------------------------------------------------------------------------

std::string Summary::found_line() const {
    auto n = [this](SensitiveType t) { return std::to_string(found[type_index(t)]); };
    return "Found: " + n(SensitiveType::Email) + " emails, " + n(SensitiveType::Phone) +
           " phones, " + n(SensitiveType::Ssn) + " SSNs, " + n(SensitiveType::Card) +
           " cards, " + n(SensitiveType::Bank) + " bank identifiers, " +
           n(SensitiveType::InsurancePolicy) + " insurance policies, " +
           n(SensitiveType::EmployeeId) + " employee IDs, " +
           n(SensitiveType::MedicalRecordNumber) + " MRNs.";
}

std::string format_value_line(const ValueRedaction& r) {
    return "Redacted " + std::to_string(r.occurrences) + " occurrence(s) of: " + r.value;
}

// ----------------------------------------------------------------------------
// Операции
// ----------------------------------------------------------------------------

bool add_confidential_header(std::string& text, std::string_view banner) {
    if (banner.empty()) {
        return false;
    }

    std::size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first])) != 0) {
        ++first;
    }
    if (equals_icase_at(text, first, banner)) {
        return false;
    }

    text.insert(0, std::string(banner) + "\n");
    return true;
}

std::size_t replace_all_icase(std::string& text, std::string_view needle,
                              std::string_view replacement) {
    if (needle.empty() || needle.size() > text.size()) {
        return 0;
    }

    std::string out;
    std::size_t count = 0;
    std::size_t copied = 0;
    std::size_t pos = 0;

    // Все вхождения ищутся в исходном тексте, потом заменяются разом
    while (pos + needle.size() <= text.size()) {
        if (equals_icase_at(text, pos, needle)) {
            out.append(text, copied, pos - copied);
            out.append(replacement);
            pos += needle.size();
            copied = pos;
            ++count;
        } else {
            ++pos;
        }
    }

    if (count > 0) {
        out.append(text, copied, std::string::npos);
        text = std::move(out);
    }
    return count;
}

Summary apply(std::string& text, const std::vector<Match>& matches, const Markers& markers) {
    Summary summary;
    summary.found = detect::count_by_type(matches);

    for (SensitiveType type : FAMILY_ORDER) {
        const std::string& marker = markers.of(type);
        for (const auto& m : matches) {
            if (m.type != type) {
                continue;
            }
            std::size_t n = replace_all_icase(text, m.value, marker);
            if (n == 0) {
                continue;
            }
            summary.redactions_total += n;
            summary.values.push_back(ValueRedaction{type, m.value, n});
        }
    }
    return summary;
}

Result redact_text(std::string_view text, const Options& options) {
    Result result;
    result.text = std::string(text);

    bool header_updated = false;
    if (options.add_header) {
        header_updated = add_confidential_header(result.text, options.banner);
    }

    auto matches = detect::detect(result.text);
    result.summary = apply(result.text, matches, options.markers);
    result.summary.header_updated = header_updated;
    return result;
}

}  // namespace piiguard::redact
