// ==============================================================================
// test_validate_gtest.cpp - Тесты валидаторов (GoogleTest)
// ==============================================================================
//
// Luhn, IBAN mod-97, исключение годов SSN, контекстное окно карт,
// нормализация строк.
//
// ==============================================================================

#include "piiguard/validate.hpp"

#include <gtest/gtest.h>
#include <string>

namespace piiguard::validate::test {

// ==============================================================================
// Luhn
// ==============================================================================

TEST(ValidateTest, Luhn_ValidNumbers) {
    EXPECT_TRUE(luhn_check("4532015112830366"));
    EXPECT_TRUE(luhn_check("4111111111111111"));
    EXPECT_TRUE(luhn_check("1111222233334444"));
}

TEST(ValidateTest, Luhn_InvalidNumbers) {
    EXPECT_FALSE(luhn_check("4532015112830367"));
    EXPECT_FALSE(luhn_check("1111222233334445"));
}

TEST(ValidateTest, Luhn_EmptyOrNonDigit_False) {
    EXPECT_FALSE(luhn_check(""));
    EXPECT_FALSE(luhn_check("4532 0151 1283 0366"));
    EXPECT_FALSE(luhn_check("45320151128303a6"));
}

TEST(ValidateTest, Luhn_SingleZero_True) {
    // Сумма 0 делится на 10
    EXPECT_TRUE(luhn_check("0"));
}

// ==============================================================================
// IBAN
// ==============================================================================

TEST(ValidateTest, NormalizeIban_StripsSpacesAndUppercases) {
    EXPECT_EQ(normalize_iban("gb82 west 1234 5698 7654 32"), "GB82WEST12345698765432");
    EXPECT_EQ(normalize_iban(" DE89\t3704 0044 0532 0130 00 "), "DE89370400440532013000");
}

TEST(ValidateTest, Iban_ValidChecksums) {
    EXPECT_TRUE(is_valid_iban("GB82WEST12345698765432"));
    EXPECT_TRUE(is_valid_iban("DE89370400440532013000"));
    EXPECT_TRUE(is_valid_iban("FR1420041010050500013M02606"));
}

TEST(ValidateTest, Iban_AnySingleDigitChange_False) {
    const std::string valid = "GB82WEST12345698765432";
    for (std::size_t i = 0; i < valid.size(); ++i) {
        if (valid[i] < '0' || valid[i] > '9') {
            continue;
        }
        for (char d = '0'; d <= '9'; ++d) {
            if (d == valid[i]) {
                continue;
            }
            std::string mutated = valid;
            mutated[i] = d;
            EXPECT_FALSE(is_valid_iban(mutated)) << mutated;
        }
    }
}

TEST(ValidateTest, Iban_WrongShape_False) {
    // Не нормализован
    EXPECT_FALSE(is_valid_iban("gb82WEST12345698765432"));
    EXPECT_FALSE(is_valid_iban("GB82 WEST 1234 5698 7654 32"));
    // Короткий BBAN
    EXPECT_FALSE(is_valid_iban("GB82WEST1234"));
    // Цифры вместо страны
    EXPECT_FALSE(is_valid_iban("1282WEST12345698765432"));
    EXPECT_FALSE(is_valid_iban(""));
}

TEST(ValidateTest, Iban_TooLong_False) {
    std::string iban = "GB82" + std::string(31, '1');
    EXPECT_FALSE(is_valid_iban(iban));
}

// ==============================================================================
// SSN
// ==============================================================================

TEST(ValidateTest, ExcludedYear_Range) {
    EXPECT_TRUE(is_excluded_year("1900"));
    EXPECT_TRUE(is_excluded_year("1999"));
    EXPECT_TRUE(is_excluded_year("2024"));
    EXPECT_TRUE(is_excluded_year("2099"));
    EXPECT_FALSE(is_excluded_year("1899"));
    EXPECT_FALSE(is_excluded_year("2100"));
    EXPECT_FALSE(is_excluded_year("8234"));
    EXPECT_FALSE(is_excluded_year("0042"));
}

TEST(ValidateTest, ExcludedYear_NotFourDigits_False) {
    EXPECT_FALSE(is_excluded_year("199"));
    EXPECT_FALSE(is_excluded_year("19999"));
    EXPECT_FALSE(is_excluded_year("20a4"));
}

TEST(ValidateTest, DigitRun) {
    EXPECT_TRUE(is_digit_run("021000021", 9));
    EXPECT_FALSE(is_digit_run("02100002", 9));
    EXPECT_TRUE(is_digit_run("123456", 6, 17));
    EXPECT_FALSE(is_digit_run("12345", 6, 17));
    EXPECT_FALSE(is_digit_run("12345a", 6, 17));
}

// ==============================================================================
// Контекст карт
// ==============================================================================

TEST(ValidateTest, ContextWindow_ClippedAndLowercased) {
    std::string text = "Credit Card Number: 1111222233334445 thanks";
    std::size_t start = text.find("1111");
    std::string window = context_window(text, start, start + 16, 50);
    EXPECT_EQ(window, "credit card number: 1111222233334445 thanks");
}

TEST(ValidateTest, ContextWindow_Radius) {
    std::string text = "abcdefghij0123456789klmnopqrst";
    std::string window = context_window(text, 10, 20, 3);
    EXPECT_EQ(window, "hij0123456789klm");
}

TEST(ValidateTest, CardKeyword_Matches) {
    EXPECT_TRUE(has_card_keyword("my credit card: 1111"));
    EXPECT_TRUE(has_card_keyword("debitcard 1111"));
    EXPECT_TRUE(has_card_keyword("card number 1111"));
    EXPECT_TRUE(has_card_keyword("paid by visa"));
    EXPECT_TRUE(has_card_keyword("mastercard"));
    EXPECT_TRUE(has_card_keyword("amex 3782"));
    EXPECT_TRUE(has_card_keyword("american  express"));
}

TEST(ValidateTest, CardKeyword_WordBoundary) {
    EXPECT_FALSE(has_card_keyword("reference 1111 on file"));
    EXPECT_FALSE(has_card_keyword("visas were issued"));
    EXPECT_FALSE(has_card_keyword("card 1111"));
}

// ==============================================================================
// Нормализация
// ==============================================================================

TEST(ValidateTest, DigitsOnly) {
    EXPECT_EQ(digits_only("4532 0151-1283 0366"), "4532015112830366");
    EXPECT_EQ(digits_only("abc"), "");
}

TEST(ValidateTest, Trim) {
    EXPECT_EQ(trim("  x y \n"), "x y");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(ValidateTest, ToLower) {
    EXPECT_EQ(to_lower("JANE.Roe@Example.COM"), "jane.roe@example.com");
}

}  // namespace piiguard::validate::test
