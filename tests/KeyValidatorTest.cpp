#include <gtest/gtest.h>
#include <kvcache/validation/KeyValidator.hpp>
#include <string>
#include <vector>

/**
 * @brief Тесты для KeyValidator
 */

TEST(KeyValidatorTest, AcceptsNonEmptyKey) {
    EXPECT_NO_THROW(KeyValidator::validate("key"));
    EXPECT_NO_THROW(KeyValidator::validate(" "));
    EXPECT_NO_THROW(KeyValidator::validate("ключ/с:любыми*символами"));
}

TEST(KeyValidatorTest, RejectsEmptyKey) {
    EXPECT_THROW(KeyValidator::validate(""), InvalidKeyError);
}

TEST(KeyValidatorTest, InvalidKeyIsInvalidArgument) {
    // Вызывающий код может ловить стандартный std::invalid_argument
    EXPECT_THROW(KeyValidator::validate(""), std::invalid_argument);
}

TEST(KeyValidatorTest, ValidateAllStopsOnFirstEmptyKey) {
    std::vector<std::string> keys = {"a", "", "c"};
    EXPECT_THROW(KeyValidator::validateAll(keys), InvalidKeyError);
}

TEST(KeyValidatorTest, ValidateAllAcceptsEmptyBatch) {
    EXPECT_NO_THROW(KeyValidator::validateAll({}));
}
