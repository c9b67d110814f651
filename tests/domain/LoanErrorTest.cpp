#include <gtest/gtest.h>

#include "domain/LoanError.hpp"

using namespace loan::domain;

TEST(LoanErrorTest, InvalidNumber_NamesField) {
    auto error = LoanError::invalidNumber("principal");

    EXPECT_EQ(error.code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(error.field, "principal");
    EXPECT_EQ(error.message, "Invalid numeric input for principal");
}

TEST(LoanErrorTest, InvalidTerm_HasNoField) {
    auto error = LoanError::invalidTerm();

    EXPECT_EQ(error.code, ErrorCode::INVALID_TERM);
    EXPECT_TRUE(error.field.empty());
    EXPECT_EQ(error.message, "Term must be positive");
}

TEST(LoanErrorTest, ErrorCodeToString) {
    EXPECT_EQ(toString(ErrorCode::INVALID_INPUT), "INVALID_INPUT");
    EXPECT_EQ(toString(ErrorCode::INVALID_DATE), "INVALID_DATE");
    EXPECT_EQ(toString(LoanError::invalidTerm().code), "INVALID_TERM");
}
