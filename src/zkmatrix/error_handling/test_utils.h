#ifndef ZKMATRIX_ERROR_HANDLING_TEST_UTILS_H_
#define ZKMATRIX_ERROR_HANDLING_TEST_UTILS_H_

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "zkmatrix/error_handling/error_handling.h"

namespace zkmatrix {

/*
  Checks that the statement throws a ZkmatrixException whose message (without the stack trace)
  matches the given gmock matcher. Usage:
    EXPECT_ASSERT(m.At(5, 0), testing::HasSubstr("out of range"));
*/
#define EXPECT_ASSERT(statement, matcher)                                              \
  do {                                                                                 \
    try {                                                                              \
      statement;                                                                       \
      ADD_FAILURE() << "Expected " #statement " to throw a ZkmatrixException.";        \
    } catch (const ::zkmatrix::ZkmatrixException& e) {                                 \
      EXPECT_THAT(e.Message(), matcher);                                               \
    }                                                                                  \
  } while (false)

}  // namespace zkmatrix

#endif  // ZKMATRIX_ERROR_HANDLING_TEST_UTILS_H_
