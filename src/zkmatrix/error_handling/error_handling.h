#ifndef ZKMATRIX_ERROR_HANDLING_ERROR_HANDLING_H_
#define ZKMATRIX_ERROR_HANDLING_ERROR_HANDLING_H_

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace zkmatrix {

/*
  The exception raised by every runtime check of the library.
  what() holds the location, the message and a stack trace; Message() holds the location and the
  message only.
*/
class ZkmatrixException : public std::exception {
 public:
  explicit ZkmatrixException(std::string message, size_t message_len)
      : message_(std::move(message)), message_len_(message_len) {}
  const char* what() const noexcept { return message_.c_str(); }  // NOLINT

  const std::string Message() const { return message_.substr(0, message_len_); }

 private:
  std::string message_;
  size_t message_len_;
};

[[noreturn]] void ThrowZkmatrixException(
    const std::string& message, const char* file, size_t line_num) noexcept(false);

/*
  Accepts msg as char* so that the std::string is built inside ThrowZkmatrixException rather than
  at the call site.
*/
[[noreturn]] void ThrowZkmatrixException(
    const char* msg, const char* file, size_t line_num) noexcept(false);

#define THROW_ZKMATRIX_EXCEPTION(msg) ::zkmatrix::ThrowZkmatrixException(msg, __FILE__, __LINE__)

/*
  The "do {} while (false)" wrapper forces a ';' after the macro.
*/
#define ASSERT_IMPL(cond, msg)       \
  do {                               \
    if (!(cond)) {                   \
      THROW_ZKMATRIX_EXCEPTION(msg); \
    }                                \
  } while (false)

#ifndef NDEBUG
#define ASSERT_DEBUG(cond, msg) ASSERT_IMPL(cond, msg)
#else
#define ASSERT_DEBUG(cond, msg) \
  do {                          \
  } while (false)
#endif

#define ASSERT_RELEASE(cond, msg) ASSERT_IMPL(cond, msg)

}  // namespace zkmatrix

#endif  // ZKMATRIX_ERROR_HANDLING_ERROR_HANDLING_H_
