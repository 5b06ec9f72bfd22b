#include "zkmatrix/error_handling/error_handling.h"

#include <sstream>
#include <string>

#define BACKWARD_HAS_DW 1  // Annotate stack traces using libdw from elfutils.
#include "backward.hpp"

namespace {

constexpr size_t kMaxStackDepth = 64;

/*
  Writes the stack trace of the calling thread to the given stream.
*/
void PrintStackTrace(std::ostream* s) {
  backward::StackTrace st;
  st.load_here(kMaxStackDepth);
  backward::Printer p;
  p.print(st, *s);
}

/*
  Cuts the trace at the first frame that belongs to this file, since those frames only show the
  machinery of raising the exception.
*/
std::string TrimErrorHandlingFrames(std::string trace) {
  const size_t pos = trace.find("src/zkmatrix/error_handling/error_handling.cc\", line ");
  if (pos == std::string::npos) {
    return trace;
  }
  const size_t line_start = trace.rfind('\n', pos);
  if (line_start == std::string::npos) {
    return trace;
  }
  trace.resize(line_start);
  return trace;
}

}  // namespace

namespace zkmatrix {

void ThrowZkmatrixException(
    const std::string& message, const char* file, size_t line_num) noexcept(false) {
  std::stringstream s;
  s << file << ":" << line_num << ": " << message << "\n";
  const size_t message_len = s.tellp();
  PrintStackTrace(&s);
  throw ZkmatrixException(TrimErrorHandlingFrames(s.str()), message_len);
}

void ThrowZkmatrixException(const char* msg, const char* file, size_t line_num) noexcept(false) {
  ThrowZkmatrixException(std::string(msg), file, line_num);
}

}  // namespace zkmatrix
