#pragma once
// orr/core/assert.h
//
// Invariant checks for the aggregation core (trajectory density, summary
// ordering). Input documents vary in shape and are never asserted on; those
// problems are reported through the err/log path instead.
//
//   ORR_CHECK_EQ(a, b)  always on; prints both operands on failure
//   ORR_DASSERT(cond)   debug builds only

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace orr {
namespace detail {

[[noreturn]] inline void InvariantFailed(const char* file, int line, const char* func, const std::string& what) {
  std::cerr << "[ORR][INVARIANT] " << file << ":" << line << " in " << func << "\n  " << what << "\n"
            << std::flush;
  std::abort();
}

template <class A, class B>
std::string DescribeMismatch(const char* a_expr, const char* b_expr, const char* op, const A& a, const B& b) {
  std::ostringstream oss;
  oss << "(" << a_expr << ") " << op << " (" << b_expr << ") failed: " << a << " vs " << b;
  return oss.str();
}

}  // namespace detail
}  // namespace orr

#define ORR_CHECK_EQ(a, b)                                                                        \
  do {                                                                                            \
    const auto& _orr_a = (a);                                                                     \
    const auto& _orr_b = (b);                                                                     \
    if (!(_orr_a == _orr_b)) {                                                                    \
      ::orr::detail::InvariantFailed(__FILE__, __LINE__, __func__,                                \
                                     ::orr::detail::DescribeMismatch(#a, #b, "==", _orr_a, _orr_b)); \
    }                                                                                             \
  } while (0)

#ifndef NDEBUG
  #define ORR_DASSERT(cond)                                                                       \
    do {                                                                                          \
      if (!(cond)) ::orr::detail::InvariantFailed(__FILE__, __LINE__, __func__, "expected " #cond); \
    } while (0)
#else
  #define ORR_DASSERT(cond) do { (void)sizeof(cond); } while (0)
#endif
