#pragma once
// orr/core/types.h
//
// Core, dependency-light types shared across the project:
//  - fixed-width integer aliases
//  - experiment selectors (race type, difficulty) with parse/print helpers
//  - a lightweight Span for passing record batches without copies

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <vector>

namespace orr {

// --------------------------
// Fixed-width integer aliases
// --------------------------
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;

// --------------------------
// Experiment selectors
// --------------------------
enum class RaceType : u8 {
  HideTheLabel = 0,  // scored by steps-to-target
  OpenRace = 1,      // scored by best-value-so-far trajectory
  Unknown = 255,
};

enum class Difficulty : u8 {
  Regular = 0,
  Hard = 1,
  Unknown = 255,
};

inline constexpr std::string_view ToString(RaceType r) noexcept {
  switch (r) {
    case RaceType::HideTheLabel: return "Hide_The_Label";
    case RaceType::OpenRace: return "Open_Race";
    case RaceType::Unknown: return "unknown";
  }
  return "unknown";
}

inline constexpr std::string_view ToString(Difficulty d) noexcept {
  switch (d) {
    case Difficulty::Regular: return "Regular";
    case Difficulty::Hard: return "Hard";
    case Difficulty::Unknown: return "unknown";
  }
  return "unknown";
}

namespace detail {
inline constexpr char LowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (usize i = 0; i < a.size(); ++i) {
    if (LowerAscii(a[i]) != LowerAscii(b[i])) return false;
  }
  return true;
}
}  // namespace detail

inline bool ParseRaceType(std::string_view s, RaceType* out) noexcept {
  if (!out) return false;

  // Accept a few aliases to make the CLI friendlier.
  if (detail::EqualsIgnoreCase(s, "Hide_The_Label") || detail::EqualsIgnoreCase(s, "hide_label") ||
      detail::EqualsIgnoreCase(s, "htl")) {
    *out = RaceType::HideTheLabel;
    return true;
  }
  if (detail::EqualsIgnoreCase(s, "Open_Race") || detail::EqualsIgnoreCase(s, "open") ||
      detail::EqualsIgnoreCase(s, "or")) {
    *out = RaceType::OpenRace;
    return true;
  }
  *out = RaceType::Unknown;
  return false;
}

inline bool ParseDifficulty(std::string_view s, Difficulty* out) noexcept {
  if (!out) return false;
  if (detail::EqualsIgnoreCase(s, "Regular") || detail::EqualsIgnoreCase(s, "easy")) {
    *out = Difficulty::Regular;
    return true;
  }
  if (detail::EqualsIgnoreCase(s, "Hard")) {
    *out = Difficulty::Hard;
    return true;
  }
  *out = Difficulty::Unknown;
  return false;
}

inline std::ostream& operator<<(std::ostream& os, RaceType r) {
  os << ToString(r);
  return os;
}
inline std::ostream& operator<<(std::ostream& os, Difficulty d) {
  os << ToString(d);
  return os;
}

// --------------------------
// Lightweight Span (C++17) to avoid copying vectors.
// Use orr::Span<T> similarly to std::span<T> (C++20).
// --------------------------
template <class T>
class Span {
 public:
  using element_type = T;
  using value_type = std::remove_cv_t<T>;
  using pointer = T*;
  using reference = T&;
  using iterator = pointer;
  using const_iterator = const T*;

  constexpr Span() noexcept : data_(nullptr), size_(0) {}
  constexpr Span(pointer ptr, usize n) noexcept : data_(ptr), size_(n) {}

  template <class Alloc>
  /*implicit*/ Span(std::vector<value_type, Alloc>& v) noexcept : data_(v.data()), size_(v.size()) {}

  template <class Alloc>
  /*implicit*/ Span(const std::vector<value_type, Alloc>& v) noexcept : data_(v.data()), size_(v.size()) {}

  template <usize N>
  /*implicit*/ Span(const std::array<value_type, N>& a) noexcept : data_(a.data()), size_(N) {}

  constexpr pointer data() const noexcept { return data_; }
  constexpr usize size() const noexcept { return size_; }
  constexpr bool empty() const noexcept { return size_ == 0; }

  constexpr reference operator[](usize i) const noexcept { return data_[i]; }
  constexpr iterator begin() const noexcept { return data_; }
  constexpr iterator end() const noexcept { return data_ + size_; }

 private:
  pointer data_;
  usize size_;
};

}  // namespace orr
