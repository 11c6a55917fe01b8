#include "id.hpp"

#include <random>

namespace tending::util {

namespace {

constexpr std::size_t kSuffixLength = 5;

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string GenerateId(std::string_view prefix, int64_t now_ms) {
  static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::string id;
  id.reserve(prefix.size() + 24);
  id.append(prefix);
  id.push_back('_');
  id.append(std::to_string(now_ms));
  id.push_back('_');
  for (std::size_t i = 0; i < kSuffixLength; ++i) {
    id.push_back(kAlphabet[rng() % 36]);
  }
  return id;
}

std::string Trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && IsSpace(value[begin])) ++begin;
  while (end > begin && IsSpace(value[end - 1])) --end;
  return std::string(value.substr(begin, end - begin));
}

} // namespace tending::util
