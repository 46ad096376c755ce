#include "search_index.hpp"
#include <cctype>

static std::vector<int> kmp_build(const std::string& pat) {
  std::vector<int> pi(pat.size(), 0);
  for (size_t i = 1, j = 0; i < pat.size(); ++i) {
    while (j > 0 && pat[i] != pat[j]) j = pi[j - 1];
    if (pat[i] == pat[j]) ++j;
    pi[i] = (int)j;
  }
  return pi;
}

static bool kmp_contains(const std::string& s, const std::string& pat, const std::vector<int>& pi) {
  if (pat.empty() || pat.size() > s.size()) return false;
  size_t j = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    while (j > 0 && s[i] != pat[j]) j = pi[j - 1];
    if (s[i] == pat[j]) ++j;
    if (j == pat.size()) return true;
  }
  return false;
}

bool contains_substring(const std::string& s, const std::string& pattern) {
  return kmp_contains(s, pattern, kmp_build(pattern));
}

std::string fold_case(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

void SearchIndex::perform(const Grid& grid, const std::string& query, bool case_sensitive) {
  results_.clear();
  current_ = 0;
  query_ = query;
  case_sensitive_ = case_sensitive;
  if (query.empty()) return;
  std::string pat = case_sensitive ? query : fold_case(query);
  auto pi = kmp_build(pat);
  for (int r = 0; r < grid.row_count(); ++r) {
    const auto& row = grid.rows()[r];
    for (int c = 0; c < static_cast<int>(row.size()); ++c) {
      bool hit = case_sensitive ? kmp_contains(row[c], pat, pi) : kmp_contains(fold_case(row[c]), pat, pi);
      if (hit) results_.push_back({r, c});
    }
  }
}

void SearchIndex::clear() {
  results_.clear();
  current_ = 0;
  query_.clear();
}

std::optional<CellPos> SearchIndex::next() {
  if (results_.empty()) return std::nullopt;
  current_ = (current_ + 1) % static_cast<int>(results_.size());
  return results_[current_];
}

std::optional<CellPos> SearchIndex::prev() {
  if (results_.empty()) return std::nullopt;
  int n = static_cast<int>(results_.size());
  current_ = (current_ + n - 1) % n;
  return results_[current_];
}

std::optional<CellPos> SearchIndex::current() const {
  if (results_.empty()) return std::nullopt;
  return results_[current_];
}
