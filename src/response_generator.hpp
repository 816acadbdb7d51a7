#pragma once
/*
 * ResponseGenerator
 *
 * Purpose: map a free-text query to an executable document (Markdown with runnable fences).
 * Design: ordered first-match over topic keywords; the fallback document covers
 *         every other input, so generate() is total and deterministic.
 * Extend: Session only sees the abstract interface; another backend can replace
 *         RuleBasedGenerator without touching it.
 */
#include <string>
#include <vector>

struct ResponseTemplate {
  std::string name;
  std::vector<std::string> keywords; // lowercase substrings, any one matches
  std::string body;                  // may contain {query} outside fences
};

class ResponseCatalog {
public:
  ResponseCatalog(std::vector<ResponseTemplate> templates, std::string fallback);
  static ResponseCatalog defaults();

  const ResponseTemplate* match(const std::string& query) const;
  const std::vector<ResponseTemplate>& templates() const { return templates_; }
  const std::string& fallback() const { return fallback_; }

private:
  std::vector<ResponseTemplate> templates_;
  std::string fallback_;
};

class ResponseGenerator {
public:
  virtual ~ResponseGenerator() = default;
  virtual std::string generate(const std::string& query) const = 0;
  virtual std::string topic(const std::string& query) const = 0;
};

class RuleBasedGenerator : public ResponseGenerator {
public:
  explicit RuleBasedGenerator(ResponseCatalog catalog);
  std::string generate(const std::string& query) const override;
  std::string topic(const std::string& query) const override;
  const ResponseCatalog& catalog() const { return catalog_; }

private:
  ResponseCatalog catalog_;
};

std::string to_lower(std::string s);
std::string sanitize_query(const std::string& query);
