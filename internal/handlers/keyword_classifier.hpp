#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/dispatch/handler.hpp"

namespace taskpilot::handlers {

/*
  Case-insensitive substring rules, first match wins. Queries that match
  nothing go to the fallback handler.
*/
class KeywordClassifier : public taskpilot::dispatch::IntentClassifier {
 public:
  using Rule = std::pair<std::string, std::vector<std::string>>;

  KeywordClassifier();
  KeywordClassifier(std::vector<Rule> rules, std::string fallback);

  std::string Classify(const std::string& text) override;

 private:
  std::vector<Rule> rules_;
  std::string       fallback_;
};

} // namespace taskpilot::handlers
