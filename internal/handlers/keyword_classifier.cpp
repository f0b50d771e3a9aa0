#include "internal/handlers/keyword_classifier.hpp"

#include <algorithm>
#include <cctype>

#include "internal/handlers/builtin_handlers.hpp"

namespace taskpilot::handlers {

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::vector<KeywordClassifier::Rule> DefaultRules() {
  return {
      {kSmartReminders, {"remind", "alert me", "don't forget", "notify me"}},
      {kEmailTriage, {"email", "e-mail", "inbox", "reply to"}},
      {kCalendarOrchestrator, {"calendar", "meeting", "schedule", "appointment", "book a"}},
      {kFocusSupport, {"focus", "distract", "deep work", "concentrat"}},
      {kAnalyticsDashboard, {"stats", "statistics", "analytics", "completion rate", "productivity report"}},
      {kPrioritizationEngine, {"prioriti", "what should i work on", "most important", "rank my"}},
      {kTaskManager, {"task", "todo", "to-do", "to do"}},
  };
}

} // namespace

KeywordClassifier::KeywordClassifier() : KeywordClassifier(DefaultRules(), kGeneralChat) {
}

KeywordClassifier::KeywordClassifier(std::vector<Rule> rules, std::string fallback) : rules_(std::move(rules)), fallback_(std::move(fallback)) {
  for (auto& [handler, keywords] : rules_) {
    for (auto& keyword : keywords) keyword = Lower(keyword);
  }
}

std::string KeywordClassifier::Classify(const std::string& text) {
  const auto lowered = Lower(text);
  for (const auto& [handler, keywords] : rules_) {
    for (const auto& keyword : keywords) {
      if (lowered.find(keyword) != std::string::npos) return handler;
    }
  }
  return fallback_;
}

} // namespace taskpilot::handlers
