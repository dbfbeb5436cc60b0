#pragma once

#include <optional>
#include <string>
#include <vector>

namespace majcpp {

struct CategorySummary {
  std::string name;
  std::string description;
};

struct ClassificationRequest {
  std::string issue_description;
  std::vector<CategorySummary> existing_categories;
};

// The classifier's answer: either the name of an existing category
// (is_new == false) or a proposed new one.
struct CategoryDecision {
  std::string name;
  std::string description;
  bool is_new = false;
};

class CategoryClassifier {
 public:
  virtual ~CategoryClassifier() = default;
  virtual CategoryDecision ClassifyIssue(const ClassificationRequest& request) = 0;
};

struct JudgeRequest {
  std::string task;
  std::string agent_output;
  std::string goal;
  std::optional<std::string> memory_context;
};

struct IssueFixPair {
  std::string issue;
  std::string fix;
};

struct Judgment {
  bool is_successful = false;
  std::string reasoning;
  // Short description of the approach taken, when the evaluator gives one.
  std::optional<std::string> attempt_summary;
  std::vector<IssueFixPair> issue_fix_pairs;
};

// Produces verdicts. Treated as a black box: no retries happen on this side.
class Evaluator : public CategoryClassifier {
 public:
  ~Evaluator() override = default;
  virtual Judgment Judge(const JudgeRequest& request) = 0;
};

}  // namespace majcpp
