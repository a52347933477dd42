#pragma once

#include "lingo/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lingo::scoring {

//-----------------------------------------------------------------
// PRONUNCIATION
//-----------------------------------------------------------------

// Lowercases, drops everything but word characters and whitespace, and
// splits on whitespace. Empty tokens are discarded.
std::vector<std::string> normalize_words(const std::string& text);

// Positional match: equal, or one word contains the other.
bool words_match(const std::string& expected, const std::string& spoken);

// confidence is the recognizer's 0-1 certainty and is clipped into range.
// Sub-scores: "accuracy", "fluency", "pronunciation".
ScoreResult score_pronunciation(const std::string& original_text,
                                const std::string& spoken_text,
                                double confidence);

//-----------------------------------------------------------------
// WRITING
//-----------------------------------------------------------------
enum class Criterion {
  Content,
  Organization,
  Grammar,
  Vocabulary,
  Mechanics
};

std::string to_string(Criterion criterion);
Criterion criterion_from_string(const std::string& value);

struct RubricItem {
  Criterion criterion = Criterion::Content;
  double max_score = 0.0;
};

// content 25, organization 20, grammar 25, vocabulary 20, mechanics 10.
std::vector<RubricItem> default_rubric();

struct WritingTask {
  std::vector<RubricItem> rubric = default_rubric();
  std::optional<int> word_limit;
  std::vector<std::string> keywords;
};

struct TextStats {
  int word_count = 0;
  int sentence_count = 0;        // never below 1
  int paragraph_count = 0;
};

TextStats text_stats(const std::string& content);

// Per-criterion heuristics, each returning a raw score in [0, max_score].
double content_score(const std::string& content, const WritingTask& task, double max_score);
double organization_score(const std::string& content, double max_score);
double grammar_score(const std::string& content, double max_score);
double vocabulary_score(const std::string& content, double max_score);
double mechanics_score(const std::string& content, double max_score);

// Criterion scores are rounded to whole points; overall_score is the total
// as a percentage of the rubric maximum. An empty rubric falls back to
// default_rubric().
ScoreResult score_writing(const std::string& content, const WritingTask& task = WritingTask{});

} // namespace lingo::scoring
