#include "scoring.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace lingo::scoring {
namespace {

constexpr std::size_t kMaxMistakes = 3;
constexpr std::size_t kMaxSuggestions = 3;
constexpr double kWeakCriterionPercent = 70.0;

bool is_word_char(unsigned char c) {
  return std::isalnum(c) != 0 || c == '_';
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::vector<std::string> split_whitespace(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string token;
  while (iss >> token) {
    out.push_back(token);
  }
  return out;
}

std::size_t count_matches(const std::string& text, const std::regex& pattern) {
  return static_cast<std::size_t>(
      std::distance(std::sregex_iterator(text.begin(), text.end(), pattern), std::sregex_iterator()));
}

std::vector<std::string> sentences_of(const std::string& content) {
  static const std::regex terminators("[.!?]+");
  std::vector<std::string> out;
  std::sregex_token_iterator it(content.begin(), content.end(), terminators, -1);
  for (; it != std::sregex_token_iterator(); ++it) {
    const std::string piece = *it;
    if (std::any_of(piece.begin(), piece.end(), [](unsigned char c) { return std::isspace(c) == 0; })) {
      out.push_back(piece);
    }
  }
  return out;
}

int paragraphs_of(const std::string& content) {
  int count = 0;
  std::size_t start = 0;
  while (start <= content.size()) {
    const std::size_t end = content.find("\n\n", start);
    const std::string piece = content.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (std::any_of(piece.begin(), piece.end(), [](unsigned char c) { return std::isspace(c) == 0; })) {
      ++count;
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 2;
  }
  return count;
}

std::string pronunciation_feedback(double overall) {
  if (overall >= 90.0) {
    return "Excellent! Your pronunciation is accurate and your intonation is natural.";
  }
  if (overall >= 80.0) {
    return "Very good! Your pronunciation is mostly accurate, keep it up.";
  }
  if (overall >= 70.0) {
    return "Good. Pay attention to the pronunciation of individual words.";
  }
  if (overall >= 60.0) {
    return "Needs improvement. Practice the word sounds and your intonation.";
  }
  return "Keep practicing. Listen to the example first, then repeat slowly.";
}

std::string criterion_feedback(Criterion criterion, double score, double max_score) {
  struct Bands {
    const char* excellent;
    const char* good;
    const char* fair;
    const char* poor;
  };
  Bands bands{};
  switch (criterion) {
    case Criterion::Content:
      bands = {"Rich content with a clear position that answers the prompt well.",
               "Content is mostly complete and the position is fairly clear.",
               "Content is thin; add more details and examples.",
               "Content is too simple; support your points with more material."};
      break;
    case Criterion::Organization:
      bands = {"Clear structure with well arranged paragraphs.",
               "Structure is fairly clear and mostly logical.",
               "Structure needs work; divide the text into clearer paragraphs.",
               "Structure is confusing; reorganize the argument."};
      break;
    case Criterion::Grammar:
      bands = {"Accurate grammar with varied sentence patterns.",
               "Grammar is mostly correct with occasional slips.",
               "Some grammar errors; proofread carefully.",
               "Frequent grammar errors; more grammar practice is needed."};
      break;
    case Criterion::Vocabulary:
      bands = {"Precise and varied vocabulary.",
               "Vocabulary is mostly appropriate.",
               "Vocabulary is plain; try more varied words.",
               "Vocabulary is repetitive; work on expanding it."};
      break;
    case Criterion::Mechanics:
      bands = {"Punctuation and spelling are correct.",
               "Punctuation and spelling are mostly correct.",
               "A few punctuation or spelling issues.",
               "Punctuation and spelling need improvement."};
      break;
  }
  const double percent = max_score > 0.0 ? 100.0 * score / max_score : 0.0;
  if (percent >= 90.0) {
    return bands.excellent;
  }
  if (percent >= 75.0) {
    return bands.good;
  }
  if (percent >= 60.0) {
    return bands.fair;
  }
  return bands.poor;
}

std::string criterion_suggestion(Criterion criterion) {
  switch (criterion) {
    case Criterion::Content:
      return "Add concrete examples and details to support your points.";
    case Criterion::Organization:
      return "Use linking words such as however, therefore and in addition between paragraphs.";
    case Criterion::Grammar:
      return "Proofread for grammar after writing, especially verb tense consistency.";
    case Criterion::Vocabulary:
      return "Vary your vocabulary and avoid repeating the same words.";
    case Criterion::Mechanics:
      return "Check punctuation and spelling against standard English conventions.";
  }
  return "";
}

std::string overall_writing_feedback(double percent, const TextStats& stats) {
  std::string feedback;
  if (percent >= 90.0) {
    feedback = "Excellent! A high quality essay that is strong in every area.";
  } else if (percent >= 80.0) {
    feedback = "Very good! A solid essay with room to improve in a few areas.";
  } else if (percent >= 70.0) {
    feedback = "Good. The essay meets the basic requirements; practice the weaker areas.";
  } else if (percent >= 60.0) {
    feedback = "Pass. There is a foundation to build on, but several areas need work.";
  } else {
    feedback = "Needs improvement. Read model essays and practice the fundamentals.";
  }
  feedback += " " + std::to_string(stats.word_count) + " words, " +
              std::to_string(stats.sentence_count) + " sentences.";
  return feedback;
}

} // namespace

std::vector<std::string> normalize_words(const std::string& text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (unsigned char c : text) {
    if (is_word_char(c)) {
      cleaned.push_back(static_cast<char>(std::tolower(c)));
    } else if (std::isspace(c) != 0) {
      cleaned.push_back(' ');
    }
  }
  return split_whitespace(cleaned);
}

bool words_match(const std::string& expected, const std::string& spoken) {
  if (expected.empty() || spoken.empty()) {
    return false;
  }
  return expected == spoken || spoken.find(expected) != std::string::npos ||
         expected.find(spoken) != std::string::npos;
}

ScoreResult score_pronunciation(const std::string& original_text,
                                const std::string& spoken_text,
                                double confidence) {
  const auto expected = normalize_words(original_text);
  const auto spoken = normalize_words(spoken_text);
  const double certainty = detail::clip01(confidence);

  ScoreResult result;
  if (expected.empty() || spoken.empty()) {
    result.sub_scores = {{"accuracy", 0.0}, {"fluency", 0.0}, {"pronunciation", 0.0}};
    result.feedback = expected.empty() ? "Cannot evaluate: the reference text is empty."
                                       : "Cannot evaluate: no speech was recognized.";
    for (std::size_t i = 0; i < expected.size() && result.mistakes.size() < kMaxMistakes; ++i) {
      result.mistakes.push_back({expected[i], "[unrecognized]", "Practice \"" + expected[i] + "\""});
    }
    return result;
  }

  std::size_t matched = 0;
  for (std::size_t i = 0; i < expected.size(); ++i) {
    const bool present = i < spoken.size();
    if (present && words_match(expected[i], spoken[i])) {
      ++matched;
      continue;
    }
    if (result.mistakes.size() < kMaxMistakes) {
      result.mistakes.push_back(
          {expected[i], present ? spoken[i] : "[unrecognized]", "Practice \"" + expected[i] + "\""});
    }
  }

  const double accuracy = 100.0 * static_cast<double>(matched) / static_cast<double>(expected.size());
  const double overall = std::min(100.0, accuracy + certainty * 20.0);
  result.overall_score = overall;
  result.sub_scores = {{"accuracy", accuracy},
                       {"fluency", std::round(certainty * 100.0)},
                       {"pronunciation", std::round(overall * 0.9)}};
  result.feedback = pronunciation_feedback(overall);
  return result;
}

std::string to_string(Criterion criterion) {
  switch (criterion) {
    case Criterion::Content: return "content";
    case Criterion::Organization: return "organization";
    case Criterion::Grammar: return "grammar";
    case Criterion::Vocabulary: return "vocabulary";
    case Criterion::Mechanics: return "mechanics";
  }
  return "content";
}

Criterion criterion_from_string(const std::string& value) {
  for (Criterion criterion : {Criterion::Content, Criterion::Organization, Criterion::Grammar,
                              Criterion::Vocabulary, Criterion::Mechanics}) {
    if (to_string(criterion) == value) {
      return criterion;
    }
  }
  throw std::invalid_argument("Unknown rubric criterion: " + value);
}

std::vector<RubricItem> default_rubric() {
  return {{Criterion::Content, 25.0},
          {Criterion::Organization, 20.0},
          {Criterion::Grammar, 25.0},
          {Criterion::Vocabulary, 20.0},
          {Criterion::Mechanics, 10.0}};
}

TextStats text_stats(const std::string& content) {
  TextStats stats;
  stats.word_count = static_cast<int>(split_whitespace(content).size());
  stats.sentence_count = std::max(1, static_cast<int>(sentences_of(content).size()));
  stats.paragraph_count = paragraphs_of(content);
  return stats;
}

double content_score(const std::string& content, const WritingTask& task, double max_score) {
  double score = max_score * 0.8;
  if (task.word_limit && *task.word_limit > 0) {
    const double words = static_cast<double>(text_stats(content).word_count);
    const double ratio = std::min(words / static_cast<double>(*task.word_limit), 1.0);
    score = max_score * (0.5 + ratio * 0.5);
  }
  if (!task.keywords.empty()) {
    const std::string haystack = to_lower(content);
    const auto found = std::count_if(task.keywords.begin(), task.keywords.end(), [&](const std::string& keyword) {
      return haystack.find(to_lower(keyword)) != std::string::npos;
    });
    const double bonus =
        static_cast<double>(found) / static_cast<double>(task.keywords.size()) * max_score * 0.2;
    score = std::min(max_score, score + bonus);
  }
  return score;
}

double organization_score(const std::string& content, double max_score) {
  const int paragraphs = paragraphs_of(content);
  if (paragraphs >= 3) {
    return max_score * 0.9;
  }
  if (paragraphs == 2) {
    return max_score * 0.7;
  }
  return max_score * 0.5;
}

double grammar_score(const std::string& content, double max_score) {
  static const std::regex missing_apostrophe("\\b(dont|wont|cant|shouldnt)\\b", std::regex::icase);
  static const std::regex lowercase_pronoun("(^|\\s)i(\\s|$)");

  std::size_t errors = count_matches(content, missing_apostrophe);
  errors += count_matches(content, lowercase_pronoun);
  const auto sentences = sentences_of(content);
  for (const auto& sentence : sentences) {
    const auto first = std::find_if(sentence.begin(), sentence.end(),
                                    [](unsigned char c) { return std::isspace(c) == 0; });
    if (first != sentence.end() && std::islower(static_cast<unsigned char>(*first)) != 0) {
      ++errors;
    }
  }
  const double sentence_count = static_cast<double>(std::max<std::size_t>(1, sentences.size()));
  const double error_rate = static_cast<double>(errors) / sentence_count;
  return max_score * std::max(0.4, 1.0 - error_rate * 0.5);
}

double vocabulary_score(const std::string& content, double max_score) {
  const auto words = normalize_words(content);
  if (words.empty()) {
    return max_score * 0.3;
  }
  const std::set<std::string> unique(words.begin(), words.end());
  const double diversity = static_cast<double>(unique.size()) / static_cast<double>(words.size());
  return max_score * (0.3 + diversity * 0.7);
}

double mechanics_score(const std::string& content, double max_score) {
  const auto marks = std::count_if(content.begin(), content.end(), [](char c) {
    return c == '.' || c == '!' || c == '?' || c == ':' || c == ';' || c == ',';
  });
  const double ratio = static_cast<double>(marks) / static_cast<double>(text_stats(content).sentence_count);
  return max_score * std::min(1.0, ratio);
}

ScoreResult score_writing(const std::string& content, const WritingTask& task) {
  const auto rubric = task.rubric.empty() ? default_rubric() : task.rubric;
  const TextStats stats = text_stats(content);

  ScoreResult result;
  std::vector<Criterion> weak;
  for (const auto& item : rubric) {
    const double max_score = std::max(0.0, item.max_score);
    double raw = 0.0;
    switch (item.criterion) {
      case Criterion::Content: raw = content_score(content, task, max_score); break;
      case Criterion::Organization: raw = organization_score(content, max_score); break;
      case Criterion::Grammar: raw = grammar_score(content, max_score); break;
      case Criterion::Vocabulary: raw = vocabulary_score(content, max_score); break;
      case Criterion::Mechanics: raw = mechanics_score(content, max_score); break;
    }
    const double score = std::clamp(std::round(raw), 0.0, max_score);
    const double percent = max_score > 0.0 ? 100.0 * score / max_score : 0.0;

    result.criteria.push_back({to_string(item.criterion), score, max_score,
                               criterion_feedback(item.criterion, score, max_score)});
    result.sub_scores.push_back({to_string(item.criterion), percent});
    result.total_score += score;
    result.max_score += max_score;
    if (max_score > 0.0 && percent < kWeakCriterionPercent) {
      weak.push_back(item.criterion);
    }
  }

  const double percent = result.max_score > 0.0 ? 100.0 * result.total_score / result.max_score : 0.0;
  result.overall_score = detail::clip_percent(percent);
  result.feedback = overall_writing_feedback(result.overall_score, stats);

  for (Criterion criterion : weak) {
    result.suggestions.push_back(criterion_suggestion(criterion));
  }
  if (task.word_limit && *task.word_limit > 0 &&
      static_cast<double>(stats.word_count) < static_cast<double>(*task.word_limit) * 0.8) {
    result.suggestions.push_back("The text is short (" + std::to_string(stats.word_count) +
                                 " words); expand it towards the required " +
                                 std::to_string(*task.word_limit) + " words.");
  }
  if (result.suggestions.empty()) {
    result.suggestions.push_back("Keep up the good habits and read model essays to improve further.");
  }
  if (result.suggestions.size() > kMaxSuggestions) {
    result.suggestions.resize(kMaxSuggestions);
  }
  return result;
}

} // namespace lingo::scoring
