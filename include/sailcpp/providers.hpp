#pragma once

#include "sailcpp/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sailcpp {

struct TextPassage {
  int page_from = 0;
  int page_to = 0;
  std::string section;
  std::string text;
};

struct VisualRegion {
  ContentType content_type = ContentType::kFigure;
  int page = 0;
  // Stable label of the bounding region within the page, e.g. "120,80,400,300".
  std::string region;
  std::vector<std::byte> image;
  std::optional<std::string> image_path;
  // Caption or surrounding text handed to the vision provider.
  std::string context;
};

struct SourceDocument {
  PaperRecord paper;
  std::string abstract;
  std::vector<TextPassage> passages;
  std::vector<VisualRegion> visuals;
};

// Supplies content that became available since the previous poll.
class DocumentSource {
 public:
  virtual ~DocumentSource() = default;
  virtual std::vector<SourceDocument> Poll(const std::string& session_id, const std::string& topic) = 0;
};

class VisionProvider {
 public:
  virtual ~VisionProvider() = default;
  // std::nullopt means the provider produced no description for this item.
  virtual std::optional<std::string> Describe(const std::vector<std::byte>& image, const std::string& context) = 0;
};

enum class SynthesisTask {
  kQuestions,
  kSynthesis,
};

struct QuestionContext {
  std::string question;
  RankedContext context;
};

struct SynthesisRequest {
  SynthesisTask task = SynthesisTask::kQuestions;
  std::string session_id;
  std::string topic;
  int round = 0;
  std::vector<std::string> asked_questions;
  std::vector<Finding> prior_findings;
  std::vector<Idea> prior_ideas;
  std::vector<QuestionContext> contexts;
};

struct SynthesisReply {
  std::vector<std::string> questions;
  std::vector<Finding> findings;
  std::vector<Idea> ideas;
  std::vector<ReadingListEntry> reading_list;
};

class SynthesisProvider {
 public:
  virtual ~SynthesisProvider() = default;
  virtual SynthesisReply Ask(const SynthesisRequest& request) = 0;
};

}  // namespace sailcpp
