#include "sailcpp/extraction_pool.hpp"

#include "sailcpp/errors.hpp"

#include "../text/lexical.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>

namespace sailcpp {
namespace {

void AddWarningOnce(ExtractionReport& report, std::unordered_set<std::string>& seen, std::string warning) {
  if (seen.insert(warning).second) {
    spdlog::warn("extraction: {}", warning);
    report.warnings.push_back(std::move(warning));
  }
}

std::string PassageLocation(const TextPassage& passage, std::size_t index) {
  return "text:" + std::to_string(passage.page_from) + "-" + std::to_string(passage.page_to) + "#" +
         std::to_string(index);
}

}  // namespace

std::vector<ExtractionTask> PlanExtractionTasks(const SourceDocument& document, std::vector<std::string>& warnings) {
  std::vector<ExtractionTask> tasks{};
  const auto& paper_id = document.paper.id;

  for (std::size_t i = 0; i < document.passages.size(); ++i) {
    const auto& passage = document.passages[i];
    auto body = text::Trim(passage.text);
    if (body.empty()) {
      continue;
    }
    ExtractionTask task{};
    task.paper_id = paper_id;
    task.content_type = ContentType::kText;
    task.location = PassageLocation(passage, i);
    task.page_from = passage.page_from;
    task.page_to = passage.page_to;
    task.text = std::move(body);
    tasks.push_back(std::move(task));
  }

  if (tasks.empty()) {
    auto abstract = text::Trim(document.abstract);
    if (!abstract.empty()) {
      ExtractionTask task{};
      task.paper_id = paper_id;
      task.content_type = ContentType::kText;
      task.location = "summary";
      task.text = std::move(abstract);
      tasks.push_back(std::move(task));
    } else {
      warnings.push_back("no_content:" + paper_id);
    }
  }

  for (const auto& visual : document.visuals) {
    if (visual.content_type == ContentType::kText) {
      continue;
    }
    ExtractionTask task{};
    task.paper_id = paper_id;
    task.content_type = visual.content_type;
    task.location = std::to_string(visual.page) + ":" + visual.region;
    task.page_from = visual.page;
    task.page_to = visual.page;
    task.text = visual.context;
    task.image = visual.image;
    task.image_path = visual.image_path;
    tasks.push_back(std::move(task));
  }
  return tasks;
}

ExtractionPool::ExtractionPool(const ExtractionConfig& config,
                               std::shared_ptr<VisionProvider> vision,
                               std::shared_ptr<EmbeddingProvider> embedder)
    : config_(config), vision_(std::move(vision)), embedder_(std::move(embedder)) {
  if (config_.worker_count <= 0) {
    throw ConfigError("extraction pool: worker_count must be positive");
  }
  if (config_.embedding_batch_size <= 0) {
    throw ConfigError("extraction pool: embedding_batch_size must be positive");
  }
}

ExtractionOutcome ExtractionPool::Describe(std::size_t index, const ExtractionTask& task) const {
  ExtractionOutcome outcome{};
  outcome.task_index = index;
  outcome.chunk_id = MakeChunkId(task.paper_id, task.content_type, task.location);

  Chunk chunk{};
  chunk.id = outcome.chunk_id;
  chunk.paper_id = task.paper_id;
  chunk.content_type = task.content_type;
  chunk.page_from = task.page_from;
  chunk.page_to = task.page_to;
  chunk.image_path = task.image_path;

  if (task.content_type == ContentType::kText) {
    chunk.text = text::Trim(task.text);
    if (chunk.text.empty()) {
      outcome.status = ExtractionStatus::kFailed;
      outcome.reason = "empty passage";
      return outcome;
    }
  } else {
    if (!vision_) {
      outcome.status = ExtractionStatus::kFailed;
      outcome.reason = "no vision provider configured";
      return outcome;
    }
    std::optional<std::string> description;
    try {
      description = vision_->Describe(task.image, task.text);
    } catch (const std::exception& error) {
      outcome.status = ExtractionStatus::kFailed;
      outcome.reason = std::string("vision provider failed: ") + error.what();
      return outcome;
    }
    if (!description.has_value() || text::Trim(*description).empty()) {
      outcome.status = ExtractionStatus::kFailed;
      outcome.reason = "vision provider returned no description";
      return outcome;
    }
    chunk.text = text::Trim(*description);
  }

  outcome.status = ExtractionStatus::kSucceeded;
  outcome.chunk = std::move(chunk);
  return outcome;
}

void ExtractionPool::EmbedChunks(std::vector<ExtractionOutcome>& outcomes,
                                 const std::vector<ExtractionTask>& tasks,
                                 ExtractionReport& report) const {
  if (!embedder_) {
    return;
  }
  std::unordered_set<std::string> seen{};

  std::vector<std::size_t> text_indices{};
  std::vector<std::size_t> visual_indices{};
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (outcomes[i].status != ExtractionStatus::kSucceeded) {
      continue;
    }
    if (outcomes[i].chunk->content_type == ContentType::kText) {
      text_indices.push_back(i);
    } else {
      visual_indices.push_back(i);
    }
  }

  auto assign = [&](std::size_t outcome_index, std::vector<float> embedding) {
    if (embedding.empty()) {
      AddWarningOnce(report, seen, "embedding_unavailable:empty embedding");
      return;
    }
    outcomes[outcome_index].chunk->embedding = std::move(embedding);
    ++report.embedded;
  };

  auto* batch_embedder = dynamic_cast<BatchEmbeddingProvider*>(embedder_.get());
  const auto batch_size = static_cast<std::size_t>(config_.embedding_batch_size);
  for (std::size_t start = 0; start < text_indices.size(); start += batch_size) {
    const auto end = std::min(text_indices.size(), start + batch_size);
    std::vector<std::string> slice{};
    slice.reserve(end - start);
    for (std::size_t i = start; i < end; ++i) {
      slice.push_back(outcomes[text_indices[i]].chunk->text);
    }
    try {
      if (batch_embedder != nullptr) {
        auto partial = batch_embedder->EmbedTextBatch(slice);
        if (partial.size() != slice.size()) {
          throw std::runtime_error("mismatched embedding batch size");
        }
        for (std::size_t i = start; i < end; ++i) {
          assign(text_indices[i], std::move(partial[i - start]));
        }
      } else {
        for (std::size_t i = start; i < end; ++i) {
          assign(text_indices[i], embedder_->EmbedText(slice[i - start]));
        }
      }
    } catch (const std::exception& error) {
      AddWarningOnce(report, seen, std::string("embedding_unavailable:") + error.what());
    }
  }

  for (const auto index : visual_indices) {
    const auto& chunk = *outcomes[index].chunk;
    MultimodalInput input{};
    input.content_type = chunk.content_type;
    input.text = chunk.text;
    input.image = tasks[outcomes[index].task_index].image;
    try {
      assign(index, embedder_->EmbedMultimodal(input));
    } catch (const std::exception& error) {
      AddWarningOnce(report, seen, std::string("embedding_unavailable:") + error.what());
    }
  }
}

ExtractionReport ExtractionPool::Run(const std::vector<ExtractionTask>& tasks,
                                     ChunkStore& store,
                                     const CancellationToken& token) const {
  ExtractionReport report{};
  report.outcomes.resize(tasks.size());
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    auto& outcome = report.outcomes[i];
    outcome.task_index = i;
    outcome.chunk_id = MakeChunkId(tasks[i].paper_id, tasks[i].content_type, tasks[i].location);
    outcome.status = ExtractionStatus::kSkipped;
    outcome.reason = "cancelled before dispatch";
  }
  if (tasks.empty()) {
    report.cancelled = token.cancelled();
    return report;
  }

  const std::size_t worker_count = std::min(tasks.size(), static_cast<std::size_t>(config_.worker_count));
  std::atomic<std::size_t> next_index{0};

  auto worker = [&]() {
    while (true) {
      if (token.cancelled()) {
        return;
      }
      const auto index = next_index.fetch_add(1);
      if (index >= tasks.size()) {
        return;
      }
      try {
        report.outcomes[index] = Describe(index, tasks[index]);
      } catch (const std::exception& error) {
        report.outcomes[index].status = ExtractionStatus::kFailed;
        report.outcomes[index].reason = error.what();
      }
    }
  };

  std::vector<std::thread> workers{};
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& thread : workers) {
    thread.join();
  }
  report.cancelled = token.cancelled();

  std::unordered_set<std::string> vision_warnings{};
  for (const auto& outcome : report.outcomes) {
    if (outcome.status == ExtractionStatus::kFailed) {
      ++report.failed;
      const auto& task = tasks[outcome.task_index];
      spdlog::warn("extraction: {} task for {} at {} failed: {}",
                   ContentTypeName(task.content_type),
                   task.paper_id,
                   task.location,
                   outcome.reason);
      if (task.content_type != ContentType::kText) {
        AddWarningOnce(report, vision_warnings, "vision_unavailable:" + outcome.reason);
      }
    } else if (outcome.status == ExtractionStatus::kSkipped) {
      ++report.skipped;
    }
  }

  EmbedChunks(report.outcomes, tasks, report);

  for (const auto& outcome : report.outcomes) {
    if (outcome.status != ExtractionStatus::kSucceeded) {
      continue;
    }
    store.Upsert(*outcome.chunk);
    ++report.stored;
  }
  for (auto& warning : store.DrainWarnings()) {
    report.warnings.push_back(std::move(warning));
  }

  spdlog::info("extraction: {} tasks, {} stored, {} embedded, {} failed, {} skipped{}",
               tasks.size(),
               report.stored,
               report.embedded,
               report.failed,
               report.skipped,
               report.cancelled ? " (cancelled)" : "");
  return report;
}

}  // namespace sailcpp
