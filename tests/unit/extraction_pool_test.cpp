#include "sailcpp/chunk_store.hpp"
#include "sailcpp/embeddings.hpp"
#include "sailcpp/extraction_pool.hpp"

#include "../test_logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::filesystem::path UniquePath(const std::string& label) {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("sailcpp_extraction_test_" + label + "_" + std::to_string(static_cast<long long>(now)) + ".sqlite3");
}

void Cleanup(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

// Describes images by their caption; "explode" throws and "blank" yields nothing.
class ScriptedVision final : public sailcpp::VisionProvider {
 public:
  explicit ScriptedVision(std::chrono::milliseconds delay = std::chrono::milliseconds(0)) : delay_(delay) {}

  std::optional<std::string> Describe(const std::vector<std::byte>&, const std::string& context) override {
    const int now = in_flight_.fetch_add(1) + 1;
    int seen = max_in_flight_.load();
    while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
    }
    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }
    in_flight_.fetch_sub(1);
    calls_.fetch_add(1);
    if (on_call_) {
      on_call_();
    }
    if (context == "explode") {
      throw std::runtime_error("vision model crashed");
    }
    if (context == "blank") {
      return std::nullopt;
    }
    return "description of " + context;
  }

  int max_in_flight() const { return max_in_flight_.load(); }
  int calls() const { return calls_.load(); }
  void set_on_call(std::function<void()> callback) { on_call_ = std::move(callback); }

 private:
  std::chrono::milliseconds delay_;
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
  std::atomic<int> calls_{0};
  std::function<void()> on_call_;
};

class CountingBatchEmbedder final : public sailcpp::BatchEmbeddingProvider {
 public:
  int dimensions() const override { return inner_.dimensions(); }
  std::vector<float> EmbedText(const std::string& text) override { return inner_.EmbedText(text); }
  std::vector<float> EmbedMultimodal(const sailcpp::MultimodalInput& input) override {
    return inner_.EmbedMultimodal(input);
  }
  std::vector<std::vector<float>> EmbedTextBatch(const std::vector<std::string>& texts) override {
    batch_sizes.push_back(texts.size());
    return inner_.EmbedTextBatch(texts);
  }

  std::vector<std::size_t> batch_sizes;

 private:
  sailcpp::HashedTokenEmbedder inner_{32};
};

class FailingEmbedder final : public sailcpp::EmbeddingProvider {
 public:
  int dimensions() const override { return 32; }
  std::vector<float> EmbedText(const std::string&) override { throw std::runtime_error("embedding quota exceeded"); }
  std::vector<float> EmbedMultimodal(const sailcpp::MultimodalInput&) override {
    throw std::runtime_error("embedding quota exceeded");
  }
};

sailcpp::ExtractionTask TextTask(const std::string& paper, int index) {
  sailcpp::ExtractionTask task{};
  task.paper_id = paper;
  task.content_type = sailcpp::ContentType::kText;
  task.location = "text:" + std::to_string(index);
  task.page_from = index;
  task.page_to = index;
  task.text = "passage number " + std::to_string(index) + " about graph learning";
  return task;
}

sailcpp::ExtractionTask VisualTask(const std::string& paper, const std::string& caption, int page) {
  sailcpp::ExtractionTask task{};
  task.paper_id = paper;
  task.content_type = sailcpp::ContentType::kFigure;
  task.location = std::to_string(page) + ":" + caption;
  task.page_from = page;
  task.page_to = page;
  task.text = caption;
  task.image = {std::byte{0x89}, std::byte{0x50}};
  return task;
}

void ScenarioFailureIsolation() {
  sailcpp::tests::Log("scenario: failure isolation");
  const auto path = UniquePath("isolation");
  sailcpp::ChunkStore store(path);
  auto vision = std::make_shared<ScriptedVision>();
  sailcpp::ExtractionPool pool(sailcpp::ExtractionConfig{}, vision, std::make_shared<sailcpp::HashedTokenEmbedder>(32));

  std::vector<sailcpp::ExtractionTask> tasks = {
      TextTask("p1", 1), VisualTask("p1", "explode", 2), VisualTask("p1", "accuracy plot", 3),
      VisualTask("p1", "blank", 4), TextTask("p1", 5)};
  sailcpp::CancellationToken token;
  const auto report = pool.Run(tasks, store, token);

  Require(report.outcomes.size() == tasks.size(), "every task must have an outcome");
  Require(report.failed == 2 && report.stored == 3 && report.skipped == 0, "failure counts mismatch");
  Require(report.outcomes[1].status == sailcpp::ExtractionStatus::kFailed, "throwing describe must fail its task");
  Require(report.outcomes[3].status == sailcpp::ExtractionStatus::kFailed, "empty describe must fail its task");
  Require(report.outcomes[2].status == sailcpp::ExtractionStatus::kSucceeded, "sibling tasks must succeed");
  Require(store.Size() == 3, "only successful tasks produce chunks");
  const auto figure = store.Get(report.outcomes[2].chunk_id);
  Require(figure.has_value() && figure->text == "description of accuracy plot", "figure text mismatch");
  Require(figure->embedding.has_value(), "figure should be embedded");
  Require(report.embedded == 3, "healthy embedder embeds every chunk");
  Require(report.warnings == std::vector<std::string>({"vision_unavailable:vision provider failed: vision model crashed",
                                                       "vision_unavailable:vision provider returned no description"}),
          "each distinct vision failure must be reported once");

  const auto again = pool.Run(tasks, store, token);
  Require(store.Size() == 3, "re-running the same tasks must be idempotent");
  Require(again.stored == 3, "re-run stores the same chunks");
  Require(again.warnings == report.warnings, "a re-run reports the same vision failures");

  sailcpp::ExtractionPool blind_pool(sailcpp::ExtractionConfig{}, nullptr, std::make_shared<sailcpp::HashedTokenEmbedder>(32));
  const std::vector<sailcpp::ExtractionTask> figures = {VisualTask("p2", "loss curve", 1), VisualTask("p2", "ablation", 2)};
  const auto blind = blind_pool.Run(figures, store, token);
  Require(blind.failed == 2 && blind.stored == 0, "figures need a vision provider");
  Require(blind.warnings.size() == 1 && blind.warnings[0] == "vision_unavailable:no vision provider configured",
          "missing vision provider warns once");
  Cleanup(path);
}

void ScenarioBoundedConcurrency() {
  sailcpp::tests::Log("scenario: bounded concurrency");
  const auto path = UniquePath("bounded");
  sailcpp::ChunkStore store(path);
  auto vision = std::make_shared<ScriptedVision>(std::chrono::milliseconds(20));
  sailcpp::ExtractionConfig config{};
  config.worker_count = 2;
  sailcpp::ExtractionPool pool(config, vision, nullptr);

  std::vector<sailcpp::ExtractionTask> tasks{};
  for (int i = 0; i < 8; ++i) {
    tasks.push_back(VisualTask("p2", "chart " + std::to_string(i), i));
  }
  sailcpp::CancellationToken token;
  const auto report = pool.Run(tasks, store, token);
  Require(report.stored == 8, "all tasks should succeed");
  Require(vision->max_in_flight() <= 2, "no more than worker_count describes may run at once");
  Require(vision->max_in_flight() >= 1, "describes must have run");
  Require(report.embedded == 0, "no embedder means no embeddings");
  Cleanup(path);
}

void ScenarioCancellation() {
  sailcpp::tests::Log("scenario: cancellation");
  const auto path = UniquePath("cancel");
  sailcpp::ChunkStore store(path);
  auto vision = std::make_shared<ScriptedVision>();
  sailcpp::ExtractionConfig config{};
  config.worker_count = 1;
  sailcpp::ExtractionPool pool(config, vision, nullptr);

  std::vector<sailcpp::ExtractionTask> tasks{};
  for (int i = 0; i < 5; ++i) {
    tasks.push_back(VisualTask("p3", "diagram " + std::to_string(i), i));
  }

  sailcpp::CancellationToken cancelled_before;
  cancelled_before.Cancel();
  const auto none = pool.Run(tasks, store, cancelled_before);
  Require(none.cancelled && none.skipped == tasks.size(), "cancelled token dispatches nothing");
  Require(vision->calls() == 0 && store.Size() == 0, "no work may happen after cancellation");

  sailcpp::CancellationToken token;
  vision->set_on_call([&token]() { token.Cancel(); });
  const auto partial = pool.Run(tasks, store, token);
  Require(partial.cancelled, "report must flag cancellation");
  Require(vision->calls() == 1, "no new task is dispatched once cancelled");
  Require(partial.stored == 1 && partial.skipped == 4, "finished work is kept, the rest skipped");
  Cleanup(path);
}

void ScenarioEmbeddingBatchingAndFailure() {
  sailcpp::tests::Log("scenario: embedding batching and failure");
  const auto path = UniquePath("batching");
  sailcpp::ChunkStore store(path);
  auto embedder = std::make_shared<CountingBatchEmbedder>();
  sailcpp::ExtractionConfig config{};
  config.embedding_batch_size = 2;
  sailcpp::ExtractionPool pool(config, nullptr, embedder);

  std::vector<sailcpp::ExtractionTask> tasks{};
  for (int i = 0; i < 5; ++i) {
    tasks.push_back(TextTask("p4", i));
  }
  sailcpp::CancellationToken token;
  const auto report = pool.Run(tasks, store, token);
  Require(embedder->batch_sizes == std::vector<std::size_t>({2, 2, 1}), "texts must be embedded in batches");
  Require(report.embedded == 5, "every chunk should be embedded");

  const auto failing_path = UniquePath("failing");
  sailcpp::ChunkStore failing_store(failing_path);
  sailcpp::ExtractionPool failing_pool(sailcpp::ExtractionConfig{}, nullptr, std::make_shared<FailingEmbedder>());
  const auto degraded = failing_pool.Run(tasks, failing_store, token);
  Require(degraded.stored == 5 && degraded.embedded == 0, "chunks are stored without embeddings");
  Require(degraded.warnings.size() == 1, "embedding failure warns once");
  Require(failing_store.Query(sailcpp::ChunkQuery{std::nullopt, "graph learning", std::nullopt, 10}).size() == 5,
          "unembedded chunks stay keyword-searchable");
  Cleanup(path);
  Cleanup(failing_path);
}

void ScenarioTaskPlanning() {
  sailcpp::tests::Log("scenario: task planning");
  sailcpp::SourceDocument with_passages{};
  with_passages.paper = sailcpp::PaperRecord{"p5", "GNN survey", "https://example.org/p5"};
  with_passages.abstract = "a survey";
  with_passages.passages = {sailcpp::TextPassage{1, 2, "intro", "Graphs are everywhere."},
                            sailcpp::TextPassage{3, 3, "empty", "   "}};
  sailcpp::VisualRegion table{};
  table.content_type = sailcpp::ContentType::kTable;
  table.page = 4;
  table.region = "10,10,200,90";
  table.context = "results table";
  with_passages.visuals = {table};

  std::vector<std::string> warnings{};
  const auto tasks = sailcpp::PlanExtractionTasks(with_passages, warnings);
  Require(tasks.size() == 2, "blank passages are skipped and visuals planned");
  Require(tasks[0].content_type == sailcpp::ContentType::kText && tasks[0].page_to == 2, "passage task mismatch");
  Require(tasks[1].content_type == sailcpp::ContentType::kTable && tasks[1].location == "4:10,10,200,90",
          "visual task mismatch");
  Require(warnings.empty(), "documents with content do not warn");

  sailcpp::SourceDocument abstract_only{};
  abstract_only.paper.id = "p6";
  abstract_only.abstract = "We study message passing.";
  const auto fallback = sailcpp::PlanExtractionTasks(abstract_only, warnings);
  Require(fallback.size() == 1 && fallback[0].location == "summary" && fallback[0].text == "We study message passing.",
          "abstract must become a summary chunk");

  sailcpp::SourceDocument empty{};
  empty.paper.id = "p7";
  Require(sailcpp::PlanExtractionTasks(empty, warnings).empty(), "empty documents yield no tasks");
  Require(warnings.size() == 1 && warnings[0] == "no_content:p7", "empty documents must warn");
}

}  // namespace

int main() {
  try {
    sailcpp::tests::Log("extraction_pool_test: start");
    ScenarioFailureIsolation();
    ScenarioBoundedConcurrency();
    ScenarioCancellation();
    ScenarioEmbeddingBatchingAndFailure();
    ScenarioTaskPlanning();
    sailcpp::tests::Log("extraction_pool_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sailcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
