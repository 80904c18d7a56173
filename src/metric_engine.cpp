/**
 * @file metric_engine.cpp
 * @brief Metric evaluation implementation
 */

#include "chunk_encode/metric_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>

#include <sys/wait.h>

#include "chunk_encode/logging.hpp"
#include "chunk_encode/work_queue.hpp"

namespace chunk_encode {

const char *metric_name(MetricKind kind) {
  switch (kind) {
  case MetricKind::Ssimulacra2:
    return "ssimulacra2";
  case MetricKind::Butteraugli:
    return "butteraugli";
  case MetricKind::Cvvdp:
    return "cvvdp";
  }
  return "unknown";
}

std::string shell_quote(const std::string &text) {
  std::string out = "'";
  for (char c : text) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

std::vector<double> parse_score_lines(const std::string &text) {
  std::vector<double> scores;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    const char *begin = line.c_str();
    char *end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE)
      continue;
    /// Allow trailing whitespace only
    while (*end == ' ' || *end == '\t' || *end == '\r')
      ++end;
    if (*end != '\0')
      continue;
    scores.push_back(value);
  }
  return scores;
}

// **----- COMMAND ENGINE -----**

CommandMetricEngine::CommandMetricEngine(std::string command_template,
                                         std::string reference,
                                         MetricKind kind, int skip,
                                         int threads)
    : template_(std::move(command_template)), reference_(std::move(reference)),
      kind_(kind), skip_(std::max(1, skip)), threads_(std::max(1, threads)) {}

std::string CommandMetricEngine::render(const MetricRequest &request) const {
  struct Placeholder {
    const char *name;
    std::string value;
  };
  const Placeholder placeholders[] = {
      {"{reference}", shell_quote(reference_)},
      {"{distorted}", shell_quote(request.distorted)},
      {"{start}", std::to_string(request.start)},
      {"{end}", std::to_string(request.end)},
      {"{skip}", std::to_string(skip_)},
      {"{metric}", metric_name(kind_)},
      {"{threads}", std::to_string(threads_)},
  };

  std::string out;
  out.reserve(template_.size() + 128);
  size_t pos = 0;
  while (pos < template_.size()) {
    bool replaced = false;
    if (template_[pos] == '{') {
      for (const auto &p : placeholders) {
        size_t len = std::strlen(p.name);
        if (template_.compare(pos, len, p.name) == 0) {
          out += p.value;
          pos += len;
          replaced = true;
          break;
        }
      }
    }
    if (!replaced)
      out += template_[pos++];
  }
  return out;
}

bool CommandMetricEngine::evaluate(const MetricRequest &request,
                                   std::vector<double> &scores) {
  std::string command = render(request);

  FILE *pipe = popen(command.c_str(), "r");
  if (!pipe) {
    LOG_ERROR("[Chunk {}] Cannot start metric command: {}", request.chunk_id,
              std::strerror(errno));
    return false;
  }

  std::string output;
  char buffer[4096];
  size_t n;
  while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0)
    output.append(buffer, n);

  int status = pclose(pipe);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    LOG_ERROR("[Chunk {}] Metric command failed with exit code {}",
              request.chunk_id, code);
    return false;
  }

  scores = parse_score_lines(output);
  return true;
}

// **----- RUNNER -----**

bool MetricRunner::run(const std::vector<MetricRequest> &requests,
                       const Aggregator &aggregate,
                       std::vector<ScoredChunk> &results) {
  results.clear();
  if (requests.empty())
    return true;

  const int total = static_cast<int>(requests.size());
  const int workers = std::max(1, std::min(workers_, total));

  WorkQueue<MetricRequest> queue;
  for (const auto &r : requests)
    queue.push(r);
  queue.finish();

  std::mutex results_mutex;
  std::atomic<bool> failed{false};
  std::atomic<int> done{0};

  auto worker = [&]() {
    MetricRequest request;
    while (!failed.load() && !token_.is_cancelled() && queue.pop(request)) {
      ScoredChunk scored;
      scored.chunk_id = request.chunk_id;
      if (!engine_.evaluate(request, scored.raw_samples)) {
        failed.store(true);
        break;
      }
      aggregate(scored);

      int finished = ++done;
      LOG_INFO("[{}/{}] Chunk {} scored {:.5f} ({} samples)", finished, total,
               scored.chunk_id, scored.score, scored.raw_samples.size());

      std::lock_guard<std::mutex> lock(results_mutex);
      results.push_back(std::move(scored));
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (int i = 0; i < workers; ++i)
    pool.emplace_back(worker);
  for (auto &t : pool)
    t.join();

  std::sort(results.begin(), results.end(),
            [](const ScoredChunk &a, const ScoredChunk &b) {
              return a.chunk_id < b.chunk_id;
            });

  if (token_.is_cancelled()) {
    LOG_WARN("Metric evaluation interrupted");
    return false;
  }
  return !failed.load() && static_cast<int>(results.size()) == total;
}

} // namespace chunk_encode
