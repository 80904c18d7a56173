/**
 * @file scene_changes.cpp
 * @brief Scene-change list loading implementation
 */

#include "chunk_encode/scene_changes.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "chunk_encode/logging.hpp"

using json = nlohmann::json;

namespace chunk_encode {

namespace {

bool parse_json_list(const std::string &text, std::vector<int> &frames) {
  json root = json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    LOG_ERROR("Scene change file is not valid JSON");
    return false;
  }

  const json *list = &root;
  if (root.is_object()) {
    auto it = root.find("scene_changes");
    if (it == root.end()) {
      LOG_ERROR("Scene change JSON has no \"scene_changes\" array");
      return false;
    }
    list = &(*it);
  }

  if (!list->is_array()) {
    LOG_ERROR("Scene change JSON \"scene_changes\" is not an array");
    return false;
  }

  for (const auto &entry : *list) {
    if (!entry.is_number_integer()) {
      LOG_ERROR("Scene change JSON contains a non-integer entry: {}",
                entry.dump());
      return false;
    }
    frames.push_back(entry.get<int>());
  }
  return true;
}

bool parse_qp_lines(const std::string &text, std::vector<int> &frames) {
  std::istringstream in(text);
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::istringstream fields(line);
    std::string frame_str, type_str, extra;
    if (!(fields >> frame_str))
      continue; /// blank line

    /// Exactly two fields per entry
    if (!(fields >> type_str) || (fields >> extra)) {
      LOG_ERROR("Scene change file line {}: expected \"<frame> <type>\"",
                line_no);
      return false;
    }

    try {
      size_t used = 0;
      int frame = std::stoi(frame_str, &used);
      if (used != frame_str.size())
        throw std::invalid_argument(frame_str);
      frames.push_back(frame);
    } catch (const std::exception &) {
      LOG_ERROR("Scene change file line {}: bad frame number '{}'", line_no,
                frame_str);
      return false;
    }
  }
  return true;
}

} // anonymous namespace

bool parse_scene_changes(const std::string &text, std::vector<int> &frames) {
  frames.clear();

  size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return true; /// empty file: a single chunk later

  if (text[first] == '{' || text[first] == '[')
    return parse_json_list(text, frames);
  return parse_qp_lines(text, frames);
}

bool load_scene_changes(const std::string &path, std::vector<int> &frames) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("Cannot open scene change file: {}", path);
    return false;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  if (!parse_scene_changes(buffer.str(), frames)) {
    LOG_ERROR("Failed to parse scene change file: {}", path);
    return false;
  }

  LOG_INFO("Loaded {} scene changes from {}", frames.size(), path);
  return true;
}

} // namespace chunk_encode
