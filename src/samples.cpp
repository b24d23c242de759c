#include "samples.h"

#include <fstream>

#include <spdlog/spdlog.h>
#include <trainer/utils.h>

namespace {

std::vector<TestCase> ToTestCases(const nlohmann::json& list) {
  std::vector<TestCase> ret;
  for (auto& item : list) {
    if (!item.is_object()) continue;
    auto Field = [&item](const char* key) {
      auto it = item.find(key);
      return it != item.end() && it->is_string() ? it->get<std::string>() : std::string();
    };
    ret.push_back({Field("in"), Field("out")});
  }
  return ret;
}

// nullptr if the candidate holds no sample list
const nlohmann::json* SampleList(const nlohmann::json* candidate) {
  if (!candidate) return nullptr;
  if (candidate->is_array()) return candidate;
  if (candidate->is_object()) {
    auto it = candidate->find("samples");
    if (it != candidate->end() && it->is_array()) return &*it;
  }
  return nullptr;
}

const nlohmann::json* Find(const nlohmann::json& obj, const std::string& key) {
  if (!obj.is_object()) return nullptr;
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &*it;
}

} // namespace

SampleStore::SampleStore(fs::path cache_file) :
    cache_file_(std::move(cache_file)), cache_(nlohmann::json::object()) {
  std::error_code ec;
  if (!fs::exists(cache_file_, ec)) {
    spdlog::debug("Samples cache {} does not exist", cache_file_.c_str());
    return;
  }
  std::ifstream fin(cache_file_);
  if (!fin) throw std::runtime_error("Cannot open samples cache " + cache_file_.string());
  try {
    fin >> cache_;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Malformed samples cache " + cache_file_.string() + ": " + e.what());
  }
  if (!cache_.is_object()) {
    spdlog::warn("Samples cache {} is not an object; ignored", cache_file_.c_str());
    cache_ = nlohmann::json::object();
  }
}

SampleStore::SampleStore(nlohmann::json cache) : cache_(std::move(cache)) {
  if (!cache_.is_object()) cache_ = nlohmann::json::object();
}

std::vector<TestCase> SampleStore::Get(const std::string& contest, const std::string& problem_id) const {
  const nlohmann::json* candidates[] = {
    Find(cache_, contest) ? Find(*Find(cache_, contest), problem_id) : nullptr,
    Find(cache_, contest + "/" + problem_id),
  };
  for (auto candidate : candidates) {
    if (auto list = SampleList(candidate)) {
      auto ret = ToTestCases(*list);
      if (ret.empty()) break;
      return ret;
    }
  }
  throw SamplesNotFound(contest, problem_id);
}

void SampleStore::Put(const std::string& contest, const std::string& problem_id,
                      const std::vector<TestCase>& samples) {
  nlohmann::json list = nlohmann::json::array();
  for (auto& i : samples) list.push_back({{"in", i.input}, {"out", i.output}});
  if (!cache_[contest].is_object()) cache_[contest] = nlohmann::json::object();
  cache_[contest][problem_id] = {{"samples", std::move(list)}};
}

bool SampleStore::Save() const {
  if (cache_file_.empty()) return true;
  if (cache_file_.has_parent_path() && !CreateDirs(cache_file_.parent_path())) return false;
  spdlog::debug("Save samples cache {}", cache_file_.c_str());
  return WriteFile(cache_file_, cache_.dump(2) + "\n");
}
