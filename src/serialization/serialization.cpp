#include <epoch_zones/serialization/records.h>
#include <epoch_zones/serialization/serialization.h>

#include <glaze/beve.hpp>
#include <glaze/glaze.hpp>

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace epoch_zones::serialization {

namespace {
void CheckVersion(const AnalysisRecord &record) {
  if (record.version != kFormatVersion) {
    throw std::runtime_error(
        std::format("Unsupported analysis record version {} (expected {})",
                    record.version, kFormatVersion));
  }
}
} // namespace

std::string ToBinary(const AnalysisResult &result) {
  auto bytes = glz::write_beve(ToRecord(result, true));
  if (!bytes) {
    throw std::runtime_error("Failed to encode analysis result as BEVE");
  }
  return std::move(bytes.value());
}

AnalysisResult FromBinary(const std::string &bytes) {
  AnalysisRecord record;
  if (auto error = glz::read_beve(record, bytes)) {
    throw std::runtime_error("Failed to decode analysis result: " +
                             glz::format_error(error, bytes));
  }
  CheckVersion(record);
  return FromRecord(std::move(record));
}

std::string ToJson(const AnalysisResult &result) {
  auto json = glz::write<glz::opts{.prettify = true}>(ToRecord(result, false));
  if (!json) {
    throw std::runtime_error("Failed to encode analysis result as JSON");
  }
  return std::move(json.value());
}

AnalysisResult FromJson(const std::string &json) {
  AnalysisRecord record;
  if (auto error = glz::read_json(record, json)) {
    throw std::runtime_error("Failed to parse analysis result JSON: " +
                             glz::format_error(error, json));
  }
  CheckVersion(record);
  return FromRecord(std::move(record));
}

std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file: " + path.string());
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("Failed to read file: " + path.string());
  }
  return contents.str();
}

void WriteFileAtomic(const std::filesystem::path &path,
                     const std::string &contents) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  auto temp = path;
  temp += std::format(".{}.tmp",
                      std::hash<std::thread::id>{}(std::this_thread::get_id()));
  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      throw std::runtime_error("Failed to open file: " + temp.string());
    }
    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!file) {
      throw std::runtime_error("Failed to write file: " + temp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    std::filesystem::remove(temp, ec);
    throw std::runtime_error("Failed to replace file: " + path.string());
  }
}

void SaveBinary(const AnalysisResult &result,
                const std::filesystem::path &path) {
  WriteFileAtomic(path, ToBinary(result));
}

AnalysisResult LoadBinary(const std::filesystem::path &path) {
  return FromBinary(ReadFile(path));
}

void SaveJson(const AnalysisResult &result, const std::filesystem::path &path) {
  WriteFileAtomic(path, ToJson(result));
}

AnalysisResult LoadJson(const std::filesystem::path &path) {
  return FromJson(ReadFile(path));
}

} // namespace epoch_zones::serialization
