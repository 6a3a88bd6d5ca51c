#pragma once
//
// AnalysisResult persistence
//
// Binary (glaze BEVE) keeps every field including the zone sub-series and the
// source series. JSON (glaze, prettified) omits both series. File I/O
// failures throw std::runtime_error naming the path.
//

#include <epoch_zones/analysis/analysis_result.h>

#include <filesystem>
#include <string>

namespace epoch_zones::serialization {

[[nodiscard]] std::string ToBinary(const AnalysisResult &result);
[[nodiscard]] AnalysisResult FromBinary(const std::string &bytes);

[[nodiscard]] std::string ToJson(const AnalysisResult &result);
[[nodiscard]] AnalysisResult FromJson(const std::string &json);

void SaveBinary(const AnalysisResult &result,
                const std::filesystem::path &path);
[[nodiscard]] AnalysisResult LoadBinary(const std::filesystem::path &path);

void SaveJson(const AnalysisResult &result, const std::filesystem::path &path);
[[nodiscard]] AnalysisResult LoadJson(const std::filesystem::path &path);

// Reads a whole file; throws std::runtime_error naming the path
[[nodiscard]] std::string ReadFile(const std::filesystem::path &path);
// Writes through a sibling temp file and renames it into place
void WriteFileAtomic(const std::filesystem::path &path,
                     const std::string &contents);

} // namespace epoch_zones::serialization
