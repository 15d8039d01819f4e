#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace codebox::security {

const std::vector<std::string>& DeniedHostPrefixes();
const std::vector<std::string>& DeniedContainerPrefixes();

// True when path equals prefix or lies beneath it. Both must be normalized.
bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& prefix);

// Throws ValidationRejected when the host path is missing or resolves into a
// system directory, or the container path is relative, points into a system or
// kernel directory, or would cover one.
void ValidateMount(const std::string& host_path, const std::string& container_path);

}  // namespace codebox::security
