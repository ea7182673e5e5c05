#include "service/execute_service.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include "detect/code_kind.hpp"
#include "utils/logging.hpp"

namespace hoya::service {

using hoya::sandbox::CodeKind;
using hoya::sandbox::ErrorKind;
using hoya::sandbox::ExecutionError;
using hoya::sandbox::ExecutionOrchestrator;
using hoya::sandbox::ExecutionResult;

ExecuteService::ExecuteService(const hoya::config::Config& config)
    : config_(config),
      downloader_(config.download),
      orchestrator_(config) {}

ExecutionResult ExecuteService::ExecuteUrl(const std::string& url) {
    hoya::utils::Log(hoya::utils::LogLevel::kInfo, "execute", "url=" + url);
    auto download = downloader_.Download(url);
    if (!download.Ok()) {
        return ExecutionOrchestrator::Rejected(std::move(*download.error), CodeKind::kUnknown, 0);
    }
    return ExecuteResource(std::move(*download.resource));
}

ExecutionResult ExecuteService::ExecuteLocal(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return ExecutionOrchestrator::Rejected(
            ExecutionError{
                .kind = ErrorKind::kInvalidRequest,
                .message = "cannot read " + path.string(),
                .details = nullptr},
            CodeKind::kUnknown, 0);
    }
    hoya::sandbox::FetchedResource resource{};
    resource.bytes.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    resource.size_bytes = resource.bytes.size();
    resource.source_url = path.string();
    resource.detected_kind = hoya::detect::DetectCodeKind(resource.source_url, resource.bytes);
    return ExecuteResource(std::move(resource));
}

ExecutionResult ExecuteService::ExecuteResource(hoya::sandbox::FetchedResource resource) {
    hoya::sandbox::ExecutionRequest request{};
    request.kind = resource.detected_kind;
    request.resource = std::move(resource);
    return orchestrator_.Execute(request);
}

}  // namespace hoya::service
