#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "fetch/resource_downloader.hpp"
#include "sandbox/execution_orchestrator.hpp"

namespace hoya::service {

// Download (or read), detect, execute. Shared by the HTTP server and the CLI.
class ExecuteService {
public:
    explicit ExecuteService(const hoya::config::Config& config);

    hoya::sandbox::ExecutionResult ExecuteUrl(const std::string& url);
    hoya::sandbox::ExecutionResult ExecuteLocal(const std::filesystem::path& path);
    hoya::sandbox::ExecutionResult ExecuteResource(hoya::sandbox::FetchedResource resource);

private:
    const hoya::config::Config& config_;
    hoya::fetch::ResourceDownloader downloader_;
    hoya::sandbox::ExecutionOrchestrator orchestrator_;
};

}  // namespace hoya::service
