#pragma once

#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/execution_types.hpp"

namespace hoya::fetch {

struct DownloadResult {
    std::optional<hoya::sandbox::FetchedResource> resource;
    std::optional<hoya::sandbox::ExecutionError> error;

    bool Ok() const { return resource.has_value(); }
};

// Plain byte fetch of the code to run. Failures come back as DownloadError.
class ResourceDownloader {
public:
    explicit ResourceDownloader(const hoya::config::DownloadConfig& config);

    DownloadResult Download(const std::string& url) const;

private:
    const hoya::config::DownloadConfig& config_;
};

}  // namespace hoya::fetch
