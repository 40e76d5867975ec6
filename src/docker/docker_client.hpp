#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"
#include "sandbox/container_backend.hpp"

namespace runbox::docker {

// Socket path named by a DOCKER_HOST value. Only unix:// endpoints are supported;
// anything else throws BackendError.
std::string ResolveSocketPath(const std::string& docker_host);

// Body of POST /containers/create for a unit spec.
nlohmann::json BuildCreateBody(const sandbox::ContainerSpec& spec);

std::string PercentEncode(std::string_view value);

// Docker Engine API client speaking HTTP/1.1 over the daemon's unix socket.
// One connection per call; safe to share between threads.
class DockerClient : public sandbox::ContainerBackend {
public:
    explicit DockerClient(const std::string& docker_host,
                          std::chrono::milliseconds request_timeout = std::chrono::seconds(30),
                          std::chrono::milliseconds pull_timeout = std::chrono::minutes(10));

    void Ping(std::chrono::milliseconds timeout) override;
    bool ImageExists(const std::string& image) override;
    void PullImage(const std::string& image) override;
    std::string CreateContainer(const sandbox::ContainerSpec& spec) override;
    std::unique_ptr<sandbox::OutputStream> AttachOutput(const std::string& id) override;
    std::shared_ptr<sandbox::WaitChannel> WaitContainer(const std::string& id,
                                                        std::chrono::milliseconds timeout) override;
    void StartContainer(const std::string& id) override;
    void KillContainer(const std::string& id, std::chrono::milliseconds timeout) override;
    void RemoveContainer(const std::string& id, std::chrono::milliseconds timeout) override;

private:
    struct Response {
        int status = 0;
        std::string body;
    };

    Response Request(const std::string& method,
                     const std::string& target,
                     const std::string& body,
                     std::chrono::milliseconds timeout) const;

    std::string socket_path_;
    std::chrono::milliseconds request_timeout_;
    std::chrono::milliseconds pull_timeout_;
};

}  // namespace runbox::docker
