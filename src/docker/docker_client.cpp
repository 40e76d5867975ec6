#include "docker/docker_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>
#include <thread>

#include "sandbox/errors.hpp"
#include "sandbox/images.hpp"
#include "utils/logging.hpp"

namespace runbox::docker {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using UnixProtocol = asio::local::stream_protocol;
using UnixStream = beast::basic_stream<UnixProtocol>;

using sandbox::BackendError;

constexpr const char* kLogTag = "docker";
constexpr const char* kUnixScheme = "unix://";
constexpr int kHttpVersion = 11;

// One HTTP exchange on a fresh unix socket connection. Every operation runs on a
// private io_context and is bounded by the stream's expiry.
class Connection {
public:
    Connection(const std::string& socket_path, std::chrono::milliseconds timeout)
        : stream_(ioc_) {
        stream_.expires_after(timeout);
        Run("connect to " + socket_path, [&](auto handler) {
            stream_.async_connect(UnixProtocol::endpoint(socket_path), std::move(handler));
        });
    }

    void Write(http::request<http::string_body>& request) {
        Run("write request", [&](auto handler) {
            http::async_write(stream_, request, std::move(handler));
        });
    }

    template <typename Parser>
    void ReadHeader(Parser& parser) {
        Run("read response header", [&](auto handler) {
            http::async_read_header(stream_, buffer_, parser, std::move(handler));
        });
    }

    template <typename Parser>
    void Read(Parser& parser) {
        Run("read response", [&](auto handler) {
            http::async_read(stream_, buffer_, parser, std::move(handler));
        });
    }

    void ExpiresAfter(std::chrono::milliseconds timeout) { stream_.expires_after(timeout); }
    void ExpiresNever() { stream_.expires_never(); }

    asio::io_context& Context() { return ioc_; }
    UnixStream& Stream() { return stream_; }
    beast::flat_buffer& Buffer() { return buffer_; }

private:
    template <typename Initiate>
    void Run(const std::string& what, Initiate&& initiate) {
        beast::error_code result = asio::error::would_block;
        initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
        ioc_.restart();
        ioc_.run();
        if (result) {
            throw BackendError(what + ": " + result.message());
        }
    }

    asio::io_context ioc_;
    UnixStream stream_;
    beast::flat_buffer buffer_;
};

http::request<http::string_body> MakeRequest(const std::string& method,
                                             const std::string& target,
                                             const std::string& body) {
    http::request<http::string_body> request{http::string_to_verb(method), target, kHttpVersion};
    request.set(http::field::host, "docker");
    request.set(http::field::user_agent, "runbox");
    request.keep_alive(false);
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
        request.body() = body;
    }
    request.prepare_payload();
    return request;
}

std::string ErrorMessage(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("message") && json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    return body;
}

std::string ContainerPath(const std::string& id) {
    return "/containers/" + PercentEncode(id);
}

// Raw multiplexed stream left over after the attach upgrade.
class AttachedStream : public sandbox::OutputStream {
public:
    explicit AttachedStream(std::unique_ptr<Connection> connection)
        : connection_(std::move(connection)) {
        connection_->ExpiresNever();
    }

    std::size_t ReadSome(char* data, std::size_t size) override {
        if (closed_) {
            return 0;
        }
        auto& buffer = connection_->Buffer();
        if (buffer.size() > 0) {
            const auto n = asio::buffer_copy(asio::buffer(data, size), buffer.data());
            buffer.consume(n);
            return n;
        }
        beast::error_code result = asio::error::would_block;
        std::size_t transferred = 0;
        connection_->Stream().async_read_some(
            asio::buffer(data, size),
            [&](beast::error_code ec, std::size_t n) {
                result = ec;
                transferred = n;
            });
        auto& ioc = connection_->Context();
        ioc.restart();
        ioc.run();
        if (result && result != asio::error::eof) {
            if (!closed_) {
                utils::Log(utils::LogLevel::kDebug, kLogTag, "attach stream ended",
                           {{"error", result.message()}});
            }
        }
        return result ? 0 : transferred;
    }

    void Close() override {
        if (closed_.exchange(true)) {
            return;
        }
        // Runs on whichever thread is inside ReadSome, or on the next one.
        asio::post(connection_->Context(), [connection = connection_.get()] {
            beast::error_code ignored;
            connection->Stream().socket().shutdown(UnixProtocol::socket::shutdown_both, ignored);
            connection->Stream().socket().close(ignored);
        });
    }

private:
    std::unique_ptr<Connection> connection_;
    std::atomic<bool> closed_{false};
};

}  // namespace

std::string ResolveSocketPath(const std::string& docker_host) {
    if (docker_host.empty()) {
        return "/var/run/docker.sock";
    }
    if (docker_host.rfind(kUnixScheme, 0) == 0) {
        auto path = docker_host.substr(std::strlen(kUnixScheme));
        if (path.empty()) {
            throw BackendError("DOCKER_HOST has an empty socket path");
        }
        return path;
    }
    if (docker_host.front() == '/') {
        return docker_host;
    }
    throw BackendError("unsupported DOCKER_HOST '" + docker_host + "', only unix:// is supported");
}

std::string PercentEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

nlohmann::json BuildCreateBody(const sandbox::ContainerSpec& spec) {
    nlohmann::json mounts = nlohmann::json::array();
    for (const auto& mount : spec.mounts) {
        mounts.push_back({
            {"Type", "bind"},
            {"Source", mount.source},
            {"Target", mount.target},
            {"ReadOnly", mount.read_only}
        });
    }
    nlohmann::json ulimits = nlohmann::json::array();
    for (const auto& ulimit : spec.ulimits) {
        ulimits.push_back({{"Name", ulimit.name}, {"Soft", ulimit.soft}, {"Hard", ulimit.hard}});
    }
    nlohmann::json tmpfs = nlohmann::json::object();
    for (const auto& [path, options] : spec.tmpfs) {
        tmpfs[path] = options;
    }

    nlohmann::json host_config = {
        {"Mounts", mounts},
        {"Memory", spec.memory_bytes},
        {"NanoCpus", spec.nano_cpus},
        {"Ulimits", ulimits},
        {"CapDrop", spec.cap_drop},
        {"SecurityOpt", spec.security_opt},
        {"ReadonlyRootfs", spec.read_only_rootfs},
        {"Tmpfs", tmpfs},
        {"AutoRemove", spec.auto_remove}
    };
    if (spec.network_disabled) {
        host_config["NetworkMode"] = "none";
    }

    return {
        {"Image", spec.image},
        {"Cmd", spec.cmd},
        {"WorkingDir", spec.working_dir},
        {"User", spec.user},
        {"Env", spec.env},
        {"NetworkDisabled", spec.network_disabled},
        {"AttachStdin", false},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"OpenStdin", false},
        {"Tty", false},
        {"HostConfig", host_config}
    };
}

DockerClient::DockerClient(const std::string& docker_host,
                           std::chrono::milliseconds request_timeout,
                           std::chrono::milliseconds pull_timeout)
    : socket_path_(ResolveSocketPath(docker_host))
    , request_timeout_(request_timeout)
    , pull_timeout_(pull_timeout) {}

DockerClient::Response DockerClient::Request(const std::string& method,
                                             const std::string& target,
                                             const std::string& body,
                                             std::chrono::milliseconds timeout) const {
    Connection connection(socket_path_, timeout);
    auto request = MakeRequest(method, target, body);
    connection.Write(request);
    http::response_parser<http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    connection.Read(parser);
    return Response{static_cast<int>(parser.get().result_int()), parser.get().body()};
}

void DockerClient::Ping(std::chrono::milliseconds timeout) {
    const auto response = Request("GET", "/_ping", "", timeout);
    if (response.status != 200) {
        throw BackendError("ping failed: HTTP " + std::to_string(response.status), response.status);
    }
}

bool DockerClient::ImageExists(const std::string& image) {
    const auto response = Request("GET", "/images/" + image + "/json", "", request_timeout_);
    if (response.status == 200) {
        return true;
    }
    if (response.status == 404) {
        return false;
    }
    throw BackendError("image inspect failed: " + ErrorMessage(response.body), response.status);
}

void DockerClient::PullImage(const std::string& image) {
    const auto [repository, tag] = sandbox::SplitImageReference(image);
    const auto target = "/images/create?fromImage=" + PercentEncode(repository) +
                        "&tag=" + PercentEncode(tag);
    const auto response = Request("POST", target, "", pull_timeout_);
    if (response.status != 200) {
        throw BackendError("failed to pull image: " + ErrorMessage(response.body), response.status);
    }
    // Progress arrives as one JSON object per line; a failed pull still answers 200.
    std::istringstream lines(response.body);
    std::string line;
    while (std::getline(lines, line)) {
        const auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            continue;
        }
        if (json.contains("error")) {
            const auto& error = json["error"];
            throw BackendError("failed to pull image: " +
                               (error.is_string() ? error.get<std::string>() : error.dump()));
        }
    }
}

std::string DockerClient::CreateContainer(const sandbox::ContainerSpec& spec) {
    const auto response = Request("POST", "/containers/create", BuildCreateBody(spec).dump(), request_timeout_);
    if (response.status != 201) {
        throw BackendError(ErrorMessage(response.body), response.status);
    }
    const auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (json.is_discarded() || !json.contains("Id") || !json["Id"].is_string()) {
        throw BackendError("create response without container id: " + response.body, response.status);
    }
    for (const auto& warning : json.value("Warnings", nlohmann::json::array())) {
        if (warning.is_string()) {
            utils::Log(utils::LogLevel::kWarn, kLogTag, "create warning",
                       {{"warning", warning.get<std::string>()}});
        }
    }
    return json["Id"].get<std::string>();
}

std::unique_ptr<sandbox::OutputStream> DockerClient::AttachOutput(const std::string& id) {
    auto connection = std::make_unique<Connection>(socket_path_, request_timeout_);
    auto request = MakeRequest("POST", ContainerPath(id) + "/attach?stream=1&stdout=1&stderr=1", "");
    request.set(http::field::connection, "Upgrade");
    request.set(http::field::upgrade, "tcp");
    connection->Write(request);

    http::response_parser<http::empty_body> parser;
    connection->ReadHeader(parser);
    const auto status = static_cast<int>(parser.get().result_int());
    if (status != 101 && status != 200) {
        throw BackendError("attach failed: HTTP " + std::to_string(status), status);
    }
    return std::make_unique<AttachedStream>(std::move(connection));
}

std::shared_ptr<sandbox::WaitChannel> DockerClient::WaitContainer(const std::string& id,
                                                                  std::chrono::milliseconds timeout) {
    struct WaitState {
        std::unique_ptr<Connection> connection;
        http::response_parser<http::string_body> parser;
    };
    auto state = std::make_shared<WaitState>();
    state->connection = std::make_unique<Connection>(socket_path_, timeout);
    auto request = MakeRequest("POST", ContainerPath(id) + "/wait?condition=next-exit", "");
    state->connection->Write(request);
    // The daemon flushes the header once the wait is registered.
    state->connection->ReadHeader(state->parser);

    auto channel = std::make_shared<sandbox::WaitChannel>();
    // Detached: the thread owns its connection and ends when the daemon answers or
    // the connection expires, whichever comes first.
    std::thread([state, channel]() {
        try {
            state->connection->Read(state->parser);
        } catch (const BackendError& ex) {
            channel->SetError(ex.what());
            return;
        }
        const auto& response = state->parser.get();
        if (response.result_int() != 200) {
            channel->SetError("HTTP " + std::to_string(response.result_int()) + ": " +
                              ErrorMessage(response.body()));
            return;
        }
        const auto json = nlohmann::json::parse(response.body(), nullptr, false);
        if (json.is_discarded() || !json.contains("StatusCode") || !json["StatusCode"].is_number_integer()) {
            channel->SetError("unexpected wait response: " + response.body());
            return;
        }
        if (json.contains("Error") && json["Error"].is_object()) {
            const auto message = json["Error"].value("Message", "");
            if (!message.empty()) {
                channel->SetError(message);
                return;
            }
        }
        channel->SetStatus(json["StatusCode"].get<std::int64_t>());
    }).detach();
    return channel;
}

void DockerClient::StartContainer(const std::string& id) {
    const auto response = Request("POST", ContainerPath(id) + "/start", "", request_timeout_);
    // 304: already started.
    if (response.status != 204 && response.status != 304) {
        throw BackendError(ErrorMessage(response.body), response.status);
    }
}

void DockerClient::KillContainer(const std::string& id, std::chrono::milliseconds timeout) {
    const auto response = Request("POST", ContainerPath(id) + "/kill?signal=SIGKILL", "", timeout);
    // 404 and 409 mean the container is already gone or no longer running.
    if (response.status != 204 && response.status != 404 && response.status != 409) {
        throw BackendError("kill failed: " + ErrorMessage(response.body), response.status);
    }
}

void DockerClient::RemoveContainer(const std::string& id, std::chrono::milliseconds timeout) {
    const auto response = Request("DELETE", ContainerPath(id) + "?force=1", "", timeout);
    // 409: auto-removal is already in progress.
    if (response.status != 204 && response.status != 404 && response.status != 409) {
        throw BackendError("remove failed: " + ErrorMessage(response.body), response.status);
    }
}

}  // namespace runbox::docker
