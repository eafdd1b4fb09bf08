// SPDX-License-Identifier: Apache-2.0
#include "SocketTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <string>

#include <sys/socket.h>
#include <sys/un.h>

#include <unistd.h>

namespace replbridge
{

struct SocketTransport::Impl
{
    int fd = -1;
    bool connected = false;
    std::string readBuffer;
};

SocketTransport::SocketTransport(): _impl(std::make_unique<Impl>())
{
}

SocketTransport::~SocketTransport()
{
    close();
}

auto SocketTransport::connect(std::string_view socketPath) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::CommunicationError, "Transport already connected");

    auto addr = sockaddr_un {};
    addr.sun_family = AF_UNIX;
    if (socketPath.size() >= sizeof(addr.sun_path))
        return makeError(ErrorCode::CommunicationError,
                         std::format("Socket path too long: {}", socketPath));
    std::memcpy(addr.sun_path, socketPath.data(), socketPath.size());

    auto const fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return makeError(ErrorCode::CommunicationError,
                         std::format("Failed to create socket: {}", std::strerror(errno)));

    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0)
    {
        auto const savedErrno = errno;
        ::close(fd);
        return makeError(ErrorCode::CommunicationError,
                         std::format("Socket error: {}. Is the Julia MCP server running?",
                                     std::strerror(savedErrno)));
    }

    _impl->fd = fd;
    _impl->connected = true;
    _impl->readBuffer.clear();
    log::debug("Connected to backend socket {}", socketPath);
    return {};
}

auto SocketTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::CommunicationError, "Transport not connected");

    auto const data = json::serialize(message) + "\n";

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::send(_impl->fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::CommunicationError,
                             std::format("Failed to write to socket: {}", std::strerror(errno)));
        }
        offset += static_cast<size_t>(written);
    }

    return {};
}

auto SocketTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::CommunicationError, "Transport not connected");

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            return json::parse(line).transform_error([](Error error) {
                return Error { ErrorCode::CommunicationError,
                               std::format("Invalid response from server: {}", error.message) };
            });
        }

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::recv(_impl->fd, buf.data(), buf.size(), 0);
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead < 0)
            return makeError(ErrorCode::CommunicationError,
                             std::format("Failed to read from socket: {}", std::strerror(errno)));
        if (bytesRead == 0)
            return makeError(ErrorCode::CommunicationError, "Server closed connection");

        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void SocketTransport::close()
{
    if (_impl->fd >= 0)
    {
        ::close(_impl->fd);
        _impl->fd = -1;
    }

    if (!_impl->connected)
        return;

    _impl->connected = false;
    log::trace("Backend socket closed");
}

auto SocketTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace replbridge
