// SPDX-License-Identifier: Apache-2.0
#include "Locator.hpp"

#include <core/Log.hpp>

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

#include <signal.h>

namespace replbridge::backend
{

namespace
{

    auto readPid(const std::filesystem::path& pidPath) -> std::optional<pid_t>
    {
        auto file = std::ifstream(pidPath);
        if (!file.is_open())
            return std::nullopt;

        auto ss = std::stringstream {};
        ss << file.rdbuf();
        auto text = ss.str();

        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return std::nullopt;
        auto const last = text.find_last_not_of(" \t\r\n");
        text = text.substr(first, last - first + 1);

        auto pid = pid_t {};
        auto const* const end = text.data() + text.size();
        auto const [ptr, ec] = std::from_chars(text.data(), end, pid);
        if (ec != std::errc {} || ptr != end || pid <= 0)
            return std::nullopt;

        return pid;
    }

} // namespace

auto findSocket(const std::filesystem::path& startDir) -> std::optional<std::filesystem::path>
{
    auto ec = std::error_code {};
    auto current = std::filesystem::absolute(startDir, ec);
    if (ec)
        return std::nullopt;
    current = current.lexically_normal();
    if (!current.has_filename() && current != current.root_path())
        current = current.parent_path();

    while (true)
    {
        auto candidate = current / SocketFileName;
        if (std::filesystem::exists(candidate, ec))
            return candidate;

        auto parent = current.parent_path();
        if (parent == current || parent.empty())
            return std::nullopt;
        current = std::move(parent);
    }
}

auto pidFileFor(const std::filesystem::path& socketPath) -> std::filesystem::path
{
    return socketPath.parent_path() / PidFileName;
}

auto isAlive(const std::filesystem::path& socketPath) noexcept -> bool
{
    try
    {
        auto const pidPath = pidFileFor(socketPath);
        auto ec = std::error_code {};
        if (!std::filesystem::exists(pidPath, ec))
            return false;

        auto const pid = readPid(pidPath);
        if (!pid)
        {
            log::debug("Malformed PID file: {}", pidPath.string());
            return false;
        }

        // EPERM means the process exists but belongs to someone else. It is
        // reported as not alive.
        return ::kill(*pid, 0) == 0;
    }
    catch (const std::exception& e)
    {
        log::debug("Liveness check failed for {}: {}", socketPath.string(), e.what());
        return false;
    }
}

auto locate(const std::filesystem::path& projectDir) -> std::optional<BackendReference>
{
    auto socketPath = findSocket(projectDir);
    if (!socketPath)
        return std::nullopt;

    auto pidPath = pidFileFor(*socketPath);
    return BackendReference { .socketPath = std::move(*socketPath), .pidFilePath = std::move(pidPath) };
}

} // namespace replbridge::backend
