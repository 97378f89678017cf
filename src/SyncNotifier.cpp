/**
 * @file SyncNotifier.cpp
 * @brief
 */

// Header Being Defined
#include <msync/SyncNotifier.hpp>

// Standard Library Includes
#include <chrono>
#include <string>
#include <utility>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <zmq.hpp>

namespace msync
{
SyncNotifier::SyncNotifier(
    std::string                     endpoint,
    const std::chrono::milliseconds timeout
)
    : m_Endpoint(std::move(endpoint)),
      m_Timeout(timeout)
{
}

auto SyncNotifier::to_json(const SyncReport& report) -> nlohmann::json
{
    return nlohmann::json {
        { "id", report.instanceId },
        { "destination", report.destination },
        { "upstream", report.upstream },
        { "mode", std::string(to_string(report.mode)) },
        { "exit_code", report.exitCode },
        { "transfer_exit_code", report.transferExitCode },
        { "elapsed_seconds", report.elapsed.count() },
    };
}

auto SyncNotifier::publish(const SyncReport& report) const -> bool
{
    const std::string message = SyncNotifier::to_json(report).dump();

    try
    {
        zmq::context_t socketContext {};
        zmq::socket_t  socket { socketContext, zmq::socket_type::req };

        const auto timeout = static_cast<int>(m_Timeout.count());
        socket.set(zmq::sockopt::linger, 0);
        socket.set(zmq::sockopt::sndtimeo, timeout);
        socket.set(zmq::sockopt::rcvtimeo, timeout);

        socket.connect(m_Endpoint);

        if (!socket.send(zmq::buffer(message), zmq::send_flags::none))
        {
            spdlog::warn("Timed out sending sync report to {}", m_Endpoint);
            return false;
        }

        zmq::message_t reply;

        if (!socket.recv(reply, zmq::recv_flags::none))
        {
            spdlog::warn(
                "No acknowledgement for sync report from {}",
                m_Endpoint
            );
            return false;
        }

        spdlog::debug(
            "Sync report acknowledged by {}: {}",
            m_Endpoint,
            reply.to_string()
        );
        return true;
    }
    catch (zmq::error_t& ze)
    {
        spdlog::warn(
            "Failed to send sync report to {}: {}",
            m_Endpoint,
            ze.what()
        );
        return false;
    }
}
} // namespace msync
