#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "uplink/error_codes.hpp"
#include "uplink/framing.hpp"
#include "uplink/protocol.hpp"
#include "uplink/server/filesystem.hpp"
#include "uplink/server/transfer_registry.hpp"

namespace uplink::server
{

    struct ServerServices
    {
        Filesystem &filesystem;
        TransferRegistry &transfer_registry;
        std::chrono::seconds session_timeout;
    };

    /// One client connection. Requests are handled strictly one at a time: the next
    /// frame is read only after the previous response has been written.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const uplink::protocol::ResponseEnvelope &envelope);
        void send_error(uplink::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void send_error(uplink::ErrorCode code, uplink::protocol::ResponseKind kind, std::string message,
                        nlohmann::json details, std::optional<std::string> request_id);
        void respond(const uplink::protocol::RequestEnvelope &envelope,
                     const std::function<nlohmann::json()> &handler);

        nlohmann::json handle_open_session(const uplink::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_send_chunk(const uplink::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_finalize(const uplink::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_query_status(const uplink::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_ping(const uplink::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_list_uploads(const uplink::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string peer_;

        std::array<std::uint8_t, uplink::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
    };

} // namespace uplink::server
