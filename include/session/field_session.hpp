// include/session/field_session.hpp

#pragma once

#include "channel.hpp"
#include "configs.hpp"
#include "host_set.hpp"
#include "packet_codec.hpp"

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

using boost::asio::ip::udp;

// a field host as the consumer sees it
struct FieldHost {
  udp::endpoint control_endpoint; ///< Host address with its control port.
  std::optional<std::string> hostname;
  uint32_t interface_index = 0;
  std::string stream_group = STREAM_GROUP_V6;
  uint16_t data_port = DATA_PORT;     ///< Multicast telemetry port.
  uint16_t vis_ad_port = VIS_AD_PORT; ///< Multicast advertisement port.

  bool operator==(const FieldHost &) const = default;

  static FieldHost from_discovered(const DiscoveredHost &host);

  // hostname if advertised, the control endpoint otherwise
  std::string display_name() const;
};

/**
 * @class FieldSession
 * @brief Base of the tasks streaming one field host's data to a consumer.
 *
 * A session pushes decoded packets into its packet channel and reads
 * requests from its request channel. It finishes (sets the shared flag) on a
 * fatal setup error, a fatal network error, when the consumer closed the
 * packet channel, or on stop(). It is never restarted.
 *
 * All member functions run on the io_context.
 */
class FieldSession : public std::enable_shared_from_this<FieldSession> {
public:
  using PacketChannel = BoundedChannel<UpdatePacket>;
  using RequestChannel = BoundedChannel<FieldRequest>;

  virtual ~FieldSession() = default;

  FieldSession(const FieldSession &) = delete;
  FieldSession &operator=(const FieldSession &) = delete;

  virtual void start() = 0;

  // closes all sockets and marks the session finished
  void stop();

  // takes the queued requests out of the request channel
  void process_requests();

  bool is_finished() const { return finished_->load(); }

protected:
  FieldSession(boost::asio::io_context &io_context, FieldHost host,
               std::shared_ptr<PacketChannel> packets_out,
               std::shared_ptr<RequestChannel> requests_in,
               std::shared_ptr<std::atomic<bool>> finished);

  virtual void handle_request(FieldRequest request) = 0;
  virtual void close_sockets() = 0;

  // hands a packet to the consumer, ends the session if nobody listens
  void forward_packet(UpdatePacket packet);

  // decodes a data datagram, returns the empty variant on malformed input
  UpdatePacket decode_datagram(const std::vector<uint8_t> &data,
                               const udp::endpoint &sender) const;

  boost::asio::io_context &io_context_;
  FieldHost host_;
  std::shared_ptr<PacketChannel> packets_out_;
  std::shared_ptr<RequestChannel> requests_in_;
  std::shared_ptr<std::atomic<bool>> finished_;
  bool stopped_ = false;

private:
  std::chrono::steady_clock::time_point next_full_warning_;
};

/**
 * @class FieldConnection
 * @brief Consumer side of a running FieldSession.
 *
 * Owns the packet receiver, the request sender and the finished flag.
 * Destroying the connection closes both channels and stops the session.
 */
class FieldConnection {
public:
  enum class Transport { MULTICAST, WEBSOCKET };

  static FieldConnection open(boost::asio::io_context &io_context,
                              const FieldHost &host, Transport transport);

  FieldConnection(FieldConnection &&) noexcept = default;
  FieldConnection &operator=(FieldConnection &&other) noexcept;
  FieldConnection(const FieldConnection &) = delete;
  FieldConnection &operator=(const FieldConnection &) = delete;

  ~FieldConnection();

  std::optional<UpdatePacket> try_recv();

  // queues a request for the session, FULL if it cannot keep up
  FieldSession::RequestChannel::SendResult send_request(FieldRequest request);

  bool is_finished() const;

private:
  FieldConnection(boost::asio::io_context &io_context,
                  std::shared_ptr<FieldSession> session,
                  std::shared_ptr<FieldSession::PacketChannel> packets,
                  std::shared_ptr<FieldSession::RequestChannel> requests,
                  std::shared_ptr<std::atomic<bool>> finished);

  void release();

  boost::asio::io_context *io_context_;
  std::shared_ptr<FieldSession> session_;
  std::shared_ptr<FieldSession::PacketChannel> packets_;
  std::shared_ptr<FieldSession::RequestChannel> requests_;
  std::shared_ptr<std::atomic<bool>> finished_;
};
