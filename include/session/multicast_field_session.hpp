// include/session/multicast_field_session.hpp

#pragma once

#include "field_session.hpp"
#include "multicast_socket.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <vector>

/**
 * @class MulticastFieldSession
 * @brief Receives one host's streams via source-specific multicast.
 *
 * Telemetry arrives on the host's data port, visualization advertisements on
 * its advertisement port (DATA_PORT and VIS_AD_PORT unless overridden). Both
 * come from the host's stream group, filtered to the host's address on the
 * interface it was discovered on. Each advertisement is
 * answered with a unicast DataRequest naming the selected visualizations.
 *
 * A failed source-specific join is retried every SSM_JOIN_RETRY_INTERVAL.
 */
class MulticastFieldSession : public FieldSession {
public:
  static std::shared_ptr<MulticastFieldSession>
  create(boost::asio::io_context &io_context, FieldHost host,
         std::shared_ptr<PacketChannel> packets_out,
         std::shared_ptr<RequestChannel> requests_in,
         std::shared_ptr<std::atomic<bool>> finished);

  void start() override;

protected:
  void handle_request(FieldRequest request) override;
  void close_sockets() override;

private:
  MulticastFieldSession(boost::asio::io_context &io_context, FieldHost host,
                        std::shared_ptr<PacketChannel> packets_out,
                        std::shared_ptr<RequestChannel> requests_in,
                        std::shared_ptr<std::atomic<bool>> finished);

  std::shared_ptr<MulticastFieldSession> self();

  void join_streams();
  void schedule_join_retry();

  void handle_data(const std::vector<uint8_t> &data,
                   const udp::endpoint &sender);
  void handle_advertisement(const std::vector<uint8_t> &data,
                            const udp::endpoint &sender);

  boost::asio::ip::address group_;
  boost::asio::ip::address source_;

  std::shared_ptr<MulticastSocket> data_socket_;
  std::shared_ptr<MulticastSocket> advert_socket_;
  std::shared_ptr<MulticastSocket> request_socket_;
  bool data_joined_ = false;
  bool advert_joined_ = false;

  boost::asio::steady_timer join_timer_;
  DataRequest selection_;
};
