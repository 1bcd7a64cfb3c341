#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace mirage::network {

/// Create a shared SSL context configured for TLS client connections
/// @param verify_peer Verify upstream certificates against the system store;
///        recording against self-signed test services needs this off
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_ssl_context(bool verify_peer);

}  // namespace mirage::network
