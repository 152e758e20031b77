#pragma once
#include "tracedmcp/mcp/dispatcher.hpp"
#include "tracedmcp/types.hpp"

#include <atomic>
#include <httplib.h>
#include <memory>
#include <string>
#include <thread>

namespace tracedmcp::server
{

/**
 * HTTP transport for the Dispatcher.
 *
 * Serves a single JSON-RPC endpoint:
 * - POST: body is decoded as JSON and handed to the dispatcher together with the request
 *   headers (the trace context travels in traceparent/tracestate). A body that is not JSON
 *   gets 400 with a ParseError envelope; a message that produces no response (notifications)
 *   gets 202; everything else 200 with the JSON-RPC response.
 * - GET: 405
 * - OPTIONS: CORS preflight, when a CORS origin is configured
 *
 * Usage:
 *   HttpServerWrapper server(dispatcher, "127.0.0.1", 8001, "/weather");
 *   server.start();  // Non-blocking - runs in background thread
 *   // ... server runs ...
 *   server.stop();
 */
class HttpServerWrapper
{
  public:
    /**
     * @param dispatcher Must outlive the server
     * @param port Port to listen on; 0 picks a free port (see port() after start())
     * @param cors_origin CORS origin to allow (empty = no CORS headers)
     */
    HttpServerWrapper(const mcp::Dispatcher& dispatcher, std::string host = "127.0.0.1",
                      int port = 8001, std::string path = "/weather",
                      std::string cors_origin = "");

    ~HttpServerWrapper();

    /// Start listening in a background thread. Returns false if already running or the
    /// address could not be bound.
    bool start();

    /// Stop the server and join the background thread. Safe to call multiple times.
    void stop();

    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }
    const std::string& path() const
    {
        return path_;
    }

  private:
    void handle_post(const httplib::Request& req, httplib::Response& res) const;
    void run_server();

    const mcp::Dispatcher& dispatcher_;
    std::string host_;
    int port_;
    std::string path_;
    std::string cors_origin_;

    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace tracedmcp::server
