#include "tracedmcp/server/http_server.hpp"

#include "tracedmcp/mcp/jsonrpc.hpp"
#include "tracedmcp/telemetry/propagation.hpp"
#include "tracedmcp/util/log.hpp"

#include <chrono>

namespace tracedmcp::server
{

HttpServerWrapper::HttpServerWrapper(const mcp::Dispatcher& dispatcher, std::string host,
                                     int port, std::string path, std::string cors_origin)
    : dispatcher_(dispatcher), host_(std::move(host)), port_(port), path_(std::move(path)),
      cors_origin_(std::move(cors_origin))
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

void HttpServerWrapper::handle_post(const httplib::Request& req, httplib::Response& res) const
{
    if (!cors_origin_.empty())
        res.set_header("Access-Control-Allow-Origin", cors_origin_);

    Carrier headers;
    for (const auto& h : req.headers)
        headers.emplace(h.first, h.second);

    Json message;
    try
    {
        message = Json::parse(req.body);
    }
    catch (const Json::parse_error& e)
    {
        util::log::warn(std::string("malformed request body: ") + e.what());
        auto error = mcp::make_error(nullptr, mcp::ErrorCode::ParseError, "Parse error",
                                     Json{{"kind", "ParseError"}, {"detail", e.what()}});
        res.status = 400;
        res.set_content(error.dump(), "application/json");
        return;
    }

    auto response = dispatcher_.handle(message, headers);
    if (!response)
    {
        res.status = 202;
        return;
    }

    // JSON-RPC errors are still 200 OK at HTTP level. The write is attempted even if the
    // client has gone away; httplib fails it on the closed socket.
    res.status = 200;
    res.set_content(response->dump(), "application/json");
}

void HttpServerWrapper::run_server()
{
    svr_->listen_after_bind();
    running_ = false;
}

bool HttpServerWrapper::start()
{
    if (running_)
        return false;

    svr_ = std::make_unique<httplib::Server>();

    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    if (!cors_origin_.empty())
    {
        svr_->Options(path_,
                      [this](const httplib::Request&, httplib::Response& res)
                      {
                          res.set_header("Access-Control-Allow-Origin", cors_origin_);
                          res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
                          res.set_header("Access-Control-Allow-Headers",
                                         std::string("Content-Type, ") +
                                             telemetry::propagation::TRACEPARENT_HEADER + ", " +
                                             telemetry::propagation::TRACESTATE_HEADER);
                          res.status = 204;
                      });
    }

    svr_->Post(path_, [this](const httplib::Request& req, httplib::Response& res)
               { handle_post(req, res); });

    svr_->Get(path_,
              [](const httplib::Request&, httplib::Response& res)
              {
                  res.status = 405;
                  res.set_header("Allow", "POST");
                  Json error_response = {
                      {"error", "Method Not Allowed"},
                      {"message", "The endpoint only supports POST requests."}};
                  res.set_content(error_response.dump(), "application/json");
              });

    if (port_ == 0)
    {
        port_ = svr_->bind_to_any_port(host_.c_str());
        if (port_ < 0)
        {
            util::log::error("failed to bind " + host_ + " on any port");
            port_ = 0;
            return false;
        }
    }
    else if (!svr_->bind_to_port(host_.c_str(), port_))
    {
        util::log::error("failed to bind " + host_ + ":" + std::to_string(port_));
        return false;
    }

    running_ = true;
    thread_ = std::thread([this]() { run_server(); });

    // Wait for the listener using GET (returns 405, but shows server is up)
    const std::string probe_host = host_ == "0.0.0.0" ? "127.0.0.1" : host_;
    for (int attempt = 0; attempt < 20; ++attempt)
    {
        httplib::Client probe(probe_host, port_);
        probe.set_connection_timeout(std::chrono::seconds(2));
        probe.set_read_timeout(std::chrono::seconds(2));
        if (probe.Get(path_.c_str()))
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    util::log::info("listening on http://" + host_ + ":" + std::to_string(port_) + path_);
    return true;
}

void HttpServerWrapper::stop()
{
    running_ = false;
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
}

} // namespace tracedmcp::server
