// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <list>
#include <algorithm>
#include <sstream>
#include <thread>

#include <boost/stacktrace.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <boost/core/noncopyable.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>

#include "server.h"
#include "service.h"
#include "error.h"
#include "utils/log.h"
#include "utils/meta.h"

namespace geoline::rpc
{
using namespace boost::asio;
using namespace boost::beast;
using namespace boost::beast::http;

namespace // detail
{
  template <typename BodyType>
  bool is_healthcheck(http::request<BodyType> const& req)
  {
    return req.method() == verb::get &&
           req.target() == "/healthcheck";
  }

  template <typename BodyType>
  bool is_cors_options(http::request<BodyType> const& req)
  {
    return req.method() == verb::options &&
           req.target() == "/";
  }

  // the map front-end is served from a different origin than the api.
  template <typename Response>
  void apply_cors_headers(Response& res)
  {
    res.set(field::access_control_allow_origin, "*");
    res.set(field::access_control_allow_headers, "content-type");
    res.set(field::access_control_allow_methods, "post");
  }
}

config config::from_json(json_t const& json)
{
  // keys are optional, but a value that is present must parse.
  config output {
    .listen_ip = json.get_child_optional("address")
      ? json.get<std::string>("address") : "0.0.0.0",
    .listen_port = json.get_child_optional("port")
      ? json.get<uint16_t>("port") : uint16_t(8050)
  };
  verify_argument(!output.listen_ip.empty());
  verify_argument(output.listen_port != 0);
  return output;
}

/**
 * One accept -> read -> dispatch -> write loop. The server runs a pool
 * of these on a shared io_context, each worker owns at most one client
 * connection at a time and closes it after a single response.
 */
class http_worker : private boost::noncopyable
{
private:  // types
  using empty_body_t = boost::beast::http::empty_body;
  using string_body_t = boost::beast::http::string_body;

public:  // construction
  http_worker(ip::tcp::acceptor& acceptor, service_map_t const& svcs)
    : svcs_(svcs)
    , acceptor_(acceptor)
    , socket_(acceptor.get_executor())
  { }

public:
  void start() { accept_next(); }

private:
  void reset()
  {
    error_code ec;
    request_ = {};
    response_ = {};
    status_response_ = {};
    buffer_.clear();
    socket_.close(ec);
  }

  void accept_next()
  {
    reset();
    acceptor_.async_accept(socket_, [this](error_code error) {
      if (error) {
        accept_next();
      } else {
        read_request();
      }
    });
  }

  void read_request()
  {
    http::async_read(socket_, buffer_, request_,
      [this](error_code error, size_t) {
        if (error) {
          accept_next();
        } else {
          handle_request();
        }
      });
  }

  void handle_request()
  {
    try {
      serve(std::move(request_));
    } catch (bad_request const& e) {
      respond_with_error(e, status::bad_request);
    } catch (std::invalid_argument const& e) {
      respond_with_error(e, status::bad_request);
    } catch (bad_method const& e) {
      respond_with_error(e, status::method_not_allowed);
    } catch (std::exception const& e) {
      respond_with_error(e, status::internal_server_error);
    }
  }

  /**
   * POST / carries a JSON-RPC call. The only other requests served are
   * the load balancer health check and the browser CORS preflight.
   */
  void serve(http::request<string_body_t> req)
  {
    if (req.method() != verb::post) {
      if (is_healthcheck(req)) {
        dbglog << "health check from " << socket_.remote_endpoint() << ": ok";
        respond_with_status(status::ok, false);
      } else if (is_cors_options(req)) {
        respond_with_status(status::ok, true);
      } else {
        errlog << "unsupported request method: " << req.method();
        throw bad_method();
      }
      return;
    }

    std::string method;
    json_t params;

    try {
      json_t reqjson;
      std::stringstream ss(req.body());
      boost::property_tree::read_json(ss, reqjson);
      if (auto p = reqjson.get_child_optional("params"); p.has_value()) {
        params = p.value();
      }
      method = reqjson.get<std::string>("method");
    } catch (boost::property_tree::ptree_error const& e) {
      errlog << "bad request body: " << req.body();
      throw bad_request(e.what());
    }

    auto svcit = svcs_.find(method);
    if (svcit == svcs_.end()) {
      errlog << "unknown rpc method: " << method;
      throw bad_method(method.c_str());
    }

    auto resjson = svcit->second->invoke(
      std::move(params),
      context { .remote_ep = socket_.remote_endpoint() });

    std::stringstream outss;
    boost::property_tree::write_json(outss, resjson, false);

    response_.result(status::ok);
    response_.set(field::content_type, "application/json; charset=utf-8");
    response_.body() = outss.str();
    send(response_, true);
  }

  template <typename Exception>
  void respond_with_error(Exception const& e, http::status status)
  {
    error_code ec;
    errlog << "request error [" << socket_.remote_endpoint(ec) << "]: " 
           << e.what();
    errlog << boost::current_exception_diagnostic_information();
    dbglog << boost::stacktrace::stacktrace();
    respond_with_status(status, true);
  }

  void respond_with_status(http::status status, bool cors)
  {
    status_response_.result(status);
    send(status_response_, cors);
  }

  /**
   * Writes a complete response, closes the connection and
   * returns the worker to accepting.
   */
  template <typename Response>
  void send(Response& res, bool cors)
  {
    if (cors) {
      apply_cors_headers(res);
    }
    res.keep_alive(false);
    res.prepare_payload();
    http::async_write(socket_, res, [this](error_code ec, size_t) {
      socket_.shutdown(ip::tcp::socket::shutdown_send, ec);
      accept_next();
    });
  }

private:  // internal state
  service_map_t const& svcs_;
  ip::tcp::acceptor& acceptor_;
  ip::tcp::socket socket_;
  flat_static_buffer<4096> buffer_;
  request<string_body_t> request_;
  response<string_body_t> response_;
  response<empty_body_t> status_response_;
};

void run_server(config config, service_map_t services)
{
  verify_argument(config.listen_port != 0);
  verify_argument(!config.listen_ip.empty());
  verify_argument(!services.empty());

  int workers_count = std::max(1u, std::thread::hardware_concurrency()) * 2;
  infolog << "starting JSON-RPC server on "
          << config.listen_ip << ":" << config.listen_port
          << " with " << workers_count << " workers";

  io_context ioctx{workers_count};
  ip::tcp::acceptor acceptor(ioctx,
    ip::tcp::endpoint(
      ip::make_address(config.listen_ip),
      config.listen_port));

  // list, workers are referenced by their pending handlers.
  std::list<http_worker> workers;
  std::list<std::thread> threads;

  for (auto i = 0; i < workers_count; ++i) {
    workers.emplace_back(acceptor, services);
    workers.back().start();
    threads.emplace_back([&ioctx]() {
      BOOST_LOG_SCOPED_THREAD_TAG("tid",
        geoline::logging::assign_thread_id());
      ioctx.run();
    });
  }

  for (auto& t : threads) {
    if (t.joinable()) {
      t.join();
    }
  }
}

}  // namespace geoline::rpc
