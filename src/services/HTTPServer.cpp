#include "beacon/services/HTTPServer.hpp"
#include "beacon/controller/SystemController.hpp"
#include "beacon/utils/MetricsExposition.hpp"
#include <cpprest/http_msg.h>
#include <nlohmann/json.hpp>
#include <pplx/pplxtasks.h>
#include <functional>
#include <mutex>
#include <iostream>

using namespace web;
using namespace web::http;
using namespace web::http::experimental::listener;

namespace beacon {
namespace services {

HTTPServer::HTTPServer(const std::string& address, uint16_t port, controller::SystemController& system_controller)
    : _listener(uri_builder().set_scheme("http").set_host(address).set_port(port).to_uri()),
      _system_controller(system_controller),
      _running(false),
      _pending_samples(0) {
    // Other methods get the listener's default 405 reply
    _listener.support(methods::GET, std::bind(&HTTPServer::handle_get, this, std::placeholders::_1));
}

HTTPServer::~HTTPServer() {
    try {
        stop();
    } catch (const std::exception& e) {
        std::cerr << "[HTTPServer] Error while stopping: " << e.what() << std::endl;
    }
}

void HTTPServer::start() {
    _listener.open().wait();
    _running = true;
    std::cout << "[HTTPServer] Listening on " << _listener.uri().to_string() << std::endl;
}

void HTTPServer::stop() {
    if (_running) {
        _running = false;
        _listener.close().wait();
        std::cout << "[HTTPServer] Stopped." << std::endl;
    }

    // Sampling tasks still reference the controller and this server
    std::unique_lock<std::mutex> lock(_pending_mutex);
    _pending_done.wait(lock, [this]() { return _pending_samples == 0; });
}

void HTTPServer::handle_get(http_request request) {
    auto path = request.relative_uri().path();

    if (path == "/metrics") {
        handle_metrics(request);
        return;
    }

    http_response response;
    try {
        if (path == "/health") {
            response.set_status_code(status_codes::OK);
            response.set_body(_system_controller.getHealth().dump(), "application/json");
        } else if (path == "/") {
            response.set_status_code(status_codes::OK);
            response.set_body(_system_controller.getGreeting(), "text/plain; charset=utf-8");
        } else {
            response.set_status_code(status_codes::NotFound);
            response.set_body(nlohmann::json({{"error", "Not Found"}}).dump(), "application/json");
        }
    } catch (const std::exception& e) {
        std::cerr << "[HTTPServer] Error handling " << path << ": " << e.what() << std::endl;
        response = http_response(status_codes::InternalError);
        response.set_body(std::string(e.what()));
    }
    send(request, response);
}

void HTTPServer::handle_metrics(http_request request) {
    {
        std::lock_guard<std::mutex> lock(_pending_mutex);
        ++_pending_samples;
    }

    // The sampling window blocks, so it runs on its own pool task
    pplx::create_task([this]() {
        return _system_controller.getMetrics();
    }).then([this, request](pplx::task<std::string> task) {
        http_response response;
        try {
            response.set_status_code(status_codes::OK);
            response.set_body(task.get(), utils::kExpositionContentType);
        } catch (const std::exception& e) {
            std::cerr << "[HTTPServer] Metrics sampling failed: " << e.what() << std::endl;
            response = http_response(status_codes::InternalError);
            response.set_body(std::string(e.what()));
        }
        send(request, response);
        finish_sample();
    });
}

void HTTPServer::finish_sample() {
    // Notify under the lock: stop() may destroy this object once it wakes
    std::lock_guard<std::mutex> lock(_pending_mutex);
    --_pending_samples;
    _pending_done.notify_all();
}

void HTTPServer::send(http_request request, http_response response) {
    std::cout << "[HTTPServer] " << request.method() << " " << request.relative_uri().path()
              << " -> " << response.status_code() << std::endl;

    try {
        request.reply(response).then([](pplx::task<void> task) {
            try {
                task.get();
            } catch (const std::exception& e) {
                std::cerr << "[HTTPServer] Failed to send reply: " << e.what() << std::endl;
            }
        });
    } catch (const std::exception& e) {
        // A closing listener may already have answered the request
        std::cerr << "[HTTPServer] Failed to send reply: " << e.what() << std::endl;
    }
}

} // namespace services
} // namespace beacon
