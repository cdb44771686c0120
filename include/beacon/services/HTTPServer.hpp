#ifndef BEACON_SERVICES_HTTPSERVER_HPP
#define BEACON_SERVICES_HTTPSERVER_HPP

#include <cpprest/http_listener.h>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace beacon {
namespace controller {
    class SystemController;  // Forward declaration
}
namespace services {

class HTTPServer {
public:
    HTTPServer(const std::string& address, uint16_t port, controller::SystemController& system_controller);
    ~HTTPServer();

    void start();

    // Closes the listener and waits for in-flight /metrics samples.
    void stop();

    web::uri uri() const { return _listener.uri(); }

private:
    void handle_get(web::http::http_request request);
    void handle_metrics(web::http::http_request request);
    void send(web::http::http_request request, web::http::http_response response);
    void finish_sample();

    web::http::experimental::listener::http_listener _listener;
    controller::SystemController& _system_controller;
    bool _running;

    std::mutex _pending_mutex;
    std::condition_variable _pending_done;
    size_t _pending_samples;
};

} // namespace services
} // namespace beacon

#endif // BEACON_SERVICES_HTTPSERVER_HPP
